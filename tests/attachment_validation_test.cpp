// Attachment screening happens before any merge tool runs
#include "QtDocAssembly/PdfMerger.hpp"
#include <QTemporaryDir>
#include <QFile>
#include <cassert>
#include <iostream>

using namespace QtDocAssembly;

static QString writeScript(const QString &dir, const QString &name, const QByteArray &body) {
    QString path = dir + "/" + name; QFile f(path); bool ok = f.open(QIODevice::WriteOnly); assert(ok);
    f.write("#!/bin/sh\n" + body); f.close();
    ok = f.setPermissions(QFile::ReadOwner | QFile::WriteOwner | QFile::ExeOwner); assert(ok);
    return path;
}

static QString writeFile(const QString &path, const QByteArray &data) {
    QFile f(path); bool ok = f.open(QIODevice::WriteOnly); assert(ok); f.write(data); f.close(); return path;
}

int main(){
    QTemporaryDir tmp; assert(tmp.isValid());
    const QString d = tmp.path();
    const QString marker = d + "/tool-ran";
    const QByteArray base("%PDF-1.4 BASE\n");

    // every tool leaves a marker; pdfunite also logs its argument count and concatenates
    AssemblyConfig cfg;
    cfg.nodeBinary = d + "/missing-node";
    cfg.ghostscriptBinary = writeScript(d, "gs", "touch '" + marker.toUtf8() + "'\nexit 1\n");
    cfg.pdfuniteBinary = writeScript(d, "pdfunite",
        "touch '" + marker.toUtf8() + "'\n"
        "echo $# > '" + (d + "/argc").toUtf8() + "'\n"
        "out=''; for a; do out=\"$a\"; done\n"
        "n=$#; i=1; : > \"$out.part\"\n"
        "for a; do if [ $i -lt $n ]; then cat \"$a\" >> \"$out.part\"; fi; i=$((i+1)); done\n"
        "mv \"$out.part\" \"$out\"\n");

    assert(PdfMerger::hasPdfSignature("%PDF-1.7"));
    assert(!PdfMerger::hasPdfSignature(" %PDF-1.7"));
    assert(!PdfMerger::hasPdfSignature(""));

    // No attachments: base returned untouched
    {
        PdfMerger merger(cfg);
        auto out = merger.merge(base, {});
        assert(out.has_value() && *out == base);
        assert(!QFile::exists(marker));
    }
    // Only blank attachments: skipped, base returned untouched
    {
        PdfMerger merger(cfg);
        auto out = merger.merge(base, {Attachment::fromData("empty.pdf", QByteArray()), Attachment::fromData("blank.pdf", " \n\t\r\n")});
        assert(out.has_value() && *out == base);
        assert(!QFile::exists(marker));
    }
    // Non-PDF attachment rejected by name, nothing executed
    {
        PdfMerger merger(cfg);
        auto out = merger.merge(base, {Attachment::fromData("ok.pdf", "%PDF-1.4 A"), Attachment::fromData("invoice.docx", "PK\x03\x04")});
        assert(!out.has_value());
        assert(merger.lastError()->code == ErrorCode::InvalidAttachment);
        assert(merger.lastError()->message.contains("invoice.docx"));
        assert(!QFile::exists(marker));
    }
    // Leading whitespace before %PDF is not a PDF
    {
        PdfMerger merger(cfg);
        assert(!merger.merge(base, {Attachment::fromData("spaced.pdf", "  %PDF-1.4")}).has_value());
        assert(merger.lastError()->code == ErrorCode::InvalidAttachment);
    }
    // Unreadable attachment file
    {
        PdfMerger merger(cfg);
        assert(!merger.merge(base, {Attachment::fromFile(d + "/nope.pdf")}).has_value());
        assert(merger.lastError()->code == ErrorCode::IoFailed);
        assert(merger.lastError()->message.contains("nope.pdf"));
        assert(!QFile::exists(marker));
    }
    // Blank entries are dropped from the tool invocation
    {
        Attachment fromDisk = Attachment::fromFile(writeFile(d + "/scan.pdf", "%PDF-1.3 SCAN\n"));
        assert(fromDisk.fileName == "scan.pdf"); assert(fromDisk.data.isEmpty());
        PdfMerger merger(cfg);
        auto out = merger.merge(base, {Attachment::fromData("blank.pdf", "   "), fromDisk, Attachment::fromData("last.pdf", "%PDF-1.4 LAST\n")});
        assert(out.has_value());
        assert(*out == base + "%PDF-1.3 SCAN\n" + "%PDF-1.4 LAST\n");
        QFile argc(d + "/argc"); assert(argc.open(QIODevice::ReadOnly));
        assert(argc.readAll().trimmed() == "4"); // base + 2 attachments + output
    }
    std::cout << "attachment_validation_test passed" << std::endl; return 0;
}
