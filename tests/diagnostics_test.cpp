// Diagnostics test: missing template, non-zip template, missing document part, unparseable body part
#include "QtDocAssembly/Template.hpp"
#include "QtDocAssembly/Builder.hpp"
#include "QtDocAssembly/Error.hpp"
#include "opc/Package.hpp"
#include <QTemporaryDir>
#include <QFile>
#include <cassert>
#include <iostream>

using namespace QtDocAssembly; using QtDocAssembly::opc::Package;

static const QByteArray kContentTypes(
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>" \
    "<Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\">" \
    "<Default Extension=\"xml\" ContentType=\"application/xml\"/>" \
    "<Override PartName=\"/word/document.xml\" ContentType=\"application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml\"/>" \
    "</Types>");

int main(){
    // Template path does not exist
    {
        Template d("/nonexistent/path/does_not_exist.docx");
        assert(!d.fillTemplate(Placeholders{}));
        assert(d.lastError().has_value());
        assert(d.lastError()->code == ErrorCode::TemplateNotFound);
        assert(d.lastError()->message.contains("does_not_exist.docx"));
        assert(!d.lastError()->message.contains("/nonexistent")); // file name only
        assert(errorCodeName(d.lastError()->code) == "TemplateNotFound");
    }
    // Not a zip archive
    {
        QTemporaryDir dir; assert(dir.isValid());
        QString path = dir.path()+"/plain.docx"; QFile f(path); assert(f.open(QIODevice::WriteOnly)); f.write("just text"); f.close();
        Template d(path);
        assert(!d.fillTemplate(makePlaceholders({{"a", "b"}})));
        assert(d.lastError().has_value());
        assert(d.lastError()->code == ErrorCode::MalformedContainer);
        Template b = Template::fromBytes(QByteArray("PK\x03\x04garbage"));
        assert(b.readTextContent().isEmpty());
        assert(b.lastError().has_value() && b.lastError()->code == ErrorCode::MalformedContainer);
    }
    // Missing document part
    {
        Package pkg; pkg.writePart("[Content_Types].xml", QByteArray("<?xml version=\"1.0\" encoding=\"UTF-8\"?><Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\"></Types>"));
        QTemporaryDir dir; QString path = dir.path()+"/nodoc.docx"; assert(pkg.saveAs(path));
        Template d(path); auto text = d.readTextContent(); assert(text.isEmpty());
        assert(d.lastError().has_value());
        assert(d.lastError()->code == ErrorCode::MalformedContainer);
    }
    // Unparseable header is copied through, the body is still filled
    {
        QTemporaryDir dir; assert(dir.isValid());
        QString path = dir.path()+"/broken.docx";
        const QByteArray brokenHeader("<w:hdr xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\"><w:p><w:r><w:t>{{name}}</w:r></w:p>");
        Package pkg; pkg.writePart("[Content_Types].xml", kContentTypes);
        pkg.writePart("word/document.xml", QByteArray("<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>"
                        "<w:document xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\"><w:body>"
                        "<w:p><w:r><w:t>{{name}}</w:t></w:r></w:p></w:body></w:document>"));
        pkg.writePart("word/header1.xml", brokenHeader);
        assert(pkg.saveAs(path));
        Template d(path);
        assert(d.fillTemplate(makePlaceholders({{"name", "Zed"}})));
        assert(d.lastError().has_value());
        assert(d.lastError()->code == ErrorCode::XmlPartUnparseable);
        assert(d.skippedParts() == QStringList({"word/header1.xml"}));
        QString out = path+".o"; assert(d.save(out));
        Package res; assert(res.open(out));
        assert(*res.readPart("word/header1.xml") == brokenHeader);
        assert(QString(*res.readPart("word/document.xml")).contains("Zed"));
    }
    // Error rendering
    {
        Error e{ErrorCode::MergeStrategyExhausted, "failed to merge pdf files", {"node (missing)", "gs (exit 1)"}};
        assert(e.toString() == "failed to merge pdf files\nnode (missing)\ngs (exit 1)");
        assert(errorCodeName(ErrorCode::InvalidAttachment) == "InvalidAttachment");
    }
    std::cout << "diagnostics_test passed" << std::endl; return 0;
}
