#include "QtDocAssembly/Assembler.hpp"
#include "QtDocAssembly/DocumentConverter.hpp"
#include "QtDocAssembly/Template.hpp"
#include "util/Logging.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

namespace QtDocAssembly {

std::optional<QByteArray> Assembler::generatePdf(const Placeholders &placeholders, const QList<Attachment> &attachments) {
    const AssemblyConfig config = effectiveConfig();
    if(config.templatePath.isEmpty()) {
        m_lastError = Error{ErrorCode::TemplateNotFound, QStringLiteral("no template path configured (QTDOCASSEMBLY_TEMPLATE_PATH)"), {}};
        return std::nullopt;
    }
    return generatePdf(config.templatePath, placeholders, attachments);
}

std::optional<QByteArray> Assembler::generatePdf(const QString &templatePath,
                                                 const Placeholders &placeholders,
                                                 const QList<Attachment> &attachments) {
    m_lastError.reset();
    const AssemblyConfig config = effectiveConfig();
    const QFileInfo templateInfo(templatePath);
    if(!templateInfo.isFile()) {
        m_lastError = Error{ErrorCode::TemplateNotFound, QStringLiteral("template not found: %1").arg(templateInfo.fileName()), {}};
        return std::nullopt;
    }

    QTemporaryDir work(QDir::temp().absoluteFilePath(QStringLiteral("qtdocassembly-XXXXXX")));
    if(!work.isValid()) {
        m_lastError = Error{ErrorCode::IoFailed, QStringLiteral("cannot create temporary directory: %1").arg(work.errorString()), {}};
        return std::nullopt;
    }

    // 1. fill
    Template doc(templatePath);
    if(!doc.fillTemplate(placeholders)) {
        m_lastError = doc.lastError();
        return std::nullopt;
    }
    for(const QString &part : doc.skippedParts()) {
        qCWarning(lcTemplate) << "Assembler:" << part << "copied through without substitution";
    }
    const QString filled = QDir(work.path()).absoluteFilePath(templateInfo.completeBaseName() + QStringLiteral(".docx"));
    if(!doc.save(filled)) {
        m_lastError = doc.lastError();
        return std::nullopt;
    }

    // 2. convert
    DocumentConverter converter(config);
    auto pdfPath = converter.convert(filled, work.path());
    if(!pdfPath) {
        m_lastError = converter.lastError();
        return std::nullopt;
    }
    QFile pdf(*pdfPath);
    if(!pdf.open(QIODevice::ReadOnly)) {
        m_lastError = Error{ErrorCode::IoFailed, QStringLiteral("cannot read converted pdf: %1").arg(pdf.errorString()), {}};
        return std::nullopt;
    }
    const QByteArray base = pdf.readAll();
    pdf.close();

    // 3. merge
    PdfMerger merger(config);
    auto merged = merger.merge(base, attachments);
    if(!merged) {
        m_lastError = merger.lastError();
        return std::nullopt;
    }
    qCDebug(lcTemplate) << "Assembler: produced" << merged->size() << "bytes from" << templateInfo.fileName();
    return merged;
}

} // namespace QtDocAssembly
