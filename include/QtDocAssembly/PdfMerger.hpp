/** \file PdfMerger.hpp
 *  Appends PDF attachments to a base PDF by trying the merge strategy cascade.
 */
#pragma once
#include "QtDocAssembly/Export.hpp"
#include "QtDocAssembly/Config.hpp"
#include "QtDocAssembly/Error.hpp"
#include <QByteArray>
#include <QList>
#include <QString>
#include <optional>

namespace QtDocAssembly {

/** One caller-supplied file. When data is empty and path is set, the file is read on demand. */
struct Attachment {
    QString fileName;
    QByteArray data;
    QString path;

    static Attachment fromData(QString fileName, QByteArray data) { return Attachment{std::move(fileName), std::move(data), QString()}; }
    static Attachment fromFile(const QString &path);
};

class QTDOCASSEMBLY_EXPORT PdfMerger {
public:
    /** Without a config, AssemblyConfig::fromEnvironment() is read on every merge. */
    PdfMerger() = default;
    explicit PdfMerger(AssemblyConfig config) : m_config(std::move(config)) {}

    /** base followed by attachments in order. Blank attachments are skipped; if none remain the
     *  base bytes are returned unchanged and no tool runs. A non-PDF attachment fails with
     *  InvalidAttachment before any tool runs.
     */
    std::optional<QByteArray> merge(const QByteArray &basePdf, const QList<Attachment> &attachments);
    /** Same, reading the base document from basePdfPath. */
    std::optional<QByteArray> mergeFile(const QString &basePdfPath, const QList<Attachment> &attachments);

    /** True if data begins with the %PDF signature. */
    static bool hasPdfSignature(const QByteArray &data);

    const std::optional<Error> & lastError() const { return m_lastError; }

private:
    std::optional<AssemblyConfig> m_config;
    std::optional<Error> m_lastError;
    void setError(ErrorCode ec, const QString &message, const QStringList &details = {}) { m_lastError = Error{ec, message, details}; }
};

} // namespace QtDocAssembly
