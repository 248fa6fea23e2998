/** \file Assembler.hpp
 *  One-call pipeline: fill template -> convert to PDF -> append attachments.
 */
#pragma once
#include "QtDocAssembly/Export.hpp"
#include "QtDocAssembly/Config.hpp"
#include "QtDocAssembly/Error.hpp"
#include "QtDocAssembly/Placeholders.hpp"
#include "QtDocAssembly/PdfMerger.hpp"
#include <QByteArray>
#include <QList>
#include <QString>
#include <optional>

namespace QtDocAssembly {

/** Stages run sequentially inside one temporary directory that is removed on return. */
class QTDOCASSEMBLY_EXPORT Assembler {
public:
    Assembler() = default;
    explicit Assembler(AssemblyConfig config) : m_config(std::move(config)) {}

    /** Complete PDF, or std::nullopt with lastError() set. Never a partial document. */
    std::optional<QByteArray> generatePdf(const QString &templatePath,
                                          const Placeholders &placeholders,
                                          const QList<Attachment> &attachments = {});
    /** Template path taken from AssemblyConfig::templatePath. */
    std::optional<QByteArray> generatePdf(const Placeholders &placeholders,
                                          const QList<Attachment> &attachments = {});

    const std::optional<Error> & lastError() const { return m_lastError; }

private:
    std::optional<AssemblyConfig> m_config;
    std::optional<Error> m_lastError;
    AssemblyConfig effectiveConfig() const { return m_config ? *m_config : AssemblyConfig::fromEnvironment(); }
};

} // namespace QtDocAssembly
