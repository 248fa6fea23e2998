/** \file DocumentConverter.hpp
 *  DOCX -> PDF through a headless office subprocess (LibreOffice soffice).
 */
#pragma once
#include "QtDocAssembly/Export.hpp"
#include "QtDocAssembly/Config.hpp"
#include "QtDocAssembly/Error.hpp"
#include <QString>
#include <QStringList>
#include <optional>

namespace QtDocAssembly {

class QTDOCASSEMBLY_EXPORT DocumentConverter {
public:
    /** Without a config, AssemblyConfig::fromEnvironment() is read on every convert(). */
    DocumentConverter() = default;
    explicit DocumentConverter(AssemblyConfig config) : m_config(std::move(config)) {}

    /** Convert inputPath into outDir. Returns the produced PDF path
     *  (outDir/<basename>.pdf). Exit code 0 without that file is a failure.
     */
    std::optional<QString> convert(const QString &inputPath, const QString &outDir);

    /** Converter executable: configured override, else soffice, else libreoffice. Empty if none. */
    static QString resolveBinary(const AssemblyConfig &config);
    /** Arguments passed to the converter (profileDir may be empty). */
    static QStringList buildArguments(const QString &inputPath, const QString &outDir, const QString &profileDir);
    /** outDir/<input basename>.pdf */
    static QString expectedOutputPath(const QString &inputPath, const QString &outDir);

    const std::optional<Error> & lastError() const { return m_lastError; }

private:
    std::optional<AssemblyConfig> m_config;
    std::optional<Error> m_lastError;
};

} // namespace QtDocAssembly
