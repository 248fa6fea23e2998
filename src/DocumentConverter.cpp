#include "QtDocAssembly/DocumentConverter.hpp"
#include "util/Logging.hpp"
#include "util/ProcessRunner.hpp"
#include <QDir>
#include <QFileInfo>
#include <QTemporaryDir>
#include <QUrl>

namespace QtDocAssembly {

using util::ProcessRunner;

QString DocumentConverter::resolveBinary(const AssemblyConfig &config) {
    if(!config.converterBinary.isEmpty()) return ProcessRunner::findExecutable(config.converterBinary);
    for(const QString &name : {QStringLiteral("soffice"), QStringLiteral("libreoffice")}) {
        QString found = ProcessRunner::findExecutable(name);
        if(!found.isEmpty()) return found;
    }
    return QString();
}

QStringList DocumentConverter::buildArguments(const QString &inputPath, const QString &outDir, const QString &profileDir) {
    QStringList args;
    if(!profileDir.isEmpty()) {
        // private profile: concurrent conversions must not share a user installation lock
        args << QStringLiteral("-env:UserInstallation=%1").arg(QUrl::fromLocalFile(profileDir).toString());
    }
    args << QStringLiteral("--headless")
         << QStringLiteral("--nologo")
         << QStringLiteral("--nodefault")
         << QStringLiteral("--nolockcheck")
         << QStringLiteral("--norestore")
         << QStringLiteral("--convert-to") << QStringLiteral("pdf")
         << QStringLiteral("--outdir") << outDir
         << inputPath;
    return args;
}

QString DocumentConverter::expectedOutputPath(const QString &inputPath, const QString &outDir) {
    return QDir(outDir).absoluteFilePath(QFileInfo(inputPath).completeBaseName() + QStringLiteral(".pdf"));
}

std::optional<QString> DocumentConverter::convert(const QString &inputPath, const QString &outDir) {
    m_lastError.reset();
    const AssemblyConfig config = m_config ? *m_config : AssemblyConfig::fromEnvironment();
    const QFileInfo input(inputPath);
    if(!input.isFile()) {
        m_lastError = Error{ErrorCode::ConversionFailed, QStringLiteral("input document not found: %1").arg(input.fileName()), {}};
        return std::nullopt;
    }
    const QString binary = resolveBinary(config);
    if(binary.isEmpty()) {
        const QString wanted = config.converterBinary.isEmpty() ? QStringLiteral("soffice/libreoffice") : QFileInfo(config.converterBinary).fileName();
        m_lastError = Error{ErrorCode::ConversionFailed, QStringLiteral("office converter binary not found: %1").arg(wanted), {}};
        return std::nullopt;
    }

    QTemporaryDir profile(QDir::temp().absoluteFilePath(QStringLiteral("qtdocassembly-profile-XXXXXX")));
    const QString absOut = QDir(outDir).absolutePath();
    const QString absIn = input.absoluteFilePath();
    const QString expected = expectedOutputPath(absIn, absOut);

    qCDebug(lcConvert) << "DocumentConverter: converting" << input.fileName() << "with" << QFileInfo(binary).fileName();
    util::ProcessResult r = ProcessRunner::run(binary, buildArguments(absIn, absOut, profile.isValid() ? profile.path() : QString()),
                                               QProcessEnvironment::systemEnvironment(), config.processTimeoutMs);
    const QStringList captured{QStringLiteral("stdout: ") + r.stdOut.trimmed(), QStringLiteral("stderr: ") + r.stdErr.trimmed()};
    if(!r.succeeded()) {
        QString why = r.timedOut ? QStringLiteral("timed out after %1 ms").arg(config.processTimeoutMs)
                    : !r.started ? QStringLiteral("failed to start: %1").arg(r.startError)
                    : r.crashed ? QStringLiteral("crashed")
                    : QStringLiteral("exit code %1").arg(r.exitCode);
        qCWarning(lcConvert) << "DocumentConverter:" << QFileInfo(binary).fileName() << why;
        m_lastError = Error{ErrorCode::ConversionFailed,
                            QStringLiteral("%1 failed: %2").arg(QFileInfo(binary).fileName(), why), captured};
        return std::nullopt;
    }
    // soffice can exit 0 without writing anything
    if(!QFileInfo::exists(expected)) {
        qCWarning(lcConvert) << "DocumentConverter: exit 0 but" << QFileInfo(expected).fileName() << "was not produced";
        m_lastError = Error{ErrorCode::ConversionFailed,
                            QStringLiteral("pdf not created: %1").arg(QFileInfo(expected).fileName()), captured};
        return std::nullopt;
    }
    return expected;
}

} // namespace QtDocAssembly
