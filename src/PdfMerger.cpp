#include "QtDocAssembly/PdfMerger.hpp"
#include "QtDocAssembly/MergeStrategy.hpp"
#include "util/Logging.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QTemporaryDir>

namespace QtDocAssembly {

namespace {

bool writeFile(const QString &path, const QByteArray &data) {
    QSaveFile f(path);
    if(!f.open(QIODevice::WriteOnly)) return false;
    if(f.write(data) != data.size()) { f.cancelWriting(); return false; }
    return f.commit();
}

} // namespace

Attachment Attachment::fromFile(const QString &path) {
    return Attachment{QFileInfo(path).fileName(), QByteArray(), path};
}

bool PdfMerger::hasPdfSignature(const QByteArray &data) {
    return data.startsWith("%PDF");
}

std::optional<QByteArray> PdfMerger::merge(const QByteArray &basePdf, const QList<Attachment> &attachments) {
    m_lastError.reset();
    const AssemblyConfig config = m_config ? *m_config : AssemblyConfig::fromEnvironment();

    QList<QByteArray> accepted;
    for(const Attachment &a : attachments) {
        QByteArray data = a.data;
        if(data.isEmpty() && !a.path.isEmpty()) {
            QFile f(a.path);
            if(!f.open(QIODevice::ReadOnly)) {
                setError(ErrorCode::IoFailed, QStringLiteral("cannot read attachment %1: %2").arg(a.fileName, f.errorString()));
                return std::nullopt;
            }
            data = f.readAll();
        }
        if(data.trimmed().isEmpty()) {
            qCDebug(lcMerge) << "PdfMerger: skipping empty attachment" << a.fileName;
            continue;
        }
        if(!hasPdfSignature(data)) {
            setError(ErrorCode::InvalidAttachment, QStringLiteral("attachment %1 is not a PDF").arg(a.fileName));
            return std::nullopt;
        }
        accepted << data;
    }
    if(accepted.isEmpty()) return basePdf;

    QTemporaryDir work(QDir::temp().absoluteFilePath(QStringLiteral("qtdocassembly-merge-XXXXXX")));
    if(!work.isValid()) {
        setError(ErrorCode::IoFailed, QStringLiteral("cannot create temporary directory: %1").arg(work.errorString()));
        return std::nullopt;
    }
    QDir dir(work.path());
    QStringList inputs;
    inputs << dir.absoluteFilePath(QStringLiteral("base.pdf"));
    for(int i = 0; i < accepted.size(); ++i) inputs << dir.absoluteFilePath(QStringLiteral("attachment-%1.pdf").arg(i + 1));
    if(!writeFile(inputs.first(), basePdf)) {
        setError(ErrorCode::IoFailed, QStringLiteral("cannot write base.pdf"));
        return std::nullopt;
    }
    for(int i = 0; i < accepted.size(); ++i) {
        if(!writeFile(inputs.at(i + 1), accepted.at(i))) {
            setError(ErrorCode::IoFailed, QStringLiteral("cannot write %1").arg(QFileInfo(inputs.at(i + 1)).fileName()));
            return std::nullopt;
        }
    }
    const QString output = dir.absoluteFilePath(QStringLiteral("merged.pdf"));

    QStringList failures;
    for(const auto &strategy : defaultMergeStrategies()) {
        MergeAttempt attempt = strategy->attempt(inputs, output, config);
        if(!attempt.ok) {
            qCWarning(lcMerge) << "PdfMerger:" << strategy->name() << "failed:" << attempt.diagnostic;
            failures << QStringLiteral("%1 (%2)").arg(strategy->name(), attempt.diagnostic);
            continue;
        }
        QFile f(output);
        if(!f.open(QIODevice::ReadOnly)) {
            setError(ErrorCode::IoFailed, QStringLiteral("cannot read merged.pdf: %1").arg(f.errorString()));
            return std::nullopt;
        }
        qCDebug(lcMerge) << "PdfMerger: merged" << inputs.size() << "document(s) with" << strategy->name();
        return f.readAll();
    }
    setError(ErrorCode::MergeStrategyExhausted,
             QStringLiteral("failed to merge pdf files: %1").arg(failures.join(QStringLiteral("; "))), failures);
    return std::nullopt;
}

std::optional<QByteArray> PdfMerger::mergeFile(const QString &basePdfPath, const QList<Attachment> &attachments) {
    m_lastError.reset();
    QFile f(basePdfPath);
    if(!f.open(QIODevice::ReadOnly)) {
        setError(ErrorCode::IoFailed, QStringLiteral("cannot read %1: %2").arg(QFileInfo(basePdfPath).fileName(), f.errorString()));
        return std::nullopt;
    }
    return merge(f.readAll(), attachments);
}

} // namespace QtDocAssembly
