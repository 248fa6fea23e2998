#include "QtDocAssembly/MergeStrategy.hpp"
#include "QtDocAssembly/PdfMerger.hpp"
#include "util/Logging.hpp"
#include "util/ProcessRunner.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>

namespace QtDocAssembly {

using util::ProcessRunner;

QString MergeStrategy::resolveExecutable(const QString &override, const QStringList &candidates, QString &why) {
    if(!override.isEmpty()) {
        QString found = ProcessRunner::findExecutable(override);
        if(found.isEmpty()) why = QStringLiteral("configured binary %1 is not accessible").arg(QFileInfo(override).fileName());
        return found;
    }
    QStringList tried;
    for(const QString &c : candidates) {
        QString found = ProcessRunner::findExecutable(c);
        if(!found.isEmpty()) return found;
        tried << c;
    }
    why = QStringLiteral("binary not found in PATH: %1").arg(tried.join(QStringLiteral(", ")));
    return QString();
}

MergeAttempt MergeStrategy::attempt(const QStringList &inputs, const QString &outputPath, const AssemblyConfig &config) const {
    MergeAttempt result;
    Invocation inv;
    QString why;
    if(!prepare(inputs, outputPath, config, inv, why)) {
        result.diagnostic = why;
        return result;
    }
    QFile::remove(outputPath); // a leftover from an earlier strategy must not count as success
    util::ProcessResult r = ProcessRunner::run(inv.program, inv.arguments, inv.environment, config.processTimeoutMs);
    if(!r.succeeded()) {
        result.diagnostic = r.diagnostic();
        return result;
    }
    QFile out(outputPath);
    if(!out.open(QIODevice::ReadOnly)) {
        result.diagnostic = QStringLiteral("no output file produced");
        return result;
    }
    if(!PdfMerger::hasPdfSignature(out.read(8))) {
        result.diagnostic = QStringLiteral("output is not a PDF");
        return result;
    }
    result.ok = true;
    return result;
}

bool NodePdfLibStrategy::prepare(const QStringList &inputs, const QString &outputPath,
                                 const AssemblyConfig &config, Invocation &inv, QString &why) const {
    inv.program = resolveExecutable(config.nodeBinary, {QStringLiteral("node"), QStringLiteral("nodejs")}, why);
    if(inv.program.isEmpty()) return false;
    const QString script = config.effectiveMergeScriptPath();
    if(!QFileInfo(script).isFile()) {
        why = QStringLiteral("merge script not found: %1").arg(QFileInfo(script).fileName());
        return false;
    }
    const QString modules = config.effectiveNodeModulesPath();
    if(!QFileInfo(modules).isDir()) {
        why = QStringLiteral("pdf-lib dependency directory not found: %1").arg(QFileInfo(modules).fileName());
        return false;
    }
    inv.arguments << script << outputPath << inputs;
    inv.environment.insert(QStringLiteral("NODE_PATH"), modules);
    return true;
}

bool GhostscriptStrategy::prepare(const QStringList &inputs, const QString &outputPath,
                                  const AssemblyConfig &config, Invocation &inv, QString &why) const {
    inv.program = resolveExecutable(config.ghostscriptBinary, {QStringLiteral("gs")}, why);
    if(inv.program.isEmpty()) return false;
    inv.arguments << QStringLiteral("-q") << QStringLiteral("-dNOPAUSE") << QStringLiteral("-dBATCH")
                  << QStringLiteral("-sDEVICE=pdfwrite")
                  << QStringLiteral("-sOutputFile=%1").arg(outputPath)
                  << inputs;
    return true;
}

bool PdfuniteStrategy::prepare(const QStringList &inputs, const QString &outputPath,
                               const AssemblyConfig &config, Invocation &inv, QString &why) const {
    inv.program = resolveExecutable(config.pdfuniteBinary, {QStringLiteral("pdfunite")}, why);
    if(inv.program.isEmpty()) return false;
    inv.arguments << inputs << outputPath;
    return true;
}

std::vector<std::unique_ptr<MergeStrategy>> defaultMergeStrategies() {
    std::vector<std::unique_ptr<MergeStrategy>> s;
    s.push_back(std::make_unique<NodePdfLibStrategy>());
    s.push_back(std::make_unique<GhostscriptStrategy>());
    s.push_back(std::make_unique<PdfuniteStrategy>());
    return s;
}

} // namespace QtDocAssembly
