#include "QtDocAssembly/Config.hpp"
#include <QDir>
#include <QFileInfo>

namespace QtDocAssembly {

AssemblyConfig AssemblyConfig::fromEnvironment() {
    return fromEnvironment(QProcessEnvironment::systemEnvironment());
}

AssemblyConfig AssemblyConfig::fromEnvironment(const QProcessEnvironment &env) {
    AssemblyConfig c;
    c.converterBinary   = env.value(QStringLiteral("QTDOCASSEMBLY_SOFFICE_BINARY")).trimmed();
    c.nodeBinary        = env.value(QStringLiteral("QTDOCASSEMBLY_NODE_BINARY")).trimmed();
    c.ghostscriptBinary = env.value(QStringLiteral("QTDOCASSEMBLY_GS_BINARY")).trimmed();
    c.pdfuniteBinary    = env.value(QStringLiteral("QTDOCASSEMBLY_PDFUNITE_BINARY")).trimmed();
    c.mergeScriptPath   = env.value(QStringLiteral("QTDOCASSEMBLY_MERGE_SCRIPT")).trimmed();
    c.nodeModulesPath   = env.value(QStringLiteral("QTDOCASSEMBLY_NODE_MODULES")).trimmed();
    c.templatePath      = env.value(QStringLiteral("QTDOCASSEMBLY_TEMPLATE_PATH")).trimmed();
    bool ok = false;
    const int timeout = env.value(QStringLiteral("QTDOCASSEMBLY_PROCESS_TIMEOUT_MS")).trimmed().toInt(&ok);
    if(ok && timeout > 0) c.processTimeoutMs = timeout;
    return c;
}

QString AssemblyConfig::effectiveMergeScriptPath() const {
    if(!mergeScriptPath.isEmpty()) return QFileInfo(mergeScriptPath).absoluteFilePath();
    return QDir::current().absoluteFilePath(QStringLiteral("scripts/merge_pdf.js"));
}

QString AssemblyConfig::effectiveNodeModulesPath() const {
    if(!nodeModulesPath.isEmpty()) return QFileInfo(nodeModulesPath).absoluteFilePath();
    const QString scriptDir = QFileInfo(effectiveMergeScriptPath()).absolutePath();
    return QDir(QFileInfo(scriptDir).absolutePath()).absoluteFilePath(QStringLiteral("node_modules"));
}

} // namespace QtDocAssembly
