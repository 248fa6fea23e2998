/** \file Config.hpp
 *  External tool locations and limits. Read from the environment at call time
 *  unless a component was given an explicit configuration.
 */
#pragma once
#include "QtDocAssembly/Export.hpp"
#include <QProcessEnvironment>
#include <QString>

namespace QtDocAssembly {

/** Empty string fields mean "use the built-in default / PATH lookup". */
struct QTDOCASSEMBLY_EXPORT AssemblyConfig {
    QString converterBinary;     // QTDOCASSEMBLY_SOFFICE_BINARY
    QString nodeBinary;          // QTDOCASSEMBLY_NODE_BINARY
    QString ghostscriptBinary;   // QTDOCASSEMBLY_GS_BINARY
    QString pdfuniteBinary;      // QTDOCASSEMBLY_PDFUNITE_BINARY
    QString mergeScriptPath;     // QTDOCASSEMBLY_MERGE_SCRIPT
    QString nodeModulesPath;     // QTDOCASSEMBLY_NODE_MODULES
    QString templatePath;        // QTDOCASSEMBLY_TEMPLATE_PATH
    int processTimeoutMs{kDefaultProcessTimeoutMs}; // QTDOCASSEMBLY_PROCESS_TIMEOUT_MS

    static constexpr int kDefaultProcessTimeoutMs = 120000;

    /** Snapshot of the current process environment. */
    static AssemblyConfig fromEnvironment();
    static AssemblyConfig fromEnvironment(const QProcessEnvironment &env);

    /** mergeScriptPath, or scripts/merge_pdf.js under the working directory. */
    QString effectiveMergeScriptPath() const;
    /** nodeModulesPath, or node_modules next to the script's parent directory. */
    QString effectiveNodeModulesPath() const;
};

} // namespace QtDocAssembly
