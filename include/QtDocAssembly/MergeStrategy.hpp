/** \file MergeStrategy.hpp
 *  External PDF concatenation recipes tried by PdfMerger, highest priority first:
 *  node + pdf-lib script, Ghostscript, pdfunite.
 */
#pragma once
#include "QtDocAssembly/Export.hpp"
#include "QtDocAssembly/Config.hpp"
#include <QProcessEnvironment>
#include <QString>
#include <QStringList>
#include <memory>
#include <vector>

namespace QtDocAssembly {

enum class MergeStrategyKind { NodePdfLib, Ghostscript, Pdfunite };

/** Outcome of one strategy. diagnostic is empty on success. */
struct MergeAttempt {
    bool ok{false};
    QString diagnostic;
};

/** Base class for merge recipes. Subclasses only describe the command line; running
 *  it and judging the result is shared.
 */
class QTDOCASSEMBLY_EXPORT MergeStrategy {
public:
    virtual ~MergeStrategy() = default;
    MergeStrategyKind kind() const { return m_kind; }
    /** Short tool name used in diagnostics ("node", "gs", "pdfunite"). */
    const QString & name() const { return m_name; }

    /** Concatenate inputs (absolute paths, in order) into outputPath.
     *  Succeeds only if the tool exits 0 and outputPath starts with %PDF.
     */
    MergeAttempt attempt(const QStringList &inputs, const QString &outputPath, const AssemblyConfig &config) const;

protected:
    MergeStrategy(MergeStrategyKind kind, QString name) : m_kind(kind), m_name(std::move(name)) {}

    struct Invocation {
        QString program;
        QStringList arguments;
        QProcessEnvironment environment{QProcessEnvironment::systemEnvironment()};
    };
    /** Resolve binary and build the invocation; on failure set why and return false. */
    virtual bool prepare(const QStringList &inputs, const QString &outputPath,
                         const AssemblyConfig &config, Invocation &inv, QString &why) const = 0;

    /** override (absolute path or name) else first resolvable candidate; empty + why on failure. */
    static QString resolveExecutable(const QString &override, const QStringList &candidates, QString &why);

private:
    MergeStrategyKind m_kind;
    QString m_name;
};

/** node <merge script> <output> <inputs...> with NODE_PATH pointing at a directory holding pdf-lib. */
class QTDOCASSEMBLY_EXPORT NodePdfLibStrategy : public MergeStrategy {
public:
    NodePdfLibStrategy() : MergeStrategy(MergeStrategyKind::NodePdfLib, QStringLiteral("node")) {}
protected:
    bool prepare(const QStringList &inputs, const QString &outputPath,
                 const AssemblyConfig &config, Invocation &inv, QString &why) const override;
};

/** gs -q -dNOPAUSE -dBATCH -sDEVICE=pdfwrite -sOutputFile=<output> <inputs...> */
class QTDOCASSEMBLY_EXPORT GhostscriptStrategy : public MergeStrategy {
public:
    GhostscriptStrategy() : MergeStrategy(MergeStrategyKind::Ghostscript, QStringLiteral("gs")) {}
protected:
    bool prepare(const QStringList &inputs, const QString &outputPath,
                 const AssemblyConfig &config, Invocation &inv, QString &why) const override;
};

/** pdfunite <inputs...> <output> */
class QTDOCASSEMBLY_EXPORT PdfuniteStrategy : public MergeStrategy {
public:
    PdfuniteStrategy() : MergeStrategy(MergeStrategyKind::Pdfunite, QStringLiteral("pdfunite")) {}
protected:
    bool prepare(const QStringList &inputs, const QString &outputPath,
                 const AssemblyConfig &config, Invocation &inv, QString &why) const override;
};

/** The fixed cascade, in priority order. */
QTDOCASSEMBLY_EXPORT std::vector<std::unique_ptr<MergeStrategy>> defaultMergeStrategies();

} // namespace QtDocAssembly
