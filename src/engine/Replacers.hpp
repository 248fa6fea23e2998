#pragma once
#include "QtDocAssembly/Placeholders.hpp"
#include "QtDocAssembly/VariablePattern.hpp"
#include <QByteArray>
#include <QString>
#include <pugixml.hpp>
#include <vector>

namespace QtDocAssembly { namespace engine {

/** Outcome of rewriting one XML part. */
struct PartRewrite {
    QByteArray bytes;      // rewritten part, or the original bytes
    bool parsed{true};     // false: part was unparseable and copied through
    int replacements{0};
    QString parseError;
};

/** One known placeholder occurrence: [start, end) in the scanned text and its value. */
struct PlaceholderMatch {
    qsizetype start{0};
    qsizetype end{0};
    QString value;
};

class Replacers {
public:
    /** Known placeholders in text, left to right, non-overlapping. Unknown tokens are skipped. */
    static std::vector<PlaceholderMatch> findPlaceholders(const QString &text, const Placeholders &values, const VariablePattern &pattern);

    /** Replace every known placeholder in one left-to-right pass. Values are inserted
     *  literally and never rescanned. Returns the number of substitutions made.
     */
    static int substitute(QString &text, const Placeholders &values, const VariablePattern &pattern);

    /** Run-recovering substitution over a parsed WordprocessingML part. Returns substitutions made. */
    static int replaceText(pugi::xml_document &doc, const Placeholders &values, const VariablePattern &pattern);

    /** Parse, substitute, serialize. Unparseable input and inputs without any substitution come
     *  back byte-identical.
     */
    static PartRewrite rewritePart(const QByteArray &xmlBytes, const Placeholders &values, const VariablePattern &pattern);
};

}} // namespace QtDocAssembly::engine
