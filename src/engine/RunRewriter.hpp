// Finite-state rewriter that recovers placeholders split across text runs.
#pragma once
#include "QtDocAssembly/Placeholders.hpp"
#include "QtDocAssembly/VariablePattern.hpp"
#include <QString>
#include <pugixml.hpp>
#include <vector>

namespace QtDocAssembly { namespace engine {

/** Consumes a document-order token stream of a WordprocessingML part and rewrites its
 *  w:t elements in place.
 *
 *  Text of consecutive w:t elements is buffered until a span boundary closes (paragraph,
 *  table row or cell, hyperlink, simple field, content control, text box). At that point
 *  the buffered texts are joined and matched in one left-to-right pass. Each value goes into
 *  the run holding the start of its placeholder, after that run's own leading text. Runs the
 *  placeholder covers lose the covered characters only, so text after the placeholder stays
 *  in its own run with its own properties. Closing w:r is not a boundary: placeholders split
 *  over sibling runs are exactly what this class recovers.
 *
 *  Line feeds in final run text become w:t / w:br / w:t siblings inside the owning run.
 */
class RunRewriter {
public:
    enum class State { OutsideRun, InsideRun, BetweenRunsBufferingForJoin };
    enum class TokenKind { StartElement, Text, EndElement };
    struct Token { TokenKind kind; pugi::xml_node node; };

    RunRewriter(const Placeholders &values, const VariablePattern &pattern, QString wordPrefix = QStringLiteral("w"));

    /** Tokenize doc (namespace prefix taken from its root) and feed every token. Returns substitutions. */
    static int rewrite(pugi::xml_document &doc, const Placeholders &values, const VariablePattern &pattern);
    /** Document-order tokens of the subtree rooted at node (node included unless it is the document). */
    static std::vector<Token> tokenize(pugi::xml_node node);
    /** Prefix bound to the WordprocessingML namespace on the root element; "w" if undeclared. */
    static QString wordNamespacePrefix(const pugi::xml_document &doc);

    void feed(const Token &token);
    /** Flush runs still buffered at end of input. */
    void finish();

    State state() const { return m_state; }
    int replacements() const { return m_replacements; }

private:
    struct Run {
        pugi::xml_node textElement; // w:t
        QString text;
        bool dirty{false};
    };

    void onStartElement(pugi::xml_node node);
    void onText(pugi::xml_node node);
    void onEndElement(pugi::xml_node node);
    void flush();
    void writeRun(const Run &run) const;
    bool isTextElement(pugi::xml_node node) const;
    bool isSpanBoundary(pugi::xml_node node) const;
    QString qualified(const char *local) const;

    const Placeholders &m_values;
    VariablePattern m_pattern;
    QString m_prefix;
    State m_state{State::OutsideRun};
    std::vector<Run> m_runs;
    int m_replacements{0};
};

}} // namespace QtDocAssembly::engine
