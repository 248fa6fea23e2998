#include "engine/RunRewriter.hpp"
#include "engine/Replacers.hpp"
#include <algorithm>
#include <cstring>

namespace QtDocAssembly { namespace engine {

namespace {

const char *const kWordNamespace = "http://schemas.openxmlformats.org/wordprocessingml/2006/main";

// Closing one of these ends the span a placeholder may stretch over.
const char *const kSpanBoundaries[] = {
    "p", "tr", "tc", "hyperlink", "fldSimple", "sdtContent", "txbxContent"
};

void setElementText(pugi::xml_node t, const QString &text) {
    while(pugi::xml_node c = t.first_child()) t.remove_child(c);
    if(!text.isEmpty()) t.append_child(pugi::node_pcdata).set_value(text.toUtf8().constData());
    pugi::xml_attribute space = t.attribute("xml:space");
    if(!space) space = t.append_attribute("xml:space");
    space.set_value("preserve");
}

} // namespace

RunRewriter::RunRewriter(const Placeholders &values, const VariablePattern &pattern, QString wordPrefix)
    : m_values(values), m_pattern(pattern), m_prefix(std::move(wordPrefix)) {}

QString RunRewriter::wordNamespacePrefix(const pugi::xml_document &doc) {
    pugi::xml_node root = doc.document_element();
    for(pugi::xml_attribute a : root.attributes()) {
        if(std::strcmp(a.value(), kWordNamespace) != 0) continue;
        const char *name = a.name();
        if(std::strcmp(name, "xmlns") == 0) return QString();
        if(std::strncmp(name, "xmlns:", 6) == 0) return QString::fromUtf8(name + 6);
    }
    return QStringLiteral("w");
}

std::vector<RunRewriter::Token> RunRewriter::tokenize(pugi::xml_node node) {
    std::vector<Token> tokens;
    // Iterative pre/post-order walk; DOCX bodies can nest deeply (tables in text boxes in tables).
    struct Frame { pugi::xml_node node; pugi::xml_node nextChild; };
    std::vector<Frame> stack;
    auto enter = [&](pugi::xml_node n) {
        switch(n.type()) {
        case pugi::node_element:
            tokens.push_back({TokenKind::StartElement, n});
            stack.push_back({n, n.first_child()});
            break;
        case pugi::node_document:
            stack.push_back({n, n.first_child()});
            break;
        case pugi::node_pcdata:
        case pugi::node_cdata:
            tokens.push_back({TokenKind::Text, n});
            break;
        default:
            break;
        }
    };
    enter(node);
    while(!stack.empty()) {
        Frame &top = stack.back();
        if(top.nextChild) {
            pugi::xml_node child = top.nextChild;
            top.nextChild = child.next_sibling();
            enter(child); // may invalidate top
            continue;
        }
        if(top.node.type() == pugi::node_element) tokens.push_back({TokenKind::EndElement, top.node});
        stack.pop_back();
    }
    return tokens;
}

int RunRewriter::rewrite(pugi::xml_document &doc, const Placeholders &values, const VariablePattern &pattern) {
    RunRewriter rw(values, pattern, wordNamespacePrefix(doc));
    // Tokens are collected before any mutation; flushes only touch nodes already consumed.
    for(const Token &t : tokenize(doc)) rw.feed(t);
    rw.finish();
    return rw.replacements();
}

QString RunRewriter::qualified(const char *local) const {
    const QString l = QString::fromLatin1(local);
    return m_prefix.isEmpty() ? l : m_prefix + QLatin1Char(':') + l;
}

bool RunRewriter::isTextElement(pugi::xml_node node) const {
    return node.type() == pugi::node_element && QString::fromUtf8(node.name()) == qualified("t");
}

bool RunRewriter::isSpanBoundary(pugi::xml_node node) const {
    const QString name = QString::fromUtf8(node.name());
    for(const char *b : kSpanBoundaries) {
        if(name == qualified(b)) return true;
    }
    return false;
}

void RunRewriter::feed(const Token &token) {
    switch(token.kind) {
    case TokenKind::StartElement: onStartElement(token.node); break;
    case TokenKind::Text:         onText(token.node); break;
    case TokenKind::EndElement:   onEndElement(token.node); break;
    }
}

void RunRewriter::onStartElement(pugi::xml_node node) {
    switch(m_state) {
    case State::OutsideRun:
    case State::BetweenRunsBufferingForJoin:
        if(isTextElement(node)) {
            m_runs.push_back(Run{node, QString(), false});
            m_state = State::InsideRun;
        }
        break;
    case State::InsideRun:
        break; // w:t holds text only
    }
}

void RunRewriter::onText(pugi::xml_node node) {
    if(m_state != State::InsideRun) return;
    m_runs.back().text += QString::fromUtf8(node.value());
}

void RunRewriter::onEndElement(pugi::xml_node node) {
    switch(m_state) {
    case State::InsideRun:
        if(isTextElement(node)) m_state = State::BetweenRunsBufferingForJoin;
        break;
    case State::BetweenRunsBufferingForJoin:
        if(isSpanBoundary(node)) {
            flush();
            m_state = State::OutsideRun;
        }
        break;
    case State::OutsideRun:
        break;
    }
}

void RunRewriter::finish() {
    if(!m_runs.empty()) flush();
    m_state = State::OutsideRun;
}

void RunRewriter::flush() {
    // Match once over the authored text so inserted values are never scanned again.
    QString joined;
    std::vector<qsizetype> offsets;
    offsets.reserve(m_runs.size() + 1);
    for(const Run &r : m_runs) {
        offsets.push_back(joined.size());
        joined += r.text;
    }
    offsets.push_back(joined.size());

    const std::vector<PlaceholderMatch> found = Replacers::findPlaceholders(joined, m_values, m_pattern);
    m_replacements += static_cast<int>(found.size());

    for(size_t i = 0; !found.empty() && i < m_runs.size(); ++i) {
        const qsizetype begin = offsets[i];
        const qsizetype end = offsets[i + 1];
        QString out;
        qsizetype pos = begin;
        bool touched = false;
        for(const PlaceholderMatch &m : found) {
            if(m.end <= begin) continue;
            if(m.start >= end) break;
            touched = true;
            // the value lives in the run holding the match start
            if(m.start >= begin) {
                out += joined.mid(pos, m.start - pos);
                out += m.value;
            }
            pos = std::max(pos, std::min(m.end, end));
        }
        if(!touched) continue;
        out += joined.mid(pos, end - pos);
        m_runs[i].text = out;
        m_runs[i].dirty = true;
    }
    for(const Run &r : m_runs) {
        if(r.dirty) writeRun(r);
    }
    m_runs.clear();
}

void RunRewriter::writeRun(const Run &run) const {
    QString text = run.text;
    text.remove(QLatin1Char('\r'));
    const QStringList lines = text.split(QLatin1Char('\n'));
    pugi::xml_node t = run.textElement;
    pugi::xml_node parent = t.parent();
    setElementText(t, lines.front());
    const QByteArray brName = qualified("br").toUtf8();
    const QByteArray tName = qualified("t").toUtf8();
    pugi::xml_node after = t;
    for(int i = 1; i < lines.size(); ++i) {
        pugi::xml_node br = parent.insert_child_after(brName.constData(), after);
        pugi::xml_node next = parent.insert_child_after(tName.constData(), br);
        setElementText(next, lines.at(i));
        after = next;
    }
}

}} // namespace QtDocAssembly::engine
