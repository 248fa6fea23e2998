// Placeholders split across runs at arbitrary offsets are recovered without changing run structure.
#include "QtDocAssembly/Builder.hpp"
#include "engine/Replacers.hpp"
#include "engine/RunRewriter.hpp"
#include <pugixml.hpp>
#include <algorithm>
#include <cassert>
#include <iostream>
#include <random>
#include <set>

using namespace QtDocAssembly; using QtDocAssembly::engine::Replacers; using QtDocAssembly::engine::RunRewriter;

static const char *kOpen = "<w:document xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\"><w:body>";
static const char *kClose = "</w:body></w:document>";

static QByteArray wrap(const QString &body) { return QByteArray(kOpen) + body.toUtf8() + QByteArray(kClose); }

static QString runXml(const QString &text, int style) {
    QString props = style % 3 == 0 ? "<w:rPr><w:b/></w:rPr>" : style % 3 == 1 ? "<w:rPr><w:i/><w:color w:val=\"FF0000\"/></w:rPr>" : "";
    return "<w:r>" + props + "<w:t xml:space=\"preserve\">" + text + "</w:t></w:r>";
}

struct Paragraphs { QStringList texts; int runs{0}; int boldRuns{0}; };

static Paragraphs inspect(const QByteArray &xml) {
    pugi::xml_document doc; pugi::xml_parse_result res = doc.load_buffer(xml.constData(), static_cast<size_t>(xml.size()));
    assert(res);
    Paragraphs out;
    for(const auto &p : doc.select_nodes("//w:p")) {
        QString text;
        for(const auto &t : p.node().select_nodes(".//w:t")) text += QString::fromUtf8(t.node().text().get());
        out.texts << text;
    }
    out.runs = static_cast<int>(doc.select_nodes("//w:r").size());
    out.boldRuns = static_cast<int>(doc.select_nodes("//w:r[w:rPr/w:b]").size());
    return out;
}

int main(){
    const Placeholders values = makePlaceholders({{"name", "Ann"}, {"id_1", "7"}});
    const QString source = "Hello {{name}}, id {{ id_1 }}.";
    const QString expected = "Hello Ann, id 7.";

    // Every way of cutting the paragraph into 1..5 runs, sampled
    std::mt19937 rng(20240611u);
    for(int iter = 0; iter < 500; ++iter) {
        const int pieces = 1 + static_cast<int>(rng() % 5);
        std::set<int> cuts;
        while(static_cast<int>(cuts.size()) < pieces - 1) cuts.insert(1 + static_cast<int>(rng() % static_cast<unsigned>(source.size() - 1)));
        QString body = "<w:p><w:pPr><w:jc w:val=\"center\"/></w:pPr>";
        int last = 0, idx = 0, bold = 0;
        std::vector<int> bounds(cuts.begin(), cuts.end()); bounds.push_back(source.size());
        for(int b : bounds) {
            const int style = static_cast<int>(rng() % 3);
            if(style == 0) ++bold;
            body += runXml(source.mid(last, b - last), style);
            if(rng() % 4 == 0) body += "<w:proofErr w:type=\"spellStart\"/>";
            last = b; ++idx;
        }
        body += "</w:p>";
        engine::PartRewrite r = Replacers::rewritePart(wrap(body), values, VariablePattern{});
        assert(r.parsed);
        assert(r.replacements == 2);
        Paragraphs p = inspect(r.bytes);
        if(p.texts.value(0) != expected) {
            std::cerr << "iteration " << iter << " produced: " << p.texts.value(0).toStdString() << std::endl;
        }
        assert(p.texts == QStringList({expected}));
        assert(p.runs == idx);       // run count preserved
        assert(p.boldRuns == bold);  // run properties preserved
    }

    // Span boundaries stop the join: paragraph, hyperlink, table cell
    {
        const QString body =
            "<w:p>" + runXml("{{na", 2) + "</w:p><w:p>" + runXml("me}}", 2) + "</w:p>"
            "<w:p><w:hyperlink>" + runXml("{{na", 2) + "</w:hyperlink>" + runXml("me}}", 2) + "</w:p>"
            "<w:tbl><w:tr><w:tc><w:p>" + runXml("{{na", 2) + "</w:p></w:tc><w:tc><w:p>" + runXml("me}}", 2) + "</w:p></w:tc></w:tr></w:tbl>";
        engine::PartRewrite r = Replacers::rewritePart(wrap(body), values, VariablePattern{});
        assert(r.parsed); assert(r.replacements == 0);
        assert(r.bytes == wrap(body));
    }
    // A placeholder wholly inside a hyperlink is still found
    {
        const QString body = "<w:p><w:hyperlink>" + runXml("{{", 0) + runXml("name}}", 1) + "</w:hyperlink>" + runXml(" tail", 2) + "</w:p>";
        engine::PartRewrite r = Replacers::rewritePart(wrap(body), values, VariablePattern{});
        assert(r.replacements == 1);
        assert(inspect(r.bytes).texts == QStringList({"Ann tail"}));
    }
    // Unknown and malformed placeholders stay untouched
    {
        const QString body = "<w:p>" + runXml("{{unknown}} {{na", 0) + runXml("me} {{name}}", 1) + "</w:p>";
        engine::PartRewrite r = Replacers::rewritePart(wrap(body), values, VariablePattern{});
        assert(r.replacements == 1);
        assert(inspect(r.bytes).texts == QStringList({"{{unknown}} {{name} Ann"}));
    }
    // Each run keeps its own text around a split placeholder
    {
        const QString body = "<w:p>" + runXml("Total: ", 0) + runXml("{{amo", 2) + runXml("unt}}", 2) + runXml(" THB", 1) + "</w:p>";
        engine::PartRewrite r = Replacers::rewritePart(wrap(body), makePlaceholders({{"amount", "1,250.00"}}), VariablePattern{});
        assert(r.replacements == 1);
        pugi::xml_document doc; assert(doc.load_buffer(r.bytes.constData(), static_cast<size_t>(r.bytes.size())));
        auto runs = doc.select_nodes("//w:r");
        assert(runs.size() == 4);
        QStringList texts;
        for(const auto &run : runs) texts << QString::fromUtf8(run.node().child("w:t").text().get());
        assert(texts == QStringList({"Total: ", "1,250.00", "", " THB"}));
        assert(runs[0].node().child("w:rPr").child("w:b"));
        assert(runs[3].node().child("w:rPr").child("w:i"));
    }
    // Trailing text of the run holding the end of a placeholder stays in that run
    {
        const QString body = "<w:p>" + runXml("a {{na", 0) + runXml("me}} b {{", 1) + runXml("id_1}} c", 2) + "</w:p>";
        engine::PartRewrite r = Replacers::rewritePart(wrap(body), values, VariablePattern{});
        assert(r.replacements == 2);
        pugi::xml_document doc; assert(doc.load_buffer(r.bytes.constData(), static_cast<size_t>(r.bytes.size())));
        QStringList texts;
        for(const auto &t : doc.select_nodes("//w:t")) texts << QString::fromUtf8(t.node().text().get());
        assert(texts == QStringList({"a Ann", " b 7", " c"}));
    }
    // Inserted values are never scanned again, whatever the key order
    {
        QString text = "{{a}} {{b}}";
        assert(Replacers::substitute(text, makePlaceholders({{"a", "{{b}}"}, {"b", "X"}}), VariablePattern{}) == 2);
        assert(text == "{{b}} X");
        text = "{{b}} {{a}}";
        assert(Replacers::substitute(text, makePlaceholders({{"b", "{{a}}"}, {"a", "Y"}}), VariablePattern{}) == 2);
        assert(text == "{{a}} Y");

        const QString body = "<w:p>" + runXml("{{a}}", 0) + runXml(" {{", 1) + runXml("b}}", 2) + "</w:p>";
        engine::PartRewrite r = Replacers::rewritePart(wrap(body), makePlaceholders({{"a", "{{b}}"}, {"b", "X"}}), VariablePattern{});
        assert(r.replacements == 2);
        assert(inspect(r.bytes).texts == QStringList({"{{b}} X"}));
    }
    // Values are literal: '$1' and backslashes are not expanded
    {
        const QString body = "<w:p>" + runXml("cost: {{name}}", 0) + "</w:p>";
        engine::PartRewrite r = Replacers::rewritePart(wrap(body), makePlaceholders({{"name", "$1 \\0 \\\\"}}), VariablePattern{});
        assert(inspect(r.bytes).texts == QStringList({"cost: $1 \\0 \\\\"}));
    }
    // Prefix other than "w" is honoured
    {
        const QByteArray xml("<x:document xmlns:x=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\"><x:body><x:p>"
                             "<x:r><x:t>{{na</x:t></x:r><x:r><x:t>me}}</x:t></x:r></x:p></x:body></x:document>");
        pugi::xml_document doc; assert(doc.load_buffer(xml.constData(), static_cast<size_t>(xml.size())));
        assert(RunRewriter::wordNamespacePrefix(doc) == "x");
        assert(RunRewriter::rewrite(doc, values, VariablePattern{}) == 1);
        assert(QString::fromUtf8(doc.select_node("//x:t").node().text().get()) == "Ann");
    }
    std::cout << "run_recovery_test passed" << std::endl; return 0;
}
