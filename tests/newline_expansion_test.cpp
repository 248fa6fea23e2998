// Line feeds in values become w:br between w:t siblings of the same run.
#include "QtDocAssembly/Builder.hpp"
#include "engine/Replacers.hpp"
#include <pugixml.hpp>
#include <cassert>
#include <iostream>

using namespace QtDocAssembly; using QtDocAssembly::engine::Replacers;

static void parse(pugi::xml_document &doc, const QByteArray &xml) {
    pugi::xml_parse_result res = doc.load_buffer(xml.constData(), static_cast<size_t>(xml.size())); assert(res);
}

int main(){
    const QByteArray doc("<w:document xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\"><w:body>"
                         "<w:p><w:r><w:rPr><w:b/></w:rPr><w:t>Address: {{addr</w:t></w:r><w:r><w:t>ess}}!</w:t></w:r></w:p>"
                         "</w:body></w:document>");
    engine::PartRewrite r = Replacers::rewritePart(doc, makePlaceholders({{"address", "1 Main St\nSpringfield\r\n\nUSA"}}), VariablePattern{});
    assert(r.parsed); assert(r.replacements == 1);

    pugi::xml_document out; parse(out, r.bytes);
    auto runs = out.select_nodes("//w:r");
    assert(runs.size() == 2);
    pugi::xml_node first = runs[0].node();
    assert(first.child("w:rPr").child("w:b")); // formatting kept

    // w:rPr, t, br, t, br, t, br, t
    QStringList sequence; QStringList texts;
    for(pugi::xml_node c : first.children()) {
        sequence << QString::fromUtf8(c.name());
        if(QString::fromUtf8(c.name()) == "w:t") {
            texts << QString::fromUtf8(c.text().get());
            assert(QString::fromUtf8(c.attribute("xml:space").value()) == "preserve");
        }
    }
    assert(sequence == QStringList({"w:rPr", "w:t", "w:br", "w:t", "w:br", "w:t", "w:br", "w:t"}));
    assert(texts == QStringList({"Address: 1 Main St", "Springfield", "", "USA"}));

    // the second run lost the covered "ess}}" and keeps its own trailing text
    pugi::xml_node second = runs[1].node();
    assert(second.child("w:t"));
    assert(QString::fromUtf8(second.child("w:t").text().get()) == "!");
    assert(!second.child("w:br"));

    // Single-run value with a trailing newline
    {
        const QByteArray one("<w:document xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\"><w:body>"
                             "<w:p><w:r><w:t>{{x}}</w:t></w:r></w:p></w:body></w:document>");
        engine::PartRewrite s = Replacers::rewritePart(one, makePlaceholders({{"x", "line\n"}}), VariablePattern{});
        pugi::xml_document d; parse(d, s.bytes);
        pugi::xml_node run = d.select_node("//w:r").node();
        assert(run.child("w:br"));
        assert(d.select_nodes("//w:t").size() == 2);
        assert(QString::fromUtf8(d.select_nodes("//w:t")[0].node().text().get()) == "line");
    }
    std::cout << "newline_expansion_test passed" << std::endl; return 0;
}
