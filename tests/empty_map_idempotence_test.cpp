// Filling with an empty map, or a map matching nothing, leaves every part byte-identical.
#include "QtDocAssembly/Template.hpp"
#include "QtDocAssembly/Builder.hpp"
#include "opc/Package.hpp"
#include <QTemporaryDir>
#include <cassert>
#include <iostream>

using namespace QtDocAssembly; using QtDocAssembly::opc::Package;

static QByteArray documentXml() {
    // unusual but legal formatting that a re-serializer would normalize
    return QByteArray("<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\r\n"
        "<w:document xmlns:w='http://schemas.openxmlformats.org/wordprocessingml/2006/main'>\r\n"
        "  <w:body><!-- kept -->\r\n"
        "    <w:p><w:r><w:t xml:space='preserve'>Dear {{na</w:t></w:r><w:r><w:t>me}} &amp; co </w:t></w:r></w:p>\r\n"
        "    <w:p><w:r><w:t/></w:r></w:p>\r\n"
        "  </w:body>\r\n"
        "</w:document>\r\n");
}

static void checkUnchanged(const Placeholders &values) {
    QTemporaryDir dir; assert(dir.isValid());
    QString in = dir.path()+"/idem.docx";
    Package pkg;
    pkg.writePart("[Content_Types].xml", QByteArray("<?xml version=\"1.0\"?><Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\"/>"));
    pkg.writePart("word/document.xml", documentXml());
    pkg.writePart("word/header1.xml", QByteArray("<w:hdr xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\"><w:p><w:r><w:t>{{page}}</w:t></w:r></w:p></w:hdr>"));
    assert(pkg.saveAs(in));

    Template d(in);
    assert(d.fillTemplate(values));
    assert(!d.lastError().has_value());
    assert(d.skippedParts().isEmpty());
    QString out = in+".o"; assert(d.save(out));
    Package src; assert(src.open(in));
    Package res; assert(res.open(out));
    assert(src.partNames() == res.partNames());
    for(const QString &name : src.partNames()) assert(*src.readPart(name) == *res.readPart(name));
}

int main(){
    checkUnchanged(Placeholders{});
    checkUnchanged(makePlaceholders({{"unrelated", "x"}, {"other", "y"}}));
    std::cout << "empty_map_idempotence_test passed" << std::endl; return 0;
}
