#include "xml/XmlPart.hpp"

namespace QtDocAssembly { namespace xml {

namespace {
struct ByteArrayWriter : pugi::xml_writer {
    QByteArray &out;
    explicit ByteArrayWriter(QByteArray &o) : out(o) {}
    void write(const void *data, size_t size) override {
        out.append(static_cast<const char *>(data), static_cast<int>(size));
    }
};

constexpr unsigned int kParseFlags = pugi::parse_full | pugi::parse_ws_pcdata;
} // namespace

bool XmlPart::load(const QByteArray &data) {
    m_error.clear();
    pugi::xml_parse_result res = m_doc.load_buffer(data.constData(), static_cast<size_t>(data.size()), kParseFlags, pugi::encoding_auto);
    if(!res) {
        m_error = QStringLiteral("%1 at offset %2").arg(QString::fromUtf8(res.description())).arg(static_cast<qlonglong>(res.offset));
        return false;
    }
    if(!m_doc.document_element()) {
        m_error = QStringLiteral("no root element");
        return false;
    }
    return true;
}

QByteArray XmlPart::save() const {
    QByteArray out;
    ByteArrayWriter w(out);
    m_doc.save(w, "", pugi::format_raw | pugi::format_no_declaration, pugi::encoding_utf8);
    return out;
}

std::vector<pugi::xml_node> XmlPart::selectAll(const char *xpath) const {
    std::vector<pugi::xml_node> nodes;
    pugi::xpath_query q(xpath);
    for(const auto &n : q.evaluate_node_set(m_doc)) nodes.push_back(n.node());
    return nodes;
}

}} // namespace QtDocAssembly::xml
