// pugixml document wrapper for one XML part of a package.
#pragma once
#include <QByteArray>
#include <QString>
#include <pugixml.hpp>
#include <vector>

namespace QtDocAssembly { namespace xml {

/** Parsed XML part. Whitespace-only text, comments, processing instructions and the
 *  declaration are kept so an unmodified document saves back to equivalent markup.
 */
class XmlPart {
public:
    /** false on any parse error; errorDescription() then says why. */
    bool load(const QByteArray &data);
    /** Serialized document, no indentation added. */
    QByteArray save() const;
    pugi::xml_document & doc() { return m_doc; }
    const pugi::xml_document & doc() const { return m_doc; }
    /** Nodes matching an XPath expression, document order. */
    std::vector<pugi::xml_node> selectAll(const char *xpath) const;
    QString errorDescription() const { return m_error; }

private:
    pugi::xml_document m_doc;
    QString m_error;
};

}} // namespace QtDocAssembly::xml
