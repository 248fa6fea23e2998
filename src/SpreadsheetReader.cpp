#include "QtDocAssembly/SpreadsheetReader.hpp"
#include "opc/Package.hpp"
#include "xml/XmlPart.hpp"
#include "util/Logging.hpp"
#include <QFileInfo>
#include <QRegularExpression>
#include <algorithm>
#include <cstring>

namespace QtDocAssembly {

namespace {

bool hasLocalName(pugi::xml_node n, const char *local) {
    const char *name = n.name();
    const char *colon = std::strrchr(name, ':');
    return std::strcmp(colon ? colon + 1 : name, local) == 0;
}

pugi::xml_node childByLocalName(pugi::xml_node parent, const char *local) {
    for(pugi::xml_node c : parent.children()) if(c.type() == pugi::node_element && hasLocalName(c, local)) return c;
    return {};
}

pugi::xml_attribute attributeByLocalName(pugi::xml_node n, const char *local) {
    for(pugi::xml_attribute a : n.attributes()) {
        const char *name = a.name();
        const char *colon = std::strrchr(name, ':');
        if(std::strcmp(colon ? colon + 1 : name, local) == 0 && std::strncmp(name, "xmlns", 5) != 0) return a;
    }
    return {};
}

// Concatenated text of every <t> below node, skipping phonetic runs (<rPh>).
QString collectText(pugi::xml_node node) {
    QString out;
    for(pugi::xml_node c : node.children()) {
        if(c.type() != pugi::node_element) continue;
        if(hasLocalName(c, "t")) out += QString::fromUtf8(c.text().get());
        else if(hasLocalName(c, "r")) out += collectText(c);
    }
    return out;
}

std::vector<QString> parseSharedStrings(const QByteArray &data, bool &ok) {
    std::vector<QString> strings;
    xml::XmlPart part;
    ok = part.load(data);
    if(!ok) return strings;
    pugi::xml_node sst = part.doc().document_element();
    for(pugi::xml_node si : sst.children()) {
        if(si.type() == pugi::node_element && hasLocalName(si, "si")) strings.push_back(collectText(si));
    }
    return strings;
}

QString joinPartPath(const QString &baseDir, const QString &target) {
    if(target.startsWith('/')) return target.mid(1);
    QStringList parts = baseDir.split('/', Qt::SkipEmptyParts);
    for(const QString &seg : target.split('/', Qt::SkipEmptyParts)) {
        if(seg == QLatin1String("..")) { if(!parts.isEmpty()) parts.removeLast(); }
        else if(seg != QLatin1String(".")) parts << seg;
    }
    return parts.join('/');
}

// First <sheet> of the workbook resolved through its relationships part.
QString worksheetFromWorkbook(const opc::Package &pkg) {
    auto wbData = pkg.readPart("xl/workbook.xml");
    auto relData = pkg.readPart("xl/_rels/workbook.xml.rels");
    if(!wbData || !relData) return {};
    xml::XmlPart wb, rels;
    if(!wb.load(*wbData) || !rels.load(*relData)) return {};
    pugi::xml_node sheets = childByLocalName(wb.doc().document_element(), "sheets");
    pugi::xml_node first = childByLocalName(sheets, "sheet");
    if(!first) return {};
    const QString rid = QString::fromUtf8(attributeByLocalName(first, "id").value());
    if(rid.isEmpty()) return {};
    for(pugi::xml_node rel : rels.doc().document_element().children()) {
        if(rel.type() != pugi::node_element || !hasLocalName(rel, "Relationship")) continue;
        if(QString::fromUtf8(rel.attribute("Id").value()) != rid) continue;
        return joinPartPath(QStringLiteral("xl"), QString::fromUtf8(rel.attribute("Target").value()));
    }
    return {};
}

QString locateWorksheet(const opc::Package &pkg) {
    QString part = worksheetFromWorkbook(pkg);
    if(!part.isEmpty() && pkg.hasPart(part)) return part;
    if(pkg.hasPart("xl/worksheets/sheet1.xml")) return QStringLiteral("xl/worksheets/sheet1.xml");
    static const QRegularExpression sheetRe(QStringLiteral("^xl/worksheets/sheet(\\d+)\\.xml$"));
    QString best; int bestNo = -1;
    for(const QString &name : pkg.partNames()) {
        auto m = sheetRe.match(name);
        if(!m.hasMatch()) continue;
        int no = m.captured(1).toInt();
        if(bestNo < 0 || no < bestNo) { bestNo = no; best = name; }
    }
    return best;
}

QString cellValue(pugi::xml_node cell, const std::vector<QString> &shared) {
    const QString type = QString::fromUtf8(cell.attribute("t").value());
    const QString raw = QString::fromUtf8(childByLocalName(cell, "v").text().get());
    if(type == QLatin1String("s")) {
        bool ok = false;
        const int idx = raw.trimmed().toInt(&ok);
        if(ok && idx >= 0 && static_cast<size_t>(idx) < shared.size()) return shared[static_cast<size_t>(idx)];
        return raw;
    }
    if(type == QLatin1String("inlineStr")) return collectText(childByLocalName(cell, "is"));
    return raw;
}

} // namespace

SpreadsheetReader::SpreadsheetReader(QString path)
    : m_path(std::move(path)) {}

int SpreadsheetReader::columnIndex(const QString &cellRef) {
    int col = 0;
    for(QChar ch : cellRef) {
        const ushort u = ch.toUpper().unicode();
        if(u < 'A' || u > 'Z') continue;
        col = col * 26 + (u - 'A' + 1);
        if(col > kMaxColumn) return -1; // checked per letter, so col * 26 cannot overflow
    }
    return col;
}

std::optional<std::vector<QStringList>> SpreadsheetReader::readRows() {
    m_lastError.reset();
    m_worksheetPart.clear();
    QFileInfo fi(m_path);
    if(!fi.exists() || !fi.isFile()) {
        setError(ErrorCode::ContainerNotFound, QStringLiteral("spreadsheet not found: %1").arg(fi.fileName()));
        return std::nullopt;
    }
    opc::Package pkg;
    if(!pkg.open(m_path)) {
        setError(ErrorCode::MalformedContainer, QStringLiteral("cannot open %1: %2").arg(fi.fileName(), pkg.errorString()));
        return std::nullopt;
    }
    m_worksheetPart = locateWorksheet(pkg);
    if(m_worksheetPart.isEmpty()) {
        setError(ErrorCode::WorksheetMissing, QStringLiteral("worksheet not found in %1").arg(fi.fileName()));
        return std::nullopt;
    }

    std::vector<QString> shared;
    if(auto sst = pkg.readPart("xl/sharedStrings.xml")) {
        bool ok = false;
        shared = parseSharedStrings(*sst, ok);
        if(!ok) {
            qCWarning(lcSpreadsheet) << "SpreadsheetReader: malformed shared string table in" << fi.fileName() << "; continuing without shared strings";
            shared.clear();
        }
    }

    xml::XmlPart sheet;
    if(!sheet.load(*pkg.readPart(m_worksheetPart))) {
        setError(ErrorCode::MalformedContainer, QStringLiteral("%1: %2").arg(m_worksheetPart, sheet.errorDescription()));
        return std::nullopt;
    }

    std::vector<QStringList> rows;
    pugi::xml_node sheetData = childByLocalName(sheet.doc().document_element(), "sheetData");
    for(pugi::xml_node row : sheetData.children()) {
        if(row.type() != pugi::node_element || !hasLocalName(row, "row")) continue;
        QStringList current;
        int lastCol = 0;
        int highestCol = 0;
        for(pugi::xml_node cell : row.children()) {
            if(cell.type() != pugi::node_element || !hasLocalName(cell, "c")) continue;
            const QString ref = QString::fromUtf8(cell.attribute("r").value());
            int col = columnIndex(ref);
            if(col == 0) col = lastCol + 1; // reference omitted: next column
            if(col < 0 || col > kMaxColumn) {
                qCWarning(lcSpreadsheet) << "SpreadsheetReader: skipping cell" << ref << "past column XFD in" << m_worksheetPart;
                continue;
            }
            while(current.size() < col - 1) current << QString();
            const QString value = cellValue(cell, shared);
            if(current.size() < col) current << value;
            else current[col - 1] = value;
            lastCol = col;
            highestCol = std::max(highestCol, col);
        }
        while(current.size() < highestCol) current << QString();
        rows.push_back(current);
    }
    qCDebug(lcSpreadsheet) << "SpreadsheetReader:" << rows.size() << "row(s) from" << m_worksheetPart;
    return rows;
}

QHash<QString, int> SpreadsheetReader::headerIndex(const QStringList &headerRow) {
    QHash<QString, int> headers;
    for(int i = 0; i < headerRow.size(); ++i) {
        const QString key = headerRow.at(i).trimmed().toLower();
        if(!key.isEmpty()) headers.insert(key, i);
    }
    return headers;
}

QStringList SpreadsheetReader::missingColumns(const QHash<QString, int> &headers, const QStringList &required) {
    QStringList missing;
    for(const QString &col : required) {
        if(!headers.contains(col.trimmed().toLower())) missing << col;
    }
    return missing;
}

QHash<QString, QString> SpreadsheetReader::record(const QHash<QString, int> &headers, const QStringList &row) {
    QHash<QString, QString> values;
    for(auto it = headers.cbegin(); it != headers.cend(); ++it) {
        if(it.value() < row.size()) values.insert(it.key(), row.at(it.value()));
    }
    return values;
}

} // namespace QtDocAssembly
