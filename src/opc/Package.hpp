// Zip container holding the parts of an OPC package (DOCX, XLSX).
#pragma once
#include <QByteArray>
#include <QHash>
#include <QString>
#include <QStringList>
#include <optional>
#include <vector>

namespace QtDocAssembly { namespace opc {

/** In-memory copy of every entry of a zip archive, in archive order.
 *  Parts that are never written keep their bytes exactly; saving re-compresses them.
 */
class Package {
public:
    /** Load from a file on disk. false if unreadable or not a zip archive. */
    bool open(const QString &path);
    /** Load from zip bytes. */
    bool openBytes(const QByteArray &zipBytes);
    QString errorString() const { return m_error; }

    /** Entry names in archive order (directory entries excluded). */
    QStringList partNames() const;
    bool hasPart(const QString &name) const { return m_index.contains(name); }
    std::optional<QByteArray> readPart(const QString &name) const;
    /** Replace an existing entry in place or append a new one. */
    void writePart(const QString &name, const QByteArray &data);

    bool saveAs(const QString &path) const;
    /** Zip bytes; empty on failure. */
    QByteArray saveToBytes() const;

private:
    struct Entry { QString name; QByteArray data; bool isDirectory{false}; };
    std::vector<Entry> m_entries;
    QHash<QString, size_t> m_index;
    mutable QString m_error;
    void clear() { m_entries.clear(); m_index.clear(); m_error.clear(); }
};

}} // namespace QtDocAssembly::opc
