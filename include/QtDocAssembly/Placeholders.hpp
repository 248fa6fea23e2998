/** \file Placeholders.hpp
 *  Placeholder map supplied to Template::fillTemplate.
 */
#pragma once
#include "QtDocAssembly/Export.hpp"
#include <QHash>
#include <QString>
#include <QStringList>

namespace QtDocAssembly {

/** Identifier -> replacement value. Keys are stored bare (without delimiters) and are
 *  case-sensitive. Values may contain '\n'; each becomes a line break in the document.
 */
class QTDOCASSEMBLY_EXPORT Placeholders {
public:
    /** Insert or overwrite. key may be bare ("name") or wrapped ("{{name}}").
     *  Returns false (and logs a warning) when the identifier is not [A-Za-z0-9_]+.
     */
    bool add(const QString &key, const QString &value);
    /** Merge another map; entries of other win. */
    void merge(const Placeholders &other);
    bool contains(const QString &key) const;
    QString value(const QString &key) const;
    bool isEmpty() const { return m_values.isEmpty(); }
    int size() const { return m_values.size(); }
    /** Bare identifiers, sorted for deterministic iteration. */
    QStringList keys() const;
    const QHash<QString, QString> & all() const { return m_values; }

    /** True if key is a non-empty run of ASCII letters, digits or underscore. */
    static bool isValidKey(const QString &key);

private:
    QHash<QString, QString> m_values;
};

} // namespace QtDocAssembly
