#include "QtDocAssembly/Placeholders.hpp"
#include "QtDocAssembly/Builder.hpp"
#include "util/Logging.hpp"
#include <algorithm>

namespace QtDocAssembly {

bool Placeholders::isValidKey(const QString &key) {
    if(key.isEmpty()) return false;
    return std::all_of(key.cbegin(), key.cend(), [](QChar c){
        const ushort u = c.unicode();
        return (u >= 'A' && u <= 'Z') || (u >= 'a' && u <= 'z') || (u >= '0' && u <= '9') || u == '_';
    });
}

bool Placeholders::add(const QString &key, const QString &value) {
    const QString bare = stripWrapped(key.trimmed());
    if(!isValidKey(bare)) {
        qCWarning(lcTemplate) << "Placeholders: ignoring invalid placeholder key" << key;
        return false;
    }
    m_values.insert(bare, value);
    return true;
}

void Placeholders::merge(const Placeholders &other) {
    for(auto it = other.m_values.cbegin(); it != other.m_values.cend(); ++it) m_values.insert(it.key(), it.value());
}

bool Placeholders::contains(const QString &key) const { return m_values.contains(stripWrapped(key)); }

QString Placeholders::value(const QString &key) const { return m_values.value(stripWrapped(key)); }

QStringList Placeholders::keys() const {
    QStringList k = m_values.keys();
    k.sort();
    return k;
}

} // namespace QtDocAssembly
