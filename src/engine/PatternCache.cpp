#include "engine/PatternCache.hpp"
#include <QReadLocker>
#include <QWriteLocker>

namespace QtDocAssembly { namespace engine {

PatternCache & PatternCache::instance() {
    static PatternCache cache;
    return cache;
}

QRegularExpression PatternCache::lookupOrCompile(const QString &cacheKey, const QString &regex) {
    {
        QReadLocker rl(&m_lock);
        auto it = m_patterns.constFind(cacheKey);
        if(it != m_patterns.constEnd()) return it.value();
    }
    QWriteLocker wl(&m_lock);
    auto it = m_patterns.constFind(cacheKey);
    if(it != m_patterns.constEnd()) return it.value(); // another thread won the race
    QRegularExpression re(regex, QRegularExpression::UseUnicodePropertiesOption);
    re.optimize();
    m_patterns.insert(cacheKey, re);
    return re;
}

QRegularExpression PatternCache::anyPlaceholderPattern(const VariablePattern &pattern) {
    // \x1f cannot occur in delimiters
    const QString key = pattern.prefix + QChar(0x1f) + QChar(0x1f) + pattern.suffix;
    const QString regex = QRegularExpression::escape(pattern.prefix) + QStringLiteral("\\s*([A-Za-z0-9_]+)\\s*")
                        + QRegularExpression::escape(pattern.suffix);
    return lookupOrCompile(key, regex);
}

int PatternCache::size() const {
    QReadLocker rl(&m_lock);
    return m_patterns.size();
}

}} // namespace QtDocAssembly::engine
