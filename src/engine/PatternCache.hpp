// Process-wide cache of compiled placeholder patterns.
#pragma once
#include "QtDocAssembly/VariablePattern.hpp"
#include <QHash>
#include <QReadWriteLock>
#include <QRegularExpression>
#include <QString>

namespace QtDocAssembly { namespace engine {

/** Populate-once memoization of one QRegularExpression per delimiter pair.
 *  The first caller compiles and stores; later callers reuse the stored object.
 *  Safe for concurrent use without external locking; entries are never evicted.
 */
class PatternCache {
public:
    static PatternCache & instance();

    /** Matches prefix + [A-Za-z0-9_]+ + suffix, whitespace allowed inside the delimiters;
     *  capture 1 is the identifier.
     */
    QRegularExpression anyPlaceholderPattern(const VariablePattern &pattern);

    /** Number of compiled entries (diagnostics and tests). */
    int size() const;

private:
    PatternCache() = default;
    QRegularExpression lookupOrCompile(const QString &cacheKey, const QString &regex);

    mutable QReadWriteLock m_lock;
    QHash<QString, QRegularExpression> m_patterns;
};

}} // namespace QtDocAssembly::engine
