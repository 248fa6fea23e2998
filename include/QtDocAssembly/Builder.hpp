/** \file Builder.hpp
 *  Free helper functions to concisely create placeholder maps.
 *  These strip or add the current variable pattern as needed.
 */
#pragma once
#include "QtDocAssembly/Export.hpp"
#include "QtDocAssembly/VariablePattern.hpp"
#include "QtDocAssembly/Placeholders.hpp"
#include <QHash>
#include <initializer_list>

namespace QtDocAssembly {

/** Returns true if key already appears wrapped with pattern prefix+suffix. */
inline bool keyLooksWrapped(const QString &key, const VariablePattern &pat){
    return key.size() >= pat.prefix.size() + pat.suffix.size()
        && key.startsWith(pat.prefix) && key.endsWith(pat.suffix);
}

/** Ensure a key is wrapped with pattern delimiters. */
inline QString ensureWrapped(const QString &rawOrWrapped, const VariablePattern &pat = {}){
    if(keyLooksWrapped(rawOrWrapped, pat)) return rawOrWrapped;
    return pat.prefix + rawOrWrapped + pat.suffix;
}

/** Strip pattern delimiters if present. */
inline QString stripWrapped(const QString &rawOrWrapped, const VariablePattern &pat = {}){
    if(!keyLooksWrapped(rawOrWrapped, pat)) return rawOrWrapped;
    return rawOrWrapped.mid(pat.prefix.size(), rawOrWrapped.size() - pat.prefix.size() - pat.suffix.size());
}

/** Convenience structure for literal placeholder lists. */
struct PlaceholderSpec { QString keyOrName; QString value; };

/** Create a map from an initializer_list; invalid keys are skipped with a warning. */
QTDOCASSEMBLY_EXPORT Placeholders makePlaceholders(std::initializer_list<PlaceholderSpec> specs);

/** Create a map from a spreadsheet record (header name -> cell text).
 *  Header names that are not valid identifiers are skipped. Values are trimmed.
 */
QTDOCASSEMBLY_EXPORT Placeholders placeholdersFromRecord(const QHash<QString, QString> &record);

} // namespace QtDocAssembly
