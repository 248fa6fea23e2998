/** \file VariablePattern.hpp
 *  Delimiters surrounding a placeholder identifier in template text.
 */
#pragma once
#include <QString>

namespace QtDocAssembly {

/** Prefix/suffix pair, default {{ .. }}. */
struct VariablePattern {
    QString prefix{QStringLiteral("{{")};
    QString suffix{QStringLiteral("}}")};

    bool operator==(const VariablePattern &o) const { return prefix == o.prefix && suffix == o.suffix; }
    bool operator!=(const VariablePattern &o) const { return !(*this == o); }
};

} // namespace QtDocAssembly
