/** \file Error.hpp
 *  Error taxonomy shared by every stage of the assembly pipeline.
 *  Operations return bool or std::optional<T>; the failing object keeps the
 *  reason in lastError() until its next operation starts.
 */
#pragma once
#include "QtDocAssembly/Export.hpp"
#include <QString>
#include <QStringList>

namespace QtDocAssembly {

enum class ErrorCode {
    ContainerNotFound,      // spreadsheet path missing
    WorksheetMissing,       // spreadsheet has no worksheet part
    MalformedContainer,     // not a zip archive, or worksheet XML unparseable
    TemplateNotFound,       // template path missing
    XmlPartUnparseable,     // informational: a template part was copied through unchanged
    ConversionFailed,       // office converter failed or produced no PDF
    InvalidAttachment,      // attachment is not a PDF
    MergeStrategyExhausted, // every merge tool failed
    IoFailed                // temp directory / file read / file write failure
};

/** Typed failure. details holds captured tool output or per-strategy diagnostics. */
struct Error {
    ErrorCode code{ErrorCode::IoFailed};
    QString message;
    QStringList details;

    /** message followed by details, one per line. */
    QString toString() const {
        if(details.isEmpty()) return message;
        return message + QLatin1Char('\n') + details.join(QLatin1Char('\n'));
    }
};

/** Stable identifier for an error code (e.g. "MergeStrategyExhausted"). */
QTDOCASSEMBLY_EXPORT QString errorCodeName(ErrorCode code);

} // namespace QtDocAssembly
