#include "QtDocAssembly/Error.hpp"

namespace QtDocAssembly {

QString errorCodeName(ErrorCode code) {
    switch(code) {
    case ErrorCode::ContainerNotFound:      return QStringLiteral("ContainerNotFound");
    case ErrorCode::WorksheetMissing:       return QStringLiteral("WorksheetMissing");
    case ErrorCode::MalformedContainer:     return QStringLiteral("MalformedContainer");
    case ErrorCode::TemplateNotFound:       return QStringLiteral("TemplateNotFound");
    case ErrorCode::XmlPartUnparseable:     return QStringLiteral("XmlPartUnparseable");
    case ErrorCode::ConversionFailed:       return QStringLiteral("ConversionFailed");
    case ErrorCode::InvalidAttachment:      return QStringLiteral("InvalidAttachment");
    case ErrorCode::MergeStrategyExhausted: return QStringLiteral("MergeStrategyExhausted");
    case ErrorCode::IoFailed:               return QStringLiteral("IoFailed");
    }
    return QStringLiteral("Unknown");
}

} // namespace QtDocAssembly
