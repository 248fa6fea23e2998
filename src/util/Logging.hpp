#pragma once
#include <QLoggingCategory>

// Enable with QT_LOGGING_RULES="qtdocassembly.*.debug=true"
Q_DECLARE_LOGGING_CATEGORY(lcTemplate)
Q_DECLARE_LOGGING_CATEGORY(lcSpreadsheet)
Q_DECLARE_LOGGING_CATEGORY(lcConvert)
Q_DECLARE_LOGGING_CATEGORY(lcMerge)
