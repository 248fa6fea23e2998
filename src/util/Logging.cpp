#include "util/Logging.hpp"

Q_LOGGING_CATEGORY(lcTemplate, "qtdocassembly.template")
Q_LOGGING_CATEGORY(lcSpreadsheet, "qtdocassembly.spreadsheet")
Q_LOGGING_CATEGORY(lcConvert, "qtdocassembly.convert")
Q_LOGGING_CATEGORY(lcMerge, "qtdocassembly.merge")
