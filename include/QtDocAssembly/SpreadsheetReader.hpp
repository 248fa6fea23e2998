/** \file SpreadsheetReader.hpp
 *  Row reader for zip-packaged workbooks (XLSX). First worksheet only; every cell is
 *  returned as text.
 */
#pragma once
#include "QtDocAssembly/Export.hpp"
#include "QtDocAssembly/Error.hpp"
#include <QHash>
#include <QString>
#include <QStringList>
#include <optional>
#include <vector>

namespace QtDocAssembly {

class QTDOCASSEMBLY_EXPORT SpreadsheetReader {
public:
    explicit SpreadsheetReader(QString path);

    /** All rows of the first worksheet. Each row is padded with empty strings up to the
     *  highest column used in it. Empty rows that the workbook omits are not synthesized.
     */
    std::optional<std::vector<QStringList>> readRows();

    /** Worksheet part that readRows() used (e.g. "xl/worksheets/sheet1.xml"). */
    const QString & worksheetPart() const { return m_worksheetPart; }

    const std::optional<Error> & lastError() const { return m_lastError; }

    /** Highest column a worksheet may use (XFD). */
    static constexpr int kMaxColumn = 16384;

    /** 1-based column of a cell reference: "A1" -> 1, "Z9" -> 26, "AA1" -> 27. 0 if no letters,
     *  -1 past kMaxColumn. Cells beyond the limit are skipped by readRows() with a warning.
     */
    static int columnIndex(const QString &cellRef);
    /** Lower-cased, trimmed header name -> 0-based column. Blank headers are skipped. */
    static QHash<QString, int> headerIndex(const QStringList &headerRow);
    /** Required names absent from a header index, in the order given. */
    static QStringList missingColumns(const QHash<QString, int> &headers, const QStringList &required);
    /** Header name -> cell text for one data row. Columns past the row end are omitted. */
    static QHash<QString, QString> record(const QHash<QString, int> &headers, const QStringList &row);

private:
    QString m_path;
    QString m_worksheetPart;
    std::optional<Error> m_lastError;
    void setError(ErrorCode ec, const QString &message) { m_lastError = Error{ec, message, {}}; }
};

} // namespace QtDocAssembly
