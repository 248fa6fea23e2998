#include <QtDocAssembly/Assembler.hpp>
#include <QtDocAssembly/Builder.hpp>
#include <QtDocAssembly/SpreadsheetReader.hpp>
#include <QtDocAssembly/Template.hpp>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFileInfo>
#include <QSaveFile>
#include <QTextStream>

// Fill a DOCX template from one spreadsheet row, convert it to PDF and append attachments.

using namespace QtDocAssembly;

namespace {

int reportError(const Error &err) {
    QTextStream(stderr) << errorCodeName(err.code) << ": " << err.toString() << '\n';
    return 1;
}

int usage(const QCommandLineParser &parser, const QString &why) {
    QTextStream err(stderr);
    err << why << "\n\n" << parser.helpText();
    return 2;
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("qtdocassembly"));
    QCoreApplication::setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Fill a DOCX template from a spreadsheet row and produce a PDF"));
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption templateOpt(QStringList{QStringLiteral("t"), QStringLiteral("template")},
                                   QStringLiteral("DOCX template (default: $QTDOCASSEMBLY_TEMPLATE_PATH)."), QStringLiteral("file"));
    QCommandLineOption dataOpt(QStringList{QStringLiteral("d"), QStringLiteral("data")},
                               QStringLiteral("XLSX workbook; header row gives placeholder names."), QStringLiteral("file"));
    QCommandLineOption rowOpt(QStringList{QStringLiteral("r"), QStringLiteral("row")},
                              QStringLiteral("Data row to use, 1 = first row after the header."), QStringLiteral("n"), QStringLiteral("1"));
    QCommandLineOption setOpt(QStringList{QStringLiteral("s"), QStringLiteral("set")},
                              QStringLiteral("Extra placeholder, overrides spreadsheet values. Repeatable."), QStringLiteral("key=value"));
    QCommandLineOption requireOpt(QStringLiteral("require"),
                                  QStringLiteral("Comma separated header names that must be present."), QStringLiteral("columns"));
    QCommandLineOption outputOpt(QStringList{QStringLiteral("o"), QStringLiteral("output")},
                                 QStringLiteral("Output file."), QStringLiteral("file"));
    QCommandLineOption docxOnlyOpt(QStringLiteral("docx-only"), QStringLiteral("Write the filled DOCX and stop."));
    parser.addOptions({templateOpt, dataOpt, rowOpt, setOpt, requireOpt, outputOpt, docxOnlyOpt});
    parser.addPositionalArgument(QStringLiteral("attachments"), QStringLiteral("PDF files appended in order."), QStringLiteral("[attachment.pdf...]"));
    parser.process(app);

    if(!parser.isSet(outputOpt)) return usage(parser, QStringLiteral("--output is required"));
    AssemblyConfig config = AssemblyConfig::fromEnvironment();
    const QString templatePath = parser.isSet(templateOpt) ? parser.value(templateOpt) : config.templatePath;
    if(templatePath.isEmpty()) return usage(parser, QStringLiteral("no template given"));

    Placeholders values;
    if(parser.isSet(dataOpt)) {
        bool ok = false;
        const int row = parser.value(rowOpt).toInt(&ok);
        if(!ok || row < 1) return usage(parser, QStringLiteral("--row must be a positive integer"));
        SpreadsheetReader reader(parser.value(dataOpt));
        auto rows = reader.readRows();
        if(!rows) return reportError(*reader.lastError());
        if(rows->empty()) return reportError(Error{ErrorCode::WorksheetMissing, QStringLiteral("worksheet has no header row"), {}});
        const auto headers = SpreadsheetReader::headerIndex(rows->front());
        if(parser.isSet(requireOpt)) {
            const QStringList missing = SpreadsheetReader::missingColumns(headers, parser.value(requireOpt).split(QLatin1Char(','), Qt::SkipEmptyParts));
            if(!missing.isEmpty()) {
                QTextStream(stderr) << "missing required columns: " << missing.join(QStringLiteral(", ")) << '\n';
                return 1;
            }
        }
        if(static_cast<size_t>(row) >= rows->size()) return usage(parser, QStringLiteral("row %1 is past the last data row").arg(row));
        values = placeholdersFromRecord(SpreadsheetReader::record(headers, rows->at(static_cast<size_t>(row))));
    }
    for(const QString &kv : parser.values(setOpt)) {
        const int eq = kv.indexOf(QLatin1Char('='));
        if(eq <= 0) return usage(parser, QStringLiteral("--set expects key=value, got %1").arg(kv));
        if(!values.add(kv.left(eq), kv.mid(eq + 1))) return usage(parser, QStringLiteral("invalid placeholder name %1").arg(kv.left(eq)));
    }

    const QString output = parser.value(outputOpt);
    if(parser.isSet(docxOnlyOpt)) {
        Template doc(templatePath);
        if(!doc.fillTemplate(values) || !doc.save(output)) return reportError(*doc.lastError());
        QTextStream(stdout) << "wrote " << output << '\n';
        return 0;
    }

    QList<Attachment> attachments;
    for(const QString &path : parser.positionalArguments()) attachments << Attachment::fromFile(path);

    Assembler assembler(config);
    auto pdf = assembler.generatePdf(templatePath, values, attachments);
    if(!pdf) return reportError(*assembler.lastError());
    QSaveFile out(output);
    if(!out.open(QIODevice::WriteOnly) || out.write(*pdf) != pdf->size() || !out.commit()) {
        QTextStream(stderr) << "IoFailed: cannot write " << QFileInfo(output).fileName() << '\n';
        return 1;
    }
    QTextStream(stdout) << "wrote " << output << " (" << pdf->size() << " bytes)\n";
    return 0;
}
