#include "ProductCsv.h"
#include "DateTimeUtils.h"
#include <QFile>
#include <QTextStream>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(productCsv, "csv")

namespace {

const int kColumnCount = 7;

QString quoted(const QString &value)
{
    if (!value.contains(',') && !value.contains('"') && !value.contains('\n')) {
        return value;
    }
    QString escaped = value;
    escaped.replace("\"", "\"\"");
    return "\"" + escaped + "\"";
}

} // namespace

QStringList ProductCsv::header()
{
    return { "ID", "Name", "Type", "Buy Price", "Sell Price", "Last Updated", "Stock" };
}

QStringList ProductCsv::splitLine(const QString &line)
{
    QStringList fields;
    QString current;
    bool inQuotes = false;

    for (int i = 0; i < line.size(); ++i) {
        const QChar c = line.at(i);
        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line.at(i + 1) == '"') {
                    current += '"';
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                current += c;
            }
        } else if (c == '"') {
            inQuotes = true;
        } else if (c == ',') {
            fields.append(current.trimmed());
            current.clear();
        } else {
            current += c;
        }
    }
    fields.append(current.trimmed());
    return fields;
}

bool ProductCsv::parse(const QString &content, QList<ImportRow> *rows, StockError *error)
{
    QList<ImportRow> result;
    const QStringList lines = content.split('\n');

    int lineNumber = 0;
    int recordLine = 0;
    bool headerSeen = false;
    bool inQuotedField = false;
    QString record;
    for (QString line : lines) {
        ++lineNumber;
        line.remove('\r');

        // Поле в кавычках может продолжаться на следующих строках
        if (inQuotedField) {
            record += QChar('\n') + line;
        } else {
            record = line;
            recordLine = lineNumber;
        }
        inQuotedField = record.count('"') % 2 != 0;
        if (inQuotedField) continue;

        if (record.trimmed().isEmpty()) continue;
        if (!headerSeen) {
            headerSeen = true;
            continue;
        }

        const QStringList fields = splitLine(record);
        if (fields.size() < kColumnCount) {
            qWarning(productCsv) << "ProductCsv::parse: Line" << recordLine << "has" << fields.size() << "columns";
            setStockError(error, StockError::validation(
                QString("Line %1: expected %2 columns").arg(recordLine).arg(kColumnCount), recordLine));
            return false;
        }

        ImportRow row;
        row.lineNumber = recordLine;
        row.name = fields.at(1);
        row.category = fields.at(2);

        bool buyOk = false;
        bool sellOk = false;
        bool stockOk = false;
        row.buyPrice = decimalFromString(fields.at(3), &buyOk);
        row.sellPrice = decimalFromString(fields.at(4), &sellOk);
        row.stock = fields.at(6).toInt(&stockOk);

        if (!buyOk || !sellOk || !stockOk) {
            qWarning(productCsv) << "ProductCsv::parse: Invalid number on line" << recordLine;
            setStockError(error, StockError::validation(
                QString("Line %1: invalid price or stock value").arg(recordLine), recordLine));
            return false;
        }
        result.append(row);
    }

    if (inQuotedField) {
        qWarning(productCsv) << "ProductCsv::parse: Unterminated quoted field from line" << recordLine;
        setStockError(error, StockError::validation(
            QString("Line %1: unterminated quoted field").arg(recordLine), recordLine));
        return false;
    }

    if (rows) *rows = result;
    return true;
}

bool ProductCsv::read(const QString &filePath, QList<ImportRow> *rows, StockError *error)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning(productCsv) << "ProductCsv::read: Cannot open" << filePath << ":" << file.errorString();
        setStockError(error, StockError::validation(
            QString("Cannot open '%1': %2").arg(filePath, file.errorString())));
        return false;
    }

    QTextStream in(&file);
    return parse(in.readAll(), rows, error);
}

QString ProductCsv::format(const QList<Product> &products)
{
    QString out;
    QTextStream stream(&out);
    stream << header().join(',') << '\n';

    for (const auto &p : products) {
        stream << p.id << ','
               << quoted(p.name) << ','
               << quoted(p.category) << ','
               << decimalToString(p.buyPrice) << ','
               << decimalToString(p.sellPrice) << ','
               << timestampToString(p.lastUpdated) << ','
               << p.stock << '\n';
    }
    return out;
}

bool ProductCsv::write(const QString &filePath, const QList<Product> &products, StockError *error)
{
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text | QIODevice::Truncate)) {
        qWarning(productCsv) << "ProductCsv::write: Cannot open" << filePath << ":" << file.errorString();
        setStockError(error, StockError::storage(
            QString("Cannot write '%1': %2").arg(filePath, file.errorString())));
        return false;
    }

    QTextStream out(&file);
    out << format(products);
    out.flush();

    if (out.status() != QTextStream::Ok) {
        setStockError(error, StockError::storage(QString("Write to '%1' failed").arg(filePath)));
        return false;
    }
    return true;
}
