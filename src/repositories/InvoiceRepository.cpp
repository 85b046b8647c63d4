#include "repositories/InvoiceRepository.h"
#include "DateTimeUtils.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(invoiceRepo, "repository.invoice")

InvoiceRepository::InvoiceRepository(QSqlDatabase db)
    : m_db(db)
{
    if (!m_db.isOpen()) {
        qCritical(invoiceRepo) << "InvoiceRepository: Database is not open";
    }
}

bool InvoiceRepository::executeQuery(QSqlQuery& q, const QString& context) const
{
    if (!q.exec()) {
        qCritical(invoiceRepo) << "InvoiceRepository::" << context << "- SQL error:" << q.lastError().text();
        qCritical(invoiceRepo) << "InvoiceRepository::" << context << "- SQL:" << q.executedQuery();
        return false;
    }
    return true;
}

Invoice InvoiceRepository::invoiceFromQuery(const QSqlQuery& q) const
{
    Invoice inv;
    inv.id = q.value("id").toInt();
    inv.number = q.value("invoice_number").toString();
    inv.invoiceDate = QDate::fromString(q.value("invoice_date").toString(), Qt::ISODate);
    inv.customerName = q.value("customer_name").toString();
    inv.subtotal = decimalFromVariant(q.value("subtotal"));
    inv.tax = decimalFromVariant(q.value("tax"));
    inv.grandTotal = decimalFromVariant(q.value("grand_total"));
    inv.createdAt = timestampFromString(q.value("created_at").toString());
    inv.saleId = q.value("sale_id").isNull() ? 0 : q.value("sale_id").toInt();
    return inv;
}

Invoice InvoiceRepository::fetchOne(QSqlQuery& q, const QString& context, bool *ok) const
{
    if (ok) *ok = true;
    if (!executeQuery(q, context)) {
        if (ok) *ok = false;
        return Invoice();
    }
    if (!q.next()) return Invoice();

    return invoiceFromQuery(q);
}

int InvoiceRepository::create(const Invoice& invoice)
{
    if (invoice.number.trimmed().isEmpty()) {
        qWarning(invoiceRepo) << "InvoiceRepository::create: empty number";
        return -1;
    }

    const QDateTime createdAt = invoice.createdAt.isValid() ? invoice.createdAt : currentTimestamp();

    QSqlQuery q(m_db);
    q.prepare(R"(
        INSERT INTO invoices (invoice_number, invoice_date, customer_name, subtotal, tax, grand_total, created_at, sale_id)
        VALUES (:number, :date, :customer, :subtotal, :tax, :grand, :created, :sale)
    )");
    q.bindValue(":number", invoice.number.trimmed());
    q.bindValue(":date", invoice.invoiceDate.toString(Qt::ISODate));
    q.bindValue(":customer", invoice.customerName.trimmed());
    q.bindValue(":subtotal", decimalToString(invoice.subtotal));
    q.bindValue(":tax", decimalToString(invoice.tax));
    q.bindValue(":grand", decimalToString(invoice.grandTotal));
    q.bindValue(":created", timestampToString(createdAt));
    q.bindValue(":sale", invoice.saleId == 0 ? QVariant() : QVariant(invoice.saleId));

    if (!executeQuery(q, "create")) return -1;

    const int id = q.lastInsertId().toInt();
    return id > 0 ? id : -1;
}

Invoice InvoiceRepository::findById(int id, bool *ok)
{
    if (ok) *ok = true;
    if (id <= 0) return Invoice();

    QSqlQuery q(m_db);
    q.prepare(R"(
        SELECT id, invoice_number, invoice_date, customer_name, subtotal, tax, grand_total, created_at, sale_id
        FROM invoices
        WHERE id = :id
    )");
    q.bindValue(":id", id);

    return fetchOne(q, "findById", ok);
}

Invoice InvoiceRepository::findByNumber(const QString& number, bool *ok)
{
    QSqlQuery q(m_db);
    q.prepare(R"(
        SELECT id, invoice_number, invoice_date, customer_name, subtotal, tax, grand_total, created_at, sale_id
        FROM invoices
        WHERE invoice_number = :number
        LIMIT 1
    )");
    q.bindValue(":number", number.trimmed());

    return fetchOne(q, "findByNumber", ok);
}

Invoice InvoiceRepository::findBySale(int saleId, bool *ok)
{
    if (ok) *ok = true;
    if (saleId <= 0) return Invoice();

    QSqlQuery q(m_db);
    q.prepare(R"(
        SELECT id, invoice_number, invoice_date, customer_name, subtotal, tax, grand_total, created_at, sale_id
        FROM invoices
        WHERE sale_id = :sale
        ORDER BY id
        LIMIT 1
    )");
    q.bindValue(":sale", saleId);

    return fetchOne(q, "findBySale", ok);
}

QList<Invoice> InvoiceRepository::findAll()
{
    QList<Invoice> res;
    QSqlQuery q(m_db);
    q.prepare(R"(
        SELECT id, invoice_number, invoice_date, customer_name, subtotal, tax, grand_total, created_at, sale_id
        FROM invoices
        ORDER BY invoice_date DESC, id DESC
    )");

    if (!executeQuery(q, "findAll")) return res;
    while (q.next()) res.append(invoiceFromQuery(q));
    return res;
}

QList<Invoice> InvoiceRepository::findByDateRange(const QDate& from, const QDate& to)
{
    QList<Invoice> res;
    QSqlQuery q(m_db);
    q.prepare(R"(
        SELECT id, invoice_number, invoice_date, customer_name, subtotal, tax, grand_total, created_at, sale_id
        FROM invoices
        WHERE invoice_date >= :from AND invoice_date <= :to
        ORDER BY invoice_date DESC, id DESC
    )");
    q.bindValue(":from", from.toString(Qt::ISODate));
    q.bindValue(":to", to.toString(Qt::ISODate));

    if (!executeQuery(q, "findByDateRange")) return res;
    while (q.next()) res.append(invoiceFromQuery(q));
    return res;
}

bool InvoiceRepository::remove(int id)
{
    if (id <= 0) return false;

    QSqlQuery q(m_db);
    q.prepare("DELETE FROM invoices WHERE id = :id");
    q.bindValue(":id", id);

    if (!executeQuery(q, "remove")) return false;
    return q.numRowsAffected() > 0;
}
