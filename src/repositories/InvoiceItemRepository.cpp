#include "repositories/InvoiceItemRepository.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(invoiceItemRepo, "repository.invoice_item")

InvoiceItemRepository::InvoiceItemRepository(QSqlDatabase db)
    : m_db(db)
{
    if (!m_db.isOpen()) {
        qCritical(invoiceItemRepo) << "InvoiceItemRepository: Database is not open";
    }
}

bool InvoiceItemRepository::executeQuery(QSqlQuery& q, const QString& context) const
{
    if (!q.exec()) {
        qCritical(invoiceItemRepo) << "InvoiceItemRepository::" << context << "- SQL error:" << q.lastError().text();
        qCritical(invoiceItemRepo) << "InvoiceItemRepository::" << context << "- SQL:" << q.executedQuery();
        return false;
    }
    return true;
}

InvoiceItem InvoiceItemRepository::itemFromQuery(const QSqlQuery& q) const
{
    InvoiceItem i;
    i.id = q.value("id").toInt();
    i.invoiceId = q.value("invoice_id").toInt();
    i.productId = q.value("product_id").toInt();
    i.quantity = q.value("quantity").toInt();
    i.unitPrice = decimalFromVariant(q.value("unit_price"));
    i.discount = decimalFromVariant(q.value("discount"));
    i.total = decimalFromVariant(q.value("total"));
    return i;
}

int InvoiceItemRepository::create(const InvoiceItem& item)
{
    if (item.invoiceId <= 0 || item.productId <= 0) return -1;

    QSqlQuery q(m_db);
    q.prepare(R"(
        INSERT INTO invoice_items (invoice_id, product_id, quantity, unit_price, discount, total)
        VALUES (:inv, :prod, :qty, :price, :discount, :total)
    )");
    q.bindValue(":inv", item.invoiceId);
    q.bindValue(":prod", item.productId);
    q.bindValue(":qty", item.quantity);
    q.bindValue(":price", decimalToString(item.unitPrice));
    q.bindValue(":discount", decimalToString(item.discount));
    q.bindValue(":total", decimalToString(item.total));

    if (!executeQuery(q, "create")) return -1;

    const int id = q.lastInsertId().toInt();
    return id > 0 ? id : -1;
}

QList<InvoiceItem> InvoiceItemRepository::findByInvoice(int invoiceId, bool *ok)
{
    if (ok) *ok = true;
    QList<InvoiceItem> res;
    if (invoiceId <= 0) return res;

    QSqlQuery q(m_db);
    q.prepare(R"(
        SELECT id, invoice_id, product_id, quantity, unit_price, discount, total
        FROM invoice_items
        WHERE invoice_id = :inv
        ORDER BY id
    )");
    q.bindValue(":inv", invoiceId);

    if (!executeQuery(q, "findByInvoice")) {
        if (ok) *ok = false;
        return res;
    }
    while (q.next()) res.append(itemFromQuery(q));
    return res;
}

bool InvoiceItemRepository::deleteByInvoice(int invoiceId)
{
    if (invoiceId <= 0) return false;

    QSqlQuery q(m_db);
    q.prepare("DELETE FROM invoice_items WHERE invoice_id = :inv");
    q.bindValue(":inv", invoiceId);

    return executeQuery(q, "deleteByInvoice");
}
