#include "repositories/SaleRepository.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(saleRepo, "repository.sale")

SaleRepository::SaleRepository(QSqlDatabase db)
    : m_db(db)
{
    if (!m_db.isOpen()) {
        qCritical(saleRepo) << "SaleRepository: Database is not open";
    }
}

bool SaleRepository::executeQuery(QSqlQuery& q, const QString& context) const
{
    if (!q.exec()) {
        qCritical(saleRepo) << "SaleRepository::" << context << "- SQL error:" << q.lastError().text();
        qCritical(saleRepo) << "SaleRepository::" << context << "- SQL:" << q.executedQuery();
        return false;
    }
    return true;
}

SaleRecord SaleRepository::saleFromQuery(const QSqlQuery& q) const
{
    SaleRecord s;
    s.id = q.value("id").toInt();
    s.saleDate = QDate::fromString(q.value("sale_date").toString(), Qt::ISODate);
    s.itemName = q.value("item_name").toString();
    s.quantity = q.value("quantity").toInt();
    s.unitPrice = decimalFromVariant(q.value("unit_price"));
    s.discount = decimalFromVariant(q.value("discount"));
    s.total = decimalFromVariant(q.value("total"));
    s.productId = q.value("product_id").toInt();
    return s;
}

int SaleRepository::create(const SaleRecord& sale)
{
    if (sale.productId <= 0 || sale.quantity <= 0) return -1;

    QSqlQuery q(m_db);
    q.prepare(R"(
        INSERT INTO sales (sale_date, item_name, quantity, unit_price, discount, total, product_id)
        VALUES (:date, :item, :qty, :price, :discount, :total, :prod)
    )");
    q.bindValue(":date", sale.saleDate.toString(Qt::ISODate));
    q.bindValue(":item", sale.itemName);
    q.bindValue(":qty", sale.quantity);
    q.bindValue(":price", decimalToString(sale.unitPrice));
    q.bindValue(":discount", decimalToString(sale.discount));
    q.bindValue(":total", decimalToString(sale.total));
    q.bindValue(":prod", sale.productId);

    if (!executeQuery(q, "create")) return -1;

    const int id = q.lastInsertId().toInt();
    return id > 0 ? id : -1;
}

SaleRecord SaleRepository::findById(int id, bool *ok)
{
    if (ok) *ok = true;
    if (id <= 0) return SaleRecord();

    QSqlQuery q(m_db);
    q.prepare(R"(
        SELECT id, sale_date, item_name, quantity, unit_price, discount, total, product_id
        FROM sales
        WHERE id = :id
    )");
    q.bindValue(":id", id);

    if (!executeQuery(q, "findById")) {
        if (ok) *ok = false;
        return SaleRecord();
    }
    if (!q.next()) return SaleRecord();

    return saleFromQuery(q);
}

QList<SaleRecord> SaleRepository::findAll()
{
    QList<SaleRecord> res;

    QSqlQuery q(m_db);
    q.prepare(R"(
        SELECT id, sale_date, item_name, quantity, unit_price, discount, total, product_id
        FROM sales
        ORDER BY id DESC
    )");

    if (!executeQuery(q, "findAll")) return res;
    while (q.next()) res.append(saleFromQuery(q));
    return res;
}

QList<SaleRecord> SaleRepository::findByProduct(int productId)
{
    QList<SaleRecord> res;
    if (productId <= 0) return res;

    QSqlQuery q(m_db);
    q.prepare(R"(
        SELECT id, sale_date, item_name, quantity, unit_price, discount, total, product_id
        FROM sales
        WHERE product_id = :prod
        ORDER BY id
    )");
    q.bindValue(":prod", productId);

    if (!executeQuery(q, "findByProduct")) return res;
    while (q.next()) res.append(saleFromQuery(q));
    return res;
}

bool SaleRepository::update(const SaleRecord& sale)
{
    if (!sale.isValid()) return false;

    QSqlQuery q(m_db);
    q.prepare(R"(
        UPDATE sales
        SET sale_date = :date,
            item_name = :item,
            quantity = :qty,
            unit_price = :price,
            discount = :discount,
            total = :total,
            product_id = :prod
        WHERE id = :id
    )");
    q.bindValue(":id", sale.id);
    q.bindValue(":date", sale.saleDate.toString(Qt::ISODate));
    q.bindValue(":item", sale.itemName);
    q.bindValue(":qty", sale.quantity);
    q.bindValue(":price", decimalToString(sale.unitPrice));
    q.bindValue(":discount", decimalToString(sale.discount));
    q.bindValue(":total", decimalToString(sale.total));
    q.bindValue(":prod", sale.productId);

    if (!executeQuery(q, "update")) return false;
    return q.numRowsAffected() > 0;
}

bool SaleRepository::remove(int id)
{
    if (id <= 0) return false;

    QSqlQuery q(m_db);
    q.prepare("DELETE FROM sales WHERE id = :id");
    q.bindValue(":id", id);

    if (!executeQuery(q, "remove")) return false;
    return q.numRowsAffected() > 0;
}
