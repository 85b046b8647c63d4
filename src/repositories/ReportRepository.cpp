#include "repositories/ReportRepository.h"
#include <QSqlError>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(reportRepo, "repository.report")

ReportRepository::ReportRepository(QSqlDatabase db)
    : m_db(db)
{
    if (!m_db.isOpen()) {
        qCritical(reportRepo) << "ReportRepository: Database is not open";
    }
}

bool ReportRepository::executeQuery(QSqlQuery& q, const QString& context) const
{
    if (!q.exec()) {
        qCritical(reportRepo) << "ReportRepository::" << context << "- SQL error:" << q.lastError().text();
        qCritical(reportRepo) << "ReportRepository::" << context << "- SQL:" << q.executedQuery();
        return false;
    }
    return true;
}

QList<StockLevel> ReportRepository::lowStock(int threshold, bool *ok)
{
    if (ok) *ok = true;
    QList<StockLevel> res;

    QSqlQuery q(m_db);
    q.prepare(R"(
        SELECT id, name, stock
        FROM products
        WHERE stock <= :threshold
        ORDER BY stock ASC, name ASC
    )");
    q.bindValue(":threshold", threshold);

    if (!executeQuery(q, "lowStock")) {
        if (ok) *ok = false;
        return res;
    }

    while (q.next()) {
        StockLevel level;
        level.productId = q.value("id").toInt();
        level.name = q.value("name").toString();
        level.stock = q.value("stock").toInt();
        res.append(level);
    }
    return res;
}

InventorySummary ReportRepository::summary(int lowStockThreshold, bool *ok)
{
    if (ok) *ok = false;
    InventorySummary s;

    {
        QSqlQuery q(m_db);
        q.prepare("SELECT COUNT(*) AS cnt, COALESCE(SUM(stock), 0) AS total FROM products");
        if (!executeQuery(q, "summary.products") || !q.next()) return s;
        s.productCount = q.value("cnt").toInt();
        s.totalStock = q.value("total").toInt();
    }

    {
        QSqlQuery q(m_db);
        q.prepare("SELECT COALESCE(SUM(total), 0) AS total, COALESCE(SUM(quantity), 0) AS qty FROM sales");
        if (!executeQuery(q, "summary.sales") || !q.next()) return s;
        s.salesTotal = decimalFromVariant(q.value("total"));
        s.unitsSold = q.value("qty").toInt();
    }

    {
        QSqlQuery q(m_db);
        q.prepare("SELECT COALESCE(SUM(quantity), 0) FROM damaged_products WHERE replaced = 0");
        if (!executeQuery(q, "summary.damaged") || !q.next()) return s;
        s.damagedUnreplaced = q.value(0).toInt();
    }

    {
        QSqlQuery q(m_db);
        q.prepare(R"(
            SELECT item_name, SUM(quantity) AS qty
            FROM sales
            GROUP BY item_name
            ORDER BY qty DESC, item_name ASC
            LIMIT 5
        )");
        if (!executeQuery(q, "summary.topSellers")) return s;
        while (q.next()) {
            s.topSellers.append(qMakePair(q.value("item_name").toString(), q.value("qty").toInt()));
        }
    }

    bool lowOk = false;
    s.lowStock = lowStock(lowStockThreshold, &lowOk);
    if (!lowOk) return s;

    if (ok) *ok = true;
    return s;
}
