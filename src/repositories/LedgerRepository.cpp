#include "repositories/LedgerRepository.h"
#include "DateTimeUtils.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(ledgerRepo, "repository.ledger")

namespace {
const char* const kBalanceSelect = R"(
    SELECT p.id    AS product_id,
           p.name  AS product_name,
           p.stock AS stock,
           COALESCE((SELECT SUM(l.quantity_change)
                     FROM stock_ledger l
                     WHERE l.product_id = p.id), 0) AS ledger_sum
    FROM products p
)";
}

LedgerRepository::LedgerRepository(QSqlDatabase db)
    : m_db(db)
{
    if (!m_db.isOpen()) {
        qCritical(ledgerRepo) << "LedgerRepository: Database is not open";
    }
}

bool LedgerRepository::executeQuery(QSqlQuery& q, const QString& context) const
{
    if (!q.exec()) {
        qCritical(ledgerRepo) << "LedgerRepository::" << context << "- SQL error:" << q.lastError().text();
        qCritical(ledgerRepo) << "LedgerRepository::" << context << "- SQL:" << q.executedQuery();
        return false;
    }
    return true;
}

LedgerEntry LedgerRepository::entryFromQuery(const QSqlQuery& q) const
{
    LedgerEntry e;
    e.id = q.value("id").toInt();
    e.productId = q.value("product_id").toInt();
    e.createdAt = timestampFromString(q.value("created_at").toString());
    e.quantityChange = q.value("quantity_change").toInt();
    e.reason = q.value("reason").toString();
    return e;
}

LedgerBalance LedgerRepository::balanceFromQuery(const QSqlQuery& q) const
{
    LedgerBalance b;
    b.productId = q.value("product_id").toInt();
    b.productName = q.value("product_name").toString();
    b.stock = q.value("stock").toInt();
    b.ledgerSum = q.value("ledger_sum").toInt();
    return b;
}

int LedgerRepository::append(const LedgerEntry& entry)
{
    if (entry.productId <= 0) return -1;

    const QDateTime createdAt = entry.createdAt.isValid() ? entry.createdAt : currentTimestamp();

    QSqlQuery q(m_db);
    q.prepare(R"(
        INSERT INTO stock_ledger (product_id, created_at, quantity_change, reason)
        VALUES (:prod, :created, :qty, :reason)
    )");
    q.bindValue(":prod", entry.productId);
    q.bindValue(":created", timestampToString(createdAt));
    q.bindValue(":qty", entry.quantityChange);
    q.bindValue(":reason", entry.reason);

    if (!executeQuery(q, "append")) return -1;

    const int id = q.lastInsertId().toInt();
    return id > 0 ? id : -1;
}

LedgerEntry LedgerRepository::findById(int id)
{
    if (id <= 0) return LedgerEntry();

    QSqlQuery q(m_db);
    q.prepare(R"(
        SELECT id, product_id, created_at, quantity_change, reason
        FROM stock_ledger
        WHERE id = :id
    )");
    q.bindValue(":id", id);

    if (!executeQuery(q, "findById")) return LedgerEntry();
    if (!q.next()) return LedgerEntry();

    return entryFromQuery(q);
}

QList<LedgerEntry> LedgerRepository::findByProduct(int productId)
{
    QList<LedgerEntry> res;
    if (productId <= 0) return res;

    QSqlQuery q(m_db);
    q.prepare(R"(
        SELECT id, product_id, created_at, quantity_change, reason
        FROM stock_ledger
        WHERE product_id = :prod
        ORDER BY created_at DESC, id DESC
    )");
    q.bindValue(":prod", productId);

    if (!executeQuery(q, "findByProduct")) return res;
    while (q.next()) res.append(entryFromQuery(q));
    return res;
}

int LedgerRepository::countForProduct(int productId)
{
    QSqlQuery q(m_db);
    q.prepare("SELECT COUNT(*) FROM stock_ledger WHERE product_id = :prod");
    q.bindValue(":prod", productId);

    if (!executeQuery(q, "countForProduct")) return -1;
    if (!q.next()) return -1;

    return q.value(0).toInt();
}

int LedgerRepository::sumForProduct(int productId, bool *ok)
{
    if (ok) *ok = true;

    QSqlQuery q(m_db);
    q.prepare(R"(
        SELECT COALESCE(SUM(quantity_change), 0) AS total
        FROM stock_ledger
        WHERE product_id = :prod
    )");
    q.bindValue(":prod", productId);

    if (!executeQuery(q, "sumForProduct") || !q.next()) {
        if (ok) *ok = false;
        return 0;
    }

    return q.value("total").toInt();
}

LedgerBalance LedgerRepository::balanceForProduct(int productId, bool *ok)
{
    if (ok) *ok = true;
    if (productId <= 0) return LedgerBalance();

    QSqlQuery q(m_db);
    q.prepare(QString(kBalanceSelect) + " WHERE p.id = :prod");
    q.bindValue(":prod", productId);

    if (!executeQuery(q, "balanceForProduct")) {
        if (ok) *ok = false;
        return LedgerBalance();
    }
    if (!q.next()) return LedgerBalance();

    return balanceFromQuery(q);
}

QList<LedgerBalance> LedgerRepository::allBalances(bool *ok)
{
    if (ok) *ok = true;
    QList<LedgerBalance> res;

    QSqlQuery q(m_db);
    q.prepare(QString(kBalanceSelect) + " ORDER BY p.id");

    if (!executeQuery(q, "allBalances")) {
        if (ok) *ok = false;
        return res;
    }

    while (q.next()) res.append(balanceFromQuery(q));
    return res;
}

bool LedgerRepository::deleteByProduct(int productId)
{
    if (productId <= 0) return false;

    QSqlQuery q(m_db);
    q.prepare("DELETE FROM stock_ledger WHERE product_id = :prod");
    q.bindValue(":prod", productId);

    return executeQuery(q, "deleteByProduct");
}
