#include "repositories/DamageRepository.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(damageRepo, "repository.damage")

DamageRepository::DamageRepository(QSqlDatabase db)
    : m_db(db)
{
    if (!m_db.isOpen()) {
        qCritical(damageRepo) << "DamageRepository: Database is not open";
    }
}

bool DamageRepository::executeQuery(QSqlQuery& q, const QString& context) const
{
    if (!q.exec()) {
        qCritical(damageRepo) << "DamageRepository::" << context << "- SQL error:" << q.lastError().text();
        qCritical(damageRepo) << "DamageRepository::" << context << "- SQL:" << q.executedQuery();
        return false;
    }
    return true;
}

DamageRecord DamageRepository::damageFromQuery(const QSqlQuery& q) const
{
    DamageRecord d;
    d.id = q.value("id").toInt();
    d.damageDate = QDate::fromString(q.value("damage_date").toString(), Qt::ISODate);
    d.productName = q.value("product_name").toString();
    d.quantity = q.value("quantity").toInt();
    d.productId = q.value("product_id").toInt();
    d.replaced = q.value("replaced").toInt() == 1;
    return d;
}

int DamageRepository::create(const DamageRecord& damage)
{
    if (damage.productId <= 0 || damage.quantity <= 0) return -1;

    QSqlQuery q(m_db);
    q.prepare(R"(
        INSERT INTO damaged_products (damage_date, product_name, quantity, product_id, replaced)
        VALUES (:date, :name, :qty, :prod, :replaced)
    )");
    q.bindValue(":date", damage.damageDate.toString(Qt::ISODate));
    q.bindValue(":name", damage.productName);
    q.bindValue(":qty", damage.quantity);
    q.bindValue(":prod", damage.productId);
    q.bindValue(":replaced", damage.replaced ? 1 : 0);

    if (!executeQuery(q, "create")) return -1;

    const int id = q.lastInsertId().toInt();
    return id > 0 ? id : -1;
}

DamageRecord DamageRepository::findById(int id, bool *ok)
{
    if (ok) *ok = true;
    if (id <= 0) return DamageRecord();

    QSqlQuery q(m_db);
    q.prepare(R"(
        SELECT id, damage_date, product_name, quantity, product_id, replaced
        FROM damaged_products
        WHERE id = :id
    )");
    q.bindValue(":id", id);

    if (!executeQuery(q, "findById")) {
        if (ok) *ok = false;
        return DamageRecord();
    }
    if (!q.next()) return DamageRecord();

    return damageFromQuery(q);
}

QList<DamageRecord> DamageRepository::findAll()
{
    QList<DamageRecord> res;

    QSqlQuery q(m_db);
    q.prepare(R"(
        SELECT id, damage_date, product_name, quantity, product_id, replaced
        FROM damaged_products
        ORDER BY id DESC
    )");

    if (!executeQuery(q, "findAll")) return res;
    while (q.next()) res.append(damageFromQuery(q));
    return res;
}

bool DamageRepository::markReplaced(int id)
{
    if (id <= 0) return false;

    QSqlQuery q(m_db);
    q.prepare(R"(
        UPDATE damaged_products
        SET replaced = 1
        WHERE id = :id
          AND replaced = 0
    )");
    q.bindValue(":id", id);

    if (!executeQuery(q, "markReplaced")) return false;
    return q.numRowsAffected() > 0;
}

bool DamageRepository::remove(int id)
{
    if (id <= 0) return false;

    QSqlQuery q(m_db);
    q.prepare("DELETE FROM damaged_products WHERE id = :id");
    q.bindValue(":id", id);

    if (!executeQuery(q, "remove")) return false;
    return q.numRowsAffected() > 0;
}
