#ifndef DAMAGEREPOSITORY_H
#define DAMAGEREPOSITORY_H

#include <QSqlDatabase>
#include <QSqlQuery>
#include "repositories/IDamageRepository.h"

class DamageRepository : public IDamageRepository
{
public:
    explicit DamageRepository(QSqlDatabase db);

    int create(const DamageRecord& damage) override;
    DamageRecord findById(int id, bool *ok = nullptr) override;
    QList<DamageRecord> findAll() override;
    bool markReplaced(int id) override;
    bool remove(int id) override;

private:
    DamageRecord damageFromQuery(const QSqlQuery& q) const;
    bool executeQuery(QSqlQuery& q, const QString& context) const;

private:
    QSqlDatabase m_db;
};

#endif // DAMAGEREPOSITORY_H
