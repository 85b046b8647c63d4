#ifndef LEDGERREPOSITORY_H
#define LEDGERREPOSITORY_H

#include <QSqlDatabase>
#include <QSqlQuery>
#include "repositories/ILedgerRepository.h"

class LedgerRepository : public ILedgerRepository
{
public:
    explicit LedgerRepository(QSqlDatabase db);

    int append(const LedgerEntry& entry) override;
    LedgerEntry findById(int id) override;
    QList<LedgerEntry> findByProduct(int productId) override;
    int countForProduct(int productId) override;
    int sumForProduct(int productId, bool *ok = nullptr) override;
    LedgerBalance balanceForProduct(int productId, bool *ok = nullptr) override;
    QList<LedgerBalance> allBalances(bool *ok = nullptr) override;
    bool deleteByProduct(int productId) override;

private:
    LedgerEntry entryFromQuery(const QSqlQuery& q) const;
    LedgerBalance balanceFromQuery(const QSqlQuery& q) const;
    bool executeQuery(QSqlQuery& q, const QString& context) const;

private:
    QSqlDatabase m_db;
};

#endif // LEDGERREPOSITORY_H
