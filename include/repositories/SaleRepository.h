#ifndef SALEREPOSITORY_H
#define SALEREPOSITORY_H

#include <QSqlDatabase>
#include <QSqlQuery>
#include "repositories/ISaleRepository.h"

class SaleRepository : public ISaleRepository
{
public:
    explicit SaleRepository(QSqlDatabase db);

    int create(const SaleRecord& sale) override;
    SaleRecord findById(int id, bool *ok = nullptr) override;
    QList<SaleRecord> findAll() override;
    QList<SaleRecord> findByProduct(int productId) override;
    bool update(const SaleRecord& sale) override;
    bool remove(int id) override;

private:
    SaleRecord saleFromQuery(const QSqlQuery& q) const;
    bool executeQuery(QSqlQuery& q, const QString& context) const;

private:
    QSqlDatabase m_db;
};

#endif // SALEREPOSITORY_H
