#ifndef INVOICEREPOSITORY_H
#define INVOICEREPOSITORY_H

#include <QSqlDatabase>
#include <QSqlQuery>
#include "repositories/IInvoiceRepository.h"

class InvoiceRepository : public IInvoiceRepository
{
public:
    explicit InvoiceRepository(QSqlDatabase db);

    int create(const Invoice& invoice) override;
    Invoice findById(int id, bool *ok = nullptr) override;
    Invoice findByNumber(const QString& number, bool *ok = nullptr) override;
    Invoice findBySale(int saleId, bool *ok = nullptr) override;
    QList<Invoice> findAll() override;
    QList<Invoice> findByDateRange(const QDate& from, const QDate& to) override;
    bool remove(int id) override;

private:
    Invoice invoiceFromQuery(const QSqlQuery& q) const;
    Invoice fetchOne(QSqlQuery& q, const QString& context, bool *ok) const;
    bool executeQuery(QSqlQuery& q, const QString& context) const;

private:
    QSqlDatabase m_db;
};

#endif // INVOICEREPOSITORY_H
