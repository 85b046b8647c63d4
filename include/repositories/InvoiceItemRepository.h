#ifndef INVOICEITEMREPOSITORY_H
#define INVOICEITEMREPOSITORY_H

#include <QSqlDatabase>
#include <QSqlQuery>
#include "repositories/IInvoiceItemRepository.h"

class InvoiceItemRepository : public IInvoiceItemRepository
{
public:
    explicit InvoiceItemRepository(QSqlDatabase db);

    int create(const InvoiceItem& item) override;
    QList<InvoiceItem> findByInvoice(int invoiceId, bool *ok = nullptr) override;
    bool deleteByInvoice(int invoiceId) override;

private:
    InvoiceItem itemFromQuery(const QSqlQuery& q) const;
    bool executeQuery(QSqlQuery& q, const QString& context) const;

private:
    QSqlDatabase m_db;
};

#endif // INVOICEITEMREPOSITORY_H
