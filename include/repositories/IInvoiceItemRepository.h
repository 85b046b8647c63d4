#ifndef IINVOICEITEMREPOSITORY_H
#define IINVOICEITEMREPOSITORY_H

#include <QList>
#include <QString>

#include "DecimalUtils.h"

/**
 * @brief Строка счёта
 */
struct InvoiceItem {
    int id = 0;
    int invoiceId = 0;
    int productId = 0;
    int quantity = 0;
    Decimal unitPrice = 0;
    Decimal discount = 0;
    Decimal total = 0;
    
    bool isValid() const { return id > 0 && invoiceId > 0 && productId > 0; }
};

/**
 * @brief Интерфейс репозитория строк счетов
 */
class IInvoiceItemRepository
{
public:
    virtual ~IInvoiceItemRepository() = default;
    
    virtual int create(const InvoiceItem &item) = 0;
    
    virtual QList<InvoiceItem> findByInvoice(int invoiceId, bool *ok = nullptr) = 0;
    
    virtual bool deleteByInvoice(int invoiceId) = 0;
};

#endif // IINVOICEITEMREPOSITORY_H
