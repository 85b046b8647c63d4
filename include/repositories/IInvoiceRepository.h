#ifndef IINVOICEREPOSITORY_H
#define IINVOICEREPOSITORY_H

#include <QList>
#include <QString>
#include <QDate>
#include <QDateTime>

#include "DecimalUtils.h"

/**
 * @brief Структура данных счёта
 *
 * saleId > 0 - счёт выписан по продаже и сам остаток не меняет.
 */
struct Invoice {
    int id = 0;
    QString number;
    QDate invoiceDate = QDate::currentDate();
    QString customerName;
    Decimal subtotal = 0;
    Decimal tax = 0;
    Decimal grandTotal = 0;
    QDateTime createdAt;
    int saleId = 0;
    
    bool isValid() const { return id > 0 && !number.isEmpty(); }
    bool isFromSale() const { return saleId > 0; }
};

/**
 * @brief Интерфейс репозитория счетов
 */
class IInvoiceRepository
{
public:
    virtual ~IInvoiceRepository() = default;
    
    virtual int create(const Invoice &invoice) = 0;
    virtual Invoice findById(int id, bool *ok = nullptr) = 0;
    virtual Invoice findByNumber(const QString &number, bool *ok = nullptr) = 0;
    
    /**
     * @brief Первый счёт, выписанный по продаже
     */
    virtual Invoice findBySale(int saleId, bool *ok = nullptr) = 0;
    
    virtual QList<Invoice> findAll() = 0;
    virtual QList<Invoice> findByDateRange(const QDate &from, const QDate &to) = 0;
    virtual bool remove(int id) = 0;
};

#endif // IINVOICEREPOSITORY_H
