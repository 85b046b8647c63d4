#ifndef ISALEREPOSITORY_H
#define ISALEREPOSITORY_H

#include <QList>
#include <QString>
#include <QDate>

#include "DecimalUtils.h"

/**
 * @brief Продажа
 *
 * itemName - копия наименования на момент продажи, связь с товаром по productId.
 */
struct SaleRecord {
    int id = 0;
    QDate saleDate = QDate::currentDate();
    QString itemName;
    int quantity = 0;
    Decimal unitPrice = 0;
    Decimal discount = 0;
    Decimal total = 0;
    int productId = 0;
    
    bool isValid() const { return id > 0 && productId > 0; }
};

class ISaleRepository
{
public:
    virtual ~ISaleRepository() = default;
    
    virtual int create(const SaleRecord &sale) = 0;
    virtual SaleRecord findById(int id, bool *ok = nullptr) = 0;
    virtual QList<SaleRecord> findAll() = 0;
    virtual QList<SaleRecord> findByProduct(int productId) = 0;
    virtual bool update(const SaleRecord &sale) = 0;
    virtual bool remove(int id) = 0;
};

#endif // ISALEREPOSITORY_H
