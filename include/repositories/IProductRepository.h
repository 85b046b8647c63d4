#ifndef IPRODUCTREPOSITORY_H
#define IPRODUCTREPOSITORY_H

#include <QList>
#include <QString>
#include <QStringList>
#include <QDateTime>

#include "DecimalUtils.h"

struct Product {
    int id = 0;
    QString name;
    QString category;
    Decimal buyPrice = 0;
    Decimal sellPrice = 0;
    QDateTime lastUpdated;
    int stock = 0;
    
    bool isValid() const { return id > 0 && !name.isEmpty(); }
};

/**
 * @brief Интерфейс репозитория товаров
 *
 * Поле stock - кэшированная проекция журнала, пишется только через updateStock().
 */
class IProductRepository
{
public:
    virtual ~IProductRepository() = default;
    
    virtual int create(const Product &product) = 0;
    
    virtual Product findById(int id, bool *ok = nullptr) = 0;

    virtual Product findByName(const QString &name, bool *ok = nullptr) = 0;

    /**
     * @brief Все товары в порядке добавления
     */
    virtual QList<Product> findAll(bool *ok = nullptr) = 0;

    virtual QStringList names() = 0;

    /**
     * @brief Обновить наименование, категорию, цены и last_updated (без остатка)
     */
    virtual bool update(const Product &product) = 0;

    virtual bool updateStock(int id, int stock, const QDateTime &timestamp) = 0;

    virtual bool remove(int id) = 0;

    virtual bool exists(int id) = 0;

    virtual bool nameExists(const QString &name, int excludeId = 0, bool *ok = nullptr) = 0;

    /**
     * @brief Есть ли продажи, списания или строки счетов, ссылающиеся на товар
     */
    virtual bool isReferenced(int id, bool *ok = nullptr) = 0;
};

#endif // IPRODUCTREPOSITORY_H
