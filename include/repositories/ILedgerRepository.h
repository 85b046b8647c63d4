#ifndef ILEDGERREPOSITORY_H
#define ILEDGERREPOSITORY_H

#include <QList>
#include <QString>
#include <QDateTime>

struct LedgerEntry {
    int id = 0;
    int productId = 0;
    QDateTime createdAt;
    int quantityChange = 0;
    QString reason;
    
    bool isValid() const { return id > 0 && productId > 0; }
};

/**
 * @brief Остаток товара и сумма его журнала, прочитанные одним запросом
 */
struct LedgerBalance {
    int productId = 0;
    QString productName;
    int stock = 0;
    int ledgerSum = 0;
    
    bool isValid() const { return productId > 0; }
    bool hasDrift() const { return stock != ledgerSum; }
};

/**
 * @brief Интерфейс журнала движения остатков
 * 
 * Принципы:
 * - Записи журнала неизменяемы, только добавление
 * - Журнал принадлежит товару и удаляется вместе с ним
 */
class ILedgerRepository
{
public:
    virtual ~ILedgerRepository() = default;
    
    /**
     * @brief Добавить запись журнала
     * @return ID записи или -1 при ошибке
     */
    virtual int append(const LedgerEntry &entry) = 0;
    
    virtual LedgerEntry findById(int id) = 0;
    
    /**
     * @brief История товара, новые записи первыми
     */
    virtual QList<LedgerEntry> findByProduct(int productId) = 0;
    
    /**
     * @return Количество записей или -1 при ошибке
     */
    virtual int countForProduct(int productId) = 0;
    
    virtual int sumForProduct(int productId, bool *ok = nullptr) = 0;
    
    /**
     * @brief Остаток и сумма журнала одного товара (атомарное чтение)
     */
    virtual LedgerBalance balanceForProduct(int productId, bool *ok = nullptr) = 0;
    
    virtual QList<LedgerBalance> allBalances(bool *ok = nullptr) = 0;
    
    virtual bool deleteByProduct(int productId) = 0;
};

#endif // ILEDGERREPOSITORY_H
