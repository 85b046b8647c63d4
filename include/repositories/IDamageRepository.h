#ifndef IDAMAGEREPOSITORY_H
#define IDAMAGEREPOSITORY_H

#include <QList>
#include <QString>
#include <QDate>

struct DamageRecord {
    int id = 0;
    QDate damageDate = QDate::currentDate();
    QString productName;
    int quantity = 0;
    int productId = 0;
    bool replaced = false;
    
    bool isValid() const { return id > 0 && productId > 0; }
};

/**
 * @brief Интерфейс репозитория повреждённого товара
 */
class IDamageRepository
{
public:
    virtual ~IDamageRepository() = default;
    
    virtual int create(const DamageRecord &damage) = 0;
    virtual DamageRecord findById(int id, bool *ok = nullptr) = 0;
    virtual QList<DamageRecord> findAll() = 0;
    
    /**
     * @brief Отметить замену (только если ещё не заменено)
     * @return true если флаг был установлен этим вызовом
     */
    virtual bool markReplaced(int id) = 0;
    
    virtual bool remove(int id) = 0;
};

#endif // IDAMAGEREPOSITORY_H
