#ifndef DAMAGESERVICE_H
#define DAMAGESERVICE_H

#include <QObject>
#include <QDate>
#include <QString>
#include <QSqlDatabase>

#include "StockError.h"
#include "repositories/IDamageRepository.h"
#include "repositories/IProductRepository.h"

class StockService;

struct DamageRequest {
    QDate date = QDate::currentDate();
    QString productName;
    int quantity = 0;
};

/**
 * @brief Учёт повреждённого товара и его замены
 */
class DamageService : public QObject
{
    Q_OBJECT

public:
    explicit DamageService(
        IDamageRepository* damageRepo,
        IProductRepository* productRepo,
        StockService* stockService,
        QSqlDatabase db,
        QObject *parent = nullptr
    );

    int createDamage(const DamageRequest &request, StockError *error = nullptr);

    /**
     * @brief Замена поставщиком: количество возвращается на склад один раз
     */
    bool replaceDamage(int damageId, StockError *error = nullptr);

    /**
     * @brief Удалить запись; незаменённое количество возвращается на склад
     */
    bool deleteDamage(int damageId, StockError *error = nullptr);

private:
    DamageRecord loadDamage(int damageId, StockError *error);

    IDamageRepository* m_damageRepo;
    IProductRepository* m_productRepo;
    StockService* m_stockService;
    QSqlDatabase m_db;
};

#endif // DAMAGESERVICE_H
