#ifndef STOCKSERVICE_H
#define STOCKSERVICE_H

#include <QObject>
#include <QList>
#include <QString>
#include <QSqlDatabase>

#include "StockError.h"
#include "repositories/IProductRepository.h"
#include "repositories/ILedgerRepository.h"

class LowStockNotifier;

/**
 * @brief Единственная точка изменения остатков
 *
 * Каждое изменение пишет запись журнала и новый остаток товара
 * в одной транзакции. Вызов внутри чужой транзакции к ней присоединяется.
 */
class StockService : public QObject
{
    Q_OBJECT

public:
    explicit StockService(
        IProductRepository* productRepo,
        ILedgerRepository* ledgerRepo,
        LowStockNotifier* notifier,
        QSqlDatabase db,
        int lowStockThreshold = 5,
        QObject *parent = nullptr
    );

    /**
     * @brief Изменить остаток товара на delta
     * @return Новый остаток или -1 при ошибке (детали в error)
     */
    int applyDelta(int productId, int delta, const QString &reason, StockError *error = nullptr);

    /**
     * @brief Текущий остаток или -1, если товар не найден / ошибка чтения
     */
    int quantity(int productId, StockError *error = nullptr);

    /**
     * @brief История движения товара, новые записи первыми
     */
    QList<LedgerEntry> history(int productId);

    int lowStockThreshold() const { return m_lowStockThreshold; }
    void setLowStockThreshold(int threshold) { m_lowStockThreshold = threshold; }

private:
    IProductRepository* m_productRepo;
    ILedgerRepository* m_ledgerRepo;
    LowStockNotifier* m_notifier;
    QSqlDatabase m_db;
    int m_lowStockThreshold;
};

#endif // STOCKSERVICE_H
