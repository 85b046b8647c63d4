#ifndef REPORTREPOSITORY_H
#define REPORTREPOSITORY_H

#include <QList>
#include <QPair>
#include <QString>
#include <QSqlDatabase>
#include <QSqlQuery>

#include "DecimalUtils.h"

struct StockLevel {
    int productId = 0;
    QString name;
    int stock = 0;
};

struct InventorySummary {
    int productCount = 0;
    int totalStock = 0;
    Decimal salesTotal = 0;
    int unitsSold = 0;
    int damagedUnreplaced = 0;

    // Товары с остатком <= порога, по возрастанию остатка
    QList<StockLevel> lowStock;

    // Наименование -> проданное количество, по убыванию (не больше 5)
    QList<QPair<QString, int>> topSellers;
};

/**
 * @brief Агрегаты для сводки по складу (только чтение)
 */
class ReportRepository
{
public:
    explicit ReportRepository(QSqlDatabase db);

    InventorySummary summary(int lowStockThreshold, bool *ok = nullptr);

    QList<StockLevel> lowStock(int threshold, bool *ok = nullptr);

private:
    bool executeQuery(QSqlQuery& q, const QString& context) const;

private:
    QSqlDatabase m_db;
};

#endif // REPORTREPOSITORY_H
