#ifndef IMPORTSERVICE_H
#define IMPORTSERVICE_H

#include <QObject>
#include <QList>
#include <QString>
#include <QSqlDatabase>

#include "StockError.h"
#include "DecimalUtils.h"
#include "repositories/IProductRepository.h"

class StockService;

/**
 * @brief Строка импорта; lineNumber - номер строки в источнике (для ошибок)
 */
struct ImportRow {
    int lineNumber = 0;
    QString name;
    QString category;
    Decimal buyPrice = 0;
    Decimal sellPrice = 0;
    int stock = 0;
};

struct ImportSummary {
    int created = 0;
    int updated = 0;
    qint64 totalQuantity = 0;
};

/**
 * @brief Массовый импорт товаров одной транзакцией
 *
 * Ошибка в любой строке откатывает весь пакет.
 */
class ImportService : public QObject
{
    Q_OBJECT

public:
    explicit ImportService(
        IProductRepository* productRepo,
        StockService* stockService,
        QSqlDatabase db,
        QObject *parent = nullptr
    );

    bool importRows(const QList<ImportRow> &rows, ImportSummary *summary = nullptr, StockError *error = nullptr);

private:
    IProductRepository* m_productRepo;
    StockService* m_stockService;
    QSqlDatabase m_db;
};

#endif // IMPORTSERVICE_H
