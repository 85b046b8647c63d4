#ifndef PRODUCTCSV_H
#define PRODUCTCSV_H

#include <QList>
#include <QString>
#include <QStringList>

#include "StockError.h"
#include "ImportService.h"
#include "repositories/IProductRepository.h"

/**
 * @brief CSV товаров: ID,Name,Type,Buy Price,Sell Price,Last Updated,Stock
 *
 * Первая строка - заголовок. ID и Last Updated при чтении игнорируются.
 */
class ProductCsv
{
public:
    static QStringList header();

    static bool read(const QString &filePath, QList<ImportRow> *rows, StockError *error = nullptr);
    static bool parse(const QString &content, QList<ImportRow> *rows, StockError *error = nullptr);

    static bool write(const QString &filePath, const QList<Product> &products, StockError *error = nullptr);
    static QString format(const QList<Product> &products);

    static QStringList splitLine(const QString &line);
};

#endif // PRODUCTCSV_H
