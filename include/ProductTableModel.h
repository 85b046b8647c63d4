#ifndef PRODUCTTABLEMODEL_H
#define PRODUCTTABLEMODEL_H

#include <QAbstractTableModel>
#include <QList>

#include "repositories/IProductRepository.h"

/**
 * @brief Табличная модель товаров: ID | Name | Type | Buy Price | Sell Price | Last Updated | Stock
 */
class ProductTableModel : public QAbstractTableModel
{
    Q_OBJECT

public:
    enum Column {
        IdColumn = 0,
        NameColumn,
        TypeColumn,
        BuyPriceColumn,
        SellPriceColumn,
        LastUpdatedColumn,
        StockColumn,
        ColumnCount
    };

    explicit ProductTableModel(IProductRepository* productRepo, QObject *parent = nullptr);

    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    int columnCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    QVariant headerData(int section, Qt::Orientation orientation, int role = Qt::DisplayRole) const override;

    Product product(int row) const;

    void setProducts(const QList<Product> &products);

    bool refresh();

private:
    IProductRepository* m_productRepo;
    QList<Product> m_data;
};

#endif // PRODUCTTABLEMODEL_H
