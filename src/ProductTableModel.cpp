#include "ProductTableModel.h"
#include "DateTimeUtils.h"
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(productModel, "model.product")

ProductTableModel::ProductTableModel(IProductRepository* productRepo, QObject *parent)
    : QAbstractTableModel(parent)
    , m_productRepo(productRepo)
{
}

int ProductTableModel::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) return 0;
    return m_data.size();
}

int ProductTableModel::columnCount(const QModelIndex &parent) const
{
    if (parent.isValid()) return 0;
    return ColumnCount;
}

QVariant ProductTableModel::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || index.row() >= m_data.size())
        return {};

    const Product &item = m_data[index.row()];

    if (role == Qt::DisplayRole) {
        switch (index.column()) {
            case IdColumn:          return item.id;
            case NameColumn:        return item.name;
            case TypeColumn:        return item.category;
            case BuyPriceColumn:    return decimalToString(item.buyPrice);
            case SellPriceColumn:   return decimalToString(item.sellPrice);
            case LastUpdatedColumn: return timestampToString(item.lastUpdated);
            case StockColumn:       return item.stock;
            default: return {};
        }
    }

    if (role == Qt::TextAlignmentRole) {
        if (index.column() == IdColumn) return QVariant(int(Qt::AlignCenter));
        if (index.column() == BuyPriceColumn || index.column() == SellPriceColumn || index.column() == StockColumn)
            return QVariant(int(Qt::AlignRight | Qt::AlignVCenter));
    }

    return {};
}

QVariant ProductTableModel::headerData(int section, Qt::Orientation orientation, int role) const
{
    if (orientation == Qt::Horizontal && role == Qt::DisplayRole) {
        switch (section) {
            case IdColumn:          return "ID";
            case NameColumn:        return "Name";
            case TypeColumn:        return "Type";
            case BuyPriceColumn:    return "Buy Price";
            case SellPriceColumn:   return "Sell Price";
            case LastUpdatedColumn: return "Last Updated";
            case StockColumn:       return "Stock";
            default: return {};
        }
    }
    return {};
}

Product ProductTableModel::product(int row) const
{
    if (row < 0 || row >= m_data.size()) return Product();
    return m_data.at(row);
}

void ProductTableModel::setProducts(const QList<Product> &products)
{
    beginResetModel();
    m_data = products;
    endResetModel();
}

bool ProductTableModel::refresh()
{
    if (!m_productRepo) {
        qWarning(productModel) << "ProductTableModel::refresh: no repository";
        return false;
    }

    bool ok = false;
    const QList<Product> products = m_productRepo->findAll(&ok);
    if (!ok) {
        qWarning(productModel) << "ProductTableModel::refresh: cannot load products";
        return false;
    }

    setProducts(products);
    return true;
}
