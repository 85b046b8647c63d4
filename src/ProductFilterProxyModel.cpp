#include "ProductFilterProxyModel.h"
#include "ProductTableModel.h"
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(filterModel, "model.filter")

namespace {
const int kDefaultDebounceMs = 300;
}

ProductFilterProxyModel::ProductFilterProxyModel(QObject *parent)
    : ProductFilterProxyModel(kDefaultDebounceMs, parent)
{
}

ProductFilterProxyModel::ProductFilterProxyModel(int debounceMs, QObject *parent)
    : QSortFilterProxyModel(parent)
{
    m_debounce.setSingleShot(true);
    m_debounce.setInterval(qMax(0, debounceMs));
    connect(&m_debounce, &QTimer::timeout, this, &ProductFilterProxyModel::applyPending);
}

void ProductFilterProxyModel::setDebounceInterval(int msec)
{
    m_debounce.setInterval(qMax(0, msec));
}

int ProductFilterProxyModel::debounceInterval() const
{
    return m_debounce.interval();
}

void ProductFilterProxyModel::setCriteria(const ProductFilterCriteria &criteria)
{
    m_debounce.stop();
    m_filter = ProductFilter(criteria);
    invalidateFilter();

    qDebug(filterModel) << "ProductFilterProxyModel::setCriteria: visible rows" << rowCount();
    emit criteriaApplied(rowCount());
}

void ProductFilterProxyModel::scheduleCriteria(const ProductFilterCriteria &criteria)
{
    m_pending = criteria;
    m_debounce.start();
}

void ProductFilterProxyModel::resetCriteria()
{
    setCriteria(ProductFilterCriteria());
}

void ProductFilterProxyModel::applyPending()
{
    setCriteria(m_pending);
}

QList<Product> ProductFilterProxyModel::visibleProducts() const
{
    QList<Product> res;
    const auto *model = qobject_cast<const ProductTableModel *>(sourceModel());
    if (!model) return res;

    for (int row = 0; row < rowCount(); ++row) {
        res.append(model->product(mapToSource(index(row, 0)).row()));
    }
    return res;
}

bool ProductFilterProxyModel::filterAcceptsRow(int sourceRow, const QModelIndex &sourceParent) const
{
    Q_UNUSED(sourceParent)
    const auto *model = qobject_cast<const ProductTableModel *>(sourceModel());
    if (!model) return true;

    return m_filter.matches(model->product(sourceRow));
}
