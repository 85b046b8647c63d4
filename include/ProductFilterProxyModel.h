#ifndef PRODUCTFILTERPROXYMODEL_H
#define PRODUCTFILTERPROXYMODEL_H

#include <QSortFilterProxyModel>
#include <QTimer>

#include "ProductFilter.h"

/**
 * @brief Отбор строк ProductTableModel по ProductFilterCriteria
 *
 * scheduleCriteria() откладывает применение на debounceInterval():
 * серия быстрых изменений даёт одно пересчитывание по последним условиям.
 */
class ProductFilterProxyModel : public QSortFilterProxyModel
{
    Q_OBJECT

public:
    explicit ProductFilterProxyModel(QObject *parent = nullptr);
    explicit ProductFilterProxyModel(int debounceMs, QObject *parent = nullptr);

    void setDebounceInterval(int msec);
    int debounceInterval() const;

    ProductFilterCriteria criteria() const { return m_filter.criteria(); }
    bool hasPendingCriteria() const { return m_debounce.isActive(); }

    QList<Product> visibleProducts() const;

public slots:
    void setCriteria(const ProductFilterCriteria &criteria);
    void scheduleCriteria(const ProductFilterCriteria &criteria);
    void resetCriteria();

signals:
    void criteriaApplied(int visibleRows);

protected:
    bool filterAcceptsRow(int sourceRow, const QModelIndex &sourceParent) const override;

private slots:
    void applyPending();

private:
    ProductFilter m_filter;
    ProductFilterCriteria m_pending;
    QTimer m_debounce;
};

#endif // PRODUCTFILTERPROXYMODEL_H
