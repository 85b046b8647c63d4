#ifndef PRODUCTFILTER_H
#define PRODUCTFILTER_H

#include <QDateTime>
#include <QList>
#include <QRegularExpression>
#include <QString>

#include <optional>

#include "DecimalUtils.h"
#include "repositories/IProductRepository.h"

/**
 * @brief Условия отбора товаров (все заданные условия должны выполняться)
 *
 * Пустая категория, "All" и "All Types" - без отбора по категории.
 * Границы диапазонов включительные; незаданная граница не проверяется.
 * Невалидный updatedAfter - без отбора по дате.
 */
struct ProductFilterCriteria {
    QString name;
    QString category;
    std::optional<Decimal> minBuyPrice;
    std::optional<Decimal> maxBuyPrice;
    std::optional<Decimal> minSellPrice;
    std::optional<Decimal> maxSellPrice;
    std::optional<int> minStock;
    std::optional<int> maxStock;
    QDateTime updatedAfter;

    bool isEmpty() const;
};

class ProductFilter
{
public:
    ProductFilter() = default;
    explicit ProductFilter(const ProductFilterCriteria &criteria);

    const ProductFilterCriteria& criteria() const { return m_criteria; }

    bool matches(const Product &product) const;

    // Порядок входного списка сохраняется
    QList<Product> apply(const QList<Product> &products) const;

    static bool evaluate(const Product &product, const ProductFilterCriteria &criteria);

    static bool isAllCategories(const QString &category);

private:
    bool matchesName(const QString &name) const;

    ProductFilterCriteria m_criteria;
    QString m_needle;
    QRegularExpression m_pattern;
};

#endif // PRODUCTFILTER_H
