#include "ProductFilter.h"

bool ProductFilterCriteria::isEmpty() const
{
    return name.trimmed().isEmpty()
        && ProductFilter::isAllCategories(category)
        && !minBuyPrice && !maxBuyPrice
        && !minSellPrice && !maxSellPrice
        && !minStock && !maxStock
        && !updatedAfter.isValid();
}

ProductFilter::ProductFilter(const ProductFilterCriteria &criteria)
    : m_criteria(criteria)
    , m_needle(criteria.name.trimmed().toLower())
{
    if (!m_needle.isEmpty()) {
        m_pattern = QRegularExpression(criteria.name.trimmed(), QRegularExpression::CaseInsensitiveOption);
    }
}

bool ProductFilter::isAllCategories(const QString &category)
{
    const QString c = category.trimmed();
    return c.isEmpty() || c == "All" || c == "All Types";
}

bool ProductFilter::matchesName(const QString &name) const
{
    if (m_needle.isEmpty()) return true;

    if (name.toLower().contains(m_needle)) return true;

    // Невалидное выражение - только поиск подстроки
    return m_pattern.isValid() && m_pattern.match(name).hasMatch();
}

bool ProductFilter::matches(const Product &product) const
{
    if (!matchesName(product.name)) return false;

    if (!isAllCategories(m_criteria.category) && product.category != m_criteria.category.trimmed()) return false;

    if (m_criteria.minBuyPrice && product.buyPrice < *m_criteria.minBuyPrice) return false;
    if (m_criteria.maxBuyPrice && product.buyPrice > *m_criteria.maxBuyPrice) return false;
    if (m_criteria.minSellPrice && product.sellPrice < *m_criteria.minSellPrice) return false;
    if (m_criteria.maxSellPrice && product.sellPrice > *m_criteria.maxSellPrice) return false;
    if (m_criteria.minStock && product.stock < *m_criteria.minStock) return false;
    if (m_criteria.maxStock && product.stock > *m_criteria.maxStock) return false;

    if (m_criteria.updatedAfter.isValid()
        && (!product.lastUpdated.isValid() || product.lastUpdated < m_criteria.updatedAfter)) {
        return false;
    }

    return true;
}

QList<Product> ProductFilter::apply(const QList<Product> &products) const
{
    QList<Product> res;
    for (const auto &product : products) {
        if (matches(product)) res.append(product);
    }
    return res;
}

bool ProductFilter::evaluate(const Product &product, const ProductFilterCriteria &criteria)
{
    return ProductFilter(criteria).matches(product);
}
