#include "EngineFixture.h"

#include <QCoreApplication>
#include <QElapsedTimer>

#include "ProductFilter.h"
#include "ProductFilterProxyModel.h"
#include "ProductTableModel.h"
#include "DateTimeUtils.h"

namespace {

Product makeProduct(int id, const QString& name, const QString& category, int stock,
                    const char* buy = "10", const char* sell = "20",
                    const QString& updated = "2024-01-10 12:00:00") {
    Product p;
    p.id = id;
    p.name = name;
    p.category = category;
    p.stock = stock;
    p.buyPrice = Decimal(buy);
    p.sellPrice = Decimal(sell);
    p.lastUpdated = timestampFromString(updated);
    return p;
}

QList<Product> catalog() {
    return {
        makeProduct(1, "Charger Type C", "Chargers", 0, "5", "12"),
        makeProduct(2, "USB Hub", "Cables & Connectors", 3, "8", "15", "2024-02-01 09:00:00"),
        makeProduct(3, "GaN Charger", "Chargers", 5, "20", "35", "2024-03-05 18:30:00"),
        makeProduct(4, "Mouse", "Peripherals", 12, "4", "9")
    };
}

QList<int> ids(const QList<Product>& products) {
    QList<int> res;
    for (const auto& p : products) res.append(p.id);
    return res;
}

}  // namespace

TEST(ProductFilterTest, CategoryWithMinimumStock) {
    ProductFilterCriteria criteria;
    criteria.category = "Chargers";
    criteria.minStock = 1;

    EXPECT_EQ(ids(ProductFilter(criteria).apply(catalog())), QList<int>({ 3 }));
}

TEST(ProductFilterTest, EmptyCriteriaKeepsEverythingInOrder) {
    ProductFilterCriteria criteria;
    EXPECT_TRUE(criteria.isEmpty());
    EXPECT_EQ(ids(ProductFilter(criteria).apply(catalog())), QList<int>({ 1, 2, 3, 4 }));
}

TEST(ProductFilterTest, NameSubstringIsCaseInsensitive) {
    ProductFilterCriteria criteria;
    criteria.name = "CHARGER";
    EXPECT_EQ(ids(ProductFilter(criteria).apply(catalog())), QList<int>({ 1, 3 }));
}

TEST(ProductFilterTest, NamePatternMatches) {
    ProductFilterCriteria criteria;
    criteria.name = "^(usb|mouse)";
    EXPECT_EQ(ids(ProductFilter(criteria).apply(catalog())), QList<int>({ 2, 4 }));
}

TEST(ProductFilterTest, InvalidPatternFallsBackToSubstring) {
    QList<Product> products = catalog();
    products.append(makeProduct(5, "Adapter [usb", "Cables & Connectors", 1));

    ProductFilterCriteria criteria;
    criteria.name = "[usb";
    EXPECT_EQ(ids(ProductFilter(criteria).apply(products)), QList<int>({ 5 }));
}

TEST(ProductFilterTest, AllCategoryValuesDisableCategoryFilter) {
    for (const QString& all : { QString(), QString("All"), QString("All Types") }) {
        ProductFilterCriteria criteria;
        criteria.category = all;
        EXPECT_EQ(ProductFilter(criteria).apply(catalog()).size(), 4);
    }
}

TEST(ProductFilterTest, RangesAreInclusive) {
    ProductFilterCriteria criteria;
    criteria.minBuyPrice = Decimal("8");
    criteria.maxBuyPrice = Decimal("20");
    EXPECT_EQ(ids(ProductFilter(criteria).apply(catalog())), QList<int>({ 2, 3 }));

    ProductFilterCriteria sell;
    sell.maxSellPrice = Decimal("12");
    EXPECT_EQ(ids(ProductFilter(sell).apply(catalog())), QList<int>({ 1, 4 }));

    ProductFilterCriteria stock;
    stock.minStock = 3;
    stock.maxStock = 5;
    EXPECT_EQ(ids(ProductFilter(stock).apply(catalog())), QList<int>({ 2, 3 }));
}

TEST(ProductFilterTest, UpdatedAfterIsInclusive) {
    ProductFilterCriteria criteria;
    criteria.updatedAfter = timestampFromString("2024-02-01 09:00:00");
    EXPECT_EQ(ids(ProductFilter(criteria).apply(catalog())), QList<int>({ 2, 3 }));
}

TEST(ProductFilterTest, EvaluateSingleProduct) {
    ProductFilterCriteria criteria;
    criteria.category = "Peripherals";
    EXPECT_TRUE(ProductFilter::evaluate(catalog().last(), criteria));
    EXPECT_FALSE(ProductFilter::evaluate(catalog().first(), criteria));
}

TEST(ProductFilterProxyModelTest, SetCriteriaAppliesImmediately) {
    ProductTableModel model(nullptr);
    model.setProducts(catalog());

    ProductFilterProxyModel proxy;
    proxy.setSourceModel(&model);
    EXPECT_EQ(proxy.rowCount(), 4);

    ProductFilterCriteria criteria;
    criteria.category = "Chargers";
    proxy.setCriteria(criteria);
    EXPECT_EQ(ids(proxy.visibleProducts()), QList<int>({ 1, 3 }));

    proxy.resetCriteria();
    EXPECT_EQ(proxy.rowCount(), 4);
}

TEST(ProductFilterProxyModelTest, ScheduledCriteriaAreCoalesced) {
    ProductTableModel model(nullptr);
    model.setProducts(catalog());

    ProductFilterProxyModel proxy;
    proxy.setSourceModel(&model);
    proxy.setDebounceInterval(20);

    QList<int> applied;
    QObject::connect(&proxy, &ProductFilterProxyModel::criteriaApplied,
                     [&applied](int rows) { applied.append(rows); });

    ProductFilterCriteria first;
    first.name = "c";
    proxy.scheduleCriteria(first);

    ProductFilterCriteria second;
    second.name = "mouse";
    proxy.scheduleCriteria(second);

    EXPECT_TRUE(proxy.hasPendingCriteria());
    EXPECT_EQ(proxy.rowCount(), 4);

    QElapsedTimer timer;
    timer.start();
    while (applied.isEmpty() && timer.elapsed() < 2000) {
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
    }

    ASSERT_EQ(applied.size(), 1);
    EXPECT_EQ(applied.first(), 1);
    EXPECT_EQ(ids(proxy.visibleProducts()), QList<int>({ 4 }));
    EXPECT_FALSE(proxy.hasPendingCriteria());
}

TEST(ProductTableModelTest, RefreshWithoutRepositoryFails) {
    ProductTableModel model(nullptr);
    model.setProducts(catalog());
    EXPECT_FALSE(model.refresh());
    EXPECT_EQ(model.rowCount(), 4);
}

namespace {

class FilterModelTest : public EngineTest {};

}  // namespace

TEST_F(FilterModelTest, RefreshLoadsStoredProducts) {
    const int first = addProduct("Charger Type V8", 0);
    addProduct("Mouse", 9, "Peripherals");

    ProductTableModel model(&m_engine->productRepository());
    ASSERT_TRUE(model.refresh());
    ASSERT_EQ(model.rowCount(), 2);
    EXPECT_EQ(model.product(0).id, first);
    EXPECT_EQ(model.data(model.index(1, ProductTableModel::StockColumn)).toInt(), 9);

    addProduct("Webcam", 2, "Peripherals");
    EXPECT_EQ(model.rowCount(), 2);
    ASSERT_TRUE(model.refresh());
    EXPECT_EQ(model.rowCount(), 3);
}

TEST_F(FilterModelTest, EngineFilterModelUsesConfiguredDebounce) {
    addProduct("Charger Type V8", 0);
    addProduct("Charger Type Lightning", 5);
    addProduct("Mouse", 9, "Peripherals");

    EngineConfig config = m_config;
    config.filterDebounceMs = 25;
    InventoryEngine engine(DbManager::instance().database(), config);

    bool ok = false;
    std::unique_ptr<ProductFilterProxyModel> proxy = engine.createFilterModel(&ok);
    ASSERT_TRUE(ok);
    EXPECT_EQ(proxy->debounceInterval(), 25);
    EXPECT_EQ(proxy->rowCount(), 3);

    int applied = 0;
    QObject::connect(proxy.get(), &ProductFilterProxyModel::criteriaApplied, [&applied](int) { ++applied; });

    ProductFilterCriteria criteria;
    criteria.category = "Chargers";
    criteria.minStock = 1;
    proxy->scheduleCriteria(criteria);

    QElapsedTimer timer;
    timer.start();
    while (applied == 0 && timer.elapsed() < 2000) {
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
    }

    ASSERT_EQ(applied, 1);
    ASSERT_EQ(proxy->rowCount(), 1);
    EXPECT_EQ(proxy->visibleProducts().first().name, QString("Charger Type Lightning"));
}

TEST(ProductFilterProxyModelTest, DefaultDebounceInterval) {
    ProductFilterProxyModel proxy;
    EXPECT_EQ(proxy.debounceInterval(), EngineConfig().filterDebounceMs);

    ProductFilterProxyModel negative(-5);
    EXPECT_EQ(negative.debounceInterval(), 0);
}
