#include "EngineFixture.h"

namespace {

class InventoryScenarioTest : public EngineTest {};

}  // namespace

TEST_F(InventoryScenarioTest, SaleDamageReplaceInvoiceLifecycle) {
    QList<int> lowStock;
    m_engine->subscribeLowStock([&lowStock](int, const QString&, int quantity) { lowStock.append(quantity); });

    const int id = addProduct("Charger Type C", 10);

    SaleRequest sale;
    sale.itemName = "Charger Type C";
    sale.quantity = 3;
    sale.unitPrice = Decimal(100);
    sale.discount = Decimal(10);
    const int saleId = m_engine->sales().createSale(sale);
    ASSERT_GT(saleId, 0);
    EXPECT_EQ(decimalToString(m_engine->saleRepository().findById(saleId).total), QString("270.00"));
    EXPECT_EQ(stockOf(id), 7);

    DamageRequest damage;
    damage.productName = "Charger Type C";
    damage.quantity = 2;
    const int damageId = m_engine->damages().createDamage(damage);
    ASSERT_GT(damageId, 0);
    EXPECT_EQ(stockOf(id), 5);

    processEvents();
    EXPECT_EQ(lowStock, QList<int>({ 5 }));

    ASSERT_TRUE(m_engine->damages().replaceDamage(damageId));
    EXPECT_EQ(stockOf(id), 7);

    InvoiceRequest invoice;
    invoice.source = InvoiceSource::FromStock;
    invoice.customerName = "Walk-in";
    invoice.productName = "Charger Type C";
    invoice.quantity = 7;
    ASSERT_GT(m_engine->invoices().createInvoice(invoice), 0);
    EXPECT_EQ(stockOf(id), 0);

    invoice.quantity = 1;
    StockError error;
    EXPECT_EQ(m_engine->invoices().createInvoice(invoice, &error), -1);
    EXPECT_EQ(error.kind, StockErrorKind::InsufficientStock);
    EXPECT_EQ(error.available, 0);

    EXPECT_EQ(ledgerSum(id), stockOf(id));
    EXPECT_TRUE(m_engine->reconcile().isEmpty());
}

TEST_F(InventoryScenarioTest, FilterOverStoredProducts) {
    addProduct("Charger Type V8", 0);
    const int stocked = addProduct("Charger Type Lightning", 5);
    addProduct("Mouse", 9, "Peripherals");

    ProductFilterCriteria criteria;
    criteria.category = "Chargers";
    criteria.minStock = 1;

    bool ok = false;
    const QList<Product> result = m_engine->filterProducts(criteria, &ok);
    ASSERT_TRUE(ok);
    ASSERT_EQ(result.size(), 1);
    EXPECT_EQ(result.first().id, stocked);
}

TEST_F(InventoryScenarioTest, SummaryAggregatesLedgerState) {
    addProduct("Charger Type V8", 2);
    addProduct("Mouse", 20, "Peripherals");

    SaleRequest sale;
    sale.itemName = "Mouse";
    sale.quantity = 4;
    sale.unitPrice = Decimal("12.50");
    ASSERT_GT(m_engine->sales().createSale(sale), 0);

    DamageRequest damage;
    damage.productName = "Mouse";
    damage.quantity = 1;
    ASSERT_GT(m_engine->damages().createDamage(damage), 0);

    bool ok = false;
    const InventorySummary summary = m_engine->summary(&ok);
    ASSERT_TRUE(ok);
    EXPECT_EQ(summary.productCount, 2);
    EXPECT_EQ(summary.totalStock, 17);
    EXPECT_EQ(decimalToString(summary.salesTotal), QString("50.00"));
    EXPECT_EQ(summary.unitsSold, 4);
    EXPECT_EQ(summary.damagedUnreplaced, 1);
    ASSERT_EQ(summary.lowStock.size(), 1);
    EXPECT_EQ(summary.lowStock.first().name, QString("Charger Type V8"));
    ASSERT_EQ(summary.topSellers.size(), 1);
    EXPECT_EQ(summary.topSellers.first().second, 4);
}
