#include "EngineFixture.h"
#include "ProductCategories.h"

namespace {

class ProductServiceTest : public EngineTest {
  protected:
    ProductRequest makeRequest(const QString& name, int stock = 5) {
        ProductRequest request;
        request.name = name;
        request.category = "Audio Devices";
        request.buyPrice = Decimal("20.00");
        request.sellPrice = Decimal("35.50");
        request.stock = stock;
        return request;
    }
};

}  // namespace

TEST_F(ProductServiceTest, AddProductRecordsInitialStock) {
    const int id = m_engine->products().addProduct(makeRequest("Bluetooth Speaker", 7));
    ASSERT_GT(id, 0);

    const Product product = m_engine->productRepository().findById(id);
    EXPECT_EQ(product.stock, 7);
    EXPECT_EQ(product.category, QString("Audio Devices"));
    EXPECT_EQ(decimalToString(product.sellPrice), QString("35.50"));
    EXPECT_TRUE(product.lastUpdated.isValid());

    const QList<LedgerEntry> entries = m_engine->history(id);
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries.first().quantityChange, 7);
    EXPECT_EQ(entries.first().reason, QString("Initial stock"));
}

TEST_F(ProductServiceTest, AddProductWithZeroStockHasNoLedger) {
    const int id = m_engine->products().addProduct(makeRequest("Soundbar", 0));
    ASSERT_GT(id, 0);
    EXPECT_EQ(ledgerCount(id), 0);
}

TEST_F(ProductServiceTest, DuplicateNameRejected) {
    ASSERT_GT(m_engine->products().addProduct(makeRequest("Soundbar")), 0);

    StockError error;
    EXPECT_EQ(m_engine->products().addProduct(makeRequest("Soundbar"), &error), -1);
    EXPECT_EQ(error.kind, StockErrorKind::Validation);
}

TEST_F(ProductServiceTest, InvalidFieldsRejected) {
    StockError error;

    ProductRequest noName = makeRequest("  ");
    EXPECT_EQ(m_engine->products().addProduct(noName, &error), -1);
    EXPECT_EQ(error.kind, StockErrorKind::Validation);

    ProductRequest badCategory = makeRequest("Speaker X");
    badCategory.category = "Groceries";
    EXPECT_EQ(m_engine->products().addProduct(badCategory, &error), -1);
    EXPECT_EQ(error.kind, StockErrorKind::Validation);

    ProductRequest negativePrice = makeRequest("Speaker Y");
    negativePrice.buyPrice = Decimal(-1);
    EXPECT_EQ(m_engine->products().addProduct(negativePrice, &error), -1);

    ProductRequest negativeStock = makeRequest("Speaker Z", -2);
    EXPECT_EQ(m_engine->products().addProduct(negativeStock, &error), -1);

    EXPECT_TRUE(m_engine->products().productNames().isEmpty());
}

TEST_F(ProductServiceTest, UpdateProductRecordsStockDifference) {
    const int id = m_engine->products().addProduct(makeRequest("Soundbar", 10));

    ProductRequest request = makeRequest("Soundbar Pro", 6);
    request.category = "Speaker";
    StockError error;
    ASSERT_TRUE(m_engine->products().updateProduct(id, request, &error)) << error.message.toStdString();

    const Product product = m_engine->productRepository().findById(id);
    EXPECT_EQ(product.name, QString("Soundbar Pro"));
    EXPECT_EQ(product.category, QString("Speaker"));
    EXPECT_EQ(product.stock, 6);

    const QList<LedgerEntry> entries = m_engine->history(id);
    ASSERT_EQ(entries.size(), 2);
    EXPECT_EQ(entries.first().quantityChange, -4);
    EXPECT_EQ(entries.first().reason, QString("Stock updated"));
}

TEST_F(ProductServiceTest, UpdateWithoutStockChangeWritesNoLedger) {
    const int id = m_engine->products().addProduct(makeRequest("Soundbar", 10));

    ProductRequest request = makeRequest("Soundbar", 10);
    request.sellPrice = Decimal("40.00");
    ASSERT_TRUE(m_engine->products().updateProduct(id, request));
    EXPECT_EQ(ledgerCount(id), 1);
}

TEST_F(ProductServiceTest, DeleteProductRemovesLedger) {
    const int id = m_engine->products().addProduct(makeRequest("Soundbar", 10));
    ASSERT_TRUE(m_engine->products().deleteProduct(id));

    EXPECT_FALSE(m_engine->productRepository().exists(id));
    EXPECT_EQ(ledgerCount(id), 0);
}

TEST_F(ProductServiceTest, DeleteReferencedProductRefused) {
    const int id = m_engine->products().addProduct(makeRequest("Soundbar", 10));

    SaleRequest sale;
    sale.itemName = "Soundbar";
    sale.quantity = 1;
    sale.unitPrice = Decimal(40);
    ASSERT_GT(m_engine->sales().createSale(sale), 0);

    StockError error;
    EXPECT_FALSE(m_engine->products().deleteProduct(id, &error));
    EXPECT_EQ(error.kind, StockErrorKind::Validation);
    EXPECT_EQ(error.recordId, id);
    EXPECT_TRUE(m_engine->productRepository().exists(id));
}

TEST_F(ProductServiceTest, ProductNamesSorted) {
    m_engine->products().addProduct(makeRequest("Soundbar"));
    m_engine->products().addProduct(makeRequest("Microphone"));

    const QStringList names = m_engine->products().productNames();
    ASSERT_EQ(names.size(), 2);
    EXPECT_EQ(names[0], QString("Microphone"));
    EXPECT_EQ(names[1], QString("Soundbar"));
}

TEST(ProductCategoriesTest, AcceptsGroupsAndTypes) {
    EXPECT_TRUE(ProductCategories::isValid("Chargers"));
    EXPECT_TRUE(ProductCategories::isValid("GaN Charger"));
    EXPECT_FALSE(ProductCategories::isValid(""));
    EXPECT_FALSE(ProductCategories::isValid("Groceries"));

    EXPECT_EQ(ProductCategories::groups().size(), 8);
    EXPECT_TRUE(ProductCategories::typesOf("Phones").contains("Iphone"));
    EXPECT_EQ(ProductCategories::all().count("Type C"), 1);
}

TEST_F(ProductServiceTest, NameCheckFailureIsStorageError) {
    QSqlQuery q(DbManager::instance().database());
    ASSERT_TRUE(q.exec("ALTER TABLE products RENAME TO products_hidden"));

    StockError error;
    EXPECT_EQ(m_engine->products().addProduct(makeRequest("Soundbar"), &error), -1);
    EXPECT_EQ(error.kind, StockErrorKind::Storage);
    EXPECT_EQ(error.message, QString("Cannot check product names"));

    bool ok = true;
    EXPECT_FALSE(m_engine->productRepository().nameExists("Soundbar", 0, &ok));
    EXPECT_FALSE(ok);
}
