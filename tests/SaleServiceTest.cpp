#include "EngineFixture.h"

namespace {

class SaleServiceTest : public EngineTest {
  protected:
    SaleRequest makeSale(const QString& item, int qty, const char* price = "100", const char* discount = "0") {
        SaleRequest request;
        request.date = QDate(2024, 3, 15);
        request.itemName = item;
        request.quantity = qty;
        request.unitPrice = Decimal(price);
        request.discount = Decimal(discount);
        return request;
    }
};

}  // namespace

TEST_F(SaleServiceTest, CreateSaleComputesTotalAndDeductsStock) {
    const int id = addProduct("Charging Dock", 10);

    StockError error;
    const int saleId = m_engine->sales().createSale(makeSale("Charging Dock", 3, "100", "10"), &error);
    ASSERT_GT(saleId, 0) << error.message.toStdString();

    const SaleRecord sale = m_engine->saleRepository().findById(saleId);
    EXPECT_EQ(decimalToString(sale.total), QString("270.00"));
    EXPECT_EQ(sale.productId, id);
    EXPECT_EQ(sale.itemName, QString("Charging Dock"));
    EXPECT_EQ(sale.saleDate, QDate(2024, 3, 15));

    EXPECT_EQ(stockOf(id), 7);
    EXPECT_EQ(ledgerSum(id), 7);
    EXPECT_EQ(lastReason(id), QString("Sale of 3 units with 10% discount"));
}

TEST_F(SaleServiceTest, InsufficientStockLeavesNoTrace) {
    const int id = addProduct("Charging Dock", 2);

    StockError error;
    EXPECT_EQ(m_engine->sales().createSale(makeSale("Charging Dock", 3), &error), -1);
    EXPECT_EQ(error.kind, StockErrorKind::InsufficientStock);
    EXPECT_EQ(error.available, 2);

    EXPECT_TRUE(m_engine->saleRepository().findAll().isEmpty());
    EXPECT_EQ(stockOf(id), 2);
    EXPECT_EQ(ledgerCount(id), 1);
}

TEST_F(SaleServiceTest, ValidationErrors) {
    addProduct("Charging Dock", 10);
    StockError error;

    EXPECT_EQ(m_engine->sales().createSale(makeSale("Charging Dock", 0), &error), -1);
    EXPECT_EQ(error.kind, StockErrorKind::Validation);

    EXPECT_EQ(m_engine->sales().createSale(makeSale("Charging Dock", 1, "100", "150"), &error), -1);
    EXPECT_EQ(error.kind, StockErrorKind::Validation);

    EXPECT_EQ(m_engine->sales().createSale(makeSale("Charging Dock", 1, "-5"), &error), -1);
    EXPECT_EQ(error.kind, StockErrorKind::Validation);

    EXPECT_EQ(m_engine->sales().createSale(makeSale("Unknown Item", 1), &error), -1);
    EXPECT_EQ(error.kind, StockErrorKind::Validation);

    SaleRequest badDate = makeSale("Charging Dock", 1);
    badDate.date = QDate();
    EXPECT_EQ(m_engine->sales().createSale(badDate, &error), -1);
    EXPECT_EQ(error.kind, StockErrorKind::Validation);
}

TEST_F(SaleServiceTest, DeleteSaleRestoresStock) {
    const int id = addProduct("Charging Dock", 10);
    const int saleId = m_engine->sales().createSale(makeSale("Charging Dock", 4));
    ASSERT_GT(saleId, 0);

    ASSERT_TRUE(m_engine->sales().deleteSale(saleId));
    EXPECT_EQ(stockOf(id), 10);
    EXPECT_EQ(ledgerSum(id), 10);
    EXPECT_EQ(lastReason(id), QString("Sale deletion (4 sold)"));
    EXPECT_FALSE(m_engine->saleRepository().findById(saleId).isValid());
}

TEST_F(SaleServiceTest, EditSameProductAppliesDifference) {
    const int id = addProduct("Charging Dock", 10);
    const int saleId = m_engine->sales().createSale(makeSale("Charging Dock", 3));

    StockError error;
    ASSERT_TRUE(m_engine->sales().editSale(saleId, makeSale("Charging Dock", 5, "100", "20"), &error))
        << error.message.toStdString();

    EXPECT_EQ(stockOf(id), 5);
    EXPECT_EQ(ledgerSum(id), 5);
    EXPECT_EQ(lastReason(id), QString("Sale edit (old: 3, new: 5)"));

    const SaleRecord sale = m_engine->saleRepository().findById(saleId);
    EXPECT_EQ(sale.quantity, 5);
    EXPECT_EQ(decimalToString(sale.total), QString("400.00"));
}

TEST_F(SaleServiceTest, EditWithUnchangedQuantityWritesNoLedger) {
    const int id = addProduct("Charging Dock", 10);
    const int saleId = m_engine->sales().createSale(makeSale("Charging Dock", 3));
    const int entries = ledgerCount(id);

    ASSERT_TRUE(m_engine->sales().editSale(saleId, makeSale("Charging Dock", 3, "90")));
    EXPECT_EQ(ledgerCount(id), entries);
    EXPECT_EQ(stockOf(id), 7);
}

TEST_F(SaleServiceTest, EditBeyondStockRejected) {
    const int id = addProduct("Charging Dock", 5);
    const int saleId = m_engine->sales().createSale(makeSale("Charging Dock", 3));

    StockError error;
    EXPECT_FALSE(m_engine->sales().editSale(saleId, makeSale("Charging Dock", 6), &error));
    EXPECT_EQ(error.kind, StockErrorKind::InsufficientStock);
    EXPECT_EQ(stockOf(id), 2);
    EXPECT_EQ(m_engine->saleRepository().findById(saleId).quantity, 3);
}

TEST_F(SaleServiceTest, EditChangingProductMovesStock) {
    const int first = addProduct("Charging Dock", 10);
    const int second = addProduct("Car Charger", 10);
    const int saleId = m_engine->sales().createSale(makeSale("Charging Dock", 3));

    ASSERT_TRUE(m_engine->sales().editSale(saleId, makeSale("Car Charger", 2)));

    EXPECT_EQ(stockOf(first), 10);
    EXPECT_EQ(ledgerSum(first), 10);
    EXPECT_EQ(stockOf(second), 8);
    EXPECT_EQ(ledgerSum(second), 8);
    EXPECT_EQ(m_engine->saleRepository().findById(saleId).productId, second);
}

TEST_F(SaleServiceTest, DeleteInvoicedSaleRefused) {
    const int id = addProduct("Charging Dock", 10);
    const int saleId = m_engine->sales().createSale(makeSale("Charging Dock", 2));

    InvoiceRequest invoice;
    invoice.source = InvoiceSource::FromSale;
    invoice.saleId = saleId;
    invoice.customerName = "ACME";
    const int invoiceId = m_engine->invoices().createInvoice(invoice);
    ASSERT_GT(invoiceId, 0);

    StockError error;
    EXPECT_FALSE(m_engine->sales().deleteSale(saleId, &error));
    EXPECT_EQ(error.kind, StockErrorKind::Validation);
    EXPECT_EQ(error.recordId, invoiceId);
    EXPECT_EQ(stockOf(id), 8);
}
