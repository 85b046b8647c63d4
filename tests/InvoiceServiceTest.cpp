#include "EngineFixture.h"

#include <QRegularExpression>

namespace {

class InvoiceServiceTest : public EngineTest {
  protected:
    InvoiceRequest stockInvoice(const QString& product, int qty, const char* discount = "0") {
        InvoiceRequest request;
        request.source = InvoiceSource::FromStock;
        request.date = QDate(2024, 6, 1);
        request.customerName = "ACME Ltd";
        request.productName = product;
        request.quantity = qty;
        request.discount = Decimal(discount);
        return request;
    }

    int createSale(const QString& item, int qty, const char* price, const char* discount = "0") {
        SaleRequest sale;
        sale.itemName = item;
        sale.quantity = qty;
        sale.unitPrice = Decimal(price);
        sale.discount = Decimal(discount);
        return m_engine->sales().createSale(sale);
    }
};

}  // namespace

TEST_F(InvoiceServiceTest, FromStockUsesSellPriceAndDeductsStock) {
    const int id = addProduct("Laptop Charger", 10, "Chargers", "15.00");

    StockError error;
    const int invoiceId = m_engine->invoices().createInvoice(stockInvoice("Laptop Charger", 2, "10"), &error);
    ASSERT_GT(invoiceId, 0) << error.message.toStdString();

    const Invoice invoice = m_engine->invoiceRepository().findById(invoiceId);
    EXPECT_EQ(decimalToString(invoice.subtotal), QString("27.00"));
    EXPECT_EQ(decimalToString(invoice.tax), QString("3.51"));
    EXPECT_EQ(decimalToString(invoice.grandTotal), QString("30.51"));
    EXPECT_FALSE(invoice.isFromSale());
    EXPECT_EQ(invoice.customerName, QString("ACME Ltd"));

    const QList<InvoiceItem> items = m_engine->invoiceItemRepository().findByInvoice(invoiceId);
    ASSERT_EQ(items.size(), 1);
    EXPECT_EQ(items.first().productId, id);
    EXPECT_EQ(items.first().quantity, 2);
    EXPECT_EQ(decimalToString(items.first().unitPrice), QString("15.00"));

    EXPECT_EQ(stockOf(id), 8);
    EXPECT_EQ(lastReason(id), QString("Invoice %1").arg(invoice.number));
}

TEST_F(InvoiceServiceTest, GeneratedNumberUsesPrefixAndTimestamp) {
    addProduct("Laptop Charger", 10);
    const int invoiceId = m_engine->invoices().createInvoice(stockInvoice("Laptop Charger", 1));
    ASSERT_GT(invoiceId, 0);

    const QString number = m_engine->invoiceRepository().findById(invoiceId).number;
    const QRegularExpression format("^INV-\\d{4}-\\d{2}-\\d{2}-\\d{6}(-\\d+)?$");
    EXPECT_TRUE(format.match(number).hasMatch()) << number.toStdString();
}

TEST_F(InvoiceServiceTest, GeneratedNumbersStayUnique) {
    addProduct("Laptop Charger", 10);
    const int a = m_engine->invoices().createInvoice(stockInvoice("Laptop Charger", 1));
    const int b = m_engine->invoices().createInvoice(stockInvoice("Laptop Charger", 1));
    ASSERT_GT(a, 0);
    ASSERT_GT(b, 0);

    EXPECT_NE(m_engine->invoiceRepository().findById(a).number,
              m_engine->invoiceRepository().findById(b).number);
}

TEST_F(InvoiceServiceTest, DuplicateExplicitNumberRejected) {
    const int id = addProduct("Laptop Charger", 10);

    InvoiceRequest request = stockInvoice("Laptop Charger", 1);
    request.number = "INV-0001";
    ASSERT_GT(m_engine->invoices().createInvoice(request), 0);

    StockError error;
    EXPECT_EQ(m_engine->invoices().createInvoice(request, &error), -1);
    EXPECT_EQ(error.kind, StockErrorKind::Validation);
    EXPECT_EQ(stockOf(id), 9);
}

TEST_F(InvoiceServiceTest, FromStockInsufficientStock) {
    const int id = addProduct("Laptop Charger", 1);

    StockError error;
    EXPECT_EQ(m_engine->invoices().createInvoice(stockInvoice("Laptop Charger", 2), &error), -1);
    EXPECT_EQ(error.kind, StockErrorKind::InsufficientStock);
    EXPECT_EQ(error.available, 1);
    EXPECT_TRUE(m_engine->invoiceRepository().findAll().isEmpty());
    EXPECT_EQ(stockOf(id), 1);
}

TEST_F(InvoiceServiceTest, FromSaleTakesSalePriceWithoutStockMutation) {
    const int id = addProduct("Laptop Charger", 10, "Chargers", "15.00");
    const int saleId = createSale("Laptop Charger", 2, "100");
    ASSERT_GT(saleId, 0);
    const int entries = ledgerCount(id);

    InvoiceRequest request;
    request.source = InvoiceSource::FromSale;
    request.saleId = saleId;
    request.customerName = "ACME Ltd";

    StockError error;
    const int invoiceId = m_engine->invoices().createInvoice(request, &error);
    ASSERT_GT(invoiceId, 0) << error.message.toStdString();

    const Invoice invoice = m_engine->invoiceRepository().findById(invoiceId);
    EXPECT_EQ(invoice.saleId, saleId);
    EXPECT_EQ(decimalToString(invoice.subtotal), QString("200.00"));
    EXPECT_EQ(decimalToString(invoice.tax), QString("26.00"));
    EXPECT_EQ(decimalToString(invoice.grandTotal), QString("226.00"));

    EXPECT_EQ(stockOf(id), 8);
    EXPECT_EQ(ledgerCount(id), entries);
}

TEST_F(InvoiceServiceTest, FromSaleMismatchRejected) {
    addProduct("Laptop Charger", 10);
    const int saleId = createSale("Laptop Charger", 2, "100", "5");

    InvoiceRequest request;
    request.source = InvoiceSource::FromSale;
    request.saleId = saleId;
    request.customerName = "ACME Ltd";
    request.productName = "Laptop Charger";
    request.quantity = 3;

    StockError error;
    EXPECT_EQ(m_engine->invoices().createInvoice(request, &error), -1);
    EXPECT_EQ(error.kind, StockErrorKind::SaleMismatch);
    EXPECT_EQ(error.recordId, saleId);

    request.quantity = 2;
    request.discount = Decimal("5.00");
    EXPECT_GT(m_engine->invoices().createInvoice(request, &error), 0);
}

TEST_F(InvoiceServiceTest, DeleteStockInvoiceRestoresStock) {
    const int id = addProduct("Laptop Charger", 10);
    const int invoiceId = m_engine->invoices().createInvoice(stockInvoice("Laptop Charger", 3));
    const QString number = m_engine->invoiceRepository().findById(invoiceId).number;

    ASSERT_TRUE(m_engine->invoices().deleteInvoice(invoiceId));
    EXPECT_EQ(stockOf(id), 10);
    EXPECT_EQ(lastReason(id), QString("Invoice %1 deletion").arg(number));
    EXPECT_TRUE(m_engine->invoiceItemRepository().findByInvoice(invoiceId).isEmpty());
}

TEST_F(InvoiceServiceTest, DeleteSaleInvoiceLeavesStock) {
    const int id = addProduct("Laptop Charger", 10);
    const int saleId = createSale("Laptop Charger", 2, "100");

    InvoiceRequest request;
    request.source = InvoiceSource::FromSale;
    request.saleId = saleId;
    request.customerName = "ACME Ltd";
    const int invoiceId = m_engine->invoices().createInvoice(request);
    const int entries = ledgerCount(id);

    ASSERT_TRUE(m_engine->invoices().deleteInvoice(invoiceId));
    EXPECT_EQ(stockOf(id), 8);
    EXPECT_EQ(ledgerCount(id), entries);
    EXPECT_TRUE(m_engine->sales().deleteSale(saleId));
}
