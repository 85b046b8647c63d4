#include "EngineFixture.h"
#include "TransactionGuard.h"

#include <limits>

namespace {

struct LowStockEvent {
    int productId = 0;
    QString name;
    int quantity = 0;
};

class StockServiceTest : public EngineTest {
  protected:
    void SetUp() override {
        EngineTest::SetUp();
        m_engine->subscribeLowStock([this](int productId, const QString& name, int quantity) {
            m_events.append({ productId, name, quantity });
        });
    }

    QList<LowStockEvent> m_events;
};

}  // namespace

TEST_F(StockServiceTest, ApplyDeltaWritesLedgerAndStock) {
    const int id = addProduct("USB-C PD Charger", 10);

    StockError error;
    EXPECT_EQ(m_engine->mutateStock(id, 4, "Restock", &error), 14);
    EXPECT_FALSE(error.isError());
    EXPECT_EQ(stockOf(id), 14);
    EXPECT_EQ(ledgerSum(id), 14);
    EXPECT_EQ(ledgerCount(id), 2);
    EXPECT_EQ(lastReason(id), QString("Restock"));
}

TEST_F(StockServiceTest, NegativeResultRejectedWithAvailableQuantity) {
    const int id = addProduct("USB-C PD Charger", 3);

    StockError error;
    EXPECT_EQ(m_engine->mutateStock(id, -4, "Sale", &error), -1);
    EXPECT_EQ(error.kind, StockErrorKind::InsufficientStock);
    EXPECT_EQ(error.available, 3);
    EXPECT_TRUE(error.isBusinessRule());
    EXPECT_EQ(stockOf(id), 3);
    EXPECT_EQ(ledgerCount(id), 1);
}

TEST_F(StockServiceTest, DrainToZeroAllowed) {
    const int id = addProduct("USB-C PD Charger", 3);
    EXPECT_EQ(m_engine->mutateStock(id, -3, "Sale"), 0);
    EXPECT_EQ(stockOf(id), 0);
}

TEST_F(StockServiceTest, ZeroDeltaIsNoOp) {
    const int id = addProduct("USB-C PD Charger", 8);
    EXPECT_EQ(m_engine->mutateStock(id, 0, "Nothing"), 8);
    EXPECT_EQ(ledgerCount(id), 1);
}

TEST_F(StockServiceTest, UnknownProductIsValidationError) {
    StockError error;
    EXPECT_EQ(m_engine->mutateStock(999, 1, "Restock", &error), -1);
    EXPECT_EQ(error.kind, StockErrorKind::Validation);
}

TEST_F(StockServiceTest, LowStockNotificationIsQueued) {
    const int id = addProduct("USB-C PD Charger", 10);
    processEvents();
    m_events.clear();

    EXPECT_EQ(m_engine->mutateStock(id, -5, "Sale"), 5);
    EXPECT_TRUE(m_events.isEmpty());

    processEvents();
    ASSERT_EQ(m_events.size(), 1);
    EXPECT_EQ(m_events.first().productId, id);
    EXPECT_EQ(m_events.first().name, QString("USB-C PD Charger"));
    EXPECT_EQ(m_events.first().quantity, 5);
}

TEST_F(StockServiceTest, NoNotificationAboveThreshold) {
    const int id = addProduct("USB-C PD Charger", 10);
    EXPECT_EQ(m_engine->mutateStock(id, -4, "Sale"), 6);
    processEvents();
    EXPECT_TRUE(m_events.isEmpty());
}

TEST_F(StockServiceTest, NotificationDroppedWhenEnclosingUnitRollsBack) {
    const int id = addProduct("USB-C PD Charger", 10);
    {
        TransactionGuard tx(DbManager::instance().database());
        EXPECT_EQ(m_engine->mutateStock(id, -8, "Sale"), 2);
        tx.rollback();
    }
    processEvents();
    EXPECT_TRUE(m_events.isEmpty());
    EXPECT_EQ(stockOf(id), 10);
    EXPECT_EQ(ledgerCount(id), 1);
}

TEST_F(StockServiceTest, HistoryNewestFirst) {
    const int id = addProduct("USB-C PD Charger", 10);
    m_engine->mutateStock(id, -2, "First");
    m_engine->mutateStock(id, 1, "Second");

    const QList<LedgerEntry> entries = m_engine->history(id);
    ASSERT_EQ(entries.size(), 3);
    EXPECT_EQ(entries[0].reason, QString("Second"));
    EXPECT_EQ(entries[1].reason, QString("First"));
    EXPECT_EQ(entries[2].reason, QString("Initial stock"));
    EXPECT_EQ(entries[2].quantityChange, 10);
}

TEST_F(StockServiceTest, DeltaBeyondIntRangeRejectedBeforeWrite) {
    const int id = addProduct("USB-C PD Charger", 10);

    StockError error;
    EXPECT_EQ(m_engine->mutateStock(id, std::numeric_limits<int>::max(), "Restock", &error), -1);
    EXPECT_EQ(error.kind, StockErrorKind::Validation);
    EXPECT_EQ(error.recordId, id);
    EXPECT_EQ(stockOf(id), 10);
    EXPECT_EQ(ledgerCount(id), 1);

    EXPECT_EQ(m_engine->mutateStock(id, std::numeric_limits<int>::max() - 10, "Restock"),
              std::numeric_limits<int>::max());
}
