#include "EngineFixture.h"
#include "TransactionGuard.h"

#include <QThread>

#include <atomic>
#include <memory>

namespace {

class TransactionGuardTest : public EngineTest {
  protected:
    int createRawProduct(const QString& name) {
        Product p;
        p.name = name;
        p.category = "Chargers";
        return m_engine->productRepository().create(p);
    }

    bool productExists(const QString& name) {
        return m_engine->productRepository().findByName(name).isValid();
    }
};

}  // namespace

TEST_F(TransactionGuardTest, CommitPersistsWrites) {
    {
        TransactionGuard tx(DbManager::instance().database());
        ASSERT_TRUE(tx.isActive());
        EXPECT_TRUE(tx.isOutermost());
        EXPECT_GT(createRawProduct("Wall Charger"), 0);
        EXPECT_TRUE(tx.commit());
    }
    EXPECT_TRUE(productExists("Wall Charger"));
}

TEST_F(TransactionGuardTest, DestructorRollsBack) {
    {
        TransactionGuard tx(DbManager::instance().database());
        ASSERT_TRUE(tx.isActive());
        EXPECT_GT(createRawProduct("Wall Charger"), 0);
    }
    EXPECT_FALSE(productExists("Wall Charger"));
}

TEST_F(TransactionGuardTest, NestedGuardJoinsOuterUnit) {
    TransactionGuard outer(DbManager::instance().database());
    {
        TransactionGuard inner(DbManager::instance().database());
        ASSERT_TRUE(inner.isActive());
        EXPECT_FALSE(inner.isOutermost());
        EXPECT_GT(createRawProduct("Car Charger"), 0);
        EXPECT_TRUE(inner.commit());
    }
    EXPECT_TRUE(outer.commit());
    EXPECT_TRUE(productExists("Car Charger"));
}

TEST_F(TransactionGuardTest, NestedReleaseWithoutCommitMarksRollbackOnly) {
    TransactionGuard outer(DbManager::instance().database());
    EXPECT_GT(createRawProduct("Car Charger"), 0);
    {
        TransactionGuard inner(DbManager::instance().database());
        EXPECT_GT(createRawProduct("GaN Charger"), 0);
    }
    EXPECT_FALSE(outer.commit());
    EXPECT_FALSE(productExists("Car Charger"));
    EXPECT_FALSE(productExists("GaN Charger"));
}

TEST_F(TransactionGuardTest, AfterCommitRunsOnlyAfterOutermostCommit) {
    int calls = 0;
    {
        TransactionGuard outer(DbManager::instance().database());
        {
            TransactionGuard inner(DbManager::instance().database());
            inner.afterCommit([&calls]() { ++calls; });
            EXPECT_TRUE(inner.commit());
        }
        EXPECT_EQ(calls, 0);
        EXPECT_TRUE(outer.commit());
    }
    EXPECT_EQ(calls, 1);
}

TEST_F(TransactionGuardTest, AfterCommitDroppedOnRollback) {
    int calls = 0;
    {
        TransactionGuard tx(DbManager::instance().database());
        tx.afterCommit([&calls]() { ++calls; });
        tx.rollback();
    }
    EXPECT_EQ(calls, 0);

    TransactionGuard next(DbManager::instance().database());
    EXPECT_TRUE(next.isOutermost());
    EXPECT_TRUE(next.commit());
    EXPECT_EQ(calls, 0);
}

TEST_F(TransactionGuardTest, WriteLockSerialisesUnitsAcrossThreads) {
    std::atomic<bool> entered{ false };
    std::unique_ptr<QThread> worker;
    {
        TransactionGuard tx(DbManager::instance().database());
        ASSERT_TRUE(tx.isActive());

        // Отдельный поток ждёт замок записи до завершения единицы работы
        worker.reset(QThread::create([&entered]() {
            TransactionGuard other{ QSqlDatabase() };
            entered = true;
        }));
        worker->start();

        EXPECT_FALSE(worker->wait(100));
        EXPECT_FALSE(entered);

        EXPECT_GT(createRawProduct("Wall Charger"), 0);
        EXPECT_TRUE(tx.commit());
    }

    EXPECT_TRUE(worker->wait(5000));
    EXPECT_TRUE(entered);
    EXPECT_TRUE(productExists("Wall Charger"));
}
