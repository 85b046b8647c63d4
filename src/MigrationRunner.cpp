#include "MigrationRunner.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QStringList>
#include <QDebug>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(migration, "migration")

MigrationRunner::MigrationRunner(QSqlDatabase db, QObject *parent)
    : QObject(parent)
    , m_db(db)
{
}

bool MigrationRunner::runMigrations()
{
    if (!m_db.isOpen()) {
        qCritical(migration) << "MigrationRunner: Database is not open";
        return false;
    }

    if (!m_db.transaction()) {
        qCritical(migration) << "MigrationRunner: Cannot start transaction:" << m_db.lastError().text();
        return false;
    }

    qInfo(migration) << "MigrationRunner: Starting migrations...";

    const QStringList requiredTables = {
        "products",
        "stock_ledger",
        "sales",
        "damaged_products",
        "invoices",
        "invoice_items"
    };

    bool needsMigration = false;
    for (const QString &tableName : requiredTables) {
        if (!tableExists(tableName)) {
            needsMigration = true;
            qInfo(migration) << "MigrationRunner: Table" << tableName << "does not exist, migration needed";
            break;
        }
    }

    if (needsMigration && !createAllTables()) {
        qCritical(migration) << "MigrationRunner: Failed to create tables";
        m_db.rollback();
        return false;
    }

    // Индексы идемпотентны, применяем и к существующей базе
    if (!createIndexes()) {
        qCritical(migration) << "MigrationRunner: Failed to create indexes";
        m_db.rollback();
        return false;
    }

    if (!m_db.commit()) {
        qCritical(migration) << "MigrationRunner: Cannot commit transaction:" << m_db.lastError().text();
        m_db.rollback();
        return false;
    }

    qInfo(migration) << "MigrationRunner: Migrations completed successfully";
    return true;
}

bool MigrationRunner::tableExists(const QString &tableName)
{
    QSqlQuery query(m_db);
    query.prepare("SELECT name FROM sqlite_master WHERE type='table' AND name=?");
    query.addBindValue(tableName);

    if (!query.exec()) {
        qWarning(migration) << "MigrationRunner: Cannot check table existence:" << query.lastError().text();
        return false;
    }

    return query.next();
}

bool MigrationRunner::createAllTables()
{
    return createProductsTable() &&
           createStockLedgerTable() &&
           createSalesTable() &&
           createDamagedProductsTable() &&
           createInvoicesTable() &&
           createInvoiceItemsTable();
}

bool MigrationRunner::createProductsTable()
{
    QString sql = R"(
        CREATE TABLE IF NOT EXISTS products (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            name TEXT NOT NULL UNIQUE CHECK(length(name) > 0),
            category TEXT NOT NULL,
            buy_price REAL NOT NULL DEFAULT 0.0 CHECK(buy_price >= 0),
            sell_price REAL NOT NULL DEFAULT 0.0 CHECK(sell_price >= 0),
            last_updated TEXT NOT NULL DEFAULT (datetime('now', 'localtime')),
            stock INTEGER NOT NULL DEFAULT 0 CHECK(stock >= 0)
        )
    )";

    return executeQuery(sql, "createProductsTable");
}

bool MigrationRunner::createStockLedgerTable()
{
    QString sql = R"(
        CREATE TABLE IF NOT EXISTS stock_ledger (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            product_id INTEGER NOT NULL,
            created_at TEXT NOT NULL DEFAULT (datetime('now', 'localtime')),
            quantity_change INTEGER NOT NULL,
            reason TEXT NOT NULL,
            FOREIGN KEY (product_id) REFERENCES products(id) ON DELETE CASCADE
        )
    )";

    return executeQuery(sql, "createStockLedgerTable");
}

bool MigrationRunner::createSalesTable()
{
    QString sql = R"(
        CREATE TABLE IF NOT EXISTS sales (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            sale_date TEXT NOT NULL,
            item_name TEXT NOT NULL,
            quantity INTEGER NOT NULL CHECK(quantity > 0),
            unit_price REAL NOT NULL CHECK(unit_price >= 0),
            discount REAL NOT NULL DEFAULT 0.0 CHECK(discount >= 0 AND discount <= 100),
            total REAL NOT NULL,
            product_id INTEGER NOT NULL,
            created_at TEXT NOT NULL DEFAULT (datetime('now', 'localtime')),
            FOREIGN KEY (product_id) REFERENCES products(id)
        )
    )";

    return executeQuery(sql, "createSalesTable");
}

bool MigrationRunner::createDamagedProductsTable()
{
    QString sql = R"(
        CREATE TABLE IF NOT EXISTS damaged_products (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            damage_date TEXT NOT NULL,
            product_name TEXT NOT NULL,
            quantity INTEGER NOT NULL CHECK(quantity > 0),
            product_id INTEGER NOT NULL,
            replaced INTEGER NOT NULL DEFAULT 0 CHECK(replaced IN (0, 1)),
            created_at TEXT NOT NULL DEFAULT (datetime('now', 'localtime')),
            FOREIGN KEY (product_id) REFERENCES products(id)
        )
    )";

    return executeQuery(sql, "createDamagedProductsTable");
}

bool MigrationRunner::createInvoicesTable()
{
    QString sql = R"(
        CREATE TABLE IF NOT EXISTS invoices (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            invoice_number TEXT NOT NULL UNIQUE,
            invoice_date TEXT NOT NULL,
            customer_name TEXT NOT NULL,
            subtotal REAL NOT NULL,
            tax REAL NOT NULL,
            grand_total REAL NOT NULL,
            created_at TEXT NOT NULL,
            sale_id INTEGER,
            FOREIGN KEY (sale_id) REFERENCES sales(id)
        )
    )";

    return executeQuery(sql, "createInvoicesTable");
}

bool MigrationRunner::createInvoiceItemsTable()
{
    QString sql = R"(
        CREATE TABLE IF NOT EXISTS invoice_items (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            invoice_id INTEGER NOT NULL,
            product_id INTEGER NOT NULL,
            quantity INTEGER NOT NULL CHECK(quantity > 0),
            unit_price REAL NOT NULL,
            discount REAL NOT NULL DEFAULT 0.0,
            total REAL NOT NULL,
            FOREIGN KEY (invoice_id) REFERENCES invoices(id) ON DELETE CASCADE,
            FOREIGN KEY (product_id) REFERENCES products(id)
        )
    )";

    return executeQuery(sql, "createInvoiceItemsTable");
}

bool MigrationRunner::createIndexes()
{
    bool success = true;

    success &= executeQuery(
        "CREATE INDEX IF NOT EXISTS idx_products_name ON products(name)",
        "createIndexes: products_name"
    );
    success &= executeQuery(
        "CREATE INDEX IF NOT EXISTS idx_products_category ON products(category)",
        "createIndexes: products_category"
    );

    success &= executeQuery(
        "CREATE INDEX IF NOT EXISTS idx_stock_ledger_product ON stock_ledger(product_id)",
        "createIndexes: stock_ledger_product"
    );

    success &= executeQuery(
        "CREATE INDEX IF NOT EXISTS idx_sales_date ON sales(sale_date)",
        "createIndexes: sales_date"
    );
    success &= executeQuery(
        "CREATE INDEX IF NOT EXISTS idx_sales_product ON sales(product_id)",
        "createIndexes: sales_product"
    );

    success &= executeQuery(
        "CREATE INDEX IF NOT EXISTS idx_damaged_product ON damaged_products(product_id)",
        "createIndexes: damaged_product"
    );

    success &= executeQuery(
        "CREATE INDEX IF NOT EXISTS idx_invoices_date ON invoices(invoice_date)",
        "createIndexes: invoices_date"
    );
    success &= executeQuery(
        "CREATE INDEX IF NOT EXISTS idx_invoices_sale ON invoices(sale_id)",
        "createIndexes: invoices_sale"
    );
    success &= executeQuery(
        "CREATE INDEX IF NOT EXISTS idx_invoice_items_invoice ON invoice_items(invoice_id)",
        "createIndexes: invoice_items_invoice"
    );
    success &= executeQuery(
        "CREATE INDEX IF NOT EXISTS idx_invoice_items_product ON invoice_items(product_id)",
        "createIndexes: invoice_items_product"
    );

    return success;
}

bool MigrationRunner::executeQuery(const QString &sql, const QString &errorContext)
{
    QSqlQuery query(m_db);

    if (!query.exec(sql)) {
        QString context = errorContext.isEmpty() ? "executeQuery" : errorContext;
        qCritical(migration) << "MigrationRunner:" << context << "- SQL error:" << query.lastError().text();
        qCritical(migration) << "MigrationRunner:" << context << "- SQL:" << sql;
        return false;
    }

    return true;
}
