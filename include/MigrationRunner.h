#ifndef MIGRATIONRUNNER_H
#define MIGRATIONRUNNER_H

#include <QObject>
#include <QSqlDatabase>
#include <QString>

class MigrationRunner : public QObject
{
    Q_OBJECT

public:
    explicit MigrationRunner(QSqlDatabase db, QObject *parent = nullptr);
    
    bool runMigrations();
    
    bool tableExists(const QString &tableName);

private:
    QSqlDatabase m_db;
    
    bool createAllTables();

    bool createProductsTable();
    bool createStockLedgerTable();
    bool createSalesTable();
    bool createDamagedProductsTable();
    bool createInvoicesTable();
    bool createInvoiceItemsTable();
    
    bool createIndexes();
    
    bool executeQuery(const QString &sql, const QString &errorContext = "");
};

#endif // MIGRATIONRUNNER_H
