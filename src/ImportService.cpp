#include "ImportService.h"
#include "ProductService.h"
#include "StockService.h"
#include "TransactionGuard.h"
#include "DateTimeUtils.h"
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(importService, "service.import")

ImportService::ImportService(
    IProductRepository* productRepo,
    StockService* stockService,
    QSqlDatabase db,
    QObject *parent
)
    : QObject(parent)
    , m_productRepo(productRepo)
    , m_stockService(stockService)
    , m_db(db)
{
}

bool ImportService::importRows(const QList<ImportRow> &rows, ImportSummary *summary, StockError *error)
{
    ImportSummary result;

    TransactionGuard tx(m_db);
    if (!tx.isActive()) {
        setStockError(error, StockError::storage("Cannot start transaction: " + tx.lastError()));
        return false;
    }

    for (const auto &row : rows) {
        ProductRequest request;
        request.name = row.name.trimmed();
        request.category = row.category.trimmed();
        request.buyPrice = row.buyPrice;
        request.sellPrice = row.sellPrice;
        request.stock = row.stock;

        if (!ProductService::validateFields(request, error, row.lineNumber)) {
            qWarning(importService) << "ImportService::importRows: Invalid row" << row.lineNumber << "- batch aborted";
            return false;
        }

        bool ok = false;
        Product product = m_productRepo->findByName(request.name, &ok);
        if (!ok) {
            setStockError(error, StockError::storage(QString("Cannot read product '%1'").arg(request.name)));
            return false;
        }

        const QDateTime now = currentTimestamp();
        if (product.isValid()) {
            product.category = request.category;
            product.buyPrice = request.buyPrice;
            product.sellPrice = request.sellPrice;
            product.lastUpdated = now;
            if (!m_productRepo->update(product)) {
                setStockError(error, StockError::storage(QString("Cannot update product '%1'").arg(product.name)));
                return false;
            }
            ++result.updated;
        } else {
            product.name = request.name;
            product.category = request.category;
            product.buyPrice = request.buyPrice;
            product.sellPrice = request.sellPrice;
            product.lastUpdated = now;
            product.stock = 0;
            product.id = m_productRepo->create(product);
            if (product.id < 0) {
                setStockError(error, StockError::storage(QString("Cannot create product '%1'").arg(product.name)));
                return false;
            }
            ++result.created;
        }

        if (request.stock > 0
            && m_stockService->applyDelta(product.id, request.stock, "Imported stock", error) < 0) {
            if (error) error->recordId = row.lineNumber;
            return false;
        }
        result.totalQuantity += request.stock;
    }

    if (!tx.commit()) {
        setStockError(error, StockError::storage("Commit failed: " + tx.lastError()));
        return false;
    }

    if (summary) *summary = result;
    qInfo(importService) << "ImportService::importRows: Imported" << rows.size() << "rows (created"
                         << result.created << ", updated" << result.updated << ")";
    return true;
}
