#include "StockService.h"
#include "LowStockNotifier.h"
#include "TransactionGuard.h"
#include "DateTimeUtils.h"
#include <QPointer>
#include <QLoggingCategory>

#include <limits>

Q_LOGGING_CATEGORY(stockService, "service.stock")

StockService::StockService(
    IProductRepository* productRepo,
    ILedgerRepository* ledgerRepo,
    LowStockNotifier* notifier,
    QSqlDatabase db,
    int lowStockThreshold,
    QObject *parent
)
    : QObject(parent)
    , m_productRepo(productRepo)
    , m_ledgerRepo(ledgerRepo)
    , m_notifier(notifier)
    , m_db(db)
    , m_lowStockThreshold(lowStockThreshold)
{
}

int StockService::applyDelta(int productId, int delta, const QString &reason, StockError *error)
{
    if (productId <= 0) {
        setStockError(error, StockError::validation(QString("Invalid product id %1").arg(productId), productId));
        return -1;
    }

    TransactionGuard tx(m_db);
    if (!tx.isActive()) {
        setStockError(error, StockError::storage("Cannot start transaction: " + tx.lastError()));
        return -1;
    }

    bool ok = false;
    const Product product = m_productRepo->findById(productId, &ok);
    if (!ok) {
        setStockError(error, StockError::storage(QString("Cannot read product #%1").arg(productId)));
        return -1;
    }
    if (!product.isValid()) {
        qWarning(stockService) << "StockService::applyDelta: Product not found" << productId;
        setStockError(error, StockError::validation(QString("Product #%1 not found").arg(productId), productId));
        return -1;
    }

    if (delta == 0) {
        if (!tx.commit()) {
            setStockError(error, StockError::storage("Commit failed: " + tx.lastError()));
            return -1;
        }
        return product.stock;
    }

    const qint64 projected = qint64(product.stock) + delta;
    if (projected > std::numeric_limits<int>::max()) {
        qWarning(stockService) << "StockService::applyDelta: Stock of" << product.name
                               << "would exceed" << std::numeric_limits<int>::max();
        setStockError(error, StockError::validation(
            QString("Stock of '%1' would exceed %2 units").arg(product.name).arg(std::numeric_limits<int>::max()),
            productId));
        return -1;
    }

    const int newQuantity = int(projected);
    if (newQuantity < 0) {
        qWarning(stockService) << "StockService::applyDelta: Insufficient stock for" << product.name
                               << "- available" << product.stock << ", requested" << -delta;
        setStockError(error, StockError::insufficientStock(productId, product.stock, -delta));
        return -1;
    }

    const QDateTime now = currentTimestamp();

    LedgerEntry entry;
    entry.productId = productId;
    entry.createdAt = now;
    entry.quantityChange = delta;
    entry.reason = reason;

    if (m_ledgerRepo->append(entry) < 0) {
        qCritical(stockService) << "StockService::applyDelta: Failed to append ledger entry for product" << productId;
        setStockError(error, StockError::storage(QString("Cannot write ledger entry for product #%1").arg(productId)));
        return -1;
    }

    if (!m_productRepo->updateStock(productId, newQuantity, now)) {
        qCritical(stockService) << "StockService::applyDelta: Failed to update stock for product" << productId;
        setStockError(error, StockError::storage(QString("Cannot update stock of product #%1").arg(productId)));
        return -1;
    }

    if (m_notifier && newQuantity <= m_lowStockThreshold) {
        QPointer<LowStockNotifier> notifier(m_notifier);
        const QString name = product.name;
        tx.afterCommit([notifier, productId, name, newQuantity]() {
            if (notifier) {
                notifier->notify(productId, name, newQuantity);
            }
        });
    }

    if (!tx.commit()) {
        setStockError(error, StockError::storage("Commit failed: " + tx.lastError()));
        return -1;
    }

    qInfo(stockService) << "StockService::applyDelta:" << product.name << delta << "->" << newQuantity
                        << "(" << reason << ")";
    return newQuantity;
}

int StockService::quantity(int productId, StockError *error)
{
    bool ok = false;
    const Product product = m_productRepo->findById(productId, &ok);
    if (!ok) {
        setStockError(error, StockError::storage(QString("Cannot read product #%1").arg(productId)));
        return -1;
    }
    if (!product.isValid()) {
        setStockError(error, StockError::validation(QString("Product #%1 not found").arg(productId), productId));
        return -1;
    }
    return product.stock;
}

QList<LedgerEntry> StockService::history(int productId)
{
    return m_ledgerRepo->findByProduct(productId);
}
