#include "ProductService.h"
#include "StockService.h"
#include "TransactionGuard.h"
#include "ProductCategories.h"
#include "DateTimeUtils.h"
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(productService, "service.product")

ProductService::ProductService(
    IProductRepository* productRepo,
    ILedgerRepository* ledgerRepo,
    StockService* stockService,
    QSqlDatabase db,
    QObject *parent
)
    : QObject(parent)
    , m_productRepo(productRepo)
    , m_ledgerRepo(ledgerRepo)
    , m_stockService(stockService)
    , m_db(db)
{
}

bool ProductService::validateFields(const ProductRequest &request, StockError *error, int recordId)
{
    if (request.name.trimmed().isEmpty()) {
        setStockError(error, StockError::validation("Product name is required!", recordId));
        return false;
    }
    if (!ProductCategories::isValid(request.category)) {
        setStockError(error, StockError::validation(
            QString("Unknown product type '%1'!").arg(request.category), recordId));
        return false;
    }
    if (request.buyPrice < 0 || request.sellPrice < 0) {
        setStockError(error, StockError::validation("Prices must be non-negative!", recordId));
        return false;
    }
    if (request.stock < 0) {
        setStockError(error, StockError::validation("Stock must be non-negative!", recordId));
        return false;
    }
    return true;
}

int ProductService::addProduct(const ProductRequest &request, StockError *error)
{
    if (!validateFields(request, error)) {
        qWarning(productService) << "ProductService::addProduct: Validation failed for" << request.name;
        return -1;
    }

    TransactionGuard tx(m_db);
    if (!tx.isActive()) {
        setStockError(error, StockError::storage("Cannot start transaction: " + tx.lastError()));
        return -1;
    }

    bool ok = false;
    const bool duplicate = m_productRepo->nameExists(request.name, 0, &ok);
    if (!ok) {
        setStockError(error, StockError::storage("Cannot check product names"));
        return -1;
    }
    if (duplicate) {
        setStockError(error, StockError::validation(
            QString("Product '%1' already exists!").arg(request.name.trimmed())));
        return -1;
    }

    Product product;
    product.name = request.name.trimmed();
    product.category = request.category.trimmed();
    product.buyPrice = request.buyPrice;
    product.sellPrice = request.sellPrice;
    product.lastUpdated = currentTimestamp();
    product.stock = 0;

    const int productId = m_productRepo->create(product);
    if (productId < 0) {
        setStockError(error, StockError::storage(QString("Cannot create product '%1'").arg(product.name)));
        return -1;
    }

    if (request.stock > 0 && m_stockService->applyDelta(productId, request.stock, "Initial stock", error) < 0) {
        return -1;
    }

    if (!tx.commit()) {
        setStockError(error, StockError::storage("Commit failed: " + tx.lastError()));
        return -1;
    }

    qInfo(productService) << "ProductService::addProduct: Product" << product.name << "added with stock" << request.stock;
    return productId;
}

bool ProductService::updateProduct(int productId, const ProductRequest &request, StockError *error)
{
    if (!validateFields(request, error, productId)) {
        qWarning(productService) << "ProductService::updateProduct: Validation failed for product" << productId;
        return false;
    }

    TransactionGuard tx(m_db);
    if (!tx.isActive()) {
        setStockError(error, StockError::storage("Cannot start transaction: " + tx.lastError()));
        return false;
    }

    bool ok = false;
    Product product = m_productRepo->findById(productId, &ok);
    if (!ok) {
        setStockError(error, StockError::storage(QString("Cannot read product #%1").arg(productId)));
        return false;
    }
    if (!product.isValid()) {
        setStockError(error, StockError::validation(QString("Product #%1 not found").arg(productId), productId));
        return false;
    }

    const bool duplicate = m_productRepo->nameExists(request.name, productId, &ok);
    if (!ok) {
        setStockError(error, StockError::storage("Cannot check product names"));
        return false;
    }
    if (duplicate) {
        setStockError(error, StockError::validation(
            QString("Product '%1' already exists!").arg(request.name.trimmed()), productId));
        return false;
    }

    const int oldStock = product.stock;

    product.name = request.name.trimmed();
    product.category = request.category.trimmed();
    product.buyPrice = request.buyPrice;
    product.sellPrice = request.sellPrice;
    product.lastUpdated = currentTimestamp();

    if (!m_productRepo->update(product)) {
        setStockError(error, StockError::storage(QString("Cannot update product #%1").arg(productId)));
        return false;
    }

    const int delta = request.stock - oldStock;
    if (delta != 0 && m_stockService->applyDelta(productId, delta, "Stock updated", error) < 0) {
        return false;
    }

    if (!tx.commit()) {
        setStockError(error, StockError::storage("Commit failed: " + tx.lastError()));
        return false;
    }

    qInfo(productService) << "ProductService::updateProduct: Product" << productId << "updated";
    return true;
}

bool ProductService::deleteProduct(int productId, StockError *error)
{
    TransactionGuard tx(m_db);
    if (!tx.isActive()) {
        setStockError(error, StockError::storage("Cannot start transaction: " + tx.lastError()));
        return false;
    }

    bool ok = false;
    const Product product = m_productRepo->findById(productId, &ok);
    if (!ok) {
        setStockError(error, StockError::storage(QString("Cannot read product #%1").arg(productId)));
        return false;
    }
    if (!product.isValid()) {
        setStockError(error, StockError::validation(QString("Product #%1 not found").arg(productId), productId));
        return false;
    }

    const bool referenced = m_productRepo->isReferenced(productId, &ok);
    if (!ok) {
        setStockError(error, StockError::storage(QString("Cannot check references of product #%1").arg(productId)));
        return false;
    }
    if (referenced) {
        qWarning(productService) << "ProductService::deleteProduct: Product" << product.name << "is still referenced";
        setStockError(error, StockError::validation(
            QString("Product '%1' is referenced by sales, damage entries or invoices!").arg(product.name), productId));
        return false;
    }

    if (!m_ledgerRepo->deleteByProduct(productId) || !m_productRepo->remove(productId)) {
        setStockError(error, StockError::storage(QString("Cannot delete product #%1").arg(productId)));
        return false;
    }

    if (!tx.commit()) {
        setStockError(error, StockError::storage("Commit failed: " + tx.lastError()));
        return false;
    }

    qInfo(productService) << "ProductService::deleteProduct: Product" << product.name << "deleted";
    return true;
}

QStringList ProductService::productNames()
{
    return m_productRepo->names();
}
