#include "SaleService.h"
#include "StockService.h"
#include "TransactionGuard.h"
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(saleService, "service.sale")

namespace {
QString percentText(const Decimal &value)
{
    return QString::number(value.convert_to<double>(), 'g', 10);
}
}

SaleService::SaleService(
    ISaleRepository* saleRepo,
    IProductRepository* productRepo,
    IInvoiceRepository* invoiceRepo,
    StockService* stockService,
    QSqlDatabase db,
    QObject *parent
)
    : QObject(parent)
    , m_saleRepo(saleRepo)
    , m_productRepo(productRepo)
    , m_invoiceRepo(invoiceRepo)
    , m_stockService(stockService)
    , m_db(db)
{
}

Decimal SaleService::saleTotal(int quantity, const Decimal &unitPrice, const Decimal &discount)
{
    return decimalRound(discountedTotal(quantity, unitPrice, discount));
}

bool SaleService::validate(const SaleRequest &request, StockError *error, int recordId) const
{
    if (!request.date.isValid()) {
        setStockError(error, StockError::validation("Invalid sale date!", recordId));
        return false;
    }
    if (request.itemName.trimmed().isEmpty()) {
        setStockError(error, StockError::validation("Item is required!", recordId));
        return false;
    }
    if (request.quantity <= 0) {
        setStockError(error, StockError::validation("Quantity must be positive!", recordId));
        return false;
    }
    if (request.unitPrice < 0) {
        setStockError(error, StockError::validation("Price must be non-negative!", recordId));
        return false;
    }
    if (request.discount < 0 || request.discount > 100) {
        setStockError(error, StockError::validation("Discount must be between 0 and 100!", recordId));
        return false;
    }
    return true;
}

Product SaleService::resolveProduct(const QString &itemName, StockError *error)
{
    bool ok = false;
    const Product product = m_productRepo->findByName(itemName, &ok);
    if (!ok) {
        setStockError(error, StockError::storage(QString("Cannot read product '%1'").arg(itemName)));
        return Product();
    }
    if (!product.isValid()) {
        setStockError(error, StockError::validation(QString("Product '%1' not found!").arg(itemName.trimmed())));
    }
    return product;
}

int SaleService::createSale(const SaleRequest &request, StockError *error)
{
    if (!validate(request, error)) {
        qWarning(saleService) << "SaleService::createSale: Validation failed for" << request.itemName;
        return -1;
    }

    TransactionGuard tx(m_db);
    if (!tx.isActive()) {
        setStockError(error, StockError::storage("Cannot start transaction: " + tx.lastError()));
        return -1;
    }

    const Product product = resolveProduct(request.itemName, error);
    if (!product.isValid()) return -1;

    if (product.stock < request.quantity) {
        qWarning(saleService) << "SaleService::createSale: Insufficient stock for" << product.name;
        setStockError(error, StockError::insufficientStock(product.id, product.stock, request.quantity));
        return -1;
    }

    SaleRecord sale;
    sale.saleDate = request.date;
    sale.itemName = product.name;
    sale.quantity = request.quantity;
    sale.unitPrice = request.unitPrice;
    sale.discount = request.discount;
    sale.total = saleTotal(request.quantity, request.unitPrice, request.discount);
    sale.productId = product.id;

    const int saleId = m_saleRepo->create(sale);
    if (saleId < 0) {
        setStockError(error, StockError::storage("Cannot create sale record"));
        return -1;
    }

    const QString reason = QString("Sale of %1 units with %2% discount")
                               .arg(request.quantity).arg(percentText(request.discount));
    if (m_stockService->applyDelta(product.id, -request.quantity, reason, error) < 0) {
        return -1;
    }

    if (!tx.commit()) {
        setStockError(error, StockError::storage("Commit failed: " + tx.lastError()));
        return -1;
    }

    qInfo(saleService) << "SaleService::createSale: Sale of" << request.quantity << product.name
                       << "added with" << percentText(request.discount) << "% discount";
    return saleId;
}

bool SaleService::editSale(int saleId, const SaleRequest &request, StockError *error)
{
    if (!validate(request, error, saleId)) {
        qWarning(saleService) << "SaleService::editSale: Validation failed for sale" << saleId;
        return false;
    }

    TransactionGuard tx(m_db);
    if (!tx.isActive()) {
        setStockError(error, StockError::storage("Cannot start transaction: " + tx.lastError()));
        return false;
    }

    bool ok = false;
    SaleRecord sale = m_saleRepo->findById(saleId, &ok);
    if (!ok) {
        setStockError(error, StockError::storage(QString("Cannot read sale #%1").arg(saleId)));
        return false;
    }
    if (!sale.isValid()) {
        setStockError(error, StockError::validation(QString("Sale #%1 not found").arg(saleId), saleId));
        return false;
    }

    const Product product = resolveProduct(request.itemName, error);
    if (!product.isValid()) return false;

    const int oldQuantity = sale.quantity;
    const int oldProductId = sale.productId;

    if (oldProductId == product.id) {
        const int delta = oldQuantity - request.quantity;
        if (delta < 0 && product.stock < -delta) {
            setStockError(error, StockError::insufficientStock(product.id, product.stock, -delta));
            return false;
        }
        if (delta != 0) {
            const QString reason = QString("Sale edit (old: %1, new: %2)").arg(oldQuantity).arg(request.quantity);
            if (m_stockService->applyDelta(product.id, delta, reason, error) < 0) return false;
        }
    } else {
        if (product.stock < request.quantity) {
            setStockError(error, StockError::insufficientStock(product.id, product.stock, request.quantity));
            return false;
        }
        const QString reason = QString("Sale edit (old: %1, new: %2)").arg(oldQuantity).arg(0);
        if (m_stockService->applyDelta(oldProductId, oldQuantity, reason, error) < 0) return false;

        const QString newReason = QString("Sale edit (old: %1, new: %2)").arg(0).arg(request.quantity);
        if (m_stockService->applyDelta(product.id, -request.quantity, newReason, error) < 0) return false;
    }

    sale.saleDate = request.date;
    sale.itemName = product.name;
    sale.quantity = request.quantity;
    sale.unitPrice = request.unitPrice;
    sale.discount = request.discount;
    sale.total = saleTotal(request.quantity, request.unitPrice, request.discount);
    sale.productId = product.id;

    if (!m_saleRepo->update(sale)) {
        setStockError(error, StockError::storage(QString("Cannot update sale #%1").arg(saleId)));
        return false;
    }

    if (!tx.commit()) {
        setStockError(error, StockError::storage("Commit failed: " + tx.lastError()));
        return false;
    }

    qInfo(saleService) << "SaleService::editSale: Sale" << saleId << "updated";
    return true;
}

bool SaleService::deleteSale(int saleId, StockError *error)
{
    TransactionGuard tx(m_db);
    if (!tx.isActive()) {
        setStockError(error, StockError::storage("Cannot start transaction: " + tx.lastError()));
        return false;
    }

    bool ok = false;
    const SaleRecord sale = m_saleRepo->findById(saleId, &ok);
    if (!ok) {
        setStockError(error, StockError::storage(QString("Cannot read sale #%1").arg(saleId)));
        return false;
    }
    if (!sale.isValid()) {
        setStockError(error, StockError::validation(QString("Sale #%1 not found").arg(saleId), saleId));
        return false;
    }

    const Invoice invoice = m_invoiceRepo->findBySale(saleId, &ok);
    if (!ok) {
        setStockError(error, StockError::storage(QString("Cannot check invoices of sale #%1").arg(saleId)));
        return false;
    }
    if (invoice.isValid()) {
        qWarning(saleService) << "SaleService::deleteSale: Sale" << saleId << "is invoiced by" << invoice.number;
        setStockError(error, StockError::validation(
            QString("Sale #%1 is referenced by invoice '%2'!").arg(saleId).arg(invoice.number), invoice.id));
        return false;
    }

    if (!m_saleRepo->remove(saleId)) {
        setStockError(error, StockError::storage(QString("Cannot delete sale #%1").arg(saleId)));
        return false;
    }

    const QString reason = QString("Sale deletion (%1 sold)").arg(sale.quantity);
    if (m_stockService->applyDelta(sale.productId, sale.quantity, reason, error) < 0) {
        return false;
    }

    if (!tx.commit()) {
        setStockError(error, StockError::storage("Commit failed: " + tx.lastError()));
        return false;
    }

    qInfo(saleService) << "SaleService::deleteSale: Sale" << saleId << "deleted," << sale.quantity << "returned to stock";
    return true;
}
