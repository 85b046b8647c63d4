#include "InvoiceService.h"
#include "StockService.h"
#include "TransactionGuard.h"
#include "DateTimeUtils.h"
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(invoiceService, "service.invoice")

InvoiceService::InvoiceService(
    IInvoiceRepository* invoiceRepo,
    IInvoiceItemRepository* itemRepo,
    ISaleRepository* saleRepo,
    IProductRepository* productRepo,
    StockService* stockService,
    QSqlDatabase db,
    QObject *parent
)
    : QObject(parent)
    , m_invoiceRepo(invoiceRepo)
    , m_itemRepo(itemRepo)
    , m_saleRepo(saleRepo)
    , m_productRepo(productRepo)
    , m_stockService(stockService)
    , m_db(db)
{
}

QString InvoiceService::generateNumber(const QDateTime &timestamp, StockError *error)
{
    const QString base = QString("%1-%2").arg(m_numberPrefix, timestamp.toString("yyyy-MM-dd-HHmmss"));

    QString candidate = base;
    for (int suffix = 2; ; ++suffix) {
        bool ok = false;
        const Invoice existing = m_invoiceRepo->findByNumber(candidate, &ok);
        if (!ok) {
            setStockError(error, StockError::storage("Cannot check invoice numbers"));
            return QString();
        }
        if (!existing.isValid()) {
            return candidate;
        }
        candidate = QString("%1-%2").arg(base).arg(suffix);
    }
}

int InvoiceService::createInvoice(const InvoiceRequest &request, StockError *error)
{
    if (!request.date.isValid()) {
        setStockError(error, StockError::validation("Invalid invoice date!"));
        return -1;
    }
    if (request.customerName.trimmed().isEmpty()) {
        setStockError(error, StockError::validation("Customer name is required!"));
        return -1;
    }

    const bool fromSale = request.source == InvoiceSource::FromSale;
    if (fromSale && request.saleId <= 0) {
        setStockError(error, StockError::validation("Please select a sale!"));
        return -1;
    }
    if (!fromSale && request.productName.trimmed().isEmpty()) {
        setStockError(error, StockError::validation("Product is required!"));
        return -1;
    }

    TransactionGuard tx(m_db);
    if (!tx.isActive()) {
        setStockError(error, StockError::storage("Cannot start transaction: " + tx.lastError()));
        return -1;
    }

    bool ok = false;
    SaleRecord sale;
    int quantity = request.quantity;
    Decimal discount = request.discount ? *request.discount : Decimal(0);

    if (fromSale) {
        sale = m_saleRepo->findById(request.saleId, &ok);
        if (!ok) {
            setStockError(error, StockError::storage(QString("Cannot read sale #%1").arg(request.saleId)));
            return -1;
        }
        if (!sale.isValid()) {
            setStockError(error, StockError::validation(
                QString("Sale ID %1 not found!").arg(request.saleId), request.saleId));
            return -1;
        }
        if (quantity == 0) quantity = sale.quantity;
        if (!request.discount) discount = sale.discount;
    }

    if (quantity <= 0) {
        setStockError(error, StockError::validation("Quantity must be positive!"));
        return -1;
    }
    if (discount < 0 || discount > 100) {
        setStockError(error, StockError::validation("Discount must be between 0 and 100%!"));
        return -1;
    }

    const Product product = (fromSale && request.productName.trimmed().isEmpty())
        ? m_productRepo->findById(sale.productId, &ok)
        : m_productRepo->findByName(request.productName, &ok);
    if (!ok) {
        setStockError(error, StockError::storage("Cannot read product"));
        return -1;
    }
    if (!product.isValid()) {
        setStockError(error, StockError::validation(
            QString("Product '%1' not found!").arg(request.productName.trimmed())));
        return -1;
    }

    Decimal unitPrice = product.sellPrice;
    if (fromSale) {
        if (product.id != sale.productId
            || quantity != sale.quantity
            || decimalRound(discount) != decimalRound(sale.discount)) {
            qWarning(invoiceService) << "InvoiceService::createInvoice: Sale" << sale.id << "does not match request";
            setStockError(error, StockError::saleMismatch(
                sale.id, "Selected sale does not match product, quantity, or discount!"));
            return -1;
        }
        unitPrice = sale.unitPrice;
    } else if (product.stock < quantity) {
        qWarning(invoiceService) << "InvoiceService::createInvoice: Insufficient stock for" << product.name;
        setStockError(error, StockError::insufficientStock(product.id, product.stock, quantity));
        return -1;
    }

    const QDateTime now = currentTimestamp();
    QString number = request.number.trimmed();
    if (number.isEmpty()) {
        number = generateNumber(now, error);
        if (number.isEmpty()) return -1;
    } else {
        const Invoice existing = m_invoiceRepo->findByNumber(number, &ok);
        if (!ok) {
            setStockError(error, StockError::storage("Cannot check invoice numbers"));
            return -1;
        }
        if (existing.isValid()) {
            setStockError(error, StockError::validation(
                QString("Invoice number '%1' already exists!").arg(number), existing.id));
            return -1;
        }
    }

    Invoice invoice;
    invoice.number = number;
    invoice.invoiceDate = request.date;
    invoice.customerName = request.customerName.trimmed();
    invoice.subtotal = decimalRound(discountedTotal(quantity, unitPrice, discount));
    invoice.tax = decimalRound(invoice.subtotal * m_taxRate);
    invoice.grandTotal = invoice.subtotal + invoice.tax;
    invoice.createdAt = now;
    invoice.saleId = fromSale ? sale.id : 0;

    const int invoiceId = m_invoiceRepo->create(invoice);
    if (invoiceId < 0) {
        setStockError(error, StockError::storage(QString("Cannot create invoice '%1'").arg(number)));
        return -1;
    }

    InvoiceItem item;
    item.invoiceId = invoiceId;
    item.productId = product.id;
    item.quantity = quantity;
    item.unitPrice = unitPrice;
    item.discount = discount;
    item.total = invoice.subtotal;

    if (m_itemRepo->create(item) < 0) {
        setStockError(error, StockError::storage(QString("Cannot create items of invoice '%1'").arg(number)));
        return -1;
    }

    if (!fromSale
        && m_stockService->applyDelta(product.id, -quantity, QString("Invoice %1").arg(number), error) < 0) {
        return -1;
    }

    if (!tx.commit()) {
        setStockError(error, StockError::storage("Commit failed: " + tx.lastError()));
        return -1;
    }

    qInfo(invoiceService) << "InvoiceService::createInvoice: Invoice" << number << "added"
                          << (fromSale ? "from sale" : "from stock");
    return invoiceId;
}

bool InvoiceService::deleteInvoice(int invoiceId, StockError *error)
{
    TransactionGuard tx(m_db);
    if (!tx.isActive()) {
        setStockError(error, StockError::storage("Cannot start transaction: " + tx.lastError()));
        return false;
    }

    bool ok = false;
    const Invoice invoice = m_invoiceRepo->findById(invoiceId, &ok);
    if (!ok) {
        setStockError(error, StockError::storage(QString("Cannot read invoice #%1").arg(invoiceId)));
        return false;
    }
    if (!invoice.isValid()) {
        setStockError(error, StockError::validation(QString("Invoice #%1 not found").arg(invoiceId), invoiceId));
        return false;
    }

    const QList<InvoiceItem> items = m_itemRepo->findByInvoice(invoiceId, &ok);
    if (!ok) {
        setStockError(error, StockError::storage(QString("Cannot read items of invoice #%1").arg(invoiceId)));
        return false;
    }

    if (!invoice.isFromSale()) {
        const QString reason = QString("Invoice %1 deletion").arg(invoice.number);
        for (const auto &item : items) {
            if (m_stockService->applyDelta(item.productId, item.quantity, reason, error) < 0) {
                return false;
            }
        }
    }

    if (!m_itemRepo->deleteByInvoice(invoiceId) || !m_invoiceRepo->remove(invoiceId)) {
        setStockError(error, StockError::storage(QString("Cannot delete invoice #%1").arg(invoiceId)));
        return false;
    }

    if (!tx.commit()) {
        setStockError(error, StockError::storage("Commit failed: " + tx.lastError()));
        return false;
    }

    qInfo(invoiceService) << "InvoiceService::deleteInvoice: Invoice" << invoice.number << "deleted";
    return true;
}
