#include "StockError.h"

bool StockError::isBusinessRule() const
{
    switch (kind) {
        case StockErrorKind::Validation:
        case StockErrorKind::InsufficientStock:
        case StockErrorKind::AlreadyReplaced:
        case StockErrorKind::SaleMismatch:
            return true;
        default:
            return false;
    }
}

QString StockError::kindString() const
{
    switch (kind) {
        case StockErrorKind::None:              return "None";
        case StockErrorKind::Validation:        return "ValidationError";
        case StockErrorKind::InsufficientStock: return "InsufficientStock";
        case StockErrorKind::AlreadyReplaced:   return "AlreadyReplaced";
        case StockErrorKind::SaleMismatch:      return "SaleMismatch";
        case StockErrorKind::Storage:           return "StorageError";
        case StockErrorKind::DriftDetected:     return "DriftDetected";
    }
    return "None";
}

StockError StockError::validation(const QString &message, int recordId)
{
    StockError e;
    e.kind = StockErrorKind::Validation;
    e.message = message;
    e.recordId = recordId;
    return e;
}

StockError StockError::insufficientStock(int productId, int available, int requested)
{
    StockError e;
    e.kind = StockErrorKind::InsufficientStock;
    e.message = QString("Insufficient stock: %1 available, %2 requested!").arg(available).arg(requested);
    e.available = available;
    e.recordId = productId;
    return e;
}

StockError StockError::alreadyReplaced(int damageId)
{
    StockError e;
    e.kind = StockErrorKind::AlreadyReplaced;
    e.message = QString("Damage entry #%1 already replaced!").arg(damageId);
    e.recordId = damageId;
    return e;
}

StockError StockError::saleMismatch(int saleId, const QString &message)
{
    StockError e;
    e.kind = StockErrorKind::SaleMismatch;
    e.message = message;
    e.recordId = saleId;
    return e;
}

StockError StockError::storage(const QString &message)
{
    StockError e;
    e.kind = StockErrorKind::Storage;
    e.message = message;
    return e;
}

StockError StockError::driftDetected(int productId, int stock, int ledgerSum)
{
    StockError e;
    e.kind = StockErrorKind::DriftDetected;
    e.message = QString("Stock drift for product #%1: stock %2, ledger %3")
                    .arg(productId).arg(stock).arg(ledgerSum);
    e.available = stock;
    e.recordId = productId;
    return e;
}
