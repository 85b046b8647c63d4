#include "DamageService.h"
#include "StockService.h"
#include "TransactionGuard.h"
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(damageService, "service.damage")

DamageService::DamageService(
    IDamageRepository* damageRepo,
    IProductRepository* productRepo,
    StockService* stockService,
    QSqlDatabase db,
    QObject *parent
)
    : QObject(parent)
    , m_damageRepo(damageRepo)
    , m_productRepo(productRepo)
    , m_stockService(stockService)
    , m_db(db)
{
}

DamageRecord DamageService::loadDamage(int damageId, StockError *error)
{
    bool ok = false;
    const DamageRecord damage = m_damageRepo->findById(damageId, &ok);
    if (!ok) {
        setStockError(error, StockError::storage(QString("Cannot read damage entry #%1").arg(damageId)));
        return DamageRecord();
    }
    if (!damage.isValid()) {
        setStockError(error, StockError::validation(QString("Damage entry #%1 not found").arg(damageId), damageId));
    }
    return damage;
}

int DamageService::createDamage(const DamageRequest &request, StockError *error)
{
    if (!request.date.isValid()) {
        setStockError(error, StockError::validation("Invalid damage date!"));
        return -1;
    }
    if (request.productName.trimmed().isEmpty()) {
        setStockError(error, StockError::validation("Product is required!"));
        return -1;
    }
    if (request.quantity <= 0) {
        setStockError(error, StockError::validation("Quantity must be positive!"));
        return -1;
    }

    TransactionGuard tx(m_db);
    if (!tx.isActive()) {
        setStockError(error, StockError::storage("Cannot start transaction: " + tx.lastError()));
        return -1;
    }

    bool ok = false;
    const Product product = m_productRepo->findByName(request.productName, &ok);
    if (!ok) {
        setStockError(error, StockError::storage(QString("Cannot read product '%1'").arg(request.productName)));
        return -1;
    }
    if (!product.isValid()) {
        setStockError(error, StockError::validation(
            QString("Product '%1' not found!").arg(request.productName.trimmed())));
        return -1;
    }

    if (product.stock < request.quantity) {
        qWarning(damageService) << "DamageService::createDamage: Insufficient stock for" << product.name;
        setStockError(error, StockError::insufficientStock(product.id, product.stock, request.quantity));
        return -1;
    }

    DamageRecord damage;
    damage.damageDate = request.date;
    damage.productName = product.name;
    damage.quantity = request.quantity;
    damage.productId = product.id;
    damage.replaced = false;

    const int damageId = m_damageRepo->create(damage);
    if (damageId < 0) {
        setStockError(error, StockError::storage("Cannot create damage entry"));
        return -1;
    }

    if (m_stockService->applyDelta(product.id, -request.quantity,
                                   QString("Damaged %1 units").arg(request.quantity), error) < 0) {
        return -1;
    }

    if (!tx.commit()) {
        setStockError(error, StockError::storage("Commit failed: " + tx.lastError()));
        return -1;
    }

    qInfo(damageService) << "DamageService::createDamage:" << request.quantity << product.name << "marked as damaged";
    return damageId;
}

bool DamageService::replaceDamage(int damageId, StockError *error)
{
    TransactionGuard tx(m_db);
    if (!tx.isActive()) {
        setStockError(error, StockError::storage("Cannot start transaction: " + tx.lastError()));
        return false;
    }

    const DamageRecord damage = loadDamage(damageId, error);
    if (!damage.isValid()) return false;

    if (damage.replaced) {
        qWarning(damageService) << "DamageService::replaceDamage: Entry" << damageId << "already replaced";
        setStockError(error, StockError::alreadyReplaced(damageId));
        return false;
    }

    if (!m_damageRepo->markReplaced(damageId)) {
        setStockError(error, StockError::storage(QString("Cannot mark damage entry #%1 as replaced").arg(damageId)));
        return false;
    }

    if (m_stockService->applyDelta(damage.productId, damage.quantity,
                                   QString("Replaced %1 damaged units").arg(damage.quantity), error) < 0) {
        return false;
    }

    if (!tx.commit()) {
        setStockError(error, StockError::storage("Commit failed: " + tx.lastError()));
        return false;
    }

    qInfo(damageService) << "DamageService::replaceDamage: Replaced" << damage.quantity << "damaged" << damage.productName;
    return true;
}

bool DamageService::deleteDamage(int damageId, StockError *error)
{
    TransactionGuard tx(m_db);
    if (!tx.isActive()) {
        setStockError(error, StockError::storage("Cannot start transaction: " + tx.lastError()));
        return false;
    }

    const DamageRecord damage = loadDamage(damageId, error);
    if (!damage.isValid()) return false;

    if (!m_damageRepo->remove(damageId)) {
        setStockError(error, StockError::storage(QString("Cannot delete damage entry #%1").arg(damageId)));
        return false;
    }

    if (!damage.replaced
        && m_stockService->applyDelta(damage.productId, damage.quantity,
                                      QString("Deleted damage entry (%1 units)").arg(damage.quantity), error) < 0) {
        return false;
    }

    if (!tx.commit()) {
        setStockError(error, StockError::storage("Commit failed: " + tx.lastError()));
        return false;
    }

    qInfo(damageService) << "DamageService::deleteDamage: Damage entry" << damageId << "deleted";
    return true;
}
