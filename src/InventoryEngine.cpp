#include "InventoryEngine.h"
#include "ProductTableModel.h"
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(engineLog, "engine")

InventoryEngine::InventoryEngine(QSqlDatabase db, const EngineConfig &config)
    : m_db(db)
    , m_config(config)
    , m_productRepo(db)
    , m_ledgerRepo(db)
    , m_saleRepo(db)
    , m_damageRepo(db)
    , m_invoiceRepo(db)
    , m_invoiceItemRepo(db)
    , m_reportRepo(db)
    , m_stockService(&m_productRepo, &m_ledgerRepo, &m_notifier, db, config.lowStockThreshold)
    , m_reconciliationService(&m_ledgerRepo, db)
    , m_productService(&m_productRepo, &m_ledgerRepo, &m_stockService, db)
    , m_saleService(&m_saleRepo, &m_productRepo, &m_invoiceRepo, &m_stockService, db)
    , m_damageService(&m_damageRepo, &m_productRepo, &m_stockService, db)
    , m_invoiceService(&m_invoiceRepo, &m_invoiceItemRepo, &m_saleRepo, &m_productRepo, &m_stockService, db)
    , m_importService(&m_productRepo, &m_stockService, db)
{
    m_invoiceService.setTaxRate(config.taxRate);
    m_invoiceService.setNumberPrefix(config.invoicePrefix);
}

QList<StockCorrection> InventoryEngine::start()
{
    if (!m_config.reconcileOnStartup) {
        qInfo(engineLog) << "InventoryEngine::start: startup reconciliation disabled";
        return {};
    }
    return reconcile();
}

int InventoryEngine::mutateStock(int productId, int delta, const QString &reason, StockError *error)
{
    return m_stockService.applyDelta(productId, delta, reason, error);
}

QList<StockCorrection> InventoryEngine::reconcile()
{
    return m_reconciliationService.reconcile();
}

QList<Product> InventoryEngine::filterProducts(const ProductFilterCriteria &criteria, bool *ok)
{
    bool readOk = false;
    const QList<Product> products = m_productRepo.findAll(&readOk);
    if (ok) *ok = readOk;
    if (!readOk) {
        qWarning(engineLog) << "InventoryEngine::filterProducts: cannot read products";
        return {};
    }
    return ProductFilter(criteria).apply(products);
}

std::unique_ptr<ProductFilterProxyModel> InventoryEngine::createFilterModel(bool *ok)
{
    auto proxy = std::make_unique<ProductFilterProxyModel>(m_config.filterDebounceMs);

    auto *source = new ProductTableModel(&m_productRepo, proxy.get());
    const bool loaded = source->refresh();
    if (ok) *ok = loaded;
    if (!loaded) {
        qWarning(engineLog) << "InventoryEngine::createFilterModel: products not loaded";
    }

    proxy->setSourceModel(source);
    return proxy;
}

QMetaObject::Connection InventoryEngine::subscribeLowStock(LowStockNotifier::Callback callback)
{
    return m_notifier.subscribe(std::move(callback));
}

InventorySummary InventoryEngine::summary(bool *ok)
{
    return m_reportRepo.summary(m_config.lowStockThreshold, ok);
}

QList<LedgerEntry> InventoryEngine::history(int productId)
{
    return m_stockService.history(productId);
}
