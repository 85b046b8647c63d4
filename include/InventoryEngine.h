#ifndef INVENTORYENGINE_H
#define INVENTORYENGINE_H

#include <QList>
#include <QSqlDatabase>

#include <memory>

#include "AppSettings.h"
#include "StockError.h"
#include "LowStockNotifier.h"
#include "StockService.h"
#include "ReconciliationService.h"
#include "ProductService.h"
#include "SaleService.h"
#include "DamageService.h"
#include "InvoiceService.h"
#include "ImportService.h"
#include "ProductFilter.h"
#include "ProductFilterProxyModel.h"

#include "repositories/ProductRepository.h"
#include "repositories/LedgerRepository.h"
#include "repositories/SaleRepository.h"
#include "repositories/DamageRepository.h"
#include "repositories/InvoiceRepository.h"
#include "repositories/InvoiceItemRepository.h"
#include "repositories/ReportRepository.h"

/**
 * @brief Складской движок над одним соединением
 *
 * Владеет репозиториями и сервисами. Схема должна быть создана
 * (MigrationRunner) до вызова start().
 */
class InventoryEngine
{
public:
    InventoryEngine(QSqlDatabase db, const EngineConfig &config);

    InventoryEngine(const InventoryEngine&) = delete;
    InventoryEngine& operator=(const InventoryEngine&) = delete;

    /**
     * @brief Сверка при запуске (если включена в настройках)
     */
    QList<StockCorrection> start();

    int mutateStock(int productId, int delta, const QString &reason, StockError *error = nullptr);

    QList<StockCorrection> reconcile();

    QList<Product> filterProducts(const ProductFilterCriteria &criteria, bool *ok = nullptr);

    /**
     * @brief Модель отбора над таблицей товаров, загруженной из базы
     *
     * Интервал отложенного отбора берётся из filterDebounceMs.
     * ok = false, если товары не удалось прочитать (модель пустая).
     */
    std::unique_ptr<ProductFilterProxyModel> createFilterModel(bool *ok = nullptr);

    QMetaObject::Connection subscribeLowStock(LowStockNotifier::Callback callback);

    InventorySummary summary(bool *ok = nullptr);

    QList<LedgerEntry> history(int productId);

    const EngineConfig& config() const { return m_config; }

    ProductService& products() { return m_productService; }
    SaleService& sales() { return m_saleService; }
    DamageService& damages() { return m_damageService; }
    InvoiceService& invoices() { return m_invoiceService; }
    ImportService& imports() { return m_importService; }
    StockService& stock() { return m_stockService; }
    ReconciliationService& reconciliation() { return m_reconciliationService; }
    LowStockNotifier& lowStockNotifier() { return m_notifier; }

    IProductRepository& productRepository() { return m_productRepo; }
    ILedgerRepository& ledgerRepository() { return m_ledgerRepo; }
    ISaleRepository& saleRepository() { return m_saleRepo; }
    IDamageRepository& damageRepository() { return m_damageRepo; }
    IInvoiceRepository& invoiceRepository() { return m_invoiceRepo; }
    IInvoiceItemRepository& invoiceItemRepository() { return m_invoiceItemRepo; }

private:
    QSqlDatabase m_db;
    EngineConfig m_config;

    ProductRepository m_productRepo;
    LedgerRepository m_ledgerRepo;
    SaleRepository m_saleRepo;
    DamageRepository m_damageRepo;
    InvoiceRepository m_invoiceRepo;
    InvoiceItemRepository m_invoiceItemRepo;
    ReportRepository m_reportRepo;

    LowStockNotifier m_notifier;
    StockService m_stockService;
    ReconciliationService m_reconciliationService;
    ProductService m_productService;
    SaleService m_saleService;
    DamageService m_damageService;
    InvoiceService m_invoiceService;
    ImportService m_importService;
};

#endif // INVENTORYENGINE_H
