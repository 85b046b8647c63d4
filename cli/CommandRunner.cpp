#include "CommandRunner.h"
#include "InventoryEngine.h"
#include "ProductCsv.h"
#include "DateTimeUtils.h"
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(cliLog, "cli")

CommandRunner::CommandRunner(InventoryEngine &engine, const QCommandLineParser &parser)
    : m_engine(engine)
    , m_parser(parser)
    , m_out(stdout)
    , m_err(stderr)
{
}

QList<QCommandLineOption> CommandRunner::options()
{
    return {
        QCommandLineOption("name", "Filter: name substring or pattern.", "text"),
        QCommandLineOption("category", "Product type (filter or product field).", "type"),
        QCommandLineOption("min-buy", "Filter: minimum buy price.", "price"),
        QCommandLineOption("max-buy", "Filter: maximum buy price.", "price"),
        QCommandLineOption("min-sell", "Filter: minimum sell price.", "price"),
        QCommandLineOption("max-sell", "Filter: maximum sell price.", "price"),
        QCommandLineOption("min-stock", "Filter: minimum stock.", "qty"),
        QCommandLineOption("max-stock", "Filter: maximum stock.", "qty"),
        QCommandLineOption("updated-after", "Filter: updated at or after (yyyy-MM-dd[ HH:mm:ss]).", "timestamp"),
        QCommandLineOption("buy", "Buy price.", "price"),
        QCommandLineOption("sell", "Sell price.", "price"),
        QCommandLineOption("stock", "Stock quantity.", "qty"),
        QCommandLineOption("discount", "Discount percent (0-100).", "percent"),
        QCommandLineOption("date", "Record date (yyyy-MM-dd), today by default.", "date"),
        QCommandLineOption("customer", "Invoice customer name.", "name"),
        QCommandLineOption("number", "Explicit invoice number.", "number"),
        QCommandLineOption("reason", "Ledger reason for adjust.", "text")
    };
}

QString CommandRunner::commandsHelp()
{
    return QStringLiteral(
        "Commands:\n"
        "  products [filter options]\n"
        "  add-product <name> --category T --buy P --sell P [--stock N]\n"
        "  update-product <id> [--name N] [--category T] [--buy P] [--sell P] [--stock N]\n"
        "  delete-product <id>\n"
        "  adjust <product-id> <delta> [--reason R]   (negative delta: adjust -- <id> -<n>)\n"
        "  history <product-id>\n"
        "  sale <item> <qty> <price> [--discount D] [--date D]\n"
        "  edit-sale <sale-id> <item> <qty> <price> [--discount D] [--date D]\n"
        "  delete-sale <sale-id>\n"
        "  damage <product> <qty> [--date D]\n"
        "  replace-damage <damage-id>\n"
        "  delete-damage <damage-id>\n"
        "  invoice-stock <product> <qty> --customer C [--discount D] [--number N] [--date D]\n"
        "  invoice-sale <sale-id> --customer C [--number N] [--date D]\n"
        "  delete-invoice <invoice-id>\n"
        "  import <file.csv>\n"
        "  export <file.csv>\n"
        "  reconcile\n"
        "  summary\n");
}

int CommandRunner::run(const QStringList &arguments)
{
    if (arguments.isEmpty()) {
        m_err << commandsHelp();
        m_err.flush();
        return BusinessError;
    }

    const QString command = arguments.first();
    const QStringList args = arguments.mid(1);
    qDebug(cliLog) << "CommandRunner::run:" << command << args;

    int code = BusinessError;
    if (command == "products") code = listProducts();
    else if (command == "add-product") code = addProduct(args);
    else if (command == "update-product") code = updateProduct(args);
    else if (command == "delete-product") code = deleteProduct(args);
    else if (command == "adjust") code = adjust(args);
    else if (command == "history") code = history(args);
    else if (command == "sale") code = sale(args);
    else if (command == "edit-sale") code = editSale(args);
    else if (command == "delete-sale") code = deleteSale(args);
    else if (command == "damage") code = damage(args);
    else if (command == "replace-damage") code = replaceDamage(args);
    else if (command == "delete-damage") code = deleteDamage(args);
    else if (command == "invoice-stock") code = invoiceFromStock(args);
    else if (command == "invoice-sale") code = invoiceFromSale(args);
    else if (command == "delete-invoice") code = deleteInvoice(args);
    else if (command == "import") code = importCsv(args);
    else if (command == "export") code = exportCsv(args);
    else if (command == "reconcile") code = reconcile();
    else if (command == "summary") code = summary();
    else {
        m_err << "Unknown command: " << command << "\n" << commandsHelp();
    }

    m_out.flush();
    m_err.flush();
    return code;
}

int CommandRunner::fail(const StockError &error)
{
    m_err << error.kindString() << ": " << error.message << "\n";
    return error.kind == StockErrorKind::Storage ? StorageError : BusinessError;
}

int CommandRunner::usage(const QString &syntax)
{
    m_err << "Usage: stockledger " << syntax << "\n";
    return BusinessError;
}

bool CommandRunner::parseInt(const QString &text, const QString &what, int *value)
{
    bool ok = false;
    *value = text.trimmed().toInt(&ok);
    if (!ok) {
        m_err << "Invalid " << what << ": " << text << "\n";
    }
    return ok;
}

bool CommandRunner::parseDecimal(const QString &text, const QString &what, Decimal *value)
{
    bool ok = false;
    *value = decimalFromString(text, &ok);
    if (!ok) {
        m_err << "Invalid " << what << ": " << text << "\n";
    }
    return ok;
}

bool CommandRunner::parseDate(QDate *date)
{
    if (!m_parser.isSet("date")) {
        *date = QDate::currentDate();
        return true;
    }
    *date = QDate::fromString(m_parser.value("date").trimmed(), Qt::ISODate);
    if (!date->isValid()) {
        m_err << "Invalid date: " << m_parser.value("date") << "\n";
        return false;
    }
    return true;
}

int CommandRunner::listProducts()
{
    ProductFilterCriteria criteria;
    criteria.name = m_parser.value("name");
    criteria.category = m_parser.value("category");

    const struct { const char *option; std::optional<Decimal> *target; } priceBounds[] = {
        { "min-buy", &criteria.minBuyPrice },
        { "max-buy", &criteria.maxBuyPrice },
        { "min-sell", &criteria.minSellPrice },
        { "max-sell", &criteria.maxSellPrice }
    };
    for (const auto &bound : priceBounds) {
        if (!m_parser.isSet(bound.option)) continue;
        Decimal value;
        if (!parseDecimal(m_parser.value(bound.option), bound.option, &value)) return BusinessError;
        *bound.target = value;
    }

    const struct { const char *option; std::optional<int> *target; } stockBounds[] = {
        { "min-stock", &criteria.minStock },
        { "max-stock", &criteria.maxStock }
    };
    for (const auto &bound : stockBounds) {
        if (!m_parser.isSet(bound.option)) continue;
        int value = 0;
        if (!parseInt(m_parser.value(bound.option), bound.option, &value)) return BusinessError;
        *bound.target = value;
    }

    if (m_parser.isSet("updated-after")) {
        criteria.updatedAfter = timestampFromString(m_parser.value("updated-after"));
        if (!criteria.updatedAfter.isValid()) {
            m_err << "Invalid timestamp: " << m_parser.value("updated-after") << "\n";
            return BusinessError;
        }
    }

    bool ok = false;
    const QList<Product> products = m_engine.filterProducts(criteria, &ok);
    if (!ok) return fail(StockError::storage("Cannot read products"));

    m_out << ProductCsv::format(products);
    return Success;
}

int CommandRunner::addProduct(const QStringList &args)
{
    if (args.size() != 1) return usage("add-product <name> --category T --buy P --sell P [--stock N]");

    ProductRequest request;
    request.name = args.at(0);
    request.category = m_parser.value("category");
    if (!parseDecimal(m_parser.value("buy"), "buy price", &request.buyPrice)) return BusinessError;
    if (!parseDecimal(m_parser.value("sell"), "sell price", &request.sellPrice)) return BusinessError;
    if (m_parser.isSet("stock") && !parseInt(m_parser.value("stock"), "stock", &request.stock)) return BusinessError;

    StockError error;
    const int id = m_engine.products().addProduct(request, &error);
    if (id < 0) return fail(error);

    m_out << "Product '" << request.name.trimmed() << "' added with id " << id << "\n";
    return Success;
}

int CommandRunner::updateProduct(const QStringList &args)
{
    if (args.size() != 1) return usage("update-product <id> [--name N] [--category T] [--buy P] [--sell P] [--stock N]");

    int id = 0;
    if (!parseInt(args.at(0), "product id", &id)) return BusinessError;

    bool ok = false;
    const Product current = m_engine.productRepository().findById(id, &ok);
    if (!ok) return fail(StockError::storage(QString("Cannot read product #%1").arg(id)));
    if (!current.isValid()) return fail(StockError::validation(QString("Product #%1 not found").arg(id), id));

    ProductRequest request;
    request.name = m_parser.isSet("name") ? m_parser.value("name") : current.name;
    request.category = m_parser.isSet("category") ? m_parser.value("category") : current.category;
    request.buyPrice = current.buyPrice;
    request.sellPrice = current.sellPrice;
    request.stock = current.stock;
    if (m_parser.isSet("buy") && !parseDecimal(m_parser.value("buy"), "buy price", &request.buyPrice)) return BusinessError;
    if (m_parser.isSet("sell") && !parseDecimal(m_parser.value("sell"), "sell price", &request.sellPrice)) return BusinessError;
    if (m_parser.isSet("stock") && !parseInt(m_parser.value("stock"), "stock", &request.stock)) return BusinessError;

    StockError error;
    if (!m_engine.products().updateProduct(id, request, &error)) return fail(error);

    m_out << "Product #" << id << " updated\n";
    return Success;
}

int CommandRunner::deleteProduct(const QStringList &args)
{
    if (args.size() != 1) return usage("delete-product <id>");

    int id = 0;
    if (!parseInt(args.at(0), "product id", &id)) return BusinessError;

    StockError error;
    if (!m_engine.products().deleteProduct(id, &error)) return fail(error);

    m_out << "Product #" << id << " deleted\n";
    return Success;
}

int CommandRunner::adjust(const QStringList &args)
{
    if (args.size() != 2) return usage("adjust <product-id> <delta> [--reason R]");

    int id = 0;
    int delta = 0;
    if (!parseInt(args.at(0), "product id", &id) || !parseInt(args.at(1), "delta", &delta)) return BusinessError;

    const QString reason = m_parser.isSet("reason") ? m_parser.value("reason") : QString("Manual adjustment");

    StockError error;
    const int quantity = m_engine.mutateStock(id, delta, reason, &error);
    if (quantity < 0) return fail(error);

    m_out << "Stock of product #" << id << " is now " << quantity << "\n";
    return Success;
}

int CommandRunner::history(const QStringList &args)
{
    if (args.size() != 1) return usage("history <product-id>");

    int id = 0;
    if (!parseInt(args.at(0), "product id", &id)) return BusinessError;

    const QList<LedgerEntry> entries = m_engine.history(id);
    for (const auto &entry : entries) {
        m_out << timestampToString(entry.createdAt) << '\t'
              << (entry.quantityChange > 0 ? "+" : "") << entry.quantityChange << '\t'
              << entry.reason << "\n";
    }
    return Success;
}

int CommandRunner::sale(const QStringList &args)
{
    if (args.size() != 3) return usage("sale <item> <qty> <price> [--discount D] [--date D]");

    SaleRequest request;
    request.itemName = args.at(0);
    if (!parseInt(args.at(1), "quantity", &request.quantity)) return BusinessError;
    if (!parseDecimal(args.at(2), "price", &request.unitPrice)) return BusinessError;
    if (m_parser.isSet("discount") && !parseDecimal(m_parser.value("discount"), "discount", &request.discount)) return BusinessError;
    if (!parseDate(&request.date)) return BusinessError;

    StockError error;
    const int id = m_engine.sales().createSale(request, &error);
    if (id < 0) return fail(error);

    m_out << "Sale #" << id << " total "
          << decimalToString(SaleService::saleTotal(request.quantity, request.unitPrice, request.discount)) << "\n";
    return Success;
}

int CommandRunner::editSale(const QStringList &args)
{
    if (args.size() != 4) return usage("edit-sale <sale-id> <item> <qty> <price> [--discount D] [--date D]");

    int id = 0;
    if (!parseInt(args.at(0), "sale id", &id)) return BusinessError;

    SaleRequest request;
    request.itemName = args.at(1);
    if (!parseInt(args.at(2), "quantity", &request.quantity)) return BusinessError;
    if (!parseDecimal(args.at(3), "price", &request.unitPrice)) return BusinessError;
    if (m_parser.isSet("discount") && !parseDecimal(m_parser.value("discount"), "discount", &request.discount)) return BusinessError;
    if (!parseDate(&request.date)) return BusinessError;

    StockError error;
    if (!m_engine.sales().editSale(id, request, &error)) return fail(error);

    m_out << "Sale #" << id << " updated\n";
    return Success;
}

int CommandRunner::deleteSale(const QStringList &args)
{
    if (args.size() != 1) return usage("delete-sale <sale-id>");

    int id = 0;
    if (!parseInt(args.at(0), "sale id", &id)) return BusinessError;

    StockError error;
    if (!m_engine.sales().deleteSale(id, &error)) return fail(error);

    m_out << "Sale #" << id << " deleted\n";
    return Success;
}

int CommandRunner::damage(const QStringList &args)
{
    if (args.size() != 2) return usage("damage <product> <qty> [--date D]");

    DamageRequest request;
    request.productName = args.at(0);
    if (!parseInt(args.at(1), "quantity", &request.quantity)) return BusinessError;
    if (!parseDate(&request.date)) return BusinessError;

    StockError error;
    const int id = m_engine.damages().createDamage(request, &error);
    if (id < 0) return fail(error);

    m_out << "Damage entry #" << id << " recorded\n";
    return Success;
}

int CommandRunner::replaceDamage(const QStringList &args)
{
    if (args.size() != 1) return usage("replace-damage <damage-id>");

    int id = 0;
    if (!parseInt(args.at(0), "damage id", &id)) return BusinessError;

    StockError error;
    if (!m_engine.damages().replaceDamage(id, &error)) return fail(error);

    m_out << "Damage entry #" << id << " replaced\n";
    return Success;
}

int CommandRunner::deleteDamage(const QStringList &args)
{
    if (args.size() != 1) return usage("delete-damage <damage-id>");

    int id = 0;
    if (!parseInt(args.at(0), "damage id", &id)) return BusinessError;

    StockError error;
    if (!m_engine.damages().deleteDamage(id, &error)) return fail(error);

    m_out << "Damage entry #" << id << " deleted\n";
    return Success;
}

int CommandRunner::invoiceFromStock(const QStringList &args)
{
    if (args.size() != 2) return usage("invoice-stock <product> <qty> --customer C [--discount D] [--number N] [--date D]");

    InvoiceRequest request;
    request.source = InvoiceSource::FromStock;
    request.productName = args.at(0);
    if (!parseInt(args.at(1), "quantity", &request.quantity)) return BusinessError;
    request.customerName = m_parser.value("customer");
    request.number = m_parser.value("number");
    if (m_parser.isSet("discount")) {
        Decimal discount;
        if (!parseDecimal(m_parser.value("discount"), "discount", &discount)) return BusinessError;
        request.discount = discount;
    }
    if (!parseDate(&request.date)) return BusinessError;

    StockError error;
    const int id = m_engine.invoices().createInvoice(request, &error);
    if (id < 0) return fail(error);

    const Invoice invoice = m_engine.invoiceRepository().findById(id);
    m_out << "Invoice '" << invoice.number << "' created, grand total " << decimalToString(invoice.grandTotal) << "\n";
    return Success;
}

int CommandRunner::invoiceFromSale(const QStringList &args)
{
    if (args.size() != 1) return usage("invoice-sale <sale-id> --customer C [--number N] [--date D]");

    InvoiceRequest request;
    request.source = InvoiceSource::FromSale;
    if (!parseInt(args.at(0), "sale id", &request.saleId)) return BusinessError;
    request.customerName = m_parser.value("customer");
    request.number = m_parser.value("number");
    if (!parseDate(&request.date)) return BusinessError;

    StockError error;
    const int id = m_engine.invoices().createInvoice(request, &error);
    if (id < 0) return fail(error);

    const Invoice invoice = m_engine.invoiceRepository().findById(id);
    m_out << "Invoice '" << invoice.number << "' created from sale #" << request.saleId
          << ", grand total " << decimalToString(invoice.grandTotal) << "\n";
    return Success;
}

int CommandRunner::deleteInvoice(const QStringList &args)
{
    if (args.size() != 1) return usage("delete-invoice <invoice-id>");

    int id = 0;
    if (!parseInt(args.at(0), "invoice id", &id)) return BusinessError;

    StockError error;
    if (!m_engine.invoices().deleteInvoice(id, &error)) return fail(error);

    m_out << "Invoice #" << id << " deleted\n";
    return Success;
}

int CommandRunner::importCsv(const QStringList &args)
{
    if (args.size() != 1) return usage("import <file.csv>");

    StockError error;
    QList<ImportRow> rows;
    if (!ProductCsv::read(args.at(0), &rows, &error)) return fail(error);

    ImportSummary result;
    if (!m_engine.imports().importRows(rows, &result, &error)) {
        if (error.recordId > 0) {
            m_err << "Import aborted at line " << error.recordId << "\n";
        }
        return fail(error);
    }

    m_out << "Imported " << rows.size() << " rows: " << result.created << " created, "
          << result.updated << " updated, " << result.totalQuantity << " units\n";
    return Success;
}

int CommandRunner::exportCsv(const QStringList &args)
{
    if (args.size() != 1) return usage("export <file.csv>");

    bool ok = false;
    const QList<Product> products = m_engine.productRepository().findAll(&ok);
    if (!ok) return fail(StockError::storage("Cannot read products"));

    StockError error;
    if (!ProductCsv::write(args.at(0), products, &error)) return fail(error);

    m_out << "Exported " << products.size() << " products to " << args.at(0) << "\n";
    return Success;
}

int CommandRunner::reconcile()
{
    const QList<StockCorrection> corrections = m_engine.reconcile();
    for (const auto &c : corrections) {
        m_out << c.productName << ": ledger " << c.ledgerSum << " -> stock " << c.stock
              << " (" << (c.delta() > 0 ? "+" : "") << c.delta() << ")\n";
    }
    m_out << corrections.size() << " correction(s)\n";
    return Success;
}

int CommandRunner::summary()
{
    bool ok = false;
    const InventorySummary s = m_engine.summary(&ok);
    if (!ok) return fail(StockError::storage("Cannot build summary"));

    m_out << "Products: " << s.productCount << "\n"
          << "Total stock: " << s.totalStock << "\n"
          << "Sales total: " << decimalToString(s.salesTotal) << " (" << s.unitsSold << " units)\n"
          << "Damaged (not replaced): " << s.damagedUnreplaced << "\n";

    if (!s.topSellers.isEmpty()) {
        m_out << "Top sellers:\n";
        for (const auto &seller : s.topSellers) {
            m_out << "  " << seller.first << ": " << seller.second << "\n";
        }
    }

    m_out << "Low stock (<= " << m_engine.config().lowStockThreshold << "):\n";
    for (const auto &level : s.lowStock) {
        m_out << "  " << level.name << ": " << level.stock << "\n";
    }
    return Success;
}
