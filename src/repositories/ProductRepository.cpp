#include "repositories/ProductRepository.h"
#include "DateTimeUtils.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QDebug>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(productRepo, "repository.product")

ProductRepository::ProductRepository(QSqlDatabase db, QObject *parent)
    : QObject(parent)
    , m_db(db)
{
    if (!m_db.isOpen()) {
        qCritical(productRepo) << "ProductRepository: Database is not open";
    }
}

int ProductRepository::create(const Product &product)
{
    if (product.name.trimmed().isEmpty()) {
        qWarning(productRepo) << "ProductRepository::create: Product name is empty";
        return -1;
    }
    
    const QDateTime timestamp = product.lastUpdated.isValid() ? product.lastUpdated : currentTimestamp();

    QSqlQuery query(m_db);
    query.prepare(R"(
        INSERT INTO products (name, category, buy_price, sell_price, last_updated, stock)
        VALUES (:name, :category, :buy_price, :sell_price, :last_updated, :stock)
    )");
    
    query.bindValue(":name", product.name);
    query.bindValue(":category", product.category);
    query.bindValue(":buy_price", decimalToString(product.buyPrice));
    query.bindValue(":sell_price", decimalToString(product.sellPrice));
    query.bindValue(":last_updated", timestampToString(timestamp));
    query.bindValue(":stock", product.stock);
    
    if (!executeQuery(query, "create")) {
        return -1;
    }
    
    int newId = query.lastInsertId().toInt();
    qInfo(productRepo) << "ProductRepository::create: Created product with id" << newId;
    return newId > 0 ? newId : -1;
}

Product ProductRepository::findById(int id, bool *ok)
{
    if (ok) *ok = true;
    if (id <= 0) {
        return Product();
    }
    
    QSqlQuery query(m_db);
    query.prepare("SELECT id, name, category, buy_price, sell_price, last_updated, stock "
                  "FROM products WHERE id = :id");
    query.bindValue(":id", id);
    
    if (!executeQuery(query, "findById")) {
        if (ok) *ok = false;
        return Product();
    }
    
    if (!query.next()) {
        qDebug(productRepo) << "ProductRepository::findById: Product with id" << id << "not found";
        return Product();
    }
    
    return productFromQuery(query);
}

Product ProductRepository::findByName(const QString &name, bool *ok)
{
    if (ok) *ok = true;
    if (name.trimmed().isEmpty()) {
        return Product();
    }

    QSqlQuery query(m_db);
    query.prepare("SELECT id, name, category, buy_price, sell_price, last_updated, stock "
                  "FROM products WHERE name = :name");
    query.bindValue(":name", name.trimmed());

    if (!executeQuery(query, "findByName")) {
        if (ok) *ok = false;
        return Product();
    }

    if (!query.next()) {
        qDebug(productRepo) << "ProductRepository::findByName: Product" << name << "not found";
        return Product();
    }

    return productFromQuery(query);
}

QList<Product> ProductRepository::findAll(bool *ok)
{
    if (ok) *ok = true;
    QList<Product> products;
    
    QSqlQuery query(m_db);
    query.prepare("SELECT id, name, category, buy_price, sell_price, last_updated, stock "
                  "FROM products "
                  "ORDER BY id");
    
    if (!executeQuery(query, "findAll")) {
        if (ok) *ok = false;
        return products;
    }
    
    while (query.next()) {
        products.append(productFromQuery(query));
    }
    
    qDebug(productRepo) << "ProductRepository::findAll: Found" << products.size() << "products";
    return products;
}

QStringList ProductRepository::names()
{
    QStringList result;

    QSqlQuery query(m_db);
    query.prepare("SELECT name FROM products ORDER BY name");

    if (!executeQuery(query, "names")) {
        return result;
    }

    while (query.next()) {
        result.append(query.value(0).toString());
    }
    return result;
}

bool ProductRepository::update(const Product &product)
{
    if (!product.isValid()) {
        qWarning(productRepo) << "ProductRepository::update: Invalid product (id:" << product.id << ")";
        return false;
    }
    
    const QDateTime timestamp = product.lastUpdated.isValid() ? product.lastUpdated : currentTimestamp();

    QSqlQuery query(m_db);
    query.prepare(R"(
        UPDATE products
        SET name = :name,
            category = :category,
            buy_price = :buy_price,
            sell_price = :sell_price,
            last_updated = :last_updated
        WHERE id = :id
    )");
    
    query.bindValue(":id", product.id);
    query.bindValue(":name", product.name);
    query.bindValue(":category", product.category);
    query.bindValue(":buy_price", decimalToString(product.buyPrice));
    query.bindValue(":sell_price", decimalToString(product.sellPrice));
    query.bindValue(":last_updated", timestampToString(timestamp));
    
    if (!executeQuery(query, "update")) {
        return false;
    }
    
    if (query.numRowsAffected() == 0) {
        qWarning(productRepo) << "ProductRepository::update: No rows affected for id" << product.id;
        return false;
    }
    
    qInfo(productRepo) << "ProductRepository::update: Updated product with id" << product.id;
    return true;
}

bool ProductRepository::updateStock(int id, int stock, const QDateTime &timestamp)
{
    if (id <= 0 || stock < 0) {
        qWarning(productRepo) << "ProductRepository::updateStock: Invalid arguments (id:" << id
                              << ", stock:" << stock << ")";
        return false;
    }

    QSqlQuery query(m_db);
    query.prepare(R"(
        UPDATE products
        SET stock = :stock,
            last_updated = :last_updated
        WHERE id = :id
    )");

    query.bindValue(":id", id);
    query.bindValue(":stock", stock);
    query.bindValue(":last_updated", timestampToString(timestamp.isValid() ? timestamp : currentTimestamp()));

    if (!executeQuery(query, "updateStock")) {
        return false;
    }

    if (query.numRowsAffected() == 0) {
        qWarning(productRepo) << "ProductRepository::updateStock: Product with id" << id << "not found";
        return false;
    }

    return true;
}

bool ProductRepository::remove(int id)
{
    if (id <= 0) {
        qWarning(productRepo) << "ProductRepository::remove: Invalid id" << id;
        return false;
    }
    
    QSqlQuery query(m_db);
    query.prepare("DELETE FROM products WHERE id = :id");
    query.bindValue(":id", id);
    
    if (!executeQuery(query, "remove")) {
        return false;
    }
    
    if (query.numRowsAffected() == 0) {
        qWarning(productRepo) << "ProductRepository::remove: Product with id" << id << "not found";
        return false;
    }
    
    qInfo(productRepo) << "ProductRepository::remove: Deleted product with id" << id;
    return true;
}

bool ProductRepository::exists(int id)
{
    if (id <= 0) {
        return false;
    }
    
    QSqlQuery query(m_db);
    query.prepare("SELECT 1 FROM products WHERE id = :id LIMIT 1");
    query.bindValue(":id", id);
    
    if (!executeQuery(query, "exists")) {
        return false;
    }
    
    return query.next();
}

bool ProductRepository::nameExists(const QString &name, int excludeId, bool *ok)
{
    if (ok) *ok = true;

    QSqlQuery query(m_db);
    query.prepare("SELECT 1 FROM products WHERE name = :name AND id <> :id LIMIT 1");
    query.bindValue(":name", name.trimmed());
    query.bindValue(":id", excludeId);

    if (!executeQuery(query, "nameExists")) {
        if (ok) *ok = false;
        return false;
    }

    return query.next();
}

bool ProductRepository::isReferenced(int id, bool *ok)
{
    if (ok) *ok = true;
    if (id <= 0) {
        return false;
    }

    QSqlQuery query(m_db);
    query.prepare(R"(
        SELECT EXISTS (SELECT 1 FROM sales WHERE product_id = :sale_pid)
            OR EXISTS (SELECT 1 FROM damaged_products WHERE product_id = :damage_pid)
            OR EXISTS (SELECT 1 FROM invoice_items WHERE product_id = :item_pid)
    )");
    query.bindValue(":sale_pid", id);
    query.bindValue(":damage_pid", id);
    query.bindValue(":item_pid", id);

    if (!executeQuery(query, "isReferenced") || !query.next()) {
        if (ok) *ok = false;
        return false;
    }

    return query.value(0).toInt() == 1;
}

Product ProductRepository::productFromQuery(const QSqlQuery &query) const
{
    Product product;
    
    product.id = query.value("id").toInt();
    product.name = query.value("name").toString();
    product.category = query.value("category").toString();
    product.buyPrice = decimalFromVariant(query.value("buy_price"));
    product.sellPrice = decimalFromVariant(query.value("sell_price"));
    product.lastUpdated = timestampFromString(query.value("last_updated").toString());
    product.stock = query.value("stock").toInt();
    
    return product;
}

bool ProductRepository::executeQuery(QSqlQuery &query, const QString &context) const
{
    if (!query.exec()) {
        qCritical(productRepo) << "ProductRepository::" << context 
                                << "- SQL error:" << query.lastError().text();
        qCritical(productRepo) << "ProductRepository::" << context 
                                << "- SQL:" << query.executedQuery();
        return false;
    }
    
    return true;
}
