#ifndef PRODUCTREPOSITORY_H
#define PRODUCTREPOSITORY_H

#include "IProductRepository.h"
#include <QSqlDatabase>
#include <QSqlQuery>
#include <QObject>

class ProductRepository : public QObject, public IProductRepository
{
    Q_OBJECT

public:
    explicit ProductRepository(QSqlDatabase db, QObject *parent = nullptr);
    
    int create(const Product &product) override;
    Product findById(int id, bool *ok = nullptr) override;
    Product findByName(const QString &name, bool *ok = nullptr) override;
    QList<Product> findAll(bool *ok = nullptr) override;
    QStringList names() override;
    bool update(const Product &product) override;
    bool updateStock(int id, int stock, const QDateTime &timestamp) override;
    bool remove(int id) override;
    bool exists(int id) override;
    bool nameExists(const QString &name, int excludeId = 0, bool *ok = nullptr) override;
    bool isReferenced(int id, bool *ok = nullptr) override;

private:
    QSqlDatabase m_db;
    
    Product productFromQuery(const QSqlQuery &query) const;
    
    bool executeQuery(QSqlQuery &query, const QString &context) const;
};

#endif // PRODUCTREPOSITORY_H
