#ifndef PRODUCTCATEGORIES_H
#define PRODUCTCATEGORIES_H

#include <QString>
#include <QStringList>

/**
 * @brief Справочник категорий товара
 *
 * Категорией товара может быть как группа ("Chargers"), так и тип внутри группы.
 */
class ProductCategories
{
public:
    static QStringList groups();
    static QStringList typesOf(const QString &group);

    /**
     * @brief Все группы и типы без повторов, в порядке справочника
     */
    static QStringList all();

    static bool isValid(const QString &category);
};

#endif // PRODUCTCATEGORIES_H
