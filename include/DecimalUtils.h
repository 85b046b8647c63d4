#ifndef DECIMALUTILS_H
#define DECIMALUTILS_H

#include <QString>
#include <QVariant>

#include <boost/multiprecision/cpp_dec_float.hpp>

#include <exception>
#include <iomanip>
#include <sstream>

using Decimal = boost::multiprecision::cpp_dec_float_50;

inline Decimal decimalFromString(const QString &input)
{
    QString normalized = input.trimmed();
    if (normalized.isEmpty()) {
        return Decimal(0);
    }
    normalized.replace(',', '.');
    try {
        return Decimal(normalized.toStdString());
    } catch (const std::exception&) {
        return Decimal(0);
    }
}

/**
 * @brief Разбор числа с проверкой формата (пустая строка и мусор -> ok = false)
 */
inline Decimal decimalFromString(const QString &input, bool *ok)
{
    QString normalized = input.trimmed();
    normalized.replace(',', '.');
    bool parsed = false;
    normalized.toDouble(&parsed);
    if (ok) *ok = parsed;
    if (!parsed) {
        return Decimal(0);
    }
    return decimalFromString(normalized);
}

inline Decimal decimalFromVariant(const QVariant &value)
{
    return decimalFromString(value.toString());
}

inline QString decimalToString(const Decimal &value, int decimals = 2)
{
    std::ostringstream stream;
    stream << std::fixed << std::setprecision(decimals) << value;
    return QString::fromStdString(stream.str());
}

inline Decimal decimalRound(const Decimal &value, int decimals = 2)
{
    return decimalFromString(decimalToString(value, decimals));
}

// qty * price * (1 - discount / 100)
inline Decimal discountedTotal(int quantity, const Decimal &unitPrice, const Decimal &discountPercent)
{
    const Decimal subtotal = unitPrice * quantity;
    return subtotal - subtotal * (discountPercent / 100);
}

#endif // DECIMALUTILS_H
