#include "UnitConverter.h"
#include <QHash>
#include <QStringList>

namespace {

const QHash<QString, double> &gramsPerUnit() {
    static const QHash<QString, double> table = {
        {"g", 1.0},
        {"gram", 1.0},
        {"grams", 1.0},
        {"kg", 1000.0},
        {"kilogram", 1000.0},
        {"kilograms", 1000.0},
        {"oz", 28.349523125},
        {"ounce", 28.349523125},
        {"ounces", 28.349523125},
        {"lb", 453.59237},
        {"lbs", 453.59237},
        {"pound", 453.59237},
        {"pounds", 453.59237},
    };
    return table;
}

const QHash<QString, double> &millilitersPerUnit() {
    static const QHash<QString, double> table = {
        {"ml", 1.0},
        {"milliliter", 1.0},
        {"milliliters", 1.0},
        {"l", 1000.0},
        {"liter", 1000.0},
        {"liters", 1000.0},
        {"tsp", 4.92892159375},
        {"teaspoon", 4.92892159375},
        {"teaspoons", 4.92892159375},
        {"tbsp", 14.78676478125},
        {"tablespoon", 14.78676478125},
        {"tablespoons", 14.78676478125},
        {"cup", 236.5882365},
        {"cups", 236.5882365},
        {"pt", 473.176473},
        {"pint", 473.176473},
        {"pints", 473.176473},
        {"qt", 946.352946},
        {"quart", 946.352946},
        {"quarts", 946.352946},
        {"gal", 3785.411784},
        {"gallon", 3785.411784},
        {"gallons", 3785.411784},
    };
    return table;
}

} // namespace

QString UnitConverter::normalize(const QString &unit) {
    return unit.trimmed().toLower();
}

UnitConverter::Family UnitConverter::classify(const QString &unit) {
    const QString key = normalize(unit);
    if (gramsPerUnit().contains(key)) return Mass;
    if (millilitersPerUnit().contains(key)) return Volume;
    return Unknown;
}

double UnitConverter::factor(const QString &normalizedUnit, Family family) {
    switch (family) {
    case Mass:
        return gramsPerUnit().value(normalizedUnit, 1.0);
    case Volume:
        return millilitersPerUnit().value(normalizedUnit, 1.0);
    case Unknown:
        break;
    }
    return 1.0;
}

UnitConverter::Canonical UnitConverter::toCanonical(double value, const QString &unit) {
    const QString key = normalize(unit);
    const Family family = classify(key);
    return Canonical{value * factor(key, family), family};
}

double UnitConverter::fromCanonical(double canonicalValue, const QString &targetUnit) {
    const QString key = normalize(targetUnit);
    const Family family = classify(key);
    if (family == Unknown) return canonicalValue;
    return canonicalValue / factor(key, family);
}

bool UnitConverter::isConvertible(const QString &fromUnit, const QString &toUnit) {
    const Family from = classify(fromUnit);
    return from != Unknown && from == classify(toUnit);
}

double UnitConverter::convert(double value, const QString &fromUnit, const QString &toUnit) {
    if (!isConvertible(fromUnit, toUnit)) return value;
    return fromCanonical(toCanonical(value, fromUnit).value, toUnit);
}

bool UnitConverter::sameUnit(const QString &a, const QString &b) {
    return normalize(a) == normalize(b);
}

QString UnitConverter::canonicalUnit(Family family) {
    switch (family) {
    case Mass:
        return QStringLiteral("g");
    case Volume:
        return QStringLiteral("ml");
    case Unknown:
        break;
    }
    return QString();
}

QString UnitConverter::familyName(Family family) {
    switch (family) {
    case Mass:
        return QStringLiteral("mass");
    case Volume:
        return QStringLiteral("volume");
    case Unknown:
        break;
    }
    return QStringLiteral("unknown");
}

bool UnitConverter::parseQuantity(const QString &text, Quantity &out) {
    const QStringList parts = text.simplified().toLower().split(' ', Qt::SkipEmptyParts);
    if (parts.isEmpty()) return false;

    bool ok = false;
    const double value = parts.first().toDouble(&ok);
    if (!ok) return false;

    out.value = value;
    out.unit = parts.mid(1).join(' ');
    return true;
}
