#ifndef UNITCONVERTER_H
#define UNITCONVERTER_H

#include <QString>

// A numeric value with its free-text unit
struct Quantity {
    double value = 0.0;
    QString unit;
};

// Conversion between kitchen units of one family.
// Mass is canonicalized to grams, volume to milliliters.
class UnitConverter {
public:
    enum Family { Mass, Volume, Unknown };

    struct Canonical {
        double value;
        Family family;
    };

    // every unit string maps to exactly one family, empty and count units are Unknown
    static Family classify(const QString &unit);

    // value in grams or milliliters; Unknown units pass through unchanged
    static Canonical toCanonical(double value, const QString &unit);
    static double fromCanonical(double canonicalValue, const QString &targetUnit);

    // Converts only when both units share a known family, otherwise
    // returns `value` unchanged. Check isConvertible() before relying on it.
    static double convert(double value, const QString &fromUnit, const QString &toUnit);
    static bool isConvertible(const QString &fromUnit, const QString &toUnit);

    static bool sameUnit(const QString &a, const QString &b);
    static QString normalize(const QString &unit);
    static QString canonicalUnit(Family family);
    static QString familyName(Family family);

    // "1.5 cups" -> {1.5, "cups"}, "3" -> {3, ""}
    static bool parseQuantity(const QString &text, Quantity &out);

private:
    static double factor(const QString &normalizedUnit, Family family);
};

#endif // UNITCONVERTER_H
