// tests/test_unit_converter.cpp (doctest)

#include <doctest/doctest.h>

#include "UnitConverter.h"

#include <QStringList>

TEST_CASE("UnitConverter classifies mass, volume and unknown units") {
    for (const char *u : {"g", "grams", "KG", " lb ", "Pounds", "oz", "ounce"})
        CHECK(UnitConverter::classify(u) == UnitConverter::Mass);
    for (const char *u : {"ml", "Liters", "tsp", "Tbsp", "cup", "cups", "pt", "qt", "gal"})
        CHECK(UnitConverter::classify(u) == UnitConverter::Volume);
    for (const char *u : {"", "pcs", "pinch", "can", "clove"})
        CHECK(UnitConverter::classify(u) == UnitConverter::Unknown);
}

TEST_CASE("UnitConverter converts cups to milliliters and back") {
    CHECK(UnitConverter::convert(1, "cup", "ml") == doctest::Approx(236.5882365));
    CHECK(UnitConverter::convert(236.5882365, "ml", "cup") == doctest::Approx(1.0));
    CHECK(UnitConverter::convert(2, "kg", "lb") == doctest::Approx(4.40924524));
    CHECK(UnitConverter::convert(3, "tsp", "tbsp") == doctest::Approx(1.0));
}

TEST_CASE("UnitConverter round-trips within each family") {
    const QStringList mass = {"g", "kg", "oz", "lb"};
    const QStringList volume = {"ml", "l", "tsp", "tbsp", "cup", "pt", "qt", "gal"};

    for (const QStringList &family : {mass, volume}) {
        for (const QString &a : family) {
            for (const QString &b : family) {
                const double there = UnitConverter::convert(12.5, a, b);
                CHECK(UnitConverter::convert(there, b, a) == doctest::Approx(12.5));
            }
        }
    }
}

TEST_CASE("UnitConverter passes values through across families and unknown units") {
    CHECK(UnitConverter::convert(100, "g", "cup") == 100);
    CHECK(UnitConverter::convert(3, "pcs", "g") == 3);
    CHECK(UnitConverter::convert(3, "ml", "") == 3);
    CHECK_FALSE(UnitConverter::isConvertible("g", "cup"));
    CHECK_FALSE(UnitConverter::isConvertible("pcs", "pcs"));
    CHECK(UnitConverter::isConvertible("Cups", "ml"));
}

TEST_CASE("UnitConverter canonical values carry their family") {
    const UnitConverter::Canonical lb = UnitConverter::toCanonical(2, "lb");
    CHECK(lb.value == doctest::Approx(907.18474));
    CHECK(lb.family == UnitConverter::Mass);

    const UnitConverter::Canonical gal = UnitConverter::toCanonical(1, "gallon");
    CHECK(gal.value == doctest::Approx(3785.411784));
    CHECK(gal.family == UnitConverter::Volume);

    const UnitConverter::Canonical pcs = UnitConverter::toCanonical(5, "pcs");
    CHECK(pcs.value == 5);
    CHECK(pcs.family == UnitConverter::Unknown);

    CHECK(UnitConverter::fromCanonical(1500, "kg") == doctest::Approx(1.5));
    CHECK(UnitConverter::fromCanonical(7, "pcs") == 7);
    CHECK(UnitConverter::canonicalUnit(UnitConverter::Mass) == "g");
    CHECK(UnitConverter::canonicalUnit(UnitConverter::Volume) == "ml");
    CHECK(UnitConverter::canonicalUnit(UnitConverter::Unknown).isEmpty());
    CHECK(UnitConverter::familyName(UnitConverter::classify("tbsp")) == "volume");
    CHECK(UnitConverter::familyName(UnitConverter::classify("oz")) == "mass");
    CHECK(UnitConverter::familyName(UnitConverter::classify("pinch")) == "unknown");
}

TEST_CASE("UnitConverter parses quantity text") {
    Quantity q;
    REQUIRE(UnitConverter::parseQuantity("1.5 Cups", q));
    CHECK(q.value == doctest::Approx(1.5));
    CHECK(q.unit == "cups");

    REQUIRE(UnitConverter::parseQuantity(" 3 ", q));
    CHECK(q.value == 3);
    CHECK(q.unit.isEmpty());

    REQUIRE(UnitConverter::parseQuantity("2 fl oz", q));
    CHECK(q.unit == "fl oz");

    // any run of whitespace separates value and unit
    REQUIRE(UnitConverter::parseQuantity("2\tcups", q));
    CHECK(q.value == 2);
    CHECK(q.unit == "cups");
    REQUIRE(UnitConverter::parseQuantity("250\n  ml", q));
    CHECK(q.unit == "ml");

    CHECK_FALSE(UnitConverter::parseQuantity("", q));
    CHECK_FALSE(UnitConverter::parseQuantity("a pinch", q));
}
