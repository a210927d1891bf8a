// tests/test_consumption_sync.cpp (doctest)

#include <doctest/doctest.h>

#include "TestDatabase.h"
#include "ConsumptionSync.h"
#include "MealPlanStore.h"
#include "PantryStore.h"
#include "ShoppingListMerger.h"

#include <QVector>

namespace consumption_sync_tests {

const QDate Today(2026, 10, 19);

struct SyncFixture : TestDatabase {
    SyncFixture()
        : pantry(db), mealPlan(db),
          shopping(db, ShoppingColumnMap::fromOptions(db, SyncOptions())),
          sync(db, pantry, mealPlan, shopping) {}

    int addItem(const QString &name, const QString &unit, double amount,
                double threshold = 0.0, double baseAmount = -1.0) {
        PantryItem item(name, unit, amount, threshold);
        if (baseAmount >= 0) item.setBaseAmount(baseAmount);
        return pantry.addItem(item);
    }

    // recipe with a single linked ingredient
    int addRecipe(const QString &title, double qty, const QString &unit, int pantryId) {
        const int recipe = mealPlan.addRecipe(title);
        mealPlan.addIngredient(RecipeIngredient(recipe, title + " ingredient", qty, unit, pantryId));
        return recipe;
    }

    int plan(int recipeId, const QDate &date = Today, double servings = 1.0) {
        return mealPlan.addEntry(MealPlanEntry(date, recipeId, servings));
    }

    double amountOf(int pantryId) {
        PantryItem item;
        pantry.load(pantryId, item);
        return item.amount();
    }

    bool applied(int entryId) {
        MealPlanEntry entry;
        mealPlan.entryById(entryId, entry);
        return entry.usageApplied();
    }

    SyncReport run(const QDate &date = Today) {
        SyncReport report;
        ok = sync.syncMenuConsumption(date, report);
        return report;
    }

    PantryStore pantry;
    MealPlanStore mealPlan;
    ShoppingListMerger shopping;
    ConsumptionSync sync;
};

} // namespace consumption_sync_tests

using consumption_sync_tests::SyncFixture;
using consumption_sync_tests::Today;

TEST_CASE("ConsumptionSync with nothing pending returns an empty report") {
    SyncFixture f;
    REQUIRE(f.ok);

    const SyncReport report = f.run();
    CHECK(f.ok);
    CHECK(report == SyncReport());
}

TEST_CASE("ConsumptionSync soup scenario deducts and auto-adds") {
    SyncFixture f;
    REQUIRE(f.ok);

    const int base = f.addItem("Soup base", "g", 250, 0.5, 500);
    const int soup = f.addRecipe("Soup", 200, "g", base);
    const int entry = f.plan(soup);

    const SyncReport report = f.run();
    REQUIRE(f.ok);
    CHECK(report.processedEntries == 1);
    CHECK(report.updatedItems == 1);
    CHECK(report.skippedIngredients == 0);
    CHECK(report.autoAdded == 1);

    CHECK(f.amountOf(base) == doctest::Approx(50.0));
    CHECK(f.applied(entry));

    QVector<ShoppingListEntry> open;
    REQUIRE(f.shopping.openEntries(open));
    REQUIRE(open.size() == 1);
    CHECK(open.first().name() == "Soup base");
    CHECK(open.first().quantity() == 1.0);
    CHECK(open.first().unit() == "g");
    CHECK(open.first().status() == "pending");
    CHECK(open.first().linkedPantryId() == base);
    CHECK(open.first().notes() == "Auto-added: remaining 50 g <= threshold 250");
}

TEST_CASE("ConsumptionSync is idempotent over the same date") {
    SyncFixture f;
    REQUIRE(f.ok);

    const int rice = f.addItem("Rice", "g", 1000);
    f.plan(f.addRecipe("Pilaf", 150, "g", rice));
    f.plan(f.addRecipe("Risotto", 100, "g", rice));

    const SyncReport first = f.run();
    REQUIRE(f.ok);
    CHECK(first.processedEntries == 2);
    CHECK(f.amountOf(rice) == doctest::Approx(750.0));

    const SyncReport second = f.run();
    REQUIRE(f.ok);
    CHECK(second.processedEntries == 0);
    CHECK(second == SyncReport());
    CHECK(f.amountOf(rice) == doctest::Approx(750.0));
}

TEST_CASE("ConsumptionSync leaves future entries for a later run") {
    SyncFixture f;
    REQUIRE(f.ok);

    const int milk = f.addItem("Milk", "ml", 2000);
    const int recipe = f.addRecipe("Pancakes", 1, "cup", milk);
    const int past = f.plan(recipe, Today.addDays(-2));
    const int future = f.plan(recipe, Today.addDays(1));

    CHECK(f.run().processedEntries == 1);
    CHECK(f.applied(past));
    CHECK_FALSE(f.applied(future));
    CHECK(f.amountOf(milk) == doctest::Approx(2000 - 236.5882365));

    CHECK(f.run(Today.addDays(1)).processedEntries == 1);
    CHECK(f.applied(future));
}

TEST_CASE("ConsumptionSync processes entries by date then id") {
    SyncFixture f;
    REQUIRE(f.ok);

    const int oil = f.addItem("Oil", "ml", 500);
    const int recipe = f.addRecipe("Fry", 10, "ml", oil);
    const int later = f.plan(recipe, Today);
    const int earlier = f.plan(recipe, Today.addDays(-1));
    const int sameDay = f.plan(recipe, Today);

    REQUIRE(f.run().processedEntries == 3);

    QVector<Movement> movements;
    REQUIRE(f.pantry.movementsFor(oil, movements));
    REQUIRE(movements.size() == 3);
    CHECK(movements.at(0).reference() == QString("Menu entry #%1").arg(earlier));
    CHECK(movements.at(1).reference() == QString("Menu entry #%1").arg(later));
    CHECK(movements.at(2).reference() == QString("Menu entry #%1").arg(sameDay));
    CHECK(movements.at(0).type() == Movement::ConsumptionType);
    CHECK(movements.at(0).quantity() == doctest::Approx(-10.0));
    CHECK(movements.at(0).date() == Today.addDays(-1));
}

TEST_CASE("ConsumptionSync converts units and applies servings") {
    SyncFixture f;
    REQUIRE(f.ok);

    const int flour = f.addItem("Flour", "kg", 2);
    f.plan(f.addRecipe("Bread", 1, "lb", flour));

    const int sugar = f.addItem("Sugar", "g", 1000);
    f.plan(f.addRecipe("Cake", 50, "g", sugar), Today, 3);

    const SyncReport report = f.run();
    REQUIRE(f.ok);
    CHECK(report.updatedItems == 2);
    CHECK(f.amountOf(flour) == doctest::Approx(2 - 0.45359237));
    CHECK(f.amountOf(sugar) == doctest::Approx(850.0));
}

TEST_CASE("ConsumptionSync clamps over-consumption at zero") {
    SyncFixture f;
    REQUIRE(f.ok);

    const int butter = f.addItem("Butter", "g", 100);
    f.plan(f.addRecipe("Shortbread", 150, "g", butter));

    const SyncReport report = f.run();
    REQUIRE(f.ok);
    CHECK(report.updatedItems == 1);
    CHECK(f.amountOf(butter) == 0.0);
}

TEST_CASE("ConsumptionSync skips unlinked and dangling ingredients") {
    SyncFixture f;
    REQUIRE(f.ok);

    const int salt = f.addItem("Salt", "g", 500);
    const int pepper = f.addItem("Pepper", "g", 80);
    const int recipe = f.mealPlan.addRecipe("Stew");
    f.mealPlan.addIngredient(RecipeIngredient(recipe, "water", 1, "l"));
    f.mealPlan.addIngredient(RecipeIngredient(recipe, "ghost", 5, "g", 999));
    f.mealPlan.addIngredient(RecipeIngredient(recipe, "salt", 5, "g", salt));
    const int entry = f.plan(recipe);

    const SyncReport report = f.run();
    REQUIRE(f.ok);
    CHECK(report.processedEntries == 1);
    CHECK(report.skippedIngredients == 2);
    CHECK(report.updatedItems == 1);
    CHECK(f.amountOf(salt) == doctest::Approx(495.0));
    CHECK(f.amountOf(pepper) == doctest::Approx(80.0));
    CHECK(f.applied(entry));
}

TEST_CASE("ConsumptionSync skips mismatched unit families") {
    SyncFixture f;
    REQUIRE(f.ok);

    const int oats = f.addItem("Oats", "g", 500);
    f.plan(f.addRecipe("Porridge", 1, "cup", oats));

    const SyncReport report = f.run();
    REQUIRE(f.ok);
    CHECK(report.skippedIngredients == 1);
    CHECK(report.updatedItems == 0);
    CHECK(report.processedEntries == 1);
    CHECK(f.amountOf(oats) == doctest::Approx(500.0));
}

TEST_CASE("ConsumptionSync unit policy decides unknown units") {
    SyncFixture f;
    REQUIRE(f.ok);

    const int eggs = f.addItem("Eggs", "pcs", 12);
    const int cheese = f.addItem("Cheese", "g", 300);
    f.plan(f.addRecipe("Omelette", 3, "PCS", eggs));
    f.plan(f.addRecipe("Toastie", 2, "slices", cheese));

    SyncReport report = f.run();
    REQUIRE(f.ok);
    // identical unit text passes through, unknown against grams does not
    CHECK(f.amountOf(eggs) == doctest::Approx(9.0));
    CHECK(f.amountOf(cheese) == doctest::Approx(300.0));
    CHECK(report.skippedIngredients == 1);

    SyncOptions permissive;
    permissive.unitPolicy = SyncOptions::Permissive;
    f.sync.setOptions(permissive);
    f.plan(f.addRecipe("Melt", 2, "slices", cheese));

    report = f.run();
    REQUIRE(f.ok);
    CHECK(report.skippedIngredients == 0);
    CHECK(f.amountOf(cheese) == doctest::Approx(298.0));

    // known families still never mix
    double converted = 0;
    CHECK_FALSE(f.sync.convertForPantry(1, "cup", "g", converted));
}

TEST_CASE("ConsumptionSync merges repeated triggers into one shopping entry") {
    SyncFixture f;
    REQUIRE(f.ok);

    const int lemons = f.addItem("Lemons", "pcs", 6, 5);
    const int recipe = f.addRecipe("Lemonade", 1, "pcs", lemons);
    f.plan(recipe);
    f.plan(recipe);

    const SyncReport report = f.run();
    REQUIRE(f.ok);
    CHECK(report.autoAdded == 2);
    CHECK(f.amountOf(lemons) == doctest::Approx(4.0));

    QVector<ShoppingListEntry> open;
    REQUIRE(f.shopping.openEntries(open));
    REQUIRE(open.size() == 1);
    CHECK(open.first().quantity() == doctest::Approx(2.0));
}

TEST_CASE("ConsumptionSync absolute threshold triggers at the cutoff only") {
    SyncFixture f;
    REQUIRE(f.ok);

    const int atCutoff = f.addItem("Tomatoes", "pcs", 7, 5);
    const int above = f.addItem("Onions", "pcs", 8, 5);
    f.plan(f.addRecipe("Salsa", 2, "pcs", atCutoff));
    f.plan(f.addRecipe("Soffritto", 2, "pcs", above));

    const SyncReport report = f.run();
    REQUIRE(f.ok);
    CHECK(report.autoAdded == 1);

    QVector<ShoppingListEntry> open;
    REQUIRE(f.shopping.openEntries(open));
    REQUIRE(open.size() == 1);
    CHECK(open.first().linkedPantryId() == atCutoff);
}

TEST_CASE("ConsumptionSync keeps the baseline at the highest amount seen") {
    SyncFixture f;
    REQUIRE(f.ok);

    // no baseline yet: the current amount becomes the reference
    const int pasta = f.addItem("Pasta", "g", 400, 0.5);
    f.plan(f.addRecipe("Carbonara", 250, "g", pasta));

    // restocked above the recorded baseline
    const int beans = f.addItem("Beans", "g", 300, 0.5, 100);
    f.plan(f.addRecipe("Chili", 160, "g", beans));

    const SyncReport report = f.run();
    REQUIRE(f.ok);
    CHECK(report.autoAdded == 2);
    CHECK(f.scalar(QString("SELECT base_amount FROM pantry_items WHERE id = %1").arg(pasta))
              .toDouble() == doctest::Approx(400.0));
    CHECK(f.scalar(QString("SELECT base_amount FROM pantry_items WHERE id = %1").arg(beans))
              .toDouble() == doctest::Approx(300.0));
}

TEST_CASE("ConsumptionSync honours restock quantity and journal options") {
    SyncFixture f;
    REQUIRE(f.ok);

    SyncOptions options;
    options.restockQuantity = 3;
    options.recordMovements = false;
    f.sync.setOptions(options);

    const int yeast = f.addItem("Yeast", "g", 20, 15);
    f.plan(f.addRecipe("Pizza", 7, "g", yeast));

    REQUIRE(f.run().autoAdded == 1);
    QVector<ShoppingListEntry> open;
    REQUIRE(f.shopping.openEntries(open));
    REQUIRE(open.size() == 1);
    CHECK(open.first().quantity() == doctest::Approx(3.0));
    CHECK(f.scalar("SELECT COUNT(*) FROM pantry_movements").toInt() == 0);
}

TEST_CASE("ConsumptionSync defaults to today for an invalid date") {
    SyncFixture f;
    REQUIRE(f.ok);

    const int tea = f.addItem("Tea", "g", 100);
    const int entry = f.plan(f.addRecipe("Tea", 2, "g", tea), QDate::currentDate().addDays(-1));

    CHECK(f.run(QDate()).processedEntries == 1);
    CHECK(f.applied(entry));
}

TEST_CASE("ConsumptionSync rolls back the failing entry and stops") {
    SyncFixture f;
    REQUIRE(f.ok);

    const int stock = f.addItem("Stock", "ml", 1000);
    const int cream = f.addItem("Cream", "ml", 300, 250);
    const int first = f.plan(f.addRecipe("Broth", 100, "ml", stock), Today.addDays(-1));
    const int second = f.plan(f.addRecipe("Sauce", 100, "ml", cream), Today);

    // the merger was configured for a table that is gone
    REQUIRE(f.exec("DROP TABLE shopping_list"));

    SyncReport report;
    CHECK_FALSE(f.sync.syncMenuConsumption(Today, report));
    CHECK(report.processedEntries == 1);
    CHECK(report.autoAdded == 0);

    CHECK(f.applied(first));
    CHECK(f.amountOf(stock) == doctest::Approx(900.0));

    CHECK_FALSE(f.applied(second));
    CHECK(f.amountOf(cream) == doctest::Approx(300.0));
    QVector<Movement> movements;
    REQUIRE(f.pantry.movementsFor(cream, movements));
    CHECK(movements.isEmpty());
}
