#ifndef CONSUMPTIONSYNC_H
#define CONSUMPTIONSYNC_H

#include "SyncOptions.h"
#include "SyncReport.h"
#include <QDate>

class DatabaseManager;
class PantryStore;
class MealPlanStore;
class ShoppingListMerger;
class MealPlanEntry;
class RecipeIngredient;
class PantryItem;

// Applies scheduled meal plan entries to pantry stock and puts items that
// fall to their replenishment threshold on the shopping list.
//
// Each entry is applied inside its own transaction together with its
// usage_applied flag, so re-running over the same dates is a no-op for
// entries already committed.
class ConsumptionSync {
public:
    ConsumptionSync(DatabaseManager &db, PantryStore &pantry, MealPlanStore &mealPlan,
                    ShoppingListMerger &shopping, const SyncOptions &options = SyncOptions());

    const SyncOptions &options() const;
    void setOptions(const SyncOptions &options);

    // Processes pending entries dated on or before asOfDate (today when invalid).
    // Returns false on a store failure; `report` then holds the counts of the
    // entries committed before it.
    bool syncMenuConsumption(const QDate &asOfDate, SyncReport &report);

    // required quantity expressed in the pantry item's unit; false when the
    // units cannot be reconciled under the current unit policy.
    // Unit text counts as identical after trimming and case folding, so
    // "PCS" passes through against "pcs" even though neither is convertible.
    bool convertForPantry(double quantity, const QString &fromUnit,
                          const QString &pantryUnit, double &converted) const;

private:
    bool applyEntry(const MealPlanEntry &entry, SyncReport &report);
    bool applyIngredient(const MealPlanEntry &entry, const RecipeIngredient &ingredient,
                         SyncReport &report);
    bool replenish(const PantryItem &item, double remaining, double cutoff, SyncReport &report);

    DatabaseManager &m_db;
    PantryStore &m_pantry;
    MealPlanStore &m_mealPlan;
    ShoppingListMerger &m_shopping;
    SyncOptions m_options;
};

#endif // CONSUMPTIONSYNC_H
