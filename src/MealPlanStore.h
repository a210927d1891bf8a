#ifndef MEALPLANSTORE_H
#define MEALPLANSTORE_H

#include "MealPlanEntry.h"
#include "RecipeIngredient.h"
#include <QVector>

class DatabaseManager;

// Access to recipes, recipe_ingredients and menu_entries
class MealPlanStore {
public:
    explicit MealPlanStore(DatabaseManager &db);

    // entries dated on or before asOf with usage not yet applied, by (date, id)
    bool pendingEntries(const QDate &asOf, QVector<MealPlanEntry> &entries) const;
    bool ingredientsForRecipe(int recipeId, QVector<RecipeIngredient> &ingredients) const;
    bool entryById(int id, MealPlanEntry &entry) const;

    bool markUsageApplied(int entryId);

    // data entry; each returns the new id, or -1
    int addRecipe(const QString &title, int servings = 0);
    int addIngredient(const RecipeIngredient &ingredient);
    int addEntry(const MealPlanEntry &entry);

private:
    DatabaseManager &m_db;
};

#endif // MEALPLANSTORE_H
