#include "MealPlanStore.h"
#include "DatabaseManager.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QVariant>
#include <QDebug>

namespace {

MealPlanEntry entryFromQuery(const QSqlQuery &query) {
    MealPlanEntry entry;
    entry.setId(query.value(0).toInt());
    entry.setDate(QDate::fromString(query.value(1).toString(), Qt::ISODate));
    entry.setMeal(query.value(2).toString());
    entry.setRecipeId(query.value(3).toInt());
    // a NULL or zero multiplier counts as one serving
    const double servings = query.value(4).toDouble();
    entry.setServings(servings != 0 ? servings : 1.0);
    entry.setUsageApplied(query.value(5).toInt() != 0);
    return entry;
}

} // namespace

MealPlanStore::MealPlanStore(DatabaseManager &db)
    : m_db(db) {}

bool MealPlanStore::pendingEntries(const QDate &asOf, QVector<MealPlanEntry> &entries) const {
    entries.clear();
    QSqlDatabase db = m_db.database();
    if (!db.isOpen()) return false;

    QSqlQuery query(db);
    query.prepare("SELECT id, date, meal, recipe_id, servings, usage_applied "
                  "FROM menu_entries "
                  "WHERE date <= :asOf AND COALESCE(usage_applied, 0) = 0 "
                  "ORDER BY date, id");
    query.bindValue(":asOf", asOf.toString(Qt::ISODate));
    if (!query.exec()) {
        qWarning() << "Failed to query pending menu entries:" << query.lastError().text();
        return false;
    }
    while (query.next())
        entries.append(entryFromQuery(query));
    return true;
}

bool MealPlanStore::ingredientsForRecipe(int recipeId, QVector<RecipeIngredient> &ingredients) const {
    ingredients.clear();
    QSqlDatabase db = m_db.database();
    if (!db.isOpen()) return false;

    QSqlQuery query(db);
    query.prepare("SELECT id, recipe_id, name, COALESCE(qty, 0), unit, linked_pantry_id "
                  "FROM recipe_ingredients WHERE recipe_id = :rid ORDER BY id");
    query.bindValue(":rid", recipeId);
    if (!query.exec()) {
        qWarning() << "Failed to query ingredients of recipe" << recipeId
                   << query.lastError().text();
        return false;
    }
    while (query.next()) {
        RecipeIngredient ingredient(query.value(1).toInt(), query.value(2).toString(),
                                    query.value(3).toDouble(), query.value(4).toString(),
                                    query.value(5).isNull() ? 0 : query.value(5).toInt());
        ingredient.setId(query.value(0).toInt());
        ingredients.append(ingredient);
    }
    return true;
}

bool MealPlanStore::entryById(int id, MealPlanEntry &entry) const {
    entry = MealPlanEntry();
    QSqlDatabase db = m_db.database();
    if (!db.isOpen()) return false;

    QSqlQuery query(db);
    query.prepare("SELECT id, date, meal, recipe_id, servings, usage_applied "
                  "FROM menu_entries WHERE id = :id");
    query.bindValue(":id", id);
    if (!query.exec()) {
        qWarning() << "Failed to load menu entry" << id << query.lastError().text();
        return false;
    }
    if (query.next())
        entry = entryFromQuery(query);
    return true;
}

bool MealPlanStore::markUsageApplied(int entryId) {
    QSqlDatabase db = m_db.database();
    if (!db.isOpen()) return false;

    QSqlQuery query(db);
    query.prepare("UPDATE menu_entries SET usage_applied = 1 WHERE id = :id");
    query.bindValue(":id", entryId);
    if (!query.exec()) {
        qWarning() << "Failed to mark menu entry" << entryId << "as applied:"
                   << query.lastError().text();
        return false;
    }
    return true;
}

int MealPlanStore::addRecipe(const QString &title, int servings) {
    QSqlDatabase db = m_db.database();
    if (!db.isOpen()) return -1;

    QSqlQuery query(db);
    query.prepare("INSERT INTO recipes(title, servings) VALUES(:title, :servings)");
    query.bindValue(":title", title);
    query.bindValue(":servings", servings);
    if (!query.exec()) {
        qWarning() << "Failed to insert recipe" << title << query.lastError().text();
        return -1;
    }
    return query.lastInsertId().toInt();
}

int MealPlanStore::addIngredient(const RecipeIngredient &ingredient) {
    QSqlDatabase db = m_db.database();
    if (!db.isOpen()) return -1;

    QSqlQuery query(db);
    query.prepare("INSERT INTO recipe_ingredients(recipe_id, name, qty, unit, linked_pantry_id) "
                  "VALUES(:rid, :name, :qty, :unit, :pid)");
    query.bindValue(":rid", ingredient.recipeId());
    query.bindValue(":name", ingredient.name());
    query.bindValue(":qty", ingredient.quantity());
    query.bindValue(":unit", ingredient.unit());
    query.bindValue(":pid", ingredient.isLinked() ? QVariant(ingredient.linkedPantryId())
                                                  : QVariant());
    if (!query.exec()) {
        qWarning() << "Failed to insert ingredient" << ingredient.name()
                   << query.lastError().text();
        return -1;
    }
    return query.lastInsertId().toInt();
}

int MealPlanStore::addEntry(const MealPlanEntry &entry) {
    QSqlDatabase db = m_db.database();
    if (!db.isOpen()) return -1;

    QSqlQuery query(db);
    query.prepare("INSERT INTO menu_entries(date, meal, recipe_id, servings, usage_applied) "
                  "VALUES(:date, :meal, :rid, :servings, :applied)");
    query.bindValue(":date", entry.date().toString(Qt::ISODate));
    query.bindValue(":meal", entry.meal());
    query.bindValue(":rid", entry.recipeId());
    query.bindValue(":servings", entry.servings());
    query.bindValue(":applied", entry.usageApplied() ? 1 : 0);
    if (!query.exec()) {
        qWarning() << "Failed to insert menu entry:" << query.lastError().text();
        return -1;
    }
    return query.lastInsertId().toInt();
}
