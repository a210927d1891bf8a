#include "MealPlanEntry.h"

MealPlanEntry::MealPlanEntry()
    : m_id(0), m_recipeId(0), m_servings(1.0), m_usageApplied(false) {}

MealPlanEntry::MealPlanEntry(const QDate &date, int recipeId, double servings,
                             const QString &meal)
    : m_id(0), m_date(date), m_meal(meal), m_recipeId(recipeId),
      m_servings(servings), m_usageApplied(false) {}

int MealPlanEntry::id() const { return m_id; }
void MealPlanEntry::setId(int id) { m_id = id; }

QDate MealPlanEntry::date() const { return m_date; }
void MealPlanEntry::setDate(const QDate &date) { m_date = date; }

QString MealPlanEntry::meal() const { return m_meal; }
void MealPlanEntry::setMeal(const QString &meal) { m_meal = meal; }

int MealPlanEntry::recipeId() const { return m_recipeId; }
void MealPlanEntry::setRecipeId(int recipeId) { m_recipeId = recipeId; }

double MealPlanEntry::servings() const { return m_servings; }
void MealPlanEntry::setServings(double servings) { m_servings = servings; }

bool MealPlanEntry::usageApplied() const { return m_usageApplied; }
void MealPlanEntry::setUsageApplied(bool applied) { m_usageApplied = applied; }
