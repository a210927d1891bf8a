#ifndef MEALPLANENTRY_H
#define MEALPLANENTRY_H

#include <QString>
#include <QDate>

// Scheduled use of a recipe; its pantry effect is applied once
class MealPlanEntry {
public:
    MealPlanEntry();
    MealPlanEntry(const QDate &date, int recipeId, double servings = 1.0,
                  const QString &meal = QString());

    int id() const;
    void setId(int id);

    QDate date() const;
    void setDate(const QDate &date);

    QString meal() const;
    void setMeal(const QString &meal);

    int recipeId() const;
    void setRecipeId(int recipeId);

    double servings() const;
    void setServings(double servings);

    bool usageApplied() const;
    void setUsageApplied(bool applied);

private:
    int m_id;
    QDate m_date;
    QString m_meal;
    int m_recipeId;
    double m_servings;
    bool m_usageApplied;
};

#endif // MEALPLANENTRY_H
