#ifndef RECIPEINGREDIENT_H
#define RECIPEINGREDIENT_H

#include <QString>

// Per-serving use of a pantry item by a recipe
class RecipeIngredient {
public:
    RecipeIngredient();
    RecipeIngredient(int recipeId, const QString &name, double quantity,
                     const QString &unit, int linkedPantryId = 0);

    int id() const;
    void setId(int id);

    int recipeId() const;
    void setRecipeId(int recipeId);

    QString name() const;
    void setName(const QString &name);

    double quantity() const;
    void setQuantity(double quantity);

    QString unit() const;
    void setUnit(const QString &unit);

    // 0 when the ingredient is not linked to the pantry
    int linkedPantryId() const;
    void setLinkedPantryId(int pantryId);
    bool isLinked() const;

private:
    int m_id;
    int m_recipeId;
    QString m_name;
    double m_quantity;
    QString m_unit;
    int m_linkedPantryId;
};

#endif // RECIPEINGREDIENT_H
