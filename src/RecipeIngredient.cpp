#include "RecipeIngredient.h"

RecipeIngredient::RecipeIngredient()
    : m_id(0), m_recipeId(0), m_quantity(0), m_linkedPantryId(0) {}

RecipeIngredient::RecipeIngredient(int recipeId, const QString &name, double quantity,
                                   const QString &unit, int linkedPantryId)
    : m_id(0), m_recipeId(recipeId), m_name(name), m_quantity(quantity),
      m_unit(unit), m_linkedPantryId(linkedPantryId) {}

int RecipeIngredient::id() const { return m_id; }
void RecipeIngredient::setId(int id) { m_id = id; }

int RecipeIngredient::recipeId() const { return m_recipeId; }
void RecipeIngredient::setRecipeId(int recipeId) { m_recipeId = recipeId; }

QString RecipeIngredient::name() const { return m_name; }
void RecipeIngredient::setName(const QString &name) { m_name = name; }

double RecipeIngredient::quantity() const { return m_quantity; }
void RecipeIngredient::setQuantity(double quantity) { m_quantity = quantity; }

QString RecipeIngredient::unit() const { return m_unit; }
void RecipeIngredient::setUnit(const QString &unit) { m_unit = unit; }

int RecipeIngredient::linkedPantryId() const { return m_linkedPantryId; }
void RecipeIngredient::setLinkedPantryId(int pantryId) { m_linkedPantryId = pantryId; }
bool RecipeIngredient::isLinked() const { return m_linkedPantryId > 0; }
