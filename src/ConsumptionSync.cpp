#include "ConsumptionSync.h"
#include "DatabaseManager.h"
#include "MealPlanStore.h"
#include "PantryStore.h"
#include "ShoppingListMerger.h"
#include "UnitConverter.h"
#include <QtGlobal>
#include <QVector>
#include <QDebug>

ConsumptionSync::ConsumptionSync(DatabaseManager &db, PantryStore &pantry, MealPlanStore &mealPlan,
                                 ShoppingListMerger &shopping, const SyncOptions &options)
    : m_db(db), m_pantry(pantry), m_mealPlan(mealPlan), m_shopping(shopping),
      m_options(options) {}

const SyncOptions &ConsumptionSync::options() const {
    return m_options;
}

void ConsumptionSync::setOptions(const SyncOptions &options) {
    m_options = options;
}

bool ConsumptionSync::syncMenuConsumption(const QDate &asOfDate, SyncReport &report) {
    report = SyncReport();
    const QDate asOf = asOfDate.isValid() ? asOfDate : QDate::currentDate();

    QVector<MealPlanEntry> entries;
    if (!m_mealPlan.pendingEntries(asOf, entries)) return false;
    if (entries.isEmpty()) return true;

    for (const MealPlanEntry &entry : entries) {
        if (!m_db.transaction()) return false;

        SyncReport entryReport;
        if (!applyEntry(entry, entryReport) || !m_mealPlan.markUsageApplied(entry.id())) {
            qWarning() << "ConsumptionSync: menu entry" << entry.id()
                       << "rolled back, stopping run";
            m_db.rollback();
            return false;
        }
        if (!m_db.commit()) {
            m_db.rollback();
            return false;
        }

        entryReport.processedEntries = 1;
        report += entryReport;
        qDebug() << "ConsumptionSync: applied menu entry" << entry.id()
                 << "of" << entry.date().toString(Qt::ISODate);
    }

    qDebug() << "ConsumptionSync: processed" << report.processedEntries << "entries,"
             << report.updatedItems << "items updated,"
             << report.skippedIngredients << "ingredients skipped,"
             << report.autoAdded << "auto-added";
    return true;
}

bool ConsumptionSync::applyEntry(const MealPlanEntry &entry, SyncReport &report) {
    QVector<RecipeIngredient> ingredients;
    if (!m_mealPlan.ingredientsForRecipe(entry.recipeId(), ingredients)) return false;

    for (const RecipeIngredient &ingredient : ingredients) {
        if (!applyIngredient(entry, ingredient, report)) return false;
    }
    return true;
}

bool ConsumptionSync::applyIngredient(const MealPlanEntry &entry,
                                      const RecipeIngredient &ingredient,
                                      SyncReport &report) {
    if (!ingredient.isLinked()) {
        ++report.skippedIngredients;
        return true;
    }

    PantryItem item;
    if (!m_pantry.load(ingredient.linkedPantryId(), item)) return false;
    if (!item.isValid()) {
        qDebug() << "ConsumptionSync: ingredient" << ingredient.name()
                 << "links to missing pantry item" << ingredient.linkedPantryId();
        ++report.skippedIngredients;
        return true;
    }

    // the baseline follows restocks above the last known maximum
    if (!m_pantry.ensureBaseline(item)) return false;

    const double required = ingredient.quantity() * entry.servings();
    double converted = 0.0;
    if (!convertForPantry(required, ingredient.unit(), item.unit(), converted)) {
        qDebug() << "ConsumptionSync: cannot use" << ingredient.unit()
                 << UnitConverter::familyName(UnitConverter::classify(ingredient.unit()))
                 << "of" << ingredient.name() << "against pantry unit" << item.unit()
                 << UnitConverter::familyName(UnitConverter::classify(item.unit()));
        ++report.skippedIngredients;
        return true;
    }

    const double remaining = qMax(0.0, item.amount() - converted);
    if (!m_pantry.updateAmount(item.id(), remaining)) return false;
    ++report.updatedItems;

    if (m_options.recordMovements) {
        // journal failures are not fatal
        m_pantry.recordMovement(Movement(entry.date(), Movement::ConsumptionType, item.id(),
                                         remaining - item.amount(), item.unit(),
                                         QString("Menu entry #%1").arg(entry.id())));
    }
    item.setAmount(remaining);

    const double cutoff = item.effectiveThreshold();
    if (cutoff > 0 && remaining <= cutoff)
        return replenish(item, remaining, cutoff, report);
    return true;
}

bool ConsumptionSync::replenish(const PantryItem &item, double remaining, double cutoff,
                                SyncReport &report) {
    ShoppingListEntry candidate(item.name().isEmpty() ? QString("Item") : item.name(),
                                m_options.restockQuantity, item.unit(), item.id());
    candidate.setBrand(item.brand());
    candidate.setCategory(item.category());
    candidate.setStore(item.store());
    candidate.setStatus(ShoppingListEntry::PendingStatus);
    candidate.setNotes(QString("Auto-added: remaining %1 %2 <= threshold %3")
                           .arg(QString::number(remaining, 'g', 6), item.unit(),
                                QString::number(cutoff, 'g', 6))
                           .simplified());

    const ShoppingListMerger::MergeResult result = m_shopping.mergeOrInsert(candidate);
    if (result == ShoppingListMerger::Failed) return false;

    ++report.autoAdded;
    qDebug() << "ConsumptionSync:" << item.name() << "at" << remaining << item.unit()
             << (result == ShoppingListMerger::Inserted ? "added to" : "already on")
             << "the shopping list";
    return true;
}

bool ConsumptionSync::convertForPantry(double quantity, const QString &fromUnit,
                                       const QString &pantryUnit, double &converted) const {
    if (UnitConverter::isConvertible(fromUnit, pantryUnit)) {
        converted = UnitConverter::convert(quantity, fromUnit, pantryUnit);
        return true;
    }
    if (UnitConverter::sameUnit(fromUnit, pantryUnit)) {
        converted = quantity;
        return true;
    }
    if (m_options.unitPolicy == SyncOptions::Permissive
        && (UnitConverter::classify(fromUnit) == UnitConverter::Unknown
            || UnitConverter::classify(pantryUnit) == UnitConverter::Unknown)) {
        converted = quantity;
        return true;
    }
    return false;
}
