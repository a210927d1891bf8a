#ifndef PANTRYSTORE_H
#define PANTRYSTORE_H

#include "PantryItem.h"
#include "Movement.h"
#include <QVector>

class DatabaseManager;

// Reads and writes pantry_items rows and their movement journal.
// Methods return false when the query fails; a missing row is reported
// through an invalid PantryItem instead.
class PantryStore {
public:
    explicit PantryStore(DatabaseManager &db);

    bool load(int id, PantryItem &item) const;
    // case-insensitive match on trimmed name and brand
    bool findByNameBrand(const QString &name, const QString &brand, PantryItem &item) const;
    bool lowStockItems(QVector<PantryItem> &items) const;

    // returns the new id, or -1
    int addItem(const PantryItem &item);

    bool updateAmount(int id, double amount);
    bool updateBaseAmount(int id, double baseAmount);

    // sets base_amount to amount when unset or exceeded; updates `item` too
    bool ensureBaseline(PantryItem &item);

    bool recordMovement(const Movement &movement);
    bool movementsFor(int pantryId, QVector<Movement> &movements) const;

private:
    DatabaseManager &m_db;
};

#endif // PANTRYSTORE_H
