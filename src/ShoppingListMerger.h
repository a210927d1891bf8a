#ifndef SHOPPINGLISTMERGER_H
#define SHOPPINGLISTMERGER_H

#include "ShoppingColumnMap.h"
#include "ShoppingListEntry.h"
#include <QVector>

class DatabaseManager;

// Keeps at most one open shopping entry per pantry link, or per (name, unit)
// for unlinked entries, by bumping the quantity of an existing open row
// instead of inserting a duplicate.
class ShoppingListMerger {
public:
    enum MergeResult {
        Failed,
        Inserted,
        Incremented,
        // open match whose quantity could not be bumped; nothing written
        AlreadyListed
    };

    ShoppingListMerger(DatabaseManager &db, const ShoppingColumnMap &columns);

    MergeResult mergeOrInsert(const ShoppingListEntry &candidate);

    bool openEntries(QVector<ShoppingListEntry> &entries) const;
    bool entryById(int id, ShoppingListEntry &entry) const;

    // marks the entry purchased, or deletes it when the table has no status column
    bool closeEntry(int id);

    const ShoppingColumnMap &columns() const;

private:
    QString selectClause(QVector<ShoppingColumnMap::Field> &fields) const;
    MergeResult insertEntry(const ShoppingListEntry &candidate);

    DatabaseManager &m_db;
    ShoppingColumnMap m_columns;
};

#endif // SHOPPINGLISTMERGER_H
