#ifndef INVENTORYMANAGER_H
#define INVENTORYMANAGER_H

#include "SyncOptions.h"
#include <QString>
#include <QDate>

class DatabaseManager;
class PantryStore;
class ShoppingListMerger;

class InventoryManager {
public:
    InventoryManager(DatabaseManager &db, PantryStore &pantry, ShoppingListMerger &shopping,
                     const SyncOptions &options = SyncOptions());

    // add incoming stock to a pantry item, raise its baseline and record movement;
    // `unit` empty means the item's own unit
    bool restock(int pantryId, double qty, const QString &unit,
                 const QDate &date, const QString &reference = QString());

    // when an open shopping entry is bought, close it and restock the pantry
    // item it links to (or the one matching name and brand, created if needed).
    // All writes commit together. Returns the pantry id, or -1
    int applyPurchase(int shoppingId, double qty = 1.0, const QString &unit = QString());

private:
    bool addStock(int pantryId, double qty, const QString &unit,
                  const QDate &date, const QString &reference);

    DatabaseManager &m_db;
    PantryStore &m_pantry;
    ShoppingListMerger &m_shopping;
    SyncOptions m_options;
};

#endif // INVENTORYMANAGER_H
