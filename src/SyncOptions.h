#ifndef SYNCOPTIONS_H
#define SYNCOPTIONS_H

#include <QString>

class Settings;

// Tunables of the consumption sync, read once per deployment
struct SyncOptions {
    enum UnitPolicy {
        // deduct only within one known unit family or for identical unit text
        Strict,
        // additionally pass the raw quantity through when either unit is unknown
        Permissive
    };

    UnitPolicy unitPolicy = Strict;
    double restockQuantity = 1.0;
    bool recordMovements = true;
    // empty: first existing of shopping_list, shopping_items
    QString shoppingTable;

    // keys: sync.unit_policy, sync.restock_quantity, sync.record_movements, shopping.table
    static SyncOptions fromSettings(const Settings &settings);
};

#endif // SYNCOPTIONS_H
