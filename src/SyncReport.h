#ifndef SYNCREPORT_H
#define SYNCREPORT_H

// Counters of one consumption sync run
struct SyncReport {
    int processedEntries = 0;
    int updatedItems = 0;
    int skippedIngredients = 0;
    // merge invocations, not distinct shopping entries
    int autoAdded = 0;

    SyncReport &operator+=(const SyncReport &other) {
        processedEntries += other.processedEntries;
        updatedItems += other.updatedItems;
        skippedIngredients += other.skippedIngredients;
        autoAdded += other.autoAdded;
        return *this;
    }

    bool operator==(const SyncReport &other) const {
        return processedEntries == other.processedEntries
            && updatedItems == other.updatedItems
            && skippedIngredients == other.skippedIngredients
            && autoAdded == other.autoAdded;
    }
};

#endif // SYNCREPORT_H
