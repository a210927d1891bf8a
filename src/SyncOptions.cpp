#include "SyncOptions.h"
#include "Settings.h"
#include <QDebug>

SyncOptions SyncOptions::fromSettings(const Settings &settings) {
    SyncOptions options;

    const QString policy = settings.value("sync.unit_policy", "strict").trimmed().toLower();
    if (policy == "permissive") {
        options.unitPolicy = Permissive;
    } else if (policy != "strict") {
        qDebug() << "SyncOptions: unknown unit policy" << policy << "- using strict";
    }

    const double restock = settings.doubleValue("sync.restock_quantity", 1.0);
    options.restockQuantity = restock > 0 ? restock : 1.0;
    options.recordMovements = settings.boolValue("sync.record_movements", true);
    options.shoppingTable = settings.value("shopping.table").trimmed();
    return options;
}
