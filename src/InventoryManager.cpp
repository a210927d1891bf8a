#include "InventoryManager.h"
#include "DatabaseManager.h"
#include "PantryStore.h"
#include "ShoppingListMerger.h"
#include "UnitConverter.h"
#include <QDebug>

InventoryManager::InventoryManager(DatabaseManager &db, PantryStore &pantry,
                                   ShoppingListMerger &shopping, const SyncOptions &options)
    : m_db(db), m_pantry(pantry), m_shopping(shopping), m_options(options) {}

bool InventoryManager::restock(int pantryId, double qty, const QString &unit,
                               const QDate &date, const QString &reference) {
    if (!m_db.transaction()) return false;
    if (!addStock(pantryId, qty, unit, date, reference)) {
        m_db.rollback();
        return false;
    }
    if (!m_db.commit()) {
        m_db.rollback();
        return false;
    }
    return true;
}

bool InventoryManager::addStock(int pantryId, double qty, const QString &unit,
                                const QDate &date, const QString &reference) {
    PantryItem item;
    if (!m_pantry.load(pantryId, item)) return false;
    if (!item.isValid()) {
        qDebug() << "Cannot restock missing pantry item" << pantryId;
        return false;
    }

    double inc = qty;
    if (!unit.isEmpty() && !UnitConverter::sameUnit(unit, item.unit())) {
        if (!UnitConverter::isConvertible(unit, item.unit())) {
            qDebug() << "Cannot restock" << item.name() << "in" << unit
                     << "- pantry unit is" << item.unit();
            return false;
        }
        inc = UnitConverter::convert(qty, unit, item.unit());
    }

    // update stock
    item.setAmount(item.amount() + inc);
    if (!m_pantry.updateAmount(item.id(), item.amount())) return false;
    if (!m_pantry.ensureBaseline(item)) return false;

    // record movement, not fatal
    if (m_options.recordMovements) {
        m_pantry.recordMovement(Movement(date.isValid() ? date : QDate::currentDate(),
                                         Movement::RestockType, item.id(), inc, item.unit(),
                                         reference));
    }
    return true;
}

int InventoryManager::applyPurchase(int shoppingId, double qty, const QString &unit) {
    ShoppingListEntry entry;
    if (!m_shopping.entryById(shoppingId, entry)) return -1;
    if (!entry.isValid()) {
        qDebug() << "Shopping entry" << shoppingId << "not found";
        return -1;
    }
    if (!entry.isOpen()) {
        qDebug() << "Shopping entry" << shoppingId << "is already" << entry.status();
        return -1;
    }

    PantryItem item;
    if (entry.isLinked() && !m_pantry.load(entry.linkedPantryId(), item)) return -1;
    if (!item.isValid() && !m_pantry.findByNameBrand(entry.name(), entry.brand(), item))
        return -1;

    if (!m_db.transaction()) return -1;

    int pantryId = item.id();
    if (!item.isValid()) {
        PantryItem created(entry.name(), unit.isEmpty() ? entry.unit() : unit, 0.0);
        created.setBrand(entry.brand());
        created.setCategory(entry.category());
        created.setStore(entry.store());
        pantryId = m_pantry.addItem(created);
    }

    if (pantryId < 0
        || !addStock(pantryId, qty, unit, QDate::currentDate(),
                     QString("Shopping entry #%1").arg(shoppingId))
        || !m_shopping.closeEntry(shoppingId)) {
        qWarning() << "InventoryManager: purchase of shopping entry" << shoppingId
                   << "rolled back";
        m_db.rollback();
        return -1;
    }
    if (!m_db.commit()) {
        m_db.rollback();
        return -1;
    }

    if (!item.isValid())
        qDebug() << "Created pantry item" << entry.name() << "from shopping entry" << shoppingId;
    return pantryId;
}
