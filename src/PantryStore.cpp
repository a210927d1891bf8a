#include "PantryStore.h"
#include "DatabaseManager.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QVariant>
#include <QDebug>

namespace {

const char *const SelectItem =
    "SELECT id, name, brand, category, store, unit, amount, base_amount, threshold, notes "
    "FROM pantry_items ";

PantryItem itemFromQuery(const QSqlQuery &query) {
    PantryItem item;
    item.setId(query.value(0).toInt());
    item.setName(query.value(1).toString());
    item.setBrand(query.value(2).toString());
    item.setCategory(query.value(3).toString());
    item.setStore(query.value(4).toString());
    item.setUnit(query.value(5).toString());
    item.setAmount(query.value(6).toDouble());
    if (!query.value(7).isNull())
        item.setBaseAmount(query.value(7).toDouble());
    item.setThreshold(query.value(8).toDouble());
    item.setNotes(query.value(9).toString());
    return item;
}

} // namespace

PantryStore::PantryStore(DatabaseManager &db)
    : m_db(db) {}

bool PantryStore::load(int id, PantryItem &item) const {
    item = PantryItem();
    QSqlDatabase db = m_db.database();
    if (!db.isOpen()) return false;

    QSqlQuery query(db);
    query.prepare(QString(SelectItem) + "WHERE id = :id");
    query.bindValue(":id", id);
    if (!query.exec()) {
        qWarning() << "Failed to load pantry item" << id << query.lastError().text();
        return false;
    }
    if (query.next())
        item = itemFromQuery(query);
    return true;
}

bool PantryStore::findByNameBrand(const QString &name, const QString &brand,
                                  PantryItem &item) const {
    item = PantryItem();
    QSqlDatabase db = m_db.database();
    if (!db.isOpen()) return false;

    QSqlQuery query(db);
    query.prepare(QString(SelectItem) +
                  "WHERE lower(trim(name)) = :name AND lower(trim(IFNULL(brand,''))) = :brand "
                  "ORDER BY id LIMIT 1");
    query.bindValue(":name", name.trimmed().toLower());
    query.bindValue(":brand", brand.trimmed().toLower());
    if (!query.exec()) {
        qWarning() << "Failed to look up pantry item" << name << query.lastError().text();
        return false;
    }
    if (query.next())
        item = itemFromQuery(query);
    return true;
}

bool PantryStore::lowStockItems(QVector<PantryItem> &items) const {
    items.clear();
    QSqlDatabase db = m_db.database();
    if (!db.isOpen()) return false;

    QSqlQuery query(db);
    if (!query.exec(QString(SelectItem) + "WHERE IFNULL(threshold, 0) > 0 ORDER BY name, id")) {
        qWarning() << "Failed to list pantry items:" << query.lastError().text();
        return false;
    }
    while (query.next()) {
        PantryItem item = itemFromQuery(query);
        if (item.needsReplenishment())
            items.append(item);
    }
    return true;
}

int PantryStore::addItem(const PantryItem &item) {
    QSqlDatabase db = m_db.database();
    if (!db.isOpen()) return -1;

    QSqlQuery query(db);
    query.prepare("INSERT INTO pantry_items(name, brand, category, store, unit, amount, "
                  "base_amount, threshold, notes) "
                  "VALUES(:name,:brand,:cat,:store,:unit,:amount,:base,:thr,:notes)");
    query.bindValue(":name", item.name());
    query.bindValue(":brand", item.brand());
    query.bindValue(":cat", item.category());
    query.bindValue(":store", item.store());
    query.bindValue(":unit", item.unit());
    query.bindValue(":amount", item.amount());
    query.bindValue(":base", item.hasBaseAmount() ? QVariant(item.baseAmount()) : QVariant());
    query.bindValue(":thr", item.threshold() > 0 ? QVariant(item.threshold()) : QVariant());
    query.bindValue(":notes", item.notes());
    if (!query.exec()) {
        qWarning() << "Failed to insert pantry item" << item.name() << query.lastError().text();
        return -1;
    }
    return query.lastInsertId().toInt();
}

bool PantryStore::updateAmount(int id, double amount) {
    QSqlDatabase db = m_db.database();
    if (!db.isOpen()) return false;

    QSqlQuery query(db);
    query.prepare("UPDATE pantry_items SET amount = :amount WHERE id = :id");
    query.bindValue(":amount", amount);
    query.bindValue(":id", id);
    if (!query.exec()) {
        qWarning() << "Failed to update amount of pantry item" << id << query.lastError().text();
        return false;
    }
    return true;
}

bool PantryStore::updateBaseAmount(int id, double baseAmount) {
    QSqlDatabase db = m_db.database();
    if (!db.isOpen()) return false;

    QSqlQuery query(db);
    query.prepare("UPDATE pantry_items SET base_amount = :base WHERE id = :id");
    query.bindValue(":base", baseAmount);
    query.bindValue(":id", id);
    if (!query.exec()) {
        qWarning() << "Failed to update baseline of pantry item" << id << query.lastError().text();
        return false;
    }
    return true;
}

bool PantryStore::ensureBaseline(PantryItem &item) {
    PantryItem updated = item;
    if (!updated.raiseBaseline()) return true;
    if (!updateBaseAmount(updated.id(), updated.baseAmount())) return false;

    qDebug() << "PantryStore: baseline of" << item.name() << "set to" << updated.baseAmount();
    item = updated;
    return true;
}

bool PantryStore::recordMovement(const Movement &movement) {
    QSqlDatabase db = m_db.database();
    if (!db.isOpen()) return false;

    QSqlQuery mov(db);
    mov.prepare("INSERT INTO pantry_movements(date,type,pantry_id,quantity,unit,reference) "
                "VALUES(:date,:type,:pid,:qty,:unit,:ref)");
    mov.bindValue(":date", movement.date().toString(Qt::ISODate));
    mov.bindValue(":type", static_cast<int>(movement.type()));
    mov.bindValue(":pid", movement.pantryId());
    mov.bindValue(":qty", movement.quantity());
    mov.bindValue(":unit", movement.unit());
    mov.bindValue(":ref", movement.reference());
    if (!mov.exec()) {
        qDebug() << "Failed to record movement for pantry item" << movement.pantryId()
                 << mov.lastError().text();
        return false;
    }
    return true;
}

bool PantryStore::movementsFor(int pantryId, QVector<Movement> &movements) const {
    movements.clear();
    QSqlDatabase db = m_db.database();
    if (!db.isOpen()) return false;

    QSqlQuery query(db);
    query.prepare("SELECT date, type, pantry_id, quantity, unit, reference "
                  "FROM pantry_movements WHERE pantry_id = :pid ORDER BY id");
    query.bindValue(":pid", pantryId);
    if (!query.exec()) {
        qWarning() << "Failed to read movements of pantry item" << pantryId
                   << query.lastError().text();
        return false;
    }
    while (query.next()) {
        movements.append(Movement(QDate::fromString(query.value(0).toString(), Qt::ISODate),
                                  static_cast<Movement::Type>(query.value(1).toInt()),
                                  query.value(2).toInt(), query.value(3).toDouble(),
                                  query.value(4).toString(), query.value(5).toString()));
    }
    return true;
}
