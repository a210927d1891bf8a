#include "ShoppingColumnMap.h"
#include "DatabaseManager.h"
#include "SyncOptions.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QStringList>
#include <QSet>
#include <QDebug>

namespace {

// candidate column names per field, most specific first
QStringList synonyms(ShoppingColumnMap::Field field) {
    switch (field) {
    case ShoppingColumnMap::Id:             return {"id", "rowid"};
    case ShoppingColumnMap::Name:           return {"name", "item", "title"};
    case ShoppingColumnMap::Brand:          return {"brand"};
    case ShoppingColumnMap::Quantity:       return {"quantity", "qty", "amount", "count"};
    case ShoppingColumnMap::Unit:           return {"unit", "units"};
    case ShoppingColumnMap::Category:       return {"category", "cat"};
    case ShoppingColumnMap::Notes:          return {"notes", "note", "description", "desc"};
    case ShoppingColumnMap::Store:          return {"store", "shop", "market"};
    case ShoppingColumnMap::Status:         return {"status", "state"};
    case ShoppingColumnMap::LinkedPantryId: return {"linked_pantry_id", "pantry_id", "source_id"};
    case ShoppingColumnMap::FieldCount:     break;
    }
    return {};
}

} // namespace

ShoppingColumnMap::ShoppingColumnMap()
    : m_columns(FieldCount) {}

ShoppingColumnMap::ShoppingColumnMap(const QString &table)
    : m_table(table), m_columns(FieldCount) {}

ShoppingColumnMap ShoppingColumnMap::standard(const QString &table) {
    ShoppingColumnMap map(table);
    for (int f = 0; f < FieldCount; ++f)
        map.setColumn(static_cast<Field>(f), synonyms(static_cast<Field>(f)).first());
    return map;
}

ShoppingColumnMap ShoppingColumnMap::detect(const DatabaseManager &db, const QString &table) {
    QSqlDatabase conn = db.database();
    if (!conn.isOpen() || table.isEmpty()) return ShoppingColumnMap();

    QSqlQuery query(conn);
    if (!query.exec(QString("PRAGMA table_info(%1)").arg(table))) {
        qWarning() << "Failed to inspect shopping table" << table << query.lastError().text();
        return ShoppingColumnMap();
    }

    QSet<QString> columns;
    while (query.next())
        columns.insert(query.value(1).toString().toLower());
    if (columns.isEmpty()) {
        qWarning() << "Shopping table" << table << "does not exist";
        return ShoppingColumnMap();
    }
    // every rowid table can be addressed by rowid
    columns.insert("rowid");

    ShoppingColumnMap map(table);
    for (int f = 0; f < FieldCount; ++f) {
        const Field field = static_cast<Field>(f);
        for (const QString &candidate : synonyms(field)) {
            if (columns.contains(candidate)) {
                map.setColumn(field, candidate);
                break;
            }
        }
    }

    QStringList missing;
    for (int f = 0; f < FieldCount; ++f) {
        if (!map.supports(static_cast<Field>(f)))
            missing << fieldName(static_cast<Field>(f));
    }
    if (!missing.isEmpty())
        qDebug() << "ShoppingColumnMap:" << table << "has no column for" << missing.join(", ");
    return map;
}

QString ShoppingColumnMap::findShoppingTable(const DatabaseManager &db) {
    for (const char *name : {"shopping_list", "shopping_items"}) {
        if (db.hasTable(name)) return QString::fromLatin1(name);
    }
    return QString();
}

ShoppingColumnMap ShoppingColumnMap::fromOptions(const DatabaseManager &db,
                                                 const SyncOptions &options) {
    const QString table = options.shoppingTable.isEmpty() ? findShoppingTable(db)
                                                          : options.shoppingTable;
    if (table.isEmpty()) {
        qWarning() << "ShoppingColumnMap: no shopping table in database";
        return ShoppingColumnMap();
    }
    return detect(db, table);
}

QString ShoppingColumnMap::table() const { return m_table; }
void ShoppingColumnMap::setTable(const QString &table) { m_table = table; }

QString ShoppingColumnMap::column(Field field) const {
    if (field < 0 || field >= FieldCount) return QString();
    return m_columns.at(field);
}

void ShoppingColumnMap::setColumn(Field field, const QString &column) {
    if (field < 0 || field >= FieldCount) return;
    m_columns[field] = column;
}

void ShoppingColumnMap::clearColumn(Field field) {
    setColumn(field, QString());
}

bool ShoppingColumnMap::supports(Field field) const {
    return !column(field).isEmpty();
}

bool ShoppingColumnMap::isValid() const {
    return !m_table.isEmpty() && supports(Id);
}

QString ShoppingColumnMap::fieldName(Field field) {
    switch (field) {
    case Id:             return QStringLiteral("id");
    case Name:           return QStringLiteral("name");
    case Brand:          return QStringLiteral("brand");
    case Quantity:       return QStringLiteral("quantity");
    case Unit:           return QStringLiteral("unit");
    case Category:       return QStringLiteral("category");
    case Notes:          return QStringLiteral("notes");
    case Store:          return QStringLiteral("store");
    case Status:         return QStringLiteral("status");
    case LinkedPantryId: return QStringLiteral("linked_pantry_id");
    case FieldCount:     break;
    }
    return QString();
}
