#include "ShoppingListMerger.h"
#include "DatabaseManager.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QStringList>
#include <QVariant>
#include <QDebug>

namespace {

const char *const OpenStatusCondition = "IFNULL(%1,'pending') IN ('pending','')";

ShoppingListEntry entryFromQuery(const QSqlQuery &query,
                                 const QVector<ShoppingColumnMap::Field> &fields) {
    ShoppingListEntry entry;
    for (int i = 0; i < fields.size(); ++i) {
        const QVariant v = query.value(i);
        switch (fields.at(i)) {
        case ShoppingColumnMap::Id:             entry.setId(v.toInt()); break;
        case ShoppingColumnMap::Name:           entry.setName(v.toString()); break;
        case ShoppingColumnMap::Brand:          entry.setBrand(v.toString()); break;
        case ShoppingColumnMap::Quantity:       entry.setQuantity(v.toDouble()); break;
        case ShoppingColumnMap::Unit:           entry.setUnit(v.toString()); break;
        case ShoppingColumnMap::Category:       entry.setCategory(v.toString()); break;
        case ShoppingColumnMap::Notes:          entry.setNotes(v.toString()); break;
        case ShoppingColumnMap::Store:          entry.setStore(v.toString()); break;
        case ShoppingColumnMap::Status:         entry.setStatus(v.toString()); break;
        case ShoppingColumnMap::LinkedPantryId: entry.setLinkedPantryId(v.toInt()); break;
        case ShoppingColumnMap::FieldCount:     break;
        }
    }
    return entry;
}

} // namespace

ShoppingListMerger::ShoppingListMerger(DatabaseManager &db, const ShoppingColumnMap &columns)
    : m_db(db), m_columns(columns) {}

const ShoppingColumnMap &ShoppingListMerger::columns() const {
    return m_columns;
}

QString ShoppingListMerger::selectClause(QVector<ShoppingColumnMap::Field> &fields) const {
    QStringList cols;
    fields.clear();
    for (int f = 0; f < ShoppingColumnMap::FieldCount; ++f) {
        const ShoppingColumnMap::Field field = static_cast<ShoppingColumnMap::Field>(f);
        if (!m_columns.supports(field)) continue;
        cols << m_columns.column(field);
        fields.append(field);
    }
    return QString("SELECT %1 FROM %2").arg(cols.join(", "), m_columns.table());
}

ShoppingListMerger::MergeResult ShoppingListMerger::mergeOrInsert(const ShoppingListEntry &candidate) {
    QSqlDatabase db = m_db.database();
    if (!db.isOpen() || !m_columns.isValid()) {
        qWarning() << "ShoppingListMerger: no usable shopping table";
        return Failed;
    }

    const QString idCol = m_columns.column(ShoppingColumnMap::Id);
    const QString qtyCol = m_columns.column(ShoppingColumnMap::Quantity);

    // match on the pantry link first, otherwise on name and unit
    QStringList wheres;
    QVariantList params;
    if (candidate.isLinked() && m_columns.supports(ShoppingColumnMap::LinkedPantryId)) {
        wheres << m_columns.column(ShoppingColumnMap::LinkedPantryId) + " = ?";
        params << candidate.linkedPantryId();
    } else if (m_columns.supports(ShoppingColumnMap::Name)) {
        wheres << m_columns.column(ShoppingColumnMap::Name) + " = ?";
        params << (candidate.name().isNull() ? QString("") : candidate.name());
        if (m_columns.supports(ShoppingColumnMap::Unit)) {
            wheres << QString("IFNULL(%1,'') = ?").arg(m_columns.column(ShoppingColumnMap::Unit));
            params << (candidate.unit().isNull() ? QString("") : candidate.unit());
        }
    }

    if (!wheres.isEmpty()) {
        if (m_columns.supports(ShoppingColumnMap::Status))
            wheres << QString(OpenStatusCondition).arg(m_columns.column(ShoppingColumnMap::Status));

        QString sql = QString("SELECT %1").arg(idCol);
        if (!qtyCol.isEmpty()) sql += ", " + qtyCol;
        sql += QString(" FROM %1 WHERE %2 ORDER BY %3 LIMIT 1")
                   .arg(m_columns.table(), wheres.join(" AND "), idCol);

        QSqlQuery find(db);
        find.prepare(sql);
        for (const QVariant &p : params) find.addBindValue(p);
        if (!find.exec()) {
            qWarning() << "Failed to look up shopping entry" << candidate.name()
                       << find.lastError().text();
            return Failed;
        }

        if (find.next()) {
            const int rowId = find.value(0).toInt();
            if (qtyCol.isEmpty()) return AlreadyListed;

            const QVariant current = find.value(1);
            bool ok = true;
            const double existing = current.isNull() ? 0.0 : current.toDouble(&ok);
            if (!ok) {
                qDebug() << "ShoppingListMerger: non-numeric quantity" << current.toString()
                         << "on entry" << rowId << "- left as is";
                return AlreadyListed;
            }
            find.finish();

            QSqlQuery upd(db);
            upd.prepare(QString("UPDATE %1 SET %2 = ? WHERE %3 = ?")
                            .arg(m_columns.table(), qtyCol, idCol));
            upd.addBindValue(existing + candidate.quantity());
            upd.addBindValue(rowId);
            if (!upd.exec()) {
                qWarning() << "Failed to increment shopping entry" << rowId
                           << upd.lastError().text();
                return Failed;
            }
            return Incremented;
        }
    }

    return insertEntry(candidate);
}

ShoppingListMerger::MergeResult ShoppingListMerger::insertEntry(const ShoppingListEntry &candidate) {
    QStringList cols;
    QVariantList values;
    auto put = [&](ShoppingColumnMap::Field field, const QVariant &value) {
        if (!m_columns.supports(field)) return;
        cols << m_columns.column(field);
        values << value;
    };

    put(ShoppingColumnMap::Name, candidate.name());
    put(ShoppingColumnMap::Brand, candidate.brand());
    put(ShoppingColumnMap::Quantity, candidate.quantity());
    put(ShoppingColumnMap::Unit, candidate.unit());
    put(ShoppingColumnMap::Category, candidate.category());
    put(ShoppingColumnMap::Notes, candidate.notes());
    put(ShoppingColumnMap::Store, candidate.store());
    put(ShoppingColumnMap::Status, candidate.status().isEmpty()
                                       ? QString::fromLatin1(ShoppingListEntry::PendingStatus)
                                       : candidate.status());
    if (candidate.isLinked())
        put(ShoppingColumnMap::LinkedPantryId, candidate.linkedPantryId());

    QSqlQuery ins(m_db.database());
    if (cols.isEmpty()) {
        ins.prepare(QString("INSERT INTO %1 DEFAULT VALUES").arg(m_columns.table()));
    } else {
        QStringList marks;
        for (int i = 0; i < cols.size(); ++i) marks << "?";
        ins.prepare(QString("INSERT INTO %1 (%2) VALUES (%3)")
                        .arg(m_columns.table(), cols.join(", "), marks.join(", ")));
        for (const QVariant &v : values) ins.addBindValue(v);
    }
    if (!ins.exec()) {
        qWarning() << "Failed to insert shopping entry" << candidate.name()
                   << ins.lastError().text();
        return Failed;
    }
    return Inserted;
}

bool ShoppingListMerger::openEntries(QVector<ShoppingListEntry> &entries) const {
    entries.clear();
    QSqlDatabase db = m_db.database();
    if (!db.isOpen() || !m_columns.isValid()) return false;

    QVector<ShoppingColumnMap::Field> fields;
    QString sql = selectClause(fields);
    if (m_columns.supports(ShoppingColumnMap::Status))
        sql += " WHERE " + QString(OpenStatusCondition).arg(m_columns.column(ShoppingColumnMap::Status));
    sql += " ORDER BY " + m_columns.column(ShoppingColumnMap::Id);

    QSqlQuery query(db);
    if (!query.exec(sql)) {
        qWarning() << "Failed to list shopping entries:" << query.lastError().text();
        return false;
    }
    while (query.next())
        entries.append(entryFromQuery(query, fields));
    return true;
}

bool ShoppingListMerger::entryById(int id, ShoppingListEntry &entry) const {
    entry = ShoppingListEntry();
    QSqlDatabase db = m_db.database();
    if (!db.isOpen() || !m_columns.isValid()) return false;

    QVector<ShoppingColumnMap::Field> fields;
    QSqlQuery query(db);
    query.prepare(selectClause(fields) +
                  QString(" WHERE %1 = ?").arg(m_columns.column(ShoppingColumnMap::Id)));
    query.addBindValue(id);
    if (!query.exec()) {
        qWarning() << "Failed to load shopping entry" << id << query.lastError().text();
        return false;
    }
    if (query.next())
        entry = entryFromQuery(query, fields);
    return true;
}

bool ShoppingListMerger::closeEntry(int id) {
    QSqlDatabase db = m_db.database();
    if (!db.isOpen() || !m_columns.isValid()) return false;

    const QString idCol = m_columns.column(ShoppingColumnMap::Id);
    QSqlQuery query(db);
    if (m_columns.supports(ShoppingColumnMap::Status)) {
        query.prepare(QString("UPDATE %1 SET %2 = ? WHERE %3 = ?")
                          .arg(m_columns.table(), m_columns.column(ShoppingColumnMap::Status), idCol));
        query.addBindValue(QString::fromLatin1(ShoppingListEntry::PurchasedStatus));
    } else {
        query.prepare(QString("DELETE FROM %1 WHERE %2 = ?").arg(m_columns.table(), idCol));
    }
    query.addBindValue(id);
    if (!query.exec()) {
        qWarning() << "Failed to close shopping entry" << id << query.lastError().text();
        return false;
    }
    return true;
}
