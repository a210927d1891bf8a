#ifndef SHOPPINGCOLUMNMAP_H
#define SHOPPINGCOLUMNMAP_H

#include <QString>
#include <QVector>

class DatabaseManager;
struct SyncOptions;

// Maps shopping list fields onto the columns a deployment's table actually has.
// Built once (detected or set by hand) and handed to ShoppingListMerger;
// fields without a column are dropped from every query.
class ShoppingColumnMap {
public:
    enum Field {
        Id,
        Name,
        Brand,
        Quantity,
        Unit,
        Category,
        Notes,
        Store,
        Status,
        LinkedPantryId,
        FieldCount
    };

    ShoppingColumnMap();
    explicit ShoppingColumnMap(const QString &table);

    // every field on its default column name
    static ShoppingColumnMap standard(const QString &table = QStringLiteral("shopping_list"));

    // reads PRAGMA table_info and picks the first known synonym per field;
    // returns an invalid map when the table cannot be inspected
    static ShoppingColumnMap detect(const DatabaseManager &db, const QString &table);

    // first of shopping_list, shopping_items that exists, or empty
    static QString findShoppingTable(const DatabaseManager &db);

    // detects the table named by options.shoppingTable, or the first found
    static ShoppingColumnMap fromOptions(const DatabaseManager &db, const SyncOptions &options);

    QString table() const;
    void setTable(const QString &table);

    QString column(Field field) const;
    void setColumn(Field field, const QString &column);
    void clearColumn(Field field);
    bool supports(Field field) const;

    // needs a table and a row id to update matches
    bool isValid() const;

    static QString fieldName(Field field);

private:
    QString m_table;
    QVector<QString> m_columns;
};

#endif // SHOPPINGCOLUMNMAP_H
