#ifndef SHOPPINGLISTENTRY_H
#define SHOPPINGLISTENTRY_H

#include <QString>

// Line of the shopping list, optionally linked back to a pantry item
class ShoppingListEntry {
public:
    static const char *const PendingStatus;
    static const char *const PurchasedStatus;

    ShoppingListEntry();
    ShoppingListEntry(const QString &name, double quantity, const QString &unit,
                      int linkedPantryId = 0);

    int id() const;
    void setId(int id);
    bool isValid() const;

    QString name() const;
    void setName(const QString &name);

    QString brand() const;
    void setBrand(const QString &brand);

    double quantity() const;
    void setQuantity(double quantity);

    QString unit() const;
    void setUnit(const QString &unit);

    QString category() const;
    void setCategory(const QString &category);

    QString notes() const;
    void setNotes(const QString &notes);

    QString store() const;
    void setStore(const QString &store);

    QString status() const;
    void setStatus(const QString &status);
    // pending, empty or unset
    bool isOpen() const;

    int linkedPantryId() const;
    void setLinkedPantryId(int pantryId);
    bool isLinked() const;

private:
    int m_id;
    QString m_name;
    QString m_brand;
    double m_quantity;
    QString m_unit;
    QString m_category;
    QString m_notes;
    QString m_store;
    QString m_status;
    int m_linkedPantryId;
};

#endif // SHOPPINGLISTENTRY_H
