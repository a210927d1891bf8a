#ifndef MOVEMENT_H
#define MOVEMENT_H

#include <QString>
#include <QDate>

// Journal row for a change of a pantry item's amount
class Movement {
public:
    enum Type { ConsumptionType, RestockType, AdjustmentType };

    Movement();
    Movement(const QDate &date, Type type, int pantryId, double quantity,
             const QString &unit, const QString &reference);

    QDate date() const;
    void setDate(const QDate &date);

    Type type() const;
    void setType(Type type);

    int pantryId() const;
    void setPantryId(int pantryId);

    // signed, negative for consumption
    double quantity() const;
    void setQuantity(double quantity);

    QString unit() const;
    void setUnit(const QString &unit);

    QString reference() const;
    void setReference(const QString &reference);

private:
    QDate m_date;
    Type m_type;
    int m_pantryId;
    double m_quantity;
    QString m_unit;
    QString m_reference;
};

#endif // MOVEMENT_H
