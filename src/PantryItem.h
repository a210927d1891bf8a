#ifndef PANTRYITEM_H
#define PANTRYITEM_H

#include <QString>

// Represents a single item in the pantry
class PantryItem {
public:
    PantryItem();
    PantryItem(const QString &name, const QString &unit, double amount,
               double threshold = 0.0, const QString &brand = QString());

    // id <= 0 means the record was not loaded from the store
    int id() const;
    void setId(int id);
    bool isValid() const;

    QString name() const;
    void setName(const QString &name);

    QString brand() const;
    void setBrand(const QString &brand);

    QString category() const;
    void setCategory(const QString &category);

    QString store() const;
    void setStore(const QString &store);

    QString unit() const;
    void setUnit(const QString &unit);

    double amount() const;
    void setAmount(double amount);

    // highest amount on record, the 100% reference for ratio thresholds
    bool hasBaseAmount() const;
    double baseAmount() const;
    void setBaseAmount(double baseAmount);
    void clearBaseAmount();

    // (0, 1] is a fraction of baseAmount, > 1 an absolute amount, 0 disables
    double threshold() const;
    void setThreshold(double threshold);

    QString notes() const;
    void setNotes(const QString &notes);

    // absolute cutoff derived from threshold; 0 when the item is exempt
    double effectiveThreshold() const;
    bool needsReplenishment() const;

    // raises baseAmount to amount after a restock; true if it changed
    bool raiseBaseline();

private:
    int m_id;
    QString m_name;
    QString m_brand;
    QString m_category;
    QString m_store;
    QString m_unit;
    double m_amount;
    double m_baseAmount;
    bool m_hasBaseAmount;
    double m_threshold;
    QString m_notes;
};

#endif // PANTRYITEM_H
