#include "PantryItem.h"

PantryItem::PantryItem()
    : m_id(0), m_amount(0), m_baseAmount(0), m_hasBaseAmount(false), m_threshold(0) {}

PantryItem::PantryItem(const QString &name, const QString &unit, double amount,
                       double threshold, const QString &brand)
    : m_id(0), m_name(name), m_brand(brand), m_unit(unit), m_amount(amount),
      m_baseAmount(0), m_hasBaseAmount(false), m_threshold(threshold) {}

int PantryItem::id() const { return m_id; }
void PantryItem::setId(int id) { m_id = id; }
bool PantryItem::isValid() const { return m_id > 0; }

QString PantryItem::name() const { return m_name; }
void PantryItem::setName(const QString &name) { m_name = name; }

QString PantryItem::brand() const { return m_brand; }
void PantryItem::setBrand(const QString &brand) { m_brand = brand; }

QString PantryItem::category() const { return m_category; }
void PantryItem::setCategory(const QString &category) { m_category = category; }

QString PantryItem::store() const { return m_store; }
void PantryItem::setStore(const QString &store) { m_store = store; }

QString PantryItem::unit() const { return m_unit; }
void PantryItem::setUnit(const QString &unit) { m_unit = unit; }

double PantryItem::amount() const { return m_amount; }
void PantryItem::setAmount(double amount) { m_amount = amount; }

bool PantryItem::hasBaseAmount() const { return m_hasBaseAmount; }
double PantryItem::baseAmount() const { return m_hasBaseAmount ? m_baseAmount : 0.0; }

void PantryItem::setBaseAmount(double baseAmount) {
    m_baseAmount = baseAmount;
    m_hasBaseAmount = true;
}

void PantryItem::clearBaseAmount() {
    m_baseAmount = 0;
    m_hasBaseAmount = false;
}

double PantryItem::threshold() const { return m_threshold; }
void PantryItem::setThreshold(double threshold) { m_threshold = threshold; }

QString PantryItem::notes() const { return m_notes; }
void PantryItem::setNotes(const QString &notes) { m_notes = notes; }

double PantryItem::effectiveThreshold() const {
    if (m_threshold <= 0) return 0.0;
    if (m_threshold <= 1.0) return baseAmount() * m_threshold;
    return m_threshold;
}

bool PantryItem::needsReplenishment() const {
    const double cutoff = effectiveThreshold();
    return cutoff > 0 && m_amount <= cutoff;
}

bool PantryItem::raiseBaseline() {
    if (m_hasBaseAmount && m_amount <= m_baseAmount) return false;
    setBaseAmount(m_amount);
    return true;
}
