#include "Movement.h"

Movement::Movement()
    : m_type(ConsumptionType), m_pantryId(0), m_quantity(0) {}

Movement::Movement(const QDate &date, Type type, int pantryId, double quantity,
                   const QString &unit, const QString &reference)
    : m_date(date), m_type(type), m_pantryId(pantryId), m_quantity(quantity),
      m_unit(unit), m_reference(reference) {}

QDate Movement::date() const { return m_date; }
void Movement::setDate(const QDate &date) { m_date = date; }

Movement::Type Movement::type() const { return m_type; }
void Movement::setType(Type type) { m_type = type; }

int Movement::pantryId() const { return m_pantryId; }
void Movement::setPantryId(int pantryId) { m_pantryId = pantryId; }

double Movement::quantity() const { return m_quantity; }
void Movement::setQuantity(double quantity) { m_quantity = quantity; }

QString Movement::unit() const { return m_unit; }
void Movement::setUnit(const QString &unit) { m_unit = unit; }

QString Movement::reference() const { return m_reference; }
void Movement::setReference(const QString &reference) { m_reference = reference; }
