#include "ShoppingListEntry.h"

const char *const ShoppingListEntry::PendingStatus = "pending";
const char *const ShoppingListEntry::PurchasedStatus = "purchased";

ShoppingListEntry::ShoppingListEntry()
    : m_id(0), m_quantity(0), m_linkedPantryId(0) {}

ShoppingListEntry::ShoppingListEntry(const QString &name, double quantity,
                                     const QString &unit, int linkedPantryId)
    : m_id(0), m_name(name), m_quantity(quantity), m_unit(unit),
      m_linkedPantryId(linkedPantryId) {}

int ShoppingListEntry::id() const { return m_id; }
void ShoppingListEntry::setId(int id) { m_id = id; }
bool ShoppingListEntry::isValid() const { return m_id > 0; }

QString ShoppingListEntry::name() const { return m_name; }
void ShoppingListEntry::setName(const QString &name) { m_name = name; }

QString ShoppingListEntry::brand() const { return m_brand; }
void ShoppingListEntry::setBrand(const QString &brand) { m_brand = brand; }

double ShoppingListEntry::quantity() const { return m_quantity; }
void ShoppingListEntry::setQuantity(double quantity) { m_quantity = quantity; }

QString ShoppingListEntry::unit() const { return m_unit; }
void ShoppingListEntry::setUnit(const QString &unit) { m_unit = unit; }

QString ShoppingListEntry::category() const { return m_category; }
void ShoppingListEntry::setCategory(const QString &category) { m_category = category; }

QString ShoppingListEntry::notes() const { return m_notes; }
void ShoppingListEntry::setNotes(const QString &notes) { m_notes = notes; }

QString ShoppingListEntry::store() const { return m_store; }
void ShoppingListEntry::setStore(const QString &store) { m_store = store; }

QString ShoppingListEntry::status() const { return m_status; }
void ShoppingListEntry::setStatus(const QString &status) { m_status = status; }

bool ShoppingListEntry::isOpen() const {
    return m_status.isEmpty() || m_status == QLatin1String(PendingStatus);
}

int ShoppingListEntry::linkedPantryId() const { return m_linkedPantryId; }
void ShoppingListEntry::setLinkedPantryId(int pantryId) { m_linkedPantryId = pantryId; }
bool ShoppingListEntry::isLinked() const { return m_linkedPantryId > 0; }
