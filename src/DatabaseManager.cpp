#include "DatabaseManager.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QDebug>

const char *const DatabaseManager::DefaultConnection = "pantrysync";

DatabaseManager::DatabaseManager() {
}

DatabaseManager::~DatabaseManager() {
    close();
}

bool DatabaseManager::open(const QString &fileName, const QString &connectionName) {
    if (m_db.isOpen()) return true;

    if (QSqlDatabase::contains(connectionName)) {
        qWarning() << "DatabaseManager: connection already in use:" << connectionName;
        return false;
    }

    m_connectionName = connectionName;
    m_db = QSqlDatabase::addDatabase("QSQLITE", m_connectionName);
    m_db.setDatabaseName(fileName);
    if (!m_db.open()) {
        qWarning() << "Failed to open database:" << m_db.lastError().text();
        close();
        return false;
    }

    QSqlQuery pragma(m_db);
    if (!pragma.exec("PRAGMA foreign_keys=ON")) {
        qDebug() << "Failed to enable foreign keys:" << pragma.lastError().text();
    }

    // ensure tables exist
    if (!createSchema() || !migrate()) {
        close();
        return false;
    }
    qDebug() << "DatabaseManager: opened" << fileName << "as" << m_connectionName;
    return true;
}

bool DatabaseManager::createSchema() {
    if (!m_db.isOpen()) return false;
    QSqlQuery query(m_db);
    const char *sql[] = {
        // Pantry stock
        "CREATE TABLE IF NOT EXISTS pantry_items("
        "id INTEGER PRIMARY KEY,"
        "name TEXT NOT NULL,"
        "brand TEXT,"
        "category TEXT,"
        "store TEXT,"
        "unit TEXT,"
        "amount REAL DEFAULT 0,"
        "base_amount REAL,"
        "threshold REAL,"
        "notes TEXT)",

        // Recipes and their ingredients
        "CREATE TABLE IF NOT EXISTS recipes("
        "id INTEGER PRIMARY KEY,"
        "title TEXT NOT NULL,"
        "servings INTEGER DEFAULT 0)",

        "CREATE TABLE IF NOT EXISTS recipe_ingredients("
        "id INTEGER PRIMARY KEY,"
        "recipe_id INTEGER,"
        "name TEXT,"
        "qty REAL DEFAULT 0,"
        "unit TEXT,"
        "linked_pantry_id INTEGER)",

        // Meal plan
        "CREATE TABLE IF NOT EXISTS menu_entries("
        "id INTEGER PRIMARY KEY,"
        "date TEXT,"
        "meal TEXT,"
        "recipe_id INTEGER,"
        "servings REAL DEFAULT 1,"
        "usage_applied INTEGER DEFAULT 0)",

        // Shopping list; older databases may carry a narrower table
        "CREATE TABLE IF NOT EXISTS shopping_list("
        "id INTEGER PRIMARY KEY,"
        "name TEXT NOT NULL,"
        "brand TEXT,"
        "quantity REAL DEFAULT 1.0,"
        "unit TEXT,"
        "category TEXT,"
        "notes TEXT,"
        "store TEXT,"
        "status TEXT DEFAULT 'pending',"
        "linked_pantry_id INTEGER,"
        "created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP)",

        // Stock movements
        "CREATE TABLE IF NOT EXISTS pantry_movements("
        "id INTEGER PRIMARY KEY,"
        "date DATE,"
        "type INTEGER,"
        "pantry_id INTEGER,"
        "quantity REAL,"
        "unit TEXT,"
        "reference TEXT)",

        // Settings
        "CREATE TABLE IF NOT EXISTS app_settings("
        "key TEXT PRIMARY KEY,"
        "value TEXT)",

        "CREATE INDEX IF NOT EXISTS idx_menu_date ON menu_entries(date)",
        "CREATE INDEX IF NOT EXISTS idx_ingredients_recipe ON recipe_ingredients(recipe_id)"
    };

    for (auto stmt : sql) {
        if (!query.exec(stmt)) {
            qWarning() << "Schema creation failed:" << query.lastError().text();
            return false;
        }
    }
    return true;
}

bool DatabaseManager::migrate() {
    if (!m_db.isOpen()) return false;
    return addColumnIfMissing("pantry_items", "base_amount REAL")
        && addColumnIfMissing("pantry_items", "threshold REAL")
        && addColumnIfMissing("pantry_items", "store TEXT")
        && addColumnIfMissing("recipe_ingredients", "linked_pantry_id INTEGER")
        && addColumnIfMissing("menu_entries", "servings REAL DEFAULT 1")
        && addColumnIfMissing("menu_entries", "usage_applied INTEGER DEFAULT 0");
}

bool DatabaseManager::addColumnIfMissing(const QString &table, const QString &columnDef) {
    const QString column = columnDef.section(' ', 0, 0);
    if (hasColumn(table, column)) return true;

    qDebug() << "DatabaseManager: adding column" << column << "to" << table;
    QSqlQuery query(m_db);
    if (!query.exec(QString("ALTER TABLE %1 ADD COLUMN %2").arg(table, columnDef))) {
        qWarning() << "Migration failed for" << table << column << query.lastError().text();
        return false;
    }
    return true;
}

bool DatabaseManager::hasTable(const QString &table) const {
    if (!m_db.isOpen()) return false;
    QSqlQuery query(m_db);
    query.prepare("SELECT 1 FROM sqlite_master WHERE type='table' AND name=:name COLLATE NOCASE");
    query.bindValue(":name", table);
    if (!query.exec()) {
        qWarning() << "Failed to look up table" << table << query.lastError().text();
        return false;
    }
    return query.next();
}

bool DatabaseManager::hasColumn(const QString &table, const QString &column) const {
    if (!m_db.isOpen()) return false;
    QSqlQuery query(m_db);
    if (!query.exec(QString("PRAGMA table_info(%1)").arg(table))) {
        qWarning() << "Failed to read columns of" << table << query.lastError().text();
        return false;
    }
    while (query.next()) {
        if (query.value(1).toString().compare(column, Qt::CaseInsensitive) == 0)
            return true;
    }
    return false;
}

bool DatabaseManager::transaction() {
    if (!m_db.transaction()) {
        qWarning() << "Failed to begin transaction:" << m_db.lastError().text();
        return false;
    }
    return true;
}

bool DatabaseManager::commit() {
    if (!m_db.commit()) {
        qWarning() << "Failed to commit transaction:" << m_db.lastError().text();
        return false;
    }
    return true;
}

bool DatabaseManager::rollback() {
    if (!m_db.rollback()) {
        qWarning() << "Failed to roll back transaction:" << m_db.lastError().text();
        return false;
    }
    return true;
}

void DatabaseManager::close() {
    if (m_connectionName.isEmpty()) return;
    if (m_db.isOpen()) {
        m_db.close();
    }
    // drop our handle before removing the connection
    m_db = QSqlDatabase();
    QSqlDatabase::removeDatabase(m_connectionName);
    m_connectionName.clear();
}

bool DatabaseManager::isOpen() const {
    return m_db.isOpen();
}

QSqlDatabase DatabaseManager::database() const {
    return m_db;
}

QString DatabaseManager::connectionName() const {
    return m_connectionName;
}
