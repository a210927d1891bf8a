#include "Settings.h"
#include "DatabaseManager.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QDebug>

Settings::Settings(DatabaseManager &db)
    : m_db(db) {}

bool Settings::lookup(const QString &key, QString &out) const {
    QSqlDatabase db = m_db.database();
    if (!db.isOpen()) return false;

    QSqlQuery query(db);
    query.prepare("SELECT value FROM app_settings WHERE key = :key");
    query.bindValue(":key", key);
    if (!query.exec()) {
        qWarning() << "Failed to read setting" << key << query.lastError().text();
        return false;
    }
    if (!query.next()) return false;
    out = query.value(0).toString();
    return true;
}

QString Settings::value(const QString &key, const QString &defaultValue) const {
    QString out;
    return lookup(key, out) ? out : defaultValue;
}

bool Settings::setValue(const QString &key, const QVariant &value) {
    QSqlDatabase db = m_db.database();
    if (!db.isOpen()) return false;

    QSqlQuery query(db);
    query.prepare("INSERT INTO app_settings(key, value) VALUES(:key, :value) "
                  "ON CONFLICT(key) DO UPDATE SET value = excluded.value");
    query.bindValue(":key", key);
    query.bindValue(":value", value.isNull() ? QString("") : value.toString());
    if (!query.exec()) {
        qWarning() << "Failed to store setting" << key << query.lastError().text();
        return false;
    }
    return true;
}

bool Settings::remove(const QString &key) {
    QSqlDatabase db = m_db.database();
    if (!db.isOpen()) return false;

    QSqlQuery query(db);
    query.prepare("DELETE FROM app_settings WHERE key = :key");
    query.bindValue(":key", key);
    if (!query.exec()) {
        qWarning() << "Failed to remove setting" << key << query.lastError().text();
        return false;
    }
    return true;
}

bool Settings::boolValue(const QString &key, bool defaultValue) const {
    QString raw;
    if (!lookup(key, raw)) return defaultValue;

    const QString v = raw.trimmed().toLower();
    if (v == "1" || v == "true" || v == "t" || v == "yes" || v == "y" || v == "on")
        return true;
    if (v == "0" || v == "false" || v == "f" || v == "no" || v == "n" || v == "off")
        return false;
    return defaultValue;
}

int Settings::intValue(const QString &key, int defaultValue) const {
    QString raw;
    if (!lookup(key, raw)) return defaultValue;
    bool ok = false;
    const int v = raw.trimmed().toInt(&ok);
    return ok ? v : defaultValue;
}

double Settings::doubleValue(const QString &key, double defaultValue) const {
    QString raw;
    if (!lookup(key, raw)) return defaultValue;
    bool ok = false;
    const double v = raw.trimmed().toDouble(&ok);
    return ok ? v : defaultValue;
}
