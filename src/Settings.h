#ifndef SETTINGS_H
#define SETTINGS_H

#include <QString>
#include <QVariant>

class DatabaseManager;

// Key/value application settings stored in the app_settings table.
// Readers fall back to the default when the key is missing or unreadable.
class Settings {
public:
    explicit Settings(DatabaseManager &db);

    QString value(const QString &key, const QString &defaultValue = QString()) const;
    bool setValue(const QString &key, const QVariant &value);
    bool remove(const QString &key);

    bool boolValue(const QString &key, bool defaultValue = false) const;
    int intValue(const QString &key, int defaultValue = 0) const;
    double doubleValue(const QString &key, double defaultValue = 0.0) const;

private:
    bool lookup(const QString &key, QString &out) const;

    DatabaseManager &m_db;
};

#endif // SETTINGS_H
