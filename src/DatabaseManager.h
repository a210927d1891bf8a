#ifndef DATABASEMANAGER_H
#define DATABASEMANAGER_H

#include <QSqlDatabase>
#include <QString>

// Owns one named QSqlDatabase connection to the pantry database.
// Stores and the sync engine borrow it by reference.
class DatabaseManager {
public:
    static const char *const DefaultConnection;

    DatabaseManager();
    ~DatabaseManager();

    DatabaseManager(const DatabaseManager &) = delete;
    DatabaseManager &operator=(const DatabaseManager &) = delete;

    // fileName may be ":memory:"; creates and migrates the schema
    bool open(const QString &fileName,
              const QString &connectionName = QString::fromLatin1(DefaultConnection));
    void close();
    bool isOpen() const;

    QSqlDatabase database() const;
    QString connectionName() const;

    /// create required tables if they do not exist
    bool createSchema();
    /// add columns missing from databases created by older versions
    bool migrate();

    bool hasTable(const QString &table) const;
    bool hasColumn(const QString &table, const QString &column) const;

    bool transaction();
    bool commit();
    bool rollback();

private:
    bool addColumnIfMissing(const QString &table, const QString &columnDef);

    QSqlDatabase m_db;
    QString m_connectionName;
};

#endif // DATABASEMANAGER_H
