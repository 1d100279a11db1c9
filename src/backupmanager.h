#pragma once
#include "core.h"
#include <QString>
#include <QStringList>

namespace rbx {

// ── BackupManager ──
//
// Copies container files into "<containerDir>/backup". An original backup
// is named "<file>.original" and is written at most once; other backups are
// "<file>.<yyyyMMdd_HHmmss>".

class BackupManager {
public:
    explicit BackupManager(const QString& containerDir);

    QString backupDir() const { return m_backupDir; }

    // `created` is false when an original backup already existed.
    EditResult createBackup(const QString& path, bool original,
                            QString* backupPath = nullptr, bool* created = nullptr,
                            const QString& timestamp = {});
    // One shared timestamp; stops at the first failure.
    EditResult createBackups(const QStringList& paths, bool original,
                             QStringList* backupPaths = nullptr, bool* anyCreated = nullptr,
                             const QString& timestamp = {});

    QString originalBackup(const QString& fileName) const;      // empty if none
    QStringList listBackups(const QString& fileName = {}) const; // newest first
    QString latestBackup(const QString& fileName) const;        // empty if none

    EditResult restoreBackup(const QString& backupPath, const QString& targetPath);

    static QString currentTimestamp();

private:
    bool ensureBackupDir() const;

    QString m_backupDir;
};

} // namespace rbx
