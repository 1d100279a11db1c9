#include "backupmanager.h"
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <algorithm>

namespace rbx {

BackupManager::BackupManager(const QString& containerDir)
    : m_backupDir(QDir(containerDir).filePath(QStringLiteral("backup"))) {}

QString BackupManager::currentTimestamp() {
    return QDateTime::currentDateTime().toString(QStringLiteral("yyyyMMdd_HHmmss"));
}

bool BackupManager::ensureBackupDir() const {
    return QDir().mkpath(m_backupDir);
}

// ── Create ──

EditResult BackupManager::createBackup(const QString& path, bool original,
                                       QString* backupPath, bool* created,
                                       const QString& timestamp) {
    if (created) *created = false;

    QFileInfo source(path);
    QString suffix = original ? QStringLiteral("original")
                              : (timestamp.isEmpty() ? currentTimestamp() : timestamp);
    QString target = QDir(m_backupDir).filePath(source.fileName() + QLatin1Char('.') + suffix);
    if (backupPath) *backupPath = target;

    if (original && QFileInfo::exists(target))
        return EditResult::success();

    if (!source.isFile())
        return EditResult::failure(ErrorKind::NotFound,
            QStringLiteral("container file not found: %1").arg(path));
    if (!ensureBackupDir())
        return EditResult::failure(ErrorKind::Io,
            QStringLiteral("cannot create backup directory %1").arg(m_backupDir));

    if (QFileInfo::exists(target))
        QFile::remove(target);
    if (!QFile::copy(path, target)) {
        qWarning() << "BackupManager: copy failed" << path << "->" << target;
        return EditResult::failure(ErrorKind::Io,
            QStringLiteral("cannot copy %1 to %2").arg(path, target));
    }

    if (created) *created = true;
    qDebug() << "BackupManager: backed up" << source.fileName() << "->" << target;
    return EditResult::success();
}

EditResult BackupManager::createBackups(const QStringList& paths, bool original,
                                        QStringList* backupPaths, bool* anyCreated,
                                        const QString& timestamp) {
    QString stamp = timestamp.isEmpty() ? currentTimestamp() : timestamp;
    QStringList written;
    bool any = false;

    for (const QString& path : paths) {
        QString out;
        bool created = false;
        EditResult r = createBackup(path, original, &out, &created, stamp);
        if (!r.ok) return r;
        written.append(out);
        any = any || created;
    }

    if (backupPaths) *backupPaths = written;
    if (anyCreated) *anyCreated = any;
    return EditResult::success();
}

// ── Query ──

QString BackupManager::originalBackup(const QString& fileName) const {
    QString path = QDir(m_backupDir).filePath(fileName + QStringLiteral(".original"));
    return QFileInfo::exists(path) ? path : QString();
}

QStringList BackupManager::listBackups(const QString& fileName) const {
    QDir dir(m_backupDir);
    if (!dir.exists()) return {};

    QFileInfoList files = dir.entryInfoList(QDir::Files);
    if (!fileName.isEmpty()) {
        QString prefix = fileName + QLatin1Char('.');
        files.erase(std::remove_if(files.begin(), files.end(), [&](const QFileInfo& fi) {
            return !fi.fileName().startsWith(prefix);
        }), files.end());
    }

    // Newest first; equal times fall back to the name, which embeds the timestamp.
    std::sort(files.begin(), files.end(), [](const QFileInfo& a, const QFileInfo& b) {
        QDateTime ta = a.lastModified(), tb = b.lastModified();
        if (ta != tb) return ta > tb;
        return a.fileName() > b.fileName();
    });

    QStringList out;
    for (const auto& fi : files) out.append(fi.absoluteFilePath());
    return out;
}

QString BackupManager::latestBackup(const QString& fileName) const {
    QStringList all = listBackups(fileName);
    return all.isEmpty() ? QString() : all.first();
}

// ── Restore ──

EditResult BackupManager::restoreBackup(const QString& backupPath, const QString& targetPath) {
    if (!QFileInfo(backupPath).isFile())
        return EditResult::failure(ErrorKind::NotFound,
            QStringLiteral("backup not found: %1").arg(backupPath));

    if (QFileInfo::exists(targetPath) && !QFile::remove(targetPath)) {
        qWarning() << "BackupManager: cannot replace" << targetPath;
        return EditResult::failure(ErrorKind::Io,
            QStringLiteral("cannot replace %1").arg(targetPath));
    }
    if (!QFile::copy(backupPath, targetPath)) {
        qWarning() << "BackupManager: restore failed" << backupPath << "->" << targetPath;
        return EditResult::failure(ErrorKind::Io,
            QStringLiteral("cannot copy %1 to %2").arg(backupPath, targetPath));
    }
    qDebug() << "BackupManager: restored" << targetPath << "from" << backupPath;
    return EditResult::success();
}

} // namespace rbx
