#include <QtTest/QTest>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include "backupmanager.h"

using namespace rbx;

static void writeFile(const QString& path, const QByteArray& data) {
    QFile f(path);
    QVERIFY(f.open(QIODevice::WriteOnly));
    f.write(data);
}

static QByteArray readFile(const QString& path) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) return {};
    return f.readAll();
}

class TestBackupManager : public QObject {
    Q_OBJECT
private slots:
    void originalWrittenOnce() {
        QTemporaryDir tmp;
        QString bundle = tmp.filePath("data.bundle");
        writeFile(bundle, "first");

        BackupManager mgr(tmp.path());
        QString path;
        bool created = false;
        QVERIFY(mgr.createBackup(bundle, true, &path, &created).ok);
        QVERIFY(created);
        QCOMPARE(path, QDir(tmp.path()).filePath("backup/data.bundle.original"));
        QCOMPARE(readFile(path), QByteArray("first"));

        writeFile(bundle, "second");
        QVERIFY(mgr.createBackup(bundle, true, &path, &created).ok);
        QVERIFY(!created);
        QCOMPARE(readFile(path), QByteArray("first"));
        QCOMPARE(mgr.originalBackup("data.bundle"), path);
    }

    void timestampedBackup() {
        QTemporaryDir tmp;
        QString bundle = tmp.filePath("style.bundle");
        writeFile(bundle, "v1");

        BackupManager mgr(tmp.path());
        QString path;
        QVERIFY(mgr.createBackup(bundle, false, &path, nullptr, "20260101_120000").ok);
        QCOMPARE(QFileInfo(path).fileName(), QString("style.bundle.20260101_120000"));
        QVERIFY(mgr.originalBackup("style.bundle").isEmpty());
    }

    void missingSource() {
        QTemporaryDir tmp;
        BackupManager mgr(tmp.path());
        bool created = true;
        EditResult r = mgr.createBackup(tmp.filePath("absent.bundle"), true, nullptr, &created);
        QCOMPARE(r.kind, ErrorKind::NotFound);
        QVERIFY(!created);
    }

    void createBackupsReportsAny() {
        QTemporaryDir tmp;
        QString a = tmp.filePath("a.bundle"), b = tmp.filePath("b.bundle");
        writeFile(a, "A");
        writeFile(b, "B");

        BackupManager mgr(tmp.path());
        QStringList written;
        bool any = false;
        QVERIFY(mgr.createBackups({a, b}, true, &written, &any).ok);
        QVERIFY(any);
        QCOMPARE(written.size(), 2);

        QVERIFY(mgr.createBackups({a, b}, true, &written, &any).ok);
        QVERIFY(!any);
    }

    void listAndLatest() {
        QTemporaryDir tmp;
        QString bundle = tmp.filePath("data.bundle");
        writeFile(bundle, "x");
        writeFile(tmp.filePath("other.bundle"), "y");

        BackupManager mgr(tmp.path());
        QVERIFY(mgr.listBackups().isEmpty());
        QVERIFY(mgr.latestBackup("data.bundle").isEmpty());

        QVERIFY(mgr.createBackup(bundle, false, nullptr, nullptr, "20250101_000000").ok);
        QVERIFY(mgr.createBackup(bundle, false, nullptr, nullptr, "20250102_000000").ok);
        QVERIFY(mgr.createBackup(tmp.filePath("other.bundle"), false, nullptr, nullptr, "20250103_000000").ok);

        QStringList mine = mgr.listBackups("data.bundle");
        QCOMPARE(mine.size(), 2);
        QCOMPARE(QFileInfo(mgr.latestBackup("data.bundle")).fileName(),
                 QString("data.bundle.20250102_000000"));
        QCOMPARE(mgr.listBackups().size(), 3);
    }

    void restore() {
        QTemporaryDir tmp;
        QString bundle = tmp.filePath("data.bundle");
        writeFile(bundle, "pristine");

        BackupManager mgr(tmp.path());
        QString original;
        QVERIFY(mgr.createBackup(bundle, true, &original).ok);
        writeFile(bundle, "modified");

        QVERIFY(mgr.restoreBackup(original, bundle).ok);
        QCOMPARE(readFile(bundle), QByteArray("pristine"));

        QCOMPARE(mgr.restoreBackup(tmp.filePath("backup/none"), bundle).kind, ErrorKind::NotFound);
        QCOMPARE(readFile(bundle), QByteArray("pristine"));
    }
};

QTEST_MAIN(TestBackupManager)
#include "test_backupmanager.moc"
