// rbx-cli: edits the attribute rating bands held in a directory of
// extracted object dumps (<name>.json per object).
//
//   rbx-cli --store DIR show
//   rbx-cli --store DIR set-boundary INDEX VALUE
//   rbx-cli --store DIR insert | remove INDEX
//   rbx-cli --store DIR set-color INDEX #RRGGBB[AA]
//   rbx-cli --store DIR highlight on|off
//   rbx-cli --store DIR backup | restore [BACKUP]

#include "backupmanager.h"
#include "colorcodec.h"
#include "core.h"
#include "objectstore.h"
#include "session.h"
#include "settings.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <cstdio>

using namespace rbx;

namespace {

int report(const EditResult& r) {
    if (r.ok) return 0;
    fprintf(stderr, "[rbx-cli] %s: %s\n", errorKindName(r.kind), r.error.toUtf8().constData());
    return 1;
}

int usage(const QString& msg) {
    fprintf(stderr, "[rbx-cli] %s\n", msg.toUtf8().constData());
    return 2;
}

bool parseIndex(const QString& s, int* out) {
    bool ok = false;
    *out = s.toInt(&ok);
    return ok;
}

void printTable(const EditSession& session) {
    const RangeTable* t = session.table();
    for (const auto& e : t->reservedEntries())
        printf("  -   %-3d %-40s %s (reserved)\n", e.boundary,
               e.label.toUtf8().constData(), rgbaToHex(e.color).toUtf8().constData());
    auto ranges = t->ranges();
    for (int i = 0; i < t->editableCount(); i++) {
        const RangeEntry& e = t->entry(i);
        QString span = QStringLiteral("%1-%2").arg(ranges[i].first).arg(ranges[i].second);
        printf("  %-3d %-6s %-37s %s\n", i, span.toUtf8().constData(),
               e.label.toUtf8().constData(), rgbaToHex(e.color).toUtf8().constData());
    }
    printf("highlight: %s\n", session.highlightEnabled() ? "on" : "off");
    if (session.colorFallbackApplied())
        printf("warning: colour preset could not be read, colours defaulted to white\n");
}

QStringList objectFiles(const JsonDirStore& store, const EditSession& session) {
    QStringList paths;
    for (const QString& name : session.objectNames())
        paths << store.pathFor(name);
    return paths;
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("rbx-cli"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Edit attribute rating bands and colours."));
    parser.addHelpOption();
    QCommandLineOption storeOpt(QStringLiteral("store"),
        QStringLiteral("Directory holding the extracted object dumps."), QStringLiteral("dir"));
    QCommandLineOption rememberOpt(QStringLiteral("remember"),
        QStringLiteral("Persist --store as the default directory."));
    parser.addOption(storeOpt);
    parser.addOption(rememberOpt);
    parser.addPositionalArgument(QStringLiteral("command"),
        QStringLiteral("show | set-boundary | insert | remove | set-color | highlight | backup | restore"));
    parser.process(app);

    AppSettings settings = AppSettings::load();
    if (parser.isSet(storeOpt)) {
        settings.storeDir = parser.value(storeOpt);
        if (parser.isSet(rememberOpt)) settings.save();
    }
    if (settings.storeDir.isEmpty())
        return usage(QStringLiteral("no store directory; pass --store DIR"));

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty())
        return usage(QStringLiteral("missing command"));
    const QString cmd = args.first();

    JsonDirStore store(settings.storeDir);
    BackupManager backups(settings.storeDir);

    // restore works on files and needs no loadable session
    if (cmd == QLatin1String("restore")) {
        QStringList names = {QString::fromLatin1(kRangeCollectionName), QString::fromLatin1(kColorPresetName),
                             QString::fromLatin1(kHighlightName), QString::fromLatin1(kHighlightNoBorderName)};
        if (args.size() > 1) {
            QString backup = args.at(1);
            QString file = QFileInfo(backup).completeBaseName();
            return report(backups.restoreBackup(backup, QDir(settings.storeDir).filePath(file)));
        }
        int restored = 0;
        for (const QString& name : names) {
            QString file = QFileInfo(store.pathFor(name)).fileName();
            QString original = backups.originalBackup(file);
            if (original.isEmpty()) continue;
            if (int rc = report(backups.restoreBackup(original, store.pathFor(name)))) return rc;
            restored++;
        }
        if (restored == 0)
            return usage(QStringLiteral("no original backups in %1").arg(backups.backupDir()));
        printf("restored %d object(s) from original backups\n", restored);
        return 0;
    }

    EditSession session(settings.customLabelPrefix);
    if (int rc = report(session.load(store))) return rc;

    if (settings.createOriginalBackups) {
        bool created = false;
        if (int rc = report(backups.createBackups(objectFiles(store, session), true, nullptr, &created)))
            return rc;
        if (created) printf("original backups created in %s\n", backups.backupDir().toUtf8().constData());
    }

    RangeTable* table = session.table();
    int index = 0;

    if (cmd == QLatin1String("show")) {
        printTable(session);
        return 0;
    } else if (cmd == QLatin1String("backup")) {
        QStringList written;
        if (int rc = report(backups.createBackups(objectFiles(store, session), false, &written))) return rc;
        for (const QString& p : written) printf("%s\n", p.toUtf8().constData());
        return 0;
    } else if (cmd == QLatin1String("set-boundary")) {
        int value = 0;
        if (args.size() < 3 || !parseIndex(args.at(1), &index) || !parseIndex(args.at(2), &value))
            return usage(QStringLiteral("usage: set-boundary INDEX VALUE"));
        if (int rc = report(table->setBoundary(index, value))) return rc;
    } else if (cmd == QLatin1String("insert")) {
        if (int rc = report(session.insertRange())) return rc;
    } else if (cmd == QLatin1String("remove")) {
        if (args.size() < 2 || !parseIndex(args.at(1), &index))
            return usage(QStringLiteral("usage: remove INDEX"));
        if (int rc = report(table->removeAt(index))) return rc;
    } else if (cmd == QLatin1String("set-color")) {
        bool ok = false;
        if (args.size() < 3 || !parseIndex(args.at(1), &index))
            return usage(QStringLiteral("usage: set-color INDEX #RRGGBB[AA]"));
        Rgba c = hexToRgba(args.at(2), &ok);
        if (!ok) return usage(QStringLiteral("invalid colour '%1'").arg(args.at(2)));
        if (int rc = report(table->setColor(index, c))) return rc;
    } else if (cmd == QLatin1String("highlight")) {
        QString state = args.value(1);
        if (state != QLatin1String("on") && state != QLatin1String("off"))
            return usage(QStringLiteral("usage: highlight on|off"));
        if (!session.hasHighlight())
            return usage(QStringLiteral("no highlight collection in %1").arg(settings.storeDir));
        session.setHighlightEnabled(state == QLatin1String("on"));
    } else {
        return usage(QStringLiteral("unknown command '%1'").arg(cmd));
    }

    if (int rc = report(session.save(store))) return rc;
    printTable(session);
    return 0;
}
