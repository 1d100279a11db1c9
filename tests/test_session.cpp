#include <QtTest/QTest>
#include <QSignalSpy>
#include "session.h"
#include "objectstore.h"
#include "structurecodec.h"
#include "fixtures.h"

using namespace rbx;

static const QString kPrefix = "attribute-colour-custom-";

static void fillStore(MemoryStore* store, bool withPreset = true, bool highlightOn = true) {
    store->writeObject(kRangeCollectionName,
        fixtures::rangeCollection(fixtures::defaultBoundaries(), fixtures::defaultLabels()));
    if (withPreset)
        store->writeObject(kColorPresetName,
            fixtures::colorPreset(fixtures::defaultColors(), fixtures::defaultLabels()));
    store->writeObject(kHighlightName, fixtures::highlightCollection(kHighlightName,
        highlightRows(HighlightVariant::Bordered, highlightOn)));
    store->writeObject(kHighlightNoBorderName, fixtures::highlightCollection(kHighlightNoBorderName,
        highlightRows(HighlightVariant::NoBorder, highlightOn)));
}

class TestSession : public QObject {
    Q_OBJECT
private slots:
    void loadBuildsTable() {
        MemoryStore store;
        fillStore(&store);
        EditSession s(kPrefix);
        EditResult r = s.load(store);
        QVERIFY2(r.ok, qPrintable(r.error));
        QVERIFY(s.isLoaded());

        QCOMPARE(s.table()->editableCount(), 4);
        QCOMPARE(s.table()->boundaries(), QVector<int>({5, 10, 15, 20}));
        QCOMPARE(s.table()->reservedEntries().size(), 2);
        QCOMPARE(s.table()->entry(0).label, QString("attribute-colour-poor"));
        QCOMPARE(s.table()->entry(0).color, fixtures::defaultColors()[2]);
        QCOMPARE(s.table()->reservedEntries()[1].color, fixtures::defaultColors()[1]);
        QVERIFY(s.highlightEnabled());
        QVERIFY(s.hasColorPreset());
        QVERIFY(!s.colorFallbackApplied());
        QCOMPARE(s.objectNames().size(), 4);
    }

    void loadReadsDisabledHighlight() {
        MemoryStore store;
        fillStore(&store, true, false);
        EditSession s(kPrefix);
        QSignalSpy spy(&s, &EditSession::highlightChanged);
        QVERIFY(s.load(store).ok);
        QVERIFY(!s.highlightEnabled());
        QCOMPARE(spy.count(), 1);
    }

    void loadRequiresRangeCollection() {
        MemoryStore store;
        EditSession s(kPrefix);
        EditResult r = s.load(store);
        QCOMPARE(r.kind, ErrorKind::NotFound);
        QVERIFY(!s.isLoaded());
    }

    void loadRejectsMalformedPreset() {
        MemoryStore store;
        fillStore(&store);
        Document bad = Document::object();
        bad.set("m_Rules", Document::list(QStringList{"x"}));
        store.writeObject(kColorPresetName, bad);

        EditSession s(kPrefix);
        EditResult r = s.load(store);
        QCOMPARE(r.kind, ErrorKind::Structure);
        QVERIFY(r.error.contains("root.m_Rules[0]"));
        QVERIFY(!s.isLoaded());
    }

    void loadWithoutPreset() {
        MemoryStore store;
        fillStore(&store, false);
        EditSession s(kPrefix);
        QVERIFY(s.load(store).ok);
        QVERIFY(!s.hasColorPreset());
        QCOMPARE(s.table()->colors(), QVector<Rgba>(4, Rgba::white()));
        QCOMPARE(s.objectNames().size(), 3);
    }

    void insertRangeUsesPrefixAndPreviousColour() {
        MemoryStore store;
        fillStore(&store);
        EditSession s(kPrefix);
        QVERIFY(s.load(store).ok);

        QVERIFY(s.insertRange().ok);
        QCOMPARE(s.table()->boundaries(), QVector<int>({5, 10, 15, 19, 20}));
        QCOMPARE(s.table()->entry(3).label, QString("attribute-colour-custom-1"));
        QCOMPARE(s.table()->entry(3).color, s.table()->entry(2).color);

        QVERIFY(s.insertRange().ok);
        QCOMPARE(s.table()->entry(4).label, QString("attribute-colour-custom-2"));
        QCOMPARE(s.table()->boundaries(), QVector<int>({5, 10, 15, 18, 19, 20}));
    }

    void insertRangeStopsAtCapacity() {
        MemoryStore store;
        fillStore(&store);
        EditSession s(kPrefix);
        QVERIFY(s.load(store).ok);
        for (int i = 0; i < 14; i++)
            QVERIFY(s.insertRange().ok);
        QCOMPARE(s.insertRange().kind, ErrorKind::Capacity);
    }

    void saveRoundTrip() {
        MemoryStore store;
        fillStore(&store);
        EditSession s(kPrefix);
        QVERIFY(s.load(store).ok);

        s.table()->setBoundary(0, 7);
        s.table()->setColor(1, Rgba{0.25f, 0.5f, 0.75f, 1.0f});
        s.insertRange();
        s.setHighlightEnabled(false);

        int before = store.writeCount();
        EditResult r = s.save(store);
        QVERIFY2(r.ok, qPrintable(r.error));
        QCOMPARE(store.writeCount(), before + 4);

        EditSession reloaded(kPrefix);
        QVERIFY(reloaded.load(store).ok);
        QCOMPARE(reloaded.table()->allEntries(), s.table()->allEntries());
        QVERIFY(!reloaded.highlightEnabled());

        // preset stays positionally bound to the full entry list
        Document preset;
        QVERIFY(store.readObject(kColorPresetName, &preset).ok);
        ColorPreset decoded;
        StructureError err;
        QVERIFY(codec::decodeColorPreset(preset, &decoded, &err));
        QCOMPARE(decoded.colors.size(), 7);
        QStringList labels;
        for (const auto& e : s.table()->allEntries()) labels << e.label;
        QCOMPARE(decoded.labels, labels);
        QCOMPARE(decoded.labels.at(5), QString("attribute-colour-custom-1"));
    }

    void saveWithoutPresetSkipsIt() {
        MemoryStore store;
        fillStore(&store, false);
        EditSession s(kPrefix);
        QVERIFY(s.load(store).ok);
        int before = store.writeCount();
        QVERIFY(s.save(store).ok);
        QCOMPARE(store.writeCount(), before + 3);
        QVERIFY(!store.contains(kColorPresetName));
    }

    void saveAbortsBatchOnInvalidObject() {
        MemoryStore store;
        fillStore(&store);
        EditSession s(kPrefix);
        QVERIFY(s.load(store).ok);
        s.table()->setBoundary(0, 9);

        // the stored preset is corrupted after load
        Document bad = Document::object();
        bad.set("m_Rules", Document::list(QStringList{"x"}));
        store.writeObject(kColorPresetName, bad);
        Document rangeBefore;
        store.readObject(kRangeCollectionName, &rangeBefore);

        int before = store.writeCount();
        EditResult r = s.save(store);
        QVERIFY(!r.ok);
        QCOMPARE(r.kind, ErrorKind::Structure);
        QCOMPARE(store.writeCount(), before);

        Document rangeAfter;
        store.readObject(kRangeCollectionName, &rangeAfter);
        QCOMPARE(rangeAfter, rangeBefore);
    }

    void saveBeforeLoad() {
        MemoryStore store;
        EditSession s(kPrefix);
        QCOMPARE(s.save(store).kind, ErrorKind::NotFound);
        QCOMPARE(s.insertRange().kind, ErrorKind::NotFound);
    }

    void highlightSignal() {
        EditSession s(kPrefix);
        QSignalSpy spy(&s, &EditSession::highlightChanged);
        s.setHighlightEnabled(true);
        QCOMPARE(spy.count(), 0);
        s.setHighlightEnabled(false);
        QCOMPARE(spy.count(), 1);
        QCOMPARE(spy.takeFirst().at(0).toBool(), false);
    }
};

QTEST_MAIN(TestSession)
#include "test_session.moc"
