#pragma once
#include "core.h"
#include <QObject>
#include <QPair>
#include <QVector>

namespace rbx {

// ── RangeTable ──
//
// Reserved bands first (kept verbatim), then the editable bands. Editable
// boundaries strictly increase and the last one is pinned to kTopBoundary.
// Every index taken by the public API is an editable index.

class RangeTable : public QObject {
    Q_OBJECT
public:
    explicit RangeTable(QObject* parent = nullptr);

    // Replaces the whole table. `entries` holds the reserved bands first.
    EditResult load(const QVector<RangeEntry>& entries);

    EditResult setBoundary(int index, int value);
    // The hint is clamped into the gap below the entry at `index`; neighbours
    // only move when that gap is empty.
    EditResult insertAt(int index, int boundaryHint, const QString& label, const Rgba& color);
    EditResult removeAt(int index);
    EditResult setColor(int index, const Rgba& color);

    int impliedMinimum(int index) const;

    int  editableCount() const { return m_entries.size(); }
    bool isEmpty() const { return m_entries.isEmpty(); }
    bool canInsert() const { return m_entries.size() < kMaxEditable; }
    bool canRemove() const { return m_entries.size() > kMinEditable; }

    const RangeEntry& entry(int index) const { return m_entries[index]; }
    const QVector<RangeEntry>& entries() const { return m_entries; }
    const QVector<RangeEntry>& reservedEntries() const { return m_reserved; }
    QVector<RangeEntry> allEntries() const { return m_reserved + m_entries; }

    QVector<int> boundaries() const;
    QStringList  labels() const;
    QVector<Rgba> colors() const;
    // Inclusive (min, max) per editable band, for display.
    QVector<QPair<int, int>> ranges() const;

signals:
    void thresholdsChanged(const QVector<int>& boundaries);
    void colorsChanged();
    void rowCountChanged(int editableCount);

private:
    int  lastIndex() const { return m_entries.size() - 1; }
    // Largest boundary at `index` that leaves one value per later band.
    int  maximumFor(int index) const { return kTopBoundary - (lastIndex() - index); }
    bool validIndex(int index) const { return index >= 0 && index < m_entries.size(); }

    void pushSuccessors(int index);
    void settleBackward(int index);
    void settleForward(int index);
    void pinLast();

    QVector<RangeEntry> m_reserved;
    QVector<RangeEntry> m_entries;
};

} // namespace rbx
