#include "rangetable.h"

namespace rbx {

RangeTable::RangeTable(QObject* parent)
    : QObject(parent) {}

EditResult RangeTable::load(const QVector<RangeEntry>& entries) {
    int editable = entries.size() - kReservedCount;
    if (editable < kMinEditable || editable > kMaxEditable)
        return EditResult::failure(ErrorKind::Capacity,
            QStringLiteral("expected %1..%2 editable ranges after %3 reserved, got %4")
                .arg(kMinEditable).arg(kMaxEditable).arg(kReservedCount).arg(editable));

    QVector<RangeEntry> reserved = entries.mid(0, kReservedCount);
    QVector<RangeEntry> editableEntries = entries.mid(kReservedCount);

    for (int i = 0; i < editableEntries.size(); i++) {
        const RangeEntry& e = editableEntries[i];
        if (e.label.isEmpty())
            return EditResult::failure(ErrorKind::Label,
                QStringLiteral("range %1 has an empty label").arg(i));
        if (i == editableEntries.size() - 1)
            break;  // re-pinned below
        if (e.boundary < kMinBoundary || e.boundary >= kTopBoundary)
            return EditResult::failure(ErrorKind::Boundary,
                QStringLiteral("range %1 boundary %2 outside %3..%4")
                    .arg(i).arg(e.boundary).arg(kMinBoundary).arg(kTopBoundary - 1));
        if (i > 0 && e.boundary <= editableEntries[i - 1].boundary)
            return EditResult::failure(ErrorKind::Boundary,
                QStringLiteral("range %1 boundary %2 does not exceed range %3 boundary %4")
                    .arg(i).arg(e.boundary).arg(i - 1).arg(editableEntries[i - 1].boundary));
    }

    m_reserved = reserved;
    m_entries = editableEntries;
    pinLast();

    emit rowCountChanged(m_entries.size());
    emit thresholdsChanged(boundaries());
    emit colorsChanged();
    return EditResult::success();
}

// ── Boundary editing ──

EditResult RangeTable::setBoundary(int index, int value) {
    if (!validIndex(index))
        return EditResult::failure(ErrorKind::Boundary,
            QStringLiteral("range index %1 out of 0..%2").arg(index).arg(lastIndex()));

    if (index == lastIndex()) {
        pinLast();
        emit thresholdsChanged(boundaries());
        return EditResult::success();
    }

    // Same bounds a spin box for this row would enforce.
    value = qBound(impliedMinimum(index), value, maximumFor(index));

    int current = m_entries[index].boundary;
    m_entries[index].boundary = value;

    if (value < current) {
        settleBackward(index);
        settleForward(index);
    } else {
        pushSuccessors(index);
    }
    pinLast();

    emit thresholdsChanged(boundaries());
    return EditResult::success();
}

// Raise successors while each one is forced onto its implied minimum.
// A band that still spans more than one value stops the cascade.
void RangeTable::pushSuccessors(int index) {
    for (int k = index + 1; k <= lastIndex(); k++) {
        int required = m_entries[k - 1].boundary + 1;
        if (m_entries[k].boundary < required)
            m_entries[k].boundary = required;
        if (impliedMinimum(k) != m_entries[k].boundary)
            break;
    }
}

void RangeTable::settleBackward(int index) {
    bool changed = true;
    while (changed) {
        changed = false;
        for (int i = index - 1; i >= 0; i--) {
            int cap = m_entries[i + 1].boundary - 1;
            if (m_entries[i].boundary > cap) {
                m_entries[i].boundary = cap;
                changed = true;
            }
        }
    }
}

void RangeTable::settleForward(int index) {
    bool changed = true;
    while (changed) {
        changed = false;
        for (int i = index + 1; i <= lastIndex(); i++) {
            int floor = impliedMinimum(i);
            if (m_entries[i].boundary < floor) {
                m_entries[i].boundary = floor;
                changed = true;
            }
        }
    }
}

void RangeTable::pinLast() {
    if (!m_entries.isEmpty())
        m_entries.last().boundary = kTopBoundary;
}

int RangeTable::impliedMinimum(int index) const {
    if (index <= 0) return kMinBoundary;
    return m_entries[index - 1].boundary + 1;
}

// ── Insert / remove ──

EditResult RangeTable::insertAt(int index, int boundaryHint, const QString& label, const Rgba& color) {
    if (!canInsert())
        return EditResult::failure(ErrorKind::Capacity,
            QStringLiteral("cannot exceed %1 ranges").arg(kMaxEditable));
    if (!validIndex(index))
        return EditResult::failure(ErrorKind::Boundary,
            QStringLiteral("insert position %1 must precede the fixed last range (0..%2)")
                .arg(index).arg(lastIndex()));
    if (label.isEmpty())
        return EditResult::failure(ErrorKind::Label, QStringLiteral("label must not be empty"));
    if (labels().contains(label))
        return EditResult::failure(ErrorKind::Label,
            QStringLiteral("label '%1' already exists").arg(label));

    // Free values below the entry currently at `index`.
    const int gapLow = impliedMinimum(index);
    const int gapHigh = m_entries[index].boundary - 1;

    RangeEntry e;
    e.boundary = qMin(boundaryHint, kTopBoundary - 1);
    e.label = label;
    e.color = color;
    m_entries.insert(index, e);
    pinLast();

    if (gapLow <= gapHigh) {
        // Fits without moving any neighbour.
        m_entries[index].boundary = qBound(gapLow, m_entries[index].boundary, gapHigh);
    } else {
        int value = qMax(m_entries[index].boundary, impliedMinimum(index));
        value = qMin(value, maximumFor(index));
        value = qMax(value, index + kMinBoundary);
        m_entries[index].boundary = value;

        settleBackward(index);
        settleForward(index);
        pinLast();
    }

    emit rowCountChanged(m_entries.size());
    emit thresholdsChanged(boundaries());
    emit colorsChanged();
    return EditResult::success();
}

EditResult RangeTable::removeAt(int index) {
    if (!canRemove())
        return EditResult::failure(ErrorKind::Capacity,
            QStringLiteral("at least %1 ranges are required").arg(kMinEditable));
    if (!validIndex(index))
        return EditResult::failure(ErrorKind::Boundary,
            QStringLiteral("range index %1 out of 0..%2").arg(index).arg(lastIndex()));
    if (index == lastIndex())
        return EditResult::failure(ErrorKind::Boundary,
            QStringLiteral("the last range cannot be removed"));

    m_entries.removeAt(index);

    emit rowCountChanged(m_entries.size());
    emit thresholdsChanged(boundaries());
    emit colorsChanged();
    return EditResult::success();
}

EditResult RangeTable::setColor(int index, const Rgba& color) {
    if (!validIndex(index))
        return EditResult::failure(ErrorKind::Boundary,
            QStringLiteral("range index %1 out of 0..%2").arg(index).arg(lastIndex()));
    m_entries[index].color = color;
    emit colorsChanged();
    return EditResult::success();
}

// ── Accessors ──

QVector<int> RangeTable::boundaries() const {
    QVector<int> out;
    out.reserve(m_entries.size());
    for (const auto& e : m_entries) out.append(e.boundary);
    return out;
}

QStringList RangeTable::labels() const {
    QStringList out;
    out.reserve(m_entries.size());
    for (const auto& e : m_entries) out.append(e.label);
    return out;
}

QVector<Rgba> RangeTable::colors() const {
    QVector<Rgba> out;
    out.reserve(m_entries.size());
    for (const auto& e : m_entries) out.append(e.color);
    return out;
}

QVector<QPair<int, int>> RangeTable::ranges() const {
    QVector<QPair<int, int>> out;
    out.reserve(m_entries.size());
    for (int i = 0; i < m_entries.size(); i++)
        out.append(qMakePair(impliedMinimum(i), m_entries[i].boundary));
    return out;
}

} // namespace rbx
