#include "session.h"
#include "labelallocator.h"
#include "objectstore.h"
#include "structurecodec.h"
#include <QDebug>
#include <QPair>
#include <QVector>

namespace rbx {

namespace {

EditResult structureFailure(const char* object, const StructureError& err) {
    return EditResult::failure(ErrorKind::Structure,
        QStringLiteral("%1: %2").arg(QString::fromLatin1(object), err.message()));
}

// Reads an optional object; NotFound leaves `out` empty and succeeds.
EditResult readOptional(const ObjectStore& store, const char* name, std::optional<Document>* out) {
    Document doc;
    EditResult r = store.readObject(QString::fromLatin1(name), &doc);
    if (r.ok) {
        *out = doc;
        return r;
    }
    out->reset();
    if (r.kind == ErrorKind::NotFound) {
        qDebug() << "EditSession:" << name << "not present, skipping";
        return EditResult::success();
    }
    return r;
}

} // namespace

EditSession::EditSession(const QString& labelPrefix, QObject* parent)
    : QObject(parent)
    , m_labelPrefix(labelPrefix.isEmpty() ? kDefaultCustomPrefix : labelPrefix)
{}

QStringList EditSession::objectNames() const {
    QStringList names;
    if (m_range)             names << QString::fromLatin1(kRangeCollectionName);
    if (m_preset)            names << QString::fromLatin1(kColorPresetName);
    if (m_highlight)         names << QString::fromLatin1(kHighlightName);
    if (m_highlightNoBorder) names << QString::fromLatin1(kHighlightNoBorderName);
    return names;
}

// ── Load ──

EditResult EditSession::load(const ObjectStore& store) {
    Document rangeDoc;
    EditResult r = store.readObject(QString::fromLatin1(kRangeCollectionName), &rangeDoc);
    if (!r.ok) {
        qWarning() << "EditSession: cannot read" << kRangeCollectionName << r.error;
        return r;
    }

    StructureError err;
    RangeCollection ranges;
    if (!codec::decodeRangeCollection(rangeDoc, &ranges, &err)) {
        qWarning() << "EditSession:" << err.message();
        return structureFailure(kRangeCollectionName, err);
    }

    std::optional<Document> preset, highlight, highlightNoBorder;
    if (!(r = readOptional(store, kColorPresetName, &preset)).ok) return r;
    if (!(r = readOptional(store, kHighlightName, &highlight)).ok) return r;
    if (!(r = readOptional(store, kHighlightNoBorderName, &highlightNoBorder)).ok) return r;

    ColorPreset colors;
    if (preset && !codec::decodeColorPreset(*preset, &colors, &err)) {
        qWarning() << "EditSession:" << err.message();
        return structureFailure(kColorPresetName, err);
    }

    // The bordered collection decides the toggle state when both exist.
    bool enabled = true;
    HighlightToggle toggle;
    if (highlight) {
        if (!codec::decodeHighlightToggle(*highlight, HighlightVariant::Bordered, &toggle, &err))
            return structureFailure(kHighlightName, err);
        enabled = toggle.enabled;
    }
    if (highlightNoBorder) {
        if (!codec::decodeHighlightToggle(*highlightNoBorder, HighlightVariant::NoBorder, &toggle, &err))
            return structureFailure(kHighlightNoBorderName, err);
        if (!highlight) enabled = toggle.enabled;
    }

    QVector<RangeEntry> entries;
    entries.reserve(ranges.boundaries.size());
    for (int i = 0; i < ranges.boundaries.size(); i++) {
        RangeEntry e;
        e.boundary = ranges.boundaries[i];
        e.label = ranges.labels[i];
        e.color = i < colors.colors.size() ? colors.colors[i] : Rgba::white();
        entries.append(e);
    }

    if (!(r = m_table.load(entries)).ok) {
        qWarning() << "EditSession: rejected range table:" << r.error;
        return r;
    }

    m_range = rangeDoc;
    m_preset = preset;
    m_highlight = highlight;
    m_highlightNoBorder = highlightNoBorder;
    m_colorFallback = colors.fallbackApplied;
    if (m_highlightEnabled != enabled) {
        m_highlightEnabled = enabled;
        emit highlightChanged(enabled);
    }

    if (m_colorFallback)
        qWarning() << "EditSession: colour preset unreadable, colours reset to white";
    qDebug() << "EditSession: loaded" << m_table.editableCount() << "ranges from" << store.name();
    return EditResult::success();
}

// ── Save ──

EditResult EditSession::save(ObjectStore& store) {
    if (!m_range)
        return EditResult::failure(ErrorKind::NotFound, QStringLiteral("nothing loaded"));

    const QVector<RangeEntry> all = m_table.allEntries();
    QVector<QPair<QString, Document>> batch;
    StructureError err;

    RangeCollection ranges;
    QVector<Rgba> colors;
    for (const auto& e : all) {
        ranges.boundaries.append(e.boundary);
        ranges.labels.append(e.label);
        colors.append(e.color);
    }

    Document out;
    if (!codec::encodeRangeCollection(ranges, *m_range, &out, &err)) {
        qWarning() << "EditSession: save aborted:" << err.message();
        return structureFailure(kRangeCollectionName, err);
    }
    batch.append(qMakePair(QString::fromLatin1(kRangeCollectionName), out));

    if (m_preset) {
        // Re-read so that preset fields changed since load pass through.
        Document current;
        EditResult r = store.readObject(QString::fromLatin1(kColorPresetName), &current);
        if (!r.ok) {
            qWarning() << "EditSession: save aborted:" << r.error;
            return r;
        }
        if (!codec::encodeColorPreset(colors, ranges.labels, current, &out, &err)) {
            qWarning() << "EditSession: save aborted:" << err.message();
            return structureFailure(kColorPresetName, err);
        }
        batch.append(qMakePair(QString::fromLatin1(kColorPresetName), out));
    }

    const struct { const std::optional<Document>* doc; HighlightVariant variant; } toggles[] = {
        {&m_highlight, HighlightVariant::Bordered},
        {&m_highlightNoBorder, HighlightVariant::NoBorder},
    };
    for (const auto& t : toggles) {
        if (!t.doc->has_value()) continue;
        const char* name = highlightMeta(t.variant)->objectName;
        if (!codec::encodeHighlightToggle(m_highlightEnabled, t.variant, **t.doc, &out, &err)) {
            qWarning() << "EditSession: save aborted:" << err.message();
            return structureFailure(name, err);
        }
        batch.append(qMakePair(QString::fromLatin1(name), out));
    }

    for (const auto& item : batch) {
        EditResult r = store.writeObject(item.first, item.second);
        if (!r.ok) {
            qWarning() << "EditSession: write failed for" << item.first << r.error;
            return r;
        }
    }

    // Later saves encode against what is now stored.
    for (const auto& item : batch) {
        if (item.first == QLatin1String(kRangeCollectionName))        m_range = item.second;
        else if (item.first == QLatin1String(kColorPresetName))       m_preset = item.second;
        else if (item.first == QLatin1String(kHighlightName))         m_highlight = item.second;
        else if (item.first == QLatin1String(kHighlightNoBorderName)) m_highlightNoBorder = item.second;
    }
    m_colorFallback = false;

    qDebug() << "EditSession: saved" << batch.size() << "objects to" << store.name();
    return EditResult::success();
}

// ── Editing ──

void EditSession::setHighlightEnabled(bool enabled) {
    if (m_highlightEnabled == enabled) return;
    m_highlightEnabled = enabled;
    emit highlightChanged(enabled);
}

EditResult EditSession::insertRange() {
    if (!isLoaded())
        return EditResult::failure(ErrorKind::NotFound, QStringLiteral("nothing loaded"));
    if (!m_table.canInsert())
        return EditResult::failure(ErrorKind::Capacity,
            QStringLiteral("cannot exceed %1 ranges").arg(kMaxEditable));

    int index = m_table.editableCount() - 1;
    Rgba color = index > 0 ? m_table.entry(index - 1).color : m_table.entry(index).color;
    QString label = allocateLabel(m_table.labels(), m_labelPrefix);
    return m_table.insertAt(index, kTopBoundary - 1, label, color);
}

} // namespace rbx
