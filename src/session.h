#pragma once
#include "core.h"
#include "document.h"
#include "rangetable.h"
#include <QObject>
#include <optional>

namespace rbx {

class ObjectStore;

// ── EditSession ──
//
// Owns the range table built from one store snapshot and the original
// documents needed to write it back. The range collection is required;
// the colour preset and both highlight collections are optional and are
// only written back when they were loaded. The preset is re-read from the
// store at save time.

class EditSession : public QObject {
    Q_OBJECT
public:
    explicit EditSession(const QString& labelPrefix, QObject* parent = nullptr);

    EditResult load(const ObjectStore& store);
    // Encodes and validates every loaded object before the first write.
    EditResult save(ObjectStore& store);

    bool isLoaded() const { return m_range.has_value(); }
    RangeTable* table() { return &m_table; }
    const RangeTable* table() const { return &m_table; }

    void setHighlightEnabled(bool enabled);
    bool highlightEnabled() const { return m_highlightEnabled; }
    bool hasHighlight() const { return m_highlight.has_value() || m_highlightNoBorder.has_value(); }
    bool hasColorPreset() const { return m_preset.has_value(); }
    bool colorFallbackApplied() const { return m_colorFallback; }

    // "Add Range": before the fixed last entry, hint 19, next custom label,
    // colour of the previous entry.
    EditResult insertRange();

    QString labelPrefix() const { return m_labelPrefix; }

    // Objects written by save(), in write order.
    QStringList objectNames() const;

signals:
    void highlightChanged(bool enabled);

private:
    QString  m_labelPrefix;
    RangeTable m_table;

    std::optional<Document> m_range;
    std::optional<Document> m_preset;
    std::optional<Document> m_highlight;
    std::optional<Document> m_highlightNoBorder;

    bool m_highlightEnabled = true;
    bool m_colorFallback = false;
};

} // namespace rbx
