#pragma once
#include <QString>
#include <QStringList>
#include <QVector>
#include <cstdint>

namespace rbx {

// ── Range limits ──

inline constexpr int kReservedCount = 2;    // "Unset" and "Low" bands
inline constexpr int kMinEditable   = 4;
inline constexpr int kMaxEditable   = 18;
inline constexpr int kMinBoundary   = 1;
inline constexpr int kTopBoundary   = 20;   // last editable boundary, always

// ── Named objects ──

inline constexpr const char* kRangeCollectionName   = "AttributeDataCollection";
inline constexpr const char* kColorPresetName       = "AttributeColoursDefault";
inline constexpr const char* kHighlightName         = "AttributeHighlightTypeDataCollection";
inline constexpr const char* kHighlightNoBorderName = "AttributeHighlightTypeNoBorderDataCollection";

// ── Highlight variants ──

enum class HighlightVariant : uint8_t { Bordered, NoBorder };

struct HighlightMeta {
    HighlightVariant variant;
    const char*      objectName;
    const char*      labels[3];   // enabled rows; labels[0] is the base label
};

inline constexpr HighlightMeta kHighlightMeta[] = {
    {HighlightVariant::Bordered, kHighlightName,
     {"attributes-row-number",
      "attributes-row-number-preference",
      "attributes-row-number-key"}},
    {HighlightVariant::NoBorder, kHighlightNoBorderName,
     {"attributes-row-number-no-border",
      "attributes-row-number-preference-no-border",
      "attributes-row-number-key-no-border"}},
};

inline constexpr const HighlightMeta* highlightMeta(HighlightVariant v) {
    for (const auto& m : kHighlightMeta)
        if (m.variant == v) return &m;
    return nullptr;
}

// Rows written for a toggle state: three distinct labels, or the base label three times.
inline QStringList highlightRows(HighlightVariant v, bool enabled) {
    const HighlightMeta* m = highlightMeta(v);
    if (!m) return {};
    if (!enabled) {
        QString base = QString::fromLatin1(m->labels[0]);
        return {base, base, base};
    }
    return {QString::fromLatin1(m->labels[0]),
            QString::fromLatin1(m->labels[1]),
            QString::fromLatin1(m->labels[2])};
}

// ── Color ──

struct Rgba {
    float r = 1.0f;
    float g = 1.0f;
    float b = 1.0f;
    float a = 1.0f;

    static Rgba white() { return {}; }

    bool operator==(const Rgba& o) const {
        return r == o.r && g == o.g && b == o.b && a == o.a;
    }
    bool operator!=(const Rgba& o) const { return !(*this == o); }
};

// ── Range entry ──

struct RangeEntry {
    int     boundary = kMinBoundary;   // inclusive upper bound of the band
    QString label;
    Rgba    color;

    bool operator==(const RangeEntry& o) const {
        return boundary == o.boundary && label == o.label && color == o.color;
    }
    bool operator!=(const RangeEntry& o) const { return !(*this == o); }
};

// ── Errors ──

enum class ErrorKind : uint8_t {
    None,
    Boundary,    // illegal index, or the fixed last entry
    Capacity,    // table at min/max editable size
    Label,       // empty or duplicate label
    Structure,   // document shape violation
    NotFound,    // named object absent from the store
    Io
};

inline const char* errorKindName(ErrorKind k) {
    switch (k) {
    case ErrorKind::None:      return "None";
    case ErrorKind::Boundary:  return "BoundaryError";
    case ErrorKind::Capacity:  return "CapacityError";
    case ErrorKind::Label:     return "LabelError";
    case ErrorKind::Structure: return "StructureError";
    case ErrorKind::NotFound:  return "NotFoundError";
    case ErrorKind::Io:        return "IoError";
    }
    return "Unknown";
}

struct EditResult {
    bool      ok   = true;
    ErrorKind kind = ErrorKind::None;
    QString   error;

    static EditResult success() { return {}; }
    static EditResult failure(ErrorKind k, const QString& msg) {
        return {false, k, msg};
    }
};

} // namespace rbx
