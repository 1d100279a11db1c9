#pragma once
#include "core.h"
#include "document.h"
#include <QString>
#include <QStringList>
#include <QVector>

namespace rbx {

// ── Shapes and decoded values ──

enum class ObjectShape : uint8_t { RangeCollection, ColorPreset, HighlightToggle };

struct StructureError {
    QString path;       // e.g. "root.m_Rules[3].m_Properties[0].m_Values[0]"
    QString expected;
    QString actual;

    QString message() const;
};

// Thresholds and labels of the range/label collection, reserved rows included.
struct RangeCollection {
    QVector<int> boundaries;
    QStringList  labels;
};

// One color and one selector label per rule, in rule order.
struct ColorPreset {
    QVector<Rgba> colors;
    QStringList   labels;          // empty string where no selector binds the rule
    bool          fallbackApplied = false;   // colors defaulted to opaque white
};

struct HighlightToggle {
    QStringList rows;
    bool        enabled = true;
};

// ── Wire vocabulary ──

namespace wire {
    inline constexpr int kColorValueType  = 4;   // valueIndex into "colors"
    inline constexpr int kFloatValueType  = 2;   // valueIndex into "floats", 4 floats
    inline constexpr int kSelectorPartType = 3;  // class selector
    inline constexpr int kSelectorSpecificity = 11;
    inline constexpr const char* kIntDataSet    = "IntDataSet";
    inline constexpr const char* kStringDataSet = "StringDataSet";
}

// ── Codec ──
//
// Every call is stateless. Decoders validate their input; encoders validate
// the original and then the rebuilt document. On failure the function
// returns false, fills *err and leaves *out untouched.

namespace codec {

bool validateDocument(const Document& doc, ObjectShape shape, StructureError* err);

bool decodeRangeCollection(const Document& doc, RangeCollection* out, StructureError* err);
bool encodeRangeCollection(const RangeCollection& value, const Document& original,
                           Document* out, StructureError* err);

bool decodeColorPreset(const Document& doc, ColorPreset* out, StructureError* err);
bool encodeColorPreset(const QVector<Rgba>& colors, const QStringList& labels,
                       const Document& original, Document* out, StructureError* err);

bool decodeHighlightToggle(const Document& doc, HighlightVariant variant,
                           HighlightToggle* out, StructureError* err);
bool encodeHighlightToggle(bool enabled, HighlightVariant variant, const Document& original,
                           Document* out, StructureError* err);

} // namespace codec

} // namespace rbx
