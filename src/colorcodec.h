#pragma once
#include "core.h"
#include <QString>

namespace rbx {

// "#RRGGBBAA", channels clamped to 0..1 and rounded to the nearest step.
QString rgbaToHex(float r, float g, float b, float a = 1.0f);
QString rgbaToHex(const Rgba& c);

// Accepts "RRGGBB" (alpha 1.0) or "RRGGBBAA", with or without a leading '#'.
// Anything else yields opaque white and *ok = false.
Rgba hexToRgba(const QString& hex, bool* ok = nullptr);

} // namespace rbx
