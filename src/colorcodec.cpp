#include "colorcodec.h"
#include <cmath>

namespace rbx {

static int toByte(float v) {
    if (!std::isfinite(v)) return 255;
    long n = std::lround(double(v) * 255.0);
    if (n < 0)   return 0;
    if (n > 255) return 255;
    return int(n);
}

static bool isHexDigit(QChar ch) {
    return (ch >= '0' && ch <= '9')
        || (ch >= 'a' && ch <= 'f')
        || (ch >= 'A' && ch <= 'F');
}

static QString hexByte(int v) {
    return QString::number(v, 16).rightJustified(2, QLatin1Char('0')).toUpper();
}

QString rgbaToHex(float r, float g, float b, float a) {
    return QStringLiteral("#") + hexByte(toByte(r)) + hexByte(toByte(g))
         + hexByte(toByte(b)) + hexByte(toByte(a));
}

QString rgbaToHex(const Rgba& c) {
    return rgbaToHex(c.r, c.g, c.b, c.a);
}

Rgba hexToRgba(const QString& hex, bool* ok) {
    QString s = hex.trimmed();
    if (s.startsWith(QLatin1Char('#')))
        s.remove(0, 1);

    bool digitsOnly = true;
    for (QChar ch : s)
        if (!isHexDigit(ch)) digitsOnly = false;

    if ((s.size() != 6 && s.size() != 8) || !digitsOnly) {
        if (ok) *ok = false;
        return Rgba::white();
    }

    int channels[4] = {255, 255, 255, 255};
    for (int i = 0; i < s.size() / 2; i++) {
        channels[i] = s.mid(i * 2, 2).toInt(nullptr, 16);
    }

    if (ok) *ok = true;
    return {channels[0] / 255.0f, channels[1] / 255.0f,
            channels[2] / 255.0f, channels[3] / 255.0f};
}

} // namespace rbx
