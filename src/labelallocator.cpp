#include "labelallocator.h"

namespace rbx {

int maxCustomSuffix(const QStringList& labels, const QString& prefix) {
    int best = 0;
    for (const QString& label : labels) {
        if (!label.startsWith(prefix)) continue;
        QString digits = label.mid(prefix.size());
        if (digits.isEmpty()) continue;

        bool allDigits = true;
        for (QChar c : digits)
            if (!c.isDigit()) { allDigits = false; break; }
        if (!allDigits) continue;

        bool ok = false;
        int n = digits.toInt(&ok);
        if (ok && n > best) best = n;
    }
    return best;
}

QString allocateLabel(const QStringList& labels, const QString& prefix) {
    qint64 next = qint64(maxCustomSuffix(labels, prefix)) + 1;
    QString label = prefix + QString::number(next);
    // Unparseable suffixes (overflow) are ignored above, so probe until free.
    while (labels.contains(label))
        label = prefix + QString::number(++next);
    return label;
}

} // namespace rbx
