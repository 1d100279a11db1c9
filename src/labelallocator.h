#pragma once
#include <QString>
#include <QStringList>

namespace rbx {

inline const QString kDefaultCustomPrefix = QStringLiteral("custom-");

// Largest N among labels of the exact form "<prefix><digits>", 0 if none.
int maxCustomSuffix(const QStringList& labels, const QString& prefix = kDefaultCustomPrefix);

// "<prefix>(N+1)"; never returns a label already present in `labels`.
QString allocateLabel(const QStringList& labels, const QString& prefix = kDefaultCustomPrefix);

} // namespace rbx
