// Small UI time helpers shared across dialogs and prompts.
#pragma once
#include <QString>
#include <QDateTime>
#include <QLocale>

namespace fileopsui {

// Format epoch seconds for user-facing display in LOCAL time (short format),
// using the system locale so 12/24h and date formats match OS preferences.
inline QString localShortTime(qint64 secs) {
    if (secs <= 0) return QStringLiteral("—");
    const QDateTime dt = QDateTime::fromSecsSinceEpoch(secs);
    if (!dt.isValid()) return QStringLiteral("—");
    return QLocale::system().toString(dt, QLocale::ShortFormat);
}

// Size in bytes with the locale's digit grouping.
inline QString groupedSize(quint64 bytes) {
    return QLocale::system().toString(bytes);
}

} // namespace fileopsui
