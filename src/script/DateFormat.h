#pragma once

#include <QFuture>
#include <QMutex>
#include <QString>
#include <atomic>

namespace reminders {

struct ParsedDate {
    QString formatted;
    bool isDateOnly = false;
};

// True for a bare YYYY-MM-DD (surrounding whitespace ignored).
bool isDateOnlyFormat(const QString &input);

QString invalidDateMessage(const QString &input);

// Accepts exactly "YYYY-MM-DD HH:mm:ss", ISO 8601 with an optional offset, or
// "YYYY-MM-DD". Anything else fails with invalidDateMessage(input).
bool parseDateWithType(const QString &input, bool use24Hour, ParsedDate *out, QString *errOut);

// Host clock-format preference. The first call to use24Hour() starts a
// background read of the system setting and returns the 12-hour default until
// that read completes. The read is started at most once.
class ClockPreference {
public:
    explicit ClockPreference(const QString &readerProgram = QStringLiteral("/usr/bin/defaults"));
    ~ClockPreference();

    ClockPreference(const ClockPreference &) = delete;
    ClockPreference &operator=(const ClockPreference &) = delete;

    bool use24Hour();
    void waitForRefresh();

#ifdef REMINDERS_TESTING
    void resetForTesting();
    void overrideForTesting(bool use24Hour);
    int refreshCountForTesting() const;
#endif

private:
    bool fetchSystemPreference(bool *use24HourOut) const;

    QString m_readerProgram;
    std::atomic_int m_refreshCount{0};
    std::atomic_bool m_started{false};
    std::atomic_bool m_use24Hour{false};
    QMutex m_mutex;
    QFuture<void> m_refresh;
};

} // namespace reminders
