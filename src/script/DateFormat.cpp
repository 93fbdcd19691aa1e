#include "script/DateFormat.h"

#include "core/Log.h"
#include "process/ProcessRunner.h"

#include <QDate>
#include <QDateTime>
#include <QLocale>
#include <QMutexLocker>
#include <QRegularExpression>
#include <QTimeZone>
#include <QtConcurrent/QtConcurrent>

namespace reminders {

namespace {

const QString kDateOnlyFormat = QStringLiteral("MMMM d, yyyy");
const QString kDateTime12Format = QStringLiteral("MMMM d, yyyy h:mm:ss AP");
const QString kDateTime24Format = QStringLiteral("MMMM d, yyyy HH:mm:ss");

const QLocale &englishLocale() {
    static const QLocale locale(QLocale::English, QLocale::UnitedStates);
    return locale;
}

// Offset in seconds from "Z", "+05", "+0530" or "+05:30".
bool parseIsoOffset(const QString &text, int *secondsOut) {
    if (text == QLatin1String("Z")) {
        *secondsOut = 0;
        return true;
    }
    const int sign = text.startsWith(QLatin1Char('-')) ? -1 : 1;
    QString digits = text.mid(1);
    digits.remove(QLatin1Char(':'));
    const int hours = digits.left(2).toInt();
    const int minutes = digits.size() > 2 ? digits.mid(2, 2).toInt() : 0;
    if (hours > 23 || minutes > 59) return false;
    *secondsOut = sign * (hours * 3600 + minutes * 60);
    return true;
}

// ISO 8601 date-time in extended ("2024-12-25T14:30:00.250+01:00") or basic
// ("20241225T143000Z") form. Minutes, seconds and fraction are optional;
// fractions beyond milliseconds are truncated.
bool parseIsoDateTime(const QString &input, QDateTime *out) {
    static const QRegularExpression extended(QStringLiteral(
        "^(\\d{4})-(\\d{2})-(\\d{2})T(\\d{2})(?::(\\d{2})(?::(\\d{2})(?:[.,](\\d+))?)?)?(Z|[+-]\\d{2}(?::?\\d{2})?)?$"));
    static const QRegularExpression basic(QStringLiteral(
        "^(\\d{4})(\\d{2})(\\d{2})T(\\d{2})(?:(\\d{2})(?:(\\d{2})(?:[.,](\\d+))?)?)?(Z|[+-]\\d{2}(?:\\d{2})?)?$"));

    auto m = extended.match(input);
    if (!m.hasMatch()) m = basic.match(input);
    if (!m.hasMatch()) return false;

    const QDate date(m.captured(1).toInt(), m.captured(2).toInt(), m.captured(3).toInt());
    const QString fraction = m.captured(7);
    const int ms = fraction.isEmpty() ? 0 : fraction.left(3).leftJustified(3, QLatin1Char('0')).toInt();
    const QTime time(m.captured(4).toInt(), m.captured(5).toInt(), m.captured(6).toInt(), ms);
    if (!date.isValid() || !time.isValid()) return false;

    const QString offsetText = m.captured(8);
    if (offsetText.isEmpty()) {
        *out = QDateTime(date, time);
        return out->isValid();
    }
    int offset = 0;
    if (!parseIsoOffset(offsetText, &offset)) return false;
    const QDateTime dt(date, time, QTimeZone(offset));
    if (!dt.isValid()) return false;
    *out = dt.toLocalTime();
    return true;
}

bool parseDateTime(const QString &input, QDateTime *out) {
    static const QRegularExpression plain(QStringLiteral("^\\d{4}-\\d{2}-\\d{2} \\d{2}:\\d{2}:\\d{2}$"));

    if (plain.match(input).hasMatch()) {
        const QDateTime dt = QDateTime::fromString(input, QStringLiteral("yyyy-MM-dd HH:mm:ss"));
        if (!dt.isValid()) return false;
        *out = dt;
        return true;
    }
    return parseIsoDateTime(input, out);
}

}

bool isDateOnlyFormat(const QString &input) {
    static const QRegularExpression re(QStringLiteral("^\\d{4}-\\d{2}-\\d{2}$"));
    return re.match(input.trimmed()).hasMatch();
}

QString invalidDateMessage(const QString &input) {
    return QStringLiteral("Invalid or unsupported date format: \"%1\". "
                          "Supported formats: YYYY-MM-DD HH:mm:ss, YYYY-MM-DD, ISO 8601. "
                          "Example: \"2024-12-25 14:30:00\"").arg(input);
}

bool parseDateWithType(const QString &input, bool use24Hour, ParsedDate *out, QString *errOut) {
    static const QRegularExpression dateOnly(QStringLiteral("^\\d{4}-\\d{2}-\\d{2}$"));

    if (dateOnly.match(input).hasMatch()) {
        const QDate d = QDate::fromString(input, QStringLiteral("yyyy-MM-dd"));
        if (!d.isValid()) {
            if (errOut) *errOut = invalidDateMessage(input);
            return false;
        }
        if (out) {
            out->formatted = englishLocale().toString(d, kDateOnlyFormat);
            out->isDateOnly = true;
            debugLog(QStringLiteral("date: %1 -> %2 (date-only)").arg(input, out->formatted));
        }
        return true;
    }

    QDateTime dt;
    if (!parseDateTime(input, &dt)) {
        if (errOut) *errOut = invalidDateMessage(input);
        return false;
    }
    if (out) {
        out->formatted = englishLocale().toString(dt, use24Hour ? kDateTime24Format : kDateTime12Format);
        out->isDateOnly = false;
        debugLog(QStringLiteral("date: %1 -> %2 (%3-hour)").arg(input, out->formatted, use24Hour ? QStringLiteral("24") : QStringLiteral("12")));
    }
    return true;
}

ClockPreference::ClockPreference(const QString &readerProgram) : m_readerProgram(readerProgram) {}

ClockPreference::~ClockPreference() {
    waitForRefresh();
}

bool ClockPreference::use24Hour() {
    bool expected = false;
    if (m_started.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        m_refreshCount.fetch_add(1, std::memory_order_relaxed);
        QMutexLocker locker(&m_mutex);
        m_refresh = QtConcurrent::run([this]() {
            bool value = false;
            if (fetchSystemPreference(&value)) {
                m_use24Hour.store(value, std::memory_order_release);
                debugLog(QStringLiteral("clock_preference: %1-hour").arg(value ? 24 : 12));
            } else {
                m_use24Hour.store(false, std::memory_order_release);
                debugLog(QStringLiteral("clock_preference: unavailable, using 12-hour"));
            }
        });
    }
    return m_use24Hour.load(std::memory_order_acquire);
}

void ClockPreference::waitForRefresh() {
    QFuture<void> pending;
    {
        QMutexLocker locker(&m_mutex);
        pending = m_refresh;
    }
    pending.waitForFinished();
}

bool ClockPreference::fetchSystemPreference(bool *use24HourOut) const {
    const ProcessResult r = runProcess(m_readerProgram,
                                       {QStringLiteral("read"), QStringLiteral("-g"), QStringLiteral("AppleICUForce24HourTime")},
                                       5000);
    if (!r.ok()) return false;
    *use24HourOut = r.stdoutText().trimmed() == QLatin1String("1");
    return true;
}

#ifdef REMINDERS_TESTING
void ClockPreference::resetForTesting() {
    waitForRefresh();
    m_refreshCount.store(0, std::memory_order_relaxed);
    m_use24Hour.store(false, std::memory_order_release);
    m_started.store(false, std::memory_order_release);
}

void ClockPreference::overrideForTesting(bool use24Hour) {
    waitForRefresh();
    m_started.store(true, std::memory_order_release);
    m_use24Hour.store(use24Hour, std::memory_order_release);
}

int ClockPreference::refreshCountForTesting() const {
    return m_refreshCount.load(std::memory_order_relaxed);
}
#endif

} // namespace reminders
