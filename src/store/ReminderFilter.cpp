#include "store/ReminderFilter.h"

#include "core/Log.h"

#include <QLocale>
#include <QRegularExpression>

namespace reminders {

bool dueFilterFromString(const QString &text, DueFilter *out) {
    static const struct {
        const char *name;
        DueFilter value;
    } table[] = {
        {"today", DueFilter::Today},
        {"tomorrow", DueFilter::Tomorrow},
        {"this-week", DueFilter::ThisWeek},
        {"overdue", DueFilter::Overdue},
        {"no-date", DueFilter::NoDate},
    };
    for (const auto &entry : table) {
        if (text == QLatin1String(entry.name)) {
            if (out) *out = entry.value;
            return true;
        }
    }
    return false;
}

std::optional<QDateTime> parseHelperDueDate(const QString &text) {
    QString t = text.trimmed();
    // Newer formatters put a narrow no-break space before AM/PM.
    t.replace(QChar(0x202F), QLatin1Char(' '));
    t.replace(QChar(0x00A0), QLatin1Char(' '));
    if (t.isEmpty()) return std::nullopt;

    const QLocale en(QLocale::English, QLocale::UnitedStates);
    static const QRegularExpression split(QStringLiteral("^(\\w{3} \\d{1,2}, \\d{4})(?:(?: at|,) (\\d{1,2}:\\d{2}(?: ?[AaPp][Mm])?))?$"));
    const auto m = split.match(t);
    if (!m.hasMatch()) {
        const QDateTime iso = QDateTime::fromString(t, Qt::ISODate);
        if (iso.isValid()) return iso.toLocalTime();
        debugLog(QStringLiteral("filter: unrecognized due date text: ") + text);
        return std::nullopt;
    }

    const QDate date = en.toDate(m.captured(1), QStringLiteral("MMM d, yyyy"));
    if (!date.isValid()) return std::nullopt;
    QTime time(0, 0);
    const QString timeText = m.captured(2);
    if (!timeText.isEmpty()) {
        const bool hasMeridiem = timeText.endsWith(QLatin1String("m"), Qt::CaseInsensitive);
        QString normalized = timeText.toUpper();
        if (hasMeridiem && !normalized.contains(QLatin1Char(' '))) normalized.insert(normalized.size() - 2, QLatin1Char(' '));
        time = hasMeridiem ? en.toTime(normalized, QStringLiteral("h:mm AP")) : QTime::fromString(normalized, QStringLiteral("H:mm"));
        if (!time.isValid()) return std::nullopt;
    }
    return QDateTime(date, time);
}

bool matchesDueFilter(const Reminder &reminder, DueFilter filter, const QDate &today) {
    if (filter == DueFilter::NoDate) return !reminder.dueDate.has_value();
    if (!reminder.dueDate) return false;
    const auto due = parseHelperDueDate(*reminder.dueDate);
    if (!due) return false;

    const QDateTime start(today, QTime(0, 0));
    const QDateTime tomorrow = start.addDays(1);
    switch (filter) {
    case DueFilter::Overdue: return *due < start;
    case DueFilter::Today: return *due >= start && *due < tomorrow;
    case DueFilter::Tomorrow: return *due >= tomorrow && *due < tomorrow.addDays(1);
    case DueFilter::ThisWeek: return *due >= start && *due <= start.addDays(7);
    case DueFilter::NoDate: break;
    }
    return false;
}

QVector<Reminder> applyReminderFilter(const QVector<Reminder> &reminders, const ReminderFilter &filter,
                                      const QDate &today) {
    QVector<Reminder> out;
    for (const Reminder &r : reminders) {
        if (filter.showCompleted.has_value() && !*filter.showCompleted && r.isCompleted) continue;
        if (!filter.list.isEmpty() && r.list != filter.list) continue;
        if (!filter.search.isEmpty()) {
            const bool inTitle = r.title.contains(filter.search, Qt::CaseInsensitive);
            const bool inNotes = r.notes && r.notes->contains(filter.search, Qt::CaseInsensitive);
            if (!inTitle && !inNotes) continue;
        }
        if (filter.dueWithin && !matchesDueFilter(r, *filter.dueWithin, today)) continue;
        out.append(r);
    }
    return out;
}

} // namespace reminders
