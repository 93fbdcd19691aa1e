#pragma once

#include "helper/Reminder.h"

#include <QDate>
#include <QDateTime>
#include <optional>

namespace reminders {

enum class DueFilter {
    Today,
    Tomorrow,
    ThisWeek,
    Overdue,
    NoDate,
};

bool dueFilterFromString(const QString &text, DueFilter *out);

struct ReminderFilter {
    std::optional<bool> showCompleted;
    QString list;
    QString search;
    std::optional<DueFilter> dueWithin;
};

// Parses the helper's due text, e.g. "Dec 25, 2024" or "Dec 25, 2024 at 2:30 PM".
std::optional<QDateTime> parseHelperDueDate(const QString &text);

bool matchesDueFilter(const Reminder &reminder, DueFilter filter, const QDate &today);

QVector<Reminder> applyReminderFilter(const QVector<Reminder> &reminders, const ReminderFilter &filter,
                                      const QDate &today = QDate::currentDate());

} // namespace reminders
