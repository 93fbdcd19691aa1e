#pragma once

#include <QString>
#include <QVector>
#include <optional>

namespace reminders {

struct ReminderList {
    int id = 0;
    QString title;
};

struct Reminder {
    QString title;
    std::optional<QString> dueDate;
    std::optional<QString> notes;
    std::optional<QString> url;
    QString list;
    bool isCompleted = false;
};

struct Transcript {
    QVector<ReminderList> lists;
    QVector<Reminder> reminders;
};

} // namespace reminders
