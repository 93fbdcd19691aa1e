#pragma once

#include "helper/Reminder.h"

#include <QString>
#include <QStringList>
#include <QVariant>

namespace reminders {

// Literal markers emitted by the GetReminders helper.
extern const QString kListsHeader;
extern const QString kRemindersHeader;
extern const QString kBlockSeparator;

struct TranscriptSections {
    QStringList lists;
    QStringList reminders;
};

TranscriptSections splitIntoSections(const QString &output);
QVector<ReminderList> parseLists(const QStringList &lines);
QVector<QStringList> groupReminderLines(const QStringList &lines);

// Returns false and leaves out untouched when the block lacks a title or a
// list; the block is logged and skipped.
bool parseReminderBlock(const QStringList &block, Reminder *out);

// Bool passes through, strings compare case-insensitively to "true", null
// and undefined are false, anything else goes by truthiness. Non-bool input
// is logged.
bool normalizeCompletionFlag(const QVariant &raw, const QString &title = QString());

// Never fails: malformed lines and blocks are dropped with a warning.
Transcript parseTranscript(const QString &output);

} // namespace reminders
