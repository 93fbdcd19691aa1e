#pragma once

#include <QString>
#include <QStringList>

namespace reminders {

// Notes carry URLs in a trailing block:
//
//   <note text>
//
//   URLs:
//   - https://example.com/a
//   - https://example.com/b

bool isValidUrl(const QString &url);

QString formatUrlSection(const QStringList &urls);
QString removeUrlSections(const QString &notes);
QStringList extractUrlsFromNotes(const QString &notes);
QString formatNoteWithUrls(const QString &note, const QStringList &urls);
QString combineNoteWithUrl(const QString &note, const QString &url);

struct ParsedNote {
    QString note;
    QStringList urls;
};

ParsedNote parseReminderNote(const QString &notes);

} // namespace reminders
