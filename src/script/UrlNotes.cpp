#include "script/UrlNotes.h"

#include <QRegularExpression>
#include <QUrl>

namespace reminders {

namespace {

const QRegularExpression &urlSectionRe() {
    static const QRegularExpression re(QStringLiteral("\\n\\nURLs:\\n((?:- https?://[^\\s]+\\n?)+)"));
    return re;
}

}

bool isValidUrl(const QString &url) {
    if (url.isEmpty()) return false;
    static const QRegularExpression scheme(QStringLiteral("^https?://"));
    if (!scheme.match(url).hasMatch()) return false;
    const QUrl u(url, QUrl::StrictMode);
    return u.isValid() && !u.host().isEmpty();
}

QString formatUrlSection(const QStringList &urls) {
    if (urls.isEmpty()) return QString();
    QStringList lines;
    for (const QString &u : urls) lines << QStringLiteral("- ") + u;
    return QStringLiteral("URLs:\n") + lines.join(QLatin1Char('\n'));
}

QString removeUrlSections(const QString &notes) {
    if (notes.isEmpty()) return QString();
    static const QRegularExpression legacyWithBreak(QStringLiteral("\\n\\nURL: https?://[^\\s]+"));
    static const QRegularExpression legacy(QStringLiteral("URL: https?://[^\\s]+"));
    QString out = notes;
    out.remove(urlSectionRe());
    out.remove(legacyWithBreak);
    out.remove(legacy);
    return out.trimmed();
}

QStringList extractUrlsFromNotes(const QString &notes) {
    QStringList urls;
    if (notes.isEmpty()) return urls;

    auto it = urlSectionRe().globalMatch(notes);
    while (it.hasNext()) {
        const QRegularExpressionMatch m = it.next();
        const QStringList lines = m.captured(1).split(QLatin1Char('\n'), Qt::SkipEmptyParts);
        for (QString line : lines) {
            if (line.startsWith(QLatin1String("- "))) line.remove(0, 2);
            line = line.trimmed();
            if (!line.isEmpty()) urls << line;
        }
    }
    if (!urls.isEmpty()) return urls;

    static const QRegularExpression bare(QStringLiteral("https?://[^\\s]+"));
    auto bareIt = bare.globalMatch(notes);
    while (bareIt.hasNext()) urls << bareIt.next().captured(0);
    return urls;
}

QString formatNoteWithUrls(const QString &note, const QStringList &urls) {
    const QString cleanNote = removeUrlSections(note).trimmed();
    QStringList valid;
    for (const QString &u : urls) {
        if (isValidUrl(u)) valid << u;
    }
    if (valid.isEmpty()) return cleanNote;

    const QString section = formatUrlSection(valid);
    if (cleanNote.isEmpty()) return section;
    return cleanNote + QStringLiteral("\n\n") + section;
}

QString combineNoteWithUrl(const QString &note, const QString &url) {
    if (url.isEmpty() || !isValidUrl(url)) return note;
    return formatNoteWithUrls(note, {url});
}

ParsedNote parseReminderNote(const QString &notes) {
    ParsedNote parsed;
    if (notes.isEmpty()) return parsed;
    parsed.urls = extractUrlsFromNotes(notes);
    parsed.note = removeUrlSections(notes);
    return parsed;
}

} // namespace reminders
