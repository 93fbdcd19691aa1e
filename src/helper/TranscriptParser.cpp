#include "helper/TranscriptParser.h"

#include "core/Log.h"

#include <QRegularExpression>
#include <functional>

namespace reminders {

const QString kListsHeader = QStringLiteral("=== REMINDER LISTS ===");
const QString kRemindersHeader = QStringLiteral("=== ALL REMINDERS ===");
const QString kBlockSeparator = QStringLiteral("-------------------");

namespace {

struct PartialReminder {
    std::optional<QString> title;
    std::optional<QString> dueDate;
    std::optional<QString> notes;
    std::optional<QString> url;
    std::optional<QString> list;
    QVariant completed = false;
};

std::optional<QString> nonEmpty(const QString &value) {
    const QString t = value.trimmed();
    if (t.isEmpty()) return std::nullopt;
    return t;
}

struct FieldParser {
    QString prefix;
    std::function<void(PartialReminder &, const QString &)> apply;
};

const QVector<FieldParser> &fieldParsers() {
    static const QVector<FieldParser> parsers = {
        {QStringLiteral("Title:"), [](PartialReminder &r, const QString &v) { r.title = nonEmpty(v); }},
        {QStringLiteral("Due Date:"), [](PartialReminder &r, const QString &v) { r.dueDate = nonEmpty(v); }},
        {QStringLiteral("Notes:"), [](PartialReminder &r, const QString &v) { r.notes = nonEmpty(v); }},
        {QStringLiteral("URL:"), [](PartialReminder &r, const QString &v) { r.url = nonEmpty(v); }},
        {QStringLiteral("List:"), [](PartialReminder &r, const QString &v) { r.list = nonEmpty(v); }},
        {QStringLiteral("Status:"), [](PartialReminder &r, const QString &v) {
            r.completed = (v.trimmed() == QLatin1String("Completed"));
        }},
        {QStringLiteral("Raw isCompleted value:"), [](PartialReminder &r, const QString &v) {
            r.completed = v.trimmed();
        }},
    };
    return parsers;
}

}

TranscriptSections splitIntoSections(const QString &output) {
    TranscriptSections sections;
    QStringList *current = nullptr;
    const QStringList lines = output.split(QLatin1Char('\n'));
    for (QString line : lines) {
        if (line.endsWith(QLatin1Char('\r'))) line.chop(1);
        if (line.contains(kListsHeader)) {
            current = &sections.lists;
        } else if (line.contains(kRemindersHeader)) {
            current = &sections.reminders;
        } else if (current && !line.trimmed().isEmpty()) {
            current->append(line);
        }
    }
    return sections;
}

QVector<ReminderList> parseLists(const QStringList &lines) {
    static const QRegularExpression re(QStringLiteral("^(\\d+)\\.\\s(.+)$"));
    QVector<ReminderList> lists;
    for (const QString &line : lines) {
        const auto m = re.match(line);
        if (!m.hasMatch()) {
            debugLog(QStringLiteral("transcript: skipping list line: ") + line);
            continue;
        }
        bool ok = false;
        const int id = m.captured(1).toInt(&ok);
        if (!ok) continue;
        lists.append(ReminderList{id, m.captured(2)});
    }
    return lists;
}

QVector<QStringList> groupReminderLines(const QStringList &lines) {
    QVector<QStringList> blocks;
    QStringList current;
    for (const QString &line : lines) {
        if (line == kBlockSeparator) {
            if (!current.isEmpty()) {
                blocks.append(current);
                current.clear();
            }
        } else {
            current.append(line);
        }
    }
    if (!current.isEmpty()) blocks.append(current);
    return blocks;
}

bool normalizeCompletionFlag(const QVariant &raw, const QString &title) {
    if (raw.typeId() == QMetaType::Bool) return raw.toBool();

    bool value = false;
    if (raw.typeId() == QMetaType::QString) {
        value = raw.toString().compare(QLatin1String("true"), Qt::CaseInsensitive) == 0;
    } else if (!raw.isValid() || raw.isNull()) {
        value = false;
    } else {
        bool ok = false;
        const double number = raw.toDouble(&ok);
        value = ok ? number != 0.0 : raw.toBool();
    }
    logWarning(QStringLiteral("transcript: reminder \"%1\" has non-boolean completion value %2 (%3), normalized to %4")
                   .arg(title, raw.toString(), QString::fromLatin1(raw.typeName() ? raw.typeName() : "undefined"),
                        value ? QStringLiteral("true") : QStringLiteral("false")));
    return value;
}

bool parseReminderBlock(const QStringList &block, Reminder *out) {
    PartialReminder partial;
    const auto &parsers = fieldParsers();
    for (const QString &line : block) {
        for (const FieldParser &parser : parsers) {
            if (line.startsWith(parser.prefix)) {
                parser.apply(partial, line.mid(parser.prefix.size()));
                break;
            }
        }
    }

    if (!partial.title || !partial.list) {
        logWarning(QStringLiteral("transcript: skipping reminder with missing required fields (title=%1, list=%2)")
                       .arg(partial.title.value_or(QStringLiteral("<none>")), partial.list.value_or(QStringLiteral("<none>"))));
        return false;
    }

    if (out) {
        out->title = *partial.title;
        out->dueDate = partial.dueDate;
        out->notes = partial.notes;
        out->url = partial.url;
        out->list = *partial.list;
        out->isCompleted = normalizeCompletionFlag(partial.completed, out->title);
    }
    return true;
}

Transcript parseTranscript(const QString &output) {
    const TranscriptSections sections = splitIntoSections(output);
    Transcript transcript;
    transcript.lists = parseLists(sections.lists);
    for (const QStringList &block : groupReminderLines(sections.reminders)) {
        Reminder r;
        if (parseReminderBlock(block, &r)) transcript.reminders.append(r);
    }
    debugLog(QStringLiteral("transcript: parsed %1 lists, %2 reminders")
                 .arg(QString::number(transcript.lists.size()), QString::number(transcript.reminders.size())));
    return transcript;
}

} // namespace reminders
