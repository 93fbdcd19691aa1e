#include "script/ScriptBuilder.h"

#include "script/DateFormat.h"
#include "script/Escape.h"
#include "script/UrlNotes.h"

#include <QStringList>

namespace reminders {

namespace {

bool hasText(const std::optional<QString> &value) {
    return value.has_value() && !value->isEmpty();
}

bool dueDateStatement(const QString &target, const QString &dueDate, const ScriptOptions &options,
                      QString *out, QString *errOut) {
    ParsedDate parsed;
    if (!parseDateWithType(dueDate, options.use24Hour, &parsed, errOut)) return false;
    const QString dateType = parsed.isDateOnly ? QStringLiteral("allday due date") : QStringLiteral("due date");
    *out = target.isEmpty()
        ? QStringLiteral("%1:date %2").arg(dateType, quoteScriptString(parsed.formatted))
        : QStringLiteral("  set %1 of %2 to date %3").arg(dateType, target, quoteScriptString(parsed.formatted));
    return true;
}

QStringList targetSelector(const QString &title, const std::optional<QString> &list) {
    QStringList lines;
    if (hasText(list)) {
        lines << QStringLiteral("set targetList to list %1").arg(quoteScriptString(*list));
        lines << QStringLiteral("set targetReminders to reminders of targetList whose name is %1").arg(quoteScriptString(title));
    } else {
        lines << QStringLiteral("set targetReminders to every reminder whose name is %1").arg(quoteScriptString(title));
    }
    return lines;
}

// Zero matches raise a script error; otherwise the first match is used even
// when several reminders share the title.
QStringList cardinalityGuard(const QString &errorMessage) {
    return {
        QStringLiteral("if (count of targetReminders) is 0 then"),
        QStringLiteral("  error %1").arg(quoteScriptString(errorMessage)),
        QStringLiteral("else"),
        QStringLiteral("  set targetReminder to first item of targetReminders"),
    };
}

struct Builder {
    const ScriptOptions &options;
    QString *scriptOut;
    QString *errOut;

    bool operator()(const CreateReminderRequest &r) const {
        QStringList lines;
        lines << (hasText(r.list)
                  ? QStringLiteral("set targetList to list %1").arg(quoteScriptString(*r.list))
                  : QStringLiteral("set targetList to default list"));

        QStringList props;
        props << QStringLiteral("name:%1").arg(quoteScriptString(r.title));
        if (hasText(r.dueDate)) {
            QString prop;
            if (!dueDateStatement(QString(), *r.dueDate, options, &prop, errOut)) return false;
            props << prop;
        }
        const QString body = combineNoteWithUrl(r.note.value_or(QString()), r.url.value_or(QString()));
        if (!body.isEmpty()) {
            props << QStringLiteral("body:%1").arg(quoteScriptString(body));
        }
        lines << QStringLiteral("set reminderProps to {%1}").arg(props.join(QStringLiteral(", ")));
        lines << QStringLiteral("set newReminder to make new reminder at end of targetList with properties reminderProps");
        *scriptOut = wrapRemindersScript(lines.join(QLatin1Char('\n')));
        return true;
    }

    bool operator()(const UpdateReminderRequest &r) const {
        QStringList lines = targetSelector(r.title, r.list);
        lines << cardinalityGuard(notFoundReminderMessage(r.title));

        if (hasText(r.newTitle)) {
            lines << QStringLiteral("  set name of targetReminder to %1").arg(quoteScriptString(*r.newTitle));
        }
        if (hasText(r.dueDate)) {
            QString stmt;
            if (!dueDateStatement(QStringLiteral("targetReminder"), *r.dueDate, options, &stmt, errOut)) return false;
            lines << stmt;
        }
        if (r.note.has_value()) {
            const QString body = combineNoteWithUrl(*r.note, r.url.value_or(QString()));
            lines << QStringLiteral("  set body of targetReminder to %1").arg(quoteScriptString(body));
        } else if (hasText(r.url) && isValidUrl(*r.url)) {
            const QString block = QStringLiteral("\n\n") + formatNoteWithUrls(QString(), {*r.url});
            lines << QStringLiteral("  set currentBody to body of targetReminder");
            lines << QStringLiteral("  if currentBody is missing value then set currentBody to \"\"");
            lines << QStringLiteral("  set body of targetReminder to currentBody & %1").arg(quoteScriptString(block));
        }
        if (r.completed.has_value()) {
            lines << QStringLiteral("  set completed of targetReminder to %1")
                         .arg(*r.completed ? QStringLiteral("true") : QStringLiteral("false"));
        }
        lines << QStringLiteral("end if");
        *scriptOut = wrapRemindersScript(lines.join(QLatin1Char('\n')));
        return true;
    }

    bool operator()(const DeleteReminderRequest &r) const {
        QStringList lines = targetSelector(r.title, r.list);
        lines << cardinalityGuard(notFoundReminderMessage(r.title));
        lines << QStringLiteral("  delete first item of targetReminders");
        lines << QStringLiteral("end if");
        *scriptOut = wrapRemindersScript(lines.join(QLatin1Char('\n')));
        return true;
    }

    bool operator()(const MoveReminderRequest &r) const {
        QStringList lines;
        lines << QStringLiteral("set sourceList to list %1").arg(quoteScriptString(r.fromList));
        lines << QStringLiteral("set destList to list %1").arg(quoteScriptString(r.toList));
        lines << QStringLiteral("set targetReminders to reminders of sourceList whose name is %1").arg(quoteScriptString(r.title));
        lines << cardinalityGuard(notFoundInListMessage(r.fromList, r.title));
        lines << QStringLiteral("  move targetReminder to destList");
        lines << QStringLiteral("end if");
        *scriptOut = wrapRemindersScript(lines.join(QLatin1Char('\n')));
        return true;
    }

    bool operator()(const CreateListRequest &r) const {
        *scriptOut = wrapRemindersScript(
            QStringLiteral("set newList to make new list with properties {name:%1}").arg(quoteScriptString(r.name)));
        return true;
    }

    bool operator()(const RenameListRequest &r) const {
        const QStringList lines = {
            QStringLiteral("set targetList to list %1").arg(quoteScriptString(r.currentName)),
            QStringLiteral("if targetList exists then"),
            QStringLiteral("  set name of targetList to %1").arg(quoteScriptString(r.newName)),
            QStringLiteral("else"),
            QStringLiteral("  error %1").arg(quoteScriptString(notFoundListMessage(r.currentName))),
            QStringLiteral("end if"),
        };
        *scriptOut = wrapRemindersScript(lines.join(QLatin1Char('\n')));
        return true;
    }

    bool operator()(const DeleteListRequest &r) const {
        const QStringList lines = {
            QStringLiteral("set targetList to list %1").arg(quoteScriptString(r.name)),
            QStringLiteral("if targetList exists then"),
            QStringLiteral("  delete targetList"),
            QStringLiteral("else"),
            QStringLiteral("  error %1").arg(quoteScriptString(notFoundListMessage(r.name))),
            QStringLiteral("end if"),
        };
        *scriptOut = wrapRemindersScript(lines.join(QLatin1Char('\n')));
        return true;
    }
};

struct OperationNamer {
    QString operator()(const CreateReminderRequest &) const { return QStringLiteral("create reminder"); }
    QString operator()(const UpdateReminderRequest &) const { return QStringLiteral("update reminder"); }
    QString operator()(const DeleteReminderRequest &) const { return QStringLiteral("delete reminder"); }
    QString operator()(const MoveReminderRequest &) const { return QStringLiteral("move reminder"); }
    QString operator()(const CreateListRequest &) const { return QStringLiteral("create reminder list"); }
    QString operator()(const RenameListRequest &) const { return QStringLiteral("update reminder list"); }
    QString operator()(const DeleteListRequest &) const { return QStringLiteral("delete reminder list"); }
};

}

bool buildScript(const ScriptRequest &request, const ScriptOptions &options,
                 QString *scriptOut, QString *errOut) {
    QString script;
    if (!std::visit(Builder{options, &script, errOut}, request)) return false;
    if (scriptOut) *scriptOut = script;
    return true;
}

QString operationName(const ScriptRequest &request) {
    return std::visit(OperationNamer{}, request);
}

QString notFoundReminderMessage(const QString &title) {
    return QStringLiteral("Reminder not found: %1").arg(title);
}

QString notFoundInListMessage(const QString &list, const QString &title) {
    return QStringLiteral("Reminder not found in list %1: %2").arg(list, title);
}

QString notFoundListMessage(const QString &list) {
    return QStringLiteral("List not found: %1").arg(list);
}

} // namespace reminders
