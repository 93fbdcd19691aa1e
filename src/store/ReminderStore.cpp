#include "store/ReminderStore.h"

#include "core/Log.h"
#include "core/RuntimeContext.h"
#include "helper/TranscriptParser.h"

#include <QRegularExpression>

namespace reminders {

namespace {

void classifyHelperFailure(const QString &program, const ProcessResult &result, BridgeError *errOut) {
    const QString detail = describeProcessFailure(program, result);
    switch (result.status) {
    case ProcessResult::Status::TimedOut:
        setError(errOut, ErrorKind::Timeout, QStringLiteral("TIMEOUT"), detail);
        break;
    case ProcessResult::Status::FailedToStart:
        setError(errOut, ErrorKind::ProcessExecution, QStringLiteral("SPAWN_FAILED"), detail);
        break;
    default:
        setError(errOut, ErrorKind::ProcessExecution, QStringLiteral("PROCESS_FAILED"), detail);
        break;
    }
}

}

void classifyAutomationFailure(const QString &program, const ProcessResult &result, BridgeError *errOut) {
    if (result.status == ProcessResult::Status::NonZeroExit) {
        static const QRegularExpression re(QStringLiteral("execution error: (.*) \\((-?\\d+)\\)\\s*$"),
                                           QRegularExpression::DotMatchesEverythingOption);
        const auto m = re.match(result.stderrText());
        if (m.hasMatch()) {
            const QString message = m.captured(1).trimmed();
            if (message.startsWith(QLatin1String("Reminder not found")) || message.startsWith(QLatin1String("List not found"))) {
                setError(errOut, ErrorKind::NotFound, QStringLiteral("NOT_FOUND"), message);
                return;
            }
            setError(errOut, ErrorKind::ProcessExecution, QStringLiteral("SCRIPT_ERROR"),
                     QStringLiteral("%1 (%2)").arg(message, m.captured(2)));
            return;
        }
    }
    classifyHelperFailure(program, result, errOut);
}

ReminderStore::ReminderStore(RuntimeContext &ctx) : m_ctx(ctx) {}

bool ReminderStore::fetch(bool showCompleted, Transcript *out, BridgeError *errOut) {
    QString helper;
    if (!m_ctx.verifiedHelperPath(&helper, errOut)) return false;

    QStringList args;
    if (showCompleted) args << QStringLiteral("--show-completed");
    const ProcessResult r = runProcess(helper, args, m_ctx.config().helperTimeoutMs);
    if (!r.ok()) {
        BridgeError err;
        classifyHelperFailure(helper, r, &err);
        logWarning(QStringLiteral("helper_failed: ") + err.message);
        if (errOut) *errOut = err;
        return false;
    }
    if (out) *out = parseTranscript(r.stdoutText());
    return true;
}

bool ReminderStore::findReminders(const ReminderFilter &filter, QVector<Reminder> *out, BridgeError *errOut) {
    Transcript t;
    if (!fetch(filter.showCompleted.value_or(false), &t, errOut)) return false;
    if (out) *out = applyReminderFilter(t.reminders, filter);
    return true;
}

bool ReminderStore::findReminderByTitle(const QString &title, const QString &list, Reminder *out, BridgeError *errOut) {
    ReminderFilter filter;
    filter.showCompleted = true;
    filter.list = list;
    QVector<Reminder> found;
    if (!findReminders(filter, &found, errOut)) return false;
    for (const Reminder &r : found) {
        if (r.title == title) {
            if (out) *out = r;
            return true;
        }
    }
    setError(errOut, ErrorKind::NotFound, QStringLiteral("NOT_FOUND"),
             list.isEmpty() ? notFoundReminderMessage(title) : notFoundInListMessage(list, title));
    return false;
}

bool ReminderStore::findAllLists(QVector<ReminderList> *out, BridgeError *errOut) {
    Transcript t;
    if (!fetch(false, &t, errOut)) return false;
    if (out) *out = t.lists;
    return true;
}

bool ReminderStore::listExists(const QString &name, bool *existsOut, BridgeError *errOut) {
    QVector<ReminderList> lists;
    if (!findAllLists(&lists, errOut)) return false;
    bool exists = false;
    for (const ReminderList &l : lists) {
        if (l.title == name) {
            exists = true;
            break;
        }
    }
    if (existsOut) *existsOut = exists;
    return true;
}

bool ReminderStore::createReminder(const CreateReminderRequest &request, BridgeError *errOut) {
    return execute(request, nullptr, errOut);
}

bool ReminderStore::updateReminder(const UpdateReminderRequest &request, BridgeError *errOut) {
    return execute(request, nullptr, errOut);
}

bool ReminderStore::deleteReminder(const DeleteReminderRequest &request, BridgeError *errOut) {
    return execute(request, nullptr, errOut);
}

bool ReminderStore::moveReminder(const MoveReminderRequest &request, BridgeError *errOut) {
    return execute(request, nullptr, errOut);
}

bool ReminderStore::createList(const CreateListRequest &request, BridgeError *errOut) {
    return execute(request, nullptr, errOut);
}

bool ReminderStore::renameList(const RenameListRequest &request, BridgeError *errOut) {
    return execute(request, nullptr, errOut);
}

bool ReminderStore::deleteList(const DeleteListRequest &request, BridgeError *errOut) {
    return execute(request, nullptr, errOut);
}

bool ReminderStore::scriptFor(const ScriptRequest &request, QString *scriptOut, BridgeError *errOut) {
    ScriptOptions options;
    options.use24Hour = m_ctx.clock().use24Hour();
    QString err;
    if (!buildScript(request, options, scriptOut, &err)) {
        setError(errOut, ErrorKind::InvalidInput, QStringLiteral("INVALID_DATE"), err);
        return false;
    }
    return true;
}

bool ReminderStore::execute(const ScriptRequest &request, QString *outputOut, BridgeError *errOut) {
    QString script;
    if (!scriptFor(request, &script, errOut)) return false;

    const QString op = operationName(request);
    debugLog(QStringLiteral("script for %1:\n%2").arg(op, script));

    const QString exe = m_ctx.config().automationExecutable;
    const QByteArray input = script.toUtf8();
    const ProcessResult r = runProcess(exe, {QStringLiteral("-")}, m_ctx.config().automationTimeoutMs, &input);
    if (!r.ok()) {
        BridgeError err;
        classifyAutomationFailure(exe, r, &err);
        logWarning(QStringLiteral("automation_failed: op=%1 kind=%2").arg(op, errorKindName(err.kind)));
        if (errOut) *errOut = err;
        return false;
    }
    if (outputOut) *outputOut = r.stdoutText().trimmed();
    logEvent(QStringLiteral("automation_ok: op=") + op);
    return true;
}

} // namespace reminders
