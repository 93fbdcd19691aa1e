#include "core/Config.h"
#include "core/Errors.h"
#include "core/Log.h"
#include "core/RuntimeContext.h"
#include "permissions/PermissionProbe.h"
#include "script/UrlNotes.h"
#include "store/ReminderStore.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTextStream>
#include <sys/resource.h>

using namespace reminders;

namespace {

QTextStream &out() {
    static QTextStream s(stdout);
    return s;
}

QTextStream &err() {
    static QTextStream s(stderr);
    return s;
}

std::optional<QString> optionValue(const QCommandLineParser &p, const QString &name) {
    if (!p.isSet(name)) return std::nullopt;
    return p.value(name);
}

QJsonObject reminderToJson(const Reminder &r) {
    QJsonObject o;
    o.insert("title", r.title);
    o.insert("list", r.list);
    o.insert("isCompleted", r.isCompleted);
    if (r.dueDate) o.insert("dueDate", *r.dueDate);
    if (r.notes) {
        const ParsedNote parsed = parseReminderNote(*r.notes);
        o.insert("notes", parsed.note);
        if (!parsed.urls.isEmpty()) o.insert("urls", QJsonArray::fromStringList(parsed.urls));
    }
    if (r.url) o.insert("url", *r.url);
    return o;
}

void printJson(const QJsonValue &value) {
    const QJsonDocument doc = value.isArray() ? QJsonDocument(value.toArray()) : QJsonDocument(value.toObject());
    out() << QString::fromUtf8(doc.toJson(QJsonDocument::Indented));
    out().flush();
}

int fail(const QString &operation, const BridgeError &error, Posture posture) {
    logEvent(QStringLiteral("command_failed: op=%1 kind=%2 code=%3").arg(operation, errorKindName(error.kind), error.code));
    err() << userMessage(operation, error, posture) << "\n";
    err().flush();
    return 1;
}

int usage(const QCommandLineParser &parser, const QString &message) {
    err() << message << "\n\n" << parser.helpText();
    err().flush();
    return 2;
}

bool requireOption(const QCommandLineParser &parser, const QString &name, QString *valueOut, QString *missing) {
    if (!parser.isSet(name) || parser.value(name).isEmpty()) {
        *missing = QStringLiteral("Missing required option --") + name;
        return false;
    }
    *valueOut = parser.value(name);
    return true;
}

bool buildRequest(const QString &command, const QCommandLineParser &parser, ScriptRequest *out, QString *problem) {
    if (command == QLatin1String("create")) {
        CreateReminderRequest r;
        if (!requireOption(parser, "title", &r.title, problem)) return false;
        r.dueDate = optionValue(parser, "due");
        r.note = optionValue(parser, "note");
        r.url = optionValue(parser, "url");
        r.list = optionValue(parser, "list");
        *out = r;
        return true;
    }
    if (command == QLatin1String("update")) {
        UpdateReminderRequest r;
        if (!requireOption(parser, "title", &r.title, problem)) return false;
        r.list = optionValue(parser, "list");
        r.newTitle = optionValue(parser, "new-title");
        r.dueDate = optionValue(parser, "due");
        r.note = optionValue(parser, "note");
        r.url = optionValue(parser, "url");
        if (parser.isSet("completed")) {
            const QString v = parser.value("completed").toLower();
            if (v != QLatin1String("true") && v != QLatin1String("false")) {
                *problem = QStringLiteral("--completed takes true or false");
                return false;
            }
            r.completed = (v == QLatin1String("true"));
        }
        *out = r;
        return true;
    }
    if (command == QLatin1String("delete")) {
        DeleteReminderRequest r;
        if (!requireOption(parser, "title", &r.title, problem)) return false;
        r.list = optionValue(parser, "list");
        *out = r;
        return true;
    }
    if (command == QLatin1String("move")) {
        MoveReminderRequest r;
        if (!requireOption(parser, "title", &r.title, problem)) return false;
        if (!requireOption(parser, "from", &r.fromList, problem)) return false;
        if (!requireOption(parser, "to", &r.toList, problem)) return false;
        *out = r;
        return true;
    }
    if (command == QLatin1String("create-list")) {
        CreateListRequest r;
        if (!requireOption(parser, "name", &r.name, problem)) return false;
        *out = r;
        return true;
    }
    if (command == QLatin1String("rename-list")) {
        RenameListRequest r;
        if (!requireOption(parser, "name", &r.currentName, problem)) return false;
        if (!requireOption(parser, "new-name", &r.newName, problem)) return false;
        *out = r;
        return true;
    }
    if (command == QLatin1String("delete-list")) {
        DeleteListRequest r;
        if (!requireOption(parser, "name", &r.name, problem)) return false;
        *out = r;
        return true;
    }
    *problem = QStringLiteral("Unknown command: ") + command;
    return false;
}

// Routes a parsed write request to the matching store operation.
struct WriteDispatch {
    ReminderStore &store;
    BridgeError *errOut;

    bool operator()(const CreateReminderRequest &r) const { return store.createReminder(r, errOut); }
    bool operator()(const UpdateReminderRequest &r) const { return store.updateReminder(r, errOut); }
    bool operator()(const DeleteReminderRequest &r) const { return store.deleteReminder(r, errOut); }
    bool operator()(const MoveReminderRequest &r) const { return store.moveReminder(r, errOut); }
    bool operator()(const CreateListRequest &r) const { return store.createList(r, errOut); }
    bool operator()(const RenameListRequest &r) const { return store.renameList(r, errOut); }
    bool operator()(const DeleteListRequest &r) const { return store.deleteList(r, errOut); }
};

int runPermissions(RuntimeContext &ctx) {
    const BridgeConfig &cfg = ctx.config();
    QString helper;
    BridgeError e;
    if (!ctx.verifiedHelperPath(&helper, &e)) return fail(QStringLiteral("check permissions"), e, cfg.posture);
    const SystemPermissions perms = checkAllPermissions(helper, cfg.automationExecutable,
                                                        cfg.dataAccessProbeTimeoutMs, cfg.automationProbeTimeoutMs);
    QJsonObject o;
    o.insert("allGranted", perms.allGranted);
    o.insert("dataAccess", perms.dataAccess.granted);
    o.insert("automation", perms.automation.granted);
    const QStringList details = permissionErrorDetails(perms);
    if (!details.isEmpty()) o.insert("errors", QJsonArray::fromStringList(details));
    o.insert("guidance", generatePermissionGuidance(perms));
    printJson(o);
    return perms.allGranted ? 0 : 1;
}

int runReminders(ReminderStore &store, const QCommandLineParser &parser, Posture posture) {
    ReminderFilter filter;
    filter.showCompleted = parser.isSet("show-completed");
    filter.list = parser.value("list");
    filter.search = parser.value("search");
    if (parser.isSet("due-within")) {
        DueFilter due;
        if (!dueFilterFromString(parser.value("due-within"), &due)) {
            BridgeError e;
            setError(&e, ErrorKind::InvalidInput, QStringLiteral("INVALID_FILTER"),
                     QStringLiteral("dueWithin must be one of today, tomorrow, this-week, overdue, no-date"));
            return fail(QStringLiteral("read reminders"), e, posture);
        }
        filter.dueWithin = due;
    }
    QVector<Reminder> found;
    BridgeError e;
    if (!store.findReminders(filter, &found, &e)) return fail(QStringLiteral("read reminders"), e, posture);
    QJsonArray arr;
    for (const Reminder &r : found) arr.append(reminderToJson(r));
    printJson(arr);
    return 0;
}

int runLists(ReminderStore &store, Posture posture) {
    QVector<ReminderList> lists;
    BridgeError e;
    if (!store.findAllLists(&lists, &e)) return fail(QStringLiteral("read reminder lists"), e, posture);
    QJsonArray arr;
    for (const ReminderList &l : lists) {
        QJsonObject o;
        o.insert("id", l.id);
        o.insert("title", l.title);
        arr.append(o);
    }
    printJson(arr);
    return 0;
}

}

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("reminders-bridge"));
    struct rlimit rlc{0, 0};
    setrlimit(RLIMIT_CORE, &rlc);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Manage Reminders items and lists"));
    parser.addHelpOption();
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("lists, reminders, create, update, delete, move, create-list, rename-list, delete-list, permissions"));
    parser.addOptions({
        {"dry-run", QStringLiteral("Print the generated script instead of running it")},
        {"title", QStringLiteral("Reminder title"), "title"},
        {"new-title", QStringLiteral("New reminder title"), "title"},
        {"list", QStringLiteral("List name"), "list"},
        {"due", QStringLiteral("Due date (YYYY-MM-DD, YYYY-MM-DD HH:mm:ss or ISO 8601)"), "date"},
        {"note", QStringLiteral("Note text"), "note"},
        {"url", QStringLiteral("URL to attach"), "url"},
        {"completed", QStringLiteral("Completion state (true or false)"), "bool"},
        {"from", QStringLiteral("Source list"), "list"},
        {"to", QStringLiteral("Target list"), "list"},
        {"name", QStringLiteral("List name"), "name"},
        {"new-name", QStringLiteral("New list name"), "name"},
        {"show-completed", QStringLiteral("Include completed reminders")},
        {"search", QStringLiteral("Case-insensitive text in title or notes"), "text"},
        {"due-within", QStringLiteral("today, tomorrow, this-week, overdue or no-date"), "range"},
    });
    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) return usage(parser, QStringLiteral("Expected exactly one command"));
    const QString command = positional.first();

    RuntimeContext ctx(readBridgeConfig());
    // Starts the background clock read so it can land while permissions are probed.
    ctx.clock().use24Hour();
    const Posture posture = ctx.config().posture;
    debugLog(QStringLiteral("startup: command=%1 posture=%2").arg(command, postureName(posture)));

    if (command == QLatin1String("permissions")) return runPermissions(ctx);

    ReminderStore store(ctx);
    const bool readCommand = command == QLatin1String("lists") || command == QLatin1String("reminders");
    ScriptRequest request;
    if (!readCommand) {
        QString problem;
        if (!buildRequest(command, parser, &request, &problem)) return usage(parser, problem);
    }

    if (readCommand && parser.isSet("dry-run")) return usage(parser, QStringLiteral("--dry-run applies to write commands only"));

    if (parser.isSet("dry-run")) {
        QString script;
        BridgeError e;
        if (!store.scriptFor(request, &script, &e)) return fail(operationName(request), e, posture);
        out() << script << "\n";
        out().flush();
        return 0;
    }

    BridgeError permErr;
    if (!ensurePermissions(ctx, &permErr)) {
        return fail(readCommand ? QStringLiteral("verify permissions") : operationName(request), permErr, posture);
    }

    if (command == QLatin1String("lists")) return runLists(store, posture);
    if (command == QLatin1String("reminders")) return runReminders(store, parser, posture);

    BridgeError e;
    if (!std::visit(WriteDispatch{store, &e}, request)) return fail(operationName(request), e, posture);
    out() << QStringLiteral("OK: ") << operationName(request) << "\n";
    out().flush();
    return 0;
}
