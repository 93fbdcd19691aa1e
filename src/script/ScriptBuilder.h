#pragma once

#include <QString>
#include <optional>
#include <variant>

namespace reminders {

struct CreateReminderRequest {
    QString title;
    std::optional<QString> dueDate;
    std::optional<QString> note;
    std::optional<QString> url;
    std::optional<QString> list;
};

struct UpdateReminderRequest {
    QString title;
    std::optional<QString> list;
    std::optional<QString> newTitle;
    std::optional<QString> dueDate;
    std::optional<QString> note;
    std::optional<QString> url;
    std::optional<bool> completed;
};

struct DeleteReminderRequest {
    QString title;
    std::optional<QString> list;
};

struct MoveReminderRequest {
    QString title;
    QString fromList;
    QString toList;
};

struct CreateListRequest {
    QString name;
};

struct RenameListRequest {
    QString currentName;
    QString newName;
};

struct DeleteListRequest {
    QString name;
};

using ScriptRequest = std::variant<CreateReminderRequest,
                                   UpdateReminderRequest,
                                   DeleteReminderRequest,
                                   MoveReminderRequest,
                                   CreateListRequest,
                                   RenameListRequest,
                                   DeleteListRequest>;

// Options captured once per build; the builders themselves hold no state.
struct ScriptOptions {
    bool use24Hour = false;
};

// Produces the full tell-block script for request. Fails only when a due
// date is not in an accepted shape, with the date error in errOut.
bool buildScript(const ScriptRequest &request, const ScriptOptions &options,
                 QString *scriptOut, QString *errOut);

QString operationName(const ScriptRequest &request);

QString notFoundReminderMessage(const QString &title);
QString notFoundInListMessage(const QString &list, const QString &title);
QString notFoundListMessage(const QString &list);

} // namespace reminders
