#pragma once

#include "core/Errors.h"
#include "helper/Reminder.h"
#include "process/ProcessRunner.h"
#include "script/ScriptBuilder.h"
#include "store/ReminderFilter.h"

namespace reminders {

class RuntimeContext;

// Reads go through the GetReminders helper transcript; writes go through a
// synthesized script fed to the automation interpreter on stdin.
class ReminderStore {
public:
    explicit ReminderStore(RuntimeContext &ctx);

    bool fetch(bool showCompleted, Transcript *out, BridgeError *errOut);

    bool findReminders(const ReminderFilter &filter, QVector<Reminder> *out, BridgeError *errOut);
    // First reminder whose title matches exactly; NotFound when there is none.
    bool findReminderByTitle(const QString &title, const QString &list, Reminder *out, BridgeError *errOut);
    bool findAllLists(QVector<ReminderList> *out, BridgeError *errOut);
    bool listExists(const QString &name, bool *existsOut, BridgeError *errOut);

    bool createReminder(const CreateReminderRequest &request, BridgeError *errOut);
    bool updateReminder(const UpdateReminderRequest &request, BridgeError *errOut);
    bool deleteReminder(const DeleteReminderRequest &request, BridgeError *errOut);
    bool moveReminder(const MoveReminderRequest &request, BridgeError *errOut);
    bool createList(const CreateListRequest &request, BridgeError *errOut);
    bool renameList(const RenameListRequest &request, BridgeError *errOut);
    bool deleteList(const DeleteListRequest &request, BridgeError *errOut);

    // Script text for request without running it.
    bool scriptFor(const ScriptRequest &request, QString *scriptOut, BridgeError *errOut);

    bool execute(const ScriptRequest &request, QString *outputOut, BridgeError *errOut);

private:
    RuntimeContext &m_ctx;
};

// Maps a failed automation run to a BridgeError. Script-raised "not found"
// errors become NotFound; everything else is a process or timeout error.
void classifyAutomationFailure(const QString &program, const ProcessResult &result, BridgeError *errOut);

} // namespace reminders
