#pragma once

#include "core/Errors.h"

#include <QString>
#include <QStringList>

namespace reminders {

class RuntimeContext;

struct PermissionStatus {
    bool granted = false;
    QString error;
    bool requiresUserAction = false;
};

struct SystemPermissions {
    PermissionStatus dataAccess;
    PermissionStatus automation;
    bool allGranted = false;
};

extern const QString kCheckPermissionsArg;
extern const QString kAutomationProbeScript;

// True when stderr mentions one of the access-denial keywords.
bool looksLikePermissionError(const QString &stderrText);

PermissionStatus checkDataAccess(const QString &helperPath, int timeoutMs = 10000);
PermissionStatus checkAutomation(const QString &automationExecutable, int timeoutMs = 5000);

// Runs both probes concurrently.
SystemPermissions checkAllPermissions(const QString &helperPath, const QString &automationExecutable,
                                      int dataAccessTimeoutMs = 10000, int automationTimeoutMs = 5000);

QString generatePermissionGuidance(const SystemPermissions &permissions);
QStringList permissionErrorDetails(const SystemPermissions &permissions);

// Runs the helper with no arguments so the system shows its access prompt.
PermissionStatus requestDataAccess(const QString &helperPath, int timeoutMs = 30000);

bool ensurePermissions(RuntimeContext &ctx, BridgeError *errOut);

} // namespace reminders
