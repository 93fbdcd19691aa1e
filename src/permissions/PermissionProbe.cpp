#include "permissions/PermissionProbe.h"

#include "core/Log.h"
#include "core/RuntimeContext.h"
#include "process/ProcessRunner.h"

#include <QFuture>

namespace reminders {

const QString kCheckPermissionsArg = QStringLiteral("--check-permissions");
const QString kAutomationProbeScript = QStringLiteral("tell application \"Reminders\" to get the name of every list");

namespace {

enum class Probe {
    DataAccess,
    Automation,
};

QString probeLabel(Probe probe) {
    return probe == Probe::DataAccess ? QStringLiteral("Reminders data access") : QStringLiteral("Automation");
}

PermissionStatus failure(const QString &error, bool requiresUserAction) {
    PermissionStatus s;
    s.granted = false;
    s.error = error;
    s.requiresUserAction = requiresUserAction;
    return s;
}

QString deniedGuidance(Probe probe) {
    if (probe == Probe::DataAccess) {
        return QStringLiteral("Reminders data access denied. Grant access in System Settings > Privacy & Security > Reminders");
    }
    return QStringLiteral("Automation permission denied. Grant access in System Settings > Privacy & Security > Automation");
}

PermissionStatus classify(Probe probe, const ProcessResult &r) {
    switch (r.status) {
    case ProcessResult::Status::Finished:
        if (probe == Probe::DataAccess || !r.stdoutText().trimmed().isEmpty()) {
            PermissionStatus ok;
            ok.granted = true;
            return ok;
        }
        break;
    case ProcessResult::Status::FailedToStart:
        return failure(QStringLiteral("Failed to check %1 permissions: %2").arg(probeLabel(probe), r.errorString), true);
    case ProcessResult::Status::TimedOut:
        return failure(QStringLiteral("%1 permission check timed out").arg(probeLabel(probe)), true);
    case ProcessResult::Status::NonZeroExit:
    case ProcessResult::Status::Crashed:
        break;
    }

    const QString err = r.stderrText();
    if (looksLikePermissionError(err)) return failure(deniedGuidance(probe), true);
    return failure(QStringLiteral("%1 check failed: %2").arg(probeLabel(probe), err.trimmed()), false);
}

QString dataAccessSection() {
    return QStringLiteral("Reminders data access:\n"
                          "   - Open System Settings > Privacy & Security > Reminders\n"
                          "   - Find your terminal or application in the list\n"
                          "   - Enable access by toggling the switch\n");
}

QString automationSection() {
    return QStringLiteral("Automation of Reminders:\n"
                          "   - Open System Settings > Privacy & Security > Automation\n"
                          "   - Find your terminal or application in the list\n"
                          "   - Expand it and enable \"Reminders\" access\n"
                          "   - You may also need to allow \"System Events\" if prompted\n");
}

}

bool looksLikePermissionError(const QString &stderrText) {
    static const QStringList keywords = {
        QStringLiteral("permission"),
        QStringLiteral("denied"),
        QStringLiteral("access"),
        QStringLiteral("authorization"),
        QStringLiteral("not authorized"),
    };
    const QString lower = stderrText.toLower();
    for (const QString &k : keywords) {
        if (lower.contains(k)) return true;
    }
    return false;
}

PermissionStatus checkDataAccess(const QString &helperPath, int timeoutMs) {
    if (helperPath.isEmpty()) return failure(QStringLiteral("GetReminders helper is not available"), true);
    const ProcessResult r = runProcess(helperPath, {kCheckPermissionsArg}, timeoutMs);
    return classify(Probe::DataAccess, r);
}

PermissionStatus checkAutomation(const QString &automationExecutable, int timeoutMs) {
    const ProcessResult r = runProcess(automationExecutable, {QStringLiteral("-e"), kAutomationProbeScript}, timeoutMs);
    return classify(Probe::Automation, r);
}

SystemPermissions checkAllPermissions(const QString &helperPath, const QString &automationExecutable,
                                      int dataAccessTimeoutMs, int automationTimeoutMs) {
    SystemPermissions perms;
    if (helperPath.isEmpty()) {
        perms.dataAccess = checkDataAccess(helperPath, dataAccessTimeoutMs);
        perms.automation = checkAutomation(automationExecutable, automationTimeoutMs);
    } else {
        QFuture<ProcessResult> data = runProcessAsync(helperPath, {kCheckPermissionsArg}, dataAccessTimeoutMs);
        QFuture<ProcessResult> automation =
            runProcessAsync(automationExecutable, {QStringLiteral("-e"), kAutomationProbeScript}, automationTimeoutMs);
        perms.dataAccess = classify(Probe::DataAccess, data.result());
        perms.automation = classify(Probe::Automation, automation.result());
    }
    perms.allGranted = perms.dataAccess.granted && perms.automation.granted;
    debugLog(QStringLiteral("permissions: data_access=%1 automation=%2")
                 .arg(perms.dataAccess.granted ? QStringLiteral("granted") : QStringLiteral("denied"),
                      perms.automation.granted ? QStringLiteral("granted") : QStringLiteral("denied")));
    return perms;
}

QString generatePermissionGuidance(const SystemPermissions &permissions) {
    if (permissions.allGranted) return QStringLiteral("All permissions granted");

    QStringList sections;
    sections << QStringLiteral("reminders-bridge requires the following permissions:\n");
    if (!permissions.dataAccess.granted) sections << dataAccessSection();
    if (!permissions.automation.granted) sections << automationSection();
    sections << QStringLiteral("After granting permissions:\n"
                               "   1. Restart your terminal or application\n"
                               "   2. Run the command again\n"
                               "   3. The system may prompt you to confirm access, click \"Allow\"\n");
    sections << QStringLiteral("If you continue having issues, try:\n"
                               "   - Logging out and back in to macOS\n"
                               "   - Checking Console.app for permission-related errors");
    return sections.join(QLatin1Char('\n'));
}

QStringList permissionErrorDetails(const SystemPermissions &permissions) {
    QStringList details;
    if (!permissions.dataAccess.granted) details << QStringLiteral("Data access: ") + permissions.dataAccess.error;
    if (!permissions.automation.granted) details << QStringLiteral("Automation: ") + permissions.automation.error;
    return details;
}

PermissionStatus requestDataAccess(const QString &helperPath, int timeoutMs) {
    if (helperPath.isEmpty()) return failure(QStringLiteral("GetReminders helper is not available"), true);
    debugLog(QStringLiteral("permissions: requesting data access via ") + helperPath);
    const ProcessResult r = runProcess(helperPath, {}, timeoutMs);
    switch (r.status) {
    case ProcessResult::Status::Finished: {
        PermissionStatus ok;
        ok.granted = true;
        return ok;
    }
    case ProcessResult::Status::TimedOut:
        return failure(QStringLiteral("Permission request timed out, the access dialog may have been dismissed"), true);
    case ProcessResult::Status::FailedToStart:
        return failure(QStringLiteral("Failed to request data access: ") + r.errorString, true);
    case ProcessResult::Status::NonZeroExit:
    case ProcessResult::Status::Crashed:
        break;
    }
    const QString err = r.stderrText().trimmed();
    return failure(err.isEmpty() ? QStringLiteral("Data access request failed") : err, true);
}

bool ensurePermissions(RuntimeContext &ctx, BridgeError *errOut) {
    const BridgeConfig &cfg = ctx.config();
    QString helper;
    if (!ctx.verifiedHelperPath(&helper, errOut)) return false;
    SystemPermissions perms = checkAllPermissions(helper, cfg.automationExecutable,
                                                  cfg.dataAccessProbeTimeoutMs, cfg.automationProbeTimeoutMs);

    if (!perms.allGranted && !perms.dataAccess.granted) {
        const PermissionStatus requested = requestDataAccess(helper, cfg.dataAccessProbeTimeoutMs * 3);
        if (requested.granted) {
            perms = checkAllPermissions(helper, cfg.automationExecutable,
                                        cfg.dataAccessProbeTimeoutMs, cfg.automationProbeTimeoutMs);
        } else {
            debugLog(QStringLiteral("permissions: data access request failed: ") + requested.error);
        }
    }

    if (!perms.allGranted) {
        const QString guidance = generatePermissionGuidance(perms);
        const QStringList details = permissionErrorDetails(perms);
        logWarning(QStringLiteral("permissions: insufficient (%1)").arg(details.join(QStringLiteral("; "))));
        setError(errOut, ErrorKind::PermissionDenied, QStringLiteral("PERMISSION_DENIED"),
                 QStringLiteral("Permission verification failed:\n%1\n\n%2").arg(details.join(QLatin1Char('\n')), guidance));
        return false;
    }
    debugLog(QStringLiteral("permissions: verified"));
    return true;
}

} // namespace reminders
