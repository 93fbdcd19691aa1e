#include "core/Errors.h"

#include "core/Log.h"

namespace reminders {

QString errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None: return QStringLiteral("none");
    case ErrorKind::BinaryValidation: return QStringLiteral("binary_validation");
    case ErrorKind::NotFound: return QStringLiteral("not_found");
    case ErrorKind::ProcessExecution: return QStringLiteral("process_execution");
    case ErrorKind::Timeout: return QStringLiteral("timeout");
    case ErrorKind::PermissionDenied: return QStringLiteral("permission_denied");
    case ErrorKind::InvalidInput: return QStringLiteral("invalid_input");
    }
    return QStringLiteral("unknown");
}

QString userMessage(const QString &operation, const BridgeError &error, Posture posture) {
    switch (error.kind) {
    case ErrorKind::NotFound:
    case ErrorKind::InvalidInput:
    case ErrorKind::PermissionDenied:
        return QStringLiteral("Failed to %1: %2").arg(operation, error.message);
    default:
        break;
    }
    if (posture == Posture::Development || debugEnabled()) {
        if (!error.code.isEmpty()) {
            return QStringLiteral("Failed to %1: [%2] %3").arg(operation, error.code, error.message);
        }
        return QStringLiteral("Failed to %1: %2").arg(operation, error.message);
    }
    return QStringLiteral("Failed to %1: System error occurred").arg(operation);
}

} // namespace reminders
