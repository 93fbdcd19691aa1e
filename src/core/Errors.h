#pragma once

#include "core/Config.h"

#include <QString>

namespace reminders {

enum class ErrorKind {
    None,
    BinaryValidation,
    NotFound,
    ProcessExecution,
    Timeout,
    PermissionDenied,
    InvalidInput,
};

struct BridgeError {
    ErrorKind kind = ErrorKind::None;
    QString code;
    QString message;

    bool isSet() const { return kind != ErrorKind::None; }
};

inline void setError(BridgeError *errOut, ErrorKind kind, const QString &code, const QString &message) {
    if (!errOut) return;
    errOut->kind = kind;
    errOut->code = code;
    errOut->message = message;
}

QString errorKindName(ErrorKind kind);

// Single human-readable failure string for the caller. Internal detail of
// process and validation failures is only shown in development posture or
// when debug logging is on.
QString userMessage(const QString &operation, const BridgeError &error, Posture posture);

} // namespace reminders
