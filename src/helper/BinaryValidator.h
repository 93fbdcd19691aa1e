#pragma once

#include "core/Config.h"

#include <QString>
#include <QStringList>

namespace reminders {

struct BinarySecurityConfig {
    qint64 maxFileSize = 50LL * 1024 * 1024;
    QStringList allowedPrefixes;
    bool requireAbsolutePath = true;
    QString expectedSha256;

    // Root-relative allow-list entries ("/dist/swift/bin/") re-rooted under root.
    BinarySecurityConfig anchoredTo(const QString &root) const;
};

BinarySecurityConfig binarySecurityConfigFor(Posture posture, const QString &expectedSha256 = QString());

struct BinaryValidationError {
    QString code;
    QString message;
};

struct BinaryValidationResult {
    bool isValid = false;
    QString sha256;
    QStringList errors;
};

// Path, type, size and permission checks in a fixed order; the first failing
// check is reported.
bool validateBinaryPath(const QString &path, const BinarySecurityConfig &config, BinaryValidationError *errOut);

bool calculateBinaryHash(const QString &path, QString *hashOut, BinaryValidationError *errOut);

bool validateBinaryIntegrity(const QString &path, const QString &expectedSha256);

BinaryValidationResult validateBinarySecurity(const QString &path, const BinarySecurityConfig &config);

// First candidate passing every check, or an empty string.
QString findSecureBinaryPath(const QStringList &candidates, const BinarySecurityConfig &config,
                             BinaryValidationResult *resultOut = nullptr);

} // namespace reminders
