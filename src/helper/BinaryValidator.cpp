#include "helper/BinaryValidator.h"

#include "core/Log.h"

#include <QCryptographicHash>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace reminders {

namespace {

const QStringList kDefaultAllowedPrefixes = {
    QStringLiteral("/dist/swift/bin/"),
    QStringLiteral("/src/swift/bin/"),
    QStringLiteral("/swift/bin/"),
};

bool fail(BinaryValidationError *errOut, const QString &code, const QString &message) {
    if (errOut) {
        errOut->code = code;
        errOut->message = message;
    }
    return false;
}

bool hasTraversalSegment(const QString &path) {
    const QStringList parts = path.split(QLatin1Char('/'));
    for (const QString &part : parts) {
        if (part == QLatin1String("..")) return true;
    }
    return false;
}

bool constantTimeEquals(const QString &expected, const QString &actual) {
    if (expected.size() != actual.size()) return false;
    int diff = 0;
    for (int i = 0; i < expected.size(); ++i) {
        diff |= (expected[i].unicode() ^ actual[i].unicode());
    }
    return diff == 0;
}

}

BinarySecurityConfig BinarySecurityConfig::anchoredTo(const QString &root) const {
    BinarySecurityConfig anchored = *this;
    anchored.allowedPrefixes.clear();
    QString base = QDir::cleanPath(root);
    if (base.endsWith(QLatin1Char('/'))) base.chop(1);
    for (const QString &prefix : allowedPrefixes) {
        anchored.allowedPrefixes << (prefix.startsWith(QLatin1Char('/')) ? base + prefix : base + QLatin1Char('/') + prefix);
    }
    return anchored;
}

BinarySecurityConfig binarySecurityConfigFor(Posture posture, const QString &expectedSha256) {
    BinarySecurityConfig cfg;
    cfg.allowedPrefixes = kDefaultAllowedPrefixes;
    switch (posture) {
    case Posture::Test:
        cfg.requireAbsolutePath = false;
        cfg.maxFileSize = 100LL * 1024 * 1024;
        break;
    case Posture::Development:
        cfg.maxFileSize = 100LL * 1024 * 1024;
        break;
    case Posture::Production:
        cfg.maxFileSize = 50LL * 1024 * 1024;
        cfg.requireAbsolutePath = true;
        cfg.expectedSha256 = expectedSha256.trimmed().toLower();
        break;
    }
    return cfg;
}

bool validateBinaryPath(const QString &path, const BinarySecurityConfig &config, BinaryValidationError *errOut) {
    if (config.requireAbsolutePath && !QDir::isAbsolutePath(path)) {
        return fail(errOut, QStringLiteral("INVALID_PATH"), QStringLiteral("Binary path must be absolute"));
    }
    if (hasTraversalSegment(path)) {
        return fail(errOut, QStringLiteral("PATH_TRAVERSAL"), QStringLiteral("Path traversal detected in binary path"));
    }

    const QString normalized = QDir::cleanPath(QFileInfo(path).absoluteFilePath());
    if (normalized != path) {
        debugLog(QStringLiteral("binary_path: normalized %1 to %2").arg(path, normalized));
    }

    bool allowed = false;
    for (const QString &prefix : config.allowedPrefixes) {
        if (normalized.startsWith(prefix)) {
            allowed = true;
            break;
        }
    }
    if (!allowed) {
        return fail(errOut, QStringLiteral("FORBIDDEN_PATH"), QStringLiteral("Binary path not in allowed directories"));
    }

    const QByteArray encoded = QFile::encodeName(normalized);
    struct stat st{};
    if (::lstat(encoded.constData(), &st) != 0) {
        return fail(errOut, QStringLiteral("FILE_NOT_FOUND"), QStringLiteral("Binary file not found: %1").arg(normalized));
    }
    if (S_ISLNK(st.st_mode)) {
        return fail(errOut, QStringLiteral("SYMLINK_NOT_ALLOWED"), QStringLiteral("Binary path is a symbolic link: %1").arg(normalized));
    }
    if (!S_ISREG(st.st_mode)) {
        return fail(errOut, QStringLiteral("NOT_A_FILE"), QStringLiteral("Binary path does not point to a file"));
    }
    if (static_cast<qint64>(st.st_size) > config.maxFileSize) {
        return fail(errOut, QStringLiteral("FILE_TOO_LARGE"),
                    QStringLiteral("Binary file too large: %1 bytes").arg(static_cast<qint64>(st.st_size)));
    }
    if ((st.st_mode & (S_IXUSR | S_IXGRP | S_IXOTH)) == 0 || ::access(encoded.constData(), X_OK) != 0) {
        return fail(errOut, QStringLiteral("NOT_EXECUTABLE"), QStringLiteral("Binary file is not executable"));
    }
    return true;
}

bool calculateBinaryHash(const QString &path, QString *hashOut, BinaryValidationError *errOut) {
    const QByteArray pba = QFile::encodeName(path);
    int fd = ::open(pba.constData(), O_RDONLY | O_CLOEXEC | O_NOFOLLOW);
    if (fd < 0) {
        return fail(errOut, QStringLiteral("HASH_CALCULATION_FAILED"),
                    QStringLiteral("Failed to calculate binary hash: %1").arg(QString::fromUtf8(strerror(errno))));
    }
    QCryptographicHash h(QCryptographicHash::Sha256);
    char buf[1 << 16];
    for (;;) {
        ssize_t n = ::read(fd, buf, sizeof buf);
        if (n < 0) {
            if (errno == EINTR) continue;
            const QString reason = QString::fromUtf8(strerror(errno));
            ::close(fd);
            return fail(errOut, QStringLiteral("HASH_CALCULATION_FAILED"),
                        QStringLiteral("Failed to calculate binary hash: %1").arg(reason));
        }
        if (n == 0) break;
        h.addData(QByteArrayView(buf, n));
    }
    ::close(fd);
    if (hashOut) *hashOut = QString::fromLatin1(h.result().toHex()).toLower();
    return true;
}

bool validateBinaryIntegrity(const QString &path, const QString &expectedSha256) {
    QString actual;
    BinaryValidationError err;
    if (!calculateBinaryHash(path, &actual, &err)) {
        debugLog(QStringLiteral("binary_integrity: ") + err.message);
        return false;
    }
    const QString expected = expectedSha256.trimmed().toLower();
    if (!constantTimeEquals(expected, actual)) {
        logWarning(QStringLiteral("binary_integrity_fail: path=%1 expected=%2 actual=%3").arg(path, expected, actual));
        return false;
    }
    return true;
}

BinaryValidationResult validateBinarySecurity(const QString &path, const BinarySecurityConfig &config) {
    BinaryValidationResult result;
    BinaryValidationError err;
    if (!validateBinaryPath(path, config, &err)) {
        result.errors << QStringLiteral("%1: %2").arg(err.code, err.message);
        return result;
    }
    if (!calculateBinaryHash(path, &result.sha256, &err)) {
        result.errors << QStringLiteral("%1: %2").arg(err.code, err.message);
        return result;
    }
    if (!config.expectedSha256.isEmpty()) {
        if (!constantTimeEquals(config.expectedSha256.trimmed().toLower(), result.sha256)) {
            logWarning(QStringLiteral("binary_integrity_fail: path=%1 expected=%2 actual=%3")
                           .arg(path, config.expectedSha256, result.sha256));
            result.errors << QStringLiteral("HASH_MISMATCH: Binary integrity check failed - hash mismatch");
            return result;
        }
    }
    debugLog(QStringLiteral("binary_validation_ok: path=%1 sha256=%2").arg(path, result.sha256));
    result.isValid = true;
    return result;
}

QString findSecureBinaryPath(const QStringList &candidates, const BinarySecurityConfig &config,
                             BinaryValidationResult *resultOut) {
    for (const QString &candidate : candidates) {
        const BinaryValidationResult r = validateBinarySecurity(candidate, config);
        if (r.isValid) {
            if (resultOut) *resultOut = r;
            return candidate;
        }
        debugLog(QStringLiteral("binary_candidate_rejected: %1 (%2)").arg(candidate, r.errors.join(QStringLiteral(", "))));
        if (resultOut) *resultOut = r;
    }
    return QString();
}

} // namespace reminders
