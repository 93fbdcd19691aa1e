#include "helper/HelperLocator.h"

#include "core/Log.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMutexLocker>

namespace reminders {

const QString kHelperBinaryName = QStringLiteral("GetReminders");
const QString kProjectMarkerFile = QStringLiteral("reminders-bridge.json");
const QString kProjectName = QStringLiteral("reminders-bridge");

namespace {

const QStringList kHelperSubdirs = {
    QStringLiteral("dist/swift/bin"),
    QStringLiteral("src/swift/bin"),
    QStringLiteral("swift/bin"),
};

}

bool isProjectRoot(const QString &dir) {
    QFile f(QDir(dir).filePath(kProjectMarkerFile));
    if (!f.open(QIODevice::ReadOnly)) return false;
    if (f.size() > (1 << 20)) {
        debugLog(QStringLiteral("project_marker: too large at ") + f.fileName());
        return false;
    }
    const auto doc = QJsonDocument::fromJson(f.readAll());
    if (!doc.isObject()) {
        debugLog(QStringLiteral("project_marker: invalid JSON at ") + f.fileName());
        return false;
    }
    const auto obj = doc.object();
    const int schema = obj.value(QStringLiteral("schema")).toInt(0);
    if (schema != 1) {
        debugLog(QStringLiteral("project_marker: schema mismatch (expected 1, got %1)").arg(schema));
        return false;
    }
    return obj.value(QStringLiteral("name")).toString() == kProjectName;
}

QString findProjectRoot(const QString &start, int maxDepth, bool *foundOut) {
    QString current = QDir::cleanPath(QFileInfo(start).absoluteFilePath());
    for (int depth = 0; depth < maxDepth; ++depth) {
        if (isProjectRoot(current)) {
            debugLog(QStringLiteral("project_root: ") + current);
            if (foundOut) *foundOut = true;
            return current;
        }
        QDir dir(current);
        if (!dir.cdUp()) break;
        const QString parent = dir.absolutePath();
        if (parent == current) break;
        current = parent;
    }
    if (foundOut) *foundOut = false;
    return QDir::cleanPath(QFileInfo(start).absoluteFilePath());
}

QStringList candidateHelperPaths(const QString &projectRoot) {
    QStringList paths;
    const QDir root(projectRoot);
    for (const QString &sub : kHelperSubdirs) {
        paths << QDir::cleanPath(root.filePath(sub + QLatin1Char('/') + kHelperBinaryName));
    }
    return paths;
}

HelperLocator::HelperLocator(const QString &searchStart, Posture posture, const QString &expectedSha256)
    : m_searchStart(searchStart), m_posture(posture), m_expectedSha256(expectedSha256) {}

QString HelperLocator::resolve() {
    QMutexLocker locker(&m_mutex);
    if (!m_resolved) {
        m_path = computePath(&m_root, &m_secure);
        ++m_computeCount;
        m_resolved = true;
    }
    return m_path;
}

bool HelperLocator::resolvedSecurely() {
    resolve();
    QMutexLocker locker(&m_mutex);
    return m_secure;
}

bool HelperLocator::verifiedPath(QString *pathOut, BridgeError *errOut) {
    const QString path = resolve();
    QString code, message;
    if (!checkHelperRunnable(path, &code, &message)) {
        logWarning(QStringLiteral("helper_unavailable: %1 %2").arg(code, path));
        setError(errOut, ErrorKind::BinaryValidation, code, message);
        return false;
    }

    QString root;
    bool secure = false;
    {
        QMutexLocker locker(&m_mutex);
        root = m_root;
        secure = m_secure;
    }
    if (!secure) {
        const BinarySecurityConfig config = binarySecurityConfigFor(m_posture, m_expectedSha256).anchoredTo(root);
        const BinaryValidationResult result = validateBinarySecurity(path, config);
        if (!result.isValid) {
            const QString reason = result.errors.join(QStringLiteral("; "));
            logEvent(QStringLiteral("helper_refused: path=%1 reason=%2").arg(path, reason));
            setError(errOut, ErrorKind::BinaryValidation, QStringLiteral("SECURITY_VALIDATION_FAILED"),
                     QStringLiteral("GetReminders helper failed security validation: ") + reason);
            return false;
        }
    }
    if (pathOut) *pathOut = path;
    return true;
}

#ifdef REMINDERS_TESTING
void HelperLocator::resetForTesting() {
    QMutexLocker locker(&m_mutex);
    m_resolved = false;
    m_secure = false;
    m_computeCount = 0;
    m_root.clear();
    m_path.clear();
}

int HelperLocator::computeCountForTesting() {
    QMutexLocker locker(&m_mutex);
    return m_computeCount;
}
#endif

QString HelperLocator::computePath(QString *rootOut, bool *secureOut) const {
    bool found = false;
    const QString root = findProjectRoot(m_searchStart, 10, &found);
    *rootOut = root;
    if (!found) {
        logWarning(QStringLiteral("project_root: marker %1 not found above %2").arg(kProjectMarkerFile, m_searchStart));
    }

    const BinarySecurityConfig config = binarySecurityConfigFor(m_posture, m_expectedSha256).anchoredTo(root);
    BinaryValidationResult result;
    const QString secure = findSecureBinaryPath(candidateHelperPaths(root), config, &result);
    if (!secure.isEmpty()) {
        debugLog(QStringLiteral("helper_path: %1 sha256=%2").arg(secure, result.sha256));
        *secureOut = true;
        return secure;
    }

    const QString fallback = candidateHelperPaths(root).first();
    logEvent(QStringLiteral("helper_security_fail: posture=%1 reason=%2")
                 .arg(postureName(m_posture), result.errors.isEmpty() ? QStringLiteral("no candidate") : result.errors.join(QStringLiteral("; "))));
    logWarning(QStringLiteral("SECURITY WARNING: helper integrity could not be verified, using unvalidated path %1").arg(fallback));
    *secureOut = false;
    return fallback;
}

bool checkHelperRunnable(const QString &path, QString *codeOut, QString *messageOut) {
    QFileInfo fi(path);
    if (!fi.exists()) {
        if (codeOut) *codeOut = QStringLiteral("BINARY_NOT_FOUND");
        if (messageOut) {
            *messageOut = QStringLiteral("GetReminders helper not found. Build the Swift helper and install it as:\n\n"
                                         "  %1\n\n"
                                         "src/swift/bin/ and swift/bin/ under the same project root are searched as well.").arg(path);
        }
        return false;
    }
    if (!fi.isFile() || !fi.isExecutable()) {
        if (codeOut) *codeOut = QStringLiteral("BINARY_NOT_EXECUTABLE");
        if (messageOut) {
            *messageOut = QStringLiteral("GetReminders helper is not executable. Check its permissions:\n\n"
                                         "  chmod +x \"%1\"").arg(path);
        }
        return false;
    }
    return true;
}

} // namespace reminders
