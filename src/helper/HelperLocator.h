#pragma once

#include "core/Errors.h"
#include "helper/BinaryValidator.h"

#include <QMutex>
#include <QString>
#include <QStringList>

namespace reminders {

extern const QString kHelperBinaryName;
extern const QString kProjectMarkerFile;
extern const QString kProjectName;

// Walks up from start until a directory holding the project marker is found.
// Falls back to start itself when no marker is found within maxDepth levels.
QString findProjectRoot(const QString &start, int maxDepth = 10, bool *foundOut = nullptr);

bool isProjectRoot(const QString &dir);

QStringList candidateHelperPaths(const QString &projectRoot);

// Resolves the GetReminders helper once and memoizes the answer for the life
// of the object. Concurrent first callers block on the same computation.
class HelperLocator {
public:
    HelperLocator(const QString &searchStart, Posture posture, const QString &expectedSha256 = QString());

    HelperLocator(const HelperLocator &) = delete;
    HelperLocator &operator=(const HelperLocator &) = delete;

    QString resolve();

    // False when resolve() had to fall back to the unvalidated default path.
    bool resolvedSecurely();

    // Gate in front of every helper invocation. A fallback path is validated
    // again with the full security config; a helper that still fails is never
    // run and is reported as SECURITY_VALIDATION_FAILED.
    bool verifiedPath(QString *pathOut, BridgeError *errOut);

#ifdef REMINDERS_TESTING
    void resetForTesting();
    int computeCountForTesting();
#endif

private:
    QString computePath(QString *rootOut, bool *secureOut) const;

    QString m_searchStart;
    Posture m_posture;
    QString m_expectedSha256;

    QMutex m_mutex;
    bool m_resolved = false;
    bool m_secure = false;
    int m_computeCount = 0;
    QString m_root;
    QString m_path;
};

// Existence and executability check performed right before the helper is
// run; the error text says where the helper belongs or how to fix permissions.
bool checkHelperRunnable(const QString &path, QString *codeOut, QString *messageOut);

} // namespace reminders
