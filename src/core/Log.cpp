#include "core/Log.h"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>
#include <QTextStream>
#include <sys/stat.h>
#include <unistd.h>

namespace reminders {

namespace {

QMutex gLogMutex;

void rotateLogsIfNeeded(const QString &log) {
    QFileInfo fi(log); const qint64 maxSize = 1024*1024;
    if (fi.exists() && fi.size() > maxSize) { QFile::remove(log + ".2"); QFile::rename(log + ".1", log + ".2"); QFile::rename(log, log + ".1"); }
}

}

bool debugEnabled() {
    static const bool enabled = qEnvironmentVariableIsSet("REMINDERS_LOG_DEBUG");
    return enabled;
}

bool ensurePrivateDir(const QString &path) {
    const QByteArray encoded = QFile::encodeName(path);
    struct stat st{};
    if (::lstat(encoded.constData(), &st) == 0) {
        if (S_ISLNK(st.st_mode)) {
            if (::unlink(encoded.constData()) != 0) {
                return false;
            }
        } else if (!S_ISDIR(st.st_mode)) {
            return false;
        } else {
            if (st.st_uid != getuid()) {
                return false;
            }
            if ((st.st_mode & (S_IRWXG | S_IRWXO)) != 0) {
                if (::chmod(encoded.constData(), S_IRWXU) != 0) {
                    return false;
                }
            }
            return true;
        }
    }

    QDir dir;
    if (!dir.mkpath(path)) {
        return false;
    }
    if (::chmod(encoded.constData(), S_IRWXU) != 0) {
        return false;
    }
    return true;
}

QString stateDirPath() {
    QString dir = QDir::homePath() + "/.local/state/reminders-bridge";
    ensurePrivateDir(dir);
    return dir;
}

QString logFilePath() { return stateDirPath() + "/reminders-bridge.log"; }

void logEvent(const QString &message) {
    QMutexLocker locker(&gLogMutex);
    const QString log = logFilePath();
    rotateLogsIfNeeded(log);
    QFile f(log);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) return;
    f.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner);
    QTextStream out(&f);
    out << QDateTime::currentDateTimeUtc().toString(Qt::ISODate) << " " << message << "\n";
}

void logWarning(const QString &message) {
    logEvent(QStringLiteral("warn: ") + message);
}

void debugLog(const QString &message) {
    if (debugEnabled()) logEvent(QStringLiteral("debug: ") + message);
}

} // namespace reminders
