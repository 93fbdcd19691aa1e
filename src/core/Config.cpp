#include "core/Config.h"

#include "core/Log.h"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QRegularExpression>
#include <QTextStream>

namespace reminders {

namespace {

int clampTimeout(int v) {
    if (v < 1000) v = 1000;
    if (v > 120000) v = 120000;
    return v;
}

}

Posture postureFromEnvironment() {
    const QString env = qEnvironmentVariable("REMINDERS_ENV").trimmed().toLower();
    if (env == QLatin1String("test")) return Posture::Test;
    if (env == QLatin1String("development")) return Posture::Development;
    return Posture::Production;
}

QString postureName(Posture posture) {
    switch (posture) {
    case Posture::Test: return QStringLiteral("test");
    case Posture::Development: return QStringLiteral("development");
    case Posture::Production: break;
    }
    return QStringLiteral("production");
}

QString configFilePath() {
    const QString override = qEnvironmentVariable("REMINDERS_CONFIG");
    if (!override.isEmpty()) return override;
    return QDir::homePath() + "/.config/reminders-bridge/config";
}

BridgeConfig readBridgeConfig(const QString &path) {
    BridgeConfig cfg;
    cfg.posture = postureFromEnvironment();
    if (cfg.posture == Posture::Production) {
        cfg.expectedHelperSha256 = qEnvironmentVariable("REMINDERS_HELPER_SHA256").trimmed().toLower();
    }
    if (QCoreApplication::instance()) {
        cfg.helperSearchStart = QCoreApplication::applicationDirPath();
    } else {
        cfg.helperSearchStart = QDir::currentPath();
    }

    QFile f(path);
    if (!f.open(QIODevice::ReadOnly | QIODevice::Text)) {
        debugLog(QStringLiteral("config: no file at ") + path + QStringLiteral(", using defaults"));
        return cfg;
    }
    QTextStream in(&f);
    static const QRegularExpression re(QStringLiteral("^([A-Z_]{1,64})=(.{0,4096})$"));
    while (!in.atEnd()) {
        const QString line = in.readLine();
        if (line.size() > 4096) continue;
        const auto m = re.match(line);
        if (!m.hasMatch()) continue;
        const QString key = m.captured(1);
        const QString value = m.captured(2).trimmed();
        bool ok = false;
        if (key == QLatin1String("AUTOMATION_TIMEOUT_MS")) {
            const int v = value.toInt(&ok);
            if (ok) cfg.automationTimeoutMs = clampTimeout(v);
        } else if (key == QLatin1String("HELPER_TIMEOUT_MS")) {
            const int v = value.toInt(&ok);
            if (ok) cfg.helperTimeoutMs = clampTimeout(v);
        } else if (key == QLatin1String("HELPER_SEARCH_START")) {
            if (!value.isEmpty()) cfg.helperSearchStart = QDir::cleanPath(value);
        } else if (key == QLatin1String("AUTOMATION_EXECUTABLE")) {
            if (!value.isEmpty()) cfg.automationExecutable = value;
        } else if (key == QLatin1String("CLOCK_READER_EXECUTABLE")) {
            if (!value.isEmpty()) cfg.clockReaderExecutable = value;
        } else {
            debugLog(QStringLiteral("config: unknown key ") + key);
        }
    }
    return cfg;
}

} // namespace reminders
