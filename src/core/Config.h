#pragma once

#include <QString>

namespace reminders {

enum class Posture {
    Test,
    Development,
    Production,
};

Posture postureFromEnvironment();
QString postureName(Posture posture);

struct BridgeConfig {
    Posture posture = Posture::Production;
    QString automationExecutable = QStringLiteral("/usr/bin/osascript");
    QString clockReaderExecutable = QStringLiteral("/usr/bin/defaults");
    QString helperSearchStart;
    int automationTimeoutMs = 30000;
    int helperTimeoutMs = 30000;
    int dataAccessProbeTimeoutMs = 10000;
    int automationProbeTimeoutMs = 5000;
    QString expectedHelperSha256;
};

QString configFilePath();

// Reads the KEY=VALUE config file (missing file means defaults) and applies
// environment overrides. Out-of-range timeouts are clamped.
BridgeConfig readBridgeConfig(const QString &path = configFilePath());

} // namespace reminders
