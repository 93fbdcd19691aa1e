#pragma once

#include <QString>

namespace reminders {

QString stateDirPath();
QString logFilePath();

bool debugEnabled();

void logEvent(const QString &message);
void logWarning(const QString &message);
void debugLog(const QString &message);

bool ensurePrivateDir(const QString &path);

} // namespace reminders
