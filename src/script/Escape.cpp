#include "script/Escape.h"

namespace reminders {

QString escapeScriptString(const QString &text) {
    QString out = text;
    out.replace(QLatin1Char('\\'), QStringLiteral("\\\\"));
    out.replace(QLatin1Char('"'), QStringLiteral("\\\""));
    out.replace(QLatin1Char('\''), QStringLiteral("\\'"));
    out.replace(QLatin1Char('\r'), QStringLiteral("\\r"));
    out.replace(QLatin1Char('\n'), QStringLiteral("\\n"));
    out.replace(QLatin1Char('\t'), QStringLiteral("\\t"));
    return out;
}

QString quoteScriptString(const QString &text) {
    return QLatin1Char('"') + escapeScriptString(text) + QLatin1Char('"');
}

QString wrapRemindersScript(const QString &body) {
    return QStringLiteral("tell application \"Reminders\"\n") + body + QStringLiteral("\nend tell");
}

} // namespace reminders
