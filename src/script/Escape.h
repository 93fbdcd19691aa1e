#pragma once

#include <QString>

namespace reminders {

// Escapes backslash, double quote, single quote, CR, LF and TAB, in that
// order, so the result can sit between double quotes in a script literal.
QString escapeScriptString(const QString &text);

QString quoteScriptString(const QString &text);

// Wraps statements in the tell block addressed to the Reminders application.
QString wrapRemindersScript(const QString &body);

} // namespace reminders
