#pragma once

#include <QByteArray>
#include <QFuture>
#include <QProcessEnvironment>
#include <QString>
#include <QStringList>

namespace reminders {

struct ProcessResult {
    enum class Status {
        Finished,
        NonZeroExit,
        FailedToStart,
        TimedOut,
        Crashed,
    };

    Status status = Status::FailedToStart;
    int exitCode = -1;
    QByteArray stdoutData;
    QByteArray stderrData;
    QString errorString;

    bool ok() const { return status == Status::Finished; }
    QString stdoutText() const { return QString::fromUtf8(stdoutData); }
    QString stderrText() const { return QString::fromUtf8(stderrData); }
};

QProcessEnvironment safeEnvVars();

// Runs program with a discrete argument vector, never through a shell. When
// input is non-null it is written to stdin and the channel is closed. On
// timeout the process is killed and its partial output dropped.
ProcessResult runProcess(const QString &program, const QStringList &args, int timeoutMs,
                         const QByteArray *input = nullptr);

QFuture<ProcessResult> runProcessAsync(const QString &program, const QStringList &args, int timeoutMs,
                                       const QByteArray &input = QByteArray());

QString describeProcessFailure(const QString &program, const ProcessResult &result);

} // namespace reminders
