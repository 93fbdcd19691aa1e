#include "process/ProcessRunner.h"

#include "core/Log.h"

#include <QDir>
#include <QElapsedTimer>
#include <QFileInfo>
#include <QProcess>
#include <QtConcurrent/QtConcurrent>

namespace reminders {

namespace {

constexpr int kStartTimeoutMs = 5000;
constexpr int kPollIntervalMs = 50;

}

QProcessEnvironment safeEnvVars() {
    QProcessEnvironment env;
    env.insert("PATH", "/usr/local/bin:/usr/bin:/bin:/usr/local/sbin:/usr/sbin:/sbin");
    env.insert("LANG", "C");
    env.insert("LC_ALL", "C");
    env.insert("HOME", QDir::homePath());
    const QString xdg = qEnvironmentVariable("XDG_RUNTIME_DIR");
    if (!xdg.isEmpty()) env.insert("XDG_RUNTIME_DIR", xdg);
    const QString tmp = qEnvironmentVariable("TMPDIR");
    if (!tmp.isEmpty()) env.insert("TMPDIR", tmp);
    static const char *danger[] = {"LD_PRELOAD","LD_LIBRARY_PATH","LD_AUDIT","LD_ASSUME_KERNEL","GCONV_PATH","HOSTALIASES","PYTHONPATH","RUBYLIB","NODE_PATH","PERL5LIB","DYLD_INSERT_LIBRARIES"};
    for (const char *k : danger) env.remove(QString::fromLatin1(k));
    return env;
}

ProcessResult runProcess(const QString &program, const QStringList &args, int timeoutMs,
                         const QByteArray *input) {
    ProcessResult result;
    QProcess p;
    p.setProgram(program);
    p.setArguments(args);
    p.setProcessEnvironment(safeEnvVars());
    p.setProcessChannelMode(QProcess::SeparateChannels);
    if (!input) p.setStandardInputFile(QProcess::nullDevice());
    p.start();
    if (!p.waitForStarted(kStartTimeoutMs)) {
        result.status = ProcessResult::Status::FailedToStart;
        result.errorString = p.errorString();
        debugLog(QStringLiteral("process_start_failed: %1 (%2)").arg(program, result.errorString));
        return result;
    }
    if (input) {
        p.write(*input);
        p.closeWriteChannel();
    }

    QElapsedTimer t;
    t.start();
    bool finished = false;
    while (!finished) {
        finished = p.waitForFinished(kPollIntervalMs);
        result.stdoutData += p.readAllStandardOutput();
        result.stderrData += p.readAllStandardError();
        if (!finished && t.elapsed() >= timeoutMs) {
            p.kill();
            p.waitForFinished(2000);
            result = ProcessResult();
            result.status = ProcessResult::Status::TimedOut;
            result.errorString = QStringLiteral("timed out after %1 ms").arg(timeoutMs);
            logWarning(QStringLiteral("process_timeout: %1 after %2 ms").arg(QFileInfo(program).fileName(), QString::number(timeoutMs)));
            return result;
        }
    }

    if (p.exitStatus() != QProcess::NormalExit) {
        result.status = ProcessResult::Status::Crashed;
        result.errorString = QStringLiteral("crash");
        return result;
    }
    result.exitCode = p.exitCode();
    result.status = result.exitCode == 0 ? ProcessResult::Status::Finished
                                         : ProcessResult::Status::NonZeroExit;
    return result;
}

QFuture<ProcessResult> runProcessAsync(const QString &program, const QStringList &args, int timeoutMs,
                                       const QByteArray &input) {
    const bool hasInput = !input.isNull();
    return QtConcurrent::run([program, args, timeoutMs, input, hasInput]() {
        return runProcess(program, args, timeoutMs, hasInput ? &input : nullptr);
    });
}

QString describeProcessFailure(const QString &program, const ProcessResult &result) {
    const QString name = QFileInfo(program).fileName();
    switch (result.status) {
    case ProcessResult::Status::Finished:
        return QString();
    case ProcessResult::Status::NonZeroExit:
        return QStringLiteral("%1 exited with code %2: %3").arg(name, QString::number(result.exitCode), result.stderrText().trimmed());
    case ProcessResult::Status::FailedToStart:
        return QStringLiteral("failed to start %1: %2").arg(name, result.errorString);
    case ProcessResult::Status::TimedOut:
        return QStringLiteral("%1 %2").arg(name, result.errorString);
    case ProcessResult::Status::Crashed:
        return QStringLiteral("%1 terminated abnormally").arg(name);
    }
    return QString();
}

} // namespace reminders
