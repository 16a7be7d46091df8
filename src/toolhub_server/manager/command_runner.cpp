#include "command_runner.h"

#include <QProcess>
#include <QStandardPaths>

namespace toolhub_server {

QString CommandResult::failureText() const {
    if (!started) {
        return errorString;
    }
    if (timedOut) {
        return "timed out: " + output;
    }
    QString text = output.trimmed();
    if (text.isEmpty()) {
        text = QString("exit code %1").arg(exitCode);
    }
    return text;
}

CommandResult ProcessCommandRunner::run(const CommandSpec& spec) {
    CommandResult result;

    QProcess proc;
    proc.setProgram(spec.program);
    proc.setArguments(spec.args);
    if (!spec.workingDirectory.isEmpty()) {
        proc.setWorkingDirectory(spec.workingDirectory);
    }
    proc.setProcessChannelMode(QProcess::MergedChannels);

    qInfo("Running: %s (cwd %s)", qUtf8Printable(spec.commandLine()),
          qUtf8Printable(spec.workingDirectory));
    proc.start();
    if (!proc.waitForStarted(kStartTimeoutMs)) {
        result.errorString = QString("failed to start %1: %2").arg(spec.program, proc.errorString());
        return result;
    }
    result.started = true;

    if (!proc.waitForFinished(spec.timeoutMs)) {
        result.timedOut = true;
        proc.kill();
        proc.waitForFinished(1000);
    }

    result.output = QString::fromUtf8(proc.readAll());
    result.exitCode = proc.exitStatus() == QProcess::NormalExit ? proc.exitCode() : -1;
    if (!result.ok()) {
        qWarning("Command failed (%d): %s", result.exitCode, qUtf8Printable(spec.commandLine()));
    }
    return result;
}

bool ProcessCommandRunner::isAvailable(const QString& program) const {
    return !QStandardPaths::findExecutable(program).isEmpty();
}

} // namespace toolhub_server
