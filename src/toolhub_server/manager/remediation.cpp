#include "remediation.h"

#include <QProcess>

namespace toolhub_server {

namespace {

template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

bool RunBuildStep::fromCommandLine(const QString& line, RunBuildStep& out, QString& error) {
    QString command = line.trimmed();
    RunBuildStep step;

    if (command.startsWith("cd ")) {
        const int sep = command.indexOf("&&");
        if (sep < 0) {
            error = "missing '&&' after cd in: " + line;
            return false;
        }
        step.workingDirectory = command.mid(3, sep - 3).trimmed();
        command = command.mid(sep + 2).trimmed();
        if (step.workingDirectory.isEmpty()) {
            error = "empty directory in: " + line;
            return false;
        }
    }

    const QStringList parts = QProcess::splitCommand(command);
    if (parts.isEmpty()) {
        error = "empty command in: " + line;
        return false;
    }
    step.program = parts.first();
    step.args = parts.mid(1);
    out = step;
    return true;
}

QString RunBuildStep::commandLine() const {
    const QString cmd = (QStringList{program} + args).join(' ');
    return workingDirectory.isEmpty() ? cmd : QString("cd %1 && %2").arg(workingDirectory, cmd);
}

QString remediationName(const Remediation& remediation) {
    return std::visit(Overloaded{
                          [](const RunBuildStep&) { return QStringLiteral("run_build_step"); },
                          [](const WriteConfig&) { return QStringLiteral("write_config"); },
                          [](const PatchPath&) { return QStringLiteral("patch_path"); },
                      },
                      remediation);
}

} // namespace toolhub_server
