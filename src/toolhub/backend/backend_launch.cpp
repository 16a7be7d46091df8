#include "backend_launch.h"

#include <QFileInfo>

#include "env_file.h"

namespace toolhub {

void LaunchSpec::applyTo(QProcess& proc) const {
    proc.setProgram(program);
    proc.setArguments(args);
    proc.setWorkingDirectory(workingDirectory);
    proc.setProcessEnvironment(environment);
}

QString LaunchSpec::commandLine() const {
    return (QStringList{program} + args).join(' ');
}

void mergeEnvironment(const EnvMap& vars, QProcessEnvironment& env) {
    for (auto it = vars.constBegin(); it != vars.constEnd(); ++it) {
        env.insert(it.key(), it.value());
    }
}

QString venvPythonPath(const QString& installPath) {
#ifdef Q_OS_WIN
    return installPath + "/venv/Scripts/python.exe";
#else
    return installPath + "/venv/bin/python";
#endif
}

LaunchSpec buildLaunchSpec(const BackendDefinition& def,
                           const QString& installPath,
                           const EnvMap& env) {
    LaunchSpec spec;
    spec.program = def.command;
    spec.args = def.args;
    spec.workingDirectory = installPath;

    if (def.runtime == RuntimeKind::Python) {
        const QString venvPython = venvPythonPath(installPath);
        if (QFileInfo(venvPython).isExecutable()) {
            spec.program = venvPython;
        }
    }

    QProcessEnvironment procEnv = QProcessEnvironment::systemEnvironment();
    mergeEnvironment(def.env, procEnv);

    const QString envPath = EnvFile::pathFor(installPath);
    if (QFileInfo::exists(envPath)) {
        EnvMap fileEnv;
        QString error;
        if (EnvFile::read(envPath, fileEnv, error)) {
            mergeEnvironment(fileEnv, procEnv);
        } else {
            qWarning("%s", qUtf8Printable(error));
        }
    }

    mergeEnvironment(env, procEnv);
    spec.environment = procEnv;
    return spec;
}

} // namespace toolhub
