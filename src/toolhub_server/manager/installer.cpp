#include "installer.h"

#include <QDir>
#include <QFileInfo>

#include "command_runner.h"
#include "config_validator.h"
#include "toolhub/backend/backend_launch.h"
#include "toolhub/backend/env_file.h"

using toolhub::BackendDefinition;
using toolhub::EnvFile;
using toolhub::EnvMap;
using toolhub::ErrorStage;
using toolhub::RuntimeKind;

namespace toolhub_server {

namespace {

QString venvPipPath(const QString& installPath) {
#ifdef Q_OS_WIN
    return installPath + "/venv/Scripts/pip.exe";
#else
    return installPath + "/venv/bin/pip";
#endif
}

CommandSpec command(const QString& program, const QStringList& args, const QString& cwd) {
    CommandSpec spec;
    spec.program = program;
    spec.args = args;
    spec.workingDirectory = cwd;
    return spec;
}

} // namespace

Installer::Installer(ICommandRunner* runner, ConfigValidator* validator)
    : m_runner(runner)
    , m_validator(validator) {
}

EnvMap Installer::mergedConfig(const BackendDefinition& def, const EnvMap& userConfig) {
    EnvMap merged = def.defaultConfig;
    for (auto it = userConfig.constBegin(); it != userConfig.constEnd(); ++it) {
        merged.insert(it.key(), it.value());
    }
    return merged;
}

bool Installer::runStep(const CommandSpec& spec, ErrorStage stage, const LogCallback& log,
                        InstallFailure& failure) {
    log("Running " + spec.commandLine());
    const CommandResult result = m_runner->run(spec);
    if (result.ok()) {
        return true;
    }
    failure.stage = stage;
    failure.text = QString("%1 failed: %2").arg(spec.commandLine(), result.failureText());
    return false;
}

bool Installer::install(const InstallRequest& request, const LogCallback& log,
                        InstallFailure& failure) {
    const BackendDefinition& def = request.definition;
    const QString& path = request.installPath;

    if (!m_runner) {
        failure = InstallFailure{ErrorStage::Generic, "no command runner"};
        return false;
    }

    QDir installDir(path);
    if (installDir.exists()) {
        log("Removing stale install directory " + path);
        if (!installDir.removeRecursively()) {
            failure = InstallFailure{ErrorStage::GitClone, "cannot remove stale directory " + path};
            return false;
        }
    }
    const QString parent = QFileInfo(path).absolutePath();
    if (!QDir().mkpath(parent)) {
        failure = InstallFailure{ErrorStage::GitClone, "cannot create directory " + parent};
        return false;
    }

    if (def.repoUrl.isEmpty()) {
        failure = InstallFailure{ErrorStage::GitClone, "no repository URL for " + def.id};
        return false;
    }
    if (!runStep(command("git", {"clone", def.repoUrl, path}, parent),
                 ErrorStage::GitClone, log, failure)) {
        return false;
    }

    const bool built = def.runtime == RuntimeKind::Python ? buildPython(path, log, failure)
                                                          : buildNode(path, log, failure);
    if (!built) {
        return false;
    }

    QString error;
    if (!EnvFile::write(EnvFile::pathFor(path), mergedConfig(def, request.config), error)) {
        failure = InstallFailure{ErrorStage::EnvFile, error};
        return false;
    }
    log("Wrote " + EnvFile::pathFor(path));

    if (m_validator) {
        ValidationResult result;
        if (!m_validator->ensureValid(def, path, result, error)) {
            failure = InstallFailure{ErrorStage::Validation, error};
            return false;
        }
        log("Validation passed");
    }
    return true;
}

bool Installer::buildNode(const QString& installPath, const LogCallback& log,
                          InstallFailure& failure) {
    return runStep(command("npm", {"install"}, installPath), ErrorStage::NpmInstall, log, failure)
           && runStep(command("npm", {"run", "build"}, installPath), ErrorStage::NpmBuild, log,
                      failure);
}

bool Installer::buildPython(const QString& installPath, const LogCallback& log,
                            InstallFailure& failure) {
    if (!m_runner->isAvailable("uv")) {
        return buildPythonWithPip(installPath, log, failure);
    }

    const CommandResult venv = m_runner->run(command("uv", {"venv", "venv"}, installPath));
    if (!venv.ok()) {
        log("uv venv failed, falling back to pip: " + venv.failureText());
        return buildPythonWithPip(installPath, log, failure);
    }

    return runStep(command("uv",
                           {"pip", "install", "--python", toolhub::venvPythonPath(installPath),
                            "-e", "."},
                           installPath),
                   ErrorStage::DependencyInstall, log, failure);
}

bool Installer::buildPythonWithPip(const QString& installPath, const LogCallback& log,
                                   InstallFailure& failure) {
    if (!runStep(command("python3", {"-m", "venv", "venv"}, installPath),
                 ErrorStage::InterpreterEnv, log, failure)) {
        return false;
    }

    const QString pip = venvPipPath(installPath);
    const CommandResult upgrade = m_runner->run(command(pip, {"install", "--upgrade", "pip"},
                                                        installPath));
    if (!upgrade.ok()) {
        log("pip upgrade failed (ignored): " + upgrade.failureText());
    }

    const CommandResult editable = m_runner->run(command(pip, {"install", "-e", "."}, installPath));
    if (editable.ok()) {
        return true;
    }

    if (!QFileInfo::exists(installPath + "/requirements.txt")) {
        failure = InstallFailure{ErrorStage::DependencyInstall,
                                 "pip install failed and no requirements.txt found: "
                                     + editable.failureText()};
        return false;
    }
    return runStep(command(pip, {"install", "-r", "requirements.txt"}, installPath),
                   ErrorStage::DependencyInstall, log, failure);
}

} // namespace toolhub_server
