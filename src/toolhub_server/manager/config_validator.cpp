#include "config_validator.h"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QJsonArray>
#include <QProcessEnvironment>

#include "client_config.h"
#include "command_runner.h"
#include "toolhub/backend/backend_launch.h"
#include "toolhub/backend/env_file.h"

using toolhub::BackendDefinition;
using toolhub::EnvFile;
using toolhub::EnvMap;
using toolhub::RuntimeKind;

namespace toolhub_server {

namespace {

void addIssue(ValidationResult& result, const QString& type, const QString& severity,
              const QString& description, const QString& field = QString()) {
    result.issues.append(ValidationIssue{type, severity, description, field});
}

void addSuggestion(ValidationResult& result, const QString& action, const QString& description,
                   const QString& command = QString()) {
    ValidationSuggestion s;
    s.action = action;
    s.description = description;
    s.command = command;
    result.suggestions.append(s);
}

void addFix(ValidationResult& result, const QString& action, const QString& description,
            const Remediation& remediation, const QString& command = QString()) {
    ValidationSuggestion s;
    s.action = action;
    s.description = description;
    s.command = command;
    s.autoFix = true;
    s.remediation = remediation;
    result.suggestions.append(s);
}

void addBuildFix(ValidationResult& result, const QString& action, const QString& description,
                 const QString& commandLine) {
    RunBuildStep step;
    QString error;
    if (RunBuildStep::fromCommandLine(commandLine, step, error)) {
        addFix(result, action, description, step, commandLine);
    } else {
        addSuggestion(result, action, description, commandLine);
    }
}

bool isNodeProgram(const QString& command) {
    const QString base = QFileInfo(command).completeBaseName();
    return base == "node";
}

bool isNpxProgram(const QString& command) {
    const QString base = QFileInfo(command).completeBaseName();
    return base == "npx";
}

QString npxPackage(const QStringList& args) {
    for (const QString& arg : args) {
        if (!arg.startsWith('-')) {
            return arg;
        }
    }
    return QString();
}

} // namespace

QJsonObject ValidationIssue::toJson() const {
    QJsonObject obj{
        {"type", type},
        {"severity", severity},
        {"description", description},
    };
    if (!field.isEmpty()) {
        obj["field"] = field;
    }
    return obj;
}

QJsonObject ValidationSuggestion::toJson() const {
    QJsonObject obj{
        {"action", action},
        {"description", description},
        {"auto_fix", autoFix},
    };
    if (!command.isEmpty()) {
        obj["command"] = command;
    }
    if (remediation) {
        obj["remediation"] = remediationName(*remediation);
    }
    return obj;
}

bool ValidationResult::isValid() const {
    for (const ValidationIssue& issue : issues) {
        if (issue.severity == "error") {
            return false;
        }
    }
    return true;
}

bool ValidationResult::hasAutoFix() const {
    for (const ValidationSuggestion& s : suggestions) {
        if (s.autoFix && s.remediation) {
            return true;
        }
    }
    return false;
}

QString ValidationResult::summary() const {
    QStringList parts;
    for (const ValidationIssue& issue : issues) {
        if (issue.severity == "error") {
            parts.append(issue.description);
        }
    }
    return parts.join("; ");
}

QJsonObject ValidationResult::toJson() const {
    QJsonArray issuesArr;
    for (const ValidationIssue& issue : issues) {
        issuesArr.append(issue.toJson());
    }
    QJsonArray suggestionsArr;
    for (const ValidationSuggestion& s : suggestions) {
        suggestionsArr.append(s.toJson());
    }
    return QJsonObject{
        {"server_id", serverId},
        {"is_valid", isValid()},
        {"issues", issuesArr},
        {"suggestions", suggestionsArr},
    };
}

QStringList ClientConfigTarget::pathCandidates() const {
    QStringList out;
    if (!selfPath.isEmpty()) {
        out.append(selfPath);
    }
    out.append(candidates);
    out.append(QCoreApplication::applicationDirPath() + "/toolhub_server");
    out.append("/usr/local/bin/toolhub_server");
    out.append("/opt/homebrew/bin/toolhub_server");
    out.append(QDir::homePath() + "/.local/bin/toolhub_server");
    out.removeDuplicates();
    return out;
}

ConfigValidator::ConfigValidator(ICommandRunner* runner, const ClientConfigTarget& target)
    : m_runner(runner)
    , m_target(target) {
}

ValidationResult ConfigValidator::validate(const BackendDefinition& def,
                                           const QString& installPath) const {
    ValidationResult result;
    result.serverId = def.id;

    if (installPath.isEmpty()) {
        addIssue(result, "missing_install_path", "error", "Backend install path is not set");
    } else if (!QDir(installPath).exists()) {
        addIssue(result, "missing_directory", "error",
                 "Backend directory does not exist: " + installPath);
        addSuggestion(result, "reinstall_server", "Reinstall the backend");
    } else {
        if (def.runtime == RuntimeKind::Python) {
            checkPython(installPath, result);
        } else if (isNpxProgram(def.command)) {
            checkNodeNpx(def, result);
        } else if (isNodeProgram(def.command) && !def.args.isEmpty()
                   && !def.args.first().startsWith('-')) {
            checkNodeLocal(def, installPath, result);
        } else {
            checkCommand(def, installPath, result);
        }
        checkRequiredEnv(def, installPath, result);
    }

    checkClientConfig(result);
    return result;
}

void ConfigValidator::checkNodeLocal(const BackendDefinition& def, const QString& installPath,
                                     ValidationResult& result) const {
    const QDir dir(installPath);
    if (!QFileInfo::exists(dir.filePath("package.json"))) {
        addIssue(result, "missing_package_json", "error",
                 "package.json not found; the repository may not be cloned correctly");
    }
    if (!QFileInfo::exists(dir.filePath("node_modules"))) {
        addIssue(result, "missing_dependencies", "error",
                 "node_modules not found; dependencies are not installed");
        addBuildFix(result, "install_dependencies", "Install Node.js dependencies",
                    QString("cd %1 && npm install").arg(installPath));
    }
    const QString entry = def.args.first();
    if (!QFileInfo::exists(dir.filePath(entry))) {
        addIssue(result, "not_built", "error",
                 QString("Entrypoint %1 not found; the backend needs to be built").arg(entry));
        addBuildFix(result, "build_server", "Build the backend from source",
                    QString("cd %1 && npm run build").arg(installPath));
    }
}

void ConfigValidator::checkNodeNpx(const BackendDefinition& def, ValidationResult& result) const {
    const bool hasNpm = m_runner && m_runner->isAvailable("npm");
    const bool hasNpx = m_runner && m_runner->isAvailable("npx");
    if (!hasNpm) {
        addIssue(result, "missing_npm", "error",
                 "npm not found in PATH; Node.js may not be installed");
        addSuggestion(result, "install_nodejs", "Install Node.js from https://nodejs.org/");
    }
    if (!hasNpx) {
        addIssue(result, "missing_npx", "error",
                 "npx not found in PATH; the Node.js installation may be incomplete");
    }

    const QString package = npxPackage(def.args);
    if (!package.isEmpty()) {
        addSuggestion(result, "test_package",
                      QString("Test if package %1 can be installed").arg(package),
                      QString("npx -y %1 --help").arg(package));
    }
}

void ConfigValidator::checkPython(const QString& installPath, ValidationResult& result) const {
    const QDir dir(installPath);
    if (!QFileInfo::exists(dir.filePath("venv"))) {
        addIssue(result, "missing_venv", "error", "Python virtual environment not found");
        addBuildFix(result, "create_venv", "Create the Python virtual environment",
                    QString("cd %1 && python3 -m venv venv").arg(installPath));
        return;
    }

    if (!QFileInfo::exists(toolhub::venvPythonPath(installPath))) {
        addIssue(result, "invalid_venv", "error",
                 "Python executable not found in the virtual environment");
    }

    static const char* kRequirementFiles[] = {"requirements.txt", "setup.py", "pyproject.toml"};
    bool found = false;
    for (const char* name : kRequirementFiles) {
        if (QFileInfo::exists(dir.filePath(name))) {
            found = true;
            break;
        }
    }
    if (!found) {
        addIssue(result, "missing_requirements", "warning",
                 "No requirements file found; dependencies may not be declared");
    }
}

void ConfigValidator::checkCommand(const BackendDefinition& def, const QString& installPath,
                                   ValidationResult& result) const {
    bool resolved = false;
    if (QDir::isAbsolutePath(def.command)) {
        resolved = QFileInfo(def.command).isExecutable();
    } else if (def.command.contains('/')) {
        resolved = QFileInfo(QDir(installPath).filePath(def.command)).isExecutable();
    } else {
        resolved = m_runner && m_runner->isAvailable(def.command);
    }

    if (!resolved) {
        addIssue(result, "missing_command", "error",
                 QString("Launch command %1 not found").arg(def.command), "command");
    }
}

void ConfigValidator::checkRequiredEnv(const BackendDefinition& def, const QString& installPath,
                                       ValidationResult& result) const {
    if (def.requiredEnv.isEmpty()) {
        return;
    }

    EnvMap fileEnv;
    const QString envPath = EnvFile::pathFor(installPath);
    if (QFileInfo::exists(envPath)) {
        QString error;
        if (!EnvFile::read(envPath, fileEnv, error)) {
            addIssue(result, "env_file_unreadable", "warning", error);
        }
    } else {
        addIssue(result, "missing_env_file", "warning",
                 "No .env file found; environment variables may not be configured");
    }

    const QProcessEnvironment sysEnv = QProcessEnvironment::systemEnvironment();
    for (const QString& var : def.requiredEnv) {
        if (!fileEnv.value(var).isEmpty() || !sysEnv.value(var).isEmpty()) {
            continue;
        }
        addIssue(result, "missing_env_var", "error",
                 QString("Required environment variable %1 is not set").arg(var), var);
        addSuggestion(result, "configure_env_var",
                      QString("Set %1 in the backend configuration").arg(var));
    }
}

void ConfigValidator::checkClientConfig(ValidationResult& result) const {
    if (m_target.path.isEmpty()) {
        return;
    }

    const WriteConfig write{m_target.path, m_target.entryName, m_target.selfPath, m_target.args};

    if (!QFileInfo::exists(m_target.path)) {
        addIssue(result, "missing_client_config", "error",
                 "Client configuration file not found: " + m_target.path);
        addFix(result, "create_client_config", "Create the client configuration file", write);
        return;
    }

    QJsonObject root;
    QString error;
    if (!ClientConfig::load(m_target.path, root, error)) {
        addIssue(result, "client_config_invalid_json", "error", error);
        return;
    }

    QJsonObject entry;
    if (!ClientConfig::findEntry(root, m_target.entryName, entry)) {
        addIssue(result, "missing_gateway_config", "error",
                 QString("Gateway entry '%1' not configured in the client").arg(m_target.entryName));
        addFix(result, "add_gateway_config", "Add the gateway to the client configuration", write);
        return;
    }

    const QString command = entry.value("command").toString();
    if (command.isEmpty()) {
        addIssue(result, "invalid_gateway_config", "error",
                 "Gateway command not specified in the client configuration");
        addFix(result, "add_gateway_config", "Rewrite the gateway entry", write);
        return;
    }

    if (!QFileInfo::exists(command)) {
        addIssue(result, "gateway_binary_missing", "error",
                 "Gateway binary not found at: " + command);
        addFix(result, "fix_gateway_path", "Update the path to the gateway binary",
               PatchPath{m_target.path, m_target.entryName, m_target.pathCandidates()});
    }
}

bool ConfigValidator::autoFix(const ValidationResult& result, QString& error) {
    int applied = 0;
    for (const ValidationSuggestion& s : result.suggestions) {
        if (!s.autoFix || !s.remediation) {
            continue;
        }
        qInfo("AutoFix %s: %s", qUtf8Printable(result.serverId), qUtf8Printable(s.action));
        if (!apply(*s.remediation, error)) {
            error = QString("%1 failed: %2").arg(s.action, error);
            qWarning("AutoFix %s: %s", qUtf8Printable(result.serverId), qUtf8Printable(error));
            return false;
        }
        ++applied;
    }
    qDebug("AutoFix %s: %d actions applied", qUtf8Printable(result.serverId), applied);
    return true;
}

bool ConfigValidator::ensureValid(const BackendDefinition& def,
                                  const QString& installPath,
                                  ValidationResult& result,
                                  QString& error) {
    result = validate(def, installPath);
    if (result.isValid()) {
        return true;
    }

    qInfo("Validation of %s failed, attempting auto-fix: %s", qUtf8Printable(def.id),
          qUtf8Printable(result.summary()));
    QString fixErr;
    if (!autoFix(result, fixErr)) {
        error = "auto-fix unsuccessful: " + fixErr;
        return false;
    }

    result = validate(def, installPath);
    if (!result.isValid()) {
        error = "validation still failed after auto-fix: " + result.summary();
        return false;
    }
    return true;
}

bool ConfigValidator::apply(const Remediation& remediation, QString& error) {
    if (const auto* step = std::get_if<RunBuildStep>(&remediation)) {
        if (!m_runner) {
            error = "no command runner";
            return false;
        }
        CommandSpec spec;
        spec.program = step->program;
        spec.args = step->args;
        spec.workingDirectory = step->workingDirectory;
        const CommandResult res = m_runner->run(spec);
        if (!res.ok()) {
            error = res.failureText();
            return false;
        }
        return true;
    }

    if (const auto* write = std::get_if<WriteConfig>(&remediation)) {
        if (write->command.isEmpty()) {
            error = "gateway binary path is unknown";
            return false;
        }
        return ClientConfig::upsertEntry(write->configPath, write->entryName, write->command,
                                         write->args, error);
    }

    const auto& patch = std::get<PatchPath>(remediation);
    for (const QString& candidate : patch.candidates) {
        if (QFileInfo(candidate).isExecutable()) {
            return ClientConfig::patchCommand(patch.configPath, patch.entryName, candidate, error);
        }
    }
    error = "could not find the gateway binary in common locations";
    return false;
}

} // namespace toolhub_server
