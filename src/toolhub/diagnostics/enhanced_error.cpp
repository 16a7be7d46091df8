#include "enhanced_error.h"

#include <QJsonArray>

namespace toolhub {

namespace {

struct SuggestionRule {
    QStringList needles;
    QStringList suggestions;
};

struct StageRules {
    QList<SuggestionRule> rules;
    QStringList fallback;
    bool fallbackAlways = false;
};

const QStringList& genericSuggestions() {
    static const QStringList kGeneric = {
        "Read the error details for the failing command",
        "Retry the operation, the failure may be transient",
        "Check that the system requirements for this backend are met",
        "Look at the backend log for more context",
    };
    return kGeneric;
}

StageRules rulesFor(ErrorStage stage) {
    switch (stage) {
    case ErrorStage::GitClone:
        return {{
                    {{"not found", "does not exist"},
                     {"Verify that the repository URL is correct and reachable",
                      "Check that the repository is public or that you have access to it"}},
                    {{"permission denied", "authentication"},
                     {"Configure git authentication (SSH key or access token)",
                      "Run: git config --global credential.helper store"}},
                    {{"network", "timeout", "could not resolve"},
                     {"Check the internet connection",
                      "Retry later, the git host may be temporarily unavailable"}},
                },
                {"Make sure git is installed and on PATH",
                 "Run the clone command by hand to see the full output"}};
    case ErrorStage::NpmInstall:
        return {{
                    {{"enoent", "command not found", "failed to start"},
                     {"Install Node.js and npm from https://nodejs.org/",
                      "Make sure npm is on PATH"}},
                    {{"eacces", "permission denied"},
                     {"Fix npm permissions: npm config set prefix ~/.npm-global",
                      "Or manage Node.js with a version manager such as nvm"}},
                    {{"network", "registry"},
                     {"Check the internet connection",
                      "Clear the npm cache: npm cache clean --force",
                      "Reset the registry: npm config set registry https://registry.npmjs.org/"}},
                    {{"eresolve", "dependency"},
                     {"Retry with --legacy-peer-deps",
                      "Update npm: npm install -g npm@latest"}},
                },
                {"Delete node_modules and package-lock.json, then retry",
                 "Check that package.json exists and is valid"}};
    case ErrorStage::NpmBuild:
        return {{
                    {{"missing script", "script not found"},
                     {"Check that package.json defines a 'build' script"}},
                    {{"typescript", "tsc"},
                     {"Install TypeScript: npm install -g typescript",
                      "Check tsconfig.json"}},
                    {{"memory", "heap"},
                     {"Raise the Node.js heap: export NODE_OPTIONS='--max-old-space-size=4096'",
                      "Close other applications to free memory"}},
                },
                {"Check the build script in package.json",
                 "Run the build by hand with the command from package.json"}};
    case ErrorStage::InterpreterEnv:
        return {{
                    {{"command not found", "no module named venv", "failed to start"},
                     {"Install Python 3 from https://python.org/downloads/",
                      "On Debian/Ubuntu: sudo apt-get install python3-venv"}},
                    {{"permission denied"},
                     {"Check write permissions on the install directory"}},
                },
                {"Make sure Python 3 is installed and on PATH",
                 "Run: python3 --version"}};
    case ErrorStage::DependencyInstall:
        return {{
                    {{"no such file", "requirements.txt"},
                     {"Check that requirements.txt or a Python package definition exists"}},
                    {{"permission denied"},
                     {"Check that the virtual environment was created correctly"}},
                    {{"network", "timeout"},
                     {"Check the internet connection",
                      "Try a different PyPI mirror"}},
                    {{"compiler", "microsoft visual c++", "gcc"},
                     {"Install a C compiler toolchain for native extensions",
                      "Prefer binary wheels: pip install --only-binary=:all:"}},
                },
                {"Upgrade pip: pip install --upgrade pip",
                 "Rerun the install with -v to see the detailed error"}};
    case ErrorStage::EnvFile:
        return {{
                    {{"permission denied"},
                     {"Check write permissions on the backend directory"}},
                    {{"no such file"},
                     {"The backend directory is missing or not accessible"}},
                },
                {"Verify that the installation completed",
                 "Check that the backend directory exists and is writable"},
                true};
    case ErrorStage::Validation:
        return {{},
                {"Run auto-fix to repair common problems",
                 "Check the validation details for the failing checks",
                 "Verify that all required dependencies are installed",
                 "Make sure the required environment variables are configured"}};
    case ErrorStage::Startup:
        return {{
                    {{"port", "address"},
                     {"Check whether another service uses the same port",
                      "Change the backend port in its configuration"}},
                    {{"permission denied"},
                     {"Check that the backend executable has execute permission",
                      "Verify that the installation completed"}},
                    {{"not found", "no such file"},
                     {"Reinstall the backend so that all files are present",
                      "Check that the backend was built"}},
                    {{"environment", "config", "env var"},
                     {"Verify that all required environment variables are set",
                      "Check the .env file of the backend"}},
                },
                {"Check the backend log for details",
                 "Try reinstalling the backend",
                 "Verify that the backend dependencies are installed"}};
    case ErrorStage::ToolDiscovery:
        return {{
                    {{"timeout", "timed out"},
                     {"The backend may be slow to start or respond",
                      "Check that the backend is running"}},
                    {{"connection", "network"},
                     {"Verify that the backend is running and reachable"}},
                    {{"parse", "json", "no response"},
                     {"The backend may not speak the tool protocol correctly",
                      "Check the backend log for protocol errors"}},
                },
                {"Restart the backend and try again",
                 "Check that the backend supports tools/list"}};
    case ErrorStage::Generic:
        break;
    }
    return {{}, genericSuggestions()};
}

} // namespace

QString errorStageName(ErrorStage stage) {
    switch (stage) {
    case ErrorStage::GitClone:          return "git_clone";
    case ErrorStage::NpmInstall:        return "npm_install";
    case ErrorStage::NpmBuild:          return "npm_build";
    case ErrorStage::InterpreterEnv:    return "interpreter_env";
    case ErrorStage::DependencyInstall: return "dependency_install";
    case ErrorStage::EnvFile:           return "env_file";
    case ErrorStage::Validation:        return "validation";
    case ErrorStage::Startup:           return "startup";
    case ErrorStage::ToolDiscovery:     return "tool_discovery";
    case ErrorStage::Generic:           return "generic";
    }
    return "generic";
}

QStringList suggestionsFor(ErrorStage stage, const QString& failureText) {
    const StageRules stageRules = rulesFor(stage);

    QStringList out;
    for (const SuggestionRule& rule : stageRules.rules) {
        for (const QString& needle : rule.needles) {
            if (failureText.contains(needle, Qt::CaseInsensitive)) {
                out.append(rule.suggestions);
                break;
            }
        }
    }

    if (out.isEmpty() || stageRules.fallbackAlways) {
        out.append(stageRules.fallback);
    }
    return out;
}

QJsonObject EnhancedError::toJson() const {
    QJsonObject obj;
    obj["type"] = type;
    obj["stage"] = stage;
    obj["message"] = message;
    obj["details"] = details;
    obj["context"] = context;
    obj["suggestions"] = QJsonArray::fromStringList(suggestions);
    obj["timestamp"] = timestamp.toString(Qt::ISODateWithMs);
    obj["severity"] = severity;
    return obj;
}

EnhancedError EnhancedError::fromJson(const QJsonObject& obj) {
    EnhancedError err;
    err.type = obj.value("type").toString();
    err.stage = obj.value("stage").toString();
    err.message = obj.value("message").toString();
    err.details = obj.value("details").toString();
    err.context = obj.value("context").toString();
    for (const QJsonValue& v : obj.value("suggestions").toArray()) {
        err.suggestions.append(v.toString());
    }
    err.timestamp = QDateTime::fromString(obj.value("timestamp").toString(), Qt::ISODateWithMs);
    err.severity = obj.value("severity").toString();
    return err;
}

ErrorReporter::ErrorReporter(const QString& backendId, const QString& context)
    : m_backendId(backendId)
    , m_context(context) {
}

EnhancedError ErrorReporter::installationError(ErrorStage stage, const QString& failureText) const {
    return make(stage, "installation_error",
                QString("%1 failed for backend %2").arg(errorStageName(stage), m_backendId),
                failureText, "error");
}

EnhancedError ErrorReporter::startupError(const QString& failureText) const {
    return make(ErrorStage::Startup, "startup_error",
                QString("Failed to start backend %1").arg(m_backendId),
                failureText, "error");
}

EnhancedError ErrorReporter::toolDiscoveryError(const QString& failureText) const {
    return make(ErrorStage::ToolDiscovery, "tool_discovery_error",
                QString("Tool discovery failed for backend %1").arg(m_backendId),
                failureText, "warning");
}

EnhancedError ErrorReporter::make(ErrorStage stage, const QString& type, const QString& message,
                                  const QString& failureText, const QString& severity) const {
    EnhancedError err;
    err.type = type;
    err.stage = errorStageName(stage);
    err.message = message;
    err.details = failureText;
    err.context = m_context;
    err.suggestions = suggestionsFor(stage, failureText);
    err.timestamp = QDateTime::currentDateTimeUtc();
    err.severity = severity;
    return err;
}

} // namespace toolhub
