#pragma once

#include <QString>

#include <functional>

#include "toolhub/backend/backend_definition.h"
#include "toolhub/diagnostics/enhanced_error.h"

namespace toolhub_server {

class ConfigValidator;
class ICommandRunner;
struct CommandSpec;

struct InstallRequest {
    toolhub::BackendDefinition definition;
    QString installPath;
    toolhub::EnvMap config;
};

struct InstallFailure {
    toolhub::ErrorStage stage = toolhub::ErrorStage::Generic;
    QString text;
};

/**
 * Clone, build and configure one backend
 *
 * Runs synchronously; the lifecycle manager calls it from a worker thread.
 * Every step is an external command issued through ICommandRunner.
 */
class Installer {
public:
    using LogCallback = std::function<void(const QString&)>;

    Installer(ICommandRunner* runner, ConfigValidator* validator);

    bool install(const InstallRequest& request, const LogCallback& log, InstallFailure& failure);

    /// User config wins over the definition's defaults.
    static toolhub::EnvMap mergedConfig(const toolhub::BackendDefinition& def,
                                        const toolhub::EnvMap& userConfig);

private:
    bool runStep(const CommandSpec& spec, toolhub::ErrorStage stage, const LogCallback& log,
                 InstallFailure& failure);
    bool buildNode(const QString& installPath, const LogCallback& log, InstallFailure& failure);
    bool buildPython(const QString& installPath, const LogCallback& log, InstallFailure& failure);
    bool buildPythonWithPip(const QString& installPath, const LogCallback& log,
                            InstallFailure& failure);

    ICommandRunner* m_runner = nullptr;
    ConfigValidator* m_validator = nullptr;
};

} // namespace toolhub_server
