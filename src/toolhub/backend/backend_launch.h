#pragma once

#include <QProcess>
#include <QProcessEnvironment>
#include <QString>
#include <QStringList>

#include "backend_definition.h"
#include "toolhub/toolhub_export.h"

namespace toolhub {

/**
 * Everything needed to spawn one backend process
 */
struct TOOLHUB_API LaunchSpec {
    QString program;
    QStringList args;
    QString workingDirectory;
    QProcessEnvironment environment;

    void applyTo(QProcess& proc) const;
    QString commandLine() const;
};

/// Insert @p vars into @p env, overriding existing keys.
TOOLHUB_API void mergeEnvironment(const EnvMap& vars, QProcessEnvironment& env);

/// Interpreter of the backend's private virtualenv.
TOOLHUB_API QString venvPythonPath(const QString& installPath);

/**
 * Launch data for a backend
 * Environment is system env, then definition env, then the install dir's .env,
 * then @p env. Python backends run on their private interpreter when present.
 */
TOOLHUB_API LaunchSpec buildLaunchSpec(const BackendDefinition& def,
                                       const QString& installPath,
                                       const EnvMap& env);

} // namespace toolhub
