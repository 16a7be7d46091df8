#pragma once

#include <QString>
#include <QStringList>

#include <variant>

namespace toolhub_server {

/// A build command to run in a backend's install directory.
struct RunBuildStep {
    QString workingDirectory;
    QString program;
    QStringList args;

    /// Parses "cd DIR && CMD ARGS". The cd prefix is optional.
    static bool fromCommandLine(const QString& line, RunBuildStep& out, QString& error);
    QString commandLine() const;
};

/// Create the client config file if needed and upsert the gateway entry.
struct WriteConfig {
    QString configPath;
    QString entryName;
    QString command;
    QStringList args;
};

/// Probe well-known locations of the gateway binary and rewrite the entry's command.
struct PatchPath {
    QString configPath;
    QString entryName;
    QStringList candidates;
};

using Remediation = std::variant<RunBuildStep, WriteConfig, PatchPath>;

QString remediationName(const Remediation& remediation);

} // namespace toolhub_server
