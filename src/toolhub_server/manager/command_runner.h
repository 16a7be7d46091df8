#pragma once

#include <QString>
#include <QStringList>

namespace toolhub_server {

struct CommandSpec {
    QString program;
    QStringList args;
    QString workingDirectory;
    int timeoutMs = 10 * 60 * 1000;

    QString commandLine() const { return (QStringList{program} + args).join(' '); }
};

struct CommandResult {
    bool started = false;
    bool timedOut = false;
    int exitCode = -1;
    QString output;   // merged stdout/stderr
    QString errorString;

    bool ok() const { return started && !timedOut && exitCode == 0; }

    /// Failure text suitable for suggestion matching.
    QString failureText() const;
};

/**
 * Runs external build tools (git, npm, pip, uv)
 * Injected into the installer so tests can script the outcomes.
 */
class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;

    virtual CommandResult run(const CommandSpec& spec) = 0;

    /// True when @p program resolves on PATH.
    virtual bool isAvailable(const QString& program) const = 0;
};

class ProcessCommandRunner : public ICommandRunner {
public:
    CommandResult run(const CommandSpec& spec) override;
    bool isAvailable(const QString& program) const override;

    static constexpr int kStartTimeoutMs = 15000;
};

} // namespace toolhub_server
