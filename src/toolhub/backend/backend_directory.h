#pragma once

#include <QList>
#include <QString>

#include "backend_definition.h"

namespace toolhub {

/**
 * Launch data for a backend that is currently up
 */
struct RunningBackend {
    BackendDefinition definition;
    QString installPath;
    EnvMap env;
};

/**
 * Source of truth for which backends are running
 * Implemented by the lifecycle manager in-process and by a control API client
 * when the gateway runs in a separate process.
 */
class IBackendDirectory {
public:
    virtual ~IBackendDirectory() = default;

    /// Running backends ordered by id.
    virtual QList<RunningBackend> runningBackends() const = 0;

    virtual bool findRunning(const QString& backendId, RunningBackend& out) const = 0;
};

} // namespace toolhub
