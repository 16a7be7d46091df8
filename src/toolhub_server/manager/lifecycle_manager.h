#pragma once

#include <QList>
#include <QMutex>
#include <QObject>
#include <QPointer>
#include <QProcess>
#include <QReadWriteLock>
#include <QString>
#include <QThread>

#include <map>
#include <memory>

#include "config_validator.h"
#include "installer.h"
#include "model/backend_installation.h"
#include "state_store.h"
#include "toolhub/backend/backend_catalog.h"
#include "toolhub/backend/backend_directory.h"
#include "toolhub/diagnostics/error_history.h"

namespace toolhub_server {

class ICommandRunner;

/**
 * Registry of installed backends and owner of their processes
 *
 * All mutation goes through one QReadWriteLock. Installs run on a worker thread
 * and only take the lock to register and to commit. Processes are started on the
 * manager's thread so their output signals are delivered by its event loop.
 */
class LifecycleManager : public QObject, public toolhub::IBackendDirectory {
    Q_OBJECT
public:
    struct Options {
        QString dataRoot;
        qint64 logMaxBytes = 10 * 1024 * 1024;
        int logMaxFiles = 3;
        int startTimeoutMs = 15000;
        ClientConfigTarget clientTarget;
    };

    LifecycleManager(const toolhub::BackendCatalog& catalog,
                     const Options& options,
                     ICommandRunner* runner,
                     QObject* parent = nullptr);
    ~LifecycleManager() override;

    /// Reload server_state.json, or detect existing installs when there is none.
    bool loadState(QString& error);

    /// Registers the install and returns; the pipeline runs on a worker thread.
    bool install(const QString& id, const toolhub::EnvMap& config, QString& error);

    bool start(const QString& id, QString& error);

    /// Unknown ids succeed as a no-op. Rejected only while installing.
    bool stop(const QString& id, QString& error);
    void stopAll();

    bool validate(const QString& id, ValidationResult& result, QString& error) const;
    bool autoFix(const QString& id, ValidationResult& result, QString& error);

    QList<BackendView> list() const;
    bool view(const QString& id, BackendView& out) const;
    QStringList logs(const QString& id, int limit) const;
    BackendState state(const QString& id) const;
    bool isInstallBusy() const;

    /// Block until every install worker has finished.
    void waitForInstalls();

    // IBackendDirectory
    QList<toolhub::RunningBackend> runningBackends() const override;
    bool findRunning(const QString& backendId, toolhub::RunningBackend& out) const override;

    const toolhub::BackendCatalog& catalog() const { return m_catalog; }
    toolhub::ErrorHistory* errorHistory() { return &m_errorHistory; }
    const toolhub::ErrorHistory* errorHistory() const { return &m_errorHistory; }
    ConfigValidator* validator() { return &m_validator; }
    QString installPathFor(const QString& id) const;
    QString dataRoot() const { return m_options.dataRoot; }

signals:
    void installFinished(const QString& id, bool success);
    void backendStarted(const QString& id);
    void backendStopped(const QString& id);

private:
    void runInstall(const QString& id,
                    const toolhub::BackendDefinition& def,
                    const QString& installPath,
                    const toolhub::EnvMap& config);
    void appendLog(const QString& id, const QString& line);
    void recordStartupError(const toolhub::BackendDefinition& def, const QString& text);
    void onProcessFinished(const QString& id, QProcess* proc, int exitCode,
                           QProcess::ExitStatus status);
    bool detectInstallations();
    void persist();
    void registerClientEntry();

    toolhub::BackendCatalog m_catalog;
    Options m_options;
    ICommandRunner* m_runner = nullptr;
    ConfigValidator m_validator;
    StateStore m_store;
    toolhub::ErrorHistory m_errorHistory;

    mutable QReadWriteLock m_lock;
    // held across snapshot and save so an older snapshot never lands last
    QMutex m_persistMutex;
    std::map<QString, std::unique_ptr<BackendInstallation>> m_installations;

    mutable QMutex m_threadsMutex;
    QList<QPointer<QThread>> m_installThreads;
};

} // namespace toolhub_server
