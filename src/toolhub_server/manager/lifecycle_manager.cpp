#include "lifecycle_manager.h"

#include <QDir>
#include <QFileInfo>
#include <QReadLocker>
#include <QWriteLocker>

#include "backend_log_writer.h"
#include "client_config.h"
#include "command_runner.h"
#include "toolhub/backend/backend_launch.h"
#include "toolhub/backend/env_file.h"

using toolhub::BackendDefinition;
using toolhub::EnvFile;
using toolhub::EnvMap;
using toolhub::ErrorReporter;
using toolhub::RunningBackend;
using toolhub::RuntimeKind;

namespace toolhub_server {

namespace {

EnvMap loadEnvFile(const QString& installPath) {
    EnvMap env;
    const QString path = EnvFile::pathFor(installPath);
    if (!QFileInfo::exists(path)) {
        return env;
    }
    QString error;
    if (!EnvFile::read(path, env, error)) {
        qWarning("%s", qUtf8Printable(error));
    }
    return env;
}

bool looksInstalled(const BackendDefinition& def, const QString& path) {
    const QDir dir(path);
    if (!dir.exists()) {
        return false;
    }
    if (def.runtime == RuntimeKind::Python) {
        return dir.exists("venv");
    }
    return QFileInfo::exists(dir.filePath("package.json")) && dir.exists("node_modules");
}

} // namespace

LifecycleManager::LifecycleManager(const toolhub::BackendCatalog& catalog,
                                   const Options& options,
                                   ICommandRunner* runner,
                                   QObject* parent)
    : QObject(parent)
    , m_catalog(catalog)
    , m_options(options)
    , m_runner(runner)
    , m_validator(runner, options.clientTarget)
    , m_store(options.dataRoot + "/" + StateStore::kFileName) {
}

LifecycleManager::~LifecycleManager() {
    waitForInstalls();
    stopAll();
}

QString LifecycleManager::installPathFor(const QString& id) const {
    return m_options.dataRoot + "/backends/" + id;
}

// ---------------------------------------------------------------------------
// Persistence

bool LifecycleManager::loadState(QString& error) {
    if (!m_store.exists()) {
        qInfo("No saved state, scanning %s/backends", qUtf8Printable(m_options.dataRoot));
        detectInstallations();
        persist();
        return true;
    }

    QJsonObject snapshot;
    if (!m_store.load(snapshot, error)) {
        qWarning("Ignoring unreadable state file: %s", qUtf8Printable(error));
        error.clear();
        detectInstallations();
        persist();
        return true;
    }

    int restored = 0;
    {
        QWriteLocker locker(&m_lock);
        m_installations.clear();
        for (auto it = snapshot.constBegin(); it != snapshot.constEnd(); ++it) {
            if (!m_catalog.contains(it.key())) {
                qWarning("State: skipping unknown backend %s", qUtf8Printable(it.key()));
                continue;
            }

            auto inst = std::make_unique<BackendInstallation>();
            QString entryErr;
            if (!BackendInstallation::fromJson(it.value().toObject(), *inst, entryErr)) {
                qWarning("State: skipping %s: %s", qUtf8Printable(it.key()),
                         qUtf8Printable(entryErr));
                continue;
            }
            if (!QDir(inst->installPath).exists()) {
                qWarning("State: dropping %s, %s is gone", qUtf8Printable(it.key()),
                         qUtf8Printable(inst->installPath));
                continue;
            }

            inst->id = it.key();
            inst->env = loadEnvFile(inst->installPath);
            inst->state = BackendState::Installed;
            inst->process = nullptr;
            inst->pid = 0;
            m_installations[inst->id] = std::move(inst);
            ++restored;
        }
    }

    qInfo("State: restored %d installations", restored);
    persist();
    error.clear();
    return true;
}

bool LifecycleManager::detectInstallations() {
    int detected = 0;
    QWriteLocker locker(&m_lock);
    for (const BackendDefinition& def : m_catalog.all()) {
        const QString path = installPathFor(def.id);
        if (!looksInstalled(def, path)) {
            continue;
        }

        auto inst = std::make_unique<BackendInstallation>();
        inst->id = def.id;
        inst->installPath = path;
        inst->state = BackendState::Installed;
        inst->env = loadEnvFile(path);
        inst->installedAt = QFileInfo(path).lastModified().toUTC();
        inst->appendLog("Detected existing installation");
        m_installations[def.id] = std::move(inst);
        ++detected;
        qInfo("Detected existing installation of %s", qUtf8Printable(def.id));
    }
    return detected > 0;
}

void LifecycleManager::persist() {
    QMutexLocker persistLocker(&m_persistMutex);
    QJsonObject snapshot;
    {
        QReadLocker locker(&m_lock);
        for (const auto& [id, inst] : m_installations) {
            if (inst->state == BackendState::Installing) {
                continue;
            }
            snapshot[id] = inst->toJson();
        }
    }

    QString error;
    if (!m_store.save(snapshot, error)) {
        qWarning("Failed to save state: %s", qUtf8Printable(error));
    }
}

// ---------------------------------------------------------------------------
// Install

bool LifecycleManager::install(const QString& id, const EnvMap& config, QString& error) {
    const auto def = m_catalog.find(id);
    if (!def) {
        error = "unknown backend: " + id;
        return false;
    }

    const QString path = installPathFor(id);
    {
        QWriteLocker locker(&m_lock);
        auto it = m_installations.find(id);
        if (it != m_installations.end()) {
            if (it->second->state == BackendState::Installing) {
                error = QString("backend %1 is already installing").arg(id);
                return false;
            }
            if (it->second->state == BackendState::Running) {
                error = QString("backend %1 is running; stop it first").arg(id);
                return false;
            }
        } else {
            auto inst = std::make_unique<BackendInstallation>();
            inst->id = id;
            it = m_installations.emplace(id, std::move(inst)).first;
        }

        BackendInstallation* inst = it->second.get();
        inst->installPath = path;
        inst->state = BackendState::Installing;
        inst->env.clear();
        inst->appendLog("Installation started");
    }

    m_errorHistory.clear(id);
    qInfo("Installing %s into %s", qUtf8Printable(id), qUtf8Printable(path));

    const BackendDefinition definition = *def;
    QThread* worker = QThread::create([this, id, definition, path, config]() {
        runInstall(id, definition, path, config);
    });
    worker->setObjectName("install-" + id);
    {
        QMutexLocker locker(&m_threadsMutex);
        m_installThreads.append(QPointer<QThread>(worker));
    }
    connect(worker, &QThread::finished, this, [this, worker]() {
        {
            QMutexLocker locker(&m_threadsMutex);
            m_installThreads.removeAll(QPointer<QThread>(worker));
        }
        worker->deleteLater();
    });
    worker->start();
    return true;
}

void LifecycleManager::runInstall(const QString& id,
                                  const BackendDefinition& def,
                                  const QString& installPath,
                                  const EnvMap& config) {
    Installer installer(m_runner, &m_validator);
    InstallFailure failure;
    const bool ok = installer.install(
        InstallRequest{def, installPath, config},
        [this, id](const QString& line) { appendLog(id, line); },
        failure);

    if (!ok) {
        const ErrorReporter reporter(id, "Installing " + def.name);
        const toolhub::EnhancedError err = reporter.installationError(failure.stage, failure.text);
        m_errorHistory.add(id, err);
        qWarning("Install of %s failed at %s: %s", qUtf8Printable(id),
                 qUtf8Printable(err.stage), qUtf8Printable(failure.text));
        {
            QWriteLocker locker(&m_lock);
            auto it = m_installations.find(id);
            if (it != m_installations.end()) {
                it->second->state = BackendState::Failed;
                it->second->appendLog(err.message + ": " + failure.text);
            }
        }
        emit installFinished(id, false);
        return;
    }

    {
        QWriteLocker locker(&m_lock);
        auto it = m_installations.find(id);
        if (it != m_installations.end()) {
            BackendInstallation* inst = it->second.get();
            inst->state = BackendState::Installed;
            inst->env = loadEnvFile(installPath);
            inst->installedAt = QDateTime::currentDateTimeUtc();
            inst->appendLog("Installation completed");
        }
    }
    qInfo("Installed %s", qUtf8Printable(id));

    persist();
    registerClientEntry();
    emit installFinished(id, true);
}

void LifecycleManager::registerClientEntry() {
    const ClientConfigTarget& target = m_options.clientTarget;
    if (target.path.isEmpty() || target.selfPath.isEmpty()) {
        return;
    }
    QString error;
    if (!ClientConfig::upsertEntry(target.path, target.entryName, target.selfPath, target.args,
                                   error)) {
        qWarning("Cannot update client config: %s", qUtf8Printable(error));
    }
}

void LifecycleManager::appendLog(const QString& id, const QString& line) {
    QWriteLocker locker(&m_lock);
    auto it = m_installations.find(id);
    if (it != m_installations.end()) {
        it->second->appendLog(line);
    }
}

void LifecycleManager::waitForInstalls() {
    QList<QPointer<QThread>> threads;
    {
        QMutexLocker locker(&m_threadsMutex);
        threads = m_installThreads;
    }
    for (const QPointer<QThread>& thread : threads) {
        if (thread) {
            thread->wait();
        }
    }
}

bool LifecycleManager::isInstallBusy() const {
    QReadLocker locker(&m_lock);
    for (const auto& [id, inst] : m_installations) {
        if (inst->state == BackendState::Installing) {
            return true;
        }
    }
    return false;
}

// ---------------------------------------------------------------------------
// Start / stop

void LifecycleManager::recordStartupError(const BackendDefinition& def, const QString& text) {
    const ErrorReporter reporter(def.id, "Starting " + def.name);
    const toolhub::EnhancedError err = reporter.startupError(text);
    m_errorHistory.add(def.id, err);
    appendLog(def.id, err.message + ": " + text);
    qWarning("%s: %s", qUtf8Printable(err.message), qUtf8Printable(text));
}

bool LifecycleManager::start(const QString& id, QString& error) {
    const auto def = m_catalog.find(id);
    if (!def) {
        error = "unknown backend: " + id;
        return false;
    }

    QString installPath;
    EnvMap env;
    {
        QReadLocker locker(&m_lock);
        auto it = m_installations.find(id);
        if (it == m_installations.end()) {
            error = QString("backend %1 is not installed").arg(id);
            return false;
        }
        const BackendInstallation* inst = it->second.get();
        if (inst->state == BackendState::Running) {
            error = QString("backend %1 is already running").arg(id);
            return false;
        }
        if (inst->state == BackendState::Installing) {
            error = QString("backend %1 is installing").arg(id);
            return false;
        }
        installPath = inst->installPath;
        env = inst->env;
    }

    ValidationResult validation;
    QString validationErr;
    if (!m_validator.ensureValid(*def, installPath, validation, validationErr)) {
        error = QString("backend %1 cannot be started: %2").arg(id, validationErr);
        recordStartupError(*def, validationErr);
        return false;
    }

    // .env may have been edited since install
    env.insert(loadEnvFile(installPath));

    const toolhub::LaunchSpec spec = toolhub::buildLaunchSpec(*def, installPath, env);
    const QString logsDir = m_options.dataRoot + "/logs";
    QDir().mkpath(logsDir);

    auto logWriter = std::make_unique<BackendLogWriter>(
        logsDir + "/" + id + ".log", m_options.logMaxBytes, m_options.logMaxFiles);

    auto* proc = new QProcess(this);
    spec.applyTo(*proc);
    connect(proc, &QProcess::readyReadStandardOutput, this, [proc, w = logWriter.get()]() {
        w->appendStdout(proc->readAllStandardOutput());
    });
    connect(proc, &QProcess::readyReadStandardError, this, [proc, w = logWriter.get()]() {
        w->appendStderr(proc->readAllStandardError());
    });

    proc->start();
    if (!proc->waitForStarted(m_options.startTimeoutMs)) {
        const QString reason = proc->errorString();
        proc->disconnect();
        proc->kill();
        proc->waitForFinished(1000);
        proc->deleteLater();
        error = QString("failed to start backend %1").arg(id);
        recordStartupError(*def, QString("%1: %2").arg(spec.commandLine(), reason));
        return false;
    }

    connect(proc, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished), this,
            [this, id, proc](int exitCode, QProcess::ExitStatus status) {
                onProcessFinished(id, proc, exitCode, status);
            });

    const qint64 pid = proc->processId();
    {
        QWriteLocker locker(&m_lock);
        auto it = m_installations.find(id);
        if (it == m_installations.end() || it->second->state == BackendState::Running
            || it->second->state == BackendState::Installing) {
            locker.unlock();
            proc->disconnect();
            proc->kill();
            proc->waitForFinished(1000);
            proc->deleteLater();
            error = QString("backend %1 changed state during start").arg(id);
            return false;
        }
        BackendInstallation* inst = it->second.get();
        inst->process = proc;
        inst->pid = pid;
        inst->logWriter = std::move(logWriter);
        inst->env = env;
        inst->state = BackendState::Running;
        inst->startedAt = QDateTime::currentDateTimeUtc();
        inst->appendLog(QString("Started (pid %1): %2").arg(pid).arg(spec.commandLine()));
    }

    qInfo("Started backend %s (pid %lld)", qUtf8Printable(id), static_cast<long long>(pid));
    persist();
    emit backendStarted(id);
    return true;
}

bool LifecycleManager::stop(const QString& id, QString& error) {
    QProcess* proc = nullptr;
    std::unique_ptr<BackendLogWriter> logWriter;
    {
        QWriteLocker locker(&m_lock);
        auto it = m_installations.find(id);
        if (it == m_installations.end()) {
            return true;
        }
        BackendInstallation* inst = it->second.get();
        if (inst->state == BackendState::Installing) {
            error = QString("backend %1 is installing").arg(id);
            return false;
        }
        proc = inst->process;
        logWriter = std::move(inst->logWriter);
        inst->process = nullptr;
        inst->pid = 0;
        inst->state = BackendState::Stopped;
        inst->appendLog("Stopped");
    }

    if (proc) {
        proc->disconnect(this);
        if (proc->state() != QProcess::NotRunning) {
            proc->kill();
            if (!proc->waitForFinished(1000)) {
                qWarning("Backend %s did not exit after kill", qUtf8Printable(id));
            }
        }
        if (logWriter) {
            logWriter->appendStdout(proc->readAllStandardOutput());
            logWriter->appendStderr(proc->readAllStandardError());
        }
        proc->deleteLater();
    }

    qInfo("Stopped backend %s", qUtf8Printable(id));
    persist();
    emit backendStopped(id);
    return true;
}

void LifecycleManager::stopAll() {
    QStringList running;
    {
        QReadLocker locker(&m_lock);
        for (const auto& [id, inst] : m_installations) {
            if (inst->process) {
                running.append(id);
            }
        }
    }
    for (const QString& id : running) {
        QString error;
        if (!stop(id, error)) {
            qWarning("Stop %s: %s", qUtf8Printable(id), qUtf8Printable(error));
        }
    }
}

void LifecycleManager::onProcessFinished(const QString& id, QProcess* proc, int exitCode,
                                         QProcess::ExitStatus status) {
    std::unique_ptr<BackendLogWriter> logWriter;
    {
        QWriteLocker locker(&m_lock);
        auto it = m_installations.find(id);
        if (it == m_installations.end() || it->second->process != proc) {
            return;
        }
        BackendInstallation* inst = it->second.get();
        logWriter = std::move(inst->logWriter);
        inst->process = nullptr;
        inst->pid = 0;
        inst->state = BackendState::Stopped;
        inst->appendLog(QString("Process exited with code %1%2")
                            .arg(exitCode)
                            .arg(status == QProcess::CrashExit ? " (crashed)" : ""));
    }

    if (logWriter) {
        logWriter->appendStdout(proc->readAllStandardOutput());
        logWriter->appendStderr(proc->readAllStandardError());
    }
    proc->disconnect(this);
    proc->deleteLater();

    qWarning("Backend %s exited with code %d", qUtf8Printable(id), exitCode);
    persist();
    emit backendStopped(id);
}

// ---------------------------------------------------------------------------
// Queries

bool LifecycleManager::validate(const QString& id, ValidationResult& result, QString& error) const {
    const auto def = m_catalog.find(id);
    if (!def) {
        error = "unknown backend: " + id;
        return false;
    }

    QString path;
    {
        QReadLocker locker(&m_lock);
        auto it = m_installations.find(id);
        if (it == m_installations.end()) {
            error = QString("backend %1 is not installed").arg(id);
            return false;
        }
        path = it->second->installPath;
    }

    result = m_validator.validate(*def, path);
    return true;
}

bool LifecycleManager::autoFix(const QString& id, ValidationResult& result, QString& error) {
    ValidationResult before;
    if (!validate(id, before, error)) {
        return false;
    }
    if (state(id) == BackendState::Installing) {
        error = QString("backend %1 is installing").arg(id);
        return false;
    }

    const bool fixed = m_validator.autoFix(before, error);
    QString revalidateErr;
    if (!validate(id, result, revalidateErr)) {
        error = revalidateErr;
        return false;
    }
    return fixed;
}

QList<BackendView> LifecycleManager::list() const {
    QList<BackendView> out;
    for (const BackendDefinition& def : m_catalog.all()) {
        BackendView v;
        view(def.id, v);
        out.append(v);
    }
    return out;
}

bool LifecycleManager::view(const QString& id, BackendView& out) const {
    const auto def = m_catalog.find(id);
    if (!def) {
        return false;
    }

    out = BackendView();
    out.definition = *def;

    QReadLocker locker(&m_lock);
    auto it = m_installations.find(id);
    if (it != m_installations.end()) {
        const BackendInstallation* inst = it->second.get();
        out.state = inst->state;
        out.installPath = inst->installPath;
        out.logs = inst->logs;
        out.envKeys = inst->env.keys();
        out.pid = inst->pid;
        out.installedAt = inst->installedAt;
        out.startedAt = inst->startedAt;
    }
    return true;
}

QStringList LifecycleManager::logs(const QString& id, int limit) const {
    QReadLocker locker(&m_lock);
    auto it = m_installations.find(id);
    if (it == m_installations.end()) {
        return {};
    }
    const QStringList& all = it->second->logs;
    if (limit <= 0 || limit >= all.size()) {
        return all;
    }
    return all.mid(all.size() - limit);
}

BackendState LifecycleManager::state(const QString& id) const {
    QReadLocker locker(&m_lock);
    auto it = m_installations.find(id);
    return it == m_installations.end() ? BackendState::NotInstalled : it->second->state;
}

QList<RunningBackend> LifecycleManager::runningBackends() const {
    QList<RunningBackend> out;
    QReadLocker locker(&m_lock);
    for (const auto& [id, inst] : m_installations) {
        if (inst->state != BackendState::Running) {
            continue;
        }
        const auto def = m_catalog.find(id);
        if (!def) {
            continue;
        }
        out.append(RunningBackend{*def, inst->installPath, inst->env});
    }
    return out;
}

bool LifecycleManager::findRunning(const QString& backendId, RunningBackend& out) const {
    const auto def = m_catalog.find(backendId);
    if (!def) {
        return false;
    }
    QReadLocker locker(&m_lock);
    auto it = m_installations.find(backendId);
    if (it == m_installations.end() || it->second->state != BackendState::Running) {
        return false;
    }
    out = RunningBackend{*def, it->second->installPath, it->second->env};
    return true;
}

} // namespace toolhub_server
