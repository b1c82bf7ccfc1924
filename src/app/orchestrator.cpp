#include "orchestrator.h"
#include "core/net/health_prober.h"
#include "core/net/port_allocator.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"
#include "core/storage/data_dir_resolver.h"
#include "core/storage/migration_engine.h"

#include <QDir>
#include <QThread>

namespace md {

Orchestrator::Orchestrator(OrchestratorOptions options, QObject* parent)
    : QObject(parent)
    , m_options(std::move(options))
    , m_supervisor(std::make_unique<ProcessSupervisor>(this))
{
    connect(m_supervisor.get(), &ProcessSupervisor::serviceExited,
            this, &Orchestrator::onServiceExited);
}

Orchestrator::~Orchestrator()
{
    stop();
}

bool Orchestrator::start(QString* error)
{
    if (m_started) {
        if (error) {
            *error = QStringLiteral("Orchestrator already started");
        }
        return false;
    }
    m_started = true;

    LOG_INFO(mdCore, "Orchestrator: starting (config root %s)",
             qUtf8Printable(m_options.configRoot));

    if (abandonIfStopping("loading settings", error)) {
        return false;
    }
    if (!QDir().mkpath(m_options.configRoot)) {
        if (error) {
            *error = QStringLiteral("Failed to create config directory: %1")
                         .arg(m_options.configRoot);
        }
        return false;
    }

    loadSettings();
    const QString overrideDir = applyMigration();
    m_dataDir = overrideDir.isEmpty()
        ? resolveDataDir(m_options.configRoot, m_settings)
        : overrideDir;
    if (!QDir().mkpath(m_dataDir)) {
        if (error) {
            *error = QStringLiteral("Failed to create data directory: %1").arg(m_dataDir);
        }
        return false;
    }
    LOG_INFO(mdCore, "Orchestrator: data directory %s%s",
             qUtf8Printable(m_dataDir),
             overrideDir.isEmpty() ? "" : " (pre-migration location)");

    const quint16 port = PortAllocator::allocate();
    if (!m_state.assignPort(port)) {
        LOG_WARN(mdCore, "Orchestrator: port already assigned, keeping %u",
                 static_cast<unsigned>(m_state.port().value_or(port)));
    }
    const quint16 serverPortValue = m_state.port().value_or(port);

    if (abandonIfStopping("starting server", error)) {
        return false;
    }

    SpawnResult server = m_supervisor->spawnServer(m_options.resources,
                                                   serverPortValue,
                                                   m_options.configRoot,
                                                   m_dataDir,
                                                   m_settings);
    if (!server.ok()) {
        LOG_ERROR(mdCore, "Orchestrator: server unavailable (%s): %s",
                  qUtf8Printable(ProcessSupervisor::errorToString(server.error)),
                  qUtf8Printable(server.message));
        if (error) {
            *error = server.message;
        }
        return false;
    }
    if (ProcessHandle rejected = m_state.storeServer(std::move(server.process))) {
        m_supervisor->terminate(std::move(rejected), kServerServiceName);
        reportAbandoned("storing server", error);
        return false;
    }

    // The first request runs the server's schema setup; the worker must not
    // open the database before that.
    m_serverResponded = HealthProber::waitUntilReady(m_options.healthHost,
                                                     serverPortValue,
                                                     m_options.healthPath,
                                                     m_options.healthTimeoutMs);
    if (!m_serverResponded) {
        LOG_WARN(mdCore, "Orchestrator: server not ready after %dms, starting worker anyway (see %s)",
                 m_options.healthTimeoutMs, qUtf8Printable(serverLogPath()));
    }

    if (abandonIfStopping("starting worker", error)) {
        return false;
    }

    SpawnResult worker = m_supervisor->spawnWorker(m_options.resources,
                                                   ProcessSupervisor::databasePath(m_dataDir),
                                                   m_options.configRoot,
                                                   m_settings);
    if (!worker.ok()) {
        LOG_WARN(mdCore, "Orchestrator: continuing without worker (%s): %s",
                 qUtf8Printable(ProcessSupervisor::errorToString(worker.error)),
                 qUtf8Printable(worker.message));
        emit workerUnavailable(worker.message);
    } else if (ProcessHandle rejected = m_state.storeWorker(std::move(worker.process))) {
        m_supervisor->terminate(std::move(rejected), kWorkerServiceName);
        reportAbandoned("storing worker", error);
        return false;
    }

    LOG_INFO(mdCore, "Orchestrator: server listening on 127.0.0.1:%u",
             static_cast<unsigned>(serverPortValue));
    emit serverReady(serverPortValue);
    return true;
}

void Orchestrator::stop()
{
    m_state.requestShutdown();

    // QProcess handles belong to this object's thread; a stop from elsewhere
    // only flags the running startup and defers the kill.
    if (QThread::currentThread() != thread()) {
        QMetaObject::invokeMethod(this, [this]() {
            m_supervisor->terminateAll(m_state);
        }, Qt::QueuedConnection);
        return;
    }

    LOG_INFO(mdCore, "Orchestrator: stopping child processes");
    m_supervisor->terminateAll(m_state);
}

std::optional<quint16> Orchestrator::serverPort() const
{
    return m_state.port();
}

QString Orchestrator::dataDir() const
{
    return m_dataDir;
}

QString Orchestrator::serverLogPath() const
{
    return ProcessSupervisor::logPath(m_options.configRoot, kServerServiceName);
}

const AppSettings& Orchestrator::settings() const
{
    return m_settings;
}

bool Orchestrator::serverResponded() const
{
    return m_serverResponded;
}

bool Orchestrator::workerRunning() const
{
    return m_state.hasWorker();
}

ServiceState& Orchestrator::state()
{
    return m_state;
}

ProcessSupervisor* Orchestrator::supervisor() const
{
    return m_supervisor.get();
}

void Orchestrator::onServiceExited(const QString& name, int exitCode, bool crashed)
{
    if (name == kServerServiceName) {
        LOG_WARN(mdCore, "Orchestrator: server exited (code=%d, crashed=%d)",
                 exitCode, crashed ? 1 : 0);
        emit serverExited(exitCode);
    } else if (name == kWorkerServiceName) {
        // The worker is optional; the app keeps running without it.
        LOG_WARN(mdCore, "Orchestrator: worker exited (code=%d)", exitCode);
    }
}

bool Orchestrator::abandonIfStopping(const char* step, QString* error)
{
    if (m_options.cancelRequested && m_options.cancelRequested()) {
        m_state.requestShutdown();
    }
    if (!m_state.shutdownRequested()) {
        return false;
    }
    // Anything already spawned must not outlive the abandoned startup.
    m_supervisor->terminateAll(m_state);
    reportAbandoned(step, error);
    return true;
}

void Orchestrator::reportAbandoned(const char* step, QString* error) const
{
    LOG_INFO(mdCore, "Orchestrator: shutdown requested, abandoning startup at %s", step);
    if (error) {
        *error = QStringLiteral("Shutdown requested before %1").arg(QString::fromLatin1(step));
    }
}

void Orchestrator::loadSettings()
{
    SettingsLoadResult loaded = SettingsManager::loadDetailed(m_options.configRoot);
    if (loaded.recovered()) {
        LOG_WARN(mdSettings, "Settings %s, using defaults: %s",
                 qUtf8Printable(SettingsManager::statusToString(loaded.status)),
                 qUtf8Printable(loaded.message));
    } else {
        LOG_INFO(mdSettings, "Settings %s",
                 qUtf8Printable(SettingsManager::statusToString(loaded.status)));
    }
    m_settings = std::move(loaded.settings);
}

QString Orchestrator::applyMigration()
{
    const MigrationOutcome outcome = MigrationEngine::apply(m_options.configRoot, m_settings);
    if (outcome.state == MigrationState::NoRequest) {
        return QString();
    }

    LOG_INFO(mdStorage, "Migration %s -> %s: %s (%s)",
             qUtf8Printable(outcome.from), qUtf8Printable(outcome.to),
             qUtf8Printable(MigrationEngine::stateToString(outcome.state)),
             qUtf8Printable(outcome.message));
    if (!outcome.backupPath.isEmpty()) {
        LOG_INFO(mdStorage, "Previous destination contents kept at %s",
                 qUtf8Printable(outcome.backupPath));
    }
    if (!outcome.settingsPersisted) {
        LOG_WARN(mdSettings, "Cleared migration request was not saved; it will be re-evaluated next launch");
    }
    return outcome.dataDirOverride.value_or(QString());
}

} // namespace md
