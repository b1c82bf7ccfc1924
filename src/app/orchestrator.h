#pragma once

#include "core/ipc/process_supervisor.h"
#include "core/ipc/service_state.h"
#include "core/shared/settings.h"

#include <QObject>
#include <QString>

#include <functional>
#include <memory>
#include <optional>

namespace md {

struct OrchestratorOptions {
    QString configRoot;
    ResourceLocator resources;
    QString healthHost = QStringLiteral("127.0.0.1");
    QString healthPath = QStringLiteral("/api/projects");
    int healthTimeoutMs = 8000;

    // Polled between startup steps alongside stop(). Lets a caller that
    // cannot reach the event loop yet (signal handlers) cancel startup.
    std::function<bool()> cancelRequested;
};

// Orchestrator -- runs the launcher's startup sequence and owns the state
// of the child processes for the lifetime of the application.
//
// start() is synchronous: settings, pending migration, data directory, port,
// server, readiness probe, worker. stop() may be called from any thread at
// any time; a startup still in progress notices and abandons its remaining
// steps, killing any process it spawns after the request.
class Orchestrator : public QObject {
    Q_OBJECT
public:
    explicit Orchestrator(OrchestratorOptions options, QObject* parent = nullptr);
    ~Orchestrator() override;

    // Returns false only when the application cannot become usable: the
    // server could not be started, or shutdown was requested first.
    bool start(QString* error = nullptr);
    void stop();

    std::optional<quint16> serverPort() const;
    QString dataDir() const;
    QString serverLogPath() const;
    const AppSettings& settings() const;
    bool serverResponded() const;
    bool workerRunning() const;

    ServiceState& state();
    ProcessSupervisor* supervisor() const;

signals:
    void serverReady(quint16 port);
    void serverExited(int exitCode);
    void workerUnavailable(const QString& reason);

private slots:
    void onServiceExited(const QString& name, int exitCode, bool crashed);

private:
    bool abandonIfStopping(const char* step, QString* error);
    void reportAbandoned(const char* step, QString* error) const;
    void loadSettings();
    QString applyMigration();

    OrchestratorOptions m_options;
    std::unique_ptr<ProcessSupervisor> m_supervisor;
    ServiceState m_state;
    AppSettings m_settings;
    QString m_dataDir;
    bool m_started = false;
    bool m_serverResponded = false;
};

} // namespace md
