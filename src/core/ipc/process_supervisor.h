#pragma once

#include "core/ipc/service_state.h"
#include "core/shared/settings.h"

#include <QObject>
#include <QProcess>
#include <QProcessEnvironment>
#include <QString>

namespace md {

inline const QString kServerServiceName = QStringLiteral("next-server");
inline const QString kWorkerServiceName = QStringLiteral("moondream-worker");

// Bundled resources live under <resourceDir>/resources/, mirroring the
// application bundle layout.
struct ResourceLocator {
    QString resourceDir;

    QString resourcePath(const QString& relativePath) const;
    QString serverBundleDir() const;   // next/
    QString serverScript() const;      // next/server.js
    QString nodeBinary() const;        // bin/node
    QString workerBinary() const;      // bin/moondream-worker
};

enum class SpawnError {
    None,
    ResourceMissing,
    SpawnFailed,
};

struct SpawnResult {
    ProcessHandle process;
    SpawnError error = SpawnError::None;
    QString message;
    QString logPath;

    bool ok() const { return process != nullptr; }
};

// ProcessSupervisor -- starts the server and worker child processes and
// tears them down.
//
// Children get stdin from the null device and append stdout/stderr to
// <configRoot>/logs/<service>.log. The returned handles are owned by the
// caller (normally stored in ServiceState); the supervisor only reports
// lifecycle events for them.
class ProcessSupervisor : public QObject {
    Q_OBJECT
public:
    static constexpr int kStartTimeoutMs = 5000;
    static constexpr int kKillWaitMs = 1000;

    explicit ProcessSupervisor(QObject* parent = nullptr);
    ~ProcessSupervisor() override;

    SpawnResult spawnServer(const ResourceLocator& resources,
                            quint16 port,
                            const QString& configRoot,
                            const QString& dataDir,
                            const AppSettings& settings);

    SpawnResult spawnWorker(const ResourceLocator& resources,
                            const QString& dbPath,
                            const QString& configRoot,
                            const AppSettings& settings);

    // Takes both handles out of `state` and kills them. Safe to call with
    // empty slots and more than once.
    void terminateAll(ServiceState& state);

    // Kills one process and waits up to kKillWaitMs for it to be reaped.
    void terminate(ProcessHandle process, const QString& name);

    static QProcessEnvironment serverEnvironment(quint16 port,
                                                 const QString& configRoot,
                                                 const QString& dataDir,
                                                 const AppSettings& settings,
                                                 const QProcessEnvironment& base
                                                 = QProcessEnvironment::systemEnvironment());

    static QProcessEnvironment workerEnvironment(const QString& dbPath,
                                                 const QString& configRoot,
                                                 const AppSettings& settings,
                                                 const QProcessEnvironment& base
                                                 = QProcessEnvironment::systemEnvironment());

    static QString logDirectory(const QString& configRoot);
    static QString logPath(const QString& configRoot, const QString& serviceName);
    static QString databasePath(const QString& dataDir);

    static QString errorToString(SpawnError error);

signals:
    void serviceStarted(const QString& name, qint64 pid);
    void serviceExited(const QString& name, int exitCode, bool crashed);

private:
    SpawnResult launch(const QString& name,
                       const QString& program,
                       const QStringList& arguments,
                       const QString& workingDirectory,
                       const QProcessEnvironment& environment,
                       const QString& configRoot);
};

} // namespace md
