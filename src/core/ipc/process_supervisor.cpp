#include "core/ipc/process_supervisor.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"

#include <QDir>
#include <QFileInfo>

namespace md {

namespace {

SpawnResult missingResource(const QString& what, const QString& path)
{
    SpawnResult result;
    result.error = SpawnError::ResourceMissing;
    result.message = QStringLiteral("Missing %1 at %2").arg(what, path);
    return result;
}

SpawnResult spawnFailure(const QString& message)
{
    SpawnResult result;
    result.error = SpawnError::SpawnFailed;
    result.message = message;
    return result;
}

} // namespace

QString ResourceLocator::resourcePath(const QString& relativePath) const
{
    return QDir::cleanPath(QDir(resourceDir).filePath(QStringLiteral("resources/") + relativePath));
}

QString ResourceLocator::serverBundleDir() const
{
    return resourcePath(QStringLiteral("next"));
}

QString ResourceLocator::serverScript() const
{
    return resourcePath(QStringLiteral("next/server.js"));
}

QString ResourceLocator::nodeBinary() const
{
    return resourcePath(QStringLiteral("bin/node"));
}

QString ResourceLocator::workerBinary() const
{
    return resourcePath(QStringLiteral("bin/moondream-worker"));
}

ProcessSupervisor::ProcessSupervisor(QObject* parent)
    : QObject(parent)
{
}

ProcessSupervisor::~ProcessSupervisor() = default;

SpawnResult ProcessSupervisor::spawnServer(const ResourceLocator& resources,
                                           quint16 port,
                                           const QString& configRoot,
                                           const QString& dataDir,
                                           const AppSettings& settings)
{
    const QString script = resources.serverScript();
    if (!QFileInfo::exists(script)) {
        return missingResource(QStringLiteral("server bundle"), script);
    }
    const QString node = resources.nodeBinary();
    if (!QFileInfo::exists(node)) {
        return missingResource(QStringLiteral("bundled Node runtime"), node);
    }

    if (!QDir().mkpath(dataDir)) {
        return spawnFailure(QStringLiteral("Failed to create data directory: %1").arg(dataDir));
    }

    return launch(kServerServiceName,
                  node,
                  {QStringLiteral("server.js")},
                  resources.serverBundleDir(),
                  serverEnvironment(port, configRoot, dataDir, settings),
                  configRoot);
}

SpawnResult ProcessSupervisor::spawnWorker(const ResourceLocator& resources,
                                           const QString& dbPath,
                                           const QString& configRoot,
                                           const AppSettings& settings)
{
    const QString worker = resources.workerBinary();
    if (!QFileInfo::exists(worker)) {
        return missingResource(QStringLiteral("bundled worker"), worker);
    }

    return launch(kWorkerServiceName,
                  worker,
                  {},
                  QString(),
                  workerEnvironment(dbPath, configRoot, settings),
                  configRoot);
}

void ProcessSupervisor::terminateAll(ServiceState& state)
{
    ServiceState::Handles handles = state.takeAll();
    if (!handles.server && !handles.worker) {
        LOG_DEBUG(mdProcess, "terminateAll: no child processes to stop");
        return;
    }
    terminate(std::move(handles.worker), kWorkerServiceName);
    terminate(std::move(handles.server), kServerServiceName);
}

void ProcessSupervisor::terminate(ProcessHandle process, const QString& name)
{
    if (!process) {
        return;
    }

    // Late finished() signals must not reach listeners once we own the teardown.
    process->disconnect(this);

    if (process->state() != QProcess::NotRunning) {
        LOG_INFO(mdProcess, "Stopping '%s' (pid=%lld)",
                 qUtf8Printable(name), static_cast<long long>(process->processId()));
        process->kill();
        if (!process->waitForFinished(kKillWaitMs)) {
            LOG_WARN(mdProcess, "'%s' did not exit within %dms after kill",
                     qUtf8Printable(name), kKillWaitMs);
        }
    }
}

QProcessEnvironment ProcessSupervisor::serverEnvironment(quint16 port,
                                                         const QString& configRoot,
                                                         const QString& dataDir,
                                                         const AppSettings& settings,
                                                         const QProcessEnvironment& base)
{
    QProcessEnvironment env = base;
    env.insert(QStringLiteral("HOSTNAME"), QStringLiteral("127.0.0.1"));
    env.insert(QStringLiteral("PORT"), QString::number(port));
    env.insert(QStringLiteral("NODE_ENV"), QStringLiteral("production"));
    env.insert(QStringLiteral("NEXT_TELEMETRY_DISABLED"), QStringLiteral("1"));
    env.insert(QStringLiteral("MOONDREAM_DATA_DIR"), dataDir);
    env.insert(QStringLiteral("MOONDREAM_APP_CONFIG_DIR"), configRoot);
    env.insert(QStringLiteral("MOONDREAM_SETTINGS_PATH"),
               SettingsManager::settingsFilePath(configRoot));
    env.insert(QStringLiteral("MOONDREAM_PROVIDER"), settings.aiProvider());
    env.insert(QStringLiteral("MOONDREAM_ENDPOINT"), settings.aiEndpoint());
    env.insert(QStringLiteral("MOONDREAM_DB_PATH"), databasePath(dataDir));
    return env;
}

QProcessEnvironment ProcessSupervisor::workerEnvironment(const QString& dbPath,
                                                         const QString& configRoot,
                                                         const AppSettings& settings,
                                                         const QProcessEnvironment& base)
{
    QProcessEnvironment env = base;
    env.insert(QStringLiteral("PYTHONUNBUFFERED"), QStringLiteral("1"));
    env.insert(QStringLiteral("MOONDREAM_DB_PATH"), dbPath);
    env.insert(QStringLiteral("MOONDREAM_PROVIDER"), settings.aiProvider());
    env.insert(QStringLiteral("MOONDREAM_ENDPOINT"), settings.aiEndpoint());
    // The launcher's own environment may tune the worker's polling.
    env.insert(QStringLiteral("MOONDREAM_POLL_SECONDS"),
               base.value(QStringLiteral("MOONDREAM_POLL_SECONDS"), QStringLiteral("1.0")));
    env.insert(QStringLiteral("MOONDREAM_RETRY_FAILED"),
               base.value(QStringLiteral("MOONDREAM_RETRY_FAILED"), QStringLiteral("1")));
    env.insert(QStringLiteral("MOONDREAM_APP_CONFIG_DIR"), configRoot);
    return env;
}

QString ProcessSupervisor::logDirectory(const QString& configRoot)
{
    return QDir(configRoot).filePath(QStringLiteral("logs"));
}

QString ProcessSupervisor::logPath(const QString& configRoot, const QString& serviceName)
{
    return QDir(logDirectory(configRoot)).filePath(serviceName + QStringLiteral(".log"));
}

QString ProcessSupervisor::databasePath(const QString& dataDir)
{
    return QDir(dataDir).filePath(QStringLiteral("moondream.sqlite3"));
}

QString ProcessSupervisor::errorToString(SpawnError error)
{
    switch (error) {
    case SpawnError::None:
        return QStringLiteral("none");
    case SpawnError::ResourceMissing:
        return QStringLiteral("resource_missing");
    case SpawnError::SpawnFailed:
        return QStringLiteral("spawn_failed");
    }
    return QStringLiteral("unknown");
}

SpawnResult ProcessSupervisor::launch(const QString& name,
                                      const QString& program,
                                      const QStringList& arguments,
                                      const QString& workingDirectory,
                                      const QProcessEnvironment& environment,
                                      const QString& configRoot)
{
    const QString logDir = logDirectory(configRoot);
    if (!QDir().mkpath(logDir)) {
        return spawnFailure(QStringLiteral("Failed to create log directory: %1").arg(logDir));
    }
    const QString log = logPath(configRoot, name);

    LOG_INFO(mdProcess, "Starting '%s': %s %s",
             qUtf8Printable(name), qUtf8Printable(program),
             qUtf8Printable(arguments.join(QLatin1Char(' '))));

    auto process = std::make_unique<QProcess>();
    process->setProgram(program);
    process->setArguments(arguments);
    if (!workingDirectory.isEmpty()) {
        process->setWorkingDirectory(workingDirectory);
    }
    process->setProcessEnvironment(environment);
    process->setStandardInputFile(QProcess::nullDevice());
    process->setStandardOutputFile(log, QIODevice::Append);
    process->setStandardErrorFile(log, QIODevice::Append);

    connect(process.get(),
            qOverload<int, QProcess::ExitStatus>(&QProcess::finished),
            this, [this, name](int exitCode, QProcess::ExitStatus status) {
        const bool crashed = status == QProcess::CrashExit;
        if (crashed || exitCode != 0) {
            LOG_WARN(mdProcess, "'%s' exited unexpectedly (exit=%d, crashed=%d)",
                     qUtf8Printable(name), exitCode, crashed ? 1 : 0);
        } else {
            LOG_INFO(mdProcess, "'%s' exited normally", qUtf8Printable(name));
        }
        emit serviceExited(name, exitCode, crashed);
    });

    process->start();
    if (!process->waitForStarted(kStartTimeoutMs)) {
        const QString error = process->errorString();
        process->disconnect(this);
        return spawnFailure(QStringLiteral("Failed to start %1: %2").arg(name, error));
    }

    LOG_INFO(mdProcess, "'%s' started (pid=%lld, log=%s)",
             qUtf8Printable(name), static_cast<long long>(process->processId()),
             qUtf8Printable(log));
    emit serviceStarted(name, process->processId());

    SpawnResult result;
    result.process = std::move(process);
    result.logPath = log;
    return result;
}

} // namespace md
