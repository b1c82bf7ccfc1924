#include "orchestrator.h"
#include "runtime_environment.h"
#include "core/shared/logging.h"

#include <QCoreApplication>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTimer>

#include <atomic>
#include <csignal>
#include <cstdio>

namespace {

std::atomic<bool> g_quitRequested{false};

void handleQuitSignal(int)
{
    g_quitRequested.store(true);
}

// One JSON line on stdout per event; the desktop shell reads these.
void publishEvent(const QJsonObject& event)
{
    const QByteArray line = QJsonDocument(event).toJson(QJsonDocument::Compact);
    std::fprintf(stdout, "%s\n", line.constData());
    std::fflush(stdout);
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("com.moondream.desktop"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));
    app.setOrganizationName(QStringLiteral("Moondream"));
    app.setOrganizationDomain(QStringLiteral("moondream.ai"));

    qInfo() << "Moondream launcher starting...";

    md::RuntimeContext context;
    QString error;
    if (!md::initRuntimeContext(&context, &error)) {
        LOG_ERROR(mdCore, "Failed to initialise runtime: %s", qUtf8Printable(error));
        return 1;
    }

    md::OrchestratorOptions options;
    options.configRoot = context.configRoot;
    options.resources.resourceDir = context.resourceDir;
    options.healthTimeoutMs = context.healthTimeoutMs;
    // The signal poll timer below only runs once the event loop starts.
    options.cancelRequested = []() { return g_quitRequested.load(); };

    md::Orchestrator orchestrator(options);

    QObject::connect(&orchestrator, &md::Orchestrator::serverReady,
                     &app, [&orchestrator](quint16 port) {
        QJsonObject event;
        event[QStringLiteral("event")] = QStringLiteral("moondream://server-ready");
        event[QStringLiteral("port")] = static_cast<int>(port);
        event[QStringLiteral("logHint")] = orchestrator.serverLogPath();
        publishEvent(event);
    });

    // Without the server there is nothing left to serve the shell.
    QObject::connect(&orchestrator, &md::Orchestrator::serverExited,
                     &app, [&app](int exitCode) {
        app.exit(exitCode == 0 ? 0 : 1);
    });

    QObject::connect(&app, &QCoreApplication::aboutToQuit,
                     &orchestrator, &md::Orchestrator::stop);

    std::signal(SIGINT, handleQuitSignal);
    std::signal(SIGTERM, handleQuitSignal);
    QTimer signalPoll;
    QObject::connect(&signalPoll, &QTimer::timeout, &app, [&app]() {
        if (g_quitRequested.load()) {
            qInfo() << "Quit requested by signal";
            app.quit();
        }
    });
    signalPoll.start(200);

    if (!orchestrator.start(&error)) {
        orchestrator.stop();
        if (g_quitRequested.load()) {
            qInfo() << "Quit requested by signal during startup";
            return 0;
        }
        LOG_ERROR(mdCore, "Startup failed: %s", qUtf8Printable(error));
        return 1;
    }

    qInfo() << "Moondream launcher ready";

    return app.exec();
}
