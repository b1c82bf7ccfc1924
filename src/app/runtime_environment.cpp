#include "runtime_environment.h"
#include "core/ipc/process_supervisor.h"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>

namespace md {

namespace {

bool ensureDirectory(const QString& path, QString* error)
{
    QDir dir(path);
    if (dir.exists()) {
        return true;
    }
    if (!dir.mkpath(QStringLiteral("."))) {
        if (error) {
            *error = QStringLiteral("Failed to create directory: %1").arg(path);
        }
        return false;
    }
    return true;
}

bool hasResourceTree(const QString& dir)
{
    return QFileInfo(QDir(dir).filePath(QStringLiteral("resources"))).isDir();
}

} // namespace

QString configRootPath()
{
    const QString envConfigDir = qEnvironmentVariable("MOONDREAM_APP_CONFIG_DIR").trimmed();
    if (!envConfigDir.isEmpty()) {
        return QDir::cleanPath(QDir(envConfigDir).absolutePath());
    }
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
}

QString resourceDirPath(const QString& applicationDir)
{
    const QString envResourceDir = qEnvironmentVariable("MOONDREAM_RESOURCE_DIR").trimmed();
    if (!envResourceDir.isEmpty()) {
        return QDir::cleanPath(QDir(envResourceDir).absolutePath());
    }

    const QString bundleResources =
        QDir::cleanPath(QDir(applicationDir).filePath(QStringLiteral("../Resources")));
    if (hasResourceTree(bundleResources)) {
        return bundleResources;
    }
    return QDir::cleanPath(applicationDir);
}

int envTimeoutMs(const char* key, int fallback)
{
    bool ok = false;
    const int value = qEnvironmentVariable(key).trimmed().toInt(&ok);
    if (!ok || value <= 0) {
        return fallback;
    }
    return value;
}

bool initRuntimeContext(RuntimeContext* context, QString* error)
{
    if (!context) {
        if (error) {
            *error = QStringLiteral("Runtime context output is null");
        }
        return false;
    }

    context->configRoot = configRootPath();
    if (context->configRoot.isEmpty()) {
        if (error) {
            *error = QStringLiteral("Could not determine the application data directory");
        }
        return false;
    }
    context->resourceDir = resourceDirPath(QCoreApplication::applicationDirPath());
    context->logDir = ProcessSupervisor::logDirectory(context->configRoot);
    context->healthTimeoutMs = envTimeoutMs("MOONDREAM_HEALTH_TIMEOUT_MS", context->healthTimeoutMs);

    return ensureDirectory(context->configRoot, error)
        && ensureDirectory(context->logDir, error);
}

} // namespace md
