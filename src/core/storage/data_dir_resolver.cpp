#include "core/storage/data_dir_resolver.h"

#include <QDir>

namespace md {

std::optional<QString> defaultIcloudDir()
{
    const QString home = qEnvironmentVariable("HOME").trimmed();
    if (home.isEmpty()) {
        return std::nullopt;
    }
    return QDir(home).filePath(
        QStringLiteral("Library/Mobile Documents/com~apple~CloudDocs/Moondream"));
}

QString defaultLocalDataDir(const QString& configRoot)
{
    return QDir(configRoot).filePath(QStringLiteral("data"));
}

QString resolveDataDir(const QString& configRoot, const AppSettings& settings)
{
    if (settings.storage && settings.storage->isIcloud()) {
        const std::optional<QString> cloudDir = settings.storage->path
            ? settings.storage->path
            : defaultIcloudDir();
        if (cloudDir && !cloudDir->trimmed().isEmpty()) {
            return QDir::cleanPath(cloudDir->trimmed());
        }
    }
    return defaultLocalDataDir(configRoot);
}

} // namespace md
