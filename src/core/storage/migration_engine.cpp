#include "core/storage/migration_engine.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"
#include "core/storage/data_dir_resolver.h"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <vector>

namespace md {

namespace {

constexpr QDir::Filters kAllEntries =
    QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System;

QString normalizedPath(const QString& path)
{
    return QDir::cleanPath(QFileInfo(path).absoluteFilePath());
}

bool isDirectoryEmpty(const QString& path)
{
    return QDir(path).isEmpty(kAllEntries);
}

bool pathExists(const QString& path)
{
    // QFileInfo::exists follows symlinks; a dangling link still occupies the name.
    const QFileInfo info(path);
    return info.exists() || info.isSymLink();
}

bool copySymlink(const QString& source, const QString& destination, QString* error)
{
    const QByteArray sourcePath = QFile::encodeName(source);
    struct stat info;
    if (::lstat(sourcePath.constData(), &info) != 0) {
        if (error) {
            *error = QStringLiteral("Failed to stat symlink %1: %2")
                         .arg(source, QString::fromLocal8Bit(std::strerror(errno)));
        }
        return false;
    }

    // st_size is the target length, but may be 0 on some filesystems; grow
    // until readlink no longer fills the buffer.
    std::vector<char> buffer(static_cast<size_t>(std::max<off_t>(info.st_size, 255)) + 1);
    ssize_t length = 0;
    for (;;) {
        length = ::readlink(sourcePath.constData(), buffer.data(), buffer.size());
        if (length < 0) {
            if (error) {
                *error = QStringLiteral("Failed to read symlink %1: %2")
                             .arg(source, QString::fromLocal8Bit(std::strerror(errno)));
            }
            return false;
        }
        if (static_cast<size_t>(length) < buffer.size()) {
            break;
        }
        buffer.resize(buffer.size() * 2);
    }
    buffer[static_cast<size_t>(length)] = '\0';

    const QByteArray destinationPath = QFile::encodeName(destination);
    if (::symlink(buffer.data(), destinationPath.constData()) != 0) {
        if (error) {
            *error = QStringLiteral("Failed to create symlink %1: %2")
                         .arg(destination, QString::fromLocal8Bit(std::strerror(errno)));
        }
        return false;
    }
    return true;
}

// True when `descendant` lies strictly below `ancestor`. Both paths must be
// normalized.
bool isInside(const QString& descendant, const QString& ancestor)
{
    if (ancestor == QStringLiteral("/")) {
        return descendant.size() > 1 && descendant.startsWith(ancestor);
    }
    return descendant.startsWith(ancestor + QLatin1Char('/'));
}

// A directory cannot be moved into itself or over one of its parents.
QString nestingConflict(const QString& from, const QString& to)
{
    if (isInside(from, to)) {
        return QStringLiteral("Destination %1 contains the source directory %2").arg(to, from);
    }
    if (isInside(to, from)) {
        return QStringLiteral("Destination %1 is inside the source directory %2").arg(to, from);
    }
    return QString();
}

void persistSettings(const QString& configRoot, const AppSettings& settings, MigrationOutcome* outcome)
{
    QString error;
    outcome->settingsPersisted = SettingsManager::save(configRoot, settings, &error);
    if (!outcome->settingsPersisted) {
        LOG_WARN(mdStorage, "Failed to persist cleared migration request: %s",
                 qUtf8Printable(error));
    }
}

} // namespace

MigrationOutcome MigrationEngine::apply(const QString& configRoot, AppSettings& settings)
{
    MigrationOutcome outcome;
    const MigrationRequest* request = settings.pendingMigration();
    if (!request) {
        outcome.state = MigrationState::NoRequest;
        return outcome;
    }

    outcome.from = request->from;
    outcome.to = request->to;
    const QString from = normalizedPath(request->from);
    const QString to = normalizedPath(request->to);

    LOG_INFO(mdStorage, "Pending data migration: %s -> %s",
             qUtf8Printable(from), qUtf8Printable(to));

    if (from == to || !QFileInfo::exists(from)) {
        outcome.state = MigrationState::Moot;
        outcome.message = from == to
            ? QStringLiteral("Source and destination are the same directory")
            : QStringLiteral("Source directory does not exist: %1").arg(from);
        LOG_INFO(mdStorage, "Migration is moot (%s), clearing request",
                 qUtf8Printable(outcome.message));
        settings.clearMigration();
        persistSettings(configRoot, settings, &outcome);
        return outcome;
    }

    auto fail = [&](const QString& message) {
        outcome.state = MigrationState::Failed;
        outcome.message = message;
        outcome.dataDirOverride = from;
        LOG_WARN(mdStorage, "Data migration failed, keeping %s for this run: %s",
                 qUtf8Printable(from), qUtf8Printable(message));
        return outcome;
    };

    // Checked before the backup step: backing up an ancestor of `from` would
    // carry the library away with it.
    const QString conflict = nestingConflict(from, to);
    if (!conflict.isEmpty()) {
        return fail(conflict);
    }

    if (pathExists(to) && !isDirectoryEmpty(to)) {
        const QString backup = backupPathFor(to, QDateTime::currentSecsSinceEpoch());
        if (!QDir().rename(to, backup)) {
            return fail(QStringLiteral("Failed to move occupied destination %1 aside to %2")
                            .arg(to, backup));
        }
        outcome.backupPath = backup;
        LOG_INFO(mdStorage, "Destination was not empty, backed up to %s", qUtf8Printable(backup));
    }

    const QString parentDir = QFileInfo(to).absolutePath();
    if (!QDir().mkpath(parentDir)) {
        LOG_WARN(mdStorage, "Failed to create destination parent %s", qUtf8Printable(parentDir));
    }

    QString moveError;
    if (!moveDirectory(from, to, &outcome.usedCopyFallback, &moveError)) {
        return fail(moveError);
    }

    outcome.state = MigrationState::Migrated;
    outcome.message = outcome.usedCopyFallback
        ? QStringLiteral("Copied library to %1").arg(to)
        : QStringLiteral("Renamed library to %1").arg(to);
    LOG_INFO(mdStorage, "%s", qUtf8Printable(outcome.message));

    settings.clearMigration();
    persistSettings(configRoot, settings, &outcome);
    return outcome;
}

bool MigrationEngine::scheduleMigration(const QString& currentDataDir,
                                        const QString& configRoot,
                                        AppSettings* next,
                                        QString* error)
{
    if (!next) {
        if (error) {
            *error = QStringLiteral("Settings output is null");
        }
        return false;
    }
    if (!next->storage) {
        next->storage = StorageSettings();
    }

    if (next->storage->isIcloud()) {
        const std::optional<QString> cloudDir = next->storage->path
            ? next->storage->path
            : defaultIcloudDir();
        if (!cloudDir || cloudDir->trimmed().isEmpty()) {
            if (error) {
                *error = QStringLiteral(
                    "Could not determine default iCloud Drive folder. Please enter a path.");
            }
            return false;
        }
        if (!QDir().mkpath(cloudDir->trimmed())) {
            LOG_WARN(mdStorage, "Failed to create cloud folder %s",
                     qUtf8Printable(cloudDir->trimmed()));
        }
    }

    const QString current = currentDataDir.trimmed().isEmpty()
        ? QString()
        : normalizedPath(currentDataDir.trimmed());
    const QString target = normalizedPath(resolveDataDir(configRoot, *next));

    next->storage->migration.reset();
    if (current.isEmpty() || current == target) {
        return true;
    }

    const QDir currentDir(current);
    const bool hasLibrary = QFileInfo::exists(currentDir.filePath(QStringLiteral("moondream.sqlite3")))
        || QFileInfo::exists(currentDir.filePath(QStringLiteral("projects")));
    if (!hasLibrary) {
        return true;
    }

    MigrationRequest request;
    request.from = current;
    request.to = target;
    request.requestedAt = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    next->storage->migration = request;

    LOG_INFO(mdStorage, "Scheduled data migration for next launch: %s -> %s",
             qUtf8Printable(current), qUtf8Printable(target));
    return true;
}

QString MigrationEngine::backupPathFor(const QString& to, qint64 unixSeconds)
{
    const QFileInfo info(QDir::cleanPath(to));
    QString name = info.fileName();
    if (name.isEmpty()) {
        name = QStringLiteral("data");
    }
    return info.dir().filePath(QStringLiteral("%1-backup-%2").arg(name).arg(unixSeconds));
}

bool MigrationEngine::moveDirectory(const QString& from,
                                    const QString& to,
                                    bool* usedCopyFallback,
                                    QString* error)
{
    if (usedCopyFallback) {
        *usedCopyFallback = false;
    }

    const QString conflict = nestingConflict(normalizedPath(from), normalizedPath(to));
    if (!conflict.isEmpty()) {
        if (error) {
            *error = conflict;
        }
        return false;
    }

    // An empty placeholder (e.g. a freshly created cloud folder) would make
    // the rename fail.
    const QFileInfo toInfo(to);
    if (toInfo.isDir() && !toInfo.isSymLink() && isDirectoryEmpty(to) && !QDir().rmdir(to)) {
        LOG_DEBUG(mdStorage, "Could not remove empty destination %s", qUtf8Printable(to));
    }

    if (QDir().rename(from, to)) {
        return true;
    }

    LOG_INFO(mdStorage, "Rename %s -> %s failed, falling back to copy",
             qUtf8Printable(from), qUtf8Printable(to));
    if (usedCopyFallback) {
        *usedCopyFallback = true;
    }

    if (!copyDirectoryRecursively(from, to, error)) {
        return false;
    }

    if (!QDir(from).removeRecursively()) {
        if (error) {
            *error = QStringLiteral("Copied library but failed to delete source %1").arg(from);
        }
        return false;
    }
    return true;
}

bool MigrationEngine::copyDirectoryRecursively(const QString& from,
                                               const QString& to,
                                               QString* error)
{
    const QFileInfo sourceInfo(from);
    if (!sourceInfo.isDir()) {
        if (error) {
            *error = QStringLiteral("Source directory does not exist: %1").arg(from);
        }
        return false;
    }
    const QString conflict = nestingConflict(normalizedPath(from), normalizedPath(to));
    if (!conflict.isEmpty()) {
        if (error) {
            *error = conflict;
        }
        return false;
    }

    if (!QDir().mkpath(to)) {
        if (error) {
            *error = QStringLiteral("Failed to create directory %1").arg(to);
        }
        return false;
    }

    const QDir sourceDir(from);
    const QDir destinationDir(to);
    const QFileInfoList entries = sourceDir.entryInfoList(kAllEntries, QDir::Name);
    for (const QFileInfo& entry : entries) {
        const QString source = entry.absoluteFilePath();
        const QString destination = destinationDir.filePath(entry.fileName());

        if (entry.isSymLink()) {
            if (!copySymlink(source, destination, error)) {
                return false;
            }
        } else if (entry.isDir()) {
            if (!copyDirectoryRecursively(source, destination, error)) {
                return false;
            }
        } else if (entry.isFile()) {
            QFile sourceFile(source);
            if (!sourceFile.copy(destination)) {
                if (error) {
                    *error = QStringLiteral("Failed to copy %1 to %2: %3")
                                 .arg(source, destination, sourceFile.errorString());
                }
                return false;
            }
        } else {
            LOG_WARN(mdStorage, "Skipping special file during copy: %s", qUtf8Printable(source));
        }
    }
    return true;
}

QString MigrationEngine::stateToString(MigrationState state)
{
    switch (state) {
    case MigrationState::NoRequest:
        return QStringLiteral("no_request");
    case MigrationState::Moot:
        return QStringLiteral("moot");
    case MigrationState::Migrated:
        return QStringLiteral("migrated");
    case MigrationState::Failed:
        return QStringLiteral("failed");
    }
    return QStringLiteral("unknown");
}

} // namespace md
