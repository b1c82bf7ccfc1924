#pragma once

#include "core/shared/settings.h"

#include <QString>

#include <optional>

namespace md {

enum class MigrationState {
    NoRequest,  // nothing pending
    Moot,       // from == to, or from is gone; request cleared
    Migrated,   // library moved to `to`; request cleared
    Failed,     // request kept for the next launch; use `from` this run
};

struct MigrationOutcome {
    MigrationState state = MigrationState::NoRequest;

    // Set only when state == Failed: the pre-migration directory the caller
    // must use for this run instead of the normal resolution.
    std::optional<QString> dataDirOverride;

    QString from;
    QString to;
    QString backupPath;
    bool usedCopyFallback = false;
    bool settingsPersisted = true;
    QString message;
};

// MigrationEngine -- executes the pending data-directory relocation found in
// settings. Runs once per launch, before any child process opens the library.
//
// The destination is never merged into: a non-empty `to` is first renamed to
// a sibling "<name>-backup-<unixSeconds>". The move is an atomic rename when
// both paths share a volume, and a recursive copy followed by deleting `from`
// otherwise.
class MigrationEngine {
public:
    // Resolves the pending request (if any) and persists the cleared request
    // on Moot/Migrated. `settings` is updated in place.
    static MigrationOutcome apply(const QString& configRoot, AppSettings& settings);

    // Called by the settings surface when the user changes storage location;
    // the request it records is executed by apply() on the next launch.
    //
    // Attaches a migration request to `next` when the storage location it
    // selects differs from `currentDataDir` and the current directory holds a
    // library. Clears any stale request otherwise. Creates the cloud folder
    // when `next` selects cloud storage. Returns false if no cloud folder can
    // be determined.
    static bool scheduleMigration(const QString& currentDataDir,
                                  const QString& configRoot,
                                  AppSettings* next,
                                  QString* error = nullptr);

    static QString backupPathFor(const QString& to, qint64 unixSeconds);

    // Rename, falling back to copy + delete across volumes. Refuses to move
    // a directory into itself or over one of its ancestors.
    static bool moveDirectory(const QString& from,
                              const QString& to,
                              bool* usedCopyFallback = nullptr,
                              QString* error = nullptr);

    // Copies directories, regular files and symlinks (as links). Other
    // special files are skipped. Fails if `from` is not a directory.
    static bool copyDirectoryRecursively(const QString& from,
                                         const QString& to,
                                         QString* error = nullptr);

    static QString stateToString(MigrationState state);
};

} // namespace md
