#pragma once

#include <QString>

#include <optional>

namespace md {

inline const QString kStorageModeLocal = QStringLiteral("local");
inline const QString kStorageModeIcloud = QStringLiteral("icloud");

inline const QString kDefaultAiProvider = QStringLiteral("local_station");
inline const QString kDefaultAiEndpoint = QStringLiteral("http://127.0.0.1:2020");

// A pending request to relocate the data directory. Executed on the next
// launch, before the server opens the database.
struct MigrationRequest {
    QString from;
    QString to;
    std::optional<QString> requestedAt;

    bool operator==(const MigrationRequest& other) const
    {
        return from == other.from && to == other.to && requestedAt == other.requestedAt;
    }
    bool operator!=(const MigrationRequest& other) const { return !(*this == other); }
};

struct StorageSettings {
    QString mode = kStorageModeLocal;   // "local" | "icloud"
    std::optional<QString> path;        // cloud-synced folder override
    std::optional<MigrationRequest> migration;

    bool isIcloud() const { return mode.compare(kStorageModeIcloud, Qt::CaseInsensitive) == 0; }

    bool operator==(const StorageSettings& other) const
    {
        return mode == other.mode && path == other.path && migration == other.migration;
    }
    bool operator!=(const StorageSettings& other) const { return !(*this == other); }
};

// Passed through to the child processes unmodified.
struct AiSettings {
    std::optional<QString> provider;
    std::optional<QString> endpoint;

    bool operator==(const AiSettings& other) const
    {
        return provider == other.provider && endpoint == other.endpoint;
    }
    bool operator!=(const AiSettings& other) const { return !(*this == other); }
};

struct AppSettings {
    std::optional<StorageSettings> storage;
    std::optional<AiSettings> ai;

    const MigrationRequest* pendingMigration() const
    {
        if (!storage || !storage->migration) {
            return nullptr;
        }
        return &*storage->migration;
    }

    void clearMigration()
    {
        if (storage) {
            storage->migration.reset();
        }
    }

    QString aiProvider() const
    {
        return (ai && ai->provider) ? *ai->provider : kDefaultAiProvider;
    }

    QString aiEndpoint() const
    {
        return (ai && ai->endpoint) ? *ai->endpoint : kDefaultAiEndpoint;
    }

    bool operator==(const AppSettings& other) const
    {
        return storage == other.storage && ai == other.ai;
    }
    bool operator!=(const AppSettings& other) const { return !(*this == other); }
};

} // namespace md
