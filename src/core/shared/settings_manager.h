#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

namespace md {

enum class SettingsLoadStatus {
    Loaded,
    Missing,
    Unreadable,
    Corrupt,
};

struct SettingsLoadResult {
    AppSettings settings;
    SettingsLoadStatus status = SettingsLoadStatus::Missing;
    QString message;

    bool recovered() const
    {
        return status == SettingsLoadStatus::Unreadable || status == SettingsLoadStatus::Corrupt;
    }
};

// SettingsManager -- JSON save/load for the launcher settings record.
//
// Settings live at <configRoot>/settings.json and are shared with the server
// process, which edits the same file. Reading never fails: a missing,
// unreadable or malformed file yields a default record.
class SettingsManager {
public:
    static AppSettings load(const QString& configRoot);

    // Same as load() but reports why defaults were used.
    static SettingsLoadResult loadDetailed(const QString& configRoot);

    // Best-effort write. Creates the config root if it doesn't exist.
    // Returns false on failure; the caller decides whether to log it.
    static bool save(const QString& configRoot,
                     const AppSettings& settings,
                     QString* error = nullptr);

    static QString settingsFilePath(const QString& configRoot);

    static QJsonObject toJson(const AppSettings& settings);
    static AppSettings fromJson(const QJsonObject& json);

    static QString statusToString(SettingsLoadStatus status);
};

} // namespace md
