#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>

namespace md {

namespace {

// Reads a string field, accepting a legacy snake_case alias.
std::optional<QString> optionalString(const QJsonObject& json,
                                      const QString& key,
                                      const QString& alias = QString())
{
    QJsonValue value = json.value(key);
    if (!value.isString() && !alias.isEmpty()) {
        value = json.value(alias);
    }
    if (!value.isString()) {
        return std::nullopt;
    }
    return value.toString();
}

std::optional<MigrationRequest> migrationFromJson(const QJsonValue& value)
{
    if (!value.isObject()) {
        return std::nullopt;
    }
    const QJsonObject json = value.toObject();
    const std::optional<QString> from = optionalString(json, QStringLiteral("from"));
    const std::optional<QString> to = optionalString(json, QStringLiteral("to"));
    if (!from || !to) {
        return std::nullopt;
    }

    MigrationRequest request;
    request.from = *from;
    request.to = *to;
    request.requestedAt = optionalString(json,
                                         QStringLiteral("requestedAt"),
                                         QStringLiteral("requested_at"));
    return request;
}

std::optional<StorageSettings> storageFromJson(const QJsonValue& value)
{
    if (!value.isObject()) {
        return std::nullopt;
    }
    const QJsonObject json = value.toObject();

    StorageSettings storage;
    storage.mode = json.value(QStringLiteral("mode")).toString(storage.mode);
    storage.path = optionalString(json,
                                  QStringLiteral("icloudPath"),
                                  QStringLiteral("icloud_path"));
    storage.migration = migrationFromJson(json.value(QStringLiteral("migration")));
    return storage;
}

std::optional<AiSettings> aiFromJson(const QJsonValue& value)
{
    if (!value.isObject()) {
        return std::nullopt;
    }
    const QJsonObject json = value.toObject();

    AiSettings ai;
    ai.provider = optionalString(json, QStringLiteral("provider"));
    ai.endpoint = optionalString(json, QStringLiteral("endpoint"));
    return ai;
}

void insertIfSet(QJsonObject& json, const QString& key, const std::optional<QString>& value)
{
    if (value) {
        json.insert(key, *value);
    }
}

} // namespace

AppSettings SettingsManager::load(const QString& configRoot)
{
    return loadDetailed(configRoot).settings;
}

SettingsLoadResult SettingsManager::loadDetailed(const QString& configRoot)
{
    SettingsLoadResult result;
    const QString filePath = settingsFilePath(configRoot);
    QFile file(filePath);
    if (!file.exists()) {
        result.status = SettingsLoadStatus::Missing;
        return result;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        result.status = SettingsLoadStatus::Unreadable;
        result.message = QStringLiteral("Failed to open %1: %2").arg(filePath, file.errorString());
        return result;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        result.status = SettingsLoadStatus::Corrupt;
        result.message = QStringLiteral("Failed to parse %1: %2")
                             .arg(filePath,
                                  parseError.error != QJsonParseError::NoError
                                      ? parseError.errorString()
                                      : QStringLiteral("top-level value is not an object"));
        return result;
    }

    result.settings = fromJson(doc.object());
    result.status = SettingsLoadStatus::Loaded;
    return result;
}

bool SettingsManager::save(const QString& configRoot, const AppSettings& settings, QString* error)
{
    if (!QDir().mkpath(configRoot)) {
        if (error) {
            *error = QStringLiteral("Failed to create config directory: %1").arg(configRoot);
        }
        return false;
    }

    const QString filePath = settingsFilePath(configRoot);
    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        if (error) {
            *error = QStringLiteral("Failed to open %1 for write: %2")
                         .arg(filePath, file.errorString());
        }
        return false;
    }

    const QByteArray payload = doc.toJson(QJsonDocument::Indented);
    const qint64 bytesWritten = file.write(payload);
    file.close();

    if (bytesWritten != payload.size()) {
        if (error) {
            *error = QStringLiteral("Failed to write %1").arg(filePath);
        }
        return false;
    }

    LOG_DEBUG(mdSettings, "Saved settings to %s", qUtf8Printable(filePath));
    return true;
}

QString SettingsManager::settingsFilePath(const QString& configRoot)
{
    return QDir(configRoot).filePath(QStringLiteral("settings.json"));
}

QJsonObject SettingsManager::toJson(const AppSettings& settings)
{
    QJsonObject json;

    if (settings.storage) {
        const StorageSettings& storage = *settings.storage;
        QJsonObject storageJson;
        storageJson.insert(QStringLiteral("mode"), storage.mode);
        insertIfSet(storageJson, QStringLiteral("icloudPath"), storage.path);
        if (storage.migration) {
            QJsonObject migrationJson;
            migrationJson.insert(QStringLiteral("from"), storage.migration->from);
            migrationJson.insert(QStringLiteral("to"), storage.migration->to);
            insertIfSet(migrationJson, QStringLiteral("requestedAt"), storage.migration->requestedAt);
            storageJson.insert(QStringLiteral("migration"), migrationJson);
        }
        json.insert(QStringLiteral("storage"), storageJson);
    }

    if (settings.ai) {
        QJsonObject aiJson;
        insertIfSet(aiJson, QStringLiteral("provider"), settings.ai->provider);
        insertIfSet(aiJson, QStringLiteral("endpoint"), settings.ai->endpoint);
        json.insert(QStringLiteral("ai"), aiJson);
    }

    return json;
}

AppSettings SettingsManager::fromJson(const QJsonObject& json)
{
    AppSettings settings;
    settings.storage = storageFromJson(json.value(QStringLiteral("storage")));
    settings.ai = aiFromJson(json.value(QStringLiteral("ai")));
    return settings;
}

QString SettingsManager::statusToString(SettingsLoadStatus status)
{
    switch (status) {
    case SettingsLoadStatus::Loaded:
        return QStringLiteral("loaded");
    case SettingsLoadStatus::Missing:
        return QStringLiteral("missing");
    case SettingsLoadStatus::Unreadable:
        return QStringLiteral("unreadable");
    case SettingsLoadStatus::Corrupt:
        return QStringLiteral("corrupt");
    }
    return QStringLiteral("unknown");
}

} // namespace md
