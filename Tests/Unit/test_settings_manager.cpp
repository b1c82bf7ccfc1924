#include <QtTest/QtTest>

#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

#include "core/shared/settings_manager.h"
#include "../Support/launcher_test_utils.h"

class TestSettingsManager : public QObject {
    Q_OBJECT

private slots:
    void testMissingFileYieldsDefaults();
    void testCorruptFileYieldsDefaults();
    void testNonObjectDocumentYieldsDefaults();
    void testParsesFullRecord();
    void testToleratesUnknownAndMistypedFields();
    void testAcceptsSnakeCaseAliases();
    void testIncompleteMigrationIsIgnored();
    void testSaveLoadRoundTripIsStable_data();
    void testSaveLoadRoundTripIsStable();
    void testSaveOmitsUnsetFields();
    void testSaveCreatesConfigRoot();
    void testSaveReportsFailure();
    void testAiDefaults();
};

void TestSettingsManager::testMissingFileYieldsDefaults()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());

    const md::SettingsLoadResult result = md::SettingsManager::loadDetailed(tempDir.path());
    QCOMPARE(result.status, md::SettingsLoadStatus::Missing);
    QVERIFY(!result.recovered());
    QVERIFY(result.settings == md::AppSettings());
    QVERIFY(md::SettingsManager::load(tempDir.path()) == md::AppSettings());
}

void TestSettingsManager::testCorruptFileYieldsDefaults()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    QVERIFY(md::test::writeFile(md::SettingsManager::settingsFilePath(tempDir.path()),
                                QByteArrayLiteral("{ \"storage\": { \"mode\": ")));

    const md::SettingsLoadResult result = md::SettingsManager::loadDetailed(tempDir.path());
    QCOMPARE(result.status, md::SettingsLoadStatus::Corrupt);
    QVERIFY(result.recovered());
    QVERIFY(!result.message.isEmpty());
    QVERIFY(result.settings == md::AppSettings());
}

void TestSettingsManager::testNonObjectDocumentYieldsDefaults()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    QVERIFY(md::test::writeFile(md::SettingsManager::settingsFilePath(tempDir.path()),
                                QByteArrayLiteral("[1, 2, 3]")));

    const md::SettingsLoadResult result = md::SettingsManager::loadDetailed(tempDir.path());
    QCOMPARE(result.status, md::SettingsLoadStatus::Corrupt);
    QVERIFY(result.settings == md::AppSettings());
}

void TestSettingsManager::testParsesFullRecord()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    QVERIFY(md::test::writeFile(
        md::SettingsManager::settingsFilePath(tempDir.path()),
        QByteArrayLiteral(R"({
            "storage": {
                "mode": "icloud",
                "icloudPath": "/Volumes/Cloud/Moondream",
                "migration": {
                    "from": "/old/data",
                    "to": "/Volumes/Cloud/Moondream",
                    "requestedAt": "2024-05-01T10:00:00.000Z"
                }
            },
            "ai": { "provider": "huggingface", "endpoint": "https://example.test/v1" }
        })")));

    const md::SettingsLoadResult result = md::SettingsManager::loadDetailed(tempDir.path());
    QCOMPARE(result.status, md::SettingsLoadStatus::Loaded);

    const md::AppSettings& settings = result.settings;
    QVERIFY(settings.storage.has_value());
    QCOMPARE(settings.storage->mode, QStringLiteral("icloud"));
    QVERIFY(settings.storage->isIcloud());
    QCOMPARE(settings.storage->path.value_or(QString()), QStringLiteral("/Volumes/Cloud/Moondream"));

    const md::MigrationRequest* migration = settings.pendingMigration();
    QVERIFY(migration != nullptr);
    QCOMPARE(migration->from, QStringLiteral("/old/data"));
    QCOMPARE(migration->to, QStringLiteral("/Volumes/Cloud/Moondream"));
    QCOMPARE(migration->requestedAt.value_or(QString()),
             QStringLiteral("2024-05-01T10:00:00.000Z"));

    QCOMPARE(settings.aiProvider(), QStringLiteral("huggingface"));
    QCOMPARE(settings.aiEndpoint(), QStringLiteral("https://example.test/v1"));
}

void TestSettingsManager::testToleratesUnknownAndMistypedFields()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    QVERIFY(md::test::writeFile(
        md::SettingsManager::settingsFilePath(tempDir.path()),
        QByteArrayLiteral(R"({
            "theme": "dark",
            "storage": { "mode": 7, "icloudPath": false, "extra": [1] },
            "ai": "not-an-object"
        })")));

    const md::SettingsLoadResult result = md::SettingsManager::loadDetailed(tempDir.path());
    QCOMPARE(result.status, md::SettingsLoadStatus::Loaded);
    QVERIFY(result.settings.storage.has_value());
    QCOMPARE(result.settings.storage->mode, md::kStorageModeLocal);
    QVERIFY(!result.settings.storage->path.has_value());
    QVERIFY(!result.settings.ai.has_value());
    QCOMPARE(result.settings.aiProvider(), md::kDefaultAiProvider);
}

void TestSettingsManager::testAcceptsSnakeCaseAliases()
{
    const QJsonObject json = QJsonDocument::fromJson(QByteArrayLiteral(R"({
        "storage": {
            "mode": "icloud",
            "icloud_path": "/cloud/Moondream",
            "migration": { "from": "/a", "to": "/b", "requested_at": "2024-01-01T00:00:00Z" }
        }
    })")).object();

    const md::AppSettings settings = md::SettingsManager::fromJson(json);
    QVERIFY(settings.storage.has_value());
    QCOMPARE(settings.storage->path.value_or(QString()), QStringLiteral("/cloud/Moondream"));
    QVERIFY(settings.pendingMigration() != nullptr);
    QCOMPARE(settings.pendingMigration()->requestedAt.value_or(QString()),
             QStringLiteral("2024-01-01T00:00:00Z"));

    // Saved back under the canonical names.
    const QJsonObject storage = md::SettingsManager::toJson(settings)
                                    .value(QStringLiteral("storage")).toObject();
    QVERIFY(storage.contains(QStringLiteral("icloudPath")));
    QVERIFY(!storage.contains(QStringLiteral("icloud_path")));
    QVERIFY(storage.value(QStringLiteral("migration")).toObject()
                .contains(QStringLiteral("requestedAt")));
}

void TestSettingsManager::testIncompleteMigrationIsIgnored()
{
    const QJsonObject json = QJsonDocument::fromJson(QByteArrayLiteral(R"({
        "storage": { "mode": "local", "migration": { "from": "/only/from" } }
    })")).object();

    const md::AppSettings settings = md::SettingsManager::fromJson(json);
    QVERIFY(settings.storage.has_value());
    QVERIFY(settings.pendingMigration() == nullptr);
}

void TestSettingsManager::testSaveLoadRoundTripIsStable_data()
{
    QTest::addColumn<QByteArray>("document");

    QTest::newRow("empty") << QByteArrayLiteral("{}");
    QTest::newRow("local-only") << QByteArrayLiteral(R"({"storage":{"mode":"local"}})");
    QTest::newRow("icloud-with-path")
        << QByteArrayLiteral(R"({"storage":{"mode":"icloud","icloudPath":"/c/M"}})");
    QTest::newRow("pending-migration")
        << QByteArrayLiteral(R"({"storage":{"mode":"icloud","migration":{"from":"/a","to":"/b"}}})");
    QTest::newRow("ai-only") << QByteArrayLiteral(R"({"ai":{"provider":"p"}})");
    QTest::newRow("legacy-aliases")
        << QByteArrayLiteral(R"({"storage":{"icloud_path":"/x","migration":{"from":"/a","to":"/b","requested_at":"t"}}})");
}

void TestSettingsManager::testSaveLoadRoundTripIsStable()
{
    QFETCH(QByteArray, document);

    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    QVERIFY(md::test::writeFile(md::SettingsManager::settingsFilePath(tempDir.path()), document));

    const md::AppSettings first = md::SettingsManager::load(tempDir.path());
    QString error;
    QVERIFY2(md::SettingsManager::save(tempDir.path(), first, &error), qPrintable(error));
    const md::AppSettings second = md::SettingsManager::load(tempDir.path());
    QVERIFY(first == second);

    QVERIFY(md::SettingsManager::save(tempDir.path(), second, &error));
    const QByteArray savedOnce = md::test::readFile(md::SettingsManager::settingsFilePath(tempDir.path()));
    QVERIFY(md::SettingsManager::save(tempDir.path(), md::SettingsManager::load(tempDir.path())));
    QCOMPARE(md::test::readFile(md::SettingsManager::settingsFilePath(tempDir.path())), savedOnce);
}

void TestSettingsManager::testSaveOmitsUnsetFields()
{
    md::AppSettings settings;
    settings.storage = md::StorageSettings();

    const QJsonObject json = md::SettingsManager::toJson(settings);
    QVERIFY(!json.contains(QStringLiteral("ai")));
    const QJsonObject storage = json.value(QStringLiteral("storage")).toObject();
    QCOMPARE(storage.value(QStringLiteral("mode")).toString(), QStringLiteral("local"));
    QVERIFY(!storage.contains(QStringLiteral("icloudPath")));
    QVERIFY(!storage.contains(QStringLiteral("migration")));

    QVERIFY(md::SettingsManager::toJson(md::AppSettings()).isEmpty());
}

void TestSettingsManager::testSaveCreatesConfigRoot()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    const QString configRoot = QDir(tempDir.path()).filePath(QStringLiteral("nested/config"));

    md::AppSettings settings;
    settings.ai = md::AiSettings{QStringLiteral("local_station"), std::nullopt};
    QString error;
    QVERIFY2(md::SettingsManager::save(configRoot, settings, &error), qPrintable(error));
    QVERIFY(QFileInfo::exists(md::SettingsManager::settingsFilePath(configRoot)));
    QVERIFY(md::SettingsManager::load(configRoot) == settings);
}

void TestSettingsManager::testSaveReportsFailure()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    const QString blocker = QDir(tempDir.path()).filePath(QStringLiteral("blocker"));
    QVERIFY(md::test::writeFile(blocker, QByteArrayLiteral("x")));

    QString error;
    QVERIFY(!md::SettingsManager::save(QDir(blocker).filePath(QStringLiteral("config")),
                                       md::AppSettings(), &error));
    QVERIFY(!error.isEmpty());
}

void TestSettingsManager::testAiDefaults()
{
    md::AppSettings settings;
    QCOMPARE(settings.aiProvider(), QStringLiteral("local_station"));
    QCOMPARE(settings.aiEndpoint(), QStringLiteral("http://127.0.0.1:2020"));

    settings.ai = md::AiSettings{std::nullopt, QStringLiteral("http://10.0.0.2:2020")};
    QCOMPARE(settings.aiProvider(), QStringLiteral("local_station"));
    QCOMPARE(settings.aiEndpoint(), QStringLiteral("http://10.0.0.2:2020"));
}

QTEST_MAIN(TestSettingsManager)
#include "test_settings_manager.moc"
