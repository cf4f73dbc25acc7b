#include <QtTest/QtTest>

#include <QCommandLineParser>
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QTemporaryDir>

#include <limits>

#include "license/LicenseSettings.hpp"

using namespace wb::license;

namespace {

const char* const kEnvironmentKeys[] = {
    "WB_LICENSE_REGISTRY_READ_URL",
    "WB_LICENSE_REGISTRY_API_KEY",
    "WB_LICENSE_REGISTRY_TIMEOUT_MS",
    "WB_LICENSE_DATA_DIR",
    "WB_LICENSE_OFFLINE_GRACE_DAYS",
    "WB_LICENSE_SMTP_HOST",
    "WB_LICENSE_SMTP_PORT",
    "WB_LICENSE_SMTP_STARTTLS",
    "WB_LICENSE_SMTP_PASSWORD",
};

bool writeFile(const QString& path, const QByteArray& contents)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate))
        return false;
    return file.write(contents) == contents.size();
}

} // namespace

class LicenseSettingsTest : public QObject {
    Q_OBJECT

private slots:
    void cleanup();
    void defaultsMatchPolicy();
    void jsonSectionsOverlayDefaults();
    void environmentOverridesFile();
    void sanitizeClampsOutOfRangeValues();
    void checkIntervalIsClamped();
    void checkIntervalFitsTimerRange();
    void parserOptionsOverrideSettings();
    void missingFileKeepsDefaults();
    void malformedFileReportsError();
    void stateFilesResolveAgainstDataDirectory();
};

void LicenseSettingsTest::cleanup()
{
    for (const char* key : kEnvironmentKeys)
        qunsetenv(key);
}

void LicenseSettingsTest::defaultsMatchPolicy()
{
    const LicenseSettings settings;
    QCOMPARE(settings.offlineGraceDays, 7);
    QCOMPARE(settings.maxTransfers, 3);
    QCOMPARE(settings.hardwareMatchThreshold, 2);
    QCOMPARE(settings.manualVerificationLimit, 3);
    QCOMPARE(settings.clockSkewToleranceSeconds, 300);
    QCOMPARE(settings.checkIntervalSeconds(LicenseTier::Trial), 3600);
    QCOMPARE(settings.checkIntervalSeconds(LicenseTier::Standard), 24 * 3600);
    QCOMPARE(settings.checkIntervalSeconds(LicenseTier::Premium), 7 * 24 * 3600);
    QVERIFY(!settings.smtp.isConfigured());
}

void LicenseSettingsTest::jsonSectionsOverlayDefaults()
{
    const QByteArray json = R"({
        "registry": {"readUrl": "https://registry.example.com/licenses", "apiKey": " k3y ", "timeoutMs": "2500"},
        "storage": {"stateFile": "state.json"},
        "policy": {"offlineGraceDays": 14, "maxTransfers": 5, "checkIntervalsHours": {"trial": 2}},
        "smtp": {"host": "smtp.example.com", "port": 587, "implicitTls": false, "startTls": true,
                 "sender": "licensing@example.com"},
        "support": {"phone": "+48 000 000 000"}
    })";
    LicenseSettings settings;
    settings.applyJson(QJsonDocument::fromJson(json).object());

    QCOMPARE(settings.registryReadUrl, QUrl(QStringLiteral("https://registry.example.com/licenses")));
    QCOMPARE(settings.registryApiKey, QStringLiteral("k3y"));
    QCOMPARE(settings.requestTimeoutMs, 2500);
    QCOMPARE(settings.stateFileName, QStringLiteral("state.json"));
    QCOMPARE(settings.auditFileName, QStringLiteral("license_audit.jsonl"));
    QCOMPARE(settings.offlineGraceDays, 14);
    QCOMPARE(settings.maxTransfers, 5);
    QCOMPARE(settings.trialCheckIntervalHours, 2);
    QCOMPARE(settings.standardCheckIntervalHours, 24);
    QCOMPARE(settings.smtp.port, 587);
    QVERIFY(!settings.smtp.implicitTls);
    QVERIFY(settings.smtp.startTls);
    QVERIFY(settings.smtp.isConfigured());
    QCOMPARE(settings.supportEmail, QStringLiteral("support@water-balance.app"));
    QCOMPARE(settings.supportPhone, QStringLiteral("+48 000 000 000"));
}

void LicenseSettingsTest::environmentOverridesFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString configPath = dir.filePath(QStringLiteral("license.json"));
    QVERIFY(writeFile(configPath, R"({"registry": {"apiKey": "from-file"}, "policy": {"offlineGraceDays": 10}})"));

    qputenv("WB_LICENSE_REGISTRY_API_KEY", "from-env");
    qputenv("WB_LICENSE_DATA_DIR", dir.path().toUtf8());
    qputenv("WB_LICENSE_SMTP_HOST", "mail.example.com");
    qputenv("WB_LICENSE_SMTP_PORT", "2525");
    qputenv("WB_LICENSE_SMTP_STARTTLS", "yes");
    qputenv("WB_LICENSE_SMTP_PASSWORD", " spaced secret ");
    qputenv("WB_LICENSE_REGISTRY_TIMEOUT_MS", "not-a-number");

    QString error;
    const LicenseSettings settings = LicenseSettings::load(configPath, &error);
    QVERIFY2(error.isEmpty(), qPrintable(error));
    QCOMPARE(settings.registryApiKey, QStringLiteral("from-env"));
    QCOMPARE(settings.offlineGraceDays, 10);
    QCOMPARE(settings.dataDirectory, QDir::cleanPath(dir.path()));
    QCOMPARE(settings.smtp.host, QStringLiteral("mail.example.com"));
    QCOMPARE(settings.smtp.port, 2525);
    QVERIFY(settings.smtp.startTls);
    QCOMPARE(settings.smtp.password, QStringLiteral(" spaced secret "));
    QCOMPARE(settings.requestTimeoutMs, 10000);
}

void LicenseSettingsTest::sanitizeClampsOutOfRangeValues()
{
    LicenseSettings settings;
    settings.requestTimeoutMs = 5;
    settings.offlineGraceDays = -3;
    settings.hardwareMatchThreshold = 7;
    settings.manualVerificationLimit = -1;
    settings.smtp.port = 0;
    settings.minimumCheckIntervalSeconds = 600;
    settings.maximumCheckIntervalSeconds = 60;
    settings.stateFileName = QStringLiteral("  ");
    settings.sanitize();

    QCOMPARE(settings.requestTimeoutMs, 1000);
    QCOMPARE(settings.offlineGraceDays, 0);
    QCOMPARE(settings.hardwareMatchThreshold, 3);
    QCOMPARE(settings.manualVerificationLimit, 0);
    QCOMPARE(settings.smtp.port, 1);
    QCOMPARE(settings.maximumCheckIntervalSeconds, 600);
    QCOMPARE(settings.stateFileName, QStringLiteral("license_state.json"));
}

void LicenseSettingsTest::checkIntervalIsClamped()
{
    LicenseSettings settings;
    settings.trialCheckIntervalHours = 0;
    settings.premiumCheckIntervalHours = 24 * 365;
    QCOMPARE(settings.checkIntervalSeconds(LicenseTier::Trial), settings.minimumCheckIntervalSeconds);
    QCOMPARE(settings.checkIntervalSeconds(LicenseTier::Premium), settings.maximumCheckIntervalSeconds);
}

void LicenseSettingsTest::checkIntervalFitsTimerRange()
{
    LicenseSettings settings;
    settings.maximumCheckIntervalSeconds = 10 * 365 * 24 * 3600;
    settings.premiumCheckIntervalHours = 10 * 365 * 24;
    settings.sanitize();

    QCOMPARE(settings.maximumCheckIntervalSeconds, std::numeric_limits<int>::max() / 1000);
    const qint64 intervalMs = static_cast<qint64>(settings.checkIntervalSeconds(LicenseTier::Premium)) * 1000;
    QVERIFY(intervalMs > 0);
    QVERIFY(intervalMs <= std::numeric_limits<int>::max());
}

void LicenseSettingsTest::parserOptionsOverrideSettings()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    QCommandLineParser parser;
    LicenseSettings::configureParser(parser);
    parser.process(QStringList{QStringLiteral("wb-license"),
                               QStringLiteral("--registry-url"), QStringLiteral("https://r.example.com/q"),
                               QStringLiteral("--registry-timeout-ms"), QStringLiteral("500000"),
                               QStringLiteral("--data-dir"), dir.path(),
                               QStringLiteral("--offline-grace-days"), QStringLiteral("3")});

    QCOMPARE(parser.value(QStringLiteral("config")), QStringLiteral("config/license.json"));

    LicenseSettings settings;
    settings.applyParser(parser);
    QCOMPARE(settings.registryReadUrl, QUrl(QStringLiteral("https://r.example.com/q")));
    QCOMPARE(settings.requestTimeoutMs, 120000);
    QCOMPARE(settings.dataDirectory, QDir::cleanPath(dir.path()));
    QCOMPARE(settings.offlineGraceDays, 3);
    QVERIFY(settings.registryWriteUrl.isEmpty());
}

void LicenseSettingsTest::missingFileKeepsDefaults()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    QString error;
    const LicenseSettings settings = LicenseSettings::load(dir.filePath(QStringLiteral("absent.json")), &error);
    QVERIFY(error.isEmpty());
    QCOMPARE(settings.offlineGraceDays, 7);
    QVERIFY(settings.registryReadUrl.isEmpty());
}

void LicenseSettingsTest::malformedFileReportsError()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString brokenPath = dir.filePath(QStringLiteral("broken.json"));
    QVERIFY(writeFile(brokenPath, "{\"policy\": {"));
    const QString arrayPath = dir.filePath(QStringLiteral("array.json"));
    QVERIFY(writeFile(arrayPath, "[1, 2]"));

    QString error;
    const LicenseSettings settings = LicenseSettings::load(brokenPath, &error);
    QVERIFY(error.contains(QStringLiteral("invalid JSON")));
    QCOMPARE(settings.maxTransfers, 3);

    LicenseSettings direct;
    QVERIFY(!direct.loadFile(arrayPath, &error));
    QVERIFY(error.contains(QStringLiteral("does not contain a JSON object")));
}

void LicenseSettingsTest::stateFilesResolveAgainstDataDirectory()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    LicenseSettings settings;
    settings.dataDirectory = dir.path();
    QCOMPARE(settings.stateFilePath(), QDir::cleanPath(dir.path() + QStringLiteral("/license_state.json")));
    QCOMPARE(settings.auditFilePath(), QDir::cleanPath(dir.path() + QStringLiteral("/license_audit.jsonl")));

    const QString absolute = dir.filePath(QStringLiteral("elsewhere/audit.jsonl"));
    settings.auditFileName = absolute;
    QCOMPARE(settings.auditFilePath(), QDir::cleanPath(absolute));

    settings.dataDirectory.clear();
    QVERIFY(QDir::isAbsolutePath(settings.stateFilePath()));
    QVERIFY(settings.stateFilePath().endsWith(QStringLiteral("/license/license_state.json")));
}

QTEST_MAIN(LicenseSettingsTest)
#include "LicenseSettingsTest.moc"
