#include "LicenseSettings.hpp"

#include <QCommandLineParser>
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QLoggingCategory>
#include <QtGlobal>

#include <limits>

#include "utils/PathUtils.hpp"

Q_LOGGING_CATEGORY(lcLicenseSettings, "wb.license.settings")

namespace wb::license {

namespace {

QString envValue(const char* key)
{
    const QByteArray env = qgetenv(key);
    if (env.isEmpty())
        return {};
    return QString::fromUtf8(env).trimmed();
}

void readInt(const QJsonObject& object, const char* key, int& target)
{
    const QJsonValue value = object.value(QLatin1String(key));
    if (value.isDouble())
        target = value.toInt(target);
    else if (value.isString()) {
        bool ok = false;
        const int parsed = value.toString().trimmed().toInt(&ok);
        if (ok)
            target = parsed;
    }
}

void readString(const QJsonObject& object, const char* key, QString& target)
{
    const QJsonValue value = object.value(QLatin1String(key));
    if (value.isString())
        target = value.toString().trimmed();
}

void readBool(const QJsonObject& object, const char* key, bool& target)
{
    const QJsonValue value = object.value(QLatin1String(key));
    if (value.isBool())
        target = value.toBool();
}

void readUrl(const QJsonObject& object, const char* key, QUrl& target)
{
    const QJsonValue value = object.value(QLatin1String(key));
    if (value.isString())
        target = QUrl(value.toString().trimmed());
}

void envInt(const char* key, int& target)
{
    const QString text = envValue(key);
    if (text.isEmpty())
        return;
    bool ok = false;
    const int parsed = text.toInt(&ok);
    if (ok)
        target = parsed;
    else
        qCWarning(lcLicenseSettings) << "Ignoring non-numeric" << key << text;
}

void envBool(const char* key, bool& target)
{
    const QString text = envValue(key).toLower();
    if (text.isEmpty())
        return;
    target = text == QLatin1String("1") || text == QLatin1String("true") || text == QLatin1String("yes");
}

} // namespace

QString LicenseSettings::stateFilePath() const
{
    const QString directory = dataDirectory.isEmpty() ? utils::defaultDataDirectory() : dataDirectory;
    return utils::resolveInDirectory(directory, stateFileName);
}

QString LicenseSettings::auditFilePath() const
{
    const QString directory = dataDirectory.isEmpty() ? utils::defaultDataDirectory() : dataDirectory;
    return utils::resolveInDirectory(directory, auditFileName);
}

int LicenseSettings::checkIntervalSeconds(LicenseTier tier) const
{
    int hours = standardCheckIntervalHours;
    switch (tier) {
    case LicenseTier::Trial:
        hours = trialCheckIntervalHours;
        break;
    case LicenseTier::Standard:
        hours = standardCheckIntervalHours;
        break;
    case LicenseTier::Premium:
        hours = premiumCheckIntervalHours;
        break;
    }
    const qint64 seconds = static_cast<qint64>(hours) * 3600;
    return static_cast<int>(qBound<qint64>(minimumCheckIntervalSeconds, seconds, maximumCheckIntervalSeconds));
}

void LicenseSettings::applyJson(const QJsonObject& root)
{
    const QJsonObject registry = root.value(QStringLiteral("registry")).toObject();
    readUrl(registry, "readUrl", registryReadUrl);
    readUrl(registry, "writeUrl", registryWriteUrl);
    readString(registry, "apiKey", registryApiKey);
    readInt(registry, "timeoutMs", requestTimeoutMs);

    const QJsonObject storage = root.value(QStringLiteral("storage")).toObject();
    QString directory;
    readString(storage, "dataDirectory", directory);
    if (!directory.isEmpty())
        dataDirectory = utils::expandPath(directory);
    readString(storage, "stateFile", stateFileName);
    readString(storage, "auditFile", auditFileName);

    const QJsonObject policy = root.value(QStringLiteral("policy")).toObject();
    readInt(policy, "offlineGraceDays", offlineGraceDays);
    readInt(policy, "maxTransfers", maxTransfers);
    readInt(policy, "hardwareMatchThreshold", hardwareMatchThreshold);
    readInt(policy, "manualVerificationLimit", manualVerificationLimit);
    readInt(policy, "expiryWarningDays", expiryWarningDays);
    readInt(policy, "clockSkewToleranceSeconds", clockSkewToleranceSeconds);

    const QJsonObject intervals = policy.value(QStringLiteral("checkIntervalsHours")).toObject();
    readInt(intervals, "trial", trialCheckIntervalHours);
    readInt(intervals, "standard", standardCheckIntervalHours);
    readInt(intervals, "premium", premiumCheckIntervalHours);
    readInt(policy, "minimumCheckIntervalSeconds", minimumCheckIntervalSeconds);
    readInt(policy, "maximumCheckIntervalSeconds", maximumCheckIntervalSeconds);

    const QJsonObject smtpObject = root.value(QStringLiteral("smtp")).toObject();
    readString(smtpObject, "host", smtp.host);
    readInt(smtpObject, "port", smtp.port);
    readBool(smtpObject, "implicitTls", smtp.implicitTls);
    readBool(smtpObject, "startTls", smtp.startTls);
    readString(smtpObject, "username", smtp.username);
    readString(smtpObject, "password", smtp.password);
    readString(smtpObject, "sender", smtp.sender);
    readInt(smtpObject, "timeoutMs", smtp.timeoutMs);

    const QJsonObject support = root.value(QStringLiteral("support")).toObject();
    readString(support, "email", supportEmail);
    readString(support, "phone", supportPhone);
}

void LicenseSettings::applyEnvironment()
{
    const QString readUrl = envValue("WB_LICENSE_REGISTRY_READ_URL");
    if (!readUrl.isEmpty())
        registryReadUrl = QUrl(readUrl);
    const QString writeUrl = envValue("WB_LICENSE_REGISTRY_WRITE_URL");
    if (!writeUrl.isEmpty())
        registryWriteUrl = QUrl(writeUrl);
    const QString apiKey = envValue("WB_LICENSE_REGISTRY_API_KEY");
    if (!apiKey.isEmpty())
        registryApiKey = apiKey;
    envInt("WB_LICENSE_REGISTRY_TIMEOUT_MS", requestTimeoutMs);

    const QString directory = envValue("WB_LICENSE_DATA_DIR");
    if (!directory.isEmpty())
        dataDirectory = utils::expandPath(directory);

    envInt("WB_LICENSE_OFFLINE_GRACE_DAYS", offlineGraceDays);

    const QString smtpHost = envValue("WB_LICENSE_SMTP_HOST");
    if (!smtpHost.isEmpty())
        smtp.host = smtpHost;
    envInt("WB_LICENSE_SMTP_PORT", smtp.port);
    envBool("WB_LICENSE_SMTP_IMPLICIT_TLS", smtp.implicitTls);
    envBool("WB_LICENSE_SMTP_STARTTLS", smtp.startTls);
    const QString smtpUser = envValue("WB_LICENSE_SMTP_USER");
    if (!smtpUser.isEmpty())
        smtp.username = smtpUser;
    const QByteArray smtpPassword = qgetenv("WB_LICENSE_SMTP_PASSWORD");
    if (!smtpPassword.isEmpty())
        smtp.password = QString::fromUtf8(smtpPassword);
    const QString sender = envValue("WB_LICENSE_SMTP_SENDER");
    if (!sender.isEmpty())
        smtp.sender = sender;
}

void LicenseSettings::sanitize()
{
    requestTimeoutMs = qBound(1000, requestTimeoutMs, 120000);
    offlineGraceDays = qBound(0, offlineGraceDays, 90);
    maxTransfers = qBound(0, maxTransfers, 100);
    hardwareMatchThreshold = qBound(1, hardwareMatchThreshold, 3);
    manualVerificationLimit = qBound(0, manualVerificationLimit, 100);
    expiryWarningDays = qBound(0, expiryWarningDays, 365);
    clockSkewToleranceSeconds = qBound(0, clockSkewToleranceSeconds, 24 * 3600);
    trialCheckIntervalHours = qMax(0, trialCheckIntervalHours);
    standardCheckIntervalHours = qMax(0, standardCheckIntervalHours);
    premiumCheckIntervalHours = qMax(0, premiumCheckIntervalHours);
    // QTimer takes milliseconds in an int.
    const int intervalCeiling = std::numeric_limits<int>::max() / 1000;
    minimumCheckIntervalSeconds = qBound(1, minimumCheckIntervalSeconds, intervalCeiling);
    maximumCheckIntervalSeconds = qBound(minimumCheckIntervalSeconds, maximumCheckIntervalSeconds, intervalCeiling);
    smtp.port = qBound(1, smtp.port, 65535);
    smtp.timeoutMs = qBound(1000, smtp.timeoutMs, 120000);
    if (stateFileName.trimmed().isEmpty())
        stateFileName = QStringLiteral("license_state.json");
    if (auditFileName.trimmed().isEmpty())
        auditFileName = QStringLiteral("license_audit.jsonl");
}

bool LicenseSettings::loadFile(const QString& path, QString* errorMessage)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        if (errorMessage)
            *errorMessage = QStringLiteral("cannot open %1: %2").arg(path, file.errorString());
        return false;
    }

    QJsonParseError parseError{};
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        if (errorMessage) {
            *errorMessage = parseError.error != QJsonParseError::NoError
                ? QStringLiteral("invalid JSON in %1: %2").arg(path, parseError.errorString())
                : QStringLiteral("%1 does not contain a JSON object").arg(path);
        }
        return false;
    }

    applyJson(document.object());
    return true;
}

void LicenseSettings::configureParser(QCommandLineParser& parser)
{
    parser.addOption({QStringLiteral("config"), QStringLiteral("License configuration file (JSON)"),
                      QStringLiteral("path"), QStringLiteral("config/license.json")});
    parser.addOption({QStringLiteral("registry-url"), QStringLiteral("Registry read endpoint"),
                      QStringLiteral("url")});
    parser.addOption({QStringLiteral("registry-write-url"), QStringLiteral("Registry write (POST) endpoint"),
                      QStringLiteral("url")});
    parser.addOption({QStringLiteral("registry-timeout-ms"), QStringLiteral("Registry request timeout"),
                      QStringLiteral("ms")});
    parser.addOption({QStringLiteral("data-dir"), QStringLiteral("Directory holding license state and audit log"),
                      QStringLiteral("path")});
    parser.addOption({QStringLiteral("offline-grace-days"), QStringLiteral("Offline grace period in days"),
                      QStringLiteral("days")});
}

void LicenseSettings::applyParser(const QCommandLineParser& parser)
{
    if (parser.isSet(QStringLiteral("registry-url")))
        registryReadUrl = QUrl(parser.value(QStringLiteral("registry-url")).trimmed());
    if (parser.isSet(QStringLiteral("registry-write-url")))
        registryWriteUrl = QUrl(parser.value(QStringLiteral("registry-write-url")).trimmed());
    if (parser.isSet(QStringLiteral("registry-timeout-ms"))) {
        bool ok = false;
        const int value = parser.value(QStringLiteral("registry-timeout-ms")).toInt(&ok);
        if (ok)
            requestTimeoutMs = value;
    }
    if (parser.isSet(QStringLiteral("data-dir")))
        dataDirectory = utils::expandPath(parser.value(QStringLiteral("data-dir")));
    if (parser.isSet(QStringLiteral("offline-grace-days"))) {
        bool ok = false;
        const int value = parser.value(QStringLiteral("offline-grace-days")).toInt(&ok);
        if (ok)
            offlineGraceDays = value;
    }
    sanitize();
}

LicenseSettings LicenseSettings::load(const QString& configPath, QString* errorMessage)
{
    LicenseSettings settings;
    const QString path = utils::expandPath(configPath);
    if (!path.isEmpty() && QFile::exists(path)) {
        QString error;
        if (!settings.loadFile(path, &error)) {
            qCWarning(lcLicenseSettings) << "License configuration ignored:" << error;
            if (errorMessage)
                *errorMessage = error;
        }
    } else if (!path.isEmpty()) {
        qCDebug(lcLicenseSettings) << "No license configuration at" << path << "- using defaults";
    }
    settings.applyEnvironment();
    settings.sanitize();
    return settings;
}

} // namespace wb::license
