#pragma once

#include <QJsonObject>
#include <QString>
#include <QUrl>

#include "license/LicenseTypes.hpp"

class QCommandLineParser;

namespace wb::license {

struct SmtpSettings {
    QString host;
    int port = 465;
    bool implicitTls = true;
    bool startTls = false;
    QString username;
    QString password;
    QString sender;
    int timeoutMs = 15000;

    bool isConfigured() const { return !host.isEmpty() && !sender.isEmpty(); }
};

struct LicenseSettings {
    QUrl registryReadUrl;
    QUrl registryWriteUrl;
    QString registryApiKey;
    int requestTimeoutMs = 10000;

    QString dataDirectory;
    QString stateFileName = QStringLiteral("license_state.json");
    QString auditFileName = QStringLiteral("license_audit.jsonl");

    int offlineGraceDays = 7;
    int maxTransfers = 3;
    int hardwareMatchThreshold = 2;
    int manualVerificationLimit = 3;
    int expiryWarningDays = 7;
    int clockSkewToleranceSeconds = 300;

    int trialCheckIntervalHours = 1;
    int standardCheckIntervalHours = 24;
    int premiumCheckIntervalHours = 168;
    int minimumCheckIntervalSeconds = 60;
    int maximumCheckIntervalSeconds = 7 * 24 * 3600;

    SmtpSettings smtp;
    QString supportEmail = QStringLiteral("support@water-balance.app");
    QString supportPhone;

    QString stateFilePath() const;
    QString auditFilePath() const;

    //! Background revalidation period for a tier, clamped to the configured floor and ceiling.
    int checkIntervalSeconds(LicenseTier tier) const;

    //! Overlay values present in the JSON document; missing keys keep the current value.
    void applyJson(const QJsonObject& root);

    //! Overlay WB_LICENSE_* environment variables.
    void applyEnvironment();

    //! Clamp numeric values to sane bounds.
    void sanitize();

    bool loadFile(const QString& path, QString* errorMessage = nullptr);

    static void configureParser(QCommandLineParser& parser);
    void applyParser(const QCommandLineParser& parser);

    //! Defaults, then the config file (if present), then environment.
    static LicenseSettings load(const QString& configPath, QString* errorMessage = nullptr);
};

} // namespace wb::license
