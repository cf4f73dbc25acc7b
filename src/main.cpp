#include <QCommandLineParser>
#include <QCoreApplication>
#include <QJsonDocument>
#include <QObject>
#include <QStringList>
#include <QTextStream>

#include <memory>

#include "app/LicenseController.hpp"
#include "license/AuditLog.hpp"
#include "license/BackgroundScheduler.hpp"
#include "license/HardwareFingerprinter.hpp"
#include "license/LicenseSettings.hpp"
#include "license/LicenseValidator.hpp"
#include "license/LocalLicenseStore.hpp"
#include "license/Notifier.hpp"
#include "license/RemoteRegistryClient.hpp"
#include "utils/RuntimeUtils.hpp"

using namespace wb::license;

namespace {

constexpr int kShutdownWaitMs = 15000;

enum ExitCode {
    ExitOk = 0,
    ExitFailure = 1,
    ExitBlocked = 2,
    ExitUsage = 64,
};

struct Engine {
    std::shared_ptr<AuditLog>              auditLog;
    std::shared_ptr<LocalLicenseStore>     store;
    std::shared_ptr<RemoteRegistryClient>  registry;
    std::shared_ptr<SmtpNotifier>          notifier;
    std::shared_ptr<HardwareFingerprinter> fingerprinter;
    std::shared_ptr<LicenseValidator>      validator;

    void drain()
    {
        if (registry && !registry->waitForPendingPosts(kShutdownWaitMs))
            QTextStream(stderr) << QObject::tr("Registry update still pending at exit.") << Qt::endl;
        if (notifier && !notifier->waitForPending(kShutdownWaitMs))
            QTextStream(stderr) << QObject::tr("Notification email still pending at exit.") << Qt::endl;
    }
};

Engine buildEngine(const LicenseSettings& settings)
{
    Engine engine;
    engine.auditLog = std::make_shared<AuditLog>(settings.auditFilePath());
    engine.store = std::make_shared<LocalLicenseStore>(settings.stateFilePath(), engine.auditLog);
    engine.registry = std::make_shared<RemoteRegistryClient>(settings.registryReadUrl, settings.registryWriteUrl,
                                                             settings.requestTimeoutMs);
    engine.registry->setApiKey(settings.registryApiKey);
    engine.notifier = std::make_shared<SmtpNotifier>(settings.smtp, settings.supportEmail, settings.supportPhone);
    engine.fingerprinter = std::make_shared<HardwareFingerprinter>();
    engine.validator = std::make_shared<LicenseValidator>(settings, engine.store, engine.registry,
                                                          engine.fingerprinter, engine.notifier);
    return engine;
}

int report(const LicenseOutcome& outcome)
{
    QTextStream out(stdout);
    QTextStream err(stderr);
    if (outcome.ok())
        out << outcome.message << Qt::endl;
    else
        err << outcome.message << " [" << errorKindToString(outcome.error) << ']' << Qt::endl;
    if (!outcome.warning.isEmpty())
        err << QObject::tr("Warning: %1").arg(outcome.warning) << Qt::endl;

    if (outcome.blocking)
        return ExitBlocked;
    return outcome.ok() ? ExitOk : ExitFailure;
}

int printStatus(const LicenseValidator& validator)
{
    const LicenseStatusSummary summary = validator.getStatus();
    QTextStream out(stdout);
    out << summary.statusText << Qt::endl;
    if (!summary.activated)
        return ExitFailure;

    out << QObject::tr("Key: %1").arg(summary.licenseKeyMasked) << Qt::endl;
    out << QObject::tr("State: %1").arg(licenseStateToString(summary.state)) << Qt::endl;
    if (summary.lastVerifiedAt.isValid())
        out << QObject::tr("Last verified: %1").arg(summary.lastVerifiedAt.toLocalTime().toString(Qt::ISODate))
            << Qt::endl;
    if (summary.offlineGraceUntil)
        out << QObject::tr("Offline grace until: %1")
                   .arg(summary.offlineGraceUntil->toLocalTime().toString(Qt::ISODate))
            << Qt::endl;
    out << QObject::tr("Manual verifications left today: %1").arg(summary.manualVerificationsRemaining)
        << Qt::endl;
    return ExitOk;
}

int printFingerprint(HardwareFingerprinter& fingerprinter)
{
    const HardwareFingerprint fingerprint = fingerprinter.probe();
    QTextStream(stdout) << QJsonDocument(fingerprint.toJson()).toJson(QJsonDocument::Indented);
    return ExitOk;
}

int printAudit(const AuditLog& auditLog, const QCommandLineParser& parser)
{
    AuditQuery query;
    for (const QString& name : parser.values(QStringLiteral("type"))) {
        const auto type = auditEventTypeFromString(name.trimmed().toUpper());
        if (!type) {
            QTextStream(stderr) << QObject::tr("Unknown audit event type: %1").arg(name) << Qt::endl;
            return ExitUsage;
        }
        query.types.append(*type);
    }
    if (parser.isSet(QStringLiteral("limit"))) {
        bool ok = false;
        query.limit = parser.value(QStringLiteral("limit")).toInt(&ok);
        if (!ok || query.limit < 0) {
            QTextStream(stderr) << QObject::tr("--limit expects a non-negative number") << Qt::endl;
            return ExitUsage;
        }
    }

    QTextStream out(stdout);
    for (const AuditEvent& event : auditLog.query(query)) {
        out << event.timestamp.toLocalTime().toString(Qt::ISODate) << ' ' << auditEventTypeToString(event.eventType)
            << ' ' << maskLicenseKey(event.licenseKey);
        if (event.sourceAddress)
            out << ' ' << *event.sourceAddress;
        if (!event.details.isEmpty())
            out << " - " << event.details;
        out << Qt::endl;
    }
    return ExitOk;
}

int runWatch(QCoreApplication& app, Engine& engine)
{
    LicenseController controller(engine.validator);
    if (!controller.runStartupValidation()) {
        QTextStream(stderr) << controller.statusMessage() << Qt::endl;
        return controller.startupBlocked() ? ExitBlocked : ExitFailure;
    }
    QTextStream(stdout) << controller.statusSummary() << Qt::endl;

    BackgroundScheduler scheduler(engine.validator);
    controller.attachScheduler(&scheduler);
    QObject::connect(&scheduler, &BackgroundScheduler::validationFinished, &app,
                     [&controller](const LicenseOutcome& outcome) {
                         QTextStream(stdout) << QStringLiteral("[%1] %2")
                                                    .arg(validationModeToString(outcome.mode), outcome.message)
                                             << Qt::endl;
                         if (outcome.ok())
                             QTextStream(stdout) << controller.statusSummary() << Qt::endl;
                     });
    QObject::connect(&controller, &LicenseController::warningMessageChanged, &app, [&controller]() {
        if (!controller.warningMessage().isEmpty())
            QTextStream(stderr) << QObject::tr("Warning: %1").arg(controller.warningMessage()) << Qt::endl;
    });

    scheduler.start();
    QTextStream(stdout) << QObject::tr("Next check in %1 s.").arg(scheduler.nextIntervalMs() / 1000) << Qt::endl;
    const int exitCode = app.exec();
    scheduler.stop();
    return exitCode;
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("water-balance"));
    QCoreApplication::setApplicationName(QStringLiteral("wb-license"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QObject::tr("Water balance license tool"));
    parser.addHelpOption();
    parser.addVersionOption();
    LicenseSettings::configureParser(parser);
    parser.addOption({QStringLiteral("type"), QObject::tr("Audit event type filter (repeatable)"),
                      QStringLiteral("type")});
    parser.addOption({QStringLiteral("limit"), QObject::tr("Show only the newest N audit events"),
                      QStringLiteral("n")});
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QObject::tr("status | activate <key> <name> <email> | validate | verify | "
                                             "transfer <key> <email> | audit | fingerprint | watch"));
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    const QString command = args.isEmpty() ? QStringLiteral("status") : args.first();

    QString configError;
    LicenseSettings settings = LicenseSettings::load(parser.value(QStringLiteral("config")), &configError);
    if (!configError.isEmpty())
        QTextStream(stderr) << QObject::tr("Configuration: %1").arg(configError) << Qt::endl;
    settings.applyParser(parser);

    if (command == QLatin1String("fingerprint")) {
        HardwareFingerprinter fingerprinter;
        return printFingerprint(fingerprinter);
    }

    const bool readOnly = command == QLatin1String("status") || command == QLatin1String("audit");
    utils::StateWriterLock writerLock(utils::writerLockFilePath(settings.dataDirectory));
    if (!readOnly && !writerLock.tryAcquire()) {
        QTextStream(stderr) << writerLock.errorString() << Qt::endl;
        return ExitFailure;
    }

    Engine engine = buildEngine(settings);
    int exitCode = ExitUsage;

    if (command == QLatin1String("status")) {
        exitCode = printStatus(*engine.validator);
    } else if (command == QLatin1String("audit")) {
        exitCode = printAudit(*engine.auditLog, parser);
    } else if (command == QLatin1String("activate")) {
        if (args.size() < 4) {
            QTextStream(stderr) << QObject::tr("Usage: wb-license activate <key> <name> <email>") << Qt::endl;
        } else {
            exitCode = report(engine.validator->activate(args.at(1), args.at(2), args.at(3)));
        }
    } else if (command == QLatin1String("validate")) {
        exitCode = report(engine.validator->validateStartup());
    } else if (command == QLatin1String("verify")) {
        exitCode = report(engine.validator->validateManual());
    } else if (command == QLatin1String("transfer")) {
        if (args.size() < 3) {
            QTextStream(stderr) << QObject::tr("Usage: wb-license transfer <key> <email>") << Qt::endl;
        } else {
            exitCode = report(engine.validator->requestTransfer(args.at(1), args.at(2)));
        }
    } else if (command == QLatin1String("watch")) {
        exitCode = runWatch(app, engine);
    } else {
        QTextStream(stderr) << QObject::tr("Unknown command: %1").arg(command) << Qt::endl;
        parser.showHelp(ExitUsage);
    }

    engine.drain();
    return exitCode;
}
