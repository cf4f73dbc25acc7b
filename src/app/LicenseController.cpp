#include "LicenseController.hpp"

#include <QLoggingCategory>
#include <QThreadPool>
#include <QtConcurrent>

#include "license/BackgroundScheduler.hpp"
#include "license/LicenseValidator.hpp"

Q_LOGGING_CATEGORY(lcLicenseController, "wb.license.controller")

namespace wb::license {

LicenseController::LicenseController(std::shared_ptr<LicenseValidator> validator, QObject* parent)
    : QObject(parent)
    , m_validator(std::move(validator))
{
    qRegisterMetaType<wb::license::LicenseOutcome>();
    connect(&m_watcher, &QFutureWatcher<LicenseOutcome>::finished, this,
            &LicenseController::handleOperationFinished);
    refreshStatus();
}

LicenseController::~LicenseController() = default;

void LicenseController::attachScheduler(BackgroundScheduler* scheduler)
{
    if (!scheduler)
        return;
    connect(scheduler, &BackgroundScheduler::validationFinished, this, &LicenseController::handleBackgroundOutcome);
    connect(scheduler, &BackgroundScheduler::warningRaised, this, &LicenseController::handleBackgroundWarning);
}

QString LicenseController::licenseTier() const
{
    if (!m_summary.activated)
        return {};
    return tierToString(m_summary.tier);
}

bool LicenseController::runStartupValidation()
{
    if (!m_validator)
        return false;
    const LicenseOutcome outcome = m_validator->validateStartup();
    applyOutcome(outcome);
    m_startupBlocked = outcome.blocking;
    Q_EMIT statusMessageChanged();
    return outcome.usable() && !outcome.blocking;
}

bool LicenseController::activate(const QString& licenseKey, const QString& licenseeName, const QString& email)
{
    if (licenseKey.trimmed().isEmpty()) {
        setStatusMessage(tr("Enter a license key."), true);
        return false;
    }
    return startOperation(QStringLiteral("activate"), [validator = m_validator, licenseKey, licenseeName, email]() {
        return validator->activate(licenseKey, licenseeName, email);
    });
}

bool LicenseController::verifyNow()
{
    return startOperation(QStringLiteral("verify"), [validator = m_validator]() {
        return validator->validateManual();
    });
}

bool LicenseController::requestTransfer(const QString& licenseKey, const QString& email)
{
    if (licenseKey.trimmed().isEmpty() || email.trimmed().isEmpty()) {
        setStatusMessage(tr("A license key and the registered email address are required."), true);
        return false;
    }
    return startOperation(QStringLiteral("transfer"), [validator = m_validator, licenseKey, email]() {
        return validator->requestTransfer(licenseKey, email);
    });
}

void LicenseController::refreshStatus()
{
    if (!m_validator)
        return;
    m_summary = m_validator->getStatus();
    setLicenseActive(m_summary.state == LicenseState::Active || m_summary.state == LicenseState::OfflineGrace);
    Q_EMIT licenseDataChanged();
}

void LicenseController::setThreadPoolForTesting(QThreadPool* pool)
{
    m_threadPool = pool;
}

bool LicenseController::startOperation(const QString& operation, std::function<LicenseOutcome()> task)
{
    if (!m_validator)
        return false;
    if (m_busy) {
        qCInfo(lcLicenseController) << "Ignoring" << operation << "while" << m_pendingOperation << "is running";
        return false;
    }
    m_pendingOperation = operation;
    m_busy = true;
    Q_EMIT busyChanged();

    auto future = QtConcurrent::run(m_threadPool ? m_threadPool : QThreadPool::globalInstance(), std::move(task));
    m_watcher.setFuture(future);
    return true;
}

void LicenseController::handleOperationFinished()
{
    if (!m_watcher.isFinished())
        return;

    const LicenseOutcome outcome = m_watcher.result();
    const QString operation = m_pendingOperation;
    m_pendingOperation.clear();
    m_busy = false;
    Q_EMIT busyChanged();

    applyOutcome(outcome);
    if (outcome.ok() && operation != QLatin1String("verify")) {
        m_startupBlocked = false;
        Q_EMIT statusMessageChanged();
    }
    Q_EMIT operationFinished(operation, outcome.ok(), outcome.message);
}

void LicenseController::handleBackgroundOutcome(const LicenseOutcome& outcome)
{
    if (outcome.ok()) {
        applyOutcome(outcome);
        return;
    }
    // Background failures never interrupt the session; they only refresh the badge and raise a warning.
    refreshStatus();
    setWarningMessage(outcome.message);
}

void LicenseController::handleBackgroundWarning(const QString& message)
{
    setWarningMessage(message);
}

void LicenseController::applyOutcome(const LicenseOutcome& outcome)
{
    m_lastErrorKind = outcome.ok() ? QString() : errorKindToString(outcome.error);
    setStatusMessage(outcome.message, !outcome.ok());
    setWarningMessage(outcome.warning);
    refreshStatus();
    if (!outcome.ok() && outcome.error != LicenseErrorKind::RateLimited)
        qCWarning(lcLicenseController) << "License" << validationModeToString(outcome.mode) << "failed:"
                                       << errorKindToString(outcome.error);
}

void LicenseController::setStatusMessage(const QString& message, bool isError)
{
    if (m_statusMessage == message && m_statusIsError == isError)
        return;
    m_statusMessage = message;
    m_statusIsError = isError;
    Q_EMIT statusMessageChanged();
}

void LicenseController::setWarningMessage(const QString& message)
{
    if (m_warningMessage == message)
        return;
    m_warningMessage = message;
    Q_EMIT warningMessageChanged();
}

void LicenseController::setLicenseActive(bool active)
{
    if (m_licenseActive == active)
        return;
    m_licenseActive = active;
    Q_EMIT licenseActiveChanged();
}

} // namespace wb::license
