#pragma once

#include <QFutureWatcher>
#include <QObject>
#include <QString>

#include <functional>
#include <memory>

#include "license/LicenseOutcome.hpp"

class QThreadPool;

namespace wb::license {

class BackgroundScheduler;
class LicenseValidator;

//! Bridge between the license engine and the GUI shell.
class LicenseController : public QObject {
    Q_OBJECT
    Q_PROPERTY(bool licenseActive READ licenseActive NOTIFY licenseActiveChanged)
    Q_PROPERTY(QString statusMessage READ statusMessage NOTIFY statusMessageChanged)
    Q_PROPERTY(bool statusIsError READ statusIsError NOTIFY statusMessageChanged)
    Q_PROPERTY(bool startupBlocked READ startupBlocked NOTIFY statusMessageChanged)
    Q_PROPERTY(QString lastErrorKind READ lastErrorKind NOTIFY statusMessageChanged)
    Q_PROPERTY(QString warningMessage READ warningMessage NOTIFY warningMessageChanged)
    Q_PROPERTY(bool offlineGrace READ offlineGrace NOTIFY licenseDataChanged)
    Q_PROPERTY(QString licenseState READ licenseState NOTIFY licenseDataChanged)
    Q_PROPERTY(QString licenseKeyMasked READ licenseKeyMasked NOTIFY licenseDataChanged)
    Q_PROPERTY(QString licenseTier READ licenseTier NOTIFY licenseDataChanged)
    Q_PROPERTY(QString statusSummary READ statusSummary NOTIFY licenseDataChanged)
    Q_PROPERTY(int transferCount READ transferCount NOTIFY licenseDataChanged)
    Q_PROPERTY(int maxTransfers READ maxTransfers NOTIFY licenseDataChanged)
    Q_PROPERTY(int daysToExpiry READ daysToExpiry NOTIFY licenseDataChanged)
    Q_PROPERTY(int manualVerificationsRemaining READ manualVerificationsRemaining NOTIFY licenseDataChanged)
    Q_PROPERTY(bool busy READ busy NOTIFY busyChanged)

public:
    explicit LicenseController(std::shared_ptr<LicenseValidator> validator, QObject* parent = nullptr);
    ~LicenseController() override;

    //! Forwards background outcomes into the displayed status.
    void attachScheduler(BackgroundScheduler* scheduler);

    //! Synchronous startup gate; returns true when the shell may continue.
    bool runStartupValidation();

    Q_INVOKABLE bool activate(const QString& licenseKey, const QString& licenseeName, const QString& email);
    Q_INVOKABLE bool verifyNow();
    Q_INVOKABLE bool requestTransfer(const QString& licenseKey, const QString& email);
    Q_INVOKABLE void refreshStatus();

    bool licenseActive() const { return m_licenseActive; }
    QString statusMessage() const { return m_statusMessage; }
    bool statusIsError() const { return m_statusIsError; }
    bool startupBlocked() const { return m_startupBlocked; }
    QString lastErrorKind() const { return m_lastErrorKind; }
    QString warningMessage() const { return m_warningMessage; }
    bool offlineGrace() const { return m_summary.state == LicenseState::OfflineGrace; }
    QString licenseState() const { return licenseStateToString(m_summary.state); }
    QString licenseKeyMasked() const { return m_summary.licenseKeyMasked; }
    QString licenseTier() const;
    QString statusSummary() const { return m_summary.statusText; }
    int transferCount() const { return m_summary.transferCount; }
    int maxTransfers() const { return m_summary.maxTransfers; }
    int daysToExpiry() const { return m_summary.daysToExpiry.value_or(-1); }
    int manualVerificationsRemaining() const { return m_summary.manualVerificationsRemaining; }
    bool busy() const { return m_busy; }

    void setThreadPoolForTesting(QThreadPool* pool);

signals:
    void licenseActiveChanged();
    void statusMessageChanged();
    void warningMessageChanged();
    void licenseDataChanged();
    void busyChanged();
    void operationFinished(const QString& operation, bool success, const QString& message);

private slots:
    void handleOperationFinished();
    void handleBackgroundOutcome(const wb::license::LicenseOutcome& outcome);
    void handleBackgroundWarning(const QString& message);

private:
    bool startOperation(const QString& operation, std::function<LicenseOutcome()> task);
    void applyOutcome(const LicenseOutcome& outcome);
    void setStatusMessage(const QString& message, bool isError);
    void setWarningMessage(const QString& message);
    void setLicenseActive(bool active);

    std::shared_ptr<LicenseValidator> m_validator;
    QFutureWatcher<LicenseOutcome>    m_watcher;
    QThreadPool*                      m_threadPool = nullptr;
    QString                           m_pendingOperation;
    LicenseStatusSummary              m_summary;

    bool    m_licenseActive = false;
    bool    m_statusIsError = false;
    bool    m_startupBlocked = false;
    bool    m_busy = false;
    QString m_statusMessage;
    QString m_lastErrorKind;
    QString m_warningMessage;
};

} // namespace wb::license
