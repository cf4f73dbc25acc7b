#pragma once

#include <QDateTime>
#include <QString>

#include <functional>
#include <memory>
#include <mutex>
#include <optional>

#include "license/HardwareFingerprinter.hpp"
#include "license/LicenseOutcome.hpp"
#include "license/LicenseSettings.hpp"
#include "license/LocalLicenseStore.hpp"
#include "license/Notifier.hpp"
#include "license/RemoteRegistryClient.hpp"
#include "license/TransferManager.hpp"

namespace wb::license {

/*!
 * License state machine.
 *
 * One instance is created by the owner of the process and shared with the
 * background scheduler and the UI facade. Every entry point returns a typed
 * LicenseOutcome; nothing here throws into the caller. The local record is
 * written only after the registry answered, so an abandoned validation
 * leaves the stored state as it was.
 */
class LicenseValidator {
public:
    using Clock = std::function<QDateTime()>;

    LicenseValidator(LicenseSettings settings, std::shared_ptr<LocalLicenseStore> store,
                     std::shared_ptr<RemoteRegistryInterface> registry,
                     std::shared_ptr<HardwareFingerprinterInterface> fingerprinter,
                     std::shared_ptr<NotifierInterface> notifier);
    ~LicenseValidator();

    LicenseOutcome activate(const QString& licenseKey, const QString& licenseeName, const QString& email);

    //! Always online; restores a lost local record from the registry when the hardware matches.
    LicenseOutcome validateStartup();
    //! Never blocking: failures surface as passive warnings.
    LicenseOutcome validateBackground();
    //! Rate limited per local calendar day; the limit is checked before any network call.
    LicenseOutcome validateManual();

    LicenseOutcome requestTransfer(const QString& licenseKey, const QString& email);

    LicenseStatusSummary getStatus() const;
    LicenseTier currentTier() const;
    int backgroundIntervalSeconds() const;

    const LicenseSettings& settings() const { return m_settings; }
    std::shared_ptr<LocalLicenseStore> store() const { return m_store; }

    void setClockForTesting(Clock clock);
    void setAddressProviderForTesting(TransferManager::AddressProvider provider);

private:
    LicenseOutcome validateOnline(ValidationMode mode, const LicenseRecord& snapshot);
    LicenseOutcome recoverFromRegistry();
    LicenseOutcome offlineFallback(ValidationMode mode, const LicenseRecord& snapshot, const QString& networkError);
    LicenseOutcome markRevoked(ValidationMode mode, const QString& key, const RegistryRecord& remote);
    LicenseOutcome markExpired(ValidationMode mode, const QString& key, const RegistryRecord& remote);
    LicenseOutcome finish(LicenseOutcome outcome, const QString& key);

    void audit(AuditEventType type, const QString& key, const QString& details);
    void postBinding(const LicenseRecord& record, const QString& eventType);
    QString expiryWarning(const LicenseRecord& record) const;
    LicenseState lastKnownState(const std::optional<LicenseRecord>& record) const;
    QDateTime now() const;
    QDate today() const;

    LicenseSettings                                 m_settings;
    std::shared_ptr<LocalLicenseStore>              m_store;
    std::shared_ptr<RemoteRegistryInterface>        m_registry;
    std::shared_ptr<HardwareFingerprinterInterface> m_fingerprinter;
    std::shared_ptr<NotifierInterface>              m_notifier;
    std::unique_ptr<TransferManager>                m_transfers;
    Clock                                           m_clock;

    mutable std::mutex          m_stateMutex;
    std::optional<LicenseState> m_lastState;
};

} // namespace wb::license
