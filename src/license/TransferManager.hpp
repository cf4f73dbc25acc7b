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

namespace wb::license {

/*!
 * Rebinds a license to the current device.
 *
 * Checks run in a fixed order and the first failure ends the request with a
 * TRANSFER_DENIED audit entry: registry lookup, transfer limit, registered
 * email. Only then is the owner notified, the binding overwritten and the
 * registry told about it.
 */
class TransferManager {
public:
    using Clock = std::function<QDateTime()>;
    using AddressProvider = std::function<QString()>;

    TransferManager(std::shared_ptr<RemoteRegistryInterface> registry, std::shared_ptr<LocalLicenseStore> store,
                    std::shared_ptr<NotifierInterface> notifier,
                    std::shared_ptr<HardwareFingerprinterInterface> fingerprinter, LicenseSettings settings);

    LicenseOutcome requestTransfer(const QString& licenseKey, const QString& email);

    void setClockForTesting(Clock clock);
    void setAddressProviderForTesting(AddressProvider provider);

private:
    LicenseOutcome deny(const QString& key, LicenseErrorKind error, const QString& message,
                        const QString& auditDetails, const std::optional<LicenseRecord>& record = std::nullopt);
    void audit(AuditEventType type, const QString& key, const QString& details);
    QDateTime now() const;

    std::shared_ptr<RemoteRegistryInterface>        m_registry;
    std::shared_ptr<LocalLicenseStore>              m_store;
    std::shared_ptr<NotifierInterface>              m_notifier;
    std::shared_ptr<HardwareFingerprinterInterface> m_fingerprinter;
    LicenseSettings                                 m_settings;
    Clock                                           m_clock;
    AddressProvider                                 m_addressProvider;
    QString                                         m_sourceAddress;
    std::mutex                                      m_requestMutex;
};

} // namespace wb::license
