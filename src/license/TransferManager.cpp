#include "TransferManager.hpp"

#include <QLoggingCategory>

#include "utils/NetworkUtils.hpp"

Q_LOGGING_CATEGORY(lcLicenseTransfer, "wb.license.transfer")

namespace wb::license {

TransferManager::TransferManager(std::shared_ptr<RemoteRegistryInterface> registry,
                                 std::shared_ptr<LocalLicenseStore> store,
                                 std::shared_ptr<NotifierInterface> notifier,
                                 std::shared_ptr<HardwareFingerprinterInterface> fingerprinter,
                                 LicenseSettings settings)
    : m_registry(std::move(registry))
    , m_store(std::move(store))
    , m_notifier(std::move(notifier))
    , m_fingerprinter(std::move(fingerprinter))
    , m_settings(std::move(settings))
    , m_clock([] { return QDateTime::currentDateTimeUtc(); })
    , m_addressProvider([] { return utils::primaryIpAddress(); })
{
}

void TransferManager::setClockForTesting(Clock clock)
{
    if (clock)
        m_clock = std::move(clock);
}

void TransferManager::setAddressProviderForTesting(AddressProvider provider)
{
    if (provider)
        m_addressProvider = std::move(provider);
}

LicenseOutcome TransferManager::requestTransfer(const QString& licenseKey, const QString& email)
{
    const QString key = licenseKey.trimmed();
    const QString typedEmail = email.trimmed();
    if (key.isEmpty()) {
        return LicenseOutcome::failure(ValidationMode::Transfer, LicenseErrorKind::InvalidInput,
                                       QStringLiteral("A license key is required to request a transfer."));
    }

    std::lock_guard<std::mutex> lock(m_requestMutex);
    m_sourceAddress = m_addressProvider ? m_addressProvider() : QString();
    audit(AuditEventType::TransferRequested, key,
          QStringLiteral("Transfer requested with email %1").arg(typedEmail.isEmpty() ? QStringLiteral("<none>")
                                                                                      : typedEmail));
    qCInfo(lcLicenseTransfer) << "Transfer requested for" << maskLicenseKey(key);

    std::optional<LicenseRecord> local = m_store->load();
    if (local && local->key != key)
        local.reset();

    const RegistryFetchResult fetched = m_registry->fetch(key);
    if (fetched.kind == RegistryFetchResult::Kind::NetworkError) {
        return deny(key, LicenseErrorKind::Network,
                    QStringLiteral("The license server could not be reached. Transfers need an online check; "
                                   "try again later."),
                    QStringLiteral("registry unreachable: %1").arg(fetched.errorMessage), local);
    }
    if (!fetched.found()) {
        return deny(key, LicenseErrorKind::NotFound, QStringLiteral("License key not found."),
                    QStringLiteral("license key not found"), local);
    }

    const RegistryRecord& remote = *fetched.record;
    const QDate today = now().toLocalTime().date();
    if (remote.status == LicenseStatus::Revoked) {
        return deny(key, LicenseErrorKind::Revoked,
                    QStringLiteral("This license has been revoked. Contact %1.").arg(m_settings.supportEmail),
                    QStringLiteral("license revoked"), local);
    }
    if (remote.status == LicenseStatus::Expired || remote.isExpiredOn(today)) {
        return deny(key, LicenseErrorKind::Expired,
                    QStringLiteral("This license has expired. Renew it at %1.").arg(m_settings.supportEmail),
                    QStringLiteral("license expired"), local);
    }
    if (remote.status == LicenseStatus::Pending) {
        return deny(key, LicenseErrorKind::NotActive,
                    QStringLiteral("This license is not active yet."), QStringLiteral("license pending"), local);
    }

    const HardwareFingerprint probe = m_fingerprinter->probe();
    const HardwareFingerprint currentBinding = remote.hasBindings()
        ? remote.bindings
        : (local ? local->hardwareBindings : HardwareFingerprint());
    if (!currentBinding.isEmpty()
        && HardwareFingerprinter::matches(probe, currentBinding, m_settings.hardwareMatchThreshold)) {
        qCInfo(lcLicenseTransfer) << "Device already holds the binding for" << maskLicenseKey(key);
        return LicenseOutcome::success(ValidationMode::Transfer, LicenseState::Active,
                                       QStringLiteral("This device is already bound to the license. "
                                                      "No transfer was needed."),
                                       local);
    }

    // 1. Limit
    const int usedTransfers = qMax(remote.transferCount, local ? local->transferCount : 0);
    if (usedTransfers >= m_settings.maxTransfers) {
        return deny(key, LicenseErrorKind::TransferLimitExceeded,
                    QStringLiteral("Transfer limit reached (%1/%2). Contact %3.")
                        .arg(usedTransfers)
                        .arg(m_settings.maxTransfers)
                        .arg(m_settings.supportEmail),
                    QStringLiteral("transfer limit reached (%1/%2)").arg(usedTransfers).arg(m_settings.maxTransfers),
                    local);
    }

    // 2. Email verification against the registered address.
    const QString registeredEmail = !remote.licenseeEmail.isEmpty()
        ? remote.licenseeEmail
        : (local ? local->licenseeEmail.trimmed() : QString());
    const QString licenseeName = !remote.licenseeName.isEmpty() ? remote.licenseeName
                                                                : (local ? local->licenseeName : QString());

    TransferAlert alert;
    alert.licenseKey = key;
    alert.recipient = registeredEmail;
    alert.licenseeName = licenseeName;
    alert.newFingerprint = probe;
    alert.timestamp = now();
    alert.sourceAddress = m_sourceAddress;
    alert.transferCount = usedTransfers;
    alert.maxTransfers = m_settings.maxTransfers;

    if (!sameEmail(typedEmail, registeredEmail)) {
        if (!registeredEmail.isEmpty() && m_notifier) {
            alert.suspicious = true;
            alert.attemptedEmail = typedEmail;
            m_notifier->notifyTransfer(alert);
        }
        return deny(key, LicenseErrorKind::EmailVerificationFailed,
                    QStringLiteral("Email verification failed. The registered owner has been notified."),
                    QStringLiteral("email verification failed for %1").arg(typedEmail), local);
    }

    // 3. Owner notification, detection only.
    if (m_notifier)
        m_notifier->notifyTransfer(alert);

    // 4. Bind and persist.
    const QDateTime timestamp = now();
    const int newCount = usedTransfers + 1;
    std::optional<LicenseRecord> stored;
    QString storageError;
    const bool written = m_store->update(
        [&](std::optional<LicenseRecord>& record) {
            if (!record || record->key != key) {
                record = LicenseRecord();
                record->key = key;
                record->activatedAt = timestamp;
            }
            record->status = LicenseStatus::Active;
            record->tier = remote.tier;
            record->expiryDate = remote.expiryDate;
            record->licenseeName = licenseeName;
            record->licenseeEmail = registeredEmail;
            record->hardwareBindings = probe;
            record->transferCount = newCount;
            record->lastVerifiedAt = timestamp;
            record->lastTransferAt = timestamp;
            record->offlineGraceUntil = timestamp.addDays(m_settings.offlineGraceDays);
            return true;
        },
        &stored, &storageError);
    if (!written) {
        qCCritical(lcLicenseTransfer) << "Transfer could not be persisted:" << storageError;
        return deny(key, LicenseErrorKind::Storage,
                    QStringLiteral("The transfer could not be saved on this device: %1").arg(storageError),
                    QStringLiteral("local state not written: %1").arg(storageError), local);
    }

    // 5. Audit and remote sync.
    audit(AuditEventType::TransferApproved, key,
          QStringLiteral("Hardware transfer approved (%1/%2), new hardware %3")
              .arg(newCount)
              .arg(m_settings.maxTransfers)
              .arg(probe.shortForm()));

    RegistryUpdate update;
    update.licenseKey = key;
    update.status = LicenseStatus::Active;
    update.bindings = probe;
    update.licenseeName = licenseeName;
    update.licenseeEmail = registeredEmail;
    update.tier = remote.tier;
    update.isTransfer = true;
    update.transferCount = newCount;
    update.eventType = QStringLiteral("TRANSFER");
    update.sourceAddress = m_sourceAddress;
    m_registry->post(update);

    qCInfo(lcLicenseTransfer) << "Transfer approved for" << maskLicenseKey(key) << newCount << "of"
                              << m_settings.maxTransfers;
    return LicenseOutcome::success(ValidationMode::Transfer, LicenseState::Active,
                                   QStringLiteral("Transfer approved (%1/%2 used).")
                                       .arg(newCount)
                                       .arg(m_settings.maxTransfers),
                                   stored);
}

LicenseOutcome TransferManager::deny(const QString& key, LicenseErrorKind error, const QString& message,
                                     const QString& auditDetails, const std::optional<LicenseRecord>& record)
{
    audit(AuditEventType::TransferDenied, key, auditDetails);
    qCWarning(lcLicenseTransfer) << "Transfer denied for" << maskLicenseKey(key) << errorKindToString(error)
                                 << auditDetails;
    LicenseOutcome outcome = LicenseOutcome::failure(ValidationMode::Transfer, error, message, record);
    // A refused transfer leaves whatever license this device had untouched.
    if (record && error != LicenseErrorKind::Revoked && error != LicenseErrorKind::Expired)
        outcome.state = record->status == LicenseStatus::Active ? LicenseState::Active : outcome.state;
    return outcome;
}

void TransferManager::audit(AuditEventType type, const QString& key, const QString& details)
{
    AuditEvent event;
    event.eventType = type;
    event.timestamp = now();
    event.licenseKey = key;
    event.details = details;
    if (!m_sourceAddress.isEmpty())
        event.sourceAddress = m_sourceAddress;
    if (!m_store->appendAudit(event))
        qCWarning(lcLicenseTransfer) << "Audit event" << auditEventTypeToString(type) << "not recorded";
}

QDateTime TransferManager::now() const
{
    return m_clock();
}

} // namespace wb::license
