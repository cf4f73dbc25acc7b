#include "LicenseValidator.hpp"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(lcLicenseValidator, "wb.license.validator")

namespace wb::license {

namespace {

LicenseState stateFromStatus(LicenseStatus status)
{
    switch (status) {
    case LicenseStatus::Active:
        return LicenseState::Active;
    case LicenseStatus::Revoked:
        return LicenseState::Revoked;
    case LicenseStatus::Expired:
        return LicenseState::Expired;
    case LicenseStatus::Pending:
        break;
    }
    return LicenseState::Unactivated;
}

bool looksLikeEmail(const QString& email)
{
    const int at = email.indexOf(QLatin1Char('@'));
    return at > 0 && at < email.size() - 1 && !email.contains(QLatin1Char(' '));
}

} // namespace

LicenseValidator::LicenseValidator(LicenseSettings settings, std::shared_ptr<LocalLicenseStore> store,
                                   std::shared_ptr<RemoteRegistryInterface> registry,
                                   std::shared_ptr<HardwareFingerprinterInterface> fingerprinter,
                                   std::shared_ptr<NotifierInterface> notifier)
    : m_settings(std::move(settings))
    , m_store(std::move(store))
    , m_registry(std::move(registry))
    , m_fingerprinter(std::move(fingerprinter))
    , m_notifier(std::move(notifier))
    , m_clock([] { return QDateTime::currentDateTimeUtc(); })
{
    m_transfers = std::make_unique<TransferManager>(m_registry, m_store, m_notifier, m_fingerprinter, m_settings);
}

LicenseValidator::~LicenseValidator() = default;

void LicenseValidator::setClockForTesting(Clock clock)
{
    if (!clock)
        return;
    m_clock = clock;
    m_transfers->setClockForTesting(std::move(clock));
}

void LicenseValidator::setAddressProviderForTesting(TransferManager::AddressProvider provider)
{
    m_transfers->setAddressProviderForTesting(std::move(provider));
}

QDateTime LicenseValidator::now() const
{
    return m_clock();
}

QDate LicenseValidator::today() const
{
    return now().toLocalTime().date();
}

LicenseOutcome LicenseValidator::activate(const QString& licenseKey, const QString& licenseeName,
                                          const QString& email)
{
    const QString key = licenseKey.trimmed();
    const QString name = licenseeName.trimmed();
    const QString typedEmail = email.trimmed();

    if (key.isEmpty()) {
        return LicenseOutcome::failure(ValidationMode::Activation, LicenseErrorKind::InvalidInput,
                                       QStringLiteral("Enter a license key."));
    }
    if (!typedEmail.isEmpty() && !looksLikeEmail(typedEmail)) {
        return LicenseOutcome::failure(ValidationMode::Activation, LicenseErrorKind::InvalidInput,
                                       QStringLiteral("Enter a valid email address."));
    }

    qCInfo(lcLicenseValidator) << "Activating" << maskLicenseKey(key);
    const RegistryFetchResult fetched = m_registry->fetch(key);
    if (fetched.kind == RegistryFetchResult::Kind::NetworkError) {
        return finish(LicenseOutcome::failure(ValidationMode::Activation, LicenseErrorKind::Network,
                                              QStringLiteral("The license server could not be reached. "
                                                             "Activation needs an internet connection.")),
                      key);
    }
    if (!fetched.found()) {
        return finish(LicenseOutcome::failure(ValidationMode::Activation, LicenseErrorKind::NotFound,
                                              QStringLiteral("License key not found. Check the key and try again.")),
                      key);
    }

    const RegistryRecord& remote = *fetched.record;
    if (remote.status == LicenseStatus::Revoked) {
        return finish(LicenseOutcome::failure(ValidationMode::Activation, LicenseErrorKind::AlreadyRevoked,
                                              QStringLiteral("This license has been revoked. Contact %1.")
                                                  .arg(m_settings.supportEmail)),
                      key);
    }
    if (remote.status == LicenseStatus::Expired || remote.isExpiredOn(today())) {
        return finish(LicenseOutcome::failure(ValidationMode::Activation, LicenseErrorKind::Expired,
                                              QStringLiteral("This license has expired. Renew it at %1.")
                                                  .arg(m_settings.supportEmail)),
                      key);
    }
    if (remote.status != LicenseStatus::Active) {
        return finish(LicenseOutcome::failure(ValidationMode::Activation, LicenseErrorKind::NotActive,
                                              QStringLiteral("This license is not active yet. Contact %1.")
                                                  .arg(m_settings.supportEmail)),
                      key);
    }

    const HardwareFingerprint probe = m_fingerprinter->probe();
    if (remote.hasBindings()
        && !HardwareFingerprinter::matches(probe, remote.bindings, m_settings.hardwareMatchThreshold)) {
        const QStringList changes = HardwareFingerprinter::describeMismatch(probe, remote.bindings);
        return finish(LicenseOutcome::failure(ValidationMode::Activation, LicenseErrorKind::HardwareMismatch,
                                              QStringLiteral("This license is already bound to another device (%1). "
                                                             "Request a transfer to move it here.")
                                                  .arg(changes.join(QStringLiteral(", ")))),
                      key);
    }

    const QDateTime timestamp = now();
    std::optional<LicenseRecord> stored;
    QString storageError;
    const bool written = m_store->update(
        [&](std::optional<LicenseRecord>& record) {
            const bool sameKey = record && record->key == key;
            LicenseRecord next = sameKey ? *record : LicenseRecord();
            next.key = key;
            next.status = LicenseStatus::Active;
            next.tier = remote.tier;
            next.expiryDate = remote.expiryDate;
            next.hardwareBindings = probe;
            next.licenseeName = !remote.licenseeName.isEmpty() ? remote.licenseeName : name;
            next.licenseeEmail = !remote.licenseeEmail.isEmpty() ? remote.licenseeEmail : typedEmail;
            next.transferCount = qMax(remote.transferCount, sameKey ? record->transferCount : 0);
            if (!next.activatedAt.isValid())
                next.activatedAt = timestamp;
            next.lastVerifiedAt = timestamp;
            next.offlineGraceUntil = timestamp.addDays(m_settings.offlineGraceDays);
            record = next;
            return true;
        },
        &stored, &storageError);
    if (!written || !stored) {
        qCCritical(lcLicenseValidator) << "Activation could not be saved:" << storageError;
        return finish(LicenseOutcome::failure(ValidationMode::Activation, LicenseErrorKind::Storage,
                                              QStringLiteral("The license could not be saved on this device: %1")
                                                  .arg(storageError)),
                      key);
    }

    m_store->recordSeen(timestamp);
    postBinding(*stored, QStringLiteral("ACTIVATE"));
    audit(AuditEventType::Activate, key, QStringLiteral("Activated on %1").arg(probe.shortForm()));

    LicenseOutcome outcome = LicenseOutcome::success(ValidationMode::Activation, LicenseState::Active,
                                                     QStringLiteral("License activated."), stored);
    outcome.warning = expiryWarning(*stored);
    return finish(outcome, key);
}

LicenseOutcome LicenseValidator::validateStartup()
{
    const std::optional<LicenseRecord> snapshot = m_store->load();
    if (!snapshot)
        return recoverFromRegistry();
    return validateOnline(ValidationMode::Startup, *snapshot);
}

LicenseOutcome LicenseValidator::validateBackground()
{
    const std::optional<LicenseRecord> snapshot = m_store->load();
    if (!snapshot) {
        return finish(LicenseOutcome::failure(ValidationMode::Background, LicenseErrorKind::NotActivated,
                                              QStringLiteral("License not activated.")),
                      QString());
    }
    return validateOnline(ValidationMode::Background, *snapshot);
}

LicenseOutcome LicenseValidator::validateManual()
{
    const std::optional<LicenseRecord> current = m_store->load();
    if (!current) {
        return finish(LicenseOutcome::failure(ValidationMode::Manual, LicenseErrorKind::NotActivated,
                                              QStringLiteral("License not activated.")),
                      QString());
    }

    const QDate day = today();
    const int limit = m_settings.manualVerificationLimit;
    bool limited = false;
    std::optional<LicenseRecord> snapshot;
    QString storageError;
    const bool written = m_store->update(
        [&](std::optional<LicenseRecord>& record) {
            if (!record)
                return false;
            if (record->manualVerificationDay != day) {
                record->manualVerificationDay = day;
                record->manualVerificationCount = 0;
            }
            if (record->manualVerificationCount >= limit) {
                limited = true;
                return false;
            }
            ++record->manualVerificationCount;
            return true;
        },
        &snapshot, &storageError);

    if (!snapshot) {
        return finish(LicenseOutcome::failure(ValidationMode::Manual, LicenseErrorKind::NotActivated,
                                              QStringLiteral("License not activated.")),
                      QString());
    }
    if (limited) {
        qCInfo(lcLicenseValidator) << "Manual verification limit reached for" << maskLicenseKey(snapshot->key);
        LicenseOutcome outcome = LicenseOutcome::failure(
            ValidationMode::Manual, LicenseErrorKind::RateLimited,
            QStringLiteral("Manual verification limit reached (%1 per day). Try again tomorrow.").arg(limit),
            snapshot);
        outcome.state = lastKnownState(snapshot);
        return finish(outcome, snapshot->key);
    }
    if (!written)
        qCWarning(lcLicenseValidator) << "Manual verification counter not saved:" << storageError;

    return validateOnline(ValidationMode::Manual, *snapshot);
}

LicenseOutcome LicenseValidator::requestTransfer(const QString& licenseKey, const QString& email)
{
    LicenseOutcome outcome = m_transfers->requestTransfer(licenseKey, email);
    if (outcome.ok()) {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_lastState = outcome.state;
    }
    return outcome;
}

LicenseOutcome LicenseValidator::validateOnline(ValidationMode mode, const LicenseRecord& snapshot)
{
    const QString key = snapshot.key;
    const HardwareFingerprint probe = m_fingerprinter->probe();

    // A state file copied to another machine must not earn offline grace.
    if (!snapshot.hardwareBindings.isEmpty()
        && !HardwareFingerprinter::matches(probe, snapshot.hardwareBindings, m_settings.hardwareMatchThreshold)) {
        const QStringList changes = HardwareFingerprinter::describeMismatch(probe, snapshot.hardwareBindings);
        return finish(LicenseOutcome::failure(mode, LicenseErrorKind::HardwareMismatch,
                                              QStringLiteral("Hardware mismatch (%1). Request a transfer to use the "
                                                             "license on this device.")
                                                  .arg(changes.join(QStringLiteral(", "))),
                                              snapshot),
                      key);
    }

    const RegistryFetchResult fetched = m_registry->fetch(key);
    if (fetched.kind == RegistryFetchResult::Kind::NetworkError)
        return offlineFallback(mode, snapshot, fetched.errorMessage);
    if (!fetched.found()) {
        return finish(LicenseOutcome::failure(mode, LicenseErrorKind::NotFound,
                                              QStringLiteral("License key not found in the registry. Contact %1.")
                                                  .arg(m_settings.supportEmail),
                                              snapshot),
                      key);
    }

    const RegistryRecord& remote = *fetched.record;
    if (remote.status == LicenseStatus::Revoked)
        return markRevoked(mode, key, remote);
    if (remote.status == LicenseStatus::Expired || remote.isExpiredOn(today()))
        return markExpired(mode, key, remote);
    if (remote.status != LicenseStatus::Active) {
        // Suspended or unknown registry state; keep the local record and its grace window as they are.
        return finish(LicenseOutcome::failure(mode, LicenseErrorKind::NotActive,
                                              QStringLiteral("The registry reports this license as %1. Contact %2.")
                                                  .arg(statusToString(remote.status), m_settings.supportEmail),
                                              snapshot),
                      key);
    }

    bool repostBinding = !remote.hasBindings();
    if (remote.hasBindings()
        && !HardwareFingerprinter::matches(probe, remote.bindings, m_settings.hardwareMatchThreshold)) {
        if (remote.transferCount > snapshot.transferCount) {
            return finish(LicenseOutcome::failure(mode, LicenseErrorKind::HardwareMismatch,
                                                  QStringLiteral("This license was transferred to another device. "
                                                                 "Request a transfer to use it here."),
                                                  snapshot),
                          key);
        }
        // Registry still shows the binding from before our last transfer.
        qCInfo(lcLicenseValidator) << "Registry binding for" << maskLicenseKey(key) << "is stale, re-posting";
        repostBinding = true;
    }

    const QDateTime timestamp = now();
    std::optional<LicenseRecord> stored;
    QString storageError;
    bool keyChanged = false;
    const bool written = m_store->update(
        [&](std::optional<LicenseRecord>& record) {
            if (!record || record->key != key) {
                keyChanged = true;
                return false;
            }
            record->status = LicenseStatus::Active;
            record->tier = remote.tier;
            record->expiryDate = remote.expiryDate;
            record->transferCount = qMax(record->transferCount, remote.transferCount);
            if (record->licenseeName.isEmpty())
                record->licenseeName = remote.licenseeName;
            if (!remote.licenseeEmail.isEmpty())
                record->licenseeEmail = remote.licenseeEmail;
            record->lastVerifiedAt = timestamp;
            record->offlineGraceUntil = timestamp.addDays(m_settings.offlineGraceDays);
            return true;
        },
        &stored, &storageError);

    if (keyChanged) {
        qCInfo(lcLicenseValidator) << "License record replaced during validation, result discarded";
        const std::optional<LicenseRecord> current = m_store->load();
        LicenseOutcome outcome = LicenseOutcome::success(mode, lastKnownState(current),
                                                         QStringLiteral("License changed during validation."),
                                                         current);
        return outcome;
    }

    LicenseOutcome outcome = LicenseOutcome::success(mode, LicenseState::Active,
                                                     QStringLiteral("License validated."),
                                                     stored ? stored : std::optional<LicenseRecord>(snapshot));
    if (!written) {
        qCCritical(lcLicenseValidator) << "Validated license could not be saved:" << storageError;
        outcome.warning = QStringLiteral("License validated, but the local state could not be saved: %1")
                              .arg(storageError);
    } else {
        m_store->recordSeen(timestamp);
        outcome.warning = expiryWarning(*stored);
        if (repostBinding)
            postBinding(*stored, QStringLiteral("REBIND"));
    }
    return finish(outcome, key);
}

LicenseOutcome LicenseValidator::recoverFromRegistry()
{
    const ValidationMode mode = ValidationMode::Startup;
    if (m_store->isCorrupt())
        qCWarning(lcLicenseValidator) << "Local license state is unreadable, attempting recovery from registry";

    const RegistryListResult listing = m_registry->fetchAll();
    if (!listing.ok) {
        qCInfo(lcLicenseValidator) << "Auto recovery unavailable:" << listing.errorMessage;
        return finish(LicenseOutcome::failure(mode, LicenseErrorKind::NotActivated,
                                              QStringLiteral("License not activated. Enter your license key to "
                                                             "activate.")),
                      QString());
    }

    const HardwareFingerprint probe = m_fingerprinter->probe();
    const QDate day = today();
    std::optional<RegistryRecord> active;
    std::optional<RegistryRecord> revoked;
    std::optional<RegistryRecord> expired;
    int bestMatch = 0;
    for (const RegistryRecord& row : listing.records) {
        if (!row.hasBindings())
            continue;
        const int matchCount = probe.matchCount(row.bindings);
        if (matchCount < m_settings.hardwareMatchThreshold)
            continue;
        if (row.status == LicenseStatus::Revoked) {
            if (!revoked)
                revoked = row;
        } else if (row.status == LicenseStatus::Expired || row.isExpiredOn(day)) {
            if (!expired)
                expired = row;
        } else if (row.status == LicenseStatus::Active && matchCount > bestMatch) {
            active = row;
            bestMatch = matchCount;
        }
    }

    if (!active) {
        if (revoked) {
            audit(AuditEventType::RevokedDetected, revoked->key,
                  QStringLiteral("Revoked license matches this device during recovery"));
            return finish(LicenseOutcome::failure(mode, LicenseErrorKind::Revoked,
                                                  QStringLiteral("The license for this device has been revoked. "
                                                                 "Contact %1.")
                                                      .arg(m_settings.supportEmail)),
                          revoked->key);
        }
        if (expired) {
            return finish(LicenseOutcome::failure(mode, LicenseErrorKind::Expired,
                                                  QStringLiteral("The license for this device has expired. "
                                                                 "Renew it at %1.")
                                                      .arg(m_settings.supportEmail)),
                          expired->key);
        }
        return finish(LicenseOutcome::failure(mode, LicenseErrorKind::NotActivated,
                                              QStringLiteral("License not activated. Enter your license key to "
                                                             "activate.")),
                      QString());
    }

    const RegistryRecord remote = *active;
    const QDateTime timestamp = now();
    std::optional<LicenseRecord> stored;
    QString storageError;
    const bool written = m_store->update(
        [&](std::optional<LicenseRecord>& record) {
            if (record)
                return false;
            LicenseRecord next;
            next.key = remote.key;
            next.status = LicenseStatus::Active;
            next.tier = remote.tier;
            next.expiryDate = remote.expiryDate;
            next.hardwareBindings = remote.bindings;
            next.licenseeName = remote.licenseeName;
            next.licenseeEmail = remote.licenseeEmail;
            next.transferCount = remote.transferCount;
            next.activatedAt = timestamp;
            next.lastVerifiedAt = timestamp;
            next.offlineGraceUntil = timestamp.addDays(m_settings.offlineGraceDays);
            record = next;
            return true;
        },
        &stored, &storageError);
    if (!written || !stored) {
        qCCritical(lcLicenseValidator) << "Recovered license could not be saved:" << storageError;
        return finish(LicenseOutcome::failure(mode, LicenseErrorKind::Storage,
                                              QStringLiteral("The license could not be saved on this device: %1")
                                                  .arg(storageError)),
                      remote.key);
    }

    m_store->recordSeen(timestamp);
    audit(AuditEventType::Activate, remote.key,
          QStringLiteral("auto-recovered (%1/3 hardware components matched)").arg(bestMatch));
    qCInfo(lcLicenseValidator) << "License" << maskLicenseKey(remote.key) << "auto-recovered from registry";

    LicenseOutcome outcome = LicenseOutcome::success(mode, LicenseState::Active,
                                                     QStringLiteral("License restored for this device."), stored);
    outcome.warning = expiryWarning(*stored);
    return finish(outcome, remote.key);
}

LicenseOutcome LicenseValidator::offlineFallback(ValidationMode mode, const LicenseRecord& snapshot,
                                                 const QString& networkError)
{
    const QString key = snapshot.key;
    const QDateTime timestamp = now();
    qCInfo(lcLicenseValidator) << "Registry unreachable, evaluating offline grace:" << networkError;

    if (snapshot.status == LicenseStatus::Revoked) {
        return finish(LicenseOutcome::failure(mode, LicenseErrorKind::Revoked,
                                              QStringLiteral("This license has been revoked. Contact %1.")
                                                  .arg(m_settings.supportEmail),
                                              snapshot),
                      key);
    }
    if (snapshot.status == LicenseStatus::Expired || snapshot.isExpiredOn(today())) {
        return finish(LicenseOutcome::failure(mode, LicenseErrorKind::Expired,
                                              QStringLiteral("This license has expired. Renew it at %1.")
                                                  .arg(m_settings.supportEmail),
                                              snapshot),
                      key);
    }

    QDateTime reference = m_store->lastSeen();
    if (snapshot.lastVerifiedAt.isValid() && (!reference.isValid() || snapshot.lastVerifiedAt > reference))
        reference = snapshot.lastVerifiedAt;
    if (reference.isValid() && timestamp.secsTo(reference) > m_settings.clockSkewToleranceSeconds) {
        qCWarning(lcLicenseValidator) << "System clock is behind the last observed time" << reference;
        return finish(LicenseOutcome::failure(mode, LicenseErrorKind::ClockTampered,
                                              QStringLiteral("The system clock appears to have been set back. "
                                                             "Correct the date and connect to the internet."),
                                              snapshot),
                      key);
    }

    if (snapshot.offlineGraceUntil && timestamp <= *snapshot.offlineGraceUntil) {
        m_store->recordSeen(timestamp);
        const qint64 secondsLeft = timestamp.secsTo(*snapshot.offlineGraceUntil);
        const qint64 daysLeft = (secondsLeft + 86399) / 86400;
        LicenseOutcome outcome = LicenseOutcome::success(
            mode, LicenseState::OfflineGrace,
            QStringLiteral("Offline grace active: %1 day(s) remaining.").arg(daysLeft), snapshot);
        outcome.warning = QStringLiteral("Offline grace active until %1. Connect to the internet to re-validate.")
                              .arg(snapshot.offlineGraceUntil->toLocalTime().toString(Qt::ISODate));
        return finish(outcome, key);
    }

    return finish(LicenseOutcome::failure(mode, LicenseErrorKind::OfflineExpired,
                                          QStringLiteral("The offline grace period has ended. Connect to the "
                                                         "internet to re-validate the license."),
                                          snapshot),
                  key);
}

LicenseOutcome LicenseValidator::markRevoked(ValidationMode mode, const QString& key, const RegistryRecord& remote)
{
    std::optional<LicenseRecord> stored;
    QString storageError;
    bool newlyRevoked = false;
    const bool written = m_store->update(
        [&](std::optional<LicenseRecord>& record) {
            if (!record || record->key != key || record->status == LicenseStatus::Revoked)
                return false;
            newlyRevoked = true;
            record->status = LicenseStatus::Revoked;
            record->lastVerifiedAt = now();
            record->offlineGraceUntil.reset();
            return true;
        },
        &stored, &storageError);
    if (!written)
        qCCritical(lcLicenseValidator) << "Revocation could not be recorded locally:" << storageError;

    if (newlyRevoked) {
        audit(AuditEventType::RevokedDetected, key,
              remote.notes.isEmpty() ? QStringLiteral("revoked in registry")
                                     : QStringLiteral("revoked in registry: %1").arg(remote.notes));
    }
    qCWarning(lcLicenseValidator) << "License" << maskLicenseKey(key) << "is revoked";

    return finish(LicenseOutcome::failure(mode, LicenseErrorKind::Revoked,
                                          QStringLiteral("This license has been revoked. Contact %1.")
                                              .arg(m_settings.supportEmail),
                                          stored),
                  key);
}

LicenseOutcome LicenseValidator::markExpired(ValidationMode mode, const QString& key, const RegistryRecord& remote)
{
    std::optional<LicenseRecord> stored;
    QString storageError;
    const bool written = m_store->update(
        [&](std::optional<LicenseRecord>& record) {
            if (!record || record->key != key)
                return false;
            if (record->status == LicenseStatus::Expired && record->expiryDate == remote.expiryDate)
                return false;
            record->status = LicenseStatus::Expired;
            if (remote.expiryDate.isValid())
                record->expiryDate = remote.expiryDate;
            record->lastVerifiedAt = now();
            return true;
        },
        &stored, &storageError);
    if (!written)
        qCCritical(lcLicenseValidator) << "Expiry could not be recorded locally:" << storageError;

    const QString when = remote.expiryDate.isValid()
        ? QStringLiteral(" on %1").arg(remote.expiryDate.toString(Qt::ISODate))
        : QString();
    return finish(LicenseOutcome::failure(mode, LicenseErrorKind::Expired,
                                          QStringLiteral("This license expired%1. Renew it at %2.")
                                              .arg(when, m_settings.supportEmail),
                                          stored),
                  key);
}

LicenseOutcome LicenseValidator::finish(LicenseOutcome outcome, const QString& key)
{
    const QString modeName = validationModeToString(outcome.mode);
    if (outcome.mode != ValidationMode::Activation) {
        if (outcome.ok()) {
            audit(AuditEventType::ValidateOk, key, QStringLiteral("%1: %2").arg(modeName, outcome.message));
        } else {
            audit(AuditEventType::ValidateFail, key,
                  QStringLiteral("%1: %2 (%3)").arg(modeName, errorKindToString(outcome.error), outcome.message));
        }
    } else if (!outcome.ok()) {
        audit(AuditEventType::ValidateFail, key,
              QStringLiteral("activation: %1 (%2)").arg(errorKindToString(outcome.error), outcome.message));
    }

    switch (outcome.error) {
    case LicenseErrorKind::RateLimited:
    case LicenseErrorKind::InvalidInput:
    case LicenseErrorKind::TransferLimitExceeded:
    case LicenseErrorKind::EmailVerificationFailed:
        break;
    case LicenseErrorKind::Network:
    case LicenseErrorKind::NotFound:
    case LicenseErrorKind::AlreadyRevoked:
    case LicenseErrorKind::Expired:
    case LicenseErrorKind::NotActive:
    case LicenseErrorKind::HardwareMismatch:
    case LicenseErrorKind::Storage:
        // A refused activation does not change the license already on this device.
        if (outcome.mode == ValidationMode::Activation)
            break;
        [[fallthrough]];
    default: {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_lastState = outcome.state;
        break;
    }
    }

    if (outcome.ok()) {
        qCInfo(lcLicenseValidator) << modeName << "validation" << licenseStateToString(outcome.state)
                                   << maskLicenseKey(key);
    } else {
        qCWarning(lcLicenseValidator) << modeName << "validation failed" << errorKindToString(outcome.error)
                                      << maskLicenseKey(key) << outcome.message;
    }
    return outcome;
}

void LicenseValidator::audit(AuditEventType type, const QString& key, const QString& details)
{
    AuditEvent event;
    event.eventType = type;
    event.timestamp = now();
    event.licenseKey = key;
    event.details = details;
    if (!m_store->appendAudit(event))
        qCWarning(lcLicenseValidator) << "Audit event" << auditEventTypeToString(type) << "not recorded";
}

void LicenseValidator::postBinding(const LicenseRecord& record, const QString& eventType)
{
    RegistryUpdate update;
    update.licenseKey = record.key;
    update.status = record.status;
    update.bindings = record.hardwareBindings;
    update.licenseeName = record.licenseeName;
    update.licenseeEmail = record.licenseeEmail;
    update.tier = record.tier;
    update.isTransfer = false;
    update.transferCount = record.transferCount;
    update.eventType = eventType;
    m_registry->post(update);
}

QString LicenseValidator::expiryWarning(const LicenseRecord& record) const
{
    if (!record.expiryDate.isValid())
        return {};
    const qint64 days = today().daysTo(record.expiryDate);
    if (days < 0 || days > m_settings.expiryWarningDays)
        return {};
    if (days == 0)
        return QStringLiteral("The license expires today. Renew it at %1.").arg(m_settings.supportEmail);
    return QStringLiteral("The license expires in %1 day(s). Renew it at %2.").arg(days).arg(m_settings.supportEmail);
}

LicenseState LicenseValidator::lastKnownState(const std::optional<LicenseRecord>& record) const
{
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (m_lastState)
            return *m_lastState;
    }
    if (!record)
        return LicenseState::Unactivated;
    return stateFromStatus(record->status);
}

LicenseStatusSummary LicenseValidator::getStatus() const
{
    LicenseStatusSummary summary;
    summary.maxTransfers = m_settings.maxTransfers;
    const std::optional<LicenseRecord> record = m_store->load();
    if (!record) {
        summary.state = LicenseState::Unactivated;
        summary.statusText = QStringLiteral("Not activated");
        summary.manualVerificationsRemaining = 0;
        return summary;
    }

    const QDate day = today();
    summary.activated = true;
    summary.state = lastKnownState(record);
    summary.licenseKeyMasked = maskLicenseKey(record->key);
    summary.tier = record->tier;
    summary.transferCount = record->transferCount;
    summary.lastVerifiedAt = record->lastVerifiedAt;
    summary.offlineGraceUntil = record->offlineGraceUntil;
    if (record->expiryDate.isValid())
        summary.daysToExpiry = static_cast<int>(day.daysTo(record->expiryDate));
    const int usedToday = record->manualVerificationDay == day ? record->manualVerificationCount : 0;
    summary.manualVerificationsRemaining = qMax(0, m_settings.manualVerificationLimit - usedToday);

    QString text;
    switch (summary.state) {
    case LicenseState::Active:
        text = QStringLiteral("License active");
        break;
    case LicenseState::OfflineGrace:
        text = QStringLiteral("License active (offline grace)");
        break;
    case LicenseState::Revoked:
        text = QStringLiteral("License revoked");
        break;
    case LicenseState::Expired:
        text = QStringLiteral("License expired");
        break;
    case LicenseState::Rejected:
        text = QStringLiteral("License not valid on this device");
        break;
    case LicenseState::Activating:
        text = QStringLiteral("Activating");
        break;
    case LicenseState::Unactivated:
        text = QStringLiteral("Not activated");
        break;
    }
    text += QStringLiteral(" (%1)").arg(tierToString(record->tier));
    if (summary.daysToExpiry) {
        if (*summary.daysToExpiry >= 0)
            text += QStringLiteral(", expires %1 (%2 days)")
                        .arg(record->expiryDate.toString(Qt::ISODate))
                        .arg(*summary.daysToExpiry);
        else
            text += QStringLiteral(", expired %1").arg(record->expiryDate.toString(Qt::ISODate));
    }
    text += QStringLiteral(", transfers %1/%2").arg(record->transferCount).arg(m_settings.maxTransfers);
    summary.statusText = text;
    return summary;
}

LicenseTier LicenseValidator::currentTier() const
{
    const std::optional<LicenseRecord> record = m_store->load();
    return record ? record->tier : LicenseTier::Standard;
}

int LicenseValidator::backgroundIntervalSeconds() const
{
    return m_settings.checkIntervalSeconds(currentTier());
}

} // namespace wb::license
