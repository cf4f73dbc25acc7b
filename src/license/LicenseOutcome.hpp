#pragma once

#include <QDate>
#include <QDateTime>
#include <QMetaType>
#include <QString>

#include <optional>

#include "license/LicenseTypes.hpp"

namespace wb::license {

enum class LicenseState {
    Unactivated,
    Activating,
    Active,
    OfflineGrace,
    Rejected,
    Revoked,
    Expired,
};

enum class LicenseErrorKind {
    None,
    Network,
    NotFound,
    Revoked,
    AlreadyRevoked,
    Expired,
    OfflineExpired,
    ClockTampered,
    NotActive,
    HardwareMismatch,
    TransferLimitExceeded,
    EmailVerificationFailed,
    RateLimited,
    NotActivated,
    InvalidInput,
    Storage,
};

QString licenseStateToString(LicenseState state);
QString errorKindToString(LicenseErrorKind kind);

//! Terminal kinds block usage regardless of any grace period.
bool isTerminalError(LicenseErrorKind kind);

enum class ValidationMode {
    Activation,
    Startup,
    Background,
    Manual,
    Transfer,
};

QString validationModeToString(ValidationMode mode);

//! Typed result handed back to the shell. Never thrown.
struct LicenseOutcome {
    LicenseState state = LicenseState::Unactivated;
    LicenseErrorKind error = LicenseErrorKind::None;
    ValidationMode mode = ValidationMode::Startup;
    QString message;
    QString warning;
    bool blocking = false;
    std::optional<LicenseRecord> record;

    bool ok() const { return error == LicenseErrorKind::None; }
    bool usable() const { return state == LicenseState::Active || state == LicenseState::OfflineGrace; }

    static LicenseOutcome success(ValidationMode mode, LicenseState state, const QString& message,
                                  const std::optional<LicenseRecord>& record = std::nullopt);
    static LicenseOutcome failure(ValidationMode mode, LicenseErrorKind error, const QString& message,
                                  const std::optional<LicenseRecord>& record = std::nullopt);
};

//! What the shell displays next to the license badge.
struct LicenseStatusSummary {
    bool activated = false;
    LicenseState state = LicenseState::Unactivated;
    QString statusText;
    QString licenseKeyMasked;
    LicenseTier tier = LicenseTier::Standard;
    std::optional<int> daysToExpiry;
    int transferCount = 0;
    int maxTransfers = 0;
    QDateTime lastVerifiedAt;
    std::optional<QDateTime> offlineGraceUntil;
    int manualVerificationsRemaining = 0;
};

} // namespace wb::license

Q_DECLARE_METATYPE(wb::license::LicenseOutcome)
