#include "LicenseOutcome.hpp"

namespace wb::license {

QString licenseStateToString(LicenseState state)
{
    switch (state) {
    case LicenseState::Unactivated:
        return QStringLiteral("unactivated");
    case LicenseState::Activating:
        return QStringLiteral("activating");
    case LicenseState::Active:
        return QStringLiteral("active");
    case LicenseState::OfflineGrace:
        return QStringLiteral("offline_grace");
    case LicenseState::Rejected:
        return QStringLiteral("rejected");
    case LicenseState::Revoked:
        return QStringLiteral("revoked");
    case LicenseState::Expired:
        return QStringLiteral("expired");
    }
    return {};
}

QString errorKindToString(LicenseErrorKind kind)
{
    switch (kind) {
    case LicenseErrorKind::None:
        return QStringLiteral("none");
    case LicenseErrorKind::Network:
        return QStringLiteral("network_error");
    case LicenseErrorKind::NotFound:
        return QStringLiteral("not_found");
    case LicenseErrorKind::Revoked:
        return QStringLiteral("revoked");
    case LicenseErrorKind::AlreadyRevoked:
        return QStringLiteral("already_revoked");
    case LicenseErrorKind::Expired:
        return QStringLiteral("expired");
    case LicenseErrorKind::OfflineExpired:
        return QStringLiteral("offline_expired");
    case LicenseErrorKind::ClockTampered:
        return QStringLiteral("clock_tampered");
    case LicenseErrorKind::NotActive:
        return QStringLiteral("not_active");
    case LicenseErrorKind::HardwareMismatch:
        return QStringLiteral("hardware_mismatch");
    case LicenseErrorKind::TransferLimitExceeded:
        return QStringLiteral("transfer_limit_exceeded");
    case LicenseErrorKind::EmailVerificationFailed:
        return QStringLiteral("email_verification_failed");
    case LicenseErrorKind::RateLimited:
        return QStringLiteral("rate_limited");
    case LicenseErrorKind::NotActivated:
        return QStringLiteral("not_activated");
    case LicenseErrorKind::InvalidInput:
        return QStringLiteral("invalid_input");
    case LicenseErrorKind::Storage:
        return QStringLiteral("storage_error");
    }
    return {};
}

bool isTerminalError(LicenseErrorKind kind)
{
    switch (kind) {
    case LicenseErrorKind::NotFound:
    case LicenseErrorKind::Revoked:
    case LicenseErrorKind::AlreadyRevoked:
    case LicenseErrorKind::Expired:
    case LicenseErrorKind::OfflineExpired:
    case LicenseErrorKind::ClockTampered:
    case LicenseErrorKind::NotActive:
        return true;
    default:
        return false;
    }
}

QString validationModeToString(ValidationMode mode)
{
    switch (mode) {
    case ValidationMode::Activation:
        return QStringLiteral("activation");
    case ValidationMode::Startup:
        return QStringLiteral("startup");
    case ValidationMode::Background:
        return QStringLiteral("background");
    case ValidationMode::Manual:
        return QStringLiteral("manual");
    case ValidationMode::Transfer:
        return QStringLiteral("transfer");
    }
    return {};
}

LicenseOutcome LicenseOutcome::success(ValidationMode mode, LicenseState state, const QString& message,
                                       const std::optional<LicenseRecord>& record)
{
    LicenseOutcome outcome;
    outcome.mode = mode;
    outcome.state = state;
    outcome.message = message;
    outcome.record = record;
    return outcome;
}

LicenseOutcome LicenseOutcome::failure(ValidationMode mode, LicenseErrorKind error, const QString& message,
                                       const std::optional<LicenseRecord>& record)
{
    LicenseOutcome outcome;
    outcome.mode = mode;
    outcome.error = error;
    outcome.message = message;
    outcome.record = record;

    switch (error) {
    case LicenseErrorKind::Revoked:
    case LicenseErrorKind::AlreadyRevoked:
        outcome.state = LicenseState::Revoked;
        break;
    case LicenseErrorKind::Expired:
    case LicenseErrorKind::OfflineExpired:
        outcome.state = LicenseState::Expired;
        break;
    case LicenseErrorKind::NotActivated:
        outcome.state = LicenseState::Unactivated;
        break;
    default:
        outcome.state = LicenseState::Rejected;
        break;
    }

    // Only the startup gate may stop the shell; everything later is a passive warning.
    outcome.blocking = mode == ValidationMode::Startup
        && (isTerminalError(error) || error == LicenseErrorKind::HardwareMismatch
            || error == LicenseErrorKind::NotActivated || error == LicenseErrorKind::Storage);
    return outcome;
}

} // namespace wb::license
