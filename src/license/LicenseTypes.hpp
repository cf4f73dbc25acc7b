#pragma once

#include <QDate>
#include <QDateTime>
#include <QJsonObject>
#include <QMetaType>
#include <QString>

#include <optional>

namespace wb::license {

enum class LicenseStatus {
    Pending,
    Active,
    Revoked,
    Expired,
};

enum class LicenseTier {
    Trial,
    Standard,
    Premium,
};

QString statusToString(LicenseStatus status);
LicenseStatus statusFromString(const QString& text, LicenseStatus fallback = LicenseStatus::Pending);

QString tierToString(LicenseTier tier);
LicenseTier tierFromString(const QString& text, LicenseTier fallback = LicenseTier::Standard);

//! Ordered triple of SHA-256 hex digests: network adapter, CPU, board.
struct HardwareFingerprint {
    QString network;
    QString cpu;
    QString board;

    bool isEmpty() const { return network.isEmpty() && cpu.isEmpty() && board.isEmpty(); }
    bool isComplete() const { return !network.isEmpty() && !cpu.isEmpty() && !board.isEmpty(); }

    //! Number of components present on both sides and equal.
    int matchCount(const HardwareFingerprint& other) const;

    //! First characters of each component, for logs and alert emails.
    QString shortForm(int length = 8) const;

    QJsonObject toJson() const;
    static HardwareFingerprint fromJson(const QJsonObject& object);

    bool operator==(const HardwareFingerprint& other) const
    {
        return network == other.network && cpu == other.cpu && board == other.board;
    }
    bool operator!=(const HardwareFingerprint& other) const { return !(*this == other); }
};

struct LicenseRecord {
    QString key;
    LicenseStatus status = LicenseStatus::Pending;
    LicenseTier tier = LicenseTier::Standard;
    HardwareFingerprint hardwareBindings;
    QString licenseeName;
    QString licenseeEmail;
    QDate expiryDate; // invalid = perpetual
    int transferCount = 0;
    QDateTime activatedAt;
    QDateTime lastVerifiedAt;
    std::optional<QDateTime> offlineGraceUntil;
    std::optional<QDateTime> lastTransferAt;

    int manualVerificationCount = 0;
    QDate manualVerificationDay;

    bool isExpiredOn(const QDate& day) const { return expiryDate.isValid() && expiryDate < day; }

    QJsonObject toJson() const;
    static std::optional<LicenseRecord> fromJson(const QJsonObject& object, QString* errorMessage = nullptr);
};

enum class AuditEventType {
    Activate,
    ValidateOk,
    ValidateFail,
    TransferRequested,
    TransferApproved,
    TransferDenied,
    RevokedDetected,
};

QString auditEventTypeToString(AuditEventType type);
std::optional<AuditEventType> auditEventTypeFromString(const QString& text);

struct AuditEvent {
    AuditEventType eventType = AuditEventType::ValidateOk;
    QDateTime timestamp;
    QString licenseKey;
    std::optional<QString> sourceAddress;
    QString details;

    QJsonObject toJson() const;
    static std::optional<AuditEvent> fromJson(const QJsonObject& object);
};

//! Keeps the first and last four characters of a license key for logs.
QString maskLicenseKey(const QString& key);

//! Trimmed, case-insensitive comparison used for registered email checks.
bool sameEmail(const QString& left, const QString& right);

} // namespace wb::license

Q_DECLARE_METATYPE(wb::license::LicenseRecord)
Q_DECLARE_METATYPE(wb::license::AuditEvent)
