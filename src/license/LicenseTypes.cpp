#include "LicenseTypes.hpp"

#include <QJsonValue>

namespace wb::license {

namespace {

QString isoOrEmpty(const QDateTime& value)
{
    if (!value.isValid())
        return {};
    return value.toUTC().toString(Qt::ISODateWithMs);
}

QDateTime parseIso(const QJsonValue& value)
{
    const QString text = value.toString().trimmed();
    if (text.isEmpty())
        return {};
    QDateTime parsed = QDateTime::fromString(text, Qt::ISODateWithMs);
    if (!parsed.isValid())
        parsed = QDateTime::fromString(text, Qt::ISODate);
    if (!parsed.isValid())
        return {};
    return parsed.toUTC();
}

std::optional<QDateTime> parseOptionalIso(const QJsonValue& value)
{
    const QDateTime parsed = parseIso(value);
    if (!parsed.isValid())
        return std::nullopt;
    return parsed;
}

} // namespace

QString statusToString(LicenseStatus status)
{
    switch (status) {
    case LicenseStatus::Pending:
        return QStringLiteral("pending");
    case LicenseStatus::Active:
        return QStringLiteral("active");
    case LicenseStatus::Revoked:
        return QStringLiteral("revoked");
    case LicenseStatus::Expired:
        return QStringLiteral("expired");
    }
    return QStringLiteral("pending");
}

LicenseStatus statusFromString(const QString& text, LicenseStatus fallback)
{
    const QString normalized = text.trimmed().toLower();
    if (normalized == QLatin1String("active"))
        return LicenseStatus::Active;
    if (normalized == QLatin1String("revoked"))
        return LicenseStatus::Revoked;
    if (normalized == QLatin1String("expired"))
        return LicenseStatus::Expired;
    if (normalized == QLatin1String("pending"))
        return LicenseStatus::Pending;
    return fallback;
}

QString tierToString(LicenseTier tier)
{
    switch (tier) {
    case LicenseTier::Trial:
        return QStringLiteral("trial");
    case LicenseTier::Standard:
        return QStringLiteral("standard");
    case LicenseTier::Premium:
        return QStringLiteral("premium");
    }
    return QStringLiteral("standard");
}

LicenseTier tierFromString(const QString& text, LicenseTier fallback)
{
    const QString normalized = text.trimmed().toLower();
    if (normalized == QLatin1String("trial"))
        return LicenseTier::Trial;
    if (normalized == QLatin1String("standard"))
        return LicenseTier::Standard;
    if (normalized == QLatin1String("premium"))
        return LicenseTier::Premium;
    return fallback;
}

int HardwareFingerprint::matchCount(const HardwareFingerprint& other) const
{
    int count = 0;
    if (!network.isEmpty() && network == other.network)
        ++count;
    if (!cpu.isEmpty() && cpu == other.cpu)
        ++count;
    if (!board.isEmpty() && board == other.board)
        ++count;
    return count;
}

QString HardwareFingerprint::shortForm(int length) const
{
    const auto part = [length](const QString& value) {
        return value.isEmpty() ? QStringLiteral("-") : value.left(length);
    };
    return QStringLiteral("%1/%2/%3").arg(part(network), part(cpu), part(board));
}

QJsonObject HardwareFingerprint::toJson() const
{
    return QJsonObject{
        {QStringLiteral("network"), network},
        {QStringLiteral("cpu"), cpu},
        {QStringLiteral("board"), board},
    };
}

HardwareFingerprint HardwareFingerprint::fromJson(const QJsonObject& object)
{
    HardwareFingerprint fingerprint;
    fingerprint.network = object.value(QStringLiteral("network")).toString().trimmed().toLower();
    fingerprint.cpu = object.value(QStringLiteral("cpu")).toString().trimmed().toLower();
    fingerprint.board = object.value(QStringLiteral("board")).toString().trimmed().toLower();
    return fingerprint;
}

QJsonObject LicenseRecord::toJson() const
{
    QJsonObject object{
        {QStringLiteral("key"), key},
        {QStringLiteral("status"), statusToString(status)},
        {QStringLiteral("tier"), tierToString(tier)},
        {QStringLiteral("hardwareBindings"), hardwareBindings.toJson()},
        {QStringLiteral("licenseeName"), licenseeName},
        {QStringLiteral("licenseeEmail"), licenseeEmail},
        {QStringLiteral("transferCount"), transferCount},
        {QStringLiteral("activatedAt"), isoOrEmpty(activatedAt)},
        {QStringLiteral("lastVerifiedAt"), isoOrEmpty(lastVerifiedAt)},
        {QStringLiteral("manualVerificationCount"), manualVerificationCount},
    };
    if (expiryDate.isValid())
        object.insert(QStringLiteral("expiryDate"), expiryDate.toString(Qt::ISODate));
    if (offlineGraceUntil)
        object.insert(QStringLiteral("offlineGraceUntil"), isoOrEmpty(*offlineGraceUntil));
    if (lastTransferAt)
        object.insert(QStringLiteral("lastTransferAt"), isoOrEmpty(*lastTransferAt));
    if (manualVerificationDay.isValid())
        object.insert(QStringLiteral("manualVerificationDay"), manualVerificationDay.toString(Qt::ISODate));
    return object;
}

std::optional<LicenseRecord> LicenseRecord::fromJson(const QJsonObject& object, QString* errorMessage)
{
    LicenseRecord record;
    record.key = object.value(QStringLiteral("key")).toString().trimmed();
    if (record.key.isEmpty()) {
        if (errorMessage)
            *errorMessage = QStringLiteral("license record has no key");
        return std::nullopt;
    }

    record.status = statusFromString(object.value(QStringLiteral("status")).toString());
    record.tier = tierFromString(object.value(QStringLiteral("tier")).toString());
    record.hardwareBindings = HardwareFingerprint::fromJson(object.value(QStringLiteral("hardwareBindings")).toObject());
    record.licenseeName = object.value(QStringLiteral("licenseeName")).toString();
    record.licenseeEmail = object.value(QStringLiteral("licenseeEmail")).toString();
    record.transferCount = qMax(0, object.value(QStringLiteral("transferCount")).toInt());
    record.activatedAt = parseIso(object.value(QStringLiteral("activatedAt")));
    record.lastVerifiedAt = parseIso(object.value(QStringLiteral("lastVerifiedAt")));
    record.offlineGraceUntil = parseOptionalIso(object.value(QStringLiteral("offlineGraceUntil")));
    record.lastTransferAt = parseOptionalIso(object.value(QStringLiteral("lastTransferAt")));
    record.manualVerificationCount = qMax(0, object.value(QStringLiteral("manualVerificationCount")).toInt());

    const QString expiry = object.value(QStringLiteral("expiryDate")).toString().trimmed();
    if (!expiry.isEmpty()) {
        record.expiryDate = QDate::fromString(expiry, Qt::ISODate);
        if (!record.expiryDate.isValid()) {
            if (errorMessage)
                *errorMessage = QStringLiteral("invalid expiry date: %1").arg(expiry);
            return std::nullopt;
        }
    }
    const QString manualDay = object.value(QStringLiteral("manualVerificationDay")).toString().trimmed();
    if (!manualDay.isEmpty())
        record.manualVerificationDay = QDate::fromString(manualDay, Qt::ISODate);

    return record;
}

QString auditEventTypeToString(AuditEventType type)
{
    switch (type) {
    case AuditEventType::Activate:
        return QStringLiteral("ACTIVATE");
    case AuditEventType::ValidateOk:
        return QStringLiteral("VALIDATE_OK");
    case AuditEventType::ValidateFail:
        return QStringLiteral("VALIDATE_FAIL");
    case AuditEventType::TransferRequested:
        return QStringLiteral("TRANSFER_REQUESTED");
    case AuditEventType::TransferApproved:
        return QStringLiteral("TRANSFER_APPROVED");
    case AuditEventType::TransferDenied:
        return QStringLiteral("TRANSFER_DENIED");
    case AuditEventType::RevokedDetected:
        return QStringLiteral("REVOKED_DETECTED");
    }
    return {};
}

std::optional<AuditEventType> auditEventTypeFromString(const QString& text)
{
    const QString normalized = text.trimmed().toUpper();
    for (const auto type : {AuditEventType::Activate, AuditEventType::ValidateOk, AuditEventType::ValidateFail,
                            AuditEventType::TransferRequested, AuditEventType::TransferApproved,
                            AuditEventType::TransferDenied, AuditEventType::RevokedDetected}) {
        if (auditEventTypeToString(type) == normalized)
            return type;
    }
    return std::nullopt;
}

QJsonObject AuditEvent::toJson() const
{
    QJsonObject object{
        {QStringLiteral("eventType"), auditEventTypeToString(eventType)},
        {QStringLiteral("timestamp"), isoOrEmpty(timestamp)},
        {QStringLiteral("licenseKey"), licenseKey},
        {QStringLiteral("details"), details},
    };
    if (sourceAddress && !sourceAddress->isEmpty())
        object.insert(QStringLiteral("sourceIP"), *sourceAddress);
    return object;
}

std::optional<AuditEvent> AuditEvent::fromJson(const QJsonObject& object)
{
    const auto type = auditEventTypeFromString(object.value(QStringLiteral("eventType")).toString());
    if (!type)
        return std::nullopt;

    AuditEvent event;
    event.eventType = *type;
    event.timestamp = parseIso(object.value(QStringLiteral("timestamp")));
    event.licenseKey = object.value(QStringLiteral("licenseKey")).toString();
    event.details = object.value(QStringLiteral("details")).toString();
    const QString source = object.value(QStringLiteral("sourceIP")).toString();
    if (!source.isEmpty())
        event.sourceAddress = source;
    return event;
}

QString maskLicenseKey(const QString& key)
{
    const QString trimmed = key.trimmed();
    if (trimmed.size() <= 8)
        return QString(trimmed.size(), QLatin1Char('*'));
    return trimmed.left(4) + QStringLiteral("...") + trimmed.right(4);
}

bool sameEmail(const QString& left, const QString& right)
{
    const QString a = left.trimmed();
    const QString b = right.trimmed();
    if (a.isEmpty() || b.isEmpty())
        return false;
    return a.compare(b, Qt::CaseInsensitive) == 0;
}

} // namespace wb::license
