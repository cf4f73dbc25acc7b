#include "LocalLicenseStore.hpp"

#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QLoggingCategory>
#include <QSaveFile>

#include "utils/PathUtils.hpp"

Q_LOGGING_CATEGORY(lcLicenseStore, "wb.license.store")

namespace wb::license {

namespace {

constexpr int kSchemaVersion = 1;

} // namespace

LocalLicenseStore::LocalLicenseStore(QString filePath, std::shared_ptr<AuditLog> auditLog)
    : m_filePath(std::move(filePath))
    , m_auditLog(std::move(auditLog))
{
}

std::optional<LicenseRecord> LocalLicenseStore::load() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return readLocked().record;
}

bool LocalLicenseStore::save(const LicenseRecord& record, QString* errorMessage)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    Document document = readLocked();
    if (document.state == DocumentState::Corrupt)
        preserveCorruptLocked();
    document.record = record;
    return writeLocked(document, errorMessage);
}

bool LocalLicenseStore::update(const Mutator& mutator, std::optional<LicenseRecord>* result,
                               QString* errorMessage)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    Document document = readLocked();
    std::optional<LicenseRecord> record = document.record;

    if (!mutator(record)) {
        if (result)
            *result = document.record;
        return true;
    }

    if (!record) {
        // Records are never hard-deleted.
        qCWarning(lcLicenseStore) << "Refusing to drop the stored license record";
        if (result)
            *result = document.record;
        if (errorMessage)
            *errorMessage = QStringLiteral("license record cannot be removed");
        return false;
    }

    if (document.state == DocumentState::Corrupt)
        preserveCorruptLocked();
    const std::optional<LicenseRecord> previous = document.record;
    document.record = record;
    if (!writeLocked(document, errorMessage)) {
        if (result)
            *result = previous;
        return false;
    }
    if (result)
        *result = record;
    return true;
}

bool LocalLicenseStore::appendAudit(const AuditEvent& event)
{
    if (!m_auditLog)
        return false;
    return m_auditLog->append(event);
}

QDateTime LocalLicenseStore::lastSeen() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return readLocked().lastSeen;
}

void LocalLicenseStore::recordSeen(const QDateTime& now)
{
    if (!now.isValid())
        return;

    std::lock_guard<std::mutex> lock(m_mutex);
    Document document = readLocked();
    if (document.state == DocumentState::Corrupt)
        return;
    if (document.lastSeen.isValid() && document.lastSeen >= now)
        return;
    document.lastSeen = now.toUTC();
    QString error;
    if (!writeLocked(document, &error))
        qCWarning(lcLicenseStore) << "Clock guard not updated:" << error;
}

bool LocalLicenseStore::isCorrupt() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return readLocked().state == DocumentState::Corrupt;
}

LocalLicenseStore::Document LocalLicenseStore::readLocked() const
{
    Document document;
    QFile file(m_filePath);
    if (!file.exists())
        return document;
    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(lcLicenseStore) << "Cannot open license state" << m_filePath << file.errorString();
        document.state = DocumentState::Corrupt;
        return document;
    }

    QJsonParseError parseError{};
    const QJsonDocument json = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !json.isObject()) {
        qCWarning(lcLicenseStore) << "License state" << m_filePath << "is corrupt:" << parseError.errorString();
        document.state = DocumentState::Corrupt;
        return document;
    }

    const QJsonObject root = json.object();
    const int schema = root.value(QStringLiteral("schema")).toInt(kSchemaVersion);
    if (schema > kSchemaVersion) {
        qCWarning(lcLicenseStore) << "License state written by a newer version, schema" << schema;
        document.state = DocumentState::Corrupt;
        return document;
    }

    document.state = DocumentState::Valid;
    const QJsonValue licenseValue = root.value(QStringLiteral("license"));
    if (licenseValue.isObject()) {
        QString error;
        document.record = LicenseRecord::fromJson(licenseValue.toObject(), &error);
        if (!document.record) {
            qCWarning(lcLicenseStore) << "Stored license record rejected:" << error;
            document.state = DocumentState::Corrupt;
        }
    }

    const QString lastSeen = root.value(QStringLiteral("clockGuard")).toObject()
                                 .value(QStringLiteral("lastSeen")).toString();
    if (!lastSeen.isEmpty())
        document.lastSeen = QDateTime::fromString(lastSeen, Qt::ISODateWithMs).toUTC();
    return document;
}

bool LocalLicenseStore::writeLocked(const Document& document, QString* errorMessage)
{
    if (!utils::ensureParentDirectory(m_filePath, errorMessage))
        return false;

    QJsonObject root{{QStringLiteral("schema"), kSchemaVersion}};
    if (document.record)
        root.insert(QStringLiteral("license"), document.record->toJson());
    if (document.lastSeen.isValid()) {
        root.insert(QStringLiteral("clockGuard"),
                    QJsonObject{{QStringLiteral("lastSeen"),
                                 document.lastSeen.toUTC().toString(Qt::ISODateWithMs)}});
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        if (errorMessage)
            *errorMessage = QStringLiteral("cannot open %1: %2").arg(m_filePath, file.errorString());
        qCWarning(lcLicenseStore) << "Cannot write license state" << m_filePath << file.errorString();
        return false;
    }
    const QByteArray payload = QJsonDocument(root).toJson(QJsonDocument::Indented);
    if (file.write(payload) != payload.size()) {
        if (errorMessage)
            *errorMessage = QStringLiteral("failed to write %1: %2").arg(m_filePath, file.errorString());
        file.cancelWriting();
        return false;
    }
    if (!file.commit()) {
        if (errorMessage)
            *errorMessage = QStringLiteral("failed to commit %1: %2").arg(m_filePath, file.errorString());
        qCWarning(lcLicenseStore) << "Commit of license state failed" << file.errorString();
        return false;
    }
    return true;
}

void LocalLicenseStore::preserveCorruptLocked()
{
    const QString backup = m_filePath + QStringLiteral(".corrupt");
    QFile::remove(backup);
    if (QFile::copy(m_filePath, backup))
        qCWarning(lcLicenseStore) << "Corrupt license state preserved at" << backup;
    else
        qCWarning(lcLicenseStore) << "Could not preserve corrupt license state" << m_filePath;
}

} // namespace wb::license
