#include "AuditLog.hpp"

#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QLoggingCategory>

#include "utils/PathUtils.hpp"

Q_LOGGING_CATEGORY(lcLicenseAudit, "wb.license.audit")

namespace wb::license {

AuditLog::AuditLog(QString filePath)
    : m_filePath(std::move(filePath))
{
}

bool AuditLog::append(const AuditEvent& event, QString* errorMessage)
{
    AuditEvent stamped = event;
    if (!stamped.timestamp.isValid())
        stamped.timestamp = QDateTime::currentDateTimeUtc();

    QByteArray line = QJsonDocument(stamped.toJson()).toJson(QJsonDocument::Compact);
    line.append('\n');

    std::lock_guard<std::mutex> lock(m_mutex);
    QString error;
    if (!utils::ensureParentDirectory(m_filePath, &error)) {
        qCWarning(lcLicenseAudit) << "Audit log unavailable:" << error;
        if (errorMessage)
            *errorMessage = error;
        return false;
    }

    // A write torn by a crash leaves the last line unterminated; never append onto it.
    if (!endsWithNewlineLocked())
        line.prepend('\n');

    QFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        qCWarning(lcLicenseAudit) << "Cannot open audit log" << m_filePath << file.errorString();
        if (errorMessage)
            *errorMessage = file.errorString();
        return false;
    }
    if (file.write(line) != line.size() || !file.flush()) {
        qCWarning(lcLicenseAudit) << "Failed to append audit event" << file.errorString();
        if (errorMessage)
            *errorMessage = file.errorString();
        return false;
    }

    qCDebug(lcLicenseAudit) << auditEventTypeToString(stamped.eventType) << maskLicenseKey(stamped.licenseKey)
                            << stamped.details;
    return true;
}

QList<AuditEvent> AuditLog::query(const AuditQuery& filter) const
{
    QList<AuditEvent> events;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        events = readAllLocked();
    }

    QList<AuditEvent> matching;
    for (const AuditEvent& event : events) {
        if (!filter.types.isEmpty() && !filter.types.contains(event.eventType))
            continue;
        if (filter.since.isValid() && event.timestamp < filter.since)
            continue;
        if (filter.until.isValid() && event.timestamp > filter.until)
            continue;
        if (!filter.licenseKey.isEmpty() && event.licenseKey.compare(filter.licenseKey, Qt::CaseInsensitive) != 0)
            continue;
        matching.append(event);
    }

    if (filter.limit > 0 && matching.size() > filter.limit)
        matching = matching.mid(matching.size() - filter.limit);
    return matching;
}

int AuditLog::count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<int>(readAllLocked().size());
}

bool AuditLog::endsWithNewlineLocked() const
{
    QFile file(m_filePath);
    if (!file.exists() || file.size() == 0)
        return true;
    if (!file.open(QIODevice::ReadOnly) || !file.seek(file.size() - 1))
        return true;
    char last = '\n';
    if (!file.getChar(&last))
        return true;
    return last == '\n';
}

QList<AuditEvent> AuditLog::readAllLocked() const
{
    QList<AuditEvent> events;
    QFile file(m_filePath);
    if (!file.exists())
        return events;
    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(lcLicenseAudit) << "Cannot read audit log" << m_filePath << file.errorString();
        return events;
    }

    int lineNumber = 0;
    while (!file.atEnd()) {
        const QByteArray line = file.readLine().trimmed();
        ++lineNumber;
        if (line.isEmpty())
            continue;
        QJsonParseError parseError{};
        const QJsonDocument document = QJsonDocument::fromJson(line, &parseError);
        if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
            qCWarning(lcLicenseAudit) << "Skipping malformed audit line" << lineNumber << parseError.errorString();
            continue;
        }
        const auto event = AuditEvent::fromJson(document.object());
        if (!event) {
            qCWarning(lcLicenseAudit) << "Skipping audit line" << lineNumber << "with unknown event type";
            continue;
        }
        events.append(*event);
    }
    return events;
}

} // namespace wb::license
