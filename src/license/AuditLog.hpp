#pragma once

#include <QDateTime>
#include <QList>
#include <QString>

#include <mutex>
#include <optional>

#include "license/LicenseTypes.hpp"

namespace wb::license {

struct AuditQuery {
    QList<AuditEventType> types; // empty = all
    QDateTime since;
    QDateTime until;
    QString licenseKey;
    int limit = 0; // 0 = unlimited, otherwise the newest `limit` events
};

//! Append-only JSON lines log of security relevant events.
class AuditLog {
public:
    explicit AuditLog(QString filePath);

    QString filePath() const { return m_filePath; }

    bool append(const AuditEvent& event, QString* errorMessage = nullptr);

    //! Matching events in append order.
    QList<AuditEvent> query(const AuditQuery& filter = {}) const;

    int count() const;

private:
    QList<AuditEvent> readAllLocked() const;
    bool endsWithNewlineLocked() const;

    QString            m_filePath;
    mutable std::mutex m_mutex;
};

} // namespace wb::license
