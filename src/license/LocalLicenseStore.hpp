#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QString>

#include <functional>
#include <memory>
#include <mutex>
#include <optional>

#include "license/AuditLog.hpp"
#include "license/LicenseTypes.hpp"

namespace wb::license {

/*!
 * Durable cache of the current license record.
 *
 * The record and the clock guard live in one JSON document written through
 * QSaveFile, so a crash mid-write leaves the previous document intact. All
 * writers go through the same mutex; callers that need load-modify-save use
 * update() rather than pairing load() and save().
 */
class LocalLicenseStore {
public:
    //! Return false to leave the stored document untouched.
    using Mutator = std::function<bool(std::optional<LicenseRecord>& record)>;

    LocalLicenseStore(QString filePath, std::shared_ptr<AuditLog> auditLog);

    QString filePath() const { return m_filePath; }
    std::shared_ptr<AuditLog> auditLog() const { return m_auditLog; }

    std::optional<LicenseRecord> load() const;
    bool save(const LicenseRecord& record, QString* errorMessage = nullptr);

    //! Load, mutate and save under the store lock. \a result receives the record as stored afterwards.
    bool update(const Mutator& mutator, std::optional<LicenseRecord>* result = nullptr,
                QString* errorMessage = nullptr);

    bool appendAudit(const AuditEvent& event);

    //! Highest wall-clock time observed so far, invalid when none was recorded.
    QDateTime lastSeen() const;
    void recordSeen(const QDateTime& now);

    //! True when the document on disk exists but could not be parsed.
    bool isCorrupt() const;

private:
    enum class DocumentState {
        Missing,
        Valid,
        Corrupt,
    };

    struct Document {
        DocumentState state = DocumentState::Missing;
        std::optional<LicenseRecord> record;
        QDateTime lastSeen;
    };

    Document readLocked() const;
    bool writeLocked(const Document& document, QString* errorMessage);
    void preserveCorruptLocked();

    QString                   m_filePath;
    std::shared_ptr<AuditLog> m_auditLog;
    mutable std::mutex        m_mutex;
};

} // namespace wb::license
