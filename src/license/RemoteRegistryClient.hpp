#pragma once

#include <QByteArray>
#include <QDate>
#include <QJsonObject>
#include <QList>
#include <QString>
#include <QThreadPool>
#include <QUrl>

#include <mutex>
#include <optional>

#include "license/LicenseTypes.hpp"

namespace wb::license {

//! One row of the license registry. Every field except the key may be missing.
struct RegistryRecord {
    QString key;
    LicenseStatus status = LicenseStatus::Pending;
    LicenseTier tier = LicenseTier::Standard;
    QDate expiryDate;
    HardwareFingerprint bindings;
    QString licenseeName;
    QString licenseeEmail;
    int transferCount = 0;
    QString notes;

    bool hasBindings() const { return !bindings.isEmpty(); }
    bool isExpiredOn(const QDate& day) const { return expiryDate.isValid() && expiryDate < day; }

    static std::optional<RegistryRecord> fromJson(const QJsonObject& row);
};

struct RegistryFetchResult {
    enum class Kind {
        Found,
        NotFound,
        NetworkError,
    };

    Kind kind = Kind::NetworkError;
    std::optional<RegistryRecord> record;
    QString errorMessage;

    bool found() const { return kind == Kind::Found && record.has_value(); }
};

struct RegistryListResult {
    bool ok = false;
    QList<RegistryRecord> records;
    QString errorMessage;
};

//! Payload of the registry write endpoint (idempotent upsert by key).
struct RegistryUpdate {
    QString licenseKey;
    LicenseStatus status = LicenseStatus::Active;
    HardwareFingerprint bindings;
    QString licenseeName;
    QString licenseeEmail;
    LicenseTier tier = LicenseTier::Standard;
    bool isTransfer = false;
    int transferCount = 0;
    QString eventType;
    QString sourceAddress;

    QJsonObject toJson() const;
};

class RemoteRegistryInterface {
public:
    virtual ~RemoteRegistryInterface() = default;

    virtual RegistryFetchResult fetch(const QString& licenseKey) = 0;
    virtual RegistryListResult fetchAll() = 0;

    //! Fire-and-forget. Must never block the caller or report failure to it.
    virtual void post(const RegistryUpdate& update) = 0;
};

class RemoteRegistryClient final : public RemoteRegistryInterface {
public:
    RemoteRegistryClient(QUrl readUrl, QUrl writeUrl, int timeoutMs = 10000);
    ~RemoteRegistryClient() override;

    void setApiKey(const QString& apiKey);
    void setTimeoutMs(int timeoutMs);
    int timeoutMs() const;

    RegistryFetchResult fetch(const QString& licenseKey) override;
    RegistryListResult fetchAll() override;
    void post(const RegistryUpdate& update) override;

    //! Waits for queued posts; used at shutdown and by tests.
    bool waitForPendingPosts(int msecs);

    //! Rows of a registry payload: a single row, an array, or an object holding "records" or "data".
    static QList<RegistryRecord> parseRows(const QByteArray& payload, QString* errorMessage = nullptr);

private:
    struct HttpResponse {
        bool transportOk = false;
        int statusCode = 0;
        QByteArray body;
        QString errorMessage;
    };

    HttpResponse get(const QUrl& url) const;
    bool postOnce(const QByteArray& body, QString* errorMessage) const;

    QUrl               m_readUrl;
    QUrl               m_writeUrl;
    QString            m_apiKey;
    int                m_timeoutMs = 10000;
    mutable std::mutex m_mutex;
    QThreadPool        m_postPool;
};

} // namespace wb::license
