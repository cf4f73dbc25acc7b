#include "RemoteRegistryClient.hpp"

#include <QDateTime>
#include <QEventLoop>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QLoggingCategory>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QUrlQuery>

Q_LOGGING_CATEGORY(lcLicenseRegistry, "wb.license.registry")

namespace wb::license {

namespace {

QString stringField(const QJsonObject& row, std::initializer_list<const char*> keys)
{
    for (const char* key : keys) {
        const QJsonValue value = row.value(QLatin1String(key));
        if (value.isString())
            return value.toString().trimmed();
        if (value.isDouble())
            return QString::number(value.toDouble(), 'g', 15);
    }
    return {};
}

int intField(const QJsonObject& row, const char* key)
{
    const QJsonValue value = row.value(QLatin1String(key));
    if (value.isDouble())
        return qMax(0, value.toInt());
    if (value.isString()) {
        bool ok = false;
        const int parsed = value.toString().trimmed().toInt(&ok);
        if (ok)
            return qMax(0, parsed);
    }
    return 0;
}

QDate parseExpiry(const QString& text)
{
    if (text.isEmpty())
        return {};
    QDate date = QDate::fromString(text, Qt::ISODate);
    if (!date.isValid())
        date = QDateTime::fromString(text, Qt::ISODate).date();
    return date;
}

} // namespace

std::optional<RegistryRecord> RegistryRecord::fromJson(const QJsonObject& row)
{
    RegistryRecord record;
    record.key = stringField(row, {"license_key", "key"});
    if (record.key.isEmpty())
        return std::nullopt;

    const QString status = stringField(row, {"status"});
    record.status = statusFromString(status.isEmpty() ? QStringLiteral("pending") : status);
    record.tier = tierFromString(stringField(row, {"license_tier", "tier"}));

    const QString expiry = stringField(row, {"expiry_date"});
    record.expiryDate = parseExpiry(expiry);
    if (!expiry.isEmpty() && !record.expiryDate.isValid())
        qCWarning(lcLicenseRegistry) << "Unparseable expiry date for" << maskLicenseKey(record.key) << expiry;

    record.bindings.network = stringField(row, {"hw_component_1", "hw1"}).toLower();
    record.bindings.cpu = stringField(row, {"hw_component_2", "hw2"}).toLower();
    record.bindings.board = stringField(row, {"hw_component_3", "hw3"}).toLower();
    record.licenseeName = stringField(row, {"licensee_name"});
    record.licenseeEmail = stringField(row, {"licensee_email"});
    record.transferCount = intField(row, "transfer_count");
    record.notes = stringField(row, {"notes"});
    return record;
}

QJsonObject RegistryUpdate::toJson() const
{
    QJsonObject object{
        {QStringLiteral("license_key"), licenseKey},
        {QStringLiteral("status"), statusToString(status)},
        {QStringLiteral("hw1"), bindings.network},
        {QStringLiteral("hw2"), bindings.cpu},
        {QStringLiteral("hw3"), bindings.board},
        {QStringLiteral("licensee_name"), licenseeName},
        {QStringLiteral("licensee_email"), licenseeEmail},
        {QStringLiteral("license_tier"), tierToString(tier)},
        {QStringLiteral("is_transfer"), isTransfer},
        {QStringLiteral("transfer_count"), transferCount},
    };
    if (!eventType.isEmpty())
        object.insert(QStringLiteral("event_type"), eventType);
    if (!sourceAddress.isEmpty())
        object.insert(QStringLiteral("source_ip"), sourceAddress);
    return object;
}

RemoteRegistryClient::RemoteRegistryClient(QUrl readUrl, QUrl writeUrl, int timeoutMs)
    : m_readUrl(std::move(readUrl))
    , m_writeUrl(std::move(writeUrl))
    , m_timeoutMs(timeoutMs)
{
    m_postPool.setMaxThreadCount(1);
}

RemoteRegistryClient::~RemoteRegistryClient()
{
    // Posts are best-effort; give in-flight ones one timeout window to finish.
    m_postPool.clear();
    m_postPool.waitForDone(timeoutMs());
}

void RemoteRegistryClient::setApiKey(const QString& apiKey)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_apiKey = apiKey.trimmed();
}

void RemoteRegistryClient::setTimeoutMs(int timeoutMs)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_timeoutMs = qMax(100, timeoutMs);
}

int RemoteRegistryClient::timeoutMs() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_timeoutMs;
}

RegistryFetchResult RemoteRegistryClient::fetch(const QString& licenseKey)
{
    RegistryFetchResult result;
    const QString key = licenseKey.trimmed();
    if (!m_readUrl.isValid() || m_readUrl.isEmpty()) {
        result.errorMessage = QStringLiteral("registry endpoint not configured");
        return result;
    }

    QUrl url = m_readUrl;
    QUrlQuery query(url);
    query.removeAllQueryItems(QStringLiteral("license_key"));
    query.addQueryItem(QStringLiteral("license_key"), key);
    url.setQuery(query);

    const HttpResponse response = get(url);
    if (!response.transportOk) {
        if (response.statusCode == 404) {
            result.kind = RegistryFetchResult::Kind::NotFound;
            result.errorMessage = QStringLiteral("license key not found");
            return result;
        }
        result.errorMessage = response.errorMessage;
        qCWarning(lcLicenseRegistry) << "Registry lookup failed for" << maskLicenseKey(key) << response.errorMessage;
        return result;
    }

    QString parseError;
    const QList<RegistryRecord> rows = parseRows(response.body, &parseError);
    if (!parseError.isEmpty()) {
        result.errorMessage = parseError;
        qCWarning(lcLicenseRegistry) << "Registry returned malformed payload:" << parseError;
        return result;
    }

    for (const RegistryRecord& row : rows) {
        if (row.key == key) {
            result.kind = RegistryFetchResult::Kind::Found;
            result.record = row;
            qCDebug(lcLicenseRegistry) << "Registry row for" << maskLicenseKey(key) << statusToString(row.status);
            return result;
        }
    }

    result.kind = RegistryFetchResult::Kind::NotFound;
    result.errorMessage = QStringLiteral("license key not found");
    return result;
}

RegistryListResult RemoteRegistryClient::fetchAll()
{
    RegistryListResult result;
    if (!m_readUrl.isValid() || m_readUrl.isEmpty()) {
        result.errorMessage = QStringLiteral("registry endpoint not configured");
        return result;
    }

    const HttpResponse response = get(m_readUrl);
    if (!response.transportOk) {
        result.errorMessage = response.errorMessage;
        qCWarning(lcLicenseRegistry) << "Registry listing failed:" << response.errorMessage;
        return result;
    }

    QString parseError;
    result.records = parseRows(response.body, &parseError);
    if (!parseError.isEmpty()) {
        result.records.clear();
        result.errorMessage = parseError;
        return result;
    }
    result.ok = true;
    return result;
}

void RemoteRegistryClient::post(const RegistryUpdate& update)
{
    if (!m_writeUrl.isValid() || m_writeUrl.isEmpty()) {
        qCDebug(lcLicenseRegistry) << "Registry write endpoint not configured, dropping" << update.eventType;
        return;
    }

    const QByteArray body = QJsonDocument(update.toJson()).toJson(QJsonDocument::Compact);
    const QString masked = maskLicenseKey(update.licenseKey);
    const QString eventType = update.eventType;
    // At most one retry, then the update is dropped.
    m_postPool.start([this, body, masked, eventType]() {
        QString error;
        if (postOnce(body, &error))
            return;
        qCInfo(lcLicenseRegistry) << "Registry post failed, retrying once:" << error;
        if (postOnce(body, &error))
            return;
        qCWarning(lcLicenseRegistry) << "Registry post dropped for" << masked << eventType << error;
    });
}

bool RemoteRegistryClient::waitForPendingPosts(int msecs)
{
    return m_postPool.waitForDone(msecs);
}

QList<RegistryRecord> RemoteRegistryClient::parseRows(const QByteArray& payload, QString* errorMessage)
{
    QList<RegistryRecord> rows;
    const QByteArray trimmed = payload.trimmed();
    if (trimmed.isEmpty())
        return rows;

    QJsonParseError parseError{};
    const QJsonDocument document = QJsonDocument::fromJson(trimmed, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (errorMessage)
            *errorMessage = QStringLiteral("invalid registry JSON: %1").arg(parseError.errorString());
        return rows;
    }

    QJsonArray array;
    if (document.isArray()) {
        array = document.array();
    } else {
        const QJsonObject object = document.object();
        if (object.value(QStringLiteral("records")).isArray())
            array = object.value(QStringLiteral("records")).toArray();
        else if (object.value(QStringLiteral("data")).isArray())
            array = object.value(QStringLiteral("data")).toArray();
        else if (object.contains(QStringLiteral("license_key")))
            array.append(object);
        else if (!object.isEmpty() && errorMessage)
            *errorMessage = QStringLiteral("registry payload has no license rows");
    }

    for (const QJsonValue& value : array) {
        if (!value.isObject())
            continue;
        if (auto record = RegistryRecord::fromJson(value.toObject()))
            rows.append(*record);
    }
    return rows;
}

RemoteRegistryClient::HttpResponse RemoteRegistryClient::get(const QUrl& url) const
{
    QString apiKey;
    int timeout = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        apiKey = m_apiKey;
        timeout = m_timeoutMs;
    }

    QNetworkRequest request(url);
    request.setHeader(QNetworkRequest::UserAgentHeader, QStringLiteral("wb-license/1.0"));
    request.setRawHeader("Accept", "application/json");
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::NoLessSafeRedirectPolicy);
    request.setTransferTimeout(timeout);
    if (!apiKey.isEmpty())
        request.setRawHeader("X-API-Key", apiKey.toUtf8());

    // A manager per call keeps the client usable from any thread.
    QNetworkAccessManager manager;
    QEventLoop loop;
    QNetworkReply* reply = manager.get(request);
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    loop.exec(QEventLoop::ExcludeUserInputEvents);

    HttpResponse response;
    response.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    response.body = reply->readAll();
    if (reply->error() != QNetworkReply::NoError) {
        response.errorMessage = response.statusCode > 0
            ? QStringLiteral("HTTP %1: %2").arg(response.statusCode).arg(reply->errorString())
            : reply->errorString();
    } else if (response.statusCode >= 400) {
        response.errorMessage = QStringLiteral("HTTP %1").arg(response.statusCode);
    } else {
        response.transportOk = true;
    }
    reply->deleteLater();
    return response;
}

bool RemoteRegistryClient::postOnce(const QByteArray& body, QString* errorMessage) const
{
    QString apiKey;
    int timeout = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        apiKey = m_apiKey;
        timeout = m_timeoutMs;
    }

    QNetworkRequest request(m_writeUrl);
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    request.setHeader(QNetworkRequest::UserAgentHeader, QStringLiteral("wb-license/1.0"));
    request.setTransferTimeout(timeout);
    if (!apiKey.isEmpty())
        request.setRawHeader("X-API-Key", apiKey.toUtf8());

    QNetworkAccessManager manager;
    QEventLoop loop;
    QNetworkReply* reply = manager.post(request, body);
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    loop.exec(QEventLoop::ExcludeUserInputEvents);

    const int statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    const bool ok = reply->error() == QNetworkReply::NoError && statusCode < 400;
    if (!ok && errorMessage)
        *errorMessage = statusCode > 0 ? QStringLiteral("HTTP %1").arg(statusCode) : reply->errorString();
    reply->deleteLater();
    return ok;
}

} // namespace wb::license
