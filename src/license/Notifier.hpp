#pragma once

#include <QDateTime>
#include <QString>
#include <QThreadPool>

#include "license/LicenseSettings.hpp"
#include "license/LicenseTypes.hpp"

class QSslSocket;

namespace wb::license {

struct TransferAlert {
    QString licenseKey;
    QString recipient;      // registered address, never the one typed by the requester
    QString licenseeName;
    QString attemptedEmail; // set for suspicious alerts
    HardwareFingerprint newFingerprint;
    QDateTime timestamp;
    QString sourceAddress;
    int transferCount = 0;
    int maxTransfers = 0;
    bool suspicious = false;
};

struct MailMessage {
    QString from;
    QString to;
    QString subject;
    QString body;
};

//! True for a single bare mailbox (optionally in angle brackets) that is safe to put on an SMTP command line.
bool isDeliverableAddress(const QString& mailbox);

MailMessage composeTransferAlert(const TransferAlert& alert, const QString& sender, const QString& supportEmail,
                                 const QString& supportPhone = {});

class NotifierInterface {
public:
    virtual ~NotifierInterface() = default;

    //! Best-effort; delivery failures are logged, never reported to the caller.
    virtual void notifyTransfer(const TransferAlert& alert) = 0;
};

class SmtpNotifier final : public NotifierInterface {
public:
    SmtpNotifier(SmtpSettings settings, QString supportEmail, QString supportPhone = {});
    ~SmtpNotifier() override;

    void notifyTransfer(const TransferAlert& alert) override;

    //! Runs the whole SMTP dialogue on the calling thread.
    bool sendNow(const MailMessage& message, QString* errorMessage = nullptr) const;

    bool waitForPending(int msecs);

    static QByteArray encodeMessage(const MailMessage& message, const QDateTime& date);

private:
    bool expect(QSslSocket& socket, int expectedCode, QString* errorMessage) const;
    bool command(QSslSocket& socket, const QByteArray& line, int expectedCode, QString* errorMessage) const;

    SmtpSettings m_settings;
    QString      m_supportEmail;
    QString      m_supportPhone;
    QThreadPool  m_pool;
};

} // namespace wb::license
