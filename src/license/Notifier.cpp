#include "Notifier.hpp"

#include <QHostInfo>
#include <QLocale>
#include <QLoggingCategory>
#include <QSslSocket>
#include <QStringList>
#include <QUuid>

Q_LOGGING_CATEGORY(lcLicenseNotifier, "wb.license.notifier")

namespace wb::license {

namespace {

QString shortHash(const QString& value)
{
    return value.isEmpty() ? QStringLiteral("unknown") : value.left(16) + QStringLiteral("...");
}

QByteArray encodeHeader(const QString& value)
{
    bool ascii = true;
    for (const QChar ch : value) {
        if (ch.unicode() > 0x7e || ch.unicode() < 0x20) {
            ascii = false;
            break;
        }
    }
    if (ascii)
        return value.toLatin1();
    return "=?UTF-8?B?" + value.toUtf8().toBase64() + "?=";
}

QByteArray addressOf(const QString& mailbox)
{
    const QString trimmed = mailbox.trimmed();
    const int open = trimmed.indexOf(QLatin1Char('<'));
    const int close = trimmed.indexOf(QLatin1Char('>'), open + 1);
    if (open >= 0 && close > open)
        return trimmed.mid(open + 1, close - open - 1).trimmed().toUtf8();
    return trimmed.toUtf8();
}

} // namespace

bool isDeliverableAddress(const QString& mailbox)
{
    const QString address = QString::fromUtf8(addressOf(mailbox));
    if (address.isEmpty() || address.count(QLatin1Char('@')) != 1)
        return false;
    if (address.startsWith(QLatin1Char('@')) || address.endsWith(QLatin1Char('@')))
        return false;
    for (const QChar ch : address) {
        if (ch.unicode() < 0x21 || ch.unicode() == 0x7f || ch == QLatin1Char('<') || ch == QLatin1Char('>'))
            return false;
    }
    return true;
}

MailMessage composeTransferAlert(const TransferAlert& alert, const QString& sender, const QString& supportEmail,
                                 const QString& supportPhone)
{
    MailMessage message;
    message.from = sender;
    message.to = alert.recipient;

    const QString name = alert.licenseeName.trimmed().isEmpty() ? QStringLiteral("License Owner")
                                                                : alert.licenseeName.trimmed();
    const QDateTime when = alert.timestamp.isValid() ? alert.timestamp : QDateTime::currentDateTimeUtc();
    const QString time = when.toUTC().toString(QStringLiteral("yyyy-MM-dd HH:mm:ss")) + QStringLiteral(" UTC");
    const QString source = alert.sourceAddress.isEmpty() ? QStringLiteral("unknown") : alert.sourceAddress;
    QString contact = supportEmail;
    if (!supportPhone.isEmpty())
        contact += QStringLiteral(" or ") + supportPhone;

    QStringList lines;
    lines << QStringLiteral("Hello %1,").arg(name) << QString();
    if (alert.suspicious) {
        message.subject = QStringLiteral("Security alert: blocked license transfer attempt");
        lines << QStringLiteral("An unauthorized transfer attempt was detected on license %1.")
                     .arg(maskLicenseKey(alert.licenseKey))
              << QStringLiteral("The request did not use the email address registered with the license, "
                                "so it was blocked.");
        if (!alert.attemptedEmail.isEmpty())
            lines << QStringLiteral("Address used in the request: %1").arg(alert.attemptedEmail);
    } else {
        message.subject = QStringLiteral("License transfer notification");
        lines << QStringLiteral("A hardware transfer was requested for license %1 (%2 of %3 transfers used "
                                "after this one).")
                     .arg(maskLicenseKey(alert.licenseKey))
                     .arg(alert.transferCount + 1)
                     .arg(alert.maxTransfers);
    }

    lines << QString() << QStringLiteral("Transfer details:")
          << QStringLiteral("- Network adapter: %1").arg(shortHash(alert.newFingerprint.network))
          << QStringLiteral("- CPU: %1").arg(shortHash(alert.newFingerprint.cpu))
          << QStringLiteral("- Motherboard: %1").arg(shortHash(alert.newFingerprint.board))
          << QStringLiteral("- Source IP: %1").arg(source)
          << QStringLiteral("- Time: %1").arg(time) << QString();

    if (alert.suspicious) {
        lines << QStringLiteral("If this was you, repeat the request with the address registered to the license: %1.")
                     .arg(alert.recipient)
              << QStringLiteral("If this was not you, your license is safe. Report the incident to %1.").arg(contact);
    } else {
        lines << QStringLiteral("If this was you, no action is needed.")
              << QStringLiteral("If this was not you, contact %1 immediately so the transfer can be reverted.")
                     .arg(contact);
    }
    lines << QString() << QStringLiteral("Water Balance Support") << supportEmail;
    if (!supportPhone.isEmpty())
        lines << supportPhone;

    message.body = lines.join(QLatin1Char('\n'));
    return message;
}

SmtpNotifier::SmtpNotifier(SmtpSettings settings, QString supportEmail, QString supportPhone)
    : m_settings(std::move(settings))
    , m_supportEmail(std::move(supportEmail))
    , m_supportPhone(std::move(supportPhone))
{
    m_pool.setMaxThreadCount(1);
}

SmtpNotifier::~SmtpNotifier()
{
    m_pool.clear();
    m_pool.waitForDone(m_settings.timeoutMs);
}

void SmtpNotifier::notifyTransfer(const TransferAlert& alert)
{
    if (!m_settings.isConfigured()) {
        qCWarning(lcLicenseNotifier) << "SMTP not configured, transfer alert for" << maskLicenseKey(alert.licenseKey)
                                     << "not sent";
        return;
    }
    if (alert.recipient.trimmed().isEmpty()) {
        qCWarning(lcLicenseNotifier) << "No registered address for" << maskLicenseKey(alert.licenseKey);
        return;
    }
    if (!isDeliverableAddress(alert.recipient)) {
        qCWarning(lcLicenseNotifier) << "Registered address for" << maskLicenseKey(alert.licenseKey)
                                     << "is not a plain mailbox, transfer alert not sent";
        return;
    }

    const MailMessage message = composeTransferAlert(alert, m_settings.sender, m_supportEmail, m_supportPhone);
    m_pool.start([this, message]() {
        QString error;
        if (sendNow(message, &error))
            qCInfo(lcLicenseNotifier) << "Transfer alert sent to" << message.to;
        else
            qCWarning(lcLicenseNotifier) << "Transfer alert to" << message.to << "failed:" << error;
    });
}

bool SmtpNotifier::waitForPending(int msecs)
{
    return m_pool.waitForDone(msecs);
}

QByteArray SmtpNotifier::encodeMessage(const MailMessage& message, const QDateTime& date)
{
    QByteArray data;
    data += "From: " + encodeHeader(message.from) + "\r\n";
    data += "To: " + encodeHeader(message.to) + "\r\n";
    data += "Subject: " + encodeHeader(message.subject) + "\r\n";
    data += "Date: "
        + QLocale::c().toString(date.toUTC(), QStringLiteral("ddd, dd MMM yyyy HH:mm:ss")).toLatin1() + " +0000\r\n";
    data += "Message-ID: <" + QUuid::createUuid().toString(QUuid::WithoutBraces).toLatin1() + "@wb-license>\r\n";
    data += "MIME-Version: 1.0\r\n";
    data += "Content-Type: text/plain; charset=UTF-8\r\n";
    data += "Content-Transfer-Encoding: 8bit\r\n\r\n";

    const QStringList lines = message.body.split(QLatin1Char('\n'));
    for (QString line : lines) {
        if (line.endsWith(QLatin1Char('\r')))
            line.chop(1);
        if (line.startsWith(QLatin1Char('.')))
            line.prepend(QLatin1Char('.'));
        data += line.toUtf8() + "\r\n";
    }
    data += ".\r\n";
    return data;
}

bool SmtpNotifier::sendNow(const MailMessage& message, QString* errorMessage) const
{
    if (!isDeliverableAddress(message.from) || !isDeliverableAddress(message.to)) {
        if (errorMessage)
            *errorMessage = QStringLiteral("refusing to send: sender or recipient is not a plain mailbox");
        return false;
    }

    const int timeout = m_settings.timeoutMs;
    QSslSocket socket;

    if (m_settings.implicitTls || m_settings.startTls) {
        if (!QSslSocket::supportsSsl()) {
            if (errorMessage)
                *errorMessage = QStringLiteral("TLS requested but not available");
            return false;
        }
    }

    if (m_settings.implicitTls) {
        socket.connectToHostEncrypted(m_settings.host, static_cast<quint16>(m_settings.port));
        if (!socket.waitForEncrypted(timeout)) {
            if (errorMessage)
                *errorMessage = QStringLiteral("TLS connect failed: %1").arg(socket.errorString());
            return false;
        }
    } else {
        socket.connectToHost(m_settings.host, static_cast<quint16>(m_settings.port));
        if (!socket.waitForConnected(timeout)) {
            if (errorMessage)
                *errorMessage = QStringLiteral("connect failed: %1").arg(socket.errorString());
            return false;
        }
    }

    if (!expect(socket, 220, errorMessage))
        return false;

    QString localName = QHostInfo::localHostName();
    if (localName.isEmpty())
        localName = QStringLiteral("localhost");
    const QByteArray ehlo = "EHLO " + localName.toUtf8();
    if (!command(socket, ehlo, 250, errorMessage))
        return false;

    if (m_settings.startTls && !m_settings.implicitTls) {
        if (!command(socket, "STARTTLS", 220, errorMessage))
            return false;
        socket.startClientEncryption();
        if (!socket.waitForEncrypted(timeout)) {
            if (errorMessage)
                *errorMessage = QStringLiteral("STARTTLS handshake failed: %1").arg(socket.errorString());
            return false;
        }
        if (!command(socket, ehlo, 250, errorMessage))
            return false;
    }

    if (!m_settings.username.isEmpty()) {
        if (!command(socket, "AUTH LOGIN", 334, errorMessage))
            return false;
        if (!command(socket, m_settings.username.toUtf8().toBase64(), 334, errorMessage))
            return false;
        if (!command(socket, m_settings.password.toUtf8().toBase64(), 235, errorMessage))
            return false;
    }

    if (!command(socket, "MAIL FROM:<" + addressOf(message.from) + ">", 250, errorMessage))
        return false;
    if (!command(socket, "RCPT TO:<" + addressOf(message.to) + ">", 250, errorMessage))
        return false;
    if (!command(socket, "DATA", 354, errorMessage))
        return false;

    socket.write(encodeMessage(message, QDateTime::currentDateTimeUtc()));
    socket.waitForBytesWritten(timeout);
    if (!expect(socket, 250, errorMessage))
        return false;

    socket.write("QUIT\r\n");
    socket.waitForBytesWritten(timeout);
    socket.disconnectFromHost();
    return true;
}

bool SmtpNotifier::expect(QSslSocket& socket, int expectedCode, QString* errorMessage) const
{
    const int timeout = m_settings.timeoutMs;
    QByteArray lastLine;
    while (true) {
        while (!socket.canReadLine()) {
            if (!socket.waitForReadyRead(timeout)) {
                if (errorMessage)
                    *errorMessage = QStringLiteral("no reply from SMTP server: %1").arg(socket.errorString());
                return false;
            }
        }
        lastLine = socket.readLine().trimmed();
        // "250-..." continues a multi-line reply, "250 ..." ends it.
        if (lastLine.size() < 4 || lastLine.at(3) != '-')
            break;
    }

    bool ok = false;
    const int code = lastLine.left(3).toInt(&ok);
    // Same reply class (2xx, 3xx) counts, e.g. 251 for RCPT.
    if (!ok || code / 100 != expectedCode / 100) {
        if (errorMessage)
            *errorMessage = QStringLiteral("unexpected SMTP reply: %1").arg(QString::fromUtf8(lastLine));
        return false;
    }
    return true;
}

bool SmtpNotifier::command(QSslSocket& socket, const QByteArray& line, int expectedCode,
                           QString* errorMessage) const
{
    socket.write(line + "\r\n");
    if (!socket.waitForBytesWritten(m_settings.timeoutMs)) {
        if (errorMessage)
            *errorMessage = QStringLiteral("write failed: %1").arg(socket.errorString());
        return false;
    }
    return expect(socket, expectedCode, errorMessage);
}

} // namespace wb::license
