#include "HardwareFingerprinter.hpp"

#include <QCryptographicHash>
#include <QFile>
#include <QLoggingCategory>
#include <QNetworkInterface>
#include <QSysInfo>
#include <QTextStream>

Q_LOGGING_CATEGORY(lcLicenseHardware, "wb.license.hardware")

namespace wb::license {

namespace {

QString readFirstLine(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text))
        return {};
    return QString::fromUtf8(file.readLine()).trimmed();
}

bool isPlaceholderIdentifier(const QString& value)
{
    const QString lowered = value.trimmed().toLower();
    if (lowered.isEmpty())
        return true;
    // Vendors ship these instead of real serials.
    static const QStringList placeholders = {
        QStringLiteral("none"),
        QStringLiteral("default string"),
        QStringLiteral("to be filled by o.e.m."),
        QStringLiteral("not specified"),
        QStringLiteral("not applicable"),
        QStringLiteral("03000200-0400-0500-0006-000700080009"),
        QStringLiteral("00000000-0000-0000-0000-000000000000"),
    };
    if (placeholders.contains(lowered))
        return true;
    for (const QChar ch : lowered) {
        if (ch != QLatin1Char('0') && ch != QLatin1Char('-') && ch != QLatin1Char(':'))
            return false;
    }
    return true;
}

QString readNetworkIdentifier()
{
    const auto interfaces = QNetworkInterface::allInterfaces();
    QString fallback;
    for (const QNetworkInterface& iface : interfaces) {
        if (iface.flags().testFlag(QNetworkInterface::IsLoopBack))
            continue;
        const QString address = iface.hardwareAddress().trimmed();
        if (isPlaceholderIdentifier(address))
            continue;
        const auto type = iface.type();
        if (type == QNetworkInterface::Virtual)
            continue;
        if (type == QNetworkInterface::Ethernet || type == QNetworkInterface::Wifi)
            return address.toLower();
        if (fallback.isEmpty())
            fallback = address.toLower();
    }
    return fallback;
}

QString readCpuIdentifier()
{
    QFile cpuinfo(QStringLiteral("/proc/cpuinfo"));
    QString modelName;
    if (cpuinfo.open(QIODevice::ReadOnly | QIODevice::Text)) {
        QTextStream stream(&cpuinfo);
        while (!stream.atEnd()) {
            const QString line = stream.readLine();
            const int colon = line.indexOf(QLatin1Char(':'));
            if (colon < 0)
                continue;
            const QString name = line.left(colon).trimmed().toLower();
            const QString value = line.mid(colon + 1).trimmed();
            if (name == QLatin1String("serial") && !isPlaceholderIdentifier(value))
                return value;
            if (modelName.isEmpty() && name == QLatin1String("model name"))
                modelName = value;
        }
    }
    if (modelName.isEmpty())
        return {};
    return modelName + QLatin1Char('|') + QSysInfo::currentCpuArchitecture();
}

QString readBoardIdentifier()
{
    const QStringList candidates = {
        QStringLiteral("/sys/class/dmi/id/product_uuid"),
        QStringLiteral("/sys/class/dmi/id/board_serial"),
    };
    for (const QString& path : candidates) {
        const QString value = readFirstLine(path);
        if (!isPlaceholderIdentifier(value))
            return value.toLower();
    }
    const QString machineId = QString::fromLatin1(QSysInfo::machineUniqueId()).trimmed();
    if (!isPlaceholderIdentifier(machineId))
        return machineId.toLower();
    return {};
}

} // namespace

HardwareFingerprinter::HardwareFingerprinter() = default;

HardwareFingerprinter::~HardwareFingerprinter() = default;

HardwareFingerprint HardwareFingerprinter::probe()
{
    const RawIdentifiers raw = m_rawSource ? m_rawSource() : readSystemIdentifiers();
    const HardwareFingerprint fingerprint = fromRaw(raw);
    qCDebug(lcLicenseHardware) << "Hardware probe" << fingerprint.shortForm();
    return fingerprint;
}

void HardwareFingerprinter::setRawSourceForTesting(RawSource source)
{
    m_rawSource = std::move(source);
}

HardwareFingerprinter::RawIdentifiers HardwareFingerprinter::readSystemIdentifiers()
{
    RawIdentifiers raw;
    raw.network = readNetworkIdentifier();
    raw.cpu = readCpuIdentifier();
    raw.board = readBoardIdentifier();
    raw.hostName = QSysInfo::machineHostName();
    if (raw.network.isEmpty() || raw.cpu.isEmpty() || raw.board.isEmpty()) {
        qCInfo(lcLicenseHardware) << "Some hardware identifiers unavailable, using host name fallback"
                                  << "network:" << !raw.network.isEmpty() << "cpu:" << !raw.cpu.isEmpty()
                                  << "board:" << !raw.board.isEmpty();
    }
    return raw;
}

HardwareFingerprint HardwareFingerprinter::fromRaw(const RawIdentifiers& raw)
{
    QString host = raw.hostName.trimmed();
    if (host.isEmpty())
        host = QStringLiteral("unknown-host");
    const QString fallback = QStringLiteral("host:") + host;

    const auto pick = [&fallback](const QString& value) {
        const QString trimmed = value.trimmed();
        return hashComponent(trimmed.isEmpty() ? fallback : trimmed);
    };

    HardwareFingerprint fingerprint;
    fingerprint.network = pick(raw.network);
    fingerprint.cpu = pick(raw.cpu);
    fingerprint.board = pick(raw.board);
    return fingerprint;
}

QString HardwareFingerprinter::hashComponent(const QString& value)
{
    return QString::fromLatin1(QCryptographicHash::hash(value.toUtf8(), QCryptographicHash::Sha256).toHex());
}

bool HardwareFingerprinter::matches(const HardwareFingerprint& local, const HardwareFingerprint& remote,
                                    int threshold)
{
    return local.matchCount(remote) >= threshold;
}

QStringList HardwareFingerprinter::describeMismatch(const HardwareFingerprint& local,
                                                    const HardwareFingerprint& remote)
{
    QStringList changes;
    if (local.network.isEmpty() || local.network != remote.network)
        changes.append(QStringLiteral("Network adapter changed"));
    if (local.cpu.isEmpty() || local.cpu != remote.cpu)
        changes.append(QStringLiteral("CPU changed"));
    if (local.board.isEmpty() || local.board != remote.board)
        changes.append(QStringLiteral("Motherboard changed"));
    return changes;
}

} // namespace wb::license
