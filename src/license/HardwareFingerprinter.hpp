#pragma once

#include <QString>
#include <QStringList>

#include <functional>

#include "license/LicenseTypes.hpp"

namespace wb::license {

class HardwareFingerprinterInterface {
public:
    virtual ~HardwareFingerprinterInterface() = default;

    //! Never fails: each component falls back to a hostname-derived identifier.
    virtual HardwareFingerprint probe() = 0;
};

class HardwareFingerprinter final : public HardwareFingerprinterInterface {
public:
    //! Unhashed identifiers as reported by the operating system.
    struct RawIdentifiers {
        QString network;
        QString cpu;
        QString board;
        QString hostName;
    };

    using RawSource = std::function<RawIdentifiers()>;

    HardwareFingerprinter();
    ~HardwareFingerprinter() override;

    HardwareFingerprint probe() override;

    void setRawSourceForTesting(RawSource source);

    static RawIdentifiers readSystemIdentifiers();
    static HardwareFingerprint fromRaw(const RawIdentifiers& raw);
    static QString hashComponent(const QString& value);

    static bool matches(const HardwareFingerprint& local, const HardwareFingerprint& remote, int threshold = 2);

    //! Labels of the components that differ, e.g. "Network adapter changed".
    static QStringList describeMismatch(const HardwareFingerprint& local, const HardwareFingerprint& remote);

private:
    RawSource m_rawSource;
};

} // namespace wb::license
