#include <QtTest/QtTest>

#include <memory>

#include "LicenseTestSupport.hpp"
#include "license/TransferManager.hpp"

using namespace wb::license;
using namespace wb::license::testing;

namespace {

const QString kKey = QStringLiteral("WB-TRNS-0000-0001");

HardwareFingerprint machine(int index)
{
    return makeFingerprint(QStringLiteral("nic-%1").arg(index), QStringLiteral("cpu-%1").arg(index),
                           QStringLiteral("board-%1").arg(index));
}

LicenseRecord boundRecord(const HardwareFingerprint& bindings, const QString& email)
{
    LicenseRecord record;
    record.key = kKey;
    record.status = LicenseStatus::Active;
    record.hardwareBindings = bindings;
    record.licenseeName = QStringLiteral("Jan Kowalski");
    record.licenseeEmail = email;
    record.activatedAt = QDateTime(QDate(2026, 1, 1), QTime(9, 0), Qt::UTC);
    record.lastVerifiedAt = record.activatedAt;
    return record;
}

std::unique_ptr<TransferManager> makeManager(LicenseHarness& harness)
{
    auto manager = std::make_unique<TransferManager>(harness.registry, harness.store, harness.notifier,
                                                     harness.fingerprinter, harness.settings);
    auto clock = harness.clock;
    manager->setClockForTesting([clock]() { return clock->now(); });
    manager->setAddressProviderForTesting([]() { return QStringLiteral("198.51.100.7"); });
    return manager;
}

} // namespace

class TransferManagerTest : public QObject {
    Q_OBJECT

private slots:
    void approvedTransferRebindsAndNotifiesOwner();
    void fourthTransferExceedsLimit();
    void wrongEmailIsDeniedAndOwnerAlerted();
    void boundDeviceConsumesNoQuota();
    void unreachableRegistryDeniesTransfer();
    void revokedLicenseCannotBeTransferred();
    void emptyKeyIsInvalidInput();
};

void TransferManagerTest::approvedTransferRebindsAndNotifiesOwner()
{
    LicenseHarness harness;
    harness.registry->setRow(registryRow(kKey, LicenseStatus::Active, machine(1)));
    harness.fingerprinter->setFingerprint(machine(2));
    auto manager = makeManager(harness);

    const LicenseOutcome outcome = manager->requestTransfer(kKey, QStringLiteral(" OWNER@example.com "));
    QVERIFY2(outcome.ok(), qPrintable(outcome.message));
    QCOMPARE(outcome.state, LicenseState::Active);
    QCOMPARE(outcome.mode, ValidationMode::Transfer);

    const auto stored = harness.store->load();
    QVERIFY(stored.has_value());
    QCOMPARE(stored->hardwareBindings, machine(2));
    QCOMPARE(stored->transferCount, 1);
    QCOMPARE(stored->licenseeEmail, QStringLiteral("owner@example.com"));
    QVERIFY(stored->lastTransferAt.has_value());
    QVERIFY(stored->offlineGraceUntil.has_value());

    const QList<TransferAlert> alerts = harness.notifier->alertsValue();
    QCOMPARE(alerts.size(), 1);
    QVERIFY(!alerts.first().suspicious);
    QCOMPARE(alerts.first().recipient, QStringLiteral("owner@example.com"));
    QCOMPARE(alerts.first().sourceAddress, QStringLiteral("198.51.100.7"));

    const QList<RegistryUpdate> posts = harness.registry->postsValue();
    QCOMPARE(posts.size(), 1);
    QVERIFY(posts.first().isTransfer);
    QCOMPARE(posts.first().transferCount, 1);
    QCOMPARE(posts.first().bindings, machine(2));
    QCOMPARE(posts.first().eventType, QStringLiteral("TRANSFER"));
    QCOMPARE(posts.first().sourceAddress, QStringLiteral("198.51.100.7"));

    QCOMPARE(harness.auditEvents(AuditEventType::TransferRequested).size(), 1);
    const QList<AuditEvent> approved = harness.auditEvents(AuditEventType::TransferApproved);
    QCOMPARE(approved.size(), 1);
    QCOMPARE(approved.first().sourceAddress.value_or(QString()), QStringLiteral("198.51.100.7"));
}

void TransferManagerTest::fourthTransferExceedsLimit()
{
    LicenseHarness harness;
    harness.registry->setRow(registryRow(kKey, LicenseStatus::Active, machine(0)));
    QVERIFY(harness.store->save(boundRecord(machine(0), QStringLiteral("owner@example.com"))));
    auto manager = makeManager(harness);

    for (int i = 1; i <= 3; ++i) {
        harness.fingerprinter->setFingerprint(machine(i));
        const LicenseOutcome outcome = manager->requestTransfer(kKey, QStringLiteral("owner@example.com"));
        QVERIFY2(outcome.ok(), qPrintable(outcome.message));
        QCOMPARE(harness.store->load()->transferCount, i);
    }

    harness.fingerprinter->setFingerprint(machine(4));
    const LicenseOutcome denied = manager->requestTransfer(kKey, QStringLiteral("owner@example.com"));
    QCOMPARE(denied.error, LicenseErrorKind::TransferLimitExceeded);
    QVERIFY(!denied.blocking);

    const auto stored = harness.store->load();
    QCOMPARE(stored->hardwareBindings, machine(3));
    QCOMPARE(stored->transferCount, 3);
    QCOMPARE(harness.registry->row(kKey).transferCount, 3);

    const QList<AuditEvent> deniedEvents = harness.auditEvents(AuditEventType::TransferDenied);
    QCOMPARE(deniedEvents.size(), 1);
    QVERIFY(deniedEvents.first().details.contains(QStringLiteral("3/3")));
    QCOMPARE(harness.auditEvents(AuditEventType::TransferApproved).size(), 3);
}

void TransferManagerTest::wrongEmailIsDeniedAndOwnerAlerted()
{
    LicenseHarness harness;
    RegistryRecord row = registryRow(kKey, LicenseStatus::Active, machine(0));
    row.licenseeEmail = QStringLiteral("right@x.com");
    row.transferCount = 1;
    harness.registry->setRow(row);
    LicenseRecord local = boundRecord(machine(0), QStringLiteral("right@x.com"));
    local.transferCount = 1;
    QVERIFY(harness.store->save(local));
    harness.fingerprinter->setFingerprint(machine(5));
    auto manager = makeManager(harness);

    const LicenseOutcome outcome = manager->requestTransfer(kKey, QStringLiteral("wrong@x.com"));
    QCOMPARE(outcome.error, LicenseErrorKind::EmailVerificationFailed);
    // The license already on this device stays usable.
    QCOMPARE(outcome.state, LicenseState::Active);

    const auto stored = harness.store->load();
    QCOMPARE(stored->hardwareBindings, machine(0));
    QCOMPARE(stored->transferCount, 1);
    QVERIFY(harness.registry->postsValue().isEmpty());

    const QList<TransferAlert> alerts = harness.notifier->alertsValue();
    QCOMPARE(alerts.size(), 1);
    QVERIFY(alerts.first().suspicious);
    QCOMPARE(alerts.first().recipient, QStringLiteral("right@x.com"));
    QCOMPARE(alerts.first().attemptedEmail, QStringLiteral("wrong@x.com"));

    const QList<AuditEvent> denied = harness.auditEvents(AuditEventType::TransferDenied);
    QCOMPARE(denied.size(), 1);
    QVERIFY(denied.first().details.contains(QStringLiteral("wrong@x.com")));
}

void TransferManagerTest::boundDeviceConsumesNoQuota()
{
    LicenseHarness harness;
    harness.registry->setRow(registryRow(kKey, LicenseStatus::Active, machine(1)));
    harness.fingerprinter->setFingerprint(machine(1));
    auto manager = makeManager(harness);

    const LicenseOutcome outcome = manager->requestTransfer(kKey, QStringLiteral("owner@example.com"));
    QVERIFY(outcome.ok());
    QCOMPARE(harness.registry->row(kKey).transferCount, 0);
    QVERIFY(harness.registry->postsValue().isEmpty());
    QVERIFY(harness.notifier->alertsValue().isEmpty());
    QCOMPARE(harness.auditEvents(AuditEventType::TransferApproved).size(), 0);
}

void TransferManagerTest::unreachableRegistryDeniesTransfer()
{
    LicenseHarness harness;
    harness.registry->setRow(registryRow(kKey, LicenseStatus::Active, machine(1)));
    harness.registry->setNetworkDown(true);
    QVERIFY(harness.store->save(boundRecord(machine(1), QStringLiteral("owner@example.com"))));
    harness.fingerprinter->setFingerprint(machine(2));
    auto manager = makeManager(harness);

    const LicenseOutcome outcome = manager->requestTransfer(kKey, QStringLiteral("owner@example.com"));
    QCOMPARE(outcome.error, LicenseErrorKind::Network);
    QCOMPARE(harness.store->load()->hardwareBindings, machine(1));
    QVERIFY(harness.notifier->alertsValue().isEmpty());
    QCOMPARE(harness.auditEvents(AuditEventType::TransferDenied).size(), 1);
}

void TransferManagerTest::revokedLicenseCannotBeTransferred()
{
    LicenseHarness harness;
    harness.registry->setRow(registryRow(kKey, LicenseStatus::Revoked, machine(1)));
    harness.fingerprinter->setFingerprint(machine(2));
    auto manager = makeManager(harness);

    const LicenseOutcome outcome = manager->requestTransfer(kKey, QStringLiteral("owner@example.com"));
    QCOMPARE(outcome.error, LicenseErrorKind::Revoked);
    QCOMPARE(outcome.state, LicenseState::Revoked);
    QVERIFY(!harness.store->load().has_value());
    QVERIFY(harness.registry->postsValue().isEmpty());
}

void TransferManagerTest::emptyKeyIsInvalidInput()
{
    LicenseHarness harness;
    auto manager = makeManager(harness);

    const LicenseOutcome outcome = manager->requestTransfer(QStringLiteral("   "), QStringLiteral("owner@example.com"));
    QCOMPARE(outcome.error, LicenseErrorKind::InvalidInput);
    QCOMPARE(harness.registry->fetchCountValue(), 0);
}

QTEST_MAIN(TransferManagerTest)
#include "TransferManagerTest.moc"
