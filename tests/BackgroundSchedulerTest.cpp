#include <QtTest/QtTest>
#include <QSignalSpy>

#include <limits>

#include "LicenseTestSupport.hpp"
#include "license/BackgroundScheduler.hpp"

using namespace wb::license;
using namespace wb::license::testing;

namespace {

const QString kKey = QStringLiteral("WB-SCHE-DULE-0001");

void seedActiveLicense(LicenseHarness& harness, LicenseStatus remoteStatus = LicenseStatus::Active)
{
    LicenseRecord record;
    record.key = kKey;
    record.status = LicenseStatus::Active;
    record.tier = LicenseTier::Trial;
    record.hardwareBindings = machineA();
    record.licenseeEmail = QStringLiteral("owner@example.com");
    record.lastVerifiedAt = harness.clock->now();
    record.offlineGraceUntil = harness.clock->now().addDays(7);
    QVERIFY(harness.store->save(record));

    RegistryRecord row = registryRow(kKey, remoteStatus, machineA());
    row.tier = LicenseTier::Trial;
    harness.registry->setRow(row);
}

} // namespace

class BackgroundSchedulerTest : public QObject {
    Q_OBJECT

private slots:
    void intervalFollowsLicenseTier();
    void longIntervalDoesNotOverflow();
    void periodicRunsRevalidate();
    void failuresSurfaceAsWarnings();
    void offlineGraceRaisesWarning();
    void stopPreventsFurtherRuns();
    void triggerNowRunsImmediately();
};

void BackgroundSchedulerTest::intervalFollowsLicenseTier()
{
    LicenseHarness harness;
    auto validator = harness.createValidator();
    BackgroundScheduler scheduler(validator);
    QCOMPARE(scheduler.nextIntervalMs(), 24 * 3600 * 1000);

    seedActiveLicense(harness);
    QCOMPARE(scheduler.nextIntervalMs(), 3600 * 1000);

    scheduler.setIntervalOverrideForTesting(250);
    QCOMPARE(scheduler.nextIntervalMs(), 250);
}

void BackgroundSchedulerTest::longIntervalDoesNotOverflow()
{
    LicenseHarness harness;
    harness.settings.maximumCheckIntervalSeconds = std::numeric_limits<int>::max();
    harness.settings.standardCheckIntervalHours = 24 * 365 * 100;
    auto validator = harness.createValidator();

    BackgroundScheduler scheduler(validator);
    QVERIFY(scheduler.nextIntervalMs() > 0);
    scheduler.start();
    QVERIFY(scheduler.isTimerActiveForTesting());
    scheduler.stop();
}

void BackgroundSchedulerTest::periodicRunsRevalidate()
{
    LicenseHarness harness;
    seedActiveLicense(harness);
    auto validator = harness.createValidator();

    BackgroundScheduler scheduler(validator);
    scheduler.setIntervalOverrideForTesting(50);
    QSignalSpy finishedSpy(&scheduler, &BackgroundScheduler::validationFinished);
    QSignalSpy runningSpy(&scheduler, &BackgroundScheduler::runningChanged);

    scheduler.start();
    QVERIFY(scheduler.isRunning());
    QCOMPARE(runningSpy.count(), 1);
    QVERIFY(scheduler.isTimerActiveForTesting());

    QTRY_VERIFY_WITH_TIMEOUT(finishedSpy.count() >= 2, 5000);
    const auto outcome = finishedSpy.first().first().value<LicenseOutcome>();
    QVERIFY(outcome.ok());
    QCOMPARE(outcome.mode, ValidationMode::Background);
    QVERIFY(harness.registry->fetchCountValue() >= 2);

    scheduler.stop();
    QVERIFY(!scheduler.isRunning());
    QVERIFY(QThreadPool::globalInstance()->waitForDone(5000));
}

void BackgroundSchedulerTest::failuresSurfaceAsWarnings()
{
    LicenseHarness harness;
    seedActiveLicense(harness, LicenseStatus::Revoked);
    auto validator = harness.createValidator();

    BackgroundScheduler scheduler(validator);
    scheduler.setIntervalOverrideForTesting(50);
    QSignalSpy finishedSpy(&scheduler, &BackgroundScheduler::validationFinished);
    QSignalSpy warningSpy(&scheduler, &BackgroundScheduler::warningRaised);

    scheduler.start();
    QTRY_VERIFY_WITH_TIMEOUT(finishedSpy.count() >= 1, 5000);
    const auto outcome = finishedSpy.first().first().value<LicenseOutcome>();
    QCOMPARE(outcome.error, LicenseErrorKind::Revoked);
    QVERIFY(!outcome.blocking);
    QVERIFY(warningSpy.count() >= 1);
    QVERIFY(warningSpy.first().first().toString().contains(QStringLiteral("revoked")));

    // The schedule keeps going after a failure.
    QTRY_VERIFY_WITH_TIMEOUT(scheduler.isTimerActiveForTesting() || scheduler.isBusy(), 1000);
    scheduler.stop();
    QVERIFY(QThreadPool::globalInstance()->waitForDone(5000));
}

void BackgroundSchedulerTest::offlineGraceRaisesWarning()
{
    LicenseHarness harness;
    seedActiveLicense(harness);
    harness.registry->setNetworkDown(true);
    auto validator = harness.createValidator();

    BackgroundScheduler scheduler(validator);
    QSignalSpy warningSpy(&scheduler, &BackgroundScheduler::warningRaised);
    QSignalSpy finishedSpy(&scheduler, &BackgroundScheduler::validationFinished);

    scheduler.triggerNow();
    QTRY_COMPARE_WITH_TIMEOUT(finishedSpy.count(), 1, 5000);
    QCOMPARE(finishedSpy.first().first().value<LicenseOutcome>().state, LicenseState::OfflineGrace);
    QCOMPARE(warningSpy.count(), 1);
    QVERIFY(warningSpy.first().first().toString().contains(QStringLiteral("Offline grace active until")));
}

void BackgroundSchedulerTest::stopPreventsFurtherRuns()
{
    LicenseHarness harness;
    seedActiveLicense(harness);
    auto validator = harness.createValidator();

    BackgroundScheduler scheduler(validator);
    scheduler.setIntervalOverrideForTesting(100);
    QSignalSpy finishedSpy(&scheduler, &BackgroundScheduler::validationFinished);

    scheduler.start();
    scheduler.stop();
    QVERIFY(!scheduler.isTimerActiveForTesting());
    QTest::qWait(300);
    QCOMPARE(finishedSpy.count(), 0);
    QCOMPARE(harness.registry->fetchCountValue(), 0);
}

void BackgroundSchedulerTest::triggerNowRunsImmediately()
{
    LicenseHarness harness;
    seedActiveLicense(harness);
    auto validator = harness.createValidator();

    BackgroundScheduler scheduler(validator);
    QThreadPool pool;
    scheduler.setThreadPoolForTesting(&pool);
    QSignalSpy finishedSpy(&scheduler, &BackgroundScheduler::validationFinished);
    QSignalSpy busySpy(&scheduler, &BackgroundScheduler::busyChanged);

    scheduler.triggerNow();
    QVERIFY(scheduler.isBusy());
    QTRY_COMPARE_WITH_TIMEOUT(finishedSpy.count(), 1, 5000);
    QVERIFY(!scheduler.isBusy());
    QCOMPARE(busySpy.count(), 2);
    // Not started, so nothing is scheduled afterwards.
    QVERIFY(!scheduler.isTimerActiveForTesting());
    QVERIFY(pool.waitForDone(1000));
}

QTEST_MAIN(BackgroundSchedulerTest)
#include "BackgroundSchedulerTest.moc"
