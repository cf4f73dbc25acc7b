#include <QtTest/QtTest>

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QTemporaryDir>

#include "utils/RuntimeUtils.hpp"

using namespace wb::license::utils;

class RuntimeUtilsTest : public QObject {
    Q_OBJECT

private slots:
    void cleanup();
    void lockPathDefaultsToDataDirectory();
    void lockPathHonoursOverride();
    void secondWriterIsRefused();
    void lockIsReleasedOnDestruction();
    void missingDirectoryIsCreated();
};

void RuntimeUtilsTest::cleanup()
{
    qunsetenv("WB_LICENSE_LOCK_FILE");
}

void RuntimeUtilsTest::lockPathDefaultsToDataDirectory()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QCOMPARE(writerLockFilePath(dir.path()), QDir::cleanPath(dir.path()) + QStringLiteral("/license_state.lock"));
    QVERIFY(writerLockFilePath(QString()).endsWith(QStringLiteral("/license/license_state.lock")));
}

void RuntimeUtilsTest::lockPathHonoursOverride()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString custom = dir.filePath(QStringLiteral("custom.lock"));
    qputenv("WB_LICENSE_LOCK_FILE", custom.toUtf8());
    QCOMPARE(writerLockFilePath(QStringLiteral("/unused")), QDir::cleanPath(custom));
}

void RuntimeUtilsTest::secondWriterIsRefused()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = writerLockFilePath(dir.path());

    StateWriterLock first(path);
    QVERIFY(first.tryAcquire());
    QVERIFY(first.isHeld());
    QVERIFY(!first.isContended());

    StateWriterLock second(path);
    QVERIFY(!second.tryAcquire());
    QVERIFY(!second.isHeld());
    QVERIFY(second.isContended());
    QCOMPARE(second.holder().pid, QCoreApplication::applicationPid());
    QVERIFY(second.errorString().contains(QString::number(QCoreApplication::applicationPid())));

    first.release();
    QVERIFY(!first.isHeld());
    QVERIFY(second.tryAcquire());
    QVERIFY(!second.isContended());
}

void RuntimeUtilsTest::lockIsReleasedOnDestruction()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = writerLockFilePath(dir.path());

    {
        StateWriterLock first(path);
        QVERIFY(first.tryAcquire());
    }
    QVERIFY(!QFileInfo::exists(path));

    StateWriterLock second(path);
    QVERIFY(second.tryAcquire());
    QCOMPARE(second.lockFilePath(), path);
}

void RuntimeUtilsTest::missingDirectoryIsCreated()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("nested/state/license_state.lock"));

    StateWriterLock lock(path);
    QVERIFY2(lock.tryAcquire(), qPrintable(lock.errorString()));
    QVERIFY(QFileInfo::exists(path));
}

QTEST_MAIN(RuntimeUtilsTest)
#include "RuntimeUtilsTest.moc"
