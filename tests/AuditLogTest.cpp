#include <QtTest/QtTest>

#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

#include <thread>
#include <vector>

#include "license/AuditLog.hpp"

using namespace wb::license;

namespace {

AuditEvent makeEvent(AuditEventType type, const QString& key, const QDateTime& timestamp,
                     const QString& details = {})
{
    AuditEvent event;
    event.eventType = type;
    event.licenseKey = key;
    event.timestamp = timestamp;
    event.details = details;
    return event;
}

} // namespace

class AuditLogTest : public QObject {
    Q_OBJECT

private slots:
    void appendWritesOneJsonLinePerEvent();
    void queryFiltersByTypeKeyAndTime();
    void queryLimitReturnsNewest();
    void malformedLinesAreSkipped();
    void appendAfterTornWriteStartsNewLine();
    void concurrentAppendsKeepEveryLine();
    void missingTimestampIsStamped();
};

void AuditLogTest::appendWritesOneJsonLinePerEvent()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    AuditLog log(dir.filePath(QStringLiteral("nested/audit.jsonl")));

    AuditEvent event = makeEvent(AuditEventType::TransferDenied, QStringLiteral("WB-KEY-0001"),
                                 QDateTime(QDate(2026, 1, 2), QTime(3, 4, 5), Qt::UTC),
                                 QStringLiteral("transfer limit reached (3/3)"));
    event.sourceAddress = QStringLiteral("192.0.2.1");
    QString error;
    QVERIFY2(log.append(event, &error), qPrintable(error));
    QVERIFY(log.append(makeEvent(AuditEventType::ValidateOk, QStringLiteral("WB-KEY-0001"),
                                 QDateTime::currentDateTimeUtc())));

    QFile file(log.filePath());
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QList<QByteArray> lines = file.readAll().trimmed().split('\n');
    QCOMPARE(lines.size(), 2);

    const QJsonObject first = QJsonDocument::fromJson(lines.first()).object();
    QCOMPARE(first.value(QStringLiteral("eventType")).toString(), QStringLiteral("TRANSFER_DENIED"));
    QCOMPARE(first.value(QStringLiteral("licenseKey")).toString(), QStringLiteral("WB-KEY-0001"));
    QCOMPARE(first.value(QStringLiteral("sourceIP")).toString(), QStringLiteral("192.0.2.1"));
    QVERIFY(first.value(QStringLiteral("timestamp")).toString().startsWith(QStringLiteral("2026-01-02T03:04:05")));
    QCOMPARE(log.count(), 2);
}

void AuditLogTest::queryFiltersByTypeKeyAndTime()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    AuditLog log(dir.filePath(QStringLiteral("audit.jsonl")));

    const QDateTime base(QDate(2026, 2, 1), QTime(8, 0), Qt::UTC);
    QVERIFY(log.append(makeEvent(AuditEventType::Activate, QStringLiteral("KEY-A"), base)));
    QVERIFY(log.append(makeEvent(AuditEventType::TransferRequested, QStringLiteral("KEY-A"), base.addSecs(60))));
    QVERIFY(log.append(makeEvent(AuditEventType::TransferDenied, QStringLiteral("KEY-B"), base.addSecs(120))));
    QVERIFY(log.append(makeEvent(AuditEventType::TransferDenied, QStringLiteral("KEY-A"), base.addSecs(180))));

    AuditQuery byType;
    byType.types = {AuditEventType::TransferDenied};
    QCOMPARE(log.query(byType).size(), 2);

    AuditQuery byKey;
    byKey.licenseKey = QStringLiteral("key-a");
    const QList<AuditEvent> keyEvents = log.query(byKey);
    QCOMPARE(keyEvents.size(), 3);
    QCOMPARE(keyEvents.first().eventType, AuditEventType::Activate);

    AuditQuery window;
    window.since = base.addSecs(60);
    window.until = base.addSecs(120);
    const QList<AuditEvent> windowed = log.query(window);
    QCOMPARE(windowed.size(), 2);
    QCOMPARE(windowed.at(0).eventType, AuditEventType::TransferRequested);
    QCOMPARE(windowed.at(1).licenseKey, QStringLiteral("KEY-B"));
}

void AuditLogTest::queryLimitReturnsNewest()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    AuditLog log(dir.filePath(QStringLiteral("audit.jsonl")));

    const QDateTime base = QDateTime::currentDateTimeUtc();
    for (int i = 0; i < 5; ++i)
        QVERIFY(log.append(makeEvent(AuditEventType::ValidateOk, QStringLiteral("KEY"), base.addSecs(i),
                                     QString::number(i))));

    AuditQuery query;
    query.limit = 2;
    const QList<AuditEvent> newest = log.query(query);
    QCOMPARE(newest.size(), 2);
    QCOMPARE(newest.at(0).details, QStringLiteral("3"));
    QCOMPARE(newest.at(1).details, QStringLiteral("4"));
}

void AuditLogTest::malformedLinesAreSkipped()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("audit.jsonl"));
    {
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("{\"eventType\":\"ACTIVATE\",\"licenseKey\":\"K\",\"timestamp\":\"2026-01-01T00:00:00Z\"}\n");
        file.write("{truncated\n");
        file.write("{\"eventType\":\"SOMETHING_ELSE\",\"licenseKey\":\"K\"}\n");
        file.write("\n");
    }

    AuditLog log(path);
    QCOMPARE(log.count(), 1);
    QVERIFY(log.append(makeEvent(AuditEventType::ValidateFail, QStringLiteral("K"), QDateTime::currentDateTimeUtc())));
    QCOMPARE(log.count(), 2);
}

void AuditLogTest::appendAfterTornWriteStartsNewLine()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("audit.jsonl"));
    {
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("{\"eventType\":\"ACTIVATE\",\"licenseKey\":\"K\",\"timestamp\":\"2026-01-01T00:00:00Z\"}\n");
        file.write("{\"eventType\":\"ACTIVATE\",\"ti");
    }

    AuditLog log(path);
    QCOMPARE(log.count(), 1);
    const QDateTime when(QDate(2026, 1, 2), QTime(8, 0), Qt::UTC);
    QVERIFY(log.append(makeEvent(AuditEventType::ValidateOk, QStringLiteral("K"), when)));

    AuditQuery query;
    query.types = {AuditEventType::ValidateOk};
    const QList<AuditEvent> events = log.query(query);
    QCOMPARE(events.size(), 1);
    QCOMPARE(events.first().timestamp, when);
    QCOMPARE(log.count(), 2);
}

void AuditLogTest::concurrentAppendsKeepEveryLine()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    AuditLog log(dir.filePath(QStringLiteral("audit.jsonl")));

    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&log, t]() {
            for (int i = 0; i < 25; ++i)
                log.append(makeEvent(AuditEventType::ValidateOk, QStringLiteral("KEY-%1").arg(t),
                                     QDateTime::currentDateTimeUtc()));
        });
    }
    for (std::thread& writer : writers)
        writer.join();

    QCOMPARE(log.count(), 100);
}

void AuditLogTest::missingTimestampIsStamped()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    AuditLog log(dir.filePath(QStringLiteral("audit.jsonl")));

    const QDateTime before = QDateTime::currentDateTimeUtc().addSecs(-1);
    QVERIFY(log.append(makeEvent(AuditEventType::RevokedDetected, QStringLiteral("KEY"), QDateTime())));
    const QList<AuditEvent> events = log.query();
    QCOMPARE(events.size(), 1);
    QVERIFY(events.first().timestamp.isValid());
    QVERIFY(events.first().timestamp >= before);
}

QTEST_MAIN(AuditLogTest)
#include "AuditLogTest.moc"
