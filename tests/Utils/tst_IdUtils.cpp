#include <QtTest>

#include <QSet>

#include "utils/IdUtils.h"

using namespace Hawk;

class tst_IdUtils : public QObject
{
    Q_OBJECT

private slots:
    void testRandomHexLength_data();
    void testRandomHexLength();
    void testSessionIdFormat();
    void testPlanAndTraceIds();
    void testIsSessionId_data();
    void testIsSessionId();
    void testIdsAreDistinct();
};

void tst_IdUtils::testRandomHexLength_data()
{
    QTest::addColumn<int>("length");
    QTest::newRow("zero") << 0;
    QTest::newRow("short") << 6;
    QTest::newRow("word") << 8;
    QTest::newRow("odd") << 13;
    QTest::newRow("uuid") << 32;
}

void tst_IdUtils::testRandomHexLength()
{
    QFETCH(int, length);
    const QString hex = IdUtils::randomHex(length);
    QCOMPARE(hex.size(), length);
    QVERIFY(QRegularExpression("^[0-9a-f]*$").match(hex).hasMatch());
}

void tst_IdUtils::testSessionIdFormat()
{
    const QString id = IdUtils::newSessionId(QDate(2026, 2, 3));
    QVERIFY(id.startsWith("hawk-20260203-"));
    QCOMPARE(id.size(), QString("hawk-20260203-").size() + 6);
    QVERIFY(IdUtils::isSessionId(id));
}

void tst_IdUtils::testPlanAndTraceIds()
{
    const QString planId = IdUtils::newPlanId();
    QVERIFY(planId.startsWith("tp_"));
    QCOMPARE(planId.size(), 11);

    const QString traceId = IdUtils::newTraceId();
    QVERIFY(traceId.startsWith("trace_"));
    QCOMPARE(traceId.size(), 38);
}

void tst_IdUtils::testIsSessionId_data()
{
    QTest::addColumn<QString>("id");
    QTest::addColumn<bool>("valid");
    QTest::newRow("valid") << "hawk-20260101-0a1b2c" << true;
    QTest::newRow("upper hex") << "hawk-20260101-0A1B2C" << false;
    QTest::newRow("short suffix") << "hawk-20260101-0a1b2" << false;
    QTest::newRow("short date") << "hawk-2026011-0a1b2c" << false;
    QTest::newRow("prefix") << "hwk-20260101-0a1b2c" << false;
    QTest::newRow("empty") << "" << false;
}

void tst_IdUtils::testIsSessionId()
{
    QFETCH(QString, id);
    QFETCH(bool, valid);
    QCOMPARE(IdUtils::isSessionId(id), valid);
}

void tst_IdUtils::testIdsAreDistinct()
{
    QSet<QString> ids;
    for (int i = 0; i < 100; ++i) {
        ids.insert(IdUtils::newTraceId());
    }
    QCOMPARE(ids.size(), 100);
}

QTEST_MAIN(tst_IdUtils)
#include "tst_IdUtils.moc"
