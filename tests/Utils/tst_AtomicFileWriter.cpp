#include <QtTest>

#include <QFile>
#include <QTemporaryDir>

#include "utils/AtomicFileWriter.h"

using Hawk::AtomicFileWriter;

class tst_AtomicFileWriter : public QObject
{
    Q_OBJECT

private slots:
    void testWriteBytesCreatesParents();
    void testWriteBytesReplacesContents();
    void testWriteImage();
    void testWriteNullImageFails();
    void testUniquePath();
    void testUniquePathWithoutSuffix();
};

void tst_AtomicFileWriter::testWriteBytesCreatesParents()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());

    const QString filePath = tempDir.filePath("a/b/events.jsonl");
    AtomicFileWriter::Error error;
    QVERIFY2(AtomicFileWriter::writeBytes("{}\n", filePath, &error), qPrintable(error.message));

    QFile file(filePath);
    QVERIFY(file.open(QIODevice::ReadOnly));
    QCOMPARE(file.readAll(), QByteArray("{}\n"));
}

void tst_AtomicFileWriter::testWriteBytesReplacesContents()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());

    const QString filePath = tempDir.filePath("plan.json");
    QVERIFY(AtomicFileWriter::writeBytes("first", filePath));
    QVERIFY(AtomicFileWriter::writeBytes("second", filePath));

    QFile file(filePath);
    QVERIFY(file.open(QIODevice::ReadOnly));
    QCOMPARE(file.readAll(), QByteArray("second"));
}

void tst_AtomicFileWriter::testWriteImage()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());

    QImage image(12, 10, QImage::Format_ARGB32);
    image.fill(QColor(0, 0, 255, 255));

    const QString filePath = tempDir.filePath("screenshots/step.png");
    AtomicFileWriter::Error error;
    QVERIFY2(AtomicFileWriter::writeImage(image, filePath, QByteArrayLiteral("png"), &error),
             qPrintable(error.message));

    const QImage loaded(filePath);
    QCOMPARE(loaded.size(), QSize(12, 10));
    QCOMPARE(loaded.pixelColor(3, 3), QColor(0, 0, 255, 255));
}

void tst_AtomicFileWriter::testWriteNullImageFails()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());

    AtomicFileWriter::Error error;
    QVERIFY(!AtomicFileWriter::writeImage(QImage(), tempDir.filePath("null.png"),
                                          QByteArrayLiteral("png"), &error));
    QCOMPARE(error.stage, QString("encode"));
    QVERIFY(!QFile::exists(tempDir.filePath("null.png")));
}

void tst_AtomicFileWriter::testUniquePath()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());

    const QString filePath = tempDir.filePath("trace.json");
    QCOMPARE(AtomicFileWriter::uniquePath(filePath), filePath);

    QVERIFY(AtomicFileWriter::writeBytes("1", filePath));
    QCOMPARE(AtomicFileWriter::uniquePath(filePath), tempDir.filePath("trace_1.json"));

    QVERIFY(AtomicFileWriter::writeBytes("2", tempDir.filePath("trace_1.json")));
    QCOMPARE(AtomicFileWriter::uniquePath(filePath), tempDir.filePath("trace_2.json"));
}

void tst_AtomicFileWriter::testUniquePathWithoutSuffix()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());

    const QString filePath = tempDir.filePath("profile");
    QVERIFY(AtomicFileWriter::writeBytes("x", filePath));
    QCOMPARE(AtomicFileWriter::uniquePath(filePath), tempDir.filePath("profile_1"));
}

QTEST_MAIN(tst_AtomicFileWriter)
#include "tst_AtomicFileWriter.moc"
