#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include <string>

#include "common/errors.hpp"
#include "common/hash_utils.hpp"
#include "common/id_utils.hpp"

class HashUtilsTests : public QObject
{
    Q_OBJECT
private slots:
    void testSha256BytesKnownVector();
    void testSha256TextTrimsAndJoins();
    void testSha256TextEmptyParts();
    void testSha256FileStreams();
    void testSha256FileMissingThrows();
    void testIsSha256Hex();
    void testAccumulatorMatchesOneShot();
    void testNewIdAfterSortsAfterFloor();
};

void HashUtilsTests::testSha256BytesKnownVector()
{
    QCOMPARE(QString::fromStdString(inspector::sha256Bytes("abc")),
             QStringLiteral("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));
    QCOMPARE(QString::fromStdString(inspector::sha256Bytes("")),
             QStringLiteral("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"));
}

void HashUtilsTests::testSha256TextTrimsAndJoins()
{
    const std::string joined = inspector::sha256Text({"  case-1 ", "\tverify\n", "success"});
    QCOMPARE(QString::fromStdString(joined),
             QString::fromStdString(inspector::sha256Bytes("case-1\nverify\nsuccess")));

    // Field boundaries are part of the digest.
    QVERIFY(inspector::sha256Text({"ab", "c"}) != inspector::sha256Text({"a", "bc"}));
}

void HashUtilsTests::testSha256TextEmptyParts()
{
    QCOMPARE(QString::fromStdString(inspector::sha256Text({"", "x"})),
             QString::fromStdString(inspector::sha256Bytes("\nx")));
    QCOMPARE(QString::fromStdString(inspector::sha256Text(std::vector<std::string>{})),
             QString::fromStdString(inspector::sha256Bytes("")));
}

void HashUtilsTests::testSha256FileStreams()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    // Larger than one read chunk.
    std::string content;
    for (int i = 0; i < 20000; ++i) {
        content += "line " + std::to_string(i) + "\n";
    }
    const QString path = dir.filePath(QStringLiteral("payload.bin"));
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write(content.data(), static_cast<qint64>(content.size()));
    file.close();

    const inspector::FileDigest digest = inspector::sha256File(path.toStdString());
    QCOMPARE(QString::fromStdString(digest.sha256),
             QString::fromStdString(inspector::sha256Bytes(content)));
    QCOMPARE(digest.sizeBytes, static_cast<std::int64_t>(content.size()));
}

void HashUtilsTests::testSha256FileMissingThrows()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const std::string missing = dir.filePath(QStringLiteral("absent.json")).toStdString();
    QVERIFY_THROWS_EXCEPTION(inspector::IOError, inspector::sha256File(missing));
}

void HashUtilsTests::testIsSha256Hex()
{
    QVERIFY(inspector::isSha256Hex(inspector::sha256Bytes("x")));
    QVERIFY(!inspector::isSha256Hex("abc"));
    QVERIFY(!inspector::isSha256Hex(std::string(64, 'g')));
    QVERIFY(!inspector::isSha256Hex(std::string(63, 'a') + "A"));
}

void HashUtilsTests::testAccumulatorMatchesOneShot()
{
    inspector::Sha256Accumulator acc;
    acc.addData("hello ", 6);
    acc.addData("world", 5);
    QCOMPARE(QString::fromStdString(acc.hexDigest()),
             QString::fromStdString(inspector::sha256Bytes("hello world")));
    QCOMPARE(acc.sizeBytes(), static_cast<std::int64_t>(11));
}

void HashUtilsTests::testNewIdAfterSortsAfterFloor()
{
    const std::string first = inspector::newId("evt");
    QVERIFY(first.rfind("evt_", 0) == 0);

    std::string floor = first;
    for (int i = 0; i < 50; ++i) {
        const std::string next = inspector::newIdAfter("evt", floor);
        QVERIFY(next > floor);
        floor = next;
    }

    // A floor from the future still yields a later id.
    const std::string future = "evt_8888888888888_ffffffffffff";
    QVERIFY(inspector::newIdAfter("evt", future) > future);
}

QTEST_MAIN(HashUtilsTests)
#include "test_hash_utils.moc"
