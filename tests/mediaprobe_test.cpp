/**
 * @file mediaprobe_test.cpp
 * @brief Unit tests for ffprobe output parsing
 */

#include <QtTest/QtTest>

#include "appsettings.h"
#include "mediaprobe.h"
#include "processmanager.h"

#include <QFile>
#include <QTemporaryDir>

class MediaProbeTest : public QObject
{
    Q_OBJECT

private:
    QString testDataPath(const QString& fileName) const;
    QByteArray readFixture(const QString& fileName) const;

private slots:
    void testParseProbeOutput();
    void testAudioOnlyRejected();
    void testMalformedJsonRejected();
    void testDurationFallsBackToStream();
    void testParseFrameRate_data();
    void testParseFrameRate();
    void testProbeWithFakeFfprobe();
    void testProbeMissingFile();
};

QString MediaProbeTest::testDataPath(const QString& fileName) const
{
    return QCoreApplication::applicationDirPath() + "/test_data/" + fileName;
}

QByteArray MediaProbeTest::readFixture(const QString& fileName) const
{
    QFile file(testDataPath(fileName));
    if (!file.open(QIODevice::ReadOnly))
    {
        return QByteArray();
    }
    return file.readAll();
}

void MediaProbeTest::testParseProbeOutput()
{
    const QByteArray json = readFixture("ffprobe_output.json");
    QVERIFY2(!json.isEmpty(), "Fixture ffprobe_output.json is missing");

    MediaInfo info;
    QString error;
    QVERIFY2(MediaProbe::parseProbeOutput(json, info, error), qPrintable(error));
    QCOMPARE(info.width, 1920);
    QCOMPARE(info.height, 1080);
    QCOMPARE(info.codec, QString("h264"));
    QVERIFY(qAbs(info.durationSeconds - 1421.013) < 0.001);
    QCOMPARE(info.bitRate, qint64(5120000));
    QVERIFY(qAbs(info.fps - 23.976) < 0.001);
}

void MediaProbeTest::testAudioOnlyRejected()
{
    MediaInfo info;
    QString error;
    QVERIFY(!MediaProbe::parseProbeOutput(readFixture("ffprobe_audio_only.json"), info, error));
    QVERIFY(!error.isEmpty());
}

void MediaProbeTest::testMalformedJsonRejected()
{
    MediaInfo info;
    QString error;
    QVERIFY(!MediaProbe::parseProbeOutput("{\"streams\": [", info, error));
    QVERIFY(!MediaProbe::parseProbeOutput("[]", info, error));
}

void MediaProbeTest::testDurationFallsBackToStream()
{
    const QByteArray json = R"({
        "streams": [{"codec_type": "video", "codec_name": "hevc", "width": 1280, "height": 720,
                     "duration": "60.500000", "bit_rate": "900000", "avg_frame_rate": "25/1"}],
        "format": {}
    })";

    MediaInfo info;
    QString error;
    QVERIFY2(MediaProbe::parseProbeOutput(json, info, error), qPrintable(error));
    QCOMPARE(info.durationSeconds, 60.5);
    QCOMPARE(info.bitRate, qint64(900000));
    QCOMPARE(info.fps, 25.0);
}

void MediaProbeTest::testParseFrameRate_data()
{
    QTest::addColumn<QString>("text");
    QTest::addColumn<bool>("valid");
    QTest::addColumn<double>("fps");

    QTest::newRow("ntsc film") << "24000/1001" << true << 24000.0 / 1001.0;
    QTest::newRow("plain integer") << "25" << true << 25.0;
    QTest::newRow("fraction") << "30/1" << true << 30.0;
    QTest::newRow("zero denominator") << "30/0" << false << 0.0;
    QTest::newRow("garbage") << "abc" << false << 0.0;
    QTest::newRow("three parts") << "1/2/3" << false << 0.0;
    QTest::newRow("negative") << "-25/1" << false << 0.0;
    QTest::newRow("empty") << "" << false << 0.0;
}

void MediaProbeTest::testParseFrameRate()
{
    QFETCH(QString, text);
    QFETCH(bool, valid);
    QFETCH(double, fps);

    double parsed = 0.0;
    QCOMPARE(MediaProbe::parseFrameRate(text, parsed), valid);
    if (valid)
    {
        QVERIFY(qAbs(parsed - fps) < 1e-9);
    }
}

void MediaProbeTest::testProbeWithFakeFfprobe()
{
#ifdef Q_OS_WIN
    QSKIP("Fake ffprobe is a shell script");
#endif
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());

    const QString scriptPath = tempDir.filePath("fake_ffprobe.sh");
    QFile script(scriptPath);
    QVERIFY(script.open(QIODevice::WriteOnly));
    script.write(QString("#!/bin/sh\ncat '%1'\n").arg(testDataPath("ffprobe_output.json")).toUtf8());
    script.close();
    QVERIFY(QFile::setPermissions(scriptPath, QFile::ReadOwner | QFile::WriteOwner | QFile::ExeOwner));

    const QString videoPath = tempDir.filePath("video.mp4");
    QFile video(videoPath);
    QVERIFY(video.open(QIODevice::WriteOnly));
    video.write("not really a video");
    video.close();

    AppSettings::instance().setFfprobePath(scriptPath);
    ProcessManager procManager;
    MediaProbe probe(&procManager);

    MediaInfo info;
    QString error;
    QVERIFY2(probe.probe(videoPath, info, error), qPrintable(error));
    QCOMPARE(info.height, 1080);
}

void MediaProbeTest::testProbeMissingFile()
{
    ProcessManager procManager;
    MediaProbe probe(&procManager);

    MediaInfo info;
    QString error;
    QVERIFY(!probe.probe("/nonexistent/video.mp4", info, error));
    QVERIFY(!error.isEmpty());
}

QTEST_MAIN(MediaProbeTest)
#include "mediaprobe_test.moc"
