/**
 * @file ffmpegencoder_test.cpp
 * @brief Unit tests for the default Encoder with a fake ffmpeg
 */

#include <QtTest/QtTest>

#include "appsettings.h"
#include "ffmpegencoder.h"

#include <QFile>
#include <QTemporaryDir>

class FfmpegEncoderTest : public QObject
{
    Q_OBJECT

private:
    bool writeScript(const QString& path, const QByteArray& body) const;
    QString makeInput() const;

    QTemporaryDir m_tempDir;
    QString m_okFfmpeg;
    QString m_failingFfmpeg;
    QString m_hangingFfmpeg;

private slots:
    void initTestCase();
    void testHeightForLabel();
    void testBuildArgumentsLowMemory();
    void testEncodeWritesRendition();
    void testUnknownLabel();
    void testFailureRemovesPartialOutput();
    void testCancelStopsProcess();
};

bool FfmpegEncoderTest::writeScript(const QString& path, const QByteArray& body) const
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate) || file.write(body) != body.size())
    {
        return false;
    }
    file.close();
    return QFile::setPermissions(path, QFile::ReadOwner | QFile::WriteOwner | QFile::ExeOwner);
}

QString FfmpegEncoderTest::makeInput() const
{
    const QString path = m_tempDir.filePath("episode_hardsubbed.mp4");
    QFile file(path);
    if (file.open(QIODevice::WriteOnly | QIODevice::Truncate))
    {
        file.write("input");
    }
    return path;
}

void FfmpegEncoderTest::initTestCase()
{
#ifdef Q_OS_WIN
    QSKIP("Fake ffmpeg is a shell script");
#endif
    QVERIFY(m_tempDir.isValid());

    m_okFfmpeg = m_tempDir.filePath("ffmpeg_ok.sh");
    QVERIFY(writeScript(m_okFfmpeg, R"SH(#!/bin/sh
for out; do :; done
echo "frame=5 time=00:00:00.20 bitrate=N/A" >&2
printf 'scaled' > "$out"
)SH"));

    m_failingFfmpeg = m_tempDir.filePath("ffmpeg_fail.sh");
    QVERIFY(writeScript(m_failingFfmpeg, R"SH(#!/bin/sh
for out; do :; done
printf 'partial' > "$out"
echo "Error while filtering" >&2
exit 1
)SH"));

    m_hangingFfmpeg = m_tempDir.filePath("ffmpeg_hang.sh");
    QVERIFY(writeScript(m_hangingFfmpeg, R"SH(#!/bin/sh
for out; do :; done
printf 'partial' > "$out"
exec sleep 30
)SH"));

    AppSettings::instance().setTerminationGraceMs(500);
}

void FfmpegEncoderTest::testHeightForLabel()
{
    QCOMPARE(FfmpegEncoder::heightForLabel("360p"), 360);
    QCOMPARE(FfmpegEncoder::heightForLabel("1080p"), 1080);
    QCOMPARE(FfmpegEncoder::heightForLabel("720"), 0);
    QCOMPARE(FfmpegEncoder::heightForLabel("hd"), 0);
}

void FfmpegEncoderTest::testBuildArgumentsLowMemory()
{
    RenderSettings render;
    render.lowMemoryMode = true;
    AppSettings::instance().setRenderSettings(render);

    FfmpegEncoder encoder;
    const QStringList args = encoder.buildArguments("/in.mp4", 480, "/out.mp4");
    QCOMPARE(args[args.indexOf("-vf") + 1], QString("scale=-2:480"));
    QCOMPARE(args[args.indexOf("-preset") + 1], QString("veryfast"));
    QCOMPARE(args[args.indexOf("-crf") + 1], QString("28"));
    QCOMPARE(args[args.indexOf("-threads") + 1], QString("2"));
    QCOMPARE(args.last(), QString("/out.mp4"));

    AppSettings::instance().setRenderSettings(RenderSettings());
}

void FfmpegEncoderTest::testEncodeWritesRendition()
{
    AppSettings::instance().setFfmpegPath(m_okFfmpeg);
    FfmpegEncoder encoder;

    QString outputPath;
    QString error;
    QVERIFY2(encoder.encode(makeInput(), "720p", CancellationToken(), outputPath, error), qPrintable(error));
    QCOMPARE(outputPath, m_tempDir.filePath("episode_hardsubbed_720p.mp4"));
    QVERIFY(QFileInfo::exists(outputPath));
}

void FfmpegEncoderTest::testUnknownLabel()
{
    AppSettings::instance().setFfmpegPath(m_okFfmpeg);
    FfmpegEncoder encoder;

    QString outputPath;
    QString error;
    QVERIFY(!encoder.encode(makeInput(), "4k", CancellationToken(), outputPath, error));
    QVERIFY(error.contains("4k"));
}

void FfmpegEncoderTest::testFailureRemovesPartialOutput()
{
    AppSettings::instance().setFfmpegPath(m_failingFfmpeg);
    FfmpegEncoder encoder;

    QString outputPath;
    QString error;
    QVERIFY(!encoder.encode(makeInput(), "480p", CancellationToken(), outputPath, error));
    QVERIFY2(error.contains("Error while filtering"), qPrintable(error));
    QVERIFY(!QFileInfo::exists(m_tempDir.filePath("episode_hardsubbed_480p.mp4")));
}

void FfmpegEncoderTest::testCancelStopsProcess()
{
    AppSettings::instance().setFfmpegPath(m_hangingFfmpeg);
    FfmpegEncoder encoder;

    QElapsedTimer timer;
    timer.start();
    const CancellationToken token([&timer]() { return timer.elapsed() > 300; });

    QString outputPath;
    QString error;
    QVERIFY(!encoder.encode(makeInput(), "360p", token, outputPath, error));
    QVERIFY(timer.elapsed() < 10000);
    QVERIFY(!QFileInfo::exists(m_tempDir.filePath("episode_hardsubbed_360p.mp4")));
}

QTEST_MAIN(FfmpegEncoderTest)
#include "ffmpegencoder_test.moc"
