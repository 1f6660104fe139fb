/**
 * @file processmanager_test.cpp
 * @brief Unit tests for the blocking child process wrapper
 */

#include <QtTest/QtTest>

#include "processmanager.h"

#include <QElapsedTimer>

class ProcessManagerTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void testReadLineSplitsCarriageReturns();
    void testReadLineReturnsTailWithoutNewline();
    void testReadLineTimeoutWhileRunning();
    void testExitCodeReported();
    void testRecentOutputKeepsLastLines();
    void testTerminateGracefully();
    void testStartFailure();
    void testExecuteAndWait();
    void testExecuteAndWaitTimeout();
};

void ProcessManagerTest::initTestCase()
{
#ifdef Q_OS_WIN
    QSKIP("Tests rely on /bin/sh");
#endif
}

void ProcessManagerTest::testReadLineSplitsCarriageReturns()
{
    ProcessManager manager;
    QVERIFY(manager.startProcess("/bin/sh", {"-c", "printf 'first\\rsecond\\r\\nthird\\n'"}));

    QStringList lines;
    QString line;
    while (manager.readLine(line, 5000) == ProcessManager::ReadResult::Line)
    {
        lines.append(line);
    }

    QCOMPARE(lines, QStringList({"first", "second", "third"}));
    QVERIFY(manager.waitForFinished(5000));
    QCOMPARE(manager.exitCode(), 0);
    QVERIFY(!manager.wasKilled());
}

void ProcessManagerTest::testReadLineReturnsTailWithoutNewline()
{
    ProcessManager manager;
    QVERIFY(manager.startProcess("/bin/sh", {"-c", "printf 'only tail'"}));

    QString line;
    QCOMPARE(manager.readLine(line, 5000), ProcessManager::ReadResult::Line);
    QCOMPARE(line, QString("only tail"));
    QCOMPARE(manager.readLine(line, 5000), ProcessManager::ReadResult::Closed);
}

void ProcessManagerTest::testReadLineTimeoutWhileRunning()
{
    ProcessManager manager;
    QVERIFY(manager.startProcess("/bin/sh", {"-c", "sleep 5"}));

    QString line;
    QCOMPARE(manager.readLine(line, 100), ProcessManager::ReadResult::Timeout);
    QVERIFY(manager.isRunning());

    manager.terminateGracefully(1000);
    QVERIFY(!manager.isRunning());
}

void ProcessManagerTest::testExitCodeReported()
{
    ProcessManager manager;
    QVERIFY(manager.startProcess("/bin/sh", {"-c", "echo failing >&2; exit 3"}));

    QString line;
    QCOMPARE(manager.readLine(line, 5000), ProcessManager::ReadResult::Line);
    QCOMPARE(line, QString("failing"));
    QCOMPARE(manager.readLine(line, 5000), ProcessManager::ReadResult::Closed);
    QCOMPARE(manager.exitStatus(), QProcess::NormalExit);
    QCOMPARE(manager.exitCode(), 3);
}

void ProcessManagerTest::testRecentOutputKeepsLastLines()
{
    ProcessManager manager;
    QVERIFY(manager.startProcess("/bin/sh", {"-c", "i=1; while [ $i -le 30 ]; do echo line$i; i=$((i+1)); done"}));

    QString line;
    while (manager.readLine(line, 5000) == ProcessManager::ReadResult::Line)
    {
    }

    const QStringList recent = manager.recentOutput();
    QCOMPARE(recent.size(), 20);
    QCOMPARE(recent.first(), QString("line11"));
    QCOMPARE(recent.last(), QString("line30"));
}

void ProcessManagerTest::testTerminateGracefully()
{
    ProcessManager manager;
    QVERIFY(manager.startProcess("/bin/sh", {"-c", "trap '' TERM; exec sleep 30"}));

    QElapsedTimer timer;
    timer.start();
    // SIGTERM игнорируется, должен сработать kill после паузы
    manager.terminateGracefully(300);

    QVERIFY(!manager.isRunning());
    QVERIFY(manager.wasKilled());
    QVERIFY(timer.elapsed() < 10000);
    QCOMPARE(manager.exitStatus(), QProcess::CrashExit);
}

void ProcessManagerTest::testStartFailure()
{
    ProcessManager manager;
    QSignalSpy errorSpy(&manager, &ProcessManager::processError);
    QVERIFY(!manager.startProcess("/nonexistent/ffmpeg-binary", {"-version"}));
    QVERIFY(errorSpy.count() > 0);
}

void ProcessManagerTest::testExecuteAndWait()
{
    ProcessManager manager;
    QByteArray output;
    QVERIFY(manager.executeAndWait("/bin/sh", {"-c", "printf '{\"ok\": true}'"}, output));
    QCOMPARE(output, QByteArray("{\"ok\": true}"));

    QByteArray failedOutput;
    QSignalSpy errorSpy(&manager, &ProcessManager::processError);
    QVERIFY(!manager.executeAndWait("/bin/sh", {"-c", "exit 2"}, failedOutput));
    QVERIFY(errorSpy.count() > 0);
}

void ProcessManagerTest::testExecuteAndWaitTimeout()
{
    ProcessManager manager;
    QByteArray output;
    QElapsedTimer timer;
    timer.start();
    QVERIFY(!manager.executeAndWait("/bin/sh", {"-c", "sleep 30"}, output, 200));
    QVERIFY(timer.elapsed() < 10000);
}

QTEST_MAIN(ProcessManagerTest)
#include "processmanager_test.moc"
