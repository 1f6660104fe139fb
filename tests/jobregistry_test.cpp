/**
 * @file jobregistry_test.cpp
 * @brief Unit tests for the thread-safe job store
 */

#include <QtTest/QtTest>

#include "jobregistry.h"

#include <QJsonArray>
#include <QThread>

class JobRegistryTest : public QObject
{
    Q_OBJECT

private:
    Job makeJob(const QString& id, const QDateTime& createdAt = QDateTime()) const;

private slots:
    void testCreateRejectsDuplicateAndEmptyId();
    void testCreateUsesFixedTaskSequence();
    void testStatusNeverMovesBackwards();
    void testTerminalJobIsFrozen();
    void testUnknownIdIgnored();
    void testListNewestFirst();
    void testMarkCancelled();
    void testMarkCancelledOnTerminalJob();
    void testWaitForTerminal();
    void testConcurrentUpdates();
    void testJsonSerialization();
};

Job JobRegistryTest::makeJob(const QString& id, const QDateTime& createdAt) const
{
    JobRequest request;
    request.videoSource = "https://example.com/video.mp4";
    request.subtitleSource = "https://example.com/subs.srt";
    request.resolutions = {"720p"};
    Job job = Job::create(id, request, false);
    job.createdAt = createdAt;
    return job;
}

void JobRegistryTest::testCreateRejectsDuplicateAndEmptyId()
{
    JobRegistry registry;
    QVERIFY(registry.create(makeJob("a")));
    QVERIFY(!registry.create(makeJob("a")));
    QVERIFY(!registry.create(makeJob("")));
    QCOMPARE(registry.activeCount(), 1);
}

void JobRegistryTest::testCreateUsesFixedTaskSequence()
{
    JobRequest request;
    request.videoSource = "/tmp/video.mp4";
    request.subtitleSource = "/tmp/subs.srt";
    request.resolutions = {"360p"};

    const Job downloaded = Job::create("d", request, false);
    QCOMPARE(downloaded.status, JobStatus::Queued);
    QCOMPARE(downloaded.tasks.size(), 4);
    QCOMPARE(downloaded.tasks[0].name, TaskNames::DownloadVideo);
    QCOMPARE(downloaded.tasks[1].name, TaskNames::DownloadSubtitle);
    QCOMPARE(downloaded.tasks[2].name, TaskNames::ProcessSubtitles);
    QCOMPARE(downloaded.tasks[3].name, TaskNames::EncodeVideos);
    for (const JobTask& task : downloaded.tasks)
    {
        QCOMPARE(task.status, TaskStatus::Pending);
    }

    const Job uploaded = Job::create("u", request, true);
    QCOMPARE(uploaded.tasks[1].name, TaskNames::UploadSubtitle);
}

void JobRegistryTest::testStatusNeverMovesBackwards()
{
    JobRegistry registry;
    QVERIFY(registry.create(makeJob("job")));

    QVERIFY(registry.update("job", [](Job& job) { job.status = JobStatus::Processing; }));
    QVERIFY(registry.update("job",
                            [](Job& job)
                            {
                                job.status = JobStatus::Queued;
                                job.stage = "Downloading";
                            }));

    std::optional<Job> job = registry.get("job");
    QVERIFY(job.has_value());
    QCOMPARE(job->status, JobStatus::Processing);
    // Остальные поля патча применяются
    QCOMPARE(job->stage, QString("Downloading"));
    QVERIFY(job->updatedAt >= job->createdAt);
}

void JobRegistryTest::testTerminalJobIsFrozen()
{
    JobRegistry registry;
    QVERIFY(registry.create(makeJob("job")));
    QVERIFY(registry.update("job",
                            [](Job& job)
                            {
                                job.status = JobStatus::Completed;
                                job.outputs.insert("720p", "/tmp/out_720p.mp4");
                            }));
    QCOMPARE(registry.activeCount(), 0);
    QCOMPARE(registry.completedCount(), 1);

    QVERIFY(!registry.update("job", [](Job& job) { job.status = JobStatus::Failed; }));
    std::optional<Job> job = registry.get("job");
    QVERIFY(job.has_value());
    QCOMPARE(job->status, JobStatus::Completed);
    QCOMPARE(job->outputs.value("720p"), QString("/tmp/out_720p.mp4"));
}

void JobRegistryTest::testUnknownIdIgnored()
{
    JobRegistry registry;
    QVERIFY(!registry.update("missing", [](Job& job) { job.stage = "x"; }));
    QVERIFY(!registry.get("missing").has_value());
    QVERIFY(!registry.markCancelled("missing"));
    QVERIFY(!registry.isCancelled("missing"));
    QVERIFY(!registry.waitForTerminal("missing", 10));
}

void JobRegistryTest::testListNewestFirst()
{
    JobRegistry registry;
    const QDateTime base = QDateTime::currentDateTime();
    QVERIFY(registry.create(makeJob("old", base.addSecs(-60))));
    QVERIFY(registry.create(makeJob("new", base)));
    QVERIFY(registry.create(makeJob("same-time-later", base)));
    QVERIFY(registry.update("old", [](Job& job) { job.status = JobStatus::Failed; }));

    const QList<Job> jobs = registry.list();
    QCOMPARE(jobs.size(), 3);
    QCOMPARE(jobs[0].id, QString("same-time-later"));
    QCOMPARE(jobs[1].id, QString("new"));
    QCOMPARE(jobs[2].id, QString("old"));
}

void JobRegistryTest::testMarkCancelled()
{
    JobRegistry registry;
    QVERIFY(registry.create(makeJob("queued")));
    QVERIFY(registry.create(makeJob("running")));
    QVERIFY(registry.update("running", [](Job& job) { job.status = JobStatus::Processing; }));

    QVERIFY(registry.markCancelled("queued"));
    QVERIFY(registry.markCancelled("running"));
    QVERIFY(registry.isCancelled("queued"));
    QVERIFY(registry.isCancelled("running"));
    QCOMPARE(registry.get("queued")->status, JobStatus::Cancelling);
    QCOMPARE(registry.get("running")->status, JobStatus::Cancelling);

    // Воркер не может вернуть задачу в Processing
    QVERIFY(registry.update("running", [](Job& job) { job.status = JobStatus::Processing; }));
    QCOMPARE(registry.get("running")->status, JobStatus::Cancelling);

    QVERIFY(registry.update("running", [](Job& job) { job.status = JobStatus::Cancelled; }));
    QCOMPARE(registry.get("running")->status, JobStatus::Cancelled);
}

void JobRegistryTest::testMarkCancelledOnTerminalJob()
{
    JobRegistry registry;
    QVERIFY(registry.create(makeJob("done")));
    QVERIFY(registry.update("done", [](Job& job) { job.status = JobStatus::Completed; }));

    QVERIFY(registry.markCancelled("done"));
    QCOMPARE(registry.get("done")->status, JobStatus::Completed);
    QVERIFY(!registry.isCancelled("done"));
}

void JobRegistryTest::testWaitForTerminal()
{
    JobRegistry registry;
    QVERIFY(registry.create(makeJob("job")));
    QVERIFY(!registry.waitForTerminal("job", 50));

    QThread* worker = QThread::create(
        [&registry]()
        {
            QThread::msleep(100);
            registry.update("job", [](Job& job) { job.status = JobStatus::Completed; });
        });
    worker->start();

    QVERIFY(registry.waitForTerminal("job", 5000));
    QVERIFY(worker->wait(5000));
    delete worker;
}

void JobRegistryTest::testConcurrentUpdates()
{
    JobRegistry registry;
    QVERIFY(registry.create(makeJob("job")));

    const int kThreads = 4;
    const int kIterations = 500;
    QList<QThread*> workers;
    for (int t = 0; t < kThreads; ++t)
    {
        workers.append(QThread::create(
            [&registry]()
            {
                for (int i = 0; i < kIterations; ++i)
                {
                    registry.update("job", [](Job& job) { job.progress.current += 1.0; });
                    registry.get("job");
                    registry.list();
                }
            }));
    }
    for (QThread* worker : workers)
    {
        worker->start();
    }
    for (QThread* worker : workers)
    {
        QVERIFY(worker->wait(30000));
        delete worker;
    }

    QCOMPARE(registry.get("job")->progress.current, double(kThreads * kIterations));
}

void JobRegistryTest::testJsonSerialization()
{
    Job job = makeJob("json-job", QDateTime::currentDateTime());
    job.status = JobStatus::Failed;
    job.errorKind = ErrorKind::ProcessOutOfMemory;
    job.error = "out of memory";
    job.setTaskStatus(TaskNames::DownloadVideo, TaskStatus::Completed);
    QVERIFY(!job.setTaskStatus("No Such Task", TaskStatus::Completed));

    const QJsonObject json = job.toJson();
    QCOMPARE(json["job_id"].toString(), QString("json-job"));
    QCOMPARE(json["status"].toString(), QString("failed"));
    QCOMPARE(json["error_kind"].toString(), QString("process_out_of_memory"));
    QCOMPARE(json["tasks"].toArray().size(), 4);
}

QTEST_MAIN(JobRegistryTest)
#include "jobregistry_test.moc"
