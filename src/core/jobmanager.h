#ifndef JOBMANAGER_H
#define JOBMANAGER_H

#include "appsettings.h"
#include "job.h"
#include "jobregistry.h"

#include <QJsonObject>
#include <QList>
#include <QMutex>
#include <QObject>

#include <optional>

class Downloader;
class Encoder;
class QThread;

struct SubmitResult
{
    bool ok = false;
    QString id;
    QString error;
    ErrorKind errorKind = ErrorKind::None;
};

struct HealthInfo
{
    int activeJobs = 0;
    int completedJobs = 0;

    QJsonObject toJson() const;
};

/**
 * @brief Entry point used by front ends: submits, queries and cancels jobs
 *
 * Every accepted job runs on its own thread. Downloader and Encoder are not
 * owned and must outlive the manager. The destructor cancels running jobs and
 * waits for all worker threads.
 */
class JobManager : public QObject
{
    Q_OBJECT
    Q_DISABLE_COPY_MOVE(JobManager)

public:
    JobManager(Downloader* downloader, Encoder* encoder, QObject* parent = nullptr);
    ~JobManager() override;

    SubmitResult submit(const QString& videoSource, const QString& subtitleSource, const QStringList& resolutions,
                        bool soft);

    std::optional<Job> getStatus(const QString& jobId) const;

    // false - задача не найдена; завершённые задачи не меняются
    bool cancel(const QString& jobId);

    QList<Job> listAll() const;

    // Пусто, если задача не завершена успешно или файла уже нет
    QString getOutput(const QString& jobId, const QString& resolution) const;

    HealthInfo health() const;

    bool waitForJob(const QString& jobId, int timeoutMs) const;

    static bool validateRequest(const QString& videoSource, const QString& subtitleSource,
                                const QStringList& resolutions, QString& error);

signals:
    void logMessage(const QString& jobId, const QString& message, LogCategory category);

private:
    void pruneFinishedThreads();

    JobRegistry m_registry;
    Downloader* m_downloader;
    Encoder* m_encoder;

    mutable QMutex m_threadsMutex;
    QList<QThread*> m_threads;
};

#endif // JOBMANAGER_H
