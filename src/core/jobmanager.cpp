#include "jobmanager.h"
#include "joborchestrator.h"

#include <QFileInfo>
#include <QMutexLocker>
#include <QSet>
#include <QThread>
#include <QUrl>

QJsonObject HealthInfo::toJson() const
{
    QJsonObject json;
    json["status"] = "healthy";
    json["active_jobs"] = activeJobs;
    json["completed_jobs"] = completedJobs;
    return json;
}

JobManager::JobManager(Downloader* downloader, Encoder* encoder, QObject* parent)
    : QObject(parent), m_downloader(downloader), m_encoder(encoder)
{
}

JobManager::~JobManager()
{
    const QList<Job> jobs = m_registry.list();
    for (const Job& job : jobs)
    {
        if (!job.isTerminal())
        {
            m_registry.markCancelled(job.id);
        }
    }

    QMutexLocker locker(&m_threadsMutex);
    for (QThread* thread : m_threads)
    {
        thread->wait();
        delete thread;
    }
    m_threads.clear();
}

bool JobManager::validateRequest(const QString& videoSource, const QString& subtitleSource,
                                 const QStringList& resolutions, QString& error)
{
    if (videoSource.trimmed().isEmpty())
    {
        error = "Не указано видео.";
        return false;
    }
    if (subtitleSource.trimmed().isEmpty())
    {
        error = "Не указаны субтитры.";
        return false;
    }
    if (resolutions.isEmpty())
    {
        error = "Не указано ни одного разрешения.";
        return false;
    }

    const QStringList supported = AppSettings::supportedResolutions();
    QSet<QString> seen;
    for (const QString& resolution : resolutions)
    {
        if (!supported.contains(resolution))
        {
            error = QString("Неподдерживаемое разрешение '%1'. Допустимые: %2.")
                        .arg(resolution, supported.join(", "));
            return false;
        }
        if (seen.contains(resolution))
        {
            error = QString("Разрешение '%1' указано повторно.").arg(resolution);
            return false;
        }
        seen.insert(resolution);
    }

    QUrl subtitleUrl(subtitleSource);
    const QString subtitleName = (subtitleUrl.isValid() && subtitleUrl.scheme().length() > 1)
                                     ? subtitleUrl.fileName()
                                     : QFileInfo(subtitleSource).fileName();
    const QString extension = "." + QFileInfo(subtitleName).suffix().toLower();
    if (!AppSettings::allowedSubtitleExtensions().contains(extension))
    {
        error = QString("Недопустимый формат субтитров. Допустимые: %1.")
                    .arg(AppSettings::allowedSubtitleExtensions().join(", "));
        return false;
    }
    return true;
}

SubmitResult JobManager::submit(const QString& videoSource, const QString& subtitleSource,
                                const QStringList& resolutions, bool soft)
{
    SubmitResult result;
    if (!validateRequest(videoSource, subtitleSource, resolutions, result.error))
    {
        result.errorKind = ErrorKind::Validation;
        return result;
    }

    pruneFinishedThreads();

    JobRequest request;
    request.videoSource = videoSource.trimmed();
    request.subtitleSource = subtitleSource.trimmed();
    request.resolutions = resolutions;
    request.soft = soft;

    const bool subtitleIsLocal = QFileInfo(request.subtitleSource).isFile();

    QString id = Job::generateId();
    while (!m_registry.create(Job::create(id, request, subtitleIsLocal)))
    {
        id = Job::generateId();
    }

    emit logMessage(id,
                    QString("Задача создана: видео %1, субтитры %2, разрешения %3, %4.")
                        .arg(request.videoSource, request.subtitleSource, resolutions.join(","),
                             soft ? "мягкие субтитры" : "вшитые субтитры"),
                    LogCategory::APP);

    JobRegistry* registry = &m_registry;
    Downloader* downloader = m_downloader;
    Encoder* encoder = m_encoder;
    QThread* thread = QThread::create(
        [this, id, registry, downloader, encoder]()
        {
            JobOrchestrator orchestrator(id, registry, downloader, encoder);
            connect(&orchestrator, &JobOrchestrator::logMessage, this,
                    [this, id](const QString& message, LogCategory category)
                    { emit logMessage(id, message, category); },
                    Qt::DirectConnection);
            orchestrator.run();
        });
    thread->setObjectName("job-" + id);

    {
        QMutexLocker locker(&m_threadsMutex);
        m_threads.append(thread);
    }
    thread->start();

    result.ok = true;
    result.id = id;
    return result;
}

std::optional<Job> JobManager::getStatus(const QString& jobId) const
{
    return m_registry.get(jobId);
}

bool JobManager::cancel(const QString& jobId)
{
    if (!m_registry.markCancelled(jobId))
    {
        return false;
    }
    emit logMessage(jobId, "Получена команда на отмену задачи.", LogCategory::APP);
    return true;
}

QList<Job> JobManager::listAll() const
{
    return m_registry.list();
}

QString JobManager::getOutput(const QString& jobId, const QString& resolution) const
{
    std::optional<Job> job = m_registry.get(jobId);
    if (!job || job->status != JobStatus::Completed)
    {
        return QString();
    }

    const QString path = job->outputs.value(resolution);
    if (path.isEmpty() || !QFileInfo::exists(path))
    {
        return QString();
    }
    return path;
}

HealthInfo JobManager::health() const
{
    HealthInfo info;
    info.activeJobs = m_registry.activeCount();
    info.completedJobs = m_registry.completedCount();
    return info;
}

bool JobManager::waitForJob(const QString& jobId, int timeoutMs) const
{
    return m_registry.waitForTerminal(jobId, timeoutMs);
}

void JobManager::pruneFinishedThreads()
{
    QMutexLocker locker(&m_threadsMutex);
    for (auto it = m_threads.begin(); it != m_threads.end();)
    {
        if ((*it)->isFinished())
        {
            delete *it;
            it = m_threads.erase(it);
        }
        else
        {
            ++it;
        }
    }
}
