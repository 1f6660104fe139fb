#ifndef JOB_H
#define JOB_H

#include <QDateTime>
#include <QJsonObject>
#include <QList>
#include <QMap>
#include <QString>
#include <QStringList>


enum class JobStatus
{
    Queued,
    Processing,
    Cancelling,
    Completed,
    Failed,
    Cancelled
};

enum class TaskStatus
{
    Pending,
    InProgress,
    Completed,
    Failed
};

enum class ErrorKind
{
    None,
    Validation,
    Download,
    Subtitle,
    ProcessOutOfMemory,
    ProcessKilled,
    ProcessEncodeError,
    ProcessFailure,
    Encode,
    Cancelled
};

namespace TaskNames
{
inline const QString DownloadVideo = "Download Video";
inline const QString DownloadSubtitle = "Download Subtitle";
inline const QString UploadSubtitle = "Upload Subtitle";
inline const QString ProcessSubtitles = "Process Subtitles";
inline const QString EncodeVideos = "Encode Videos";
} // namespace TaskNames

QString jobStatusToString(JobStatus status);
QString taskStatusToString(TaskStatus status);
QString errorKindToString(ErrorKind kind);

// Queued < Processing < Cancelling < все терминальные статусы
int jobStatusRank(JobStatus status);
bool isTerminalStatus(JobStatus status);

struct JobTask
{
    QString name;
    TaskStatus status = TaskStatus::Pending;
};

struct JobProgress
{
    double current = 0.0;  // секунды
    double total = 0.0;    // 0 - длительность неизвестна
    double percentage = 0.0;
};

// Параметры, с которыми задача была отправлена
struct JobRequest
{
    QString videoSource;
    QString subtitleSource;
    QStringList resolutions;
    bool soft = false;
};

struct Job
{
    QString id;
    JobStatus status = JobStatus::Queued;
    QString stage;
    QList<JobTask> tasks;
    JobProgress progress;
    QMap<QString, QString> outputs; // метка разрешения -> путь к файлу
    QString error;
    ErrorKind errorKind = ErrorKind::None;
    JobRequest request;
    QDateTime createdAt;
    QDateTime updatedAt;
    quint64 sequence = 0; // порядок регистрации, выставляет JobRegistry

    bool isTerminal() const { return isTerminalStatus(status); }

    /**
     * @brief Sets the status of the task with the given name, if present.
     * @return false when the job has no such task.
     */
    bool setTaskStatus(const QString& taskName, TaskStatus taskStatus);

    QJsonObject toJson() const;

    /**
     * @brief Builds a Queued job with the fixed task sequence.
     *
     * The second task is "Upload Subtitle" when @p subtitleIsLocal is set,
     * "Download Subtitle" otherwise.
     */
    static Job create(const QString& id, const JobRequest& request, bool subtitleIsLocal);

    static QString generateId();
};

#endif // JOB_H
