#include "job.h"

#include <QJsonArray>
#include <QUuid>


QString jobStatusToString(JobStatus status)
{
    switch (status)
    {
    case JobStatus::Queued:
        return "queued";
    case JobStatus::Processing:
        return "processing";
    case JobStatus::Cancelling:
        return "cancelling";
    case JobStatus::Completed:
        return "completed";
    case JobStatus::Failed:
        return "failed";
    case JobStatus::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

QString taskStatusToString(TaskStatus status)
{
    switch (status)
    {
    case TaskStatus::Pending:
        return "pending";
    case TaskStatus::InProgress:
        return "in_progress";
    case TaskStatus::Completed:
        return "completed";
    case TaskStatus::Failed:
        return "failed";
    }
    return "unknown";
}

QString errorKindToString(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::None:
        return QString();
    case ErrorKind::Validation:
        return "validation";
    case ErrorKind::Download:
        return "download";
    case ErrorKind::Subtitle:
        return "subtitle";
    case ErrorKind::ProcessOutOfMemory:
        return "process_out_of_memory";
    case ErrorKind::ProcessKilled:
        return "process_killed";
    case ErrorKind::ProcessEncodeError:
        return "process_encode_error";
    case ErrorKind::ProcessFailure:
        return "process_failure";
    case ErrorKind::Encode:
        return "encode";
    case ErrorKind::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

int jobStatusRank(JobStatus status)
{
    switch (status)
    {
    case JobStatus::Queued:
        return 0;
    case JobStatus::Processing:
        return 1;
    case JobStatus::Cancelling:
        return 2;
    case JobStatus::Completed:
    case JobStatus::Failed:
    case JobStatus::Cancelled:
        return 3;
    }
    return 0;
}

bool isTerminalStatus(JobStatus status)
{
    return jobStatusRank(status) == 3;
}

bool Job::setTaskStatus(const QString& taskName, TaskStatus taskStatus)
{
    for (JobTask& task : tasks)
    {
        if (task.name == taskName)
        {
            task.status = taskStatus;
            return true;
        }
    }
    return false;
}

QJsonObject Job::toJson() const
{
    QJsonObject json;
    json["job_id"] = id;
    json["status"] = jobStatusToString(status);
    json["stage"] = stage;

    QJsonArray tasksArray;
    for (const JobTask& task : tasks)
    {
        QJsonObject taskObj;
        taskObj["name"] = task.name;
        taskObj["status"] = taskStatusToString(task.status);
        tasksArray.append(taskObj);
    }
    json["tasks"] = tasksArray;

    QJsonObject progressObj;
    progressObj["current"] = progress.current;
    progressObj["total"] = progress.total;
    progressObj["percentage"] = progress.percentage;
    json["progress"] = progressObj;

    QJsonObject outputsObj;
    for (auto it = outputs.constBegin(); it != outputs.constEnd(); ++it)
    {
        outputsObj[it.key()] = it.value();
    }
    json["outputs"] = outputsObj;

    if (!error.isEmpty())
    {
        json["error"] = error;
        json["error_kind"] = errorKindToString(errorKind);
    }

    QJsonObject requestObj;
    requestObj["video"] = request.videoSource;
    requestObj["subtitle"] = request.subtitleSource;
    requestObj["resolutions"] = QJsonArray::fromStringList(request.resolutions);
    requestObj["soft"] = request.soft;
    json["request"] = requestObj;

    json["created_at"] = createdAt.toString(Qt::ISODateWithMs);
    json["updated_at"] = updatedAt.toString(Qt::ISODateWithMs);
    return json;
}

Job Job::create(const QString& id, const JobRequest& request, bool subtitleIsLocal)
{
    Job job;
    job.id = id;
    job.status = JobStatus::Queued;
    job.stage = "Queued";
    job.request = request;
    job.tasks = {{TaskNames::DownloadVideo, TaskStatus::Pending},
                 {subtitleIsLocal ? TaskNames::UploadSubtitle : TaskNames::DownloadSubtitle, TaskStatus::Pending},
                 {TaskNames::ProcessSubtitles, TaskStatus::Pending},
                 {TaskNames::EncodeVideos, TaskStatus::Pending}};
    job.createdAt = QDateTime::currentDateTime();
    job.updatedAt = job.createdAt;
    return job;
}

QString Job::generateId()
{
    return QDateTime::currentDateTime().toString("yyyyMMdd_HHmmss_") +
           QUuid::createUuid().toString(QUuid::WithoutBraces).left(8);
}
