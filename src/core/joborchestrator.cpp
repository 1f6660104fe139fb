#include "joborchestrator.h"
#include "downloader.h"
#include "encoder.h"
#include "fontresolver.h"
#include "jobregistry.h"
#include "mediaprobe.h"
#include "pathescaper.h"
#include "processmanager.h"
#include "progressmonitor.h"
#include "subtitlenormalizer.h"

#include <QFile>
#include <QFileInfo>


JobOrchestrator::JobOrchestrator(const QString& jobId, JobRegistry* registry, Downloader* downloader, Encoder* encoder,
                                 QObject* parent)
    : QObject(parent),
      m_jobId(jobId),
      m_registry(registry),
      m_downloader(downloader),
      m_encoder(encoder),
      m_workRoot(AppSettings::instance().workRoot()),
      m_ffmpegPath(AppSettings::instance().ffmpegPath()),
      m_render(AppSettings::instance().renderSettings()),
      m_soft(AppSettings::instance().softSubtitleSettings()),
      m_style(AppSettings::instance().subtitleStyle()),
      m_terminationGraceMs(AppSettings::instance().terminationGraceMs())
{
    m_token = CancellationToken([registry, jobId]() { return registry->isCancelled(jobId); });
}

JobOrchestrator::~JobOrchestrator()
{
    delete m_paths;
}

void JobOrchestrator::run()
{
    std::optional<Job> job = m_registry->get(m_jobId);
    if (!job)
    {
        emit logMessage("Задача " + m_jobId + " не найдена в реестре.", LogCategory::APP);
        return;
    }
    if (job->isTerminal())
    {
        return;
    }

    m_request = job->request;
    for (const JobTask& task : job->tasks)
    {
        if (task.name == TaskNames::UploadSubtitle)
        {
            m_subtitleIsLocal = true;
        }
    }

    m_registry->update(m_jobId,
                       [](Job& j)
                       {
                           if (j.status == JobStatus::Queued)
                           {
                               j.status = JobStatus::Processing;
                               j.stage = "Starting";
                           }
                       });
    emit logMessage("Задача запущена.", LogCategory::APP);

    if (abortIfCancelled("до начала обработки"))
    {
        return;
    }

    m_paths = new JobPaths(m_workRoot, m_jobId);
    if (!m_paths->isValid())
    {
        failJob(ErrorKind::Validation, "Не удалось создать рабочую папку задачи: " + m_paths->basePath);
        return;
    }

    QString videoPath;
    if (!stageDownloadVideo(videoPath))
    {
        return;
    }

    QString subtitlePath;
    if (!stageAcquireSubtitle(subtitlePath))
    {
        return;
    }

    QString processedVideoPath;
    if (!stageProcessSubtitles(videoPath, subtitlePath, processedVideoPath))
    {
        return;
    }

    QMap<QString, QString> outputs;
    if (!stageEncode(processedVideoPath, outputs))
    {
        return;
    }

    if (abortIfCancelled("после кодирования"))
    {
        return;
    }

    m_registry->update(m_jobId,
                       [&outputs](Job& j)
                       {
                           j.status = JobStatus::Completed;
                           j.stage = "Completed";
                           j.outputs = outputs;
                           j.progress.percentage = 100.0;
                       });
    emit logMessage(QString("Задача завершена, файлов: %1.").arg(outputs.size()), LogCategory::APP);
}

bool JobOrchestrator::stageDownloadVideo(QString& videoPath)
{
    if (abortIfCancelled("перед загрузкой видео"))
    {
        return false;
    }
    beginTask(TaskNames::DownloadVideo, "Downloading video");

    QString error;
    bool ok = m_downloader->fetch(
        m_request.videoSource, m_paths->downloadsPath, AssetKind::Video,
        [this](qint64 received, qint64 total)
        { setProgress(received, total, ProgressMonitor::percentage(received, total)); },
        m_token, videoPath, error);

    if (!ok)
    {
        if (abortIfCancelled("во время загрузки видео"))
        {
            return false;
        }
        failJob(ErrorKind::Download, error);
        return false;
    }

    completeTask(TaskNames::DownloadVideo);
    return true;
}

bool JobOrchestrator::stageAcquireSubtitle(QString& subtitlePath)
{
    if (abortIfCancelled("перед получением субтитров"))
    {
        return false;
    }

    if (m_subtitleIsLocal)
    {
        beginTask(TaskNames::UploadSubtitle, "Accepting subtitle");
        subtitlePath = QFileInfo(m_request.subtitleSource).absoluteFilePath();
        emit logMessage("Используются загруженные субтитры: " + subtitlePath, LogCategory::APP);
        completeTask(TaskNames::UploadSubtitle);
        return true;
    }

    beginTask(TaskNames::DownloadSubtitle, "Downloading subtitle");
    QString error;
    bool ok = m_downloader->fetch(
        m_request.subtitleSource, m_paths->subtitlesPath, AssetKind::Subtitle,
        [this](qint64 received, qint64 total)
        { setProgress(received, total, ProgressMonitor::percentage(received, total)); },
        m_token, subtitlePath, error);

    if (!ok)
    {
        if (abortIfCancelled("во время загрузки субтитров"))
        {
            return false;
        }
        failJob(ErrorKind::Download, error);
        return false;
    }

    completeTask(TaskNames::DownloadSubtitle);
    return true;
}

bool JobOrchestrator::stageProcessSubtitles(const QString& videoPath, const QString& subtitlePath,
                                            QString& processedVideoPath)
{
    if (abortIfCancelled("перед обработкой субтитров"))
    {
        return false;
    }
    beginTask(TaskNames::ProcessSubtitles, "Processing subtitles");

    QString error;
    if (!SubtitleNormalizer::validateSubtitleFile(subtitlePath, error))
    {
        failJob(ErrorKind::Subtitle, error);
        return false;
    }

    ProcessManager process;
    connect(&process, &ProcessManager::processOutput, this,
            [this](const QString& output) { emit logMessage(output, LogCategory::DEBUG); }, Qt::DirectConnection);
    connect(&process, &ProcessManager::processError, this,
            [this](const QString& message) { emit logMessage(message, LogCategory::FFMPEG); }, Qt::DirectConnection);

    // Без длительности прогресс в процентах не считается, но обработка продолжается
    double durationSeconds = 0.0;
    MediaProbe probe(&process);
    connect(&probe, &MediaProbe::logMessage, this, &JobOrchestrator::logMessage, Qt::DirectConnection);
    MediaInfo info;
    QString probeError;
    if (probe.probe(videoPath, info, probeError))
    {
        durationSeconds = info.durationSeconds;
    }
    else
    {
        emit logMessage("Предупреждение: " + probeError, LogCategory::APP);
    }

    SubtitleNormalizer normalizer(&process);
    connect(&normalizer, &SubtitleNormalizer::logMessage, this, &JobOrchestrator::logMessage, Qt::DirectConnection);

    QString preparedSubtitle;
    QProcessEnvironment environment;
    QStringList arguments;
    processedVideoPath = m_paths->subtitledVideo(videoPath, m_request.soft);

    if (m_request.soft)
    {
        if (!normalizer.prepareForEmbed(subtitlePath, m_paths->subtitlesPath, preparedSubtitle, error))
        {
            failJob(ErrorKind::Subtitle, error);
            return false;
        }
        arguments = buildEmbedArguments(videoPath, preparedSubtitle, processedVideoPath);
    }
    else
    {
        FontResolver fontResolver;
        connect(&fontResolver, &FontResolver::logMessage, this, &JobOrchestrator::logMessage, Qt::DirectConnection);

        SubtitleStyle style = m_style;
        if (style.fontName.isEmpty())
        {
            style.fontName = fontResolver.resolveFontName();
        }

        if (!normalizer.prepareForBurn(subtitlePath, m_paths->subtitlesPath, style, preparedSubtitle, error))
        {
            failJob(ErrorKind::Subtitle, error);
            return false;
        }

        QString fontConfigPath;
        QString fontConfigError;
        if (fontResolver.writeFontConfig(m_paths->fontConfigDir(), fontConfigPath, fontConfigError))
        {
            environment = QProcessEnvironment::systemEnvironment();
            environment.insert("FONTCONFIG_FILE", fontConfigPath);
        }
        else
        {
            emit logMessage("Предупреждение: " + fontConfigError, LogCategory::APP);
        }

        const QString fontsDir = fontResolver.hasBundledFonts() ? fontResolver.bundledFontsDir() : QString();
        arguments = buildBurnArguments(videoPath, preparedSubtitle, fontsDir, processedVideoPath);
    }

    if (abortIfCancelled("перед запуском ffmpeg"))
    {
        return false;
    }

    m_registry->update(m_jobId,
                       [this](Job& j) { j.stage = m_request.soft ? "Embedding subtitles" : "Burning subtitles"; });
    if (!runSubtitleProcess(process, arguments, environment, processedVideoPath, durationSeconds))
    {
        return false;
    }

    completeTask(TaskNames::ProcessSubtitles);
    return true;
}

bool JobOrchestrator::runSubtitleProcess(ProcessManager& process, const QStringList& arguments,
                                         const QProcessEnvironment& environment, const QString& outputPath,
                                         double durationSeconds)
{
    if (!process.startProcess(m_ffmpegPath, arguments, environment))
    {
        failJob(ErrorKind::ProcessFailure, "Не удалось запустить ffmpeg: " + process.errorString());
        return false;
    }

    ProgressMonitor monitor(durationSeconds,
                            [this](double elapsed, double total)
                            { setProgress(elapsed, total, ProgressMonitor::percentage(elapsed, total)); });
    monitor.setLineCallback([this](const QString& line) { emit logMessage(line, LogCategory::FFMPEG); });

    if (monitor.run(process, m_token) == ProgressMonitor::Outcome::Cancelled)
    {
        process.terminateGracefully(m_terminationGraceMs);
        if (QFile::exists(outputPath) && !QFile::remove(outputPath))
        {
            emit logMessage("Не удалось удалить незавершённый файл: " + outputPath, LogCategory::APP);
        }
        finishCancelled("во время работы ffmpeg");
        return false;
    }

    if (!process.waitForFinished(m_terminationGraceMs))
    {
        process.terminateGracefully(m_terminationGraceMs);
    }

    QString message;
    const ErrorKind kind =
        classifyProcessExit(process.exitStatus(), process.exitCode(), process.wasKilled(), message);
    if (kind != ErrorKind::None)
    {
        QFile::remove(outputPath);
        if (abortIfCancelled("во время работы ffmpeg"))
        {
            return false;
        }
        const QStringList tail = process.recentOutput().mid(qMax(0, process.recentOutput().size() - 5));
        if (!tail.isEmpty())
        {
            message += "\n" + tail.join("\n");
        }
        failJob(kind, message);
        return false;
    }

    QFileInfo outputInfo(outputPath);
    if (!outputInfo.exists() || outputInfo.size() == 0)
    {
        failJob(ErrorKind::ProcessFailure, "ffmpeg не создал выходной файл: " + outputPath);
        return false;
    }
    return true;
}

bool JobOrchestrator::stageEncode(const QString& processedVideoPath, QMap<QString, QString>& outputs)
{
    if (abortIfCancelled("перед кодированием"))
    {
        return false;
    }
    beginTask(TaskNames::EncodeVideos, "Encoding videos");

    const int total = m_request.resolutions.size();
    int done = 0;
    for (const QString& label : m_request.resolutions)
    {
        if (abortIfCancelled("перед кодированием в " + label))
        {
            return false;
        }
        m_registry->update(m_jobId, [&label](Job& j) { j.stage = "Encoding " + label; });

        QString outputPath;
        QString error;
        if (!m_encoder->encode(processedVideoPath, label, m_token, outputPath, error))
        {
            if (abortIfCancelled("во время кодирования в " + label))
            {
                return false;
            }
            failJob(ErrorKind::Encode, error);
            return false;
        }

        outputs.insert(label, outputPath);
        ++done;
        setProgress(done, total, done * 100.0 / total);
    }

    completeTask(TaskNames::EncodeVideos);
    return true;
}

QStringList JobOrchestrator::buildEmbedArguments(const QString& videoPath, const QString& subtitlePath,
                                                 const QString& outputPath) const
{
    return {"-y", "-hide_banner",
            "-i", videoPath,
            "-i", subtitlePath,
            "-map", "0:v", "-map", "0:a?", "-map", "1:0",
            "-c:v", "copy", "-c:a", "copy",
            "-c:s", m_soft.codec,
            "-metadata:s:s:0", "language=" + m_soft.language,
            "-metadata:s:s:0", "title=" + m_soft.title,
            "-disposition:s:0", "default",
            outputPath};
}

QStringList JobOrchestrator::buildBurnArguments(const QString& videoPath, const QString& subtitlePath,
                                                const QString& fontsDir, const QString& outputPath) const
{
    QString filter = QString("subtitles='%1'").arg(escapePathForFfmpegFilter(subtitlePath));
    if (!fontsDir.isEmpty())
    {
        filter += QString(":fontsdir='%1'").arg(escapePathForFfmpegFilter(fontsDir));
    }

    return {"-y", "-hide_banner",
            "-i", videoPath,
            "-vf", filter,
            "-c:v", m_render.videoCodec,
            "-crf", QString::number(m_render.effectiveCrf()),
            "-preset", m_render.effectivePreset(),
            "-threads", QString::number(m_render.effectiveThreads()),
            "-c:a", "copy",
            "-max_muxing_queue_size", QString::number(m_render.maxMuxingQueueSize),
            outputPath};
}

ErrorKind JobOrchestrator::classifyProcessExit(QProcess::ExitStatus exitStatus, int exitCode, bool killedByUs,
                                               QString& message)
{
    if (exitStatus == QProcess::CrashExit)
    {
        if (killedByUs)
        {
            message = "ffmpeg был остановлен.";
        }
        else
        {
            message = "ffmpeg аварийно завершён системой (вероятно, из-за нехватки памяти).";
        }
        return ErrorKind::ProcessKilled;
    }

    if (exitCode == 137 || exitCode == -9)
    {
        message = QString("ffmpeg завершился с кодом %1: процесс убит из-за нехватки памяти. "
                          "Включите режим экономии памяти (render/lowMemoryMode).")
                      .arg(exitCode);
        return ErrorKind::ProcessOutOfMemory;
    }

    if (exitCode == 1)
    {
        message = "ffmpeg завершился с ошибкой кодирования (код 1).";
        return ErrorKind::ProcessEncodeError;
    }

    if (exitCode != 0)
    {
        message = QString("ffmpeg завершился с кодом %1.").arg(exitCode);
        return ErrorKind::ProcessFailure;
    }

    return ErrorKind::None;
}

bool JobOrchestrator::abortIfCancelled(const QString& where)
{
    if (!m_token.isCancelled())
    {
        return false;
    }
    finishCancelled(where);
    return true;
}

void JobOrchestrator::beginTask(const QString& taskName, const QString& stage)
{
    m_currentTask = taskName;
    m_registry->update(m_jobId,
                       [&](Job& j)
                       {
                           j.setTaskStatus(taskName, TaskStatus::InProgress);
                           j.stage = stage;
                           j.progress = JobProgress();
                       });
    emit logMessage("Этап: " + taskName, LogCategory::APP);
}

void JobOrchestrator::completeTask(const QString& taskName)
{
    m_registry->update(m_jobId, [&taskName](Job& j) { j.setTaskStatus(taskName, TaskStatus::Completed); });
    m_currentTask.clear();
}

void JobOrchestrator::failJob(ErrorKind kind, const QString& message)
{
    const QString taskName = m_currentTask;
    m_registry->update(m_jobId,
                       [&](Job& j)
                       {
                           if (!taskName.isEmpty())
                           {
                               j.setTaskStatus(taskName, TaskStatus::Failed);
                           }
                           j.status = JobStatus::Failed;
                           j.stage = "Failed";
                           j.error = message;
                           j.errorKind = kind;
                           j.outputs.clear();
                       });
    emit logMessage("Ошибка: " + message, LogCategory::APP);
}

void JobOrchestrator::finishCancelled(const QString& where)
{
    const QString taskName = m_currentTask;
    const QString message = QString("Задача отменена пользователем (%1).").arg(where);
    m_registry->update(m_jobId,
                       [&](Job& j)
                       {
                           if (!taskName.isEmpty())
                           {
                               j.setTaskStatus(taskName, TaskStatus::Failed);
                           }
                           j.status = JobStatus::Cancelled;
                           j.stage = "Cancelled";
                           j.error = message;
                           j.errorKind = ErrorKind::Cancelled;
                           j.outputs.clear();
                       });
    emit logMessage(message, LogCategory::APP);
}

void JobOrchestrator::setProgress(double current, double total, double percentage)
{
    m_registry->update(m_jobId,
                       [=](Job& j)
                       {
                           j.progress.current = current;
                           j.progress.total = total;
                           // В пределах этапа процент не убывает
                           if (percentage >= 0 && percentage > j.progress.percentage)
                           {
                               j.progress.percentage = percentage;
                           }
                       });
}
