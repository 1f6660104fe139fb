#ifndef JOBORCHESTRATOR_H
#define JOBORCHESTRATOR_H

#include "appsettings.h"
#include "cancellationtoken.h"
#include "job.h"
#include "jobpaths.h"

#include <QObject>
#include <QProcess>
#include <QProcessEnvironment>

class Downloader;
class Encoder;
class JobRegistry;
class ProcessManager;

/**
 * @brief Runs the fixed pipeline of one job on the calling thread
 *
 * Stages, strictly in order:
 *  1. Download Video;
 *  2. Download Subtitle, or Upload Subtitle for an already present local file;
 *  3. Process Subtitles: validation, probe, normalization, then the soft embed
 *     or hard burn ffmpeg run;
 *  4. Encode Videos: one Encoder call per resolution, in request order.
 *
 * The orchestrator is the only writer of its job in the registry. The
 * cancellation flag is polled at every stage boundary, before each
 * resolution and on every ffmpeg status line. Outputs are committed only
 * after every resolution has succeeded.
 */
class JobOrchestrator : public QObject
{
    Q_OBJECT
public:
    JobOrchestrator(const QString& jobId, JobRegistry* registry, Downloader* downloader, Encoder* encoder,
                    QObject* parent = nullptr);
    ~JobOrchestrator() override;

    // Блокирующий вызов, возвращается, когда задача в терминальном статусе
    void run();

    QStringList buildEmbedArguments(const QString& videoPath, const QString& subtitlePath,
                                    const QString& outputPath) const;
    QStringList buildBurnArguments(const QString& videoPath, const QString& subtitlePath, const QString& fontsDir,
                                   const QString& outputPath) const;

    /**
     * @brief Maps an ffmpeg exit to an error kind and a readable message.
     *
     * Crash exit (not requested by us), code 137 or -9: out of memory / killed.
     * Code 1: encoding error. Anything else non-zero: generic failure.
     * @return ErrorKind::None for a clean exit.
     */
    static ErrorKind classifyProcessExit(QProcess::ExitStatus exitStatus, int exitCode, bool killedByUs,
                                         QString& message);

signals:
    void logMessage(const QString& message, LogCategory category = LogCategory::APP);

private:
    bool stageDownloadVideo(QString& videoPath);
    bool stageAcquireSubtitle(QString& subtitlePath);
    bool stageProcessSubtitles(const QString& videoPath, const QString& subtitlePath, QString& processedVideoPath);
    bool stageEncode(const QString& processedVideoPath, QMap<QString, QString>& outputs);

    bool runSubtitleProcess(ProcessManager& process, const QStringList& arguments,
                            const QProcessEnvironment& environment, const QString& outputPath,
                            double durationSeconds);

    // true, если задача была отменена; в этом случае она уже переведена в Cancelled
    bool abortIfCancelled(const QString& where);

    void beginTask(const QString& taskName, const QString& stage);
    void completeTask(const QString& taskName);
    void failJob(ErrorKind kind, const QString& message);
    void finishCancelled(const QString& where);
    void setProgress(double current, double total, double percentage);

    QString m_jobId;
    JobRegistry* m_registry;
    Downloader* m_downloader;
    Encoder* m_encoder;
    CancellationToken m_token;
    JobRequest m_request;
    JobPaths* m_paths = nullptr;
    QString m_currentTask;
    bool m_subtitleIsLocal = false;

    // Копии настроек на момент создания
    QString m_workRoot;
    QString m_ffmpegPath;
    RenderSettings m_render;
    SoftSubtitleSettings m_soft;
    SubtitleStyle m_style;
    int m_terminationGraceMs;
};

#endif // JOBORCHESTRATOR_H
