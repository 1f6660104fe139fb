#include "appsettings.h"
#include "ffmpegencoder.h"
#include "filedownloader.h"
#include "jobmanager.h"
#include "logsink.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFileInfo>
#include <QJsonDocument>
#include <QTextStream>

enum ExitCode
{
    ExitCompleted = 0,
    ExitFailed = 1,
    ExitCancelled = 2,
    ExitInvalidRequest = 3
};

int main(int argc, char* argv[])
{
    QCoreApplication a(argc, argv);
    QCoreApplication::setApplicationName("subtitletool");

    QCommandLineParser parser;
    parser.setApplicationDescription("Embeds or burns subtitles into a video and encodes renditions.");
    parser.addHelpOption();
    parser.addPositionalArgument("video", "Video file path or URL.");
    parser.addPositionalArgument("subtitle", "Subtitle file path or URL (.srt .ass .vtt .sub .ssa).");
    QCommandLineOption resolutionsOption({"r", "resolutions"}, "Comma-separated renditions, e.g. 360p,720p.",
                                         "list", AppSettings::supportedResolutions().join(","));
    QCommandLineOption softOption({"s", "soft"}, "Embed subtitles as a separate track instead of burning them in.");
    QCommandLineOption logOption("log", "Log file path.", "file", "subtitletool.log");
    QCommandLineOption timeoutOption("timeout", "Give up waiting after this many seconds (0 - no limit).",
                                     "seconds", "0");
    parser.addOption(resolutionsOption);
    parser.addOption(softOption);
    parser.addOption(logOption);
    parser.addOption(timeoutOption);
    parser.process(a);

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 2)
    {
        parser.showHelp(ExitInvalidRequest);
    }

    AppSettings::instance().load();
    const auto& settings = AppSettings::instance();
    if (!QFileInfo::exists(settings.ffmpegPath()))
    {
        qWarning("ffmpeg не найден по пути '%s', будет использован поиск в PATH.", qPrintable(settings.ffmpegPath()));
    }

    LogSink logSink(parser.value(logOption));
    FileDownloader downloader;
    FfmpegEncoder encoder;
    JobManager manager(&downloader, &encoder);

    QObject::connect(&manager, &JobManager::logMessage, &logSink, &LogSink::writeForJob, Qt::DirectConnection);
    QObject::connect(&downloader, &FileDownloader::logMessage, &logSink, &LogSink::write, Qt::DirectConnection);
    QObject::connect(&encoder, &FfmpegEncoder::logMessage, &logSink, &LogSink::write, Qt::DirectConnection);

    const QStringList resolutions = parser.value(resolutionsOption).split(',', Qt::SkipEmptyParts);
    SubmitResult submitted = manager.submit(positional[0], positional[1], resolutions, parser.isSet(softOption));
    QTextStream out(stdout);
    if (!submitted.ok)
    {
        logSink.write("Запрос отклонён: " + submitted.error, LogCategory::APP);
        out << submitted.error << Qt::endl;
        return ExitInvalidRequest;
    }

    out << "job_id: " << submitted.id << Qt::endl;

    const int timeoutS = parser.value(timeoutOption).toInt();
    int waitedS = 0;
    double lastPercentage = -1;
    QString lastStage;
    while (!manager.waitForJob(submitted.id, 1000))
    {
        ++waitedS;
        std::optional<Job> job = manager.getStatus(submitted.id);
        if (job && (job->stage != lastStage || job->progress.percentage != lastPercentage))
        {
            lastStage = job->stage;
            lastPercentage = job->progress.percentage;
            out << QString("[%1] %2%").arg(lastStage).arg(lastPercentage, 0, 'f', 1) << Qt::endl;
        }
        if (timeoutS > 0 && waitedS >= timeoutS)
        {
            out << "Время ожидания истекло, задача отменяется." << Qt::endl;
            manager.cancel(submitted.id);
            manager.waitForJob(submitted.id, -1);
            break;
        }
    }

    std::optional<Job> job = manager.getStatus(submitted.id);
    if (!job)
    {
        return ExitFailed;
    }
    out << QJsonDocument(job->toJson()).toJson(QJsonDocument::Indented);

    switch (job->status)
    {
    case JobStatus::Completed:
        return ExitCompleted;
    case JobStatus::Cancelled:
        return ExitCancelled;
    default:
        return ExitFailed;
    }
}
