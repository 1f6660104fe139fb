#include "ffmpegencoder.h"
#include "processmanager.h"
#include "progressmonitor.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>

FfmpegEncoder::FfmpegEncoder(QObject* parent)
    : QObject(parent),
      m_ffmpegPath(AppSettings::instance().ffmpegPath()),
      m_render(AppSettings::instance().renderSettings()),
      m_terminationGraceMs(AppSettings::instance().terminationGraceMs())
{
}

int FfmpegEncoder::heightForLabel(const QString& resolutionLabel)
{
    static const QRegularExpression re("^(\\d+)p$", QRegularExpression::CaseInsensitiveOption);
    QRegularExpressionMatch match = re.match(resolutionLabel.trimmed());
    if (!match.hasMatch())
    {
        return 0;
    }
    return match.captured(1).toInt();
}

QStringList FfmpegEncoder::buildArguments(const QString& inputPath, int height, const QString& outputPath) const
{
    // -2: ширина пропорционально, кратная двум
    return {"-y", "-hide_banner", "-i", inputPath,
            "-vf", QString("scale=-2:%1").arg(height),
            "-c:v", m_render.videoCodec,
            "-crf", QString::number(m_render.effectiveCrf()),
            "-preset", m_render.effectivePreset(),
            "-threads", QString::number(m_render.effectiveThreads()),
            "-c:a", "copy",
            "-c:s", "copy",
            "-max_muxing_queue_size", QString::number(m_render.maxMuxingQueueSize),
            outputPath};
}

bool FfmpegEncoder::encode(const QString& inputPath, const QString& resolutionLabel, const CancellationToken& token,
                           QString& outputPath, QString& error)
{
    const int height = heightForLabel(resolutionLabel);
    if (height <= 0)
    {
        error = "Неизвестное разрешение: " + resolutionLabel;
        return false;
    }

    QFileInfo inputInfo(inputPath);
    const QString target =
        QDir(inputInfo.absolutePath()).filePath(QString("%1_%2.mp4").arg(inputInfo.completeBaseName(), resolutionLabel));

    ProcessManager process;
    connect(&process, &ProcessManager::processOutput, this,
            [this](const QString& output) { emit logMessage(output, LogCategory::DEBUG); }, Qt::DirectConnection);
    connect(&process, &ProcessManager::processError, this,
            [this](const QString& message) { emit logMessage(message, LogCategory::FFMPEG); }, Qt::DirectConnection);

    emit logMessage(QString("Кодирование в %1...").arg(resolutionLabel), LogCategory::APP);
    if (!process.startProcess(m_ffmpegPath, buildArguments(inputPath, height, target)))
    {
        error = "Не удалось запустить ffmpeg: " + process.errorString();
        return false;
    }

    ProgressMonitor monitor(0.0, nullptr);
    monitor.setLineCallback([this](const QString& line) { emit logMessage(line, LogCategory::FFMPEG); });
    if (monitor.run(process, token) == ProgressMonitor::Outcome::Cancelled)
    {
        process.terminateGracefully(m_terminationGraceMs);
        QFile::remove(target);
        error = QString("Кодирование в %1 отменено.").arg(resolutionLabel);
        return false;
    }

    process.waitForFinished(m_terminationGraceMs);
    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0)
    {
        QFile::remove(target);
        error = QString("ffmpeg завершился с кодом %1 при кодировании в %2. %3")
                    .arg(process.exitCode())
                    .arg(resolutionLabel, process.recentOutput().join("\n"))
                    .trimmed();
        return false;
    }

    if (!QFileInfo::exists(target))
    {
        error = "ffmpeg не создал файл " + target;
        return false;
    }

    outputPath = target;
    emit logMessage(QString("Готово: %1").arg(QFileInfo(target).fileName()), LogCategory::APP);
    return true;
}
