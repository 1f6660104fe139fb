#ifndef FFMPEGENCODER_H
#define FFMPEGENCODER_H

#include "appsettings.h"
#include "encoder.h"

#include <QObject>

/**
 * @brief Default Encoder: scales the processed video to the label's height
 *
 * Output goes next to the input as <name>_<label>.mp4. Every call uses its
 * own ffmpeg process, so one instance may serve several jobs at once.
 */
class FfmpegEncoder : public QObject, public Encoder
{
    Q_OBJECT
public:
    explicit FfmpegEncoder(QObject* parent = nullptr);

    bool encode(const QString& inputPath,
                const QString& resolutionLabel,
                const CancellationToken& token,
                QString& outputPath,
                QString& error) override;

    // "720p" -> 720; 0 для неизвестной метки
    static int heightForLabel(const QString& resolutionLabel);

    QStringList buildArguments(const QString& inputPath, int height, const QString& outputPath) const;

signals:
    void logMessage(const QString& message, LogCategory category = LogCategory::FFMPEG);

private:
    QString m_ffmpegPath;
    RenderSettings m_render;
    int m_terminationGraceMs;
};

#endif // FFMPEGENCODER_H
