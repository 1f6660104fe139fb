#ifndef MEDIAPROBE_H
#define MEDIAPROBE_H

#include "appsettings.h"

#include <QObject>

class ProcessManager;

struct MediaInfo
{
    int width = 0;
    int height = 0;
    double durationSeconds = 0.0; // 0 - неизвестна
    qint64 bitRate = 0;
    QString codec;
    double fps = 0.0;
};

/**
 * @brief Reads basic video properties with ffprobe
 */
class MediaProbe : public QObject
{
    Q_OBJECT
public:
    explicit MediaProbe(ProcessManager* procManager, QObject* parent = nullptr);

    bool probe(const QString& mediaPath, MediaInfo& info, QString& error);

    /**
     * @brief Parses the JSON printed by "ffprobe -print_format json -show_format -show_streams".
     * @return false if the JSON is malformed or has no video stream.
     */
    static bool parseProbeOutput(const QByteArray& jsonData, MediaInfo& info, QString& error);

    /**
     * @brief Parses "num/den" or a plain integer frame rate.
     * @return false on malformed text or a zero denominator.
     */
    static bool parseFrameRate(const QString& text, double& fps);

signals:
    void logMessage(const QString& message, LogCategory category = LogCategory::APP);

private:
    ProcessManager* m_procManager;
    QString m_ffprobePath;
    int m_timeoutMs;
};

#endif // MEDIAPROBE_H
