#include "mediaprobe.h"
#include "processmanager.h"

#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>


MediaProbe::MediaProbe(ProcessManager* procManager, QObject* parent)
    : QObject(parent),
      m_procManager(procManager),
      m_ffprobePath(AppSettings::instance().ffprobePath()),
      m_timeoutMs(AppSettings::instance().helperTimeoutMs())
{
}

bool MediaProbe::probe(const QString& mediaPath, MediaInfo& info, QString& error)
{
    if (!QFileInfo::exists(mediaPath))
    {
        error = "Файл для анализа не найден: " + mediaPath;
        return false;
    }

    emit logMessage("Получение информации о видео через ffprobe...", LogCategory::DEBUG);
    QStringList ffprobeArgs = {"-v", "quiet", "-print_format", "json", "-show_format", "-show_streams", mediaPath};

    QByteArray jsonData;
    if (!m_procManager->executeAndWait(m_ffprobePath, ffprobeArgs, jsonData, m_timeoutMs) || jsonData.isEmpty())
    {
        error = "ffprobe не вернул данные для " + QFileInfo(mediaPath).fileName();
        return false;
    }

    if (!parseProbeOutput(jsonData, info, error))
    {
        return false;
    }

    emit logMessage(QString("Видео: %1x%2, %3 c, кодек %4, %5 fps")
                        .arg(info.width)
                        .arg(info.height)
                        .arg(info.durationSeconds, 0, 'f', 2)
                        .arg(info.codec)
                        .arg(info.fps, 0, 'f', 3),
                    LogCategory::APP);
    return true;
}

bool MediaProbe::parseProbeOutput(const QByteArray& jsonData, MediaInfo& info, QString& error)
{
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(jsonData, &parseError);
    if (doc.isNull() || !doc.isObject())
    {
        error = "Не удалось распарсить JSON от ffprobe: " + parseError.errorString();
        return false;
    }

    QJsonObject root = doc.object();
    QJsonObject videoStream;
    const QJsonArray streams = root["streams"].toArray();
    for (const QJsonValue& value : streams)
    {
        QJsonObject stream = value.toObject();
        if (stream["codec_type"].toString() == "video")
        {
            videoStream = stream;
            break;
        }
    }

    if (videoStream.isEmpty())
    {
        error = "Не удалось найти видеопоток в выводе ffprobe.";
        return false;
    }

    QJsonObject format = root["format"].toObject();

    info = MediaInfo();
    info.width = videoStream["width"].toInt();
    info.height = videoStream["height"].toInt();
    info.codec = videoStream["codec_name"].toString();

    // ffprobe отдаёт числа строками
    info.durationSeconds = format["duration"].toString().toDouble();
    if (info.durationSeconds <= 0)
    {
        info.durationSeconds = videoStream["duration"].toString().toDouble();
    }
    info.bitRate = format["bit_rate"].toString().toLongLong();
    if (info.bitRate <= 0)
    {
        info.bitRate = videoStream["bit_rate"].toString().toLongLong();
    }

    double fps = 0.0;
    if (parseFrameRate(videoStream["r_frame_rate"].toString(), fps) ||
        parseFrameRate(videoStream["avg_frame_rate"].toString(), fps))
    {
        info.fps = fps;
    }
    return true;
}

bool MediaProbe::parseFrameRate(const QString& text, double& fps)
{
    const QString trimmed = text.trimmed();
    if (trimmed.isEmpty())
    {
        return false;
    }

    const QStringList parts = trimmed.split('/');
    if (parts.size() > 2)
    {
        return false;
    }

    bool numOk = false;
    const qlonglong numerator = parts[0].toLongLong(&numOk);
    if (!numOk || numerator < 0)
    {
        return false;
    }

    qlonglong denominator = 1;
    if (parts.size() == 2)
    {
        bool denOk = false;
        denominator = parts[1].toLongLong(&denOk);
        if (!denOk || denominator <= 0)
        {
            return false;
        }
    }

    fps = static_cast<double>(numerator) / static_cast<double>(denominator);
    return true;
}
