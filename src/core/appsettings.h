#ifndef APPSETTINGS_H
#define APPSETTINGS_H

#include <QObject>
#include <QSettings>
#include <QList>
#include <QSet>
#include <QStringList>
#include "subtitlestyle.h"


enum class LogCategory {
    APP,
    FFMPEG,
    NETWORK,
    DEBUG
};

struct RenderSettings {
    QString videoCodec = "libx264";
    int crf = 23;
    QString preset = "medium";
    int threads = 0;                    // 0 - ffmpeg выбирает сам
    int maxMuxingQueueSize = 1024;
    bool lowMemoryMode = false;         // veryfast / crf 28 / 2 потока

    // Параметры с учётом режима экономии памяти
    QString effectivePreset() const { return lowMemoryMode ? "veryfast" : preset; }
    int effectiveCrf() const { return lowMemoryMode ? 28 : crf; }
    int effectiveThreads() const { return lowMemoryMode ? 2 : threads; }
};

struct SoftSubtitleSettings {
    QString codec = "mov_text";
    QString language = "eng";
    QString title = "English";
};

class AppSettings : public QObject
{
    Q_OBJECT
private:
    explicit AppSettings(QObject *parent = nullptr);
    AppSettings(const AppSettings&) = delete;
    AppSettings& operator=(const AppSettings&) = delete;

public:
    static AppSettings& instance();
    void load();
    void save();
    void loadDefaults();

    QSet<LogCategory> enabledLogCategories() const;
    void setEnabledLogCategories(const QSet<LogCategory> &categories);
    QString ffmpegPath() const;
    void setFfmpegPath(const QString &path);
    QString ffprobePath() const;
    void setFfprobePath(const QString &path);
    QString workRoot() const;
    void setWorkRoot(const QString &path);
    SubtitleStyle subtitleStyle() const;
    void setSubtitleStyle(const SubtitleStyle &style);
    QStringList legacyEncodings() const;
    void setLegacyEncodings(const QStringList &encodings);
    QString bundledFontsDir() const;
    void setBundledFontsDir(const QString &dir);
    QString bundledFontFamily() const;
    void setBundledFontFamily(const QString &family);
    QStringList fontCandidates() const;
    void setFontCandidates(const QStringList &candidates);
    QStringList fontSearchDirs() const;
    void setFontSearchDirs(const QStringList &dirs);
    RenderSettings renderSettings() const;
    void setRenderSettings(const RenderSettings &settings);
    SoftSubtitleSettings softSubtitleSettings() const;
    void setSoftSubtitleSettings(const SoftSubtitleSettings &settings);
    int terminationGraceMs() const;
    void setTerminationGraceMs(int ms);
    int helperTimeoutMs() const;
    void setHelperTimeoutMs(int ms);

    static QStringList supportedResolutions();
    static QStringList allowedSubtitleExtensions();

private:
    QSet<LogCategory> m_enabledLogCategories;
    QString m_ffmpegPath;
    QString m_ffprobePath;
    QString m_workRoot;
    SubtitleStyle m_subtitleStyle;
    QStringList m_legacyEncodings;
    QString m_bundledFontsDir;
    QString m_bundledFontFamily;
    QStringList m_fontCandidates;
    QStringList m_fontSearchDirs;
    RenderSettings m_renderSettings;
    SoftSubtitleSettings m_softSettings;
    int m_terminationGraceMs;
    int m_helperTimeoutMs;
};

#endif // APPSETTINGS_H
