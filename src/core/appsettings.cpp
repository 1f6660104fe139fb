#include "appsettings.h"
#include <QCoreApplication>
#include <QStandardPaths>
#include <QDir>
#include <QFileInfo>
#include <QJsonObject>


static QString findExecutablePath(const QString &exeName) {
    // 1. Ищем в tools/ рядом с бинарником
    const QString kAppDir = QCoreApplication::applicationDirPath();
    QString candidate = QDir(kAppDir).filePath("tools/" + exeName);
    if (QFileInfo::exists(candidate)) {
        return candidate;
    }

    // 2. Ищем рядом с бинарником
    candidate = QDir(kAppDir).filePath(exeName);
    if (QFileInfo::exists(candidate)) {
        return candidate;
    }

    // 3. Ищем в PATH
    QString path = QStandardPaths::findExecutable(exeName);
    if (!path.isEmpty()) {
        return path;
    }

    // 4. Фоллбэк: просто имя, QProcess поищет сам при запуске
    return exeName;
}

/**
 * @brief Load a tool path from settings, re-detecting if the stored path no longer exists.
 */
static QString loadToolPath(const QSettings &settings, const QString &key, const QString &exeName) {
    QString stored = settings.value(key).toString();
    if (!stored.isEmpty() && QFileInfo::exists(stored)) {
        return stored;
    }
    return findExecutablePath(exeName);
}

AppSettings& AppSettings::instance() {
    static AppSettings self;
    return self;
}

AppSettings::AppSettings(QObject *parent) : QObject(parent) {
    loadDefaults();
}

void AppSettings::load() {
    QSettings settings("MyCompany", "SubtitleTool");
    loadDefaults();

    m_ffmpegPath = loadToolPath(settings, "paths/ffmpeg", "ffmpeg");
    m_ffprobePath = loadToolPath(settings, "paths/ffprobe", "ffprobe");
    m_workRoot = settings.value("general/workRoot", m_workRoot).toString();

    if (settings.contains("subtitles/style")) {
        m_subtitleStyle.read(settings.value("subtitles/style").toJsonObject());
    }
    m_legacyEncodings = settings.value("subtitles/legacyEncodings", m_legacyEncodings).toStringList();

    m_bundledFontsDir = settings.value("fonts/bundledDir", m_bundledFontsDir).toString();
    m_bundledFontFamily = settings.value("fonts/bundledFamily", m_bundledFontFamily).toString();
    m_fontCandidates = settings.value("fonts/candidates", m_fontCandidates).toStringList();
    m_fontSearchDirs = settings.value("fonts/searchDirs", m_fontSearchDirs).toStringList();

    m_renderSettings.videoCodec = settings.value("render/videoCodec", m_renderSettings.videoCodec).toString();
    m_renderSettings.crf = settings.value("render/crf", m_renderSettings.crf).toInt();
    m_renderSettings.preset = settings.value("render/preset", m_renderSettings.preset).toString();
    m_renderSettings.threads = settings.value("render/threads", m_renderSettings.threads).toInt();
    m_renderSettings.maxMuxingQueueSize = settings.value("render/maxMuxingQueueSize", m_renderSettings.maxMuxingQueueSize).toInt();
    m_renderSettings.lowMemoryMode = settings.value("render/lowMemoryMode", m_renderSettings.lowMemoryMode).toBool();

    m_softSettings.codec = settings.value("soft/subtitleCodec", m_softSettings.codec).toString();
    m_softSettings.language = settings.value("soft/language", m_softSettings.language).toString();
    m_softSettings.title = settings.value("soft/title", m_softSettings.title).toString();

    m_terminationGraceMs = settings.value("process/terminationGraceMs", m_terminationGraceMs).toInt();
    m_helperTimeoutMs = settings.value("process/helperTimeoutMs", m_helperTimeoutMs).toInt();

    QVariantList enabledCategoriesInts = settings.value("logging/enabledCategories").toList();
    if (!enabledCategoriesInts.isEmpty()) {
        m_enabledLogCategories.clear();
        for (const QVariant& val : enabledCategoriesInts) {
            m_enabledLogCategories.insert(static_cast<LogCategory>(val.toInt()));
        }
    }
}

void AppSettings::save() {
    QSettings settings("MyCompany", "SubtitleTool");
    settings.setValue("paths/ffmpeg", m_ffmpegPath);
    settings.setValue("paths/ffprobe", m_ffprobePath);
    settings.setValue("general/workRoot", m_workRoot);

    QJsonObject styleObj;
    m_subtitleStyle.write(styleObj);
    settings.setValue("subtitles/style", styleObj);
    settings.setValue("subtitles/legacyEncodings", m_legacyEncodings);

    settings.setValue("fonts/bundledDir", m_bundledFontsDir);
    settings.setValue("fonts/bundledFamily", m_bundledFontFamily);
    settings.setValue("fonts/candidates", m_fontCandidates);
    settings.setValue("fonts/searchDirs", m_fontSearchDirs);

    settings.setValue("render/videoCodec", m_renderSettings.videoCodec);
    settings.setValue("render/crf", m_renderSettings.crf);
    settings.setValue("render/preset", m_renderSettings.preset);
    settings.setValue("render/threads", m_renderSettings.threads);
    settings.setValue("render/maxMuxingQueueSize", m_renderSettings.maxMuxingQueueSize);
    settings.setValue("render/lowMemoryMode", m_renderSettings.lowMemoryMode);

    settings.setValue("soft/subtitleCodec", m_softSettings.codec);
    settings.setValue("soft/language", m_softSettings.language);
    settings.setValue("soft/title", m_softSettings.title);

    settings.setValue("process/terminationGraceMs", m_terminationGraceMs);
    settings.setValue("process/helperTimeoutMs", m_helperTimeoutMs);

    QVariantList enabledCategoriesInts;
    for (const auto& category : m_enabledLogCategories) {
        enabledCategoriesInts.append(static_cast<int>(category));
    }
    settings.setValue("logging/enabledCategories", enabledCategoriesInts);
}

void AppSettings::loadDefaults() {
    m_ffmpegPath = findExecutablePath("ffmpeg");
    m_ffprobePath = findExecutablePath("ffprobe");
    m_workRoot = QDir::current().filePath("jobs");
    m_subtitleStyle = SubtitleStyle();
    // Однобайтовая кодовая страница принимает почти любые байты, на деле срабатывает первая из списка
    m_legacyEncodings = { "windows-1251", "windows-1252" };

    // Шрифт, поставляемый вместе с приложением, лежит в fonts/ рядом с бинарником
    m_bundledFontsDir = QDir(QCoreApplication::applicationDirPath()).filePath("fonts");
    m_bundledFontFamily.clear();
    m_fontCandidates = { "Noto Sans", "DejaVu Sans", "Arial" };
    m_fontSearchDirs = { "/usr/share/fonts", "/usr/local/share/fonts",
                         QDir::home().filePath(".fonts"), QDir::home().filePath(".local/share/fonts") };

    m_renderSettings = RenderSettings();
    m_softSettings = SoftSubtitleSettings();
    m_terminationGraceMs = 2000;
    m_helperTimeoutMs = 60000;

    m_enabledLogCategories = { LogCategory::APP };
}

QStringList AppSettings::supportedResolutions() {
    return { "360p", "480p", "720p", "1080p" };
}

QStringList AppSettings::allowedSubtitleExtensions() {
    return { ".srt", ".ass", ".vtt", ".sub", ".ssa" };
}


// Геттеры и сеттеры
QSet<LogCategory> AppSettings::enabledLogCategories() const { return m_enabledLogCategories; }
void AppSettings::setEnabledLogCategories(const QSet<LogCategory> &categories) { m_enabledLogCategories = categories; }
QString AppSettings::ffmpegPath() const { return m_ffmpegPath; }
void AppSettings::setFfmpegPath(const QString &path) { m_ffmpegPath = path; }
QString AppSettings::ffprobePath() const { return m_ffprobePath; }
void AppSettings::setFfprobePath(const QString &path) { m_ffprobePath = path; }
QString AppSettings::workRoot() const { return m_workRoot; }
void AppSettings::setWorkRoot(const QString &path) { m_workRoot = path; }
SubtitleStyle AppSettings::subtitleStyle() const { return m_subtitleStyle; }
void AppSettings::setSubtitleStyle(const SubtitleStyle &style) { m_subtitleStyle = style; }
QStringList AppSettings::legacyEncodings() const { return m_legacyEncodings; }
void AppSettings::setLegacyEncodings(const QStringList &encodings) { m_legacyEncodings = encodings; }
QString AppSettings::bundledFontsDir() const { return m_bundledFontsDir; }
void AppSettings::setBundledFontsDir(const QString &dir) { m_bundledFontsDir = dir; }
QString AppSettings::bundledFontFamily() const { return m_bundledFontFamily; }
void AppSettings::setBundledFontFamily(const QString &family) { m_bundledFontFamily = family; }
QStringList AppSettings::fontCandidates() const { return m_fontCandidates; }
void AppSettings::setFontCandidates(const QStringList &candidates) { m_fontCandidates = candidates; }
QStringList AppSettings::fontSearchDirs() const { return m_fontSearchDirs; }
void AppSettings::setFontSearchDirs(const QStringList &dirs) { m_fontSearchDirs = dirs; }
RenderSettings AppSettings::renderSettings() const { return m_renderSettings; }
void AppSettings::setRenderSettings(const RenderSettings &settings) { m_renderSettings = settings; }
SoftSubtitleSettings AppSettings::softSubtitleSettings() const { return m_softSettings; }
void AppSettings::setSoftSubtitleSettings(const SoftSubtitleSettings &settings) { m_softSettings = settings; }
int AppSettings::terminationGraceMs() const { return m_terminationGraceMs; }
void AppSettings::setTerminationGraceMs(int ms) { m_terminationGraceMs = ms; }
int AppSettings::helperTimeoutMs() const { return m_helperTimeoutMs; }
void AppSettings::setHelperTimeoutMs(int ms) { m_helperTimeoutMs = ms; }
