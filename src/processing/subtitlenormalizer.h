#ifndef SUBTITLENORMALIZER_H
#define SUBTITLENORMALIZER_H

#include "appsettings.h"
#include "subtitlestyle.h"

#include <QObject>
#include <QStringConverter>
#include <QStringList>

class ProcessManager;

/**
 * @brief Prepares a subtitle file for embedding or burn-in
 *
 * Three steps, each writing a new artifact next to the previous one; the
 * source file is never modified:
 *  1. encoding normalization to UTF-8 without BOM;
 *  2. conversion of SRT/VTT/SUB to ASS through ffmpeg (burn-in only);
 *  3. rewrite of the Default style (burn-in only).
 */
class SubtitleNormalizer : public QObject
{
    Q_OBJECT
public:
    explicit SubtitleNormalizer(ProcessManager* procManager, QObject* parent = nullptr);

    // Файл существует, это обычный файл и он не пустой
    static bool validateSubtitleFile(const QString& path, QString& error);

    static bool isStyledFormat(const QString& path);

    /**
     * @brief Decodes @p raw and re-encodes it as UTF-8 without BOM.
     *
     * Valid UTF-8 without BOM is returned unchanged. Then: UTF-8 with BOM,
     * UTF-16 with BOM, BOM-less UTF-16 when the zero-byte pattern looks like
     * it, the configured legacy code pages, Latin-1. Text containing NUL
     * characters is rejected by every candidate.
     * @param detectedEncoding Receives the name of the encoding that succeeded.
     */
    bool normalizeEncoding(const QByteArray& raw, QByteArray& utf8, QString& detectedEncoding,
                           QString& error);

    bool normalizeEncodingFile(const QString& inputPath, const QString& outputPath, QString& error);

    bool convertToAss(const QString& inputPath, const QString& outputAssPath, QString& error);

    /**
     * @brief Rewrites the Default style of @p inputAssPath into @p outputAssPath.
     *
     * Fails when the style section, its Format line or a required column is
     * missing. A script without a Default row is copied unchanged with a warning.
     */
    bool injectStyle(const QString& inputAssPath, const QString& outputAssPath, const SubtitleStyle& style,
                     QString& error);

    /**
     * @brief Encoding normalization only. Output goes to @p workDir.
     */
    bool prepareForEmbed(const QString& subtitlePath, const QString& workDir, QString& outputPath, QString& error);

    /**
     * @brief Full pipeline: encoding, conversion to ASS and style injection.
     */
    bool prepareForBurn(const QString& subtitlePath, const QString& workDir, const SubtitleStyle& style,
                        QString& outputPath, QString& error);

    // 'LE' / 'BE' для UTF-16 без BOM, иначе пусто
    static QString guessBomlessUtf16(const QByteArray& raw);

signals:
    void logMessage(const QString& message, LogCategory category = LogCategory::APP);

private:
    static bool decodeStrict(const QByteArray& raw, QStringConverter::Encoding encoding, QString& text);
    static bool decodeNamed(const QByteArray& raw, const QString& encodingName, QString& text);

    ProcessManager* m_procManager;
    QString m_ffmpegPath;
    QStringList m_legacyEncodings;
    int m_helperTimeoutMs;
};

#endif // SUBTITLENORMALIZER_H
