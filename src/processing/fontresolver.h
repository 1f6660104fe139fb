#ifndef FONTRESOLVER_H
#define FONTRESOLVER_H

#include "appsettings.h"

#include <QObject>
#include <QStringList>

/**
 * @brief Picks the font family written into the Default style before burn-in
 *
 * Order: a font bundled with the deployment (fonts/bundledDir), then the first
 * configured candidate whose font file exists in one of the search
 * directories, then the generic "Sans". Only a name is selected; the renderer
 * resolves the actual file through fontconfig.
 */
class FontResolver : public QObject
{
    Q_OBJECT
    Q_DISABLE_COPY_MOVE(FontResolver)

public:
    explicit FontResolver(QObject* parent = nullptr);

    QString resolveFontName();

    bool hasBundledFonts() const;
    QString bundledFontsDir() const { return m_bundledFontsDir; }

    /**
     * @brief Writes fonts.conf into @p directory.
     *
     * The file adds the bundled fonts directory (when present) to the system
     * configuration, so libass inside ffmpeg sees the bundled font. Pass the
     * result through FONTCONFIG_FILE.
     */
    bool writeFontConfig(const QString& directory, QString& configPath, QString& error);

    /**
     * @brief Looks for a font file whose name matches @p family.
     *
     * Matching ignores case, spaces and style suffixes such as "-Regular" or
     * "_Bold". Subdirectories are searched.
     * @return Absolute file path, or an empty string.
     */
    static QString findFontFile(const QString& family, const QStringList& searchDirs);

    static QStringList fontFileFilters();

signals:
    void logMessage(const QString& message, LogCategory category);

private:
    static QString normalizedFamilyKey(const QString& text);
    QString bundledFamilyName() const;

    QString m_bundledFontsDir;
    QString m_bundledFontFamily;
    QStringList m_candidates;
    QStringList m_searchDirs;
};

#endif // FONTRESOLVER_H
