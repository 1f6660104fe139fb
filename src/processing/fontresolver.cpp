#include "fontresolver.h"

#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include <QStandardPaths>
#include <QXmlStreamWriter>

static const char* kGenericFallbackFont = "Sans";

FontResolver::FontResolver(QObject* parent)
    : QObject(parent),
      m_bundledFontsDir(AppSettings::instance().bundledFontsDir()),
      m_bundledFontFamily(AppSettings::instance().bundledFontFamily()),
      m_candidates(AppSettings::instance().fontCandidates()),
      m_searchDirs(AppSettings::instance().fontSearchDirs())
{
}

QStringList FontResolver::fontFileFilters()
{
    return {"*.ttf", "*.otf", "*.ttc", "*.woff", "*.woff2"};
}

QString FontResolver::resolveFontName()
{
    if (hasBundledFonts())
    {
        QString family = bundledFamilyName();
        emit logMessage(QString("Используется шрифт из комплекта поставки: %1").arg(family), LogCategory::DEBUG);
        return family;
    }

    for (const QString& candidate : m_candidates)
    {
        QString fontPath = findFontFile(candidate, m_searchDirs);
        if (!fontPath.isEmpty())
        {
            emit logMessage(QString("Шрифт '%1' найден: %2").arg(candidate, fontPath), LogCategory::DEBUG);
            return candidate;
        }
    }

    emit logMessage(QString("Ни один из шрифтов (%1) не найден, используется '%2'.")
                        .arg(m_candidates.join(", "), kGenericFallbackFont),
                    LogCategory::APP);
    return kGenericFallbackFont;
}

bool FontResolver::hasBundledFonts() const
{
    if (m_bundledFontsDir.isEmpty())
    {
        return false;
    }
    QDir dir(m_bundledFontsDir);
    return dir.exists() && !dir.entryList(fontFileFilters(), QDir::Files).isEmpty();
}

bool FontResolver::writeFontConfig(const QString& directory, QString& configPath, QString& error)
{
    if (!QDir(directory).mkpath("."))
    {
        error = "Не удалось создать папку для fonts.conf: " + directory;
        return false;
    }

    configPath = QDir(directory).filePath("fonts.conf");
    QFile file(configPath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text))
    {
        error = "Не удалось записать " + configPath + ": " + file.errorString();
        return false;
    }

    QXmlStreamWriter xml(&file);
    xml.setAutoFormatting(true);
    xml.writeStartDocument();
    xml.writeDTD("<!DOCTYPE fontconfig SYSTEM \"fonts.dtd\">");
    xml.writeStartElement("fontconfig");
    if (hasBundledFonts())
    {
        xml.writeTextElement("dir", QDir(m_bundledFontsDir).absolutePath());
    }
    for (const QString& searchDir : m_searchDirs)
    {
        if (QDir(searchDir).exists())
        {
            xml.writeTextElement("dir", searchDir);
        }
    }

    xml.writeStartElement("include");
    xml.writeAttribute("ignore_missing", "yes");
    xml.writeCharacters("/etc/fonts/fonts.conf");
    xml.writeEndElement();

    QString cacheDir = QStandardPaths::writableLocation(QStandardPaths::CacheLocation);
    if (cacheDir.isEmpty())
    {
        cacheDir = QDir(directory).filePath("fontcache");
    }
    xml.writeTextElement("cachedir", QDir(cacheDir).filePath("fontconfig"));

    xml.writeEndElement();
    xml.writeEndDocument();

    if (xml.hasError())
    {
        error = "Ошибка записи " + configPath;
        return false;
    }

    emit logMessage("Создан файл конфигурации шрифтов: " + configPath, LogCategory::DEBUG);
    return true;
}

QString FontResolver::findFontFile(const QString& family, const QStringList& searchDirs)
{
    const QString wanted = normalizedFamilyKey(family);
    if (wanted.isEmpty())
    {
        return QString();
    }

    for (const QString& dirPath : searchDirs)
    {
        if (!QDir(dirPath).exists())
        {
            continue;
        }

        QDirIterator it(dirPath, fontFileFilters(), QDir::Files, QDirIterator::Subdirectories);
        while (it.hasNext())
        {
            const QString filePath = it.next();
            if (normalizedFamilyKey(QFileInfo(filePath).completeBaseName()) == wanted)
            {
                return QFileInfo(filePath).absoluteFilePath();
            }
        }
    }
    return QString();
}

QString FontResolver::normalizedFamilyKey(const QString& text)
{
    static const QRegularExpression styleSuffix(
        R"([-_ ](bold|italic|regular|light|medium|semibold|black|thin|heavy|oblique|condensed|expanded)$)",
        QRegularExpression::CaseInsensitiveOption);

    QString key = text.trimmed();
    // Снимаем суффиксы по одному: NotoSans-Bold-Italic -> NotoSans
    QString previous;
    while (previous != key)
    {
        previous = key;
        key.remove(styleSuffix);
    }
    key.remove(' ');
    key.remove('-');
    key.remove('_');
    return key.toLower();
}

QString FontResolver::bundledFamilyName() const
{
    if (!m_bundledFontFamily.isEmpty())
    {
        return m_bundledFontFamily;
    }

    QDir dir(m_bundledFontsDir);
    const QFileInfoList files = dir.entryInfoList(fontFileFilters(), QDir::Files, QDir::Name);
    if (files.isEmpty())
    {
        return kGenericFallbackFont;
    }

    static const QRegularExpression styleSuffix(
        R"([-_](bold|italic|regular|light|medium|semibold|black|thin|heavy|oblique|condensed|expanded)$)",
        QRegularExpression::CaseInsensitiveOption);
    QString family = files.first().completeBaseName();
    family.remove(styleSuffix);
    return family;
}
