#include "subtitlenormalizer.h"
#include "assstyleblock.h"
#include "processmanager.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QStringConverter>

static const QByteArray kUtf8Bom("\xEF\xBB\xBF", 3);
static const QByteArray kUtf16LeBom("\xFF\xFE", 2);
static const QByteArray kUtf16BeBom("\xFE\xFF", 2);

SubtitleNormalizer::SubtitleNormalizer(ProcessManager* procManager, QObject* parent)
    : QObject(parent),
      m_procManager(procManager),
      m_ffmpegPath(AppSettings::instance().ffmpegPath()),
      m_legacyEncodings(AppSettings::instance().legacyEncodings()),
      m_helperTimeoutMs(AppSettings::instance().helperTimeoutMs())
{
}

bool SubtitleNormalizer::validateSubtitleFile(const QString& path, QString& error)
{
    QFileInfo info(path);
    if (!info.exists())
    {
        error = "Файл субтитров не найден: " + path;
        return false;
    }
    if (!info.isFile())
    {
        error = "Путь к субтитрам не является файлом: " + path;
        return false;
    }
    if (info.size() == 0)
    {
        error = "Файл субтитров пуст: " + path;
        return false;
    }
    return true;
}

bool SubtitleNormalizer::isStyledFormat(const QString& path)
{
    const QString suffix = QFileInfo(path).suffix().toLower();
    return suffix == "ass" || suffix == "ssa";
}

bool SubtitleNormalizer::normalizeEncoding(const QByteArray& raw, QByteArray& utf8, QString& detectedEncoding,
                                           QString& error)
{
    if (raw.isEmpty())
    {
        error = "Файл субтитров пуст.";
        return false;
    }

    QString text;

    // Корректный UTF-8 без BOM оставляем как есть, байт в байт
    if (!raw.startsWith(kUtf8Bom) && decodeStrict(raw, QStringConverter::Utf8, text))
    {
        utf8 = raw;
        detectedEncoding = "UTF-8";
        return true;
    }

    if (raw.startsWith(kUtf8Bom) && decodeStrict(raw.mid(kUtf8Bom.size()), QStringConverter::Utf8, text))
    {
        utf8 = text.toUtf8();
        detectedEncoding = "UTF-8 BOM";
        return true;
    }

    if (raw.startsWith(kUtf16LeBom) && decodeStrict(raw.mid(2), QStringConverter::Utf16LE, text))
    {
        utf8 = text.toUtf8();
        detectedEncoding = "UTF-16LE";
        return true;
    }
    if (raw.startsWith(kUtf16BeBom) && decodeStrict(raw.mid(2), QStringConverter::Utf16BE, text))
    {
        utf8 = text.toUtf8();
        detectedEncoding = "UTF-16BE";
        return true;
    }

    const QString utf16Guess = guessBomlessUtf16(raw);
    if (utf16Guess == "LE" && decodeStrict(raw, QStringConverter::Utf16LE, text))
    {
        utf8 = text.toUtf8();
        detectedEncoding = "UTF-16LE (без BOM)";
        return true;
    }
    if (utf16Guess == "BE" && decodeStrict(raw, QStringConverter::Utf16BE, text))
    {
        utf8 = text.toUtf8();
        detectedEncoding = "UTF-16BE (без BOM)";
        return true;
    }

    for (const QString& encodingName : m_legacyEncodings)
    {
        if (!QStringDecoder(encodingName.toLatin1().constData()).isValid())
        {
            emit logMessage(QString("Предупреждение: кодировка '%1' недоступна в этой сборке Qt, пропускаем.")
                                .arg(encodingName),
                            LogCategory::APP);
            continue;
        }
        if (decodeNamed(raw, encodingName, text))
        {
            utf8 = text.toUtf8();
            detectedEncoding = encodingName;
            return true;
        }
    }

    if (decodeStrict(raw, QStringConverter::Latin1, text))
    {
        utf8 = text.toUtf8();
        detectedEncoding = "ISO-8859-1";
        return true;
    }

    error = "Не удалось определить кодировку файла субтитров.";
    return false;
}

bool SubtitleNormalizer::normalizeEncodingFile(const QString& inputPath, const QString& outputPath, QString& error)
{
    QFile inputFile(inputPath);
    if (!inputFile.open(QIODevice::ReadOnly))
    {
        error = "Не удалось открыть файл субтитров: " + inputFile.errorString();
        return false;
    }
    const QByteArray raw = inputFile.readAll();
    inputFile.close();

    QByteArray utf8;
    QString detectedEncoding;
    if (!normalizeEncoding(raw, utf8, detectedEncoding, error))
    {
        return false;
    }

    if (detectedEncoding != "UTF-8")
    {
        emit logMessage(QString("Субтитры перекодированы из %1 в UTF-8.").arg(detectedEncoding), LogCategory::APP);
    }

    QFile outputFile(outputPath);
    if (!outputFile.open(QIODevice::WriteOnly | QIODevice::Truncate))
    {
        error = "Не удалось записать субтитры: " + outputFile.errorString();
        return false;
    }
    if (outputFile.write(utf8) != utf8.size())
    {
        error = "Ошибка записи субтитров: " + outputFile.errorString();
        return false;
    }
    return true;
}

bool SubtitleNormalizer::convertToAss(const QString& inputPath, const QString& outputAssPath, QString& error)
{
    emit logMessage(QString("Конвертация %1 в ASS...").arg(QFileInfo(inputPath).fileName()), LogCategory::APP);

    QStringList args = {"-y", "-hide_banner", "-loglevel", "error", "-sub_charenc", "UTF-8",
                        "-i", inputPath, outputAssPath};
    QByteArray output;
    if (!m_procManager->executeAndWait(m_ffmpegPath, args, output, m_helperTimeoutMs))
    {
        error = "Не удалось сконвертировать субтитры в ASS через ffmpeg.";
        return false;
    }

    QFileInfo result(outputAssPath);
    if (!result.exists() || result.size() == 0)
    {
        error = "ffmpeg не создал ASS-файл: " + outputAssPath;
        return false;
    }
    return true;
}

bool SubtitleNormalizer::injectStyle(const QString& inputAssPath, const QString& outputAssPath,
                                     const SubtitleStyle& style, QString& error)
{
    QFile inputFile(inputAssPath);
    if (!inputFile.open(QIODevice::ReadOnly))
    {
        error = "Не удалось открыть ASS-файл: " + inputFile.errorString();
        return false;
    }
    const QString scriptText = QString::fromUtf8(inputFile.readAll());
    inputFile.close();

    AssStyleBlock styleBlock;
    if (!styleBlock.parse(scriptText, error))
    {
        return false;
    }

    QStringList warnings;
    const int rewritten = styleBlock.applyDefaultStyle(style, warnings);
    for (const QString& warning : warnings)
    {
        emit logMessage(warning, LogCategory::APP);
    }
    if (rewritten == 0)
    {
        emit logMessage("Предупреждение: в субтитрах нет стиля Default, стиль не изменён.", LogCategory::APP);
    }
    else
    {
        emit logMessage(QString("Стиль Default обновлён (шрифт: %1).").arg(style.fontName), LogCategory::DEBUG);
    }

    QFile outputFile(outputAssPath);
    if (!outputFile.open(QIODevice::WriteOnly | QIODevice::Truncate))
    {
        error = "Не удалось записать ASS-файл: " + outputFile.errorString();
        return false;
    }
    const QByteArray data = styleBlock.toText().toUtf8();
    if (outputFile.write(data) != data.size())
    {
        error = "Ошибка записи ASS-файла: " + outputFile.errorString();
        return false;
    }
    return true;
}

bool SubtitleNormalizer::prepareForEmbed(const QString& subtitlePath, const QString& workDir, QString& outputPath,
                                         QString& error)
{
    const QString suffix = QFileInfo(subtitlePath).suffix().toLower();
    outputPath = QDir(workDir).filePath("subtitle_utf8." + suffix);
    return normalizeEncodingFile(subtitlePath, outputPath, error);
}

bool SubtitleNormalizer::prepareForBurn(const QString& subtitlePath, const QString& workDir,
                                        const SubtitleStyle& style, QString& outputPath, QString& error)
{
    QString currentPath;
    if (!prepareForEmbed(subtitlePath, workDir, currentPath, error))
    {
        return false;
    }

    if (!isStyledFormat(currentPath))
    {
        const QString convertedPath = QDir(workDir).filePath("subtitle_converted.ass");
        if (!convertToAss(currentPath, convertedPath, error))
        {
            return false;
        }
        currentPath = convertedPath;
    }

    const QString suffix = QFileInfo(currentPath).suffix().toLower();
    outputPath = QDir(workDir).filePath("subtitle_styled." + suffix);
    return injectStyle(currentPath, outputPath, style, error);
}

QString SubtitleNormalizer::guessBomlessUtf16(const QByteArray& raw)
{
    const int sampleSize = qMin<int>(raw.size(), 4096) & ~1;
    if (sampleSize < 4)
    {
        return QString();
    }

    int evenZeros = 0;
    int oddZeros = 0;
    for (int i = 0; i < sampleSize; ++i)
    {
        if (raw.at(i) == '\0')
        {
            (i % 2 == 0 ? evenZeros : oddZeros)++;
        }
    }

    // Латиница в UTF-16LE: "A\0B\0", в UTF-16BE: "\0A\0B"
    const int pairs = sampleSize / 2;
    if (oddZeros * 10 >= pairs * 4 && evenZeros * 20 <= pairs)
    {
        return "LE";
    }
    if (evenZeros * 10 >= pairs * 4 && oddZeros * 20 <= pairs)
    {
        return "BE";
    }
    return QString();
}

bool SubtitleNormalizer::decodeStrict(const QByteArray& raw, QStringConverter::Encoding encoding, QString& text)
{
    QStringDecoder decoder(encoding, QStringConverter::Flag::Stateless);
    QString decoded = decoder.decode(raw);
    if (decoder.hasError() || decoded.contains(QChar(0)))
    {
        return false;
    }
    text = decoded;
    return true;
}

bool SubtitleNormalizer::decodeNamed(const QByteArray& raw, const QString& encodingName, QString& text)
{
    QStringDecoder decoder(encodingName.toLatin1().constData(), QStringConverter::Flag::Stateless);
    if (!decoder.isValid())
    {
        return false;
    }
    QString decoded = decoder.decode(raw);
    if (decoder.hasError() || decoded.contains(QChar(0)))
    {
        return false;
    }
    text = decoded;
    return true;
}
