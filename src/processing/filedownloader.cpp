#include "filedownloader.h"

#include <QDir>
#include <QEventLoop>
#include <QFile>
#include <QFileInfo>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>

static const qint64 kCopyChunkSize = 1024 * 1024;

FileDownloader::FileDownloader(QObject* parent) : QObject(parent)
{
}

QString FileDownloader::targetFileName(const QString& source, AssetKind kind)
{
    QString fileName;
    QUrl url(source);
    if (url.isValid() && !url.scheme().isEmpty() && url.scheme().length() > 1)
    {
        fileName = url.fileName();
    }
    else
    {
        fileName = QFileInfo(source).fileName();
    }

    if (fileName.isEmpty() || QFileInfo(fileName).suffix().isEmpty())
    {
        fileName = (kind == AssetKind::Video) ? "video.mp4" : "subtitle.srt";
    }
    return fileName;
}

bool FileDownloader::fetch(const QString& source, const QString& destinationDir, AssetKind kind,
                           const ProgressCallback& onProgress, const CancellationToken& token, QString& localPath,
                           QString& error)
{
    if (source.trimmed().isEmpty())
    {
        error = "Не указан источник для загрузки.";
        return false;
    }
    if (!QDir(destinationDir).mkpath("."))
    {
        error = "Не удалось создать папку для загрузки: " + destinationDir;
        return false;
    }

    const QString targetPath = QDir(destinationDir).filePath(targetFileName(source, kind));

    // Локальный путь или file://
    QUrl url(source);
    const bool isRemote = url.isValid() && (url.scheme() == "http" || url.scheme() == "https");
    if (!isRemote)
    {
        const QString sourcePath = url.isLocalFile() ? url.toLocalFile() : source;
        if (!QFileInfo(sourcePath).isFile())
        {
            error = "Файл не найден: " + source;
            return false;
        }
        if (!copyLocalFile(sourcePath, targetPath, onProgress, token, error))
        {
            return false;
        }
        localPath = targetPath;
        return true;
    }

    if (!downloadUrl(url, targetPath, onProgress, token, error))
    {
        return false;
    }
    localPath = targetPath;
    return true;
}

bool FileDownloader::copyLocalFile(const QString& sourcePath, const QString& targetPath,
                                   const ProgressCallback& onProgress, const CancellationToken& token, QString& error)
{
    emit logMessage(QString("Копирование %1 -> %2").arg(sourcePath, targetPath), LogCategory::DEBUG);

    QFile sourceFile(sourcePath);
    if (!sourceFile.open(QIODevice::ReadOnly))
    {
        error = "Не удалось открыть файл: " + sourceFile.errorString();
        return false;
    }
    QFile targetFile(targetPath);
    if (!targetFile.open(QIODevice::WriteOnly | QIODevice::Truncate))
    {
        error = "Не удалось создать файл: " + targetFile.errorString();
        return false;
    }

    const qint64 total = sourceFile.size();
    qint64 copied = 0;
    while (!sourceFile.atEnd())
    {
        if (token.isCancelled())
        {
            targetFile.close();
            targetFile.remove();
            error = "Загрузка отменена.";
            return false;
        }

        const QByteArray chunk = sourceFile.read(kCopyChunkSize);
        if (chunk.isEmpty() && sourceFile.error() != QFileDevice::NoError)
        {
            error = "Ошибка чтения файла: " + sourceFile.errorString();
            targetFile.close();
            targetFile.remove();
            return false;
        }
        if (targetFile.write(chunk) != chunk.size())
        {
            error = "Ошибка записи файла: " + targetFile.errorString();
            targetFile.close();
            targetFile.remove();
            return false;
        }
        copied += chunk.size();
        if (onProgress)
        {
            onProgress(copied, total);
        }
    }
    return true;
}

bool FileDownloader::downloadUrl(const QUrl& url, const QString& targetPath, const ProgressCallback& onProgress,
                                 const CancellationToken& token, QString& error)
{
    emit logMessage("Загрузка: " + url.toString(), LogCategory::NETWORK);

    QFile targetFile(targetPath);
    if (!targetFile.open(QIODevice::WriteOnly | QIODevice::Truncate))
    {
        error = "Не удалось создать файл: " + targetFile.errorString();
        return false;
    }

    QNetworkAccessManager manager;
    QNetworkRequest request(url);
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::NoLessSafeRedirectPolicy);
    QNetworkReply* reply = manager.get(request);

    bool cancelled = false;
    bool writeFailed = false;
    QEventLoop loop;

    connect(reply, &QNetworkReply::readyRead, &loop,
            [&]()
            {
                const QByteArray chunk = reply->readAll();
                if (targetFile.write(chunk) != chunk.size())
                {
                    writeFailed = true;
                    reply->abort();
                }
            });
    connect(reply, &QNetworkReply::downloadProgress, &loop,
            [&](qint64 received, qint64 total)
            {
                if (onProgress)
                {
                    onProgress(received, total < 0 ? 0 : total);
                }
            });
    connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);

    // Токен проверяем по таймеру, данные могут долго не приходить
    QTimer cancelTimer;
    cancelTimer.setInterval(250);
    connect(&cancelTimer, &QTimer::timeout, &loop,
            [&]()
            {
                if (token.isCancelled())
                {
                    cancelled = true;
                    reply->abort();
                }
            });
    cancelTimer.start();

    if (!reply->isFinished())
    {
        loop.exec();
    }
    cancelTimer.stop();

    if (!cancelled && !writeFailed && reply->error() == QNetworkReply::NoError)
    {
        const QByteArray rest = reply->readAll();
        if (targetFile.write(rest) != rest.size())
        {
            writeFailed = true;
        }
    }
    targetFile.close();

    const int httpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    QString failure;
    if (cancelled)
    {
        failure = "Загрузка отменена.";
    }
    else if (writeFailed)
    {
        failure = "Ошибка записи файла: " + targetFile.errorString();
    }
    else if (reply->error() != QNetworkReply::NoError)
    {
        failure = QString("Ошибка загрузки %1: %2").arg(url.toString(), reply->errorString());
    }
    else if (httpStatus >= 400)
    {
        failure = QString("Ошибка загрузки %1: HTTP %2").arg(url.toString()).arg(httpStatus);
    }

    if (!failure.isEmpty())
    {
        targetFile.remove();
        emit logMessage(failure, LogCategory::NETWORK);
        error = failure;
        return false;
    }

    emit logMessage(QString("Загружено: %1 (%2 байт)").arg(targetPath).arg(QFileInfo(targetPath).size()),
                    LogCategory::NETWORK);
    return true;
}
