#ifndef FILEDOWNLOADER_H
#define FILEDOWNLOADER_H

#include "appsettings.h"
#include "downloader.h"

#include <QObject>

class QUrl;

/**
 * @brief Default Downloader: copies local files, fetches http(s) URLs
 *
 * Local paths and file:// URLs are copied in chunks; remote URLs are fetched
 * with QNetworkAccessManager inside a local event loop, so fetch() can be
 * called from any worker thread. Each call is independent, one instance may
 * serve several jobs at once.
 */
class FileDownloader : public QObject, public Downloader
{
    Q_OBJECT
public:
    explicit FileDownloader(QObject* parent = nullptr);

    bool fetch(const QString& source,
               const QString& destinationDir,
               AssetKind kind,
               const ProgressCallback& onProgress,
               const CancellationToken& token,
               QString& localPath,
               QString& error) override;

    static QString targetFileName(const QString& source, AssetKind kind);

signals:
    void logMessage(const QString& message, LogCategory category = LogCategory::NETWORK);

private:
    bool copyLocalFile(const QString& sourcePath, const QString& targetPath, const ProgressCallback& onProgress,
                       const CancellationToken& token, QString& error);
    bool downloadUrl(const QUrl& url, const QString& targetPath, const ProgressCallback& onProgress,
                     const CancellationToken& token, QString& error);
};

#endif // FILEDOWNLOADER_H
