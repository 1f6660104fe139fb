#ifndef DOWNLOADER_H
#define DOWNLOADER_H

#include "cancellationtoken.h"

#include <QString>

#include <functional>

enum class AssetKind
{
    Video,
    Subtitle
};

/**
 * @brief Fetches a remote or local asset into a job's working directory
 */
class Downloader
{
public:
    // (получено байт, всего байт); всего = 0, если размер неизвестен
    using ProgressCallback = std::function<void(qint64, qint64)>;

    virtual ~Downloader() = default;

    /**
     * @brief Makes @p source available as a local file inside @p destinationDir.
     * @param localPath Receives the path of the fetched file on success.
     * @param error Receives a human-readable message on failure.
     * @return false on failure or when @p token was cancelled mid-transfer.
     */
    virtual bool fetch(const QString& source,
                       const QString& destinationDir,
                       AssetKind kind,
                       const ProgressCallback& onProgress,
                       const CancellationToken& token,
                       QString& localPath,
                       QString& error) = 0;
};

#endif // DOWNLOADER_H
