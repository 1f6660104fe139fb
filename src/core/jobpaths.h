#ifndef JOBPATHS_H
#define JOBPATHS_H

#include <QDir>
#include <QFileInfo>
#include <QString>

struct JobPaths
{
    QString basePath;
    QString downloadsPath;
    QString subtitlesPath;
    QString processingPath;
    QString outputPath;

    // Конструктор, который создает все папки задачи
    JobPaths(const QString& workRoot, const QString& jobId)
    {
        basePath = QDir(workRoot).filePath(jobId);
        downloadsPath = QDir(basePath).filePath("downloads");
        subtitlesPath = QDir(basePath).filePath("subtitles");
        processingPath = QDir(basePath).filePath("processing");
        outputPath = QDir(basePath).filePath("output");

        QDir(downloadsPath).mkpath(".");
        QDir(subtitlesPath).mkpath(".");
        QDir(processingPath).mkpath(".");
        QDir(outputPath).mkpath(".");
    }

    bool isValid() const
    {
        return QDir(downloadsPath).exists() && QDir(subtitlesPath).exists() && QDir(processingPath).exists() &&
               QDir(outputPath).exists();
    }

    // <имя>_subtitled.mp4 для мягких субтитров, <имя>_hardsubbed.mp4 для вшитых
    QString subtitledVideo(const QString& sourceVideoPath, bool soft) const
    {
        const QString stem = QFileInfo(sourceVideoPath).completeBaseName();
        return QDir(outputPath).filePath(stem + (soft ? "_subtitled.mp4" : "_hardsubbed.mp4"));
    }

    QString fontConfigDir() const
    {
        return QDir(processingPath).filePath("fontconfig");
    }
};

#endif // JOBPATHS_H
