#ifndef LOGSINK_H
#define LOGSINK_H

#include "appsettings.h"

#include <QFile>
#include <QMutex>
#include <QObject>

QString logCategoryToString(LogCategory category);

/**
 * @brief Receives logMessage() signals from jobs and helper components
 *
 * Every message goes to the log file; only enabled categories are printed to
 * the console. Connect with Qt::DirectConnection: orchestrators emit from
 * their own worker threads and write() is thread-safe.
 */
class LogSink : public QObject
{
    Q_OBJECT
    Q_DISABLE_COPY_MOVE(LogSink)

public:
    explicit LogSink(const QString& logFilePath = QString(), QObject* parent = nullptr);
    ~LogSink() override;

public slots:
    void write(const QString& message, LogCategory category = LogCategory::APP);
    void writeForJob(const QString& jobId, const QString& message, LogCategory category);

private:
    QMutex m_mutex;
    QFile m_logFile;
    QSet<LogCategory> m_enabledCategories;
};

#endif // LOGSINK_H
