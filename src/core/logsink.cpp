#include "logsink.h"

#include <QDateTime>
#include <QDebug>
#include <QMutexLocker>

QString logCategoryToString(LogCategory category)
{
    switch (category)
    {
    case LogCategory::APP:
        return "APP";
    case LogCategory::FFMPEG:
        return "FFMPEG";
    case LogCategory::NETWORK:
        return "NETWORK";
    case LogCategory::DEBUG:
        return "DEBUG";
    }
    return "UNKNOWN";
}

LogSink::LogSink(const QString& logFilePath, QObject* parent)
    : QObject(parent), m_enabledCategories(AppSettings::instance().enabledLogCategories())
{
    if (logFilePath.isEmpty())
    {
        return;
    }

    m_logFile.setFileName(logFilePath);
    if (!m_logFile.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text))
    {
        qWarning("Failed to open %s for writing", qPrintable(logFilePath));
    }
}

LogSink::~LogSink()
{
    if (m_logFile.isOpen())
    {
        m_logFile.close();
    }
}

void LogSink::write(const QString& message, LogCategory category)
{
    QString timedMessage = QString("[%1] %2 - %3")
                               .arg(logCategoryToString(category))
                               .arg(QDateTime::currentDateTime().toString("hh:mm:ss"))
                               .arg(message.trimmed());

    QMutexLocker locker(&m_mutex);

    // В файл пишем всё, независимо от фильтра
    if (m_logFile.isOpen())
    {
        m_logFile.write(timedMessage.toUtf8());
        m_logFile.write("\n");
        m_logFile.flush();
    }

    if (!m_enabledCategories.contains(category))
    {
        return;
    }

    if (category == LogCategory::DEBUG)
    {
        qDebug().noquote() << timedMessage;
    }
    else
    {
        qInfo().noquote() << timedMessage;
    }
}

void LogSink::writeForJob(const QString& jobId, const QString& message, LogCategory category)
{
    write(QString("[%1] %2").arg(jobId, message.trimmed()), category);
}
