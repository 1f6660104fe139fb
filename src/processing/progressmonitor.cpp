#include "progressmonitor.h"
#include "processmanager.h"

#include <QRegularExpression>

ProgressMonitor::ProgressMonitor(double totalSeconds, ProgressCallback onProgress)
    : m_totalSeconds(totalSeconds > 0 ? totalSeconds : 0.0), m_onProgress(std::move(onProgress))
{
}

void ProgressMonitor::setLineCallback(LineCallback onLine)
{
    m_onLine = std::move(onLine);
}

bool ProgressMonitor::feedLine(const QString& line)
{
    if (m_onLine)
    {
        m_onLine(line);
    }

    double seconds = 0.0;
    if (!parseTimeMarker(line, seconds))
    {
        return false;
    }

    if (seconds > m_lastElapsed)
    {
        m_lastElapsed = seconds;
    }
    if (m_onProgress)
    {
        m_onProgress(m_lastElapsed, m_totalSeconds);
    }
    return true;
}

ProgressMonitor::Outcome ProgressMonitor::run(ProcessManager& process, const CancellationToken& token,
                                              int pollIntervalMs)
{
    QString line;
    while (true)
    {
        if (token.isCancelled())
        {
            return Outcome::Cancelled;
        }

        ProcessManager::ReadResult result = process.readLine(line, pollIntervalMs);
        if (result == ProcessManager::ReadResult::Closed)
        {
            return Outcome::Finished;
        }
        if (result == ProcessManager::ReadResult::Line)
        {
            feedLine(line);
        }
        // Timeout: просто снова проверяем токен
    }
}

bool ProgressMonitor::parseTimeMarker(const QString& line, double& seconds)
{
    static const QRegularExpression re("time=\\s*(\\d+):(\\d{2}):(\\d{2})(?:\\.(\\d+))?");

    QRegularExpressionMatchIterator it = re.globalMatch(line);
    QRegularExpressionMatch lastMatch;
    while (it.hasNext())
    {
        lastMatch = it.next();
    }
    if (!lastMatch.hasMatch())
    {
        return false;
    }

    const int hours = lastMatch.captured(1).toInt();
    const int minutes = lastMatch.captured(2).toInt();
    const int secs = lastMatch.captured(3).toInt();
    double fraction = 0.0;
    const QString fractionText = lastMatch.captured(4);
    if (!fractionText.isEmpty())
    {
        fraction = QString("0." + fractionText).toDouble();
    }

    seconds = hours * 3600.0 + minutes * 60.0 + secs + fraction;
    return true;
}

double ProgressMonitor::percentage(double elapsedSeconds, double totalSeconds)
{
    if (totalSeconds <= 0)
    {
        return -1.0;
    }
    double percent = elapsedSeconds / totalSeconds * 100.0;
    if (percent < 0)
    {
        return 0.0;
    }
    if (percent > 100.0)
    {
        return 100.0;
    }
    return percent;
}
