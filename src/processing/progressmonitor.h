#ifndef PROGRESSMONITOR_H
#define PROGRESSMONITOR_H

#include "cancellationtoken.h"

#include <QString>

#include <functional>

class ProcessManager;

/**
 * @brief Turns the ffmpeg status stream into (elapsed, total) progress tokens
 *
 * Each line is scanned for the last "time=HH:MM:SS.ff" marker. Lines without a
 * marker are ignored. Reported elapsed time never decreases. A total of 0 means
 * the duration is unknown: elapsed is still reported, but percentage() returns -1.
 */
class ProgressMonitor
{
public:
    enum class Outcome
    {
        Finished,
        Cancelled
    };

    using ProgressCallback = std::function<void(double elapsedSeconds, double totalSeconds)>;
    using LineCallback = std::function<void(const QString& line)>;

    ProgressMonitor(double totalSeconds, ProgressCallback onProgress);

    void setLineCallback(LineCallback onLine);

    /**
     * @brief Processes one status line.
     * @return true if the line carried a time marker.
     */
    bool feedLine(const QString& line);

    /**
     * @brief Reads @p process until its output closes or @p token is cancelled.
     *
     * The token is checked after every line and every read timeout. The caller
     * is responsible for stopping the process and inspecting its exit status.
     */
    Outcome run(ProcessManager& process, const CancellationToken& token, int pollIntervalMs = 250);

    double lastElapsed() const { return m_lastElapsed; }
    double total() const { return m_totalSeconds; }

    /**
     * @brief Extracts the last time marker from a line.
     * @return false when the line has no "time=" marker.
     */
    static bool parseTimeMarker(const QString& line, double& seconds);

    // [0, 100] или -1, если длительность неизвестна
    static double percentage(double elapsedSeconds, double totalSeconds);

private:
    double m_totalSeconds;
    double m_lastElapsed = 0.0;
    ProgressCallback m_onProgress;
    LineCallback m_onLine;
};

#endif // PROGRESSMONITOR_H
