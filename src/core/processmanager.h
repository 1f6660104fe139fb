#ifndef PROCESSMANAGER_H
#define PROCESSMANAGER_H

#include <QObject>
#include <QProcess>
#include <QProcessEnvironment>
#include <QStringList>

/**
 * @brief Blocking wrapper around one child process at a time
 *
 * Meant to be used from a worker thread without an event loop: output is pulled
 * with readLine(), which splits on both '\n' and '\r' because ffmpeg rewrites
 * its status line with carriage returns. stdout and stderr are merged.
 */
class ProcessManager : public QObject
{
    Q_OBJECT
    Q_DISABLE_COPY_MOVE(ProcessManager)

public:
    enum class ReadResult
    {
        Line,
        Timeout,
        Closed
    };

    explicit ProcessManager(QObject* parent = nullptr);
    ~ProcessManager();

    /**
     * @brief Starts @p program. An empty @p environment keeps the inherited one.
     * @return false if the process could not be started.
     */
    bool startProcess(const QString& program, const QStringList& arguments,
                      const QProcessEnvironment& environment = QProcessEnvironment());

    /**
     * @brief Reads the next non-empty output line.
     *
     * Returns Timeout if no complete line arrived within @p timeoutMs while the
     * process is still running, Closed once the process has exited and all of
     * its output has been consumed.
     */
    ReadResult readLine(QString& line, int timeoutMs);

    bool waitForFinished(int timeoutMs);

    // terminate -> ожидание graceMs -> kill
    void terminateGracefully(int graceMs);

    bool isRunning() const;
    bool wasKilled() const;
    int exitCode() const;
    QProcess::ExitStatus exitStatus() const;
    QString errorString() const;

    // Последние строки вывода, для сообщений об ошибках
    QStringList recentOutput() const;

    bool executeAndWait(const QString& program, const QStringList& arguments, QByteArray& output,
                        int timeoutMs = 30000);

signals:
    void processOutput(const QString& output);
    void processError(const QString& error);

private:
    bool takeBufferedLine(QString& line);
    void rememberLine(const QString& line);

    QProcess* m_process = nullptr;
    QByteArray m_buffer;
    QStringList m_recentLines;
    bool m_wasKilled = false;
};

#endif // PROCESSMANAGER_H
