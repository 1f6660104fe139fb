#include "processmanager.h"

#include <QDeadlineTimer>
#include <QFileInfo>

static const int kRecentLinesLimit = 20;

ProcessManager::ProcessManager(QObject* parent) : QObject{parent}
{
}

ProcessManager::~ProcessManager()
{
    if (isRunning())
    {
        terminateGracefully(500);
    }
}

bool ProcessManager::startProcess(const QString& program, const QStringList& arguments,
                                  const QProcessEnvironment& environment)
{
    if (isRunning())
    {
        emit processError("Предыдущий процесс ещё выполняется, новый запуск отклонён.");
        return false;
    }

    delete m_process;
    m_process = new QProcess(this);
    m_buffer.clear();
    m_recentLines.clear();
    m_wasKilled = false;

    m_process->setProcessChannelMode(QProcess::MergedChannels);
    if (!environment.isEmpty())
    {
        m_process->setProcessEnvironment(environment);
    }

    emit processOutput(QString("Запуск: %1 %2").arg(program, arguments.join(" ")));
    m_process->start(program, arguments);
    if (!m_process->waitForStarted())
    {
        emit processError("Не удалось запустить процесс: " + m_process->errorString());
        return false;
    }
    return true;
}

ProcessManager::ReadResult ProcessManager::readLine(QString& line, int timeoutMs)
{
    if (!m_process)
    {
        return ReadResult::Closed;
    }

    QDeadlineTimer deadline(timeoutMs);
    while (true)
    {
        if (takeBufferedLine(line))
        {
            return ReadResult::Line;
        }

        if (m_process->state() == QProcess::NotRunning)
        {
            m_buffer.append(m_process->readAll());
            if (takeBufferedLine(line))
            {
                return ReadResult::Line;
            }
            // Хвост без перевода строки
            QString tail = QString::fromUtf8(m_buffer).trimmed();
            m_buffer.clear();
            if (!tail.isEmpty())
            {
                rememberLine(tail);
                line = tail;
                return ReadResult::Line;
            }
            return ReadResult::Closed;
        }

        const int remaining = static_cast<int>(deadline.remainingTime());
        if (remaining <= 0 && !deadline.isForever())
        {
            return ReadResult::Timeout;
        }
        if (m_process->waitForReadyRead(deadline.isForever() ? -1 : remaining))
        {
            m_buffer.append(m_process->readAll());
        }
        else if (m_process->state() != QProcess::NotRunning)
        {
            return ReadResult::Timeout;
        }
    }
}

bool ProcessManager::waitForFinished(int timeoutMs)
{
    if (!m_process || m_process->state() == QProcess::NotRunning)
    {
        return true;
    }
    return m_process->waitForFinished(timeoutMs);
}

void ProcessManager::terminateGracefully(int graceMs)
{
    if (!isRunning())
    {
        return;
    }

    m_wasKilled = true;
    emit processOutput("Принудительное завершение дочернего процесса...");

    m_process->terminate();
    if (!m_process->waitForFinished(graceMs))
    {
        m_process->kill();
        m_process->waitForFinished(graceMs);
    }
}

bool ProcessManager::isRunning() const
{
    return m_process && m_process->state() != QProcess::NotRunning;
}

bool ProcessManager::wasKilled() const
{
    return m_wasKilled;
}

int ProcessManager::exitCode() const
{
    return m_process ? m_process->exitCode() : -1;
}

QProcess::ExitStatus ProcessManager::exitStatus() const
{
    return m_process ? m_process->exitStatus() : QProcess::CrashExit;
}

QString ProcessManager::errorString() const
{
    return m_process ? m_process->errorString() : QString();
}

QStringList ProcessManager::recentOutput() const
{
    return m_recentLines;
}

bool ProcessManager::executeAndWait(const QString& program, const QStringList& arguments, QByteArray& output,
                                    int timeoutMs)
{
    emit processOutput(QString("Запуск (синхронный): %1 %2").arg(program, arguments.join(" ")));

    QProcess syncProcess;
    syncProcess.start(program, arguments);
    if (!syncProcess.waitForStarted())
    {
        emit processError("Не удалось запустить '" + program + "': " + syncProcess.errorString());
        return false;
    }

    if (!syncProcess.waitForFinished(timeoutMs))
    {
        emit processError(QString("Процесс '%1' не завершился за %2 мс (timeout).").arg(program).arg(timeoutMs));
        syncProcess.kill();
        syncProcess.waitForFinished(1000);
        return false;
    }

    if (syncProcess.exitStatus() != QProcess::NormalExit || syncProcess.exitCode() != 0)
    {
        QString errorString = QString("Процесс '%1' завершился с ошибкой. Код: %2, Статус: %3.")
                                  .arg(QFileInfo(program).fileName())
                                  .arg(syncProcess.exitCode())
                                  .arg(syncProcess.exitStatus() == QProcess::NormalExit ? "Normal" : "Crash");
        emit processError(errorString);
        QByteArray stderrData = syncProcess.readAllStandardError();
        if (!stderrData.isEmpty())
        {
            emit processError("STDERR: " + QString::fromUtf8(stderrData));
        }
        return false;
    }

    output = syncProcess.readAllStandardOutput();
    emit processOutput("Процесс успешно завершен. Получено " + QString::number(output.size()) + " байт данных.");
    return true;
}

bool ProcessManager::takeBufferedLine(QString& line)
{
    while (true)
    {
        int newlinePos = -1;
        for (int i = 0; i < m_buffer.size(); ++i)
        {
            if (m_buffer.at(i) == '\n' || m_buffer.at(i) == '\r')
            {
                newlinePos = i;
                break;
            }
        }
        if (newlinePos < 0)
        {
            return false;
        }

        QString candidate = QString::fromUtf8(m_buffer.left(newlinePos)).trimmed();
        m_buffer.remove(0, newlinePos + 1);
        // "\r\n" даёт пустую строку, пропускаем
        if (!candidate.isEmpty())
        {
            rememberLine(candidate);
            line = candidate;
            return true;
        }
    }
}

void ProcessManager::rememberLine(const QString& line)
{
    m_recentLines.append(line);
    while (m_recentLines.size() > kRecentLinesLimit)
    {
        m_recentLines.removeFirst();
    }
}
