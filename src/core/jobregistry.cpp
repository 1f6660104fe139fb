#include "jobregistry.h"

#include <QDeadlineTimer>
#include <QReadLocker>
#include <QWriteLocker>

#include <algorithm>

bool JobRegistry::create(const Job& job)
{
    QWriteLocker locker(&m_lock);
    if (job.id.isEmpty() || m_activeJobs.contains(job.id) || m_completedJobs.contains(job.id))
    {
        return false;
    }

    Job stored = job;
    stored.sequence = m_nextSequence++;
    if (!stored.createdAt.isValid())
    {
        stored.createdAt = QDateTime::currentDateTime();
    }
    stored.updatedAt = stored.createdAt;

    if (stored.isTerminal())
    {
        m_completedJobs.insert(stored.id, stored);
        m_terminalReached.wakeAll();
    }
    else
    {
        m_activeJobs.insert(stored.id, stored);
    }
    return true;
}

bool JobRegistry::update(const QString& id, const Mutator& mutator)
{
    QWriteLocker locker(&m_lock);
    auto it = m_activeJobs.find(id);
    if (it == m_activeJobs.end())
    {
        // Неизвестная или уже завершённая задача
        return false;
    }

    Job patched = it.value();
    mutator(patched);

    // id и порядковый номер не меняются
    patched.id = it.value().id;
    patched.sequence = it.value().sequence;
    patched.createdAt = it.value().createdAt;
    if (jobStatusRank(patched.status) < jobStatusRank(it.value().status))
    {
        patched.status = it.value().status;
    }
    patched.updatedAt = QDateTime::currentDateTime();

    if (patched.isTerminal())
    {
        m_activeJobs.erase(it);
        m_completedJobs.insert(id, patched);
        m_terminalReached.wakeAll();
    }
    else
    {
        it.value() = patched;
    }
    return true;
}

std::optional<Job> JobRegistry::get(const QString& id) const
{
    QReadLocker locker(&m_lock);
    const Job* job = findLocked(id);
    if (!job)
    {
        return std::nullopt;
    }
    return *job;
}

QList<Job> JobRegistry::list() const
{
    QList<Job> jobs;
    {
        QReadLocker locker(&m_lock);
        jobs.reserve(m_activeJobs.size() + m_completedJobs.size());
        for (const Job& job : m_activeJobs)
        {
            jobs.append(job);
        }
        for (const Job& job : m_completedJobs)
        {
            jobs.append(job);
        }
    }

    std::sort(jobs.begin(), jobs.end(),
              [](const Job& a, const Job& b)
              {
                  if (a.createdAt != b.createdAt)
                  {
                      return a.createdAt > b.createdAt;
                  }
                  return a.sequence > b.sequence;
              });
    return jobs;
}

bool JobRegistry::markCancelled(const QString& id)
{
    QWriteLocker locker(&m_lock);
    if (m_completedJobs.contains(id))
    {
        return true;
    }

    auto it = m_activeJobs.find(id);
    if (it == m_activeJobs.end())
    {
        return false;
    }

    m_cancelledIds.insert(id);
    if (jobStatusRank(it->status) < jobStatusRank(JobStatus::Cancelling))
    {
        it->status = JobStatus::Cancelling;
        it->stage = "Cancelling";
        it->updatedAt = QDateTime::currentDateTime();
    }
    return true;
}

bool JobRegistry::isCancelled(const QString& id) const
{
    QReadLocker locker(&m_lock);
    return m_cancelledIds.contains(id);
}

bool JobRegistry::waitForTerminal(const QString& id, int timeoutMs) const
{
    QDeadlineTimer deadline(timeoutMs);
    QReadLocker locker(&m_lock);
    while (true)
    {
        if (m_completedJobs.contains(id))
        {
            return true;
        }
        if (!m_activeJobs.contains(id))
        {
            return false;
        }
        if (!m_terminalReached.wait(&m_lock, deadline))
        {
            return m_completedJobs.contains(id);
        }
    }
}

int JobRegistry::activeCount() const
{
    QReadLocker locker(&m_lock);
    return m_activeJobs.size();
}

int JobRegistry::completedCount() const
{
    QReadLocker locker(&m_lock);
    return m_completedJobs.size();
}

const Job* JobRegistry::findLocked(const QString& id) const
{
    auto it = m_activeJobs.constFind(id);
    if (it != m_activeJobs.constEnd())
    {
        return &it.value();
    }
    it = m_completedJobs.constFind(id);
    if (it != m_completedJobs.constEnd())
    {
        return &it.value();
    }
    return nullptr;
}
