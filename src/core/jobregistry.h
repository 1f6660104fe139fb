#ifndef JOBREGISTRY_H
#define JOBREGISTRY_H

#include "job.h"

#include <QMap>
#include <QReadWriteLock>
#include <QSet>
#include <QWaitCondition>

#include <functional>
#include <optional>

/**
 * @brief Thread-safe store of all jobs known to this process
 *
 * Jobs live in the active partition until they reach a terminal status and are
 * then moved to the completed partition. Records are never removed. Readers
 * always receive copies.
 */
class JobRegistry
{
    Q_DISABLE_COPY_MOVE(JobRegistry)

public:
    // Мутатор вызывается под блокировкой записи и не должен обращаться к реестру
    using Mutator = std::function<void(Job&)>;

    JobRegistry() = default;

    /**
     * @brief Registers a new job. Fails if the id is already taken.
     */
    bool create(const Job& job);

    /**
     * @brief Applies a field-level patch to the job.
     *
     * Silent no-op (returns false) when the id is unknown or the job is already
     * terminal. A patch that would move the status backwards keeps the
     * previous status; the other fields are still applied.
     */
    bool update(const QString& id, const Mutator& mutator);

    std::optional<Job> get(const QString& id) const;

    // Новые задачи первыми; при равном времени создания - по порядку регистрации
    QList<Job> list() const;

    /**
     * @brief Raises the cancellation flag and moves a Queued/Processing job to Cancelling.
     * @return false when the id is unknown. Terminal jobs are left untouched.
     */
    bool markCancelled(const QString& id);
    bool isCancelled(const QString& id) const;

    /**
     * @brief Blocks until the job reaches a terminal status or the timeout expires.
     * @return true if the job is terminal on return.
     */
    bool waitForTerminal(const QString& id, int timeoutMs) const;

    int activeCount() const;
    int completedCount() const;

private:
    const Job* findLocked(const QString& id) const;

    mutable QReadWriteLock m_lock;
    mutable QWaitCondition m_terminalReached;
    QMap<QString, Job> m_activeJobs;
    QMap<QString, Job> m_completedJobs;
    QSet<QString> m_cancelledIds;
    quint64 m_nextSequence = 0;
};

#endif // JOBREGISTRY_H
