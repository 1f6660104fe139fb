#ifndef CANCELLATIONTOKEN_H
#define CANCELLATIONTOKEN_H

#include <functional>

/**
 * @brief Advisory cancellation flag passed down through every stage of a job
 *
 * The token only answers "should I stop?"; it never interrupts anything by
 * itself. A default-constructed token is never cancelled.
 */
class CancellationToken
{
public:
    CancellationToken() = default;
    explicit CancellationToken(std::function<bool()> check) : m_check(std::move(check)) {}

    bool isCancelled() const { return m_check && m_check(); }

private:
    std::function<bool()> m_check;
};

#endif // CANCELLATIONTOKEN_H
