#pragma once

/**
 * @brief Process-wide claim on the overlay event loop.
 *
 * At most one instance holds the claim at a time. Constructing a second one
 * while the first is alive throws AlreadyRunningError. The claim is released
 * by release() or the destructor, whichever comes first.
 */
class EventLoopOwnership
{
public:
    /**
     * @throws AlreadyRunningError if another owner holds the loop.
     */
    EventLoopOwnership();
    ~EventLoopOwnership();

    EventLoopOwnership(const EventLoopOwnership&)            = delete;
    EventLoopOwnership& operator=(const EventLoopOwnership&) = delete;

    /**
     * @brief Give the claim back. Idempotent.
     */
    void release() noexcept;

    /**
     * @brief Whether any instance in this process currently holds the loop.
     */
    [[nodiscard]] static bool isClaimed() noexcept;

private:
    bool m_owned = false;
};
