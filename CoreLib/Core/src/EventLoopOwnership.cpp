#include "EventLoopOwnership.hpp"

#include <atomic>

#include "OverlayErrors.hpp"

namespace
{
    std::atomic<bool> g_loopClaimed{false};
} // namespace

EventLoopOwnership::EventLoopOwnership()
{
    bool expected = false;
    if (!g_loopClaimed.compare_exchange_strong(expected, true))
        throw AlreadyRunningError("EventLoopOwnership: another OverlayManager already owns the overlay event loop");

    m_owned = true;
}

EventLoopOwnership::~EventLoopOwnership()
{
    release();
}

void EventLoopOwnership::release() noexcept
{
    if (!m_owned)
        return;

    m_owned = false;
    g_loopClaimed.store(false);
}

bool EventLoopOwnership::isClaimed() noexcept
{
    return g_loopClaimed.load();
}
