#include "DragController.hpp"

void DragController::beginMove(OverlayKind kind, const glm::ivec2& cursor, const OverlayGeometry& start) noexcept
{
    m_mode        = Mode::Move;
    m_kind        = kind;
    m_startCursor = cursor;
    m_start       = start;
}

void DragController::beginResize(const glm::ivec2& cursor, const OverlayGeometry& start) noexcept
{
    m_mode        = Mode::Resize;
    m_kind        = OverlayKind::Rect;
    m_startCursor = cursor;
    m_start       = start;
}

bool DragController::end() noexcept
{
    const bool wasActive = active();
    m_mode               = Mode::None;
    return wasActive;
}

OverlayGeometry DragController::update(const glm::ivec2& cursor, const Limits& limits) const noexcept
{
    const glm::ivec2 delta = cursor - m_startCursor;

    switch (m_mode)
    {
        case Mode::Move:
            return m_kind == OverlayKind::Point ? movePoint(delta, limits) : moveRect(delta, limits);
        case Mode::Resize:
            return resizeRect(delta, limits);
        case Mode::None:
            break;
    }
    return m_start;
}

bool DragController::inResizeHandle(const glm::ivec2& local, const glm::ivec2& size, int handleSize) noexcept
{
    return local.x >= size.x - handleSize && local.y >= size.y - handleSize;
}

OverlayGeometry DragController::moveRect(const glm::ivec2& delta, const Limits& limits) const noexcept
{
    OverlayGeometry out = m_start;

    // max() first: a rect larger than the screen pins to the origin.
    const glm::ivec2 maxPos = glm::max(limits.screenSize - m_start.size, glm::ivec2(0));
    out.pos                 = glm::clamp(m_start.pos + delta, glm::ivec2(0), maxPos);
    return out;
}

OverlayGeometry DragController::resizeRect(const glm::ivec2& delta, const Limits& limits) const noexcept
{
    OverlayGeometry out = m_start;

    glm::ivec2 size = glm::max(m_start.size + delta, limits.minSize);

    const glm::ivec2 maxSize = glm::max(limits.screenSize - m_start.pos, limits.minSize);
    out.size                 = glm::min(size, maxSize);
    return out;
}

OverlayGeometry DragController::movePoint(const glm::ivec2& delta, const Limits& limits) const noexcept
{
    const int        half        = limits.windowSize / 2;
    const glm::ivec2 startWindow = m_start.pos - glm::ivec2(half);

    const glm::ivec2 maxWindow = glm::max(limits.screenSize - glm::ivec2(limits.windowSize), glm::ivec2(0));
    const glm::ivec2 window    = glm::clamp(startWindow + delta, glm::ivec2(0), maxWindow);

    glm::ivec2       point    = window + glm::ivec2(half);
    const glm::ivec2 minPoint = glm::ivec2(limits.pointRadius);
    const glm::ivec2 maxPoint = glm::max(limits.screenSize - glm::ivec2(limits.pointRadius), minPoint);
    point                     = glm::clamp(point, minPoint, maxPoint);

    return OverlayGeometry{point, glm::ivec2(0)};
}
