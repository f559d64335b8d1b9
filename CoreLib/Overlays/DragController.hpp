#pragma once

#include <glm/glm.hpp>

#include "CoreTypes.hpp"

/**
 * @brief Toolkit-independent drag / resize state machine for one overlay.
 *
 * The UI layer feeds global cursor positions (screen pixels); the controller
 * returns the geometry the overlay should take. All clamping rules live here
 * so they can be tested without a display:
 *
 *  Rect move   : top-left stays within [0, screen - size].
 *  Rect resize : bottom-right corner handle, size >= minSize and the rect
 *                never grows past the screen edge.
 *  Point move  : the square host window (windowSize) stays on screen and the
 *                point itself stays at least pointRadius away from the edge.
 */
class DragController
{
public:
    enum class Mode
    {
        None,
        Move,
        Resize
    };

    struct Limits
    {
        glm::ivec2 screenSize  = glm::ivec2(0);
        glm::ivec2 minSize     = glm::ivec2(50, 50);
        int        windowSize  = 0; // point host window edge (points only)
        int        pointRadius = 0; // points only
    };

public:
    DragController() = default;

    /**
     * @brief Start moving the overlay.
     * @param kind   Overlay kind (selects the clamping rules).
     * @param cursor Global cursor position at press time.
     * @param start  Overlay geometry at press time.
     */
    void beginMove(OverlayKind kind, const glm::ivec2& cursor, const OverlayGeometry& start) noexcept;

    /**
     * @brief Start resizing a rect from its bottom-right corner.
     */
    void beginResize(const glm::ivec2& cursor, const OverlayGeometry& start) noexcept;

    /**
     * @brief Geometry for the current cursor position.
     *
     * Returns the start geometry unchanged when no interaction is active.
     */
    [[nodiscard]] OverlayGeometry update(const glm::ivec2& cursor, const Limits& limits) const noexcept;

    /**
     * @brief Ends the interaction.
     * @return True if an interaction was active.
     */
    bool end() noexcept;

    [[nodiscard]] bool active() const noexcept
    {
        return m_mode != Mode::None;
    }

    [[nodiscard]] Mode mode() const noexcept
    {
        return m_mode;
    }

    /**
     * @brief Whether a local position (relative to the rect's top-left) hits
     * the bottom-right resize handle.
     */
    [[nodiscard]] static bool inResizeHandle(const glm::ivec2& local, const glm::ivec2& size, int handleSize) noexcept;

private:
    [[nodiscard]] OverlayGeometry moveRect(const glm::ivec2& delta, const Limits& limits) const noexcept;
    [[nodiscard]] OverlayGeometry resizeRect(const glm::ivec2& delta, const Limits& limits) const noexcept;
    [[nodiscard]] OverlayGeometry movePoint(const glm::ivec2& delta, const Limits& limits) const noexcept;

private:
    Mode            m_mode        = Mode::None;
    OverlayKind     m_kind        = OverlayKind::Rect;
    glm::ivec2      m_startCursor = glm::ivec2(0);
    OverlayGeometry m_start       = {};
};
