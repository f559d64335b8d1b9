#pragma once

#include <glm/glm.hpp>
#include <optional>
#include <string>
#include <string_view>

/**
 * @brief Kind of overlay. Rects and points use separate id namespaces.
 */
enum class OverlayKind
{
    Rect,
    Point
};

/**
 * @brief Human-readable kind name ("rect" / "point"), used in logs and errors.
 */
std::string_view kindName(OverlayKind kind) noexcept;

/**
 * @brief Rectangle geometry as seen by callers of OverlayManager.
 */
struct RectGeometry
{
    int x      = 0;
    int y      = 0;
    int width  = 0;
    int height = 0;

    bool operator==(const RectGeometry&) const = default;
};

/**
 * @brief Point marker geometry as seen by callers of OverlayManager.
 */
struct PointGeometry
{
    int x = 0;
    int y = 0;

    bool operator==(const PointGeometry&) const = default;
};

/**
 * @brief Internal geometry shared by both overlay kinds.
 *
 * Points carry a zero size. For rects the size is always positive.
 */
struct OverlayGeometry
{
    glm::ivec2 pos  = glm::ivec2(0);
    glm::ivec2 size = glm::ivec2(0);

    bool operator==(const OverlayGeometry&) const = default;

    static OverlayGeometry fromRect(const RectGeometry& r) noexcept
    {
        return OverlayGeometry{glm::ivec2(r.x, r.y), glm::ivec2(r.width, r.height)};
    }

    static OverlayGeometry fromPoint(const PointGeometry& p) noexcept
    {
        return OverlayGeometry{glm::ivec2(p.x, p.y), glm::ivec2(0)};
    }

    [[nodiscard]] RectGeometry toRect() const noexcept
    {
        return RectGeometry{pos.x, pos.y, size.x, size.y};
    }

    [[nodiscard]] PointGeometry toPoint() const noexcept
    {
        return PointGeometry{pos.x, pos.y};
    }
};

/**
 * @brief Explicit geometry fields supplied at registration.
 *
 * Every field is optional; missing fields are resolved one by one from the
 * stored geometry and then from the built-in default.
 */
struct GeometryRequest
{
    std::optional<int> x      = {};
    std::optional<int> y      = {};
    std::optional<int> width  = {};
    std::optional<int> height = {};

    [[nodiscard]] bool empty() const noexcept
    {
        return !x && !y && !width && !height;
    }
};

/**
 * @brief Durable counterpart of an overlay: geometry only, no label or style.
 */
struct PersistedEntry
{
    std::string     id;
    OverlayKind     kind = OverlayKind::Rect;
    OverlayGeometry geometry{};

    bool operator==(const PersistedEntry&) const = default;
};
