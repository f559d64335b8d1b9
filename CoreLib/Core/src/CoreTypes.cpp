#include "CoreTypes.hpp"

std::string_view kindName(OverlayKind kind) noexcept
{
    switch (kind)
    {
        case OverlayKind::Rect:
            return "rect";
        case OverlayKind::Point:
            return "point";
    }
    return "unknown";
}
