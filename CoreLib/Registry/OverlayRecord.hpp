#pragma once

#include <QVariantMap>
#include <memory>
#include <string>

#include "CoreTypes.hpp"
#include "OverlayWidget.hpp"

/**
 * @brief One live overlay tracked by OverlayRegistry.
 *
 * The record exclusively owns its widget. Move-only.
 */
struct OverlayRecord
{
    std::string                    id;
    OverlayKind                    kind = OverlayKind::Rect;
    std::string                    label;
    OverlayGeometry                geometry{};
    QVariantMap                    style   = {};
    std::unique_ptr<OverlayWidget> widget  = {};
    bool                           visible = false;
};
