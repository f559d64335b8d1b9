#pragma once

#include <QVariantMap>
#include <functional>
#include <string>

#include "CoreTypes.hpp"

/**
 * @file OverlayWidget.hpp
 * @brief Capability interface for one on-screen overlay.
 *
 * The registry depends only on this interface; how the overlay is painted and
 * dragged is up to the backend (see QtOverlayBackend).
 *
 * Lifetime: the widget is created by OverlayBackend::createWidget() and
 * destroyed by releasing the unique_ptr. A destroyed widget delivers no
 * further geometry events.
 */
class OverlayWidget
{
public:
    /**
     * @brief Geometry-changed event.
     *
     * @param geometry New geometry (screen coordinates).
     * @param finished True once the drag/resize interaction ended (mouse release).
     */
    using GeometryChangedFn = std::function<void(const OverlayGeometry& geometry, bool finished)>;

    virtual ~OverlayWidget() = default;

    virtual void show() = 0;
    virtual void hide() = 0;

    [[nodiscard]] virtual bool isVisible() const = 0;

    /**
     * @brief Move/resize the overlay programmatically. Does not emit a geometry event.
     */
    virtual void setGeometry(const OverlayGeometry& geometry) = 0;

    [[nodiscard]] virtual OverlayGeometry geometry() const = 0;

    virtual void setLabel(const std::string& label) = 0;

    /**
     * @brief Replace the style. Implementations validate the map against
     * the recognized options for their kind.
     */
    virtual void setStyle(const QVariantMap& style) = 0;

    /**
     * @brief Install the handler invoked when the user drags or resizes the overlay.
     */
    virtual void setGeometryChangedHandler(GeometryChangedFn fn) = 0;
};
