#pragma once

#include <QVariantMap>
#include <memory>
#include <string>

#include "CoreTypes.hpp"
#include "OverlayWidget.hpp"

/**
 * @brief Rendering surface + event loop the overlay widgets live on.
 *
 * OverlayManager owns exactly one backend and drives its lifecycle:
 * startLoop() on construction, stopLoop() on destroy(). All calls happen on
 * the thread that owns the loop.
 */
class OverlayBackend
{
public:
    virtual ~OverlayBackend() = default;

    /**
     * @brief Open the rendering surface and make the event loop usable.
     */
    virtual void startLoop() = 0;

    /**
     * @brief Stop the event loop and free the rendering surface.
     *
     * Must be safe to call more than once.
     */
    virtual void stopLoop() noexcept = 0;

    /**
     * @brief Dispatch pending events without blocking.
     */
    virtual void processEvents() = 0;

    /**
     * @brief Run the event loop until stopLoop() is called.
     * @return Loop exit code.
     */
    virtual int exec() = 0;

    /**
     * @brief Create a widget for the given kind.
     *
     * The widget starts hidden; the registry shows it.
     *
     * @throws InvalidStyleError if `style` does not validate for `kind`.
     */
    virtual std::unique_ptr<OverlayWidget> createWidget(OverlayKind            kind,
                                                        const OverlayGeometry& geometry,
                                                        const std::string&     label,
                                                        const QVariantMap&     style) = 0;
};
