//=============================================================================
// OverlayManager.hpp
//=============================================================================
#pragma once

#include <QVariantMap>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "Config.hpp"
#include "CoreTypes.hpp"
#include "EventLoopOwnership.hpp"

class GeometryStore;
class OverlayBackend;
class OverlayRegistry;

/**
 * @brief Arguments of OverlayManager::registerRect().
 *
 * @code
 * mgr.registerRect("price", {.label = "Price", .width = 300, .style = {{"border_color", "#00FF00"}}});
 * @endcode
 */
struct RectOptions
{
    std::string        label  = {};
    std::optional<int> x      = {};
    std::optional<int> y      = {};
    std::optional<int> width  = {};
    std::optional<int> height = {};
    QVariantMap        style  = {};
};

/**
 * @brief Arguments of OverlayManager::registerPosition().
 */
struct PointOptions
{
    std::string        label = {};
    std::optional<int> x     = {};
    std::optional<int> y     = {};
    QVariantMap        style = {};
};

/**
 * @brief Public facade: draggable desktop overlays with persisted geometry.
 *
 * OverlayManager composes the backend (widgets + event loop), the
 * GeometryStore and the OverlayRegistry. It owns the process-wide overlay
 * event loop for its whole lifetime:
 *  - construction claims the loop (AlreadyRunningError if another manager
 *    holds it), loads the store and starts the backend loop
 *  - destroy() (or the destructor) releases every widget, stops the loop and
 *    gives the claim back
 *
 * All calls must come from the thread running the loop.
 */
class OverlayManager
{
public:
    /**
     * @param backend Widget/event-loop backend (e.g. QtOverlayBackend). Must not be null.
     * @param options Config directory, store file name, style and persist policies.
     *
     * @throws AlreadyRunningError if another OverlayManager is alive.
     */
    explicit OverlayManager(std::unique_ptr<OverlayBackend> backend, config::ManagerOptions options = {});

    /** @brief Runs destroy(). */
    ~OverlayManager();

    OverlayManager(const OverlayManager&)            = delete;
    OverlayManager& operator=(const OverlayManager&) = delete;

    // ------------------------------------------------------------
    // Registration
    // ------------------------------------------------------------

    /**
     * @brief Create (or re-show) a draggable rectangle.
     *
     * Missing geometry fields come from the stored geometry, then from
     * config::kDefaultRect, one field at a time.
     *
     * @throws InvalidGeometryError on a non-positive width/height.
     * @throws InvalidStyleError    on a rejected style option.
     * @throws LoopStoppedError     after destroy().
     */
    void registerRect(const std::string& id, const RectOptions& options = {});

    /**
     * @brief Create (or re-show) a draggable point marker.
     *
     * @throws InvalidStyleError on a rejected style option.
     * @throws LoopStoppedError  after destroy().
     */
    void registerPosition(const std::string& id, const PointOptions& options = {});

    /** @brief Alias of registerPosition() kept for older callers. */
    void regsterPositon(const std::string& id, const PointOptions& options = {});

    /**
     * @brief Release one rectangle; its stored geometry is kept.
     * @return True if it was live.
     */
    bool unregisterRect(const std::string& id);

    /**
     * @brief Release one point marker; its stored geometry is kept.
     * @return True if it was live.
     */
    bool unregisterPosition(const std::string& id);

    // ------------------------------------------------------------
    // Queries
    // ------------------------------------------------------------

    /**
     * @brief Live geometry of a rect, or its stored geometry if not instantiated.
     * @throws NotFoundError for an id never registered nor stored.
     */
    [[nodiscard]] RectGeometry getRect(const std::string& id) const;

    /**
     * @brief Live position of a point, or its stored position if not instantiated.
     * @throws NotFoundError for an id never registered nor stored.
     */
    [[nodiscard]] PointGeometry getPosition(const std::string& id) const;

    // ------------------------------------------------------------
    // Visibility / lifecycle
    // ------------------------------------------------------------

    void showAll();
    void hideAll();

    /**
     * @brief Destroy all overlays, stop the event loop, release the loop claim.
     *
     * Idempotent. Stored geometry is kept for the next process.
     */
    void destroy() noexcept;

    /**
     * @brief Dispatch pending UI events (drags, repaints) without blocking.
     */
    void processEvents();

    /**
     * @brief Block in the backend event loop.
     * @return Loop exit code.
     */
    int exec();

    [[nodiscard]] bool isRunning() const noexcept
    {
        return m_running;
    }

    // ------------------------------------------------------------
    // Internals (tests / advanced hosts)
    // ------------------------------------------------------------

    [[nodiscard]] const std::filesystem::path& configDir() const noexcept;

    [[nodiscard]] OverlayRegistry& registry() noexcept
    {
        return *m_registry;
    }

    [[nodiscard]] const GeometryStore& store() const noexcept
    {
        return *m_store;
    }

private:
    void requireRunning(const char* operation) const;

private:
    // Declared first so a second manager fails before touching the store.
    EventLoopOwnership m_loopOwnership;

    config::ManagerOptions           m_options;
    std::unique_ptr<OverlayBackend>  m_backend;
    std::unique_ptr<GeometryStore>   m_store;
    std::unique_ptr<OverlayRegistry> m_registry;

    bool m_running = false;
};
