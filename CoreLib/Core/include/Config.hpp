#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "CoreTypes.hpp"
#include "OverlayStyle.hpp"

namespace config
{

    /// Built-in rect geometry used when neither the caller nor the store provides one.
    inline constexpr RectGeometry kDefaultRect{120, 120, 240, 160};

    /// Built-in point geometry used when neither the caller nor the store provides one.
    inline constexpr PointGeometry kDefaultPoint{160, 160};

    /// Per-user directory (under $HOME) used when no config directory is given.
    inline constexpr const char* kDefaultDirName = ".desktop_overlay_manager";

    /// Store file inside the config directory.
    inline constexpr const char* kStoreFileName = "overlays.json";

    /// Files written by older releases, migrated into kStoreFileName on first load.
    inline constexpr const char* kLegacyRectsFileName  = "rects.json";
    inline constexpr const char* kLegacyPointsFileName = "points.json";

    /// Smallest rect the user can resize to, in pixels.
    inline constexpr int kMinRectSize = 50;

    /**
     * @brief When a geometry-changed event reaches the durable store.
     *
     * The in-memory geometry is updated on every event regardless.
     */
    enum class PersistPolicy
    {
        OnDragFinished, ///< Flush once the drag/resize ends (mouse release).
        EveryChange     ///< Flush on every event, including live drag updates.
    };

    /**
     * @brief Options for OverlayManager.
     *
     * Typical usage:
     * @code
     * config::ManagerOptions opts;
     * opts.configDir = "/tmp/overlays";
     * OverlayManager mgr(std::make_unique<QtOverlayBackend>(), opts);
     * @endcode
     */
    struct ManagerOptions
    {
        std::optional<std::filesystem::path> configDir     = {};
        std::string                          storeFileName = kStoreFileName;
        StylePolicy                          stylePolicy   = StylePolicy::Passthrough;
        PersistPolicy                        persistPolicy = PersistPolicy::OnDragFinished;
    };

    /**
     * @brief Default config directory: $HOME/.desktop_overlay_manager.
     */
    std::filesystem::path defaultConfigDir();

    /**
     * @brief The config directory `options` resolves to (explicit or default).
     */
    std::filesystem::path resolveConfigDir(const ManagerOptions& options);

} // namespace config
