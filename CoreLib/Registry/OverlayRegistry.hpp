#pragma once

#include <QVariantMap>
#include <cstddef>
#include <string>
#include <unordered_map>

#include "Config.hpp"
#include "CoreTypes.hpp"
#include "OverlayRecord.hpp"

class GeometryStore;
class OverlayBackend;

/**
 * @brief Owns the live overlays and reconciles them with the durable store.
 *
 * Geometry resolution on first registration is field by field:
 * explicit request field > stored geometry > built-in default.
 *
 * Geometry events from widgets are the only path that mutates a record's
 * geometry after creation. Each event is applied synchronously on the UI
 * thread; applying one touches only the record and the store, never a widget.
 *
 * @note The registry does not own the backend or the store; OverlayManager does.
 */
class OverlayRegistry
{
public:
    /**
     * @param backend Creates the widgets (must outlive the registry).
     * @param store   Durable geometry (must outlive the registry).
     * @param persist When geometry events reach the store.
     */
    OverlayRegistry(OverlayBackend&       backend,
                    GeometryStore&        store,
                    config::PersistPolicy persist = config::PersistPolicy::OnDragFinished) noexcept;

    ~OverlayRegistry();

    OverlayRegistry(const OverlayRegistry&)            = delete;
    OverlayRegistry& operator=(const OverlayRegistry&) = delete;

    // ------------------------------------------------------------
    // Registration
    // ------------------------------------------------------------

    /**
     * @brief Create the overlay for (kind, id), or refresh the live one.
     *
     * Existing record: label and style are replaced, explicit geometry fields
     * are applied over the live geometry, and the overlay is shown again.
     * No second overlay is ever created for the same (kind, id).
     *
     * @param kind    Overlay kind.
     * @param id      Overlay id (namespace is per kind).
     * @param label   Label text; empty falls back to the id.
     * @param request Explicit geometry fields.
     * @param style   Style options (replaced, not merged).
     *
     * @throws InvalidGeometryError if the request has a non-positive width/height.
     * @throws InvalidStyleError    if the backend rejects the style.
     */
    const OverlayRecord& ensure(OverlayKind            kind,
                                const std::string&     id,
                                const std::string&     label,
                                const GeometryRequest& request,
                                const QVariantMap&     style);

    /**
     * @brief Release one overlay. Its persisted geometry is kept.
     * @return True if a live record was removed.
     */
    bool remove(OverlayKind kind, const std::string& id);

    // ------------------------------------------------------------
    // Geometry
    // ------------------------------------------------------------

    /**
     * @brief Apply a geometry event coming from a widget.
     *
     * The in-memory geometry is updated immediately. The store is written
     * when `finished` is true, or on every event under PersistPolicy::EveryChange.
     * Events for ids without a live record are ignored.
     *
     * @throws StoreWriteError if the store flush fails (memory keeps the new value).
     */
    void onGeometryChanged(OverlayKind kind, const std::string& id, const OverlayGeometry& geometry, bool finished = true);

    /**
     * @brief Current geometry: live record first, then the store.
     * @throws NotFoundError if neither knows (kind, id).
     */
    [[nodiscard]] OverlayGeometry get(OverlayKind kind, const std::string& id) const;

    // ------------------------------------------------------------
    // Visibility / teardown
    // ------------------------------------------------------------

    /// Show every live overlay. Idempotent.
    void showAll();

    /// Hide every live overlay. Idempotent.
    void hideAll();

    /// Release every widget and forget all live records. Persisted entries are kept.
    void destroyAll() noexcept;

    // ------------------------------------------------------------
    // Queries
    // ------------------------------------------------------------

    [[nodiscard]] const OverlayRecord* find(OverlayKind kind, const std::string& id) const;

    [[nodiscard]] bool contains(OverlayKind kind, const std::string& id) const;

    [[nodiscard]] std::size_t size() const noexcept;

private:
    using RecordMap = std::unordered_map<std::string, OverlayRecord>;

    RecordMap&                     records(OverlayKind kind) noexcept;
    [[nodiscard]] const RecordMap& records(OverlayKind kind) const noexcept;

    [[nodiscard]] OverlayGeometry resolveGeometry(OverlayKind kind, const std::string& id, const GeometryRequest& request) const;

    void subscribe(OverlayRecord& record);

    static void validateRequest(OverlayKind kind, const std::string& id, const GeometryRequest& request);
    static void applyRequest(OverlayKind kind, OverlayGeometry& geometry, const GeometryRequest& request) noexcept;

private:
    OverlayBackend*       m_backend = nullptr; // non-owning
    GeometryStore*        m_store   = nullptr; // non-owning
    config::PersistPolicy m_persist = config::PersistPolicy::OnDragFinished;

    RecordMap m_rects;
    RecordMap m_points;
};
