#pragma once

#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>

#include "Config.hpp"
#include "CoreTypes.hpp"
#include "StoreIOReport.hpp"

/**
 * @brief Durable (kind, id) -> geometry store backed by one JSON file.
 *
 * File layout (config::kStoreFileName inside the config directory):
 * @code
 * {
 *   "rects":  { "price": { "x": 10, "y": 20, "width": 300, "height": 80 } },
 *   "points": { "ok":    { "x": 400, "y": 300 } }
 * }
 * @endcode
 *
 * Behavior:
 *  - A missing file loads as an empty store.
 *  - A malformed entry is skipped and logged; it stays in the file and the rest still loads.
 *  - An unparsable file is copied to "<file>.corrupt" and loads as empty.
 *  - Unknown fields (per entry and top level) are kept and written back untouched.
 *  - save() rewrites the file atomically (temporary file + rename) before returning.
 *  - If the store file is absent but legacy "rects.json"/"points.json" exist,
 *    their entries are imported and written to the store file.
 *
 * @note Processes sharing one store are not coordinated; last writer wins.
 */
class GeometryStore
{
public:
    using EntryKey = std::pair<OverlayKind, std::string>;
    using EntryMap = std::map<EntryKey, PersistedEntry>;

    /**
     * @param configDir Directory holding the store file. Created on load() if missing.
     * @param fileName  Store file name inside configDir.
     */
    explicit GeometryStore(std::filesystem::path configDir, std::string fileName = config::kStoreFileName);

    GeometryStore(const GeometryStore&)            = delete;
    GeometryStore& operator=(const GeometryStore&) = delete;

    /**
     * @brief (Re)read the store from disk, replacing the cached state.
     *
     * Never throws for corrupt data: bad entries are skipped and reported.
     *
     * @param report Optional report receiving per-entry diagnostics.
     * @return All valid entries.
     */
    EntryMap load(StoreIOReport* report = nullptr);

    /**
     * @brief Upsert one entry and flush the file before returning.
     *
     * Only this entry's geometry fields change; other entries and unknown
     * fields are preserved.
     *
     * @throws InvalidGeometryError if a rect entry has a non-positive size.
     * @throws StoreWriteError if the file could not be written; the cached
     *         state is left unchanged in that case.
     */
    void save(const PersistedEntry& entry);

    /**
     * @brief Cached entry for (kind, id), if any.
     */
    [[nodiscard]] std::optional<PersistedEntry> get(OverlayKind kind, const std::string& id) const;

    [[nodiscard]] bool contains(OverlayKind kind, const std::string& id) const;

    [[nodiscard]] const EntryMap& entries() const noexcept
    {
        return m_entries;
    }

    [[nodiscard]] const std::filesystem::path& directory() const noexcept
    {
        return m_dir;
    }

    [[nodiscard]] const std::filesystem::path& filePath() const noexcept
    {
        return m_path;
    }

    /**
     * @brief Parse one stored entry.
     * @throws CorruptStoreError if the value is not an object or a geometry field is missing/invalid.
     */
    [[nodiscard]] static PersistedEntry parseEntry(OverlayKind kind, const std::string& id, const QJsonValue& value);

    /**
     * @brief JSON section holding entries of `kind` ("rects" / "points").
     */
    [[nodiscard]] static QString sectionName(OverlayKind kind);

private:
    enum class ReadResult
    {
        Missing,
        Ok,
        Corrupt
    };

    static ReadResult readDocument(const std::filesystem::path& path, QJsonObject& out, std::string& problem);
    void writeDocument(const QJsonObject& doc) const;

    bool migrateLegacy(StoreIOReport& report);
    void rebuildEntries(StoreIOReport& report);
    void backupCorruptFile(StoreIOReport& report) const;

private:
    std::filesystem::path m_dir;
    std::filesystem::path m_path;

    QJsonObject m_document = {}; // raw document, including unknown fields
    EntryMap    m_entries  = {};
};
