#pragma once

#include <QString>
#include <filesystem>
#include <string>
#include <system_error>

/**
 * @brief Path helpers shared by the store and the config layer.
 *
 * Conversions go through UTF-8 / native paths so ids and directories with
 * non-ASCII characters round-trip between std::filesystem and Qt.
 */
namespace PathUtil
{

    // ============================================================================
    // Normalization
    // ============================================================================

    /**
     * @brief Absolute, lexically normalized path.
     * @param input Path to normalize (may be relative or absolute).
     */
    inline std::filesystem::path normalizedPath(const std::filesystem::path& input)
    {
        std::error_code             ec;
        const std::filesystem::path abs = std::filesystem::absolute(input, ec);
        if (ec)
            return input.lexically_normal();
        return abs.lexically_normal();
    }

    // ============================================================================
    // Qt interop
    // ============================================================================

    inline std::filesystem::path toPath(const QString& path)
    {
        return std::filesystem::path(path.toStdU16String());
    }

    inline QString toQString(const std::filesystem::path& path)
    {
        return QString::fromStdU16String(path.generic_u16string());
    }

    // ============================================================================
    // Filesystem
    // ============================================================================

    /**
     * @brief Creates `dir` (and parents) if missing.
     * @return true if the directory exists afterwards.
     */
    inline bool ensureDirectory(const std::filesystem::path& dir, std::error_code& ec)
    {
        ec.clear();
        if (std::filesystem::is_directory(dir, ec))
            return true;
        std::filesystem::create_directories(dir, ec);
        return !ec && std::filesystem::is_directory(dir, ec);
    }

    /**
     * @brief Checks if a regular file exists at the given path.
     */
    inline bool fileExists(const std::filesystem::path& path)
    {
        std::error_code ec;
        return std::filesystem::is_regular_file(path, ec);
    }

    /**
     * @brief Same path with `suffix` appended to the filename ("a.json" -> "a.json.corrupt").
     */
    inline std::filesystem::path withSuffix(const std::filesystem::path& path, const std::string& suffix)
    {
        std::filesystem::path out = path;
        out += suffix;
        return out;
    }

} // namespace PathUtil
