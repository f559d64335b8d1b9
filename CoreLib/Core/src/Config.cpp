#include "Config.hpp"

#include <QDir>

#include "PathUtilities.hpp"

namespace config
{

    std::filesystem::path defaultConfigDir()
    {
        const std::filesystem::path home = PathUtil::toPath(QDir::homePath());
        return home / kDefaultDirName;
    }

    std::filesystem::path resolveConfigDir(const ManagerOptions& options)
    {
        if (options.configDir && !options.configDir->empty())
            return PathUtil::normalizedPath(*options.configDir);
        return defaultConfigDir();
    }

} // namespace config
