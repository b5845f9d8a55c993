#include "../../include/modelbase/utils/utils.h"

#include <fstream>

namespace mdb
{
    fs::path resolvePath(const std::string& input_path)
    {
        fs::path path(input_path);

        if (!path.is_absolute())
        {
            path = fs::absolute(path);
        }

        return path;
    }

    bool createDirs(const fs::path& path)
    {
        try
        {
            if (!fs::exists(path))
            {
                fs::create_directories(path); // creates all missing parent directories too
            }

            return true;
        }
        catch (const fs::filesystem_error& e)
        {
            logger::critical("Filesystem error while creating directory '{}', reason: {}",
                             path.string(), e.what());
            return false;
        }
    }

    std::optional<json> readJsonFile(const fs::path& path)
    {
        std::error_code ec;
        if (!fs::is_regular_file(path, ec))
        {
            logger::debug("JSON file `{}` does not exist", path.string());
            return std::nullopt;
        }

        std::ifstream file(path);
        if (!file.is_open())
        {
            logger::warn("Could not open JSON file `{}`", path.string());
            return std::nullopt;
        }

        try
        {
            return json::parse(file);
        }
        catch (const json::parse_error& e)
        {
            logger::warn("JSON parse error in `{}`: {}", path.string(), e.what());
            return std::nullopt;
        }
    }

    bool writeJsonFile(const fs::path& path, const json& data)
    {
        if (path.has_parent_path() && !createDirs(path.parent_path()))
            return false;

        std::ofstream file(path, std::ios::trunc);
        if (!file.is_open())
        {
            logger::warn("Could not open `{}` for writing", path.string());
            return false;
        }

        file << data.dump(2);
        return static_cast<bool>(file);
    }
}
