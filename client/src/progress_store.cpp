#include "sliceload/client/progress_store.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include <nlohmann/json.hpp>

namespace sliceload::client
{

    ProgressStore::ProgressStore(std::filesystem::path directory)
        : directory_(std::move(directory)) {}

    std::filesystem::path ProgressStore::default_directory()
    {
#ifdef _WIN32
        if (const char *appdata = std::getenv("APPDATA"))
        {
            return std::filesystem::path(appdata) / "SliceLoad" / "progress";
        }
#endif
        if (const char *home = std::getenv("HOME"))
        {
            return std::filesystem::path(home) / ".sliceload" / "progress";
        }
        return std::filesystem::path(".sliceload") / "progress";
    }

    std::filesystem::path ProgressStore::path_for(const std::string &file_name, std::uint64_t file_size) const
    {
        return directory_ / ("file_meta_" + file_name + "_" + std::to_string(file_size) + ".json");
    }

    std::optional<FileMeta> ProgressStore::load(const std::string &file_name, std::uint64_t file_size) const
    {
        const auto path = path_for(file_name, file_size);
        std::ifstream in(path);
        if (!in.is_open())
        {
            return std::nullopt;
        }
        try
        {
            nlohmann::json json;
            in >> json;
            auto meta = json.get<FileMeta>();
            if (meta.file_name != file_name || meta.file_size != file_size || meta.file_id.empty())
            {
                return std::nullopt;
            }
            return meta;
        }
        catch (const nlohmann::json::exception &)
        {
            return std::nullopt;
        }
        catch (const std::invalid_argument &)
        {
            return std::nullopt;
        }
    }

    void ProgressStore::save(const FileMeta &meta) const
    {
        std::error_code ec;
        std::filesystem::create_directories(directory_, ec);
        if (ec)
        {
            throw std::runtime_error("Unable to create progress directory " + directory_.string() + ": " + ec.message());
        }

        const auto path = path_for(meta.file_name, meta.file_size);
        auto temp = path;
        temp += ".tmp";
        {
            std::ofstream out(temp, std::ios::trunc);
            if (!out.is_open())
            {
                throw std::runtime_error("Unable to write progress file " + temp.string());
            }
            out << nlohmann::json(meta).dump(2);
            out.flush();
            if (!out)
            {
                throw std::runtime_error("Unable to write progress file " + temp.string());
            }
        }
        std::filesystem::rename(temp, path, ec);
        if (ec)
        {
            std::filesystem::remove(temp, ec);
            throw std::runtime_error("Unable to replace progress file " + path.string());
        }
    }

    void ProgressStore::clear(const std::string &file_name, std::uint64_t file_size) const
    {
        std::error_code ec;
        std::filesystem::remove(path_for(file_name, file_size), ec);
    }

} // namespace sliceload::client
