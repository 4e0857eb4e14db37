#include "sliceload/server/config.hpp"

#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace sliceload::server
{

    namespace
    {

        void assign_path(const nlohmann::json &section, const char *key, std::filesystem::path &target)
        {
            if (auto it = section.find(key); it != section.end())
            {
                target = std::filesystem::path(it->get<std::string>());
            }
        }

    } // namespace

    void apply_root(ServerConfig &config, const std::filesystem::path &root)
    {
        if (config.slice_cache_dir.empty())
        {
            config.slice_cache_dir = root / "cache";
        }
        if (config.upload_dir.empty())
        {
            config.upload_dir = root / "uploads";
        }
        if (config.meta_dir.empty())
        {
            config.meta_dir = root / "meta";
        }
    }

    void apply_config_file(ServerConfig &config, const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw std::runtime_error("Unable to open config file " + path.string());
        }

        nlohmann::json json;
        try
        {
            in >> json;
        }
        catch (const nlohmann::json::parse_error &ex)
        {
            throw std::runtime_error("Invalid config file " + path.string() + ": " + ex.what());
        }

        try
        {
            if (auto it = json.find("server"); it != json.end())
            {
                const auto &server = *it;
                config.address = server.value("address", config.address);
                config.port = server.value("port", config.port);
                config.worker_threads = server.value("threads", config.worker_threads);
                if (auto log = server.find("log_file"); log != server.end())
                {
                    config.log_file = std::filesystem::path(log->get<std::string>());
                }
            }
            if (auto it = json.find("uploader"); it != json.end())
            {
                const auto &uploader = *it;
                assign_path(uploader, "slice_cache_dir", config.slice_cache_dir);
                assign_path(uploader, "upload_dir", config.upload_dir);
                assign_path(uploader, "metafile_dir", config.meta_dir);
                if (auto storage = uploader.find("storage"); storage != uploader.end())
                {
                    const auto label = storage->get<std::string>();
                    const auto mode = storage_mode_from_string(label);
                    if (!mode)
                    {
                        throw std::runtime_error("Unknown storage mode '" + label + "'");
                    }
                    config.default_storage = *mode;
                }
                if (auto timeout = uploader.find("session_timeout"); timeout != uploader.end())
                {
                    config.session_timeout = std::chrono::seconds(timeout->get<std::int64_t>());
                }
            }
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw std::runtime_error("Invalid value in config file " + path.string() + ": " + ex.what());
        }
    }

    void validate(const ServerConfig &config)
    {
        if (config.slice_cache_dir.empty())
        {
            throw std::invalid_argument("slice cache directory is not configured");
        }
        if (config.upload_dir.empty())
        {
            throw std::invalid_argument("upload directory is not configured");
        }
        if (config.meta_dir.empty())
        {
            throw std::invalid_argument("meta directory is not configured");
        }
    }

} // namespace sliceload::server
