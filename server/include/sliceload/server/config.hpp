#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "sliceload/file_meta.hpp"

namespace sliceload::server
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::size_t worker_threads{0};
        std::filesystem::path slice_cache_dir;
        std::filesystem::path upload_dir;
        std::filesystem::path meta_dir;
        StorageMode default_storage{StorageMode::Sparse};
        // Zero disables reaping of abandoned sessions.
        std::chrono::seconds session_timeout{std::chrono::hours{24}};
        std::optional<std::filesystem::path> log_file;
    };

    // Fills any unset directory with <root>/cache, <root>/uploads, <root>/meta.
    void apply_root(ServerConfig &config, const std::filesystem::path &root);

    /**
     * Overlays settings from a JSON file:
     *
     *   {"server":   {"address": "...", "port": 8080, "threads": 4},
     *    "uploader": {"slice_cache_dir": "...", "upload_dir": "...",
     *                 "metafile_dir": "...", "storage": "sparse",
     *                 "session_timeout": 86400}}
     *
     * Missing keys keep their current values. Throws std::runtime_error.
     */
    void apply_config_file(ServerConfig &config, const std::filesystem::path &path);

    // Throws std::invalid_argument naming the first missing setting.
    void validate(const ServerConfig &config);

} // namespace sliceload::server
