#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "sliceload/file_meta.hpp"

namespace sliceload::client
{

    enum class ClientCommand : std::uint8_t
    {
        Upload,
        Meta
    };

    struct ClientConfig
    {
        std::string host;
        std::uint16_t port{};
        ClientCommand command{ClientCommand::Upload};
        std::filesystem::path file;
        std::string file_id;
        std::uint64_t chunk_size{10ULL * 1024 * 1024};
        std::string prefix;
        std::size_t concurrency{4};
        std::optional<StorageMode> storage;
        bool verify{true};
        std::optional<std::filesystem::path> progress_dir;
        std::optional<std::filesystem::path> log_path;
    };

    // Throws std::runtime_error with a usage message on malformed input.
    ClientConfig parse_arguments(int argc, char *argv[]);

} // namespace sliceload::client
