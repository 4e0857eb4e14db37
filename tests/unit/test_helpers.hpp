#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <span>
#include <string>
#include <system_error>
#include <vector>

namespace sliceload::testing
{

    // Scratch directory under the system temp dir, removed on destruction.
    class TempDir
    {
    public:
        explicit TempDir(const std::string &name)
            : path_(std::filesystem::temp_directory_path() / name)
        {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
            std::filesystem::create_directories(path_);
        }

        ~TempDir()
        {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }

        TempDir(const TempDir &) = delete;
        TempDir &operator=(const TempDir &) = delete;

        const std::filesystem::path &path() const noexcept { return path_; }

    private:
        std::filesystem::path path_;
    };

    inline std::vector<std::byte> make_pattern(std::size_t size, std::uint32_t seed)
    {
        std::vector<std::byte> data(size);
        std::uint32_t state = seed * 2654435761u + 1;
        for (auto &value : data)
        {
            state = state * 1664525u + 1013904223u;
            value = static_cast<std::byte>(state >> 24);
        }
        return data;
    }

    inline void write_file(const std::filesystem::path &path, std::span<const std::byte> data)
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
    }

    inline std::vector<std::byte> read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        const std::vector<char> raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        std::vector<std::byte> bytes(raw.size());
        for (std::size_t i = 0; i < raw.size(); ++i)
        {
            bytes[i] = static_cast<std::byte>(raw[i]);
        }
        return bytes;
    }

    inline std::span<const std::byte> slice_of(const std::vector<std::byte> &data, std::uint64_t chunk_size,
                                               std::uint64_t index)
    {
        const auto offset = static_cast<std::size_t>(index * chunk_size);
        const auto length = std::min<std::size_t>(static_cast<std::size_t>(chunk_size), data.size() - offset);
        return std::span<const std::byte>(data).subspan(offset, length);
    }

} // namespace sliceload::testing
