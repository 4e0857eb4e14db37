#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "sliceload/file_meta.hpp"

namespace sliceload::client
{

    /**
     * Local copy of each upload's session document, one JSON file per
     * (file name, file size) pair: <directory>/file_meta_<name>_<size>.json.
     */
    class ProgressStore
    {
    public:
        explicit ProgressStore(std::filesystem::path directory = default_directory());

        // $HOME/.sliceload/progress, or .sliceload/progress without HOME.
        static std::filesystem::path default_directory();

        const std::filesystem::path &directory() const noexcept { return directory_; }

        std::filesystem::path path_for(const std::string &file_name, std::uint64_t file_size) const;

        // Missing, unreadable or corrupt documents count as no progress.
        std::optional<FileMeta> load(const std::string &file_name, std::uint64_t file_size) const;

        // Atomic replace; throws std::runtime_error when the write fails.
        void save(const FileMeta &meta) const;

        void clear(const std::string &file_name, std::uint64_t file_size) const;

    private:
        std::filesystem::path directory_;
    };

} // namespace sliceload::client
