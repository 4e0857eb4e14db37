#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>

#include "sliceload/file_meta.hpp"

namespace sliceload::server
{

    /**
     * Canonical on-disk placement of upload sessions.
     *
     *   <cache>/<file_id>/meta.json                  working session document
     *   <cache>/<file_id>/<name>.<index>.<hash>.slice discrete slice files
     *   <cache>/<file_id>/<name>.part                 sparse working file
     *   <uploads>/[prefix/]<name>                     merged artifact
     *   <meta>/<file_id>.meta.json                    archived document
     */
    class StorageLayout
    {
    public:
        using IdGenerator = std::function<std::string()>;

        static constexpr int kMaxIdAttempts = 10;

        StorageLayout(std::filesystem::path cache_root, std::filesystem::path upload_root,
                      std::filesystem::path meta_root, IdGenerator id_generator = {});

        const std::filesystem::path &cache_root() const noexcept { return cache_root_; }
        const std::filesystem::path &upload_root() const noexcept { return upload_root_; }
        const std::filesystem::path &meta_root() const noexcept { return meta_root_; }

        // Mints an id whose cache directory did not exist and creates that
        // directory. Throws UploadError after kMaxIdAttempts collisions.
        std::string allocate_session();

        std::filesystem::path session_dir(const std::string &file_id) const;
        std::filesystem::path working_meta_path(const std::string &file_id) const;
        std::filesystem::path archived_meta_path(const std::string &file_id) const;
        std::filesystem::path slice_path(const FileMeta &meta, std::uint64_t index, const std::string &hash) const;
        std::filesystem::path working_file_path(const FileMeta &meta) const;
        std::filesystem::path destination_path(const FileMeta &meta) const;
        // Session-scoped staging file beside the destination, so the final
        // rename stays on one filesystem and never collides with another session.
        std::filesystem::path staging_path(const FileMeta &meta) const;

        static bool is_valid_session_id(std::string_view file_id) noexcept;
        static bool is_safe_file_name(std::string_view file_name) noexcept;
        static bool is_safe_prefix(std::string_view prefix) noexcept;

    private:
        std::filesystem::path cache_root_;
        std::filesystem::path upload_root_;
        std::filesystem::path meta_root_;
        IdGenerator id_generator_;
    };

} // namespace sliceload::server
