#include "sliceload/server/layout.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

#include "sliceload/crypto.hpp"
#include "sliceload/server/errors.hpp"

namespace sliceload::server
{

    namespace
    {
        constexpr auto kWorkingMetaName = "meta.json";
        constexpr auto kArchivedMetaSuffix = ".meta.json";
        constexpr std::size_t kSessionIdBytes = 16;
        constexpr std::size_t kMaxSessionIdLength = 128;
    } // namespace

    StorageLayout::StorageLayout(std::filesystem::path cache_root, std::filesystem::path upload_root,
                                 std::filesystem::path meta_root, IdGenerator id_generator)
        : cache_root_(std::move(cache_root)),
          upload_root_(std::move(upload_root)),
          meta_root_(std::move(meta_root)),
          id_generator_(std::move(id_generator))
    {
        if (!id_generator_)
        {
            id_generator_ = []
            { return sliceload::crypto::random_hex(kSessionIdBytes); };
        }
        std::filesystem::create_directories(cache_root_);
        std::filesystem::create_directories(upload_root_);
        std::filesystem::create_directories(meta_root_);
    }

    std::string StorageLayout::allocate_session()
    {
        for (int attempt = 0; attempt < kMaxIdAttempts; ++attempt)
        {
            auto file_id = id_generator_();
            if (!is_valid_session_id(file_id))
            {
                throw UploadError(sliceload::ErrorCode::InternalError, "Generated session id is malformed");
            }
            // create_directory reports false when the directory already exists,
            // which makes the collision check and the reservation one step.
            if (std::filesystem::create_directory(session_dir(file_id)))
            {
                return file_id;
            }
            spdlog::warn("Session id collision on {} (attempt {})", file_id, attempt + 1);
        }
        throw UploadError(sliceload::ErrorCode::InternalError, "Unable to allocate a unique session id");
    }

    std::filesystem::path StorageLayout::session_dir(const std::string &file_id) const
    {
        return cache_root_ / file_id;
    }

    std::filesystem::path StorageLayout::working_meta_path(const std::string &file_id) const
    {
        return session_dir(file_id) / kWorkingMetaName;
    }

    std::filesystem::path StorageLayout::archived_meta_path(const std::string &file_id) const
    {
        return meta_root_ / (file_id + kArchivedMetaSuffix);
    }

    std::filesystem::path StorageLayout::slice_path(const FileMeta &meta, std::uint64_t index,
                                                    const std::string &hash) const
    {
        return session_dir(meta.file_id) / (meta.file_name + "." + slice_key(index) + "." + hash + ".slice");
    }

    std::filesystem::path StorageLayout::working_file_path(const FileMeta &meta) const
    {
        return session_dir(meta.file_id) / (meta.file_name + ".part");
    }

    std::filesystem::path StorageLayout::destination_path(const FileMeta &meta) const
    {
        auto destination = upload_root_;
        for (const auto &part : std::filesystem::path(meta.prefix).relative_path())
        {
            const auto part_string = part.generic_string();
            if (part_string.empty() || part_string == ".")
            {
                continue;
            }
            destination /= part;
        }
        return destination / meta.file_name;
    }

    std::filesystem::path StorageLayout::staging_path(const FileMeta &meta) const
    {
        auto staging = destination_path(meta);
        staging += "." + meta.file_id + ".merging";
        return staging;
    }

    bool StorageLayout::is_valid_session_id(std::string_view file_id) noexcept
    {
        if (file_id.empty() || file_id.size() > kMaxSessionIdLength)
        {
            return false;
        }
        return std::all_of(file_id.begin(), file_id.end(), [](char ch)
                           { return std::isalnum(static_cast<unsigned char>(ch)) != 0; });
    }

    bool StorageLayout::is_safe_file_name(std::string_view file_name) noexcept
    {
        if (file_name.empty() || file_name == "." || file_name == "..")
        {
            return false;
        }
        return file_name.find_first_of("/\\") == std::string_view::npos &&
               file_name.find('\0') == std::string_view::npos;
    }

    bool StorageLayout::is_safe_prefix(std::string_view prefix) noexcept
    {
        return prefix.find("..") == std::string_view::npos && prefix.find('\0') == std::string_view::npos;
    }

} // namespace sliceload::server
