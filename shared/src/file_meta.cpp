#include "sliceload/file_meta.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <stdexcept>

namespace sliceload
{

    namespace
    {

        struct StorageModeMapping
        {
            StorageMode mode;
            std::string_view label;
        };

        constexpr std::array<StorageModeMapping, 2> kStorageMappings{{
            {StorageMode::Discrete, "discrete"},
            {StorageMode::Sparse, "sparse"},
        }};

        std::uint64_t read_unsigned(const nlohmann::json &json, const char *key)
        {
            const auto &value = json.at(key);
            if (!value.is_number_unsigned())
            {
                throw std::invalid_argument(std::string("Field '") + key + "' must be a non-negative integer");
            }
            return value.get<std::uint64_t>();
        }

    } // namespace

    std::string_view to_string(StorageMode mode) noexcept
    {
        for (const auto &mapping : kStorageMappings)
        {
            if (mapping.mode == mode)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<StorageMode> storage_mode_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kStorageMappings)
        {
            if (mapping.label == value)
            {
                return mapping.mode;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const Slice &slice)
    {
        json = {
            {"slice_id", slice.id},
            {"status", static_cast<int>(slice.status)},
            {"sha1", slice.sha1},
        };
    }

    void from_json(const nlohmann::json &json, Slice &slice)
    {
        slice.id = json.at("slice_id").get<std::string>();
        slice.status = json.value("status", 0) == static_cast<int>(SliceStatus::Uploaded) ? SliceStatus::Uploaded
                                                                                         : SliceStatus::Pending;
        slice.sha1 = json.value("sha1", std::string{});
    }

    void to_json(nlohmann::json &json, const FileMeta &meta)
    {
        json = {
            {"file_id", meta.file_id},
            {"file_name", meta.file_name},
            {"file_type", meta.file_type},
            {"file_size", meta.file_size},
            {"chunk_size", meta.chunk_size},
            {"prefix", meta.prefix},
            {"storage", to_string(meta.storage)},
            {"created_at", meta.created_at},
            {"status", static_cast<int>(meta.status)},
            {"slices", meta.slices},
        };
    }

    void from_json(const nlohmann::json &json, FileMeta &meta)
    {
        meta.file_id = json.at("file_id").get<std::string>();
        meta.file_name = json.at("file_name").get<std::string>();
        meta.file_type = json.value("file_type", std::string{});
        meta.file_size = read_unsigned(json, "file_size");
        meta.chunk_size = read_unsigned(json, "chunk_size");
        meta.prefix = json.value("prefix", std::string{});
        const auto storage_label = json.value("storage", std::string{"sparse"});
        const auto storage = storage_mode_from_string(storage_label);
        if (!storage)
        {
            throw std::invalid_argument("Unknown storage mode: " + storage_label);
        }
        meta.storage = *storage;
        meta.created_at = json.value("created_at", std::int64_t{0});
        meta.status = json.value("status", 0) == static_cast<int>(SessionStatus::Complete) ? SessionStatus::Complete
                                                                                          : SessionStatus::Incomplete;
        meta.slices = json.value("slices", std::map<std::string, Slice>{});
    }

    std::uint64_t expected_slice_count(std::uint64_t file_size, std::uint64_t chunk_size) noexcept
    {
        if (chunk_size == 0)
        {
            return 0;
        }
        return file_size / chunk_size + (file_size % chunk_size != 0 ? 1 : 0);
    }

    std::string slice_key(std::uint64_t index)
    {
        return std::to_string(index);
    }

    std::optional<std::uint64_t> parse_slice_id(std::string_view value) noexcept
    {
        if (value.empty())
        {
            return std::nullopt;
        }
        std::uint64_t parsed{};
        const auto *end = value.data() + value.size();
        const auto [ptr, ec] = std::from_chars(value.data(), end, parsed);
        if (ec != std::errc{} || ptr != end)
        {
            return std::nullopt;
        }
        return parsed;
    }

    std::uint64_t slice_offset(const FileMeta &meta, std::uint64_t index) noexcept
    {
        return index * meta.chunk_size;
    }

    std::uint64_t slice_length(const FileMeta &meta, std::uint64_t index) noexcept
    {
        const auto offset = slice_offset(meta, index);
        if (offset >= meta.file_size)
        {
            return 0;
        }
        return std::min(meta.chunk_size, meta.file_size - offset);
    }

    FileMeta make_pending_meta(std::string file_id, std::string file_name, std::string file_type,
                               std::uint64_t file_size, std::uint64_t chunk_size, std::string prefix,
                               StorageMode storage, std::int64_t created_at)
    {
        FileMeta meta{
            .file_id = std::move(file_id),
            .file_name = std::move(file_name),
            .file_type = std::move(file_type),
            .file_size = file_size,
            .chunk_size = chunk_size,
            .prefix = std::move(prefix),
            .storage = storage,
            .created_at = created_at,
            .status = SessionStatus::Incomplete,
            .slices = {},
        };
        const auto count = expected_slice_count(file_size, chunk_size);
        for (std::uint64_t index = 0; index < count; ++index)
        {
            auto key = slice_key(index);
            meta.slices.emplace(key, Slice{.id = key, .status = SliceStatus::Pending, .sha1 = {}});
        }
        return meta;
    }

    bool all_slices_uploaded(const FileMeta &meta) noexcept
    {
        return std::all_of(meta.slices.begin(), meta.slices.end(), [](const auto &item)
                           { return item.second.status == SliceStatus::Uploaded; });
    }

    std::size_t uploaded_slice_count(const FileMeta &meta) noexcept
    {
        return static_cast<std::size_t>(std::count_if(meta.slices.begin(), meta.slices.end(), [](const auto &item)
                                                      { return item.second.status == SliceStatus::Uploaded; }));
    }

    std::vector<std::uint64_t> pending_slices(const FileMeta &meta)
    {
        std::vector<std::uint64_t> result;
        for (const auto &[key, slice] : meta.slices)
        {
            if (slice.status != SliceStatus::Pending)
            {
                continue;
            }
            if (auto index = parse_slice_id(key))
            {
                result.push_back(*index);
            }
        }
        std::sort(result.begin(), result.end());
        return result;
    }

    std::vector<std::uint64_t> slice_indices(const FileMeta &meta)
    {
        std::vector<std::uint64_t> result;
        result.reserve(meta.slices.size());
        for (const auto &item : meta.slices)
        {
            if (auto index = parse_slice_id(item.first))
            {
                result.push_back(*index);
            }
        }
        std::sort(result.begin(), result.end());
        return result;
    }

} // namespace sliceload
