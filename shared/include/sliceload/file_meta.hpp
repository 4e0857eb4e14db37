/**
 * SliceLoad - Upload session document shared by server and client.
 *
 * A FileMeta is always read and written as a whole document. Slices are keyed
 * by their stringified index ("0".."N-1"); use the helpers below for numeric
 * ordering rather than iterating the map directly.
 */
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace sliceload
{

    enum class StorageMode : std::uint8_t
    {
        Discrete,
        Sparse
    };

    std::string_view to_string(StorageMode mode) noexcept;
    std::optional<StorageMode> storage_mode_from_string(std::string_view value) noexcept;

    enum class SliceStatus : int
    {
        Pending = 0,
        Uploaded = 1
    };

    enum class SessionStatus : int
    {
        Incomplete = 0,
        Complete = 1
    };

    struct Slice
    {
        std::string id;
        SliceStatus status{SliceStatus::Pending};
        // BLAKE2b-256 hex digest of the stored bytes (crypto::hash_bytes).
        // Only the "sha1" key name is historical: values never match SHA-1.
        std::string sha1;
    };

    void to_json(nlohmann::json &json, const Slice &slice);
    void from_json(const nlohmann::json &json, Slice &slice);

    struct FileMeta
    {
        std::string file_id;
        std::string file_name;
        std::string file_type;
        std::uint64_t file_size{};
        std::uint64_t chunk_size{};
        std::string prefix;
        StorageMode storage{StorageMode::Sparse};
        std::int64_t created_at{};
        SessionStatus status{SessionStatus::Incomplete};
        std::map<std::string, Slice> slices;
    };

    void to_json(nlohmann::json &json, const FileMeta &meta);
    void from_json(const nlohmann::json &json, FileMeta &meta);

    // ceil(file_size / chunk_size); zero when chunk_size is zero.
    std::uint64_t expected_slice_count(std::uint64_t file_size, std::uint64_t chunk_size) noexcept;

    std::string slice_key(std::uint64_t index);

    // Accepts only plain decimal digits, no sign or whitespace.
    std::optional<std::uint64_t> parse_slice_id(std::string_view value) noexcept;

    std::uint64_t slice_offset(const FileMeta &meta, std::uint64_t index) noexcept;

    // Length of slice `index`; the last slice may be shorter than chunk_size.
    std::uint64_t slice_length(const FileMeta &meta, std::uint64_t index) noexcept;

    // A fresh document with slices 0..N-1 all pending.
    FileMeta make_pending_meta(std::string file_id, std::string file_name, std::string file_type,
                               std::uint64_t file_size, std::uint64_t chunk_size, std::string prefix,
                               StorageMode storage, std::int64_t created_at);

    bool all_slices_uploaded(const FileMeta &meta) noexcept;

    std::size_t uploaded_slice_count(const FileMeta &meta) noexcept;

    // Pending slice indices in ascending numeric order.
    std::vector<std::uint64_t> pending_slices(const FileMeta &meta);

    // Every slice index in ascending numeric order.
    std::vector<std::uint64_t> slice_indices(const FileMeta &meta);

} // namespace sliceload
