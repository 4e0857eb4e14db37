#include "sliceload/server/upload_service.hpp"

#include <filesystem>
#include <optional>
#include <vector>

#include <spdlog/spdlog.h>

#include "sliceload/crypto.hpp"
#include "sliceload/server/errors.hpp"

namespace sliceload::server
{

    namespace
    {

        constexpr std::uint64_t kMaxSliceCount = 1ULL << 20;

        std::int64_t unix_now()
        {
            return std::chrono::duration_cast<std::chrono::seconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                .count();
        }

        void validate_create(const protocol::CreateSessionRequest &request)
        {
            if (!StorageLayout::is_safe_file_name(request.file_name))
            {
                throw UploadError(sliceload::ErrorCode::InvalidPayload, "file_name must be a plain file name");
            }
            if (request.file_type.empty())
            {
                throw UploadError(sliceload::ErrorCode::InvalidPayload, "file_type is required");
            }
            if (request.file_size == 0)
            {
                throw UploadError(sliceload::ErrorCode::InvalidPayload, "file_size must be positive");
            }
            if (request.chunk_size < kMinChunkSize || request.chunk_size > kMaxChunkSize)
            {
                throw UploadError(sliceload::ErrorCode::InvalidPayload,
                                  "chunk_size must be between " + std::to_string(kMinChunkSize) + " and " +
                                      std::to_string(kMaxChunkSize));
            }
            if (!StorageLayout::is_safe_prefix(request.prefix))
            {
                throw UploadError(sliceload::ErrorCode::InvalidPayload, "prefix must not contain '..'");
            }
            if (expected_slice_count(request.file_size, request.chunk_size) > kMaxSliceCount)
            {
                throw UploadError(sliceload::ErrorCode::InvalidPayload, "Too many slices, raise chunk_size");
            }
        }

        std::optional<std::int64_t> write_stamp(const std::filesystem::path &path)
        {
            std::error_code ec;
            const auto written = std::filesystem::last_write_time(path, ec);
            if (ec)
            {
                return std::nullopt;
            }
            const auto system_time = std::chrono::time_point_cast<std::chrono::seconds>(
                written - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
            return system_time.time_since_epoch().count();
        }

        // A session's last activity is its working document's last rewrite,
        // which every accepted slice performs. Without a document, age the
        // directory itself: it may belong to a create_session call that has
        // not written its document yet.
        bool is_stale(const StorageLayout &layout, const std::string &file_id, std::int64_t cutoff)
        {
            auto stamp = write_stamp(layout.working_meta_path(file_id));
            if (!stamp)
            {
                stamp = write_stamp(layout.session_dir(file_id));
            }
            return stamp && *stamp < cutoff;
        }

        bool matches_session(const SliceUpload &upload, const FileMeta &meta)
        {
            return upload.file_name == meta.file_name && upload.file_type == meta.file_type &&
                   upload.file_size == meta.file_size && upload.chunk_size == meta.chunk_size;
        }

    } // namespace

    UploadService::UploadService(StorageLayout &layout, SessionLockRegistry &locks, StorageMode default_storage)
        : layout_(layout),
          store_(layout),
          locks_(locks),
          discrete_(layout),
          sparse_(layout),
          default_storage_(default_storage) {}

    FileMeta UploadService::create_session(const protocol::CreateSessionRequest &request)
    {
        validate_create(request);

        const auto file_id = layout_.allocate_session();
        auto meta = make_pending_meta(file_id, request.file_name, request.file_type, request.file_size,
                                      request.chunk_size, request.prefix, request.storage.value_or(default_storage_),
                                      unix_now());
        try
        {
            store_.save_working(meta);
        }
        catch (const std::exception &)
        {
            std::error_code ec;
            std::filesystem::remove_all(layout_.session_dir(file_id), ec);
            throw;
        }

        spdlog::info("Created session {} for {} ({} bytes, {} slices of {}, {} storage)", file_id, meta.file_name,
                     meta.file_size, meta.slices.size(), meta.chunk_size, to_string(meta.storage));
        return meta;
    }

    SliceReceipt UploadService::upload_slice(const SliceUpload &upload, std::span<const std::byte> data)
    {
        const auto index = parse_slice_id(upload.slice_id);
        if (!index)
        {
            throw UploadError(sliceload::ErrorCode::InvalidPayload, "slice_id must be a decimal index");
        }
        if (!StorageLayout::is_valid_session_id(upload.file_id))
        {
            throw UploadError(sliceload::ErrorCode::Conflict, "Unknown upload session");
        }

        auto guard = locks_.acquire(upload.file_id);

        const auto current = store_.load_working(upload.file_id);
        if (!current)
        {
            spdlog::warn("Slice {} for unknown or completed session {}", upload.slice_id, upload.file_id);
            throw UploadError(sliceload::ErrorCode::Conflict, "Unknown or already completed upload session");
        }
        if (!matches_session(upload, *current))
        {
            spdlog::warn("Slice {} for session {} declares {} ({}, {} bytes, chunk {}) but session holds {} ({}, {} "
                         "bytes, chunk {})",
                         upload.slice_id, upload.file_id, upload.file_name, upload.file_type, upload.file_size,
                         upload.chunk_size, current->file_name, current->file_type, current->file_size,
                         current->chunk_size);
            throw UploadError(sliceload::ErrorCode::Conflict, "Declared file attributes do not match the session");
        }

        const auto key = slice_key(*index);
        if (current->slices.find(key) == current->slices.end())
        {
            throw UploadError(sliceload::ErrorCode::InvalidPayload,
                              "slice_id " + key + " is outside 0.." + std::to_string(current->slices.size() - 1));
        }
        const auto expected_length = slice_length(*current, *index);
        if (data.size() != expected_length)
        {
            throw UploadError(sliceload::ErrorCode::InvalidPayload,
                              "Slice " + key + " carries " + std::to_string(data.size()) + " bytes, expected " +
                                  std::to_string(expected_length));
        }

        const auto hash = sliceload::crypto::hash_bytes(data);
        auto &storage = storage_for(current->storage);
        storage.write_slice(*current, *index, hash, data);

        auto fresh = store_.load_working(upload.file_id);
        if (!fresh)
        {
            throw UploadError(sliceload::ErrorCode::InternalError, "Session document disappeared during slice write");
        }
        fresh->slices[key] = Slice{.id = key, .status = SliceStatus::Uploaded, .sha1 = hash};
        store_.save_working(*fresh);

        spdlog::debug("Session {} stored slice {} ({} bytes, {}/{})", upload.file_id, key, data.size(),
                      uploaded_slice_count(*fresh), fresh->slices.size());

        if (!all_slices_uploaded(*fresh))
        {
            return SliceReceipt{.slice_id = key, .sha1 = hash, .outcome = SliceOutcome::Accepted};
        }

        complete_session(std::move(*fresh), storage);
        return SliceReceipt{.slice_id = key, .sha1 = hash, .outcome = SliceOutcome::Completed};
    }

    FileMeta UploadService::session_meta(const std::string &file_id) const
    {
        if (!StorageLayout::is_valid_session_id(file_id))
        {
            throw UploadError(sliceload::ErrorCode::NotFound, "Session not found");
        }
        // A session completing between the two reads has already been archived
        // by the time its working document disappears.
        if (auto working = store_.load_working(file_id))
        {
            return *working;
        }
        if (auto archived = store_.load_archived(file_id))
        {
            return *archived;
        }
        spdlog::warn("Meta requested for unknown session {}", file_id);
        throw UploadError(sliceload::ErrorCode::NotFound, "Session not found");
    }

    std::size_t UploadService::reap_stale(std::chrono::seconds max_age)
    {
        const auto cutoff = unix_now() - max_age.count();

        std::vector<std::string> candidates;
        std::error_code ec;
        for (std::filesystem::directory_iterator it(layout_.cache_root(), ec), end; !ec && it != end; it.increment(ec))
        {
            const auto file_id = it->path().filename().string();
            if (it->is_directory() && StorageLayout::is_valid_session_id(file_id))
            {
                candidates.push_back(file_id);
            }
        }
        if (ec)
        {
            spdlog::warn("Failed to scan slice cache {}: {}", layout_.cache_root().string(), ec.message());
        }

        std::size_t reaped = 0;
        for (const auto &file_id : candidates)
        {
            // First pass without the lock: documents are replaced by rename, so
            // the stamp is always that of a whole write. Only candidates that
            // look stale are locked and checked again.
            const auto dir = layout_.session_dir(file_id);
            if (!is_stale(layout_, file_id, cutoff))
            {
                continue;
            }
            auto guard = locks_.acquire(file_id);
            if (!is_stale(layout_, file_id, cutoff))
            {
                // Completed meanwhile: drop the entry this pass just created.
                if (!std::filesystem::exists(dir))
                {
                    locks_.release(file_id);
                }
                continue;
            }
            std::error_code remove_ec;
            std::filesystem::remove_all(dir, remove_ec);
            if (remove_ec)
            {
                spdlog::warn("Failed to reap session {}: {}", file_id, remove_ec.message());
                continue;
            }
            locks_.release(file_id);
            ++reaped;
            spdlog::info("Reaped stale session {}", file_id);
        }
        return reaped;
    }

    SliceStorage &UploadService::storage_for(StorageMode mode)
    {
        if (mode == StorageMode::Discrete)
        {
            return discrete_;
        }
        return sparse_;
    }

    void UploadService::complete_session(FileMeta meta, SliceStorage &storage)
    {
        storage.on_all_slices_uploaded(meta);

        meta.status = SessionStatus::Complete;
        store_.archive(meta);
        std::filesystem::remove_all(layout_.session_dir(meta.file_id));
        locks_.release(meta.file_id);

        spdlog::info("Session {} complete: {} ({} bytes) at {}", meta.file_id, meta.file_name, meta.file_size,
                     layout_.destination_path(meta).string());
    }

} // namespace sliceload::server
