#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

#include "sliceload/file_meta.hpp"
#include "sliceload/protocol.hpp"
#include "sliceload/server/layout.hpp"
#include "sliceload/server/lock_registry.hpp"
#include "sliceload/server/session_store.hpp"
#include "sliceload/server/slice_storage.hpp"

namespace sliceload::server
{

    inline constexpr std::uint64_t kMinChunkSize = 1024;
    inline constexpr std::uint64_t kMaxChunkSize = 64ULL * 1024 * 1024;

    // Attributes a client declares alongside every slice.
    struct SliceUpload
    {
        std::string file_id;
        std::string file_name;
        std::string file_type;
        std::uint64_t file_size{};
        std::uint64_t chunk_size{};
        std::string slice_id;
    };

    enum class SliceOutcome : std::uint8_t
    {
        Accepted,
        Completed
    };

    struct SliceReceipt
    {
        std::string slice_id;
        std::string sha1;
        SliceOutcome outcome{SliceOutcome::Accepted};
    };

    /**
     * Upload session state machine.
     *
     * Every slice write runs under the session's lock: read the document,
     * check the declared attributes, persist the bytes through the session's
     * storage strategy, re-read the document, mark the slice, write it back,
     * and, when no slice is pending anymore, merge and archive. Different
     * sessions never contend with each other.
     *
     * Failures are reported as UploadError.
     */
    class UploadService
    {
    public:
        UploadService(StorageLayout &layout, SessionLockRegistry &locks, StorageMode default_storage);

        FileMeta create_session(const protocol::CreateSessionRequest &request);

        SliceReceipt upload_slice(const SliceUpload &upload, std::span<const std::byte> data);

        // Working document while the session is open, archived copy afterwards.
        FileMeta session_meta(const std::string &file_id) const;

        // Drops open sessions with no activity for max_age. Returns the count.
        std::size_t reap_stale(std::chrono::seconds max_age);

    private:
        SliceStorage &storage_for(StorageMode mode);
        void complete_session(FileMeta meta, SliceStorage &storage);

        StorageLayout &layout_;
        SessionStore store_;
        SessionLockRegistry &locks_;
        DiscreteSliceStorage discrete_;
        SparseSliceStorage sparse_;
        StorageMode default_storage_;
    };

} // namespace sliceload::server
