#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include "sliceload/client/cancellation.hpp"
#include "sliceload/client/logger.hpp"
#include "sliceload/client/progress_store.hpp"
#include "sliceload/client/transport.hpp"
#include "sliceload/file_meta.hpp"

namespace sliceload::client
{

    struct Progress
    {
        std::size_t finished_slices{};
        std::size_t total_slices{};
    };

    struct ChecksumReport
    {
        std::size_t checked{};
        std::size_t repaired{};
    };

    struct UploadOptions
    {
        std::uint64_t chunk_size{10ULL * 1024 * 1024};
        std::string prefix;
        std::size_t concurrency{4};
        // Unset lets the server pick its default strategy.
        std::optional<StorageMode> storage;
        std::function<void(const Progress &)> on_progress;
        std::function<void(const Progress &)> on_checksum_progress;
    };

    /**
     * Resumable upload of one local file.
     *
     * A locally persisted session document for the same (name, size) is
     * picked up on construction; upload() then sends only the slices still
     * pending in it. Slices run on a bounded worker pool while every update
     * of the local document happens on the calling thread.
     *
     * No call retries on its own: after a failure, calling upload() again
     * resumes from the persisted progress.
     */
    class Uploader
    {
    public:
        Uploader(std::filesystem::path file, Transport &transport, ProgressStore &store, UploadOptions options = {},
                 Logger *logger = nullptr);

        // Throws the first slice failure, or UserCanceledError when cancel()
        // was observed before a slice started.
        FileMeta upload();

        // Compares every slice of the server's document against the local
        // file and re-uploads mismatches. Throws ChecksumMismatchError when a
        // re-upload is rejected; that slice is left pending locally.
        ChecksumReport checksum();

        void cancel() noexcept { token_.cancel(); }

        // Forgets the local session document.
        void clear_meta();

        const std::optional<FileMeta> &meta() const noexcept { return meta_; }

    private:
        void ensure_session();
        SliceAck send_slice(const FileMeta &session, std::uint64_t index) const;
        void mark_uploaded(std::uint64_t index, const SliceAck &ack);
        void log(const std::string &tag, const std::string &message) const;

        std::filesystem::path file_;
        std::string file_name_;
        std::uint64_t file_size_{};
        Transport &transport_;
        ProgressStore &store_;
        UploadOptions options_;
        Logger *logger_;
        CancellationToken token_;
        std::optional<FileMeta> meta_;
    };

} // namespace sliceload::client
