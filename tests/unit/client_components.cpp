#include <atomic>
#include <cassert>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "sliceload/client/errors.hpp"
#include "sliceload/client/progress_store.hpp"
#include "sliceload/client/transport.hpp"
#include "sliceload/client/uploader.hpp"
#include "sliceload/crypto.hpp"
#include "sliceload/encoding/base64.hpp"
#include "sliceload/server/errors.hpp"
#include "sliceload/server/layout.hpp"
#include "sliceload/server/lock_registry.hpp"
#include "sliceload/server/session_store.hpp"
#include "sliceload/server/upload_service.hpp"
#include "test_helpers.hpp"

using namespace sliceload;
using namespace sliceload::client;
using sliceload::testing::TempDir;

namespace
{

    constexpr std::uint64_t kKiB = 1024;

    // Calls the upload service directly, translating its errors the way the
    // TCP transport does. `fail_slice` makes uploads of that slice fail.
    class InProcessTransport : public Transport
    {
    public:
        explicit InProcessTransport(server::UploadService &service) : service_(service) {}

        FileMeta create_session(const protocol::CreateSessionRequest &request) override
        {
            try
            {
                return service_.create_session(request);
            }
            catch (const server::UploadError &err)
            {
                throw RemoteError(err.code(), err.what());
            }
        }

        SliceAck upload_slice(const protocol::UploadSliceRequest &request) override
        {
            {
                std::lock_guard lock(mutex_);
                uploaded_.push_back(request.slice_id);
                if (fail_slice && *fail_slice == request.slice_id)
                {
                    throw RemoteError(ErrorCode::Timeout, "injected failure");
                }
            }
            const auto data = encoding::decode_base64(request.data_base64);
            if (!data)
            {
                throw RemoteError(ErrorCode::InvalidPayload, "Invalid slice data");
            }
            try
            {
                const auto receipt = service_.upload_slice(
                    server::SliceUpload{
                        .file_id = request.file_id,
                        .file_name = request.file_name,
                        .file_type = request.file_type,
                        .file_size = request.file_size,
                        .chunk_size = request.chunk_size,
                        .slice_id = request.slice_id,
                    },
                    *data);
                return SliceAck{
                    .complete = receipt.outcome == server::SliceOutcome::Completed,
                    .sha1 = receipt.sha1,
                };
            }
            catch (const server::UploadError &err)
            {
                throw RemoteError(err.code(), err.what());
            }
        }

        FileMeta fetch_meta(const std::string &file_id) override
        {
            try
            {
                return service_.session_meta(file_id);
            }
            catch (const server::UploadError &err)
            {
                throw RemoteError(err.code(), err.what());
            }
        }

        std::vector<std::string> uploaded()
        {
            std::lock_guard lock(mutex_);
            return uploaded_;
        }

        void reset_log()
        {
            std::lock_guard lock(mutex_);
            uploaded_.clear();
        }

        std::optional<std::string> fail_slice;

    private:
        server::UploadService &service_;
        std::mutex mutex_;
        std::vector<std::string> uploaded_;
    };

    struct Harness
    {
        Harness(const std::string &name, StorageMode default_storage = StorageMode::Sparse)
            : temp(name),
              layout(temp.path() / "cache", temp.path() / "uploads", temp.path() / "meta"),
              service(layout, locks, default_storage),
              transport(service),
              store(temp.path() / "progress") {}

        std::filesystem::path make_source(const std::string &file_name, std::size_t size, std::uint32_t seed)
        {
            const auto path = temp.path() / file_name;
            data = sliceload::testing::make_pattern(size, seed);
            sliceload::testing::write_file(path, data);
            return path;
        }

        TempDir temp;
        server::StorageLayout layout;
        server::SessionLockRegistry locks;
        server::UploadService service;
        InProcessTransport transport;
        ProgressStore store;
        std::vector<std::byte> data;
    };

    UploadOptions small_chunks(std::size_t concurrency = 4)
    {
        UploadOptions options;
        options.chunk_size = kKiB;
        options.concurrency = concurrency;
        return options;
    }

    void test_full_upload_with_pool()
    {
        for (const auto mode : {StorageMode::Discrete, StorageMode::Sparse})
        {
            Harness h("sliceload_client_full_" + std::string(to_string(mode)));
            const auto source = h.make_source("clip.mov", 8 * kKiB, 21);

            std::vector<Progress> progress;
            auto options = small_chunks(4);
            options.storage = mode;
            options.prefix = "clips";
            options.on_progress = [&](const Progress &p)
            { progress.push_back(p); };

            Uploader uploader(source, h.transport, h.store, options);
            assert(!uploader.meta());
            const auto meta = uploader.upload();

            assert(meta.slices.size() == 8);
            assert(all_slices_uploaded(meta));
            assert(meta.status == SessionStatus::Complete);
            assert(meta.storage == mode);
            assert(meta.file_type == ".mov");

            // Callbacks ran one at a time, each seeing one more finished slice.
            assert(progress.size() == 8);
            for (std::size_t i = 0; i < progress.size(); ++i)
            {
                assert(progress[i].finished_slices == i + 1);
                assert(progress[i].total_slices == 8);
            }

            const auto uploaded = h.transport.uploaded();
            assert(uploaded.size() == 8);
            assert(std::set<std::string>(uploaded.begin(), uploaded.end()).size() == 8);

            const auto destination = h.temp.path() / "uploads" / "clips" / "clip.mov";
            assert(crypto::hash_file(destination) == crypto::hash_bytes(h.data));

            const auto stored = h.store.load("clip.mov", 8 * kKiB);
            assert(stored.has_value());
            assert(all_slices_uploaded(*stored));

            const auto report = uploader.checksum();
            assert(report.checked == 8);
            assert(report.repaired == 0);

            uploader.clear_meta();
            assert(!uploader.meta());
            assert(!std::filesystem::exists(h.store.path_for("clip.mov", 8 * kKiB)));
        }
    }

    void test_resume_after_failure()
    {
        Harness h("sliceload_client_resume");
        const auto source = h.make_source("data.bin", 6 * kKiB + 10, 23);

        h.transport.fail_slice = "3";
        {
            Uploader uploader(source, h.transport, h.store, small_chunks(1));
            bool failed = false;
            try
            {
                uploader.upload();
            }
            catch (const RemoteError &err)
            {
                failed = true;
                assert(err.code() == ErrorCode::Timeout);
            }
            assert(failed);
            // Slices dispatch in index order on a single worker; the pool
            // stopped at the failing slice.
            assert(uploaded_slice_count(*uploader.meta()) == 3);
        }

        const auto persisted = h.store.load("data.bin", 6 * kKiB + 10);
        assert(persisted.has_value());
        assert(uploaded_slice_count(*persisted) == 3);
        assert(persisted->slices.at("3").status == SliceStatus::Pending);

        h.transport.fail_slice.reset();
        h.transport.reset_log();

        Uploader resumed(source, h.transport, h.store, small_chunks(3));
        assert(resumed.meta().has_value());
        assert(resumed.meta()->file_id == persisted->file_id);
        const auto meta = resumed.upload();
        assert(all_slices_uploaded(meta));

        // Only the pending slices went over the wire the second time.
        const auto uploaded = h.transport.uploaded();
        assert((std::set<std::string>(uploaded.begin(), uploaded.end()) == std::set<std::string>{"3", "4", "5", "6"}));

        const auto destination = h.temp.path() / "uploads" / "data.bin";
        assert(crypto::hash_file(destination) == crypto::hash_bytes(h.data));
    }

    void test_cancellation()
    {
        Harness h("sliceload_client_cancel");
        const auto source = h.make_source("c.bin", 5 * kKiB, 29);

        Uploader *active = nullptr;
        auto options = small_chunks(1);
        options.on_progress = [&](const Progress &progress)
        {
            if (progress.finished_slices == 2)
            {
                active->cancel();
            }
        };
        Uploader uploader(source, h.transport, h.store, options);
        active = &uploader;

        bool canceled = false;
        try
        {
            uploader.upload();
        }
        catch (const UserCanceledError &)
        {
            canceled = true;
        }
        assert(canceled);
        assert(uploaded_slice_count(*uploader.meta()) == 2);
        assert(h.transport.uploaded().size() == 2);

        // The request was consumed; the next call carries on.
        const auto meta = uploader.upload();
        assert(all_slices_uploaded(meta));
        assert(h.transport.uploaded().size() == 5);
        assert(crypto::hash_file(h.temp.path() / "uploads" / "c.bin") == crypto::hash_bytes(h.data));
    }

    void test_checksum_repairs_divergent_slices()
    {
        Harness h("sliceload_client_repair", StorageMode::Discrete);
        const auto source = h.make_source("r.bin", 4 * kKiB, 31);

        Uploader *active = nullptr;
        auto options = small_chunks(1);
        options.on_progress = [&](const Progress &progress)
        {
            if (progress.finished_slices == 2)
            {
                active->cancel();
            }
        };
        std::vector<Progress> checks;
        options.on_checksum_progress = [&](const Progress &progress)
        { checks.push_back(progress); };

        Uploader uploader(source, h.transport, h.store, options);
        active = &uploader;
        try
        {
            uploader.upload();
        }
        catch (const UserCanceledError &)
        {
        }
        assert(uploaded_slice_count(*uploader.meta()) == 2);

        // Make the server's record of slice 1 disagree with the local bytes.
        server::SessionStore documents(h.layout);
        auto working = *documents.load_working(uploader.meta()->file_id);
        working.slices.at("1").sha1 = std::string(64, '0');
        documents.save_working(working);

        h.transport.reset_log();
        const auto report = uploader.checksum();
        assert(report.checked == 4);
        // Slice 1 plus the two slices the server never received.
        assert(report.repaired == 3);
        const auto uploaded = h.transport.uploaded();
        assert((uploaded == std::vector<std::string>{"1", "2", "3"}));
        assert(checks.size() == 4);
        assert(checks.back().finished_slices == 4);

        assert(uploader.meta()->status == SessionStatus::Complete);
        assert(crypto::hash_file(h.temp.path() / "uploads" / "r.bin") == crypto::hash_bytes(h.data));
    }

    void test_checksum_mismatch_after_completion()
    {
        Harness h("sliceload_client_mismatch");
        const auto source = h.make_source("t.bin", 4 * kKiB, 37);

        Uploader uploader(source, h.transport, h.store, small_chunks(2));
        uploader.upload();

        // Corrupt slice 2 locally; the completed session refuses the re-upload.
        {
            std::fstream file(source, std::ios::binary | std::ios::in | std::ios::out);
            file.seekp(static_cast<std::streamoff>(2 * kKiB + 5));
            file.put(static_cast<char>(~std::to_integer<unsigned char>(h.data[2 * kKiB + 5])));
        }

        std::optional<std::string> failed_slice;
        try
        {
            uploader.checksum();
        }
        catch (const ChecksumMismatchError &err)
        {
            failed_slice = err.slice_id();
        }
        assert(failed_slice == "2");
        assert(uploader.meta()->slices.at("2").status == SliceStatus::Pending);
        assert(uploader.meta()->slices.at("1").status == SliceStatus::Uploaded);

        const auto persisted = h.store.load("t.bin", 4 * kKiB);
        assert(persisted.has_value());
        assert(persisted->slices.at("2").status == SliceStatus::Pending);
    }

    void test_create_rejection_surfaces()
    {
        Harness h("sliceload_client_reject");
        const auto source = h.make_source("x.bin", 4 * kKiB, 41);

        auto options = small_chunks();
        options.prefix = "../escape";
        Uploader uploader(source, h.transport, h.store, options);
        bool rejected = false;
        try
        {
            uploader.upload();
        }
        catch (const RemoteError &err)
        {
            rejected = true;
            assert(err.code() == ErrorCode::InvalidPayload);
            assert(err.http_status() == 400);
        }
        assert(rejected);
        assert(!uploader.meta());
        assert(!std::filesystem::exists(h.store.path_for("x.bin", 4 * kKiB)));
    }

    void test_progress_store()
    {
        TempDir temp("sliceload_progress_store");
        ProgressStore store(temp.path() / "nested" / "progress");

        assert(store.path_for("movie.mp4", 1234).filename() == "file_meta_movie.mp4_1234.json");
        assert(!store.load("movie.mp4", 1234));

        auto meta = make_pending_meta("abc123", "movie.mp4", ".mp4", 1234, 1024, "", StorageMode::Sparse, 1);
        meta.slices.at("0").status = SliceStatus::Uploaded;
        store.save(meta);

        const auto loaded = store.load("movie.mp4", 1234);
        assert(loaded.has_value());
        assert(loaded->file_id == "abc123");
        assert(loaded->slices.at("0").status == SliceStatus::Uploaded);

        {
            std::ofstream out(store.path_for("movie.mp4", 1234), std::ios::trunc);
            out << "{ truncated";
        }
        assert(!store.load("movie.mp4", 1234));

        store.save(meta);
        store.clear("movie.mp4", 1234);
        assert(!store.load("movie.mp4", 1234));
    }

} // namespace

void run_client_component_tests()
{
    test_progress_store();
    test_full_upload_with_pool();
    test_resume_after_failure();
    test_cancellation();
    test_checksum_repairs_divergent_slices();
    test_checksum_mismatch_after_completion();
    test_create_rejection_surfaces();
}
