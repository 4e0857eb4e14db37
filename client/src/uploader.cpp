#include "sliceload/client/uploader.hpp"

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/post.hpp>
#include <asio/thread_pool.hpp>

#include <algorithm>
#include <deque>
#include <exception>
#include <fstream>
#include <functional>
#include <span>
#include <stdexcept>
#include <vector>

#include "sliceload/client/errors.hpp"
#include "sliceload/crypto.hpp"
#include "sliceload/encoding/base64.hpp"
#include "sliceload/protocol.hpp"

namespace sliceload::client
{

    namespace
    {

        constexpr std::string_view kDefaultFileType = "application/octet-stream";

        std::string file_type_for(const std::filesystem::path &file)
        {
            const auto extension = file.extension().string();
            return extension.empty() ? std::string(kDefaultFileType) : extension;
        }

        // Bookkeeping for one pool run; only touched on the calling thread.
        struct DispatchState
        {
            std::deque<std::uint64_t> queue;
            std::size_t in_flight{0};
            bool stopped{false};
            std::exception_ptr first_error;

            void fail(std::exception_ptr error)
            {
                if (!first_error)
                {
                    first_error = std::move(error);
                }
                stopped = true;
            }
        };

    } // namespace

    Uploader::Uploader(std::filesystem::path file, Transport &transport, ProgressStore &store, UploadOptions options,
                       Logger *logger)
        : file_(std::move(file)),
          transport_(transport),
          store_(store),
          options_(std::move(options)),
          logger_(logger)
    {
        if (!std::filesystem::is_regular_file(file_))
        {
            throw std::runtime_error("Local path is not a regular file: " + file_.string());
        }
        if (options_.concurrency == 0)
        {
            options_.concurrency = 1;
        }
        file_name_ = file_.filename().string();
        file_size_ = std::filesystem::file_size(file_);
        meta_ = store_.load(file_name_, file_size_);
        if (meta_)
        {
            log("resume", "found local progress for " + meta_->file_id + " (" +
                              std::to_string(uploaded_slice_count(*meta_)) + "/" +
                              std::to_string(meta_->slices.size()) + " slices)");
        }
    }

    void Uploader::ensure_session()
    {
        if (meta_)
        {
            return;
        }
        const protocol::CreateSessionRequest request{
            .file_name = file_name_,
            .file_type = file_type_for(file_),
            .file_size = file_size_,
            .chunk_size = options_.chunk_size,
            .prefix = options_.prefix,
            .storage = options_.storage,
        };
        auto created = transport_.create_session(request);
        store_.save(created);
        log("session", "created " + created.file_id + " with " + std::to_string(created.slices.size()) + " slices");
        meta_ = std::move(created);
    }

    FileMeta Uploader::upload()
    {
        ensure_session();

        DispatchState state;
        const auto pending = pending_slices(*meta_);
        state.queue.assign(pending.begin(), pending.end());
        if (state.queue.empty())
        {
            return *meta_;
        }

        // Workers only read these attributes; the slice map stays on this thread.
        auto session = *meta_;
        session.slices.clear();

        const auto concurrency = std::min<std::size_t>(options_.concurrency, state.queue.size());
        asio::io_context completions;
        auto work = asio::make_work_guard(completions);
        asio::thread_pool workers(concurrency);

        std::function<void()> fill = [&]()
        {
            while (!state.stopped && state.in_flight < concurrency && !state.queue.empty())
            {
                if (token_.consume())
                {
                    log("cancel", "upload canceled with " + std::to_string(state.queue.size()) + " slices not started");
                    state.fail(std::make_exception_ptr(UserCanceledError()));
                    break;
                }
                const auto index = state.queue.front();
                state.queue.pop_front();
                ++state.in_flight;
                asio::post(workers, [this, index, &session, &completions, &state, &fill]()
                           {
                    SliceAck ack;
                    std::exception_ptr error;
                    try
                    {
                        ack = send_slice(session, index);
                    }
                    catch (const std::exception &)
                    {
                        error = std::current_exception();
                    }
                    asio::post(completions, [this, index, ack, error, &state, &fill]()
                               {
                        --state.in_flight;
                        if (error)
                        {
                            state.fail(error);
                        }
                        else
                        {
                            try
                            {
                                mark_uploaded(index, ack);
                            }
                            catch (const std::exception &)
                            {
                                state.fail(std::current_exception());
                            }
                        }
                        fill(); }); });
            }
            if (state.in_flight == 0)
            {
                work.reset();
            }
        };

        fill();
        completions.run();
        workers.join();

        if (state.first_error)
        {
            std::rethrow_exception(state.first_error);
        }
        log("upload", "all " + std::to_string(meta_->slices.size()) + " slices of " + meta_->file_id + " uploaded");
        return *meta_;
    }

    SliceAck Uploader::send_slice(const FileMeta &session, std::uint64_t index) const
    {
        const auto offset = slice_offset(session, index);
        const auto length = slice_length(session, index);

        std::ifstream in(file_, std::ios::binary);
        if (!in.is_open())
        {
            throw std::runtime_error("Could not open local file " + file_.string());
        }
        std::vector<char> buffer(static_cast<std::size_t>(length));
        in.seekg(static_cast<std::streamoff>(offset));
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        if (static_cast<std::uint64_t>(in.gcount()) != length)
        {
            throw std::runtime_error("Local file is shorter than the session expects: " + file_.string());
        }

        const protocol::UploadSliceRequest request{
            .file_id = session.file_id,
            .file_name = session.file_name,
            .file_type = session.file_type,
            .file_size = session.file_size,
            .chunk_size = session.chunk_size,
            .slice_id = slice_key(index),
            .data_base64 = encoding::encode_base64(std::as_bytes(std::span(buffer.data(), buffer.size()))),
        };
        auto ack = transport_.upload_slice(request);
        if (logger_)
        {
            logger_->log("slice", session.file_id, " slice ", index, ack.complete ? " completed session" : " accepted");
        }
        return ack;
    }

    void Uploader::mark_uploaded(std::uint64_t index, const SliceAck &ack)
    {
        auto &slice = meta_->slices[slice_key(index)];
        slice.id = slice_key(index);
        slice.status = SliceStatus::Uploaded;
        slice.sha1 = ack.sha1;
        if (ack.complete)
        {
            meta_->status = SessionStatus::Complete;
        }
        store_.save(*meta_);
        if (options_.on_progress)
        {
            options_.on_progress(Progress{
                .finished_slices = uploaded_slice_count(*meta_),
                .total_slices = meta_->slices.size(),
            });
        }
    }

    ChecksumReport Uploader::checksum()
    {
        if (!meta_)
        {
            throw std::runtime_error("No upload session to verify for " + file_name_);
        }
        const auto remote = transport_.fetch_meta(meta_->file_id);

        std::ifstream in(file_, std::ios::binary);
        if (!in.is_open())
        {
            throw std::runtime_error("Could not open local file " + file_.string());
        }

        auto session = remote;
        session.slices.clear();

        ChecksumReport report;
        const auto indices = slice_indices(remote);
        for (const auto index : indices)
        {
            const auto key = slice_key(index);
            const auto local_hash = crypto::hash_range(in, slice_offset(remote, index), slice_length(remote, index));
            ++report.checked;

            const auto &remote_slice = remote.slices.at(key);
            if (remote_slice.sha1 != local_hash)
            {
                log("checksum", "slice " + key + " differs from the server copy, re-uploading");
                SliceAck ack;
                try
                {
                    ack = send_slice(session, index);
                }
                catch (const RemoteError &err)
                {
                    log("checksum", "re-upload of slice " + key + " rejected: " + err.what());
                    auto &slice = meta_->slices[key];
                    slice.id = key;
                    slice.status = SliceStatus::Pending;
                    slice.sha1.clear();
                    store_.save(*meta_);
                    throw ChecksumMismatchError(key);
                }
                mark_uploaded(index, ack);
                ++report.repaired;
            }

            if (options_.on_checksum_progress)
            {
                options_.on_checksum_progress(Progress{
                    .finished_slices = report.checked,
                    .total_slices = indices.size(),
                });
            }
        }

        log("checksum", std::to_string(report.checked) + " slices checked, " + std::to_string(report.repaired) +
                            " repaired");
        return report;
    }

    void Uploader::clear_meta()
    {
        meta_.reset();
        store_.clear(file_name_, file_size_);
    }

    void Uploader::log(const std::string &tag, const std::string &message) const
    {
        if (logger_)
        {
            logger_->log(tag, message);
        }
    }

} // namespace sliceload::client
