#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include "sliceload/client/errors.hpp"
#include "sliceload/client/logger.hpp"
#include "sliceload/client/progress_store.hpp"
#include "sliceload/client/tcp_transport.hpp"
#include "sliceload/client/uploader.hpp"
#include "sliceload/crypto.hpp"
#include "sliceload/server/config.hpp"
#include "sliceload/server/server.hpp"
#include "test_helpers.hpp"

using namespace sliceload;
using sliceload::testing::TempDir;

namespace
{

    void test_upload_over_tcp()
    {
        TempDir temp("sliceload_e2e");

        server::ServerConfig config;
        config.address = "127.0.0.1";
        config.port = 0;
        config.worker_threads = 2;
        server::apply_root(config, temp.path() / "server");
        config.default_storage = StorageMode::Discrete;

        server::Server srv(config);
        const auto port = srv.port();
        assert(port != 0);
        std::thread server_thread([&srv]
                                  { srv.run(); });

        {
            client::Logger logger(temp.path() / "client.log");
            client::TcpTransport transport("127.0.0.1", port, logger);
            transport.ping();

            const auto source = temp.path() / "payload.bin";
            const auto data = sliceload::testing::make_pattern(20 * 1024 + 123, 43);
            sliceload::testing::write_file(source, data);

            client::ProgressStore store(temp.path() / "progress");
            client::UploadOptions options;
            options.chunk_size = 2048;
            options.concurrency = 3;
            options.prefix = "incoming";

            client::Uploader uploader(source, transport, store, options, &logger);
            const auto meta = uploader.upload();
            assert(meta.slices.size() == 11);
            assert(all_slices_uploaded(meta));
            assert(meta.storage == StorageMode::Discrete);

            const auto report = uploader.checksum();
            assert(report.checked == 11);
            assert(report.repaired == 0);

            const auto remote = transport.fetch_meta(meta.file_id);
            assert(remote.status == SessionStatus::Complete);

            const auto destination = config.upload_dir / "incoming" / "payload.bin";
            assert(std::filesystem::exists(destination));
            assert(crypto::hash_file(destination) == crypto::hash_bytes(data));
            assert(std::filesystem::exists(config.meta_dir / (meta.file_id + ".meta.json")));

            std::optional<ErrorCode> missing;
            try
            {
                (void)transport.fetch_meta("00000000000000000000000000000000");
            }
            catch (const client::RemoteError &err)
            {
                missing = err.code();
            }
            assert(missing == ErrorCode::NotFound);

            std::optional<ErrorCode> rejected;
            try
            {
                (void)transport.create_session(protocol::CreateSessionRequest{
                    .file_name = "x.bin",
                    .file_type = ".bin",
                    .file_size = 10,
                    .chunk_size = 10,
                    .prefix = "",
                    .storage = std::nullopt,
                });
            }
            catch (const client::RemoteError &err)
            {
                rejected = err.code();
            }
            assert(rejected == ErrorCode::InvalidPayload);
        }

        srv.stop();
        server_thread.join();
    }

} // namespace

void run_end_to_end_tests()
{
    test_upload_over_tcp();
}
