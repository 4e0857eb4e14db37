#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>

#include <csignal>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <thread>

#include <nlohmann/json.hpp>

#include "sliceload/client/config.hpp"
#include "sliceload/client/errors.hpp"
#include "sliceload/client/logger.hpp"
#include "sliceload/client/progress_store.hpp"
#include "sliceload/client/tcp_transport.hpp"
#include "sliceload/client/uploader.hpp"
#include "sliceload/crypto.hpp"
#include "sliceload/version.hpp"

namespace
{

    // Runs `on_interrupt` on SIGINT for as long as it lives.
    class InterruptWatcher
    {
    public:
        explicit InterruptWatcher(std::function<void()> on_interrupt)
            : signals_(io_context_, SIGINT), on_interrupt_(std::move(on_interrupt))
        {
            signals_.async_wait([this](const std::error_code &ec, int /*signal*/)
                                {
                if (!ec)
                {
                    on_interrupt_();
                } });
            thread_ = std::thread([this]()
                                  { io_context_.run(); });
        }

        ~InterruptWatcher()
        {
            std::error_code ec;
            signals_.cancel(ec);
            io_context_.stop();
            if (thread_.joinable())
            {
                thread_.join();
            }
        }

        InterruptWatcher(const InterruptWatcher &) = delete;
        InterruptWatcher &operator=(const InterruptWatcher &) = delete;

    private:
        asio::io_context io_context_;
        asio::signal_set signals_;
        std::function<void()> on_interrupt_;
        std::thread thread_;
    };

    int run_upload(const sliceload::client::ClientConfig &config, sliceload::client::Logger &logger)
    {
        using namespace sliceload::client;

        TcpTransport transport(config.host, config.port, logger);
        ProgressStore store(config.progress_dir.value_or(ProgressStore::default_directory()));

        UploadOptions options;
        options.chunk_size = config.chunk_size;
        options.prefix = config.prefix;
        options.concurrency = config.concurrency;
        options.storage = config.storage;
        options.on_progress = [](const Progress &progress)
        {
            std::cout << "\rUploaded " << progress.finished_slices << " / " << progress.total_slices << " slices"
                      << std::flush;
        };
        options.on_checksum_progress = [](const Progress &progress)
        {
            std::cout << "\rVerified " << progress.finished_slices << " / " << progress.total_slices << " slices"
                      << std::flush;
        };

        Uploader uploader(config.file, transport, store, std::move(options), &logger);
        if (uploader.meta())
        {
            std::cout << "Resuming upload " << uploader.meta()->file_id << std::endl;
        }

        {
            InterruptWatcher watcher([&uploader]()
                                     { uploader.cancel(); });
            const auto meta = uploader.upload();
            std::cout << std::endl
                      << "Upload " << meta.file_id << " finished" << std::endl;
        }

        if (config.verify)
        {
            const auto report = uploader.checksum();
            std::cout << std::endl
                      << "Checksum OK (" << report.checked << " slices, " << report.repaired << " repaired)"
                      << std::endl;
        }
        uploader.clear_meta();
        return EXIT_SUCCESS;
    }

    int run_meta(const sliceload::client::ClientConfig &config, sliceload::client::Logger &logger)
    {
        sliceload::client::TcpTransport transport(config.host, config.port, logger);
        const auto meta = transport.fetch_meta(config.file_id);
        std::cout << nlohmann::json(meta).dump(2) << std::endl;
        return EXIT_SUCCESS;
    }

} // namespace

int main(int argc, char *argv[])
{
    using namespace sliceload::client;

    ClientConfig config;
    try
    {
        config = parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << "SliceLoad client " << sliceload::version() << "\n"
                  << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    Logger logger(config.log_path);
    try
    {
        sliceload::crypto::ensure_sodium_init();
        switch (config.command)
        {
        case ClientCommand::Upload:
            return run_upload(config, logger);
        case ClientCommand::Meta:
            return run_meta(config, logger);
        }
    }
    catch (const UserCanceledError &ex)
    {
        std::cout << std::endl
                  << "Upload canceled; run the same command again to resume." << std::endl;
        logger.log("info", ex.what());
        return 130;
    }
    catch (const ChecksumMismatchError &ex)
    {
        std::cerr << std::endl
                  << "ERROR: checksum_mismatch" << std::endl
                  << ex.what() << std::endl;
        logger.log("error", ex.what());
        return EXIT_FAILURE;
    }
    catch (const RemoteError &ex)
    {
        std::cerr << std::endl
                  << "ERROR: " << sliceload::to_string(ex.code()) << " (" << ex.http_status() << ")" << std::endl
                  << ex.what() << std::endl;
        logger.log("error", ex.what());
        return EXIT_FAILURE;
    }
    catch (const std::exception &ex)
    {
        std::cerr << std::endl
                  << "ERROR: " << ex.what() << std::endl;
        logger.log("error", "fatal: ", ex.what());
        return EXIT_FAILURE;
    }
    return EXIT_FAILURE;
}
