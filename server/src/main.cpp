#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "sliceload/crypto.hpp"
#include "sliceload/server/config.hpp"
#include "sliceload/server/server.hpp"
#include "sliceload/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "SliceLoad server " << sliceload::version() << "\n"
                  << "Usage: " << program_name
                  << " --port <PORT> (--root <ROOT> | --cache-dir <DIR> --upload-dir <DIR> --meta-dir <DIR>)\n"
                     "       [--address <ADDRESS>] [--threads <N>] [--storage discrete|sparse]\n"
                     "       [--session-timeout <seconds>] [--log <FILE>] [--config <FILE>]\n";
    }

    std::optional<std::string> read_option(int &index, int argc, char *argv[])
    {
        if (index + 1 >= argc)
        {
            return std::nullopt;
        }
        ++index;
        return std::string(argv[index]);
    }

} // namespace

int main(int argc, char *argv[])
{
    using sliceload::server::Server;
    using sliceload::server::ServerConfig;

    ServerConfig config;
    std::optional<std::filesystem::path> root;

    // The config file is applied first so command line flags override it.
    for (int i = 1; i + 1 < argc; ++i)
    {
        if (std::string(argv[i]) == "--config")
        {
            try
            {
                sliceload::server::apply_config_file(config, argv[i + 1]);
            }
            catch (const std::exception &ex)
            {
                std::cerr << ex.what() << std::endl;
                return EXIT_FAILURE;
            }
        }
    }

    try
    {
        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--help" || arg == "-h")
            {
                print_usage(argv[0]);
                return EXIT_SUCCESS;
            }

            auto value = read_option(i, argc, argv);
            if (!value)
            {
                std::cerr << "Missing value for " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }

            if (arg == "--port")
            {
                config.port = static_cast<std::uint16_t>(std::stoi(*value));
            }
            else if (arg == "--root")
            {
                root = std::filesystem::path(*value);
            }
            else if (arg == "--address")
            {
                config.address = *value;
            }
            else if (arg == "--threads")
            {
                config.worker_threads = static_cast<std::size_t>(std::stoul(*value));
            }
            else if (arg == "--cache-dir")
            {
                config.slice_cache_dir = std::filesystem::path(*value);
            }
            else if (arg == "--upload-dir")
            {
                config.upload_dir = std::filesystem::path(*value);
            }
            else if (arg == "--meta-dir")
            {
                config.meta_dir = std::filesystem::path(*value);
            }
            else if (arg == "--storage")
            {
                const auto mode = sliceload::storage_mode_from_string(*value);
                if (!mode)
                {
                    std::cerr << "Unknown storage mode: " << *value << std::endl;
                    return EXIT_FAILURE;
                }
                config.default_storage = *mode;
            }
            else if (arg == "--session-timeout")
            {
                config.session_timeout = std::chrono::seconds(std::stoll(*value));
            }
            else if (arg == "--log")
            {
                config.log_file = std::filesystem::path(*value);
            }
            else if (arg == "--config")
            {
                continue;
            }
            else
            {
                std::cerr << "Unknown argument: " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }
        }
    }
    catch (const std::logic_error &ex)
    {
        // std::stoi and friends report malformed numbers this way.
        std::cerr << "Invalid numeric argument: " << ex.what() << std::endl;
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    if (root)
    {
        sliceload::server::apply_root(config, *root);
    }

    if (config.port == 0)
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        sliceload::server::validate(config);
    }
    catch (const std::invalid_argument &ex)
    {
        std::cerr << ex.what() << std::endl;
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::info);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        sliceload::crypto::ensure_sodium_init();
        spdlog::info("Starting SliceLoad server {} on {}:{}", sliceload::version(), config.address, config.port);

        Server server(std::move(config));
        server.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
