#include "sliceload/client/config.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

namespace sliceload::client
{

    namespace
    {

        constexpr const char *kUsage =
            "Usage: sliceload_client <server>:<port> upload <file> [--chunk-size N] [--prefix P]\n"
            "                        [--concurrency N] [--storage discrete|sparse] [--no-verify]\n"
            "                        [--progress-dir DIR] [--log FILE]\n"
            "       sliceload_client <server>:<port> meta <file_id> [--log FILE]";

        std::string require_value(int &index, int argc, char *argv[], const std::string &flag)
        {
            if (index >= argc)
            {
                throw std::runtime_error(flag + " requires a value");
            }
            return argv[index++];
        }

    } // namespace

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        if (argc < 4)
        {
            throw std::runtime_error(kUsage);
        }

        ClientConfig config;
        int index = 1;
        const std::string endpoint = argv[index++];

        const auto colon_pos = endpoint.rfind(':');
        if (colon_pos == std::string::npos || colon_pos == 0)
        {
            throw std::runtime_error("Expected endpoint format host:port");
        }
        config.host = endpoint.substr(0, colon_pos);
        const auto port_string = endpoint.substr(colon_pos + 1);
        try
        {
            config.port = static_cast<std::uint16_t>(std::stoi(port_string));
        }
        catch (const std::logic_error &)
        {
            throw std::runtime_error("Invalid port: " + port_string);
        }

        const std::string command = argv[index++];
        if (command == "upload")
        {
            config.command = ClientCommand::Upload;
            config.file = std::filesystem::path(argv[index++]);
        }
        else if (command == "meta")
        {
            config.command = ClientCommand::Meta;
            config.file_id = argv[index++];
        }
        else
        {
            throw std::runtime_error("Unknown command: " + command + "\n" + kUsage);
        }

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--log")
            {
                config.log_path = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--chunk-size")
            {
                config.chunk_size = static_cast<std::uint64_t>(std::stoull(require_value(index, argc, argv, arg)));
            }
            else if (arg == "--prefix")
            {
                config.prefix = require_value(index, argc, argv, arg);
            }
            else if (arg == "--concurrency")
            {
                config.concurrency = static_cast<std::size_t>(std::stoul(require_value(index, argc, argv, arg)));
                if (config.concurrency == 0)
                {
                    throw std::runtime_error("--concurrency must be at least 1");
                }
            }
            else if (arg == "--storage")
            {
                const auto value = require_value(index, argc, argv, arg);
                config.storage = storage_mode_from_string(value);
                if (!config.storage)
                {
                    throw std::runtime_error("Unknown storage mode: " + value);
                }
            }
            else if (arg == "--progress-dir")
            {
                config.progress_dir = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--no-verify")
            {
                config.verify = false;
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }

        return config;
    }

} // namespace sliceload::client
