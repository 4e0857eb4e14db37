#include "sliceload/crypto.hpp"

#include <algorithm>
#include <fstream>
#include <limits>
#include <mutex>
#include <stdexcept>
#include <vector>

#include <sodium.h>

namespace sliceload::crypto
{

    namespace
    {

        constexpr std::size_t kReadBufferSize = 64 * 1024;

        std::string to_hex(std::span<const unsigned char> data)
        {
            static constexpr char kHexDigits[] = "0123456789abcdef";
            std::string result;
            result.resize(data.size() * 2);
            for (std::size_t i = 0; i < data.size(); ++i)
            {
                const auto byte = data[i];
                result[2 * i] = kHexDigits[(byte >> 4) & 0x0F];
                result[2 * i + 1] = kHexDigits[byte & 0x0F];
            }
            return result;
        }

        void ensure_initialized_once()
        {
            static std::once_flag flag;
            std::call_once(flag, []()
                           {
                if (sodium_init() < 0)
                {
                    throw std::runtime_error("libsodium initialization failed");
                } });
        }

        class StreamingHash
        {
        public:
            StreamingHash()
            {
                ensure_initialized_once();
                if (crypto_generichash_init(&state_, nullptr, 0, crypto_generichash_BYTES) != 0)
                {
                    throw std::runtime_error("crypto_generichash_init failed");
                }
            }

            void update(const unsigned char *data, std::size_t size)
            {
                if (crypto_generichash_update(&state_, data, size) != 0)
                {
                    throw std::runtime_error("crypto_generichash_update failed");
                }
            }

            std::string finish()
            {
                std::vector<unsigned char> digest(crypto_generichash_BYTES);
                if (crypto_generichash_final(&state_, digest.data(), digest.size()) != 0)
                {
                    throw std::runtime_error("crypto_generichash_final failed");
                }
                return to_hex(digest);
            }

        private:
            crypto_generichash_state state_{};
        };

        std::string hash_limited(std::istream &input, std::uint64_t limit)
        {
            StreamingHash hash;
            std::vector<unsigned char> buffer(kReadBufferSize);
            std::uint64_t remaining = limit;
            while (input && remaining > 0)
            {
                const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, buffer.size()));
                input.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(want));
                const auto read_count = static_cast<std::size_t>(input.gcount());
                if (read_count == 0)
                {
                    break;
                }
                hash.update(buffer.data(), read_count);
                remaining -= read_count;
            }
            if (input.bad())
            {
                throw std::runtime_error("Read error while hashing stream");
            }
            return hash.finish();
        }

    } // namespace

    void ensure_sodium_init()
    {
        ensure_initialized_once();
    }

    std::string hash_bytes(std::span<const std::byte> data)
    {
        ensure_initialized_once();
        std::vector<unsigned char> digest(crypto_generichash_BYTES);
        if (crypto_generichash(digest.data(), digest.size(),
                               reinterpret_cast<const unsigned char *>(data.data()), data.size(), nullptr, 0) != 0)
        {
            throw std::runtime_error("crypto_generichash failed");
        }
        return to_hex(digest);
    }

    std::string hash_stream(std::istream &input)
    {
        return hash_limited(input, std::numeric_limits<std::uint64_t>::max());
    }

    std::string hash_range(std::istream &input, std::uint64_t offset, std::uint64_t length)
    {
        input.clear();
        input.seekg(static_cast<std::streamoff>(offset));
        if (!input)
        {
            throw std::runtime_error("Failed to seek to offset " + std::to_string(offset));
        }
        return hash_limited(input, length);
    }

    std::string hash_file(const std::filesystem::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            throw std::runtime_error("Failed to open file for hashing: " + path.string());
        }
        return hash_stream(file);
    }

    std::string random_hex(std::size_t byte_count)
    {
        ensure_initialized_once();
        std::vector<unsigned char> bytes(byte_count);
        randombytes_buf(bytes.data(), bytes.size());
        return to_hex(bytes);
    }

} // namespace sliceload::crypto
