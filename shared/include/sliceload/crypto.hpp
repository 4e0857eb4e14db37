/**
 * SliceLoad - Content digests and random identifiers built on libsodium.
 *
 * Digests are BLAKE2b (crypto_generichash) rendered as lowercase hex. The
 * same helpers are used by the server when a slice arrives and by the client
 * when it verifies its local file, so both sides agree byte for byte.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <span>
#include <string>

namespace sliceload::crypto
{

    void ensure_sodium_init();

    std::string hash_bytes(std::span<const std::byte> data);

    std::string hash_stream(std::istream &input);

    // Hashes at most `length` bytes starting at `offset`; a range running past
    // the end of the stream is truncated like a short final slice.
    std::string hash_range(std::istream &input, std::uint64_t offset, std::uint64_t length);

    std::string hash_file(const std::filesystem::path &path);

    // `byte_count` random bytes as hex (two characters per byte).
    std::string random_hex(std::size_t byte_count);

} // namespace sliceload::crypto
