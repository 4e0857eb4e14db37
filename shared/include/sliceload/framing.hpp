/**
 * SliceLoad - Length-prefixed JSON framing helpers.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <nlohmann/json.hpp>

namespace sliceload::protocol
{

    inline constexpr std::size_t kFrameHeaderSize = sizeof(std::uint32_t);

    // Upper bound on a single frame; a base64 slice of a 64 MiB chunk fits.
    inline constexpr std::uint32_t kMaxFrameSize = 96u * 1024u * 1024u;

    using FrameHeader = std::array<std::uint8_t, kFrameHeaderSize>;

    struct DecodedFrame
    {
        nlohmann::json message;
        std::size_t bytes_consumed{};
    };

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message);

    // Throws std::length_error when the announced payload exceeds kMaxFrameSize.
    std::uint32_t decode_frame_length(const FrameHeader &header);

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer);

} // namespace sliceload::protocol
