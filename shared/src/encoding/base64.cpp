#include "sliceload/encoding/base64.hpp"

#include <array>
#include <cctype>
#include <cstdint>

namespace sliceload::encoding
{

    namespace
    {

        constexpr std::string_view kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
        constexpr std::int8_t kInvalid = -1;
        constexpr std::int8_t kPadding = -2;

        consteval auto make_decode_table()
        {
            std::array<std::int8_t, 256> table{};
            table.fill(kInvalid);
            for (std::size_t i = 0; i < kAlphabet.size(); ++i)
            {
                table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<std::int8_t>(i);
            }
            table[static_cast<unsigned char>('=')] = kPadding;
            return table;
        }

        constexpr auto kDecodeTable = make_decode_table();

        char sextet(std::uint32_t group, int shift)
        {
            return kAlphabet[(group >> shift) & 0x3Fu];
        }

    } // namespace

    std::string encode_base64(std::span<const std::byte> data)
    {
        std::string output;
        output.reserve(((data.size() + 2) / 3) * 4);

        std::size_t index = 0;
        for (; index + 3 <= data.size(); index += 3)
        {
            const auto group = (std::to_integer<std::uint32_t>(data[index]) << 16) |
                               (std::to_integer<std::uint32_t>(data[index + 1]) << 8) |
                               std::to_integer<std::uint32_t>(data[index + 2]);
            output.push_back(sextet(group, 18));
            output.push_back(sextet(group, 12));
            output.push_back(sextet(group, 6));
            output.push_back(sextet(group, 0));
        }

        const auto remaining = data.size() - index;
        if (remaining == 1)
        {
            const auto group = std::to_integer<std::uint32_t>(data[index]) << 16;
            output.push_back(sextet(group, 18));
            output.push_back(sextet(group, 12));
            output.append("==");
        }
        else if (remaining == 2)
        {
            const auto group = (std::to_integer<std::uint32_t>(data[index]) << 16) |
                               (std::to_integer<std::uint32_t>(data[index + 1]) << 8);
            output.push_back(sextet(group, 18));
            output.push_back(sextet(group, 12));
            output.push_back(sextet(group, 6));
            output.push_back('=');
        }

        return output;
    }

    std::optional<std::vector<std::byte>> decode_base64(std::string_view input)
    {
        std::vector<std::byte> output;
        output.reserve((input.size() * 3) / 4);

        std::uint32_t accumulator = 0;
        int bits_collected = 0;
        int symbols = 0;
        for (const char ch : input)
        {
            const auto c = static_cast<unsigned char>(ch);
            const auto value = kDecodeTable[c];
            if (value == kInvalid)
            {
                if (!std::isspace(c))
                {
                    return std::nullopt;
                }
                continue;
            }
            if (value == kPadding)
            {
                break;
            }
            ++symbols;
            accumulator = (accumulator << 6) | static_cast<std::uint32_t>(value);
            bits_collected += 6;
            if (bits_collected >= 8)
            {
                bits_collected -= 8;
                output.push_back(static_cast<std::byte>((accumulator >> bits_collected) & 0xFFu));
            }
        }

        if (symbols % 4 == 1)
        {
            return std::nullopt;
        }
        return output;
    }

} // namespace sliceload::encoding
