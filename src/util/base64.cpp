#include "mmlive/util/base64.hpp"

#include <array>

namespace mmlive {

namespace {

constexpr std::string_view kAlphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr std::uint8_t kInvalid = 0xFF;

constexpr std::array<std::uint8_t, 256> make_decode_table() {
    std::array<std::uint8_t, 256> table{};
    for (auto& entry : table) {
        entry = kInvalid;
    }
    for (std::size_t i = 0; i < kAlphabet.size(); ++i) {
        table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<std::uint8_t>(i);
    }
    return table;
}

constexpr auto kDecodeTable = make_decode_table();

[[nodiscard]] constexpr bool is_space(char c) noexcept {
    return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

}  // namespace

std::string base64_encode(std::span<const std::uint8_t> data) {
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);

    std::size_t i = 0;
    for (; i + 2 < data.size(); i += 3) {
        const std::uint32_t triple = (static_cast<std::uint32_t>(data[i]) << 16)
                                   | (static_cast<std::uint32_t>(data[i + 1]) << 8)
                                   | static_cast<std::uint32_t>(data[i + 2]);
        out.push_back(kAlphabet[(triple >> 18) & 0x3F]);
        out.push_back(kAlphabet[(triple >> 12) & 0x3F]);
        out.push_back(kAlphabet[(triple >> 6) & 0x3F]);
        out.push_back(kAlphabet[triple & 0x3F]);
    }

    const std::size_t remaining = data.size() - i;
    if (remaining == 1) {
        const std::uint32_t triple = static_cast<std::uint32_t>(data[i]) << 16;
        out.push_back(kAlphabet[(triple >> 18) & 0x3F]);
        out.push_back(kAlphabet[(triple >> 12) & 0x3F]);
        out.append("==");
    } else if (remaining == 2) {
        const std::uint32_t triple = (static_cast<std::uint32_t>(data[i]) << 16)
                                   | (static_cast<std::uint32_t>(data[i + 1]) << 8);
        out.push_back(kAlphabet[(triple >> 18) & 0x3F]);
        out.push_back(kAlphabet[(triple >> 12) & 0x3F]);
        out.push_back(kAlphabet[(triple >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

tl::expected<ByteBuffer, std::string> base64_decode(std::string_view encoded) {
    ByteBuffer out;
    out.reserve((encoded.size() / 4) * 3);

    std::uint32_t accumulator = 0;
    int bits = 0;
    bool seen_padding = false;

    for (const char c : encoded) {
        if (is_space(c)) {
            continue;
        }
        if (c == '=') {
            seen_padding = true;
            continue;
        }
        if (seen_padding) {
            return tl::unexpected(std::string("base64: data after padding"));
        }

        const std::uint8_t value = kDecodeTable[static_cast<unsigned char>(c)];
        if (value == kInvalid) {
            return tl::unexpected(std::string("base64: invalid character '") + c + "'");
        }

        accumulator = (accumulator << 6) | value;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<std::uint8_t>((accumulator >> bits) & 0xFF));
        }
    }

    // A lone trailing sextet cannot encode a whole byte.
    if (bits >= 6) {
        return tl::unexpected(std::string("base64: truncated input"));
    }
    return out;
}

}  // namespace mmlive
