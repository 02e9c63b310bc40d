#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>

namespace mmlive {

/// Raw audio / media bytes after transport decoding.
using ByteBuffer = std::vector<std::uint8_t>;

/// Standard alphabet, padded output.
[[nodiscard]] std::string base64_encode(std::span<const std::uint8_t> data);

/// Standard alphabet. Padding is optional and ASCII whitespace is skipped;
/// any other character outside the alphabet is an error.
[[nodiscard]] tl::expected<ByteBuffer, std::string> base64_decode(std::string_view encoded);

}  // namespace mmlive
