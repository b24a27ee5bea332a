#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace stompcli::encoding
{

    std::string encode_base64(std::span<const std::byte> data);

    // Whitespace is skipped, padding is optional. Returns nullopt on any other
    // character outside the standard alphabet or on a dangling 6-bit group.
    std::optional<std::vector<std::byte>> decode_base64(std::string_view input);

} // namespace stompcli::encoding
