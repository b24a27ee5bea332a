#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace stompcli::client
{

    class TransferError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    struct TransferredFile
    {
        std::filesystem::path requested_name;
        std::filesystem::path resolved_name;
        std::vector<std::byte> content;
    };

    std::string encode_payload(std::span<const std::byte> content);

    // Throws TransferError when the text is not valid base64.
    std::vector<std::byte> decode_payload(std::string_view text);

    std::int64_t unix_now();

    // An existing file is never overwritten: the reception time is appended
    // as an extra extension instead. Two receptions of the same name within
    // one second resolve to the same path.
    std::filesystem::path resolve_received_name(const std::filesystem::path &requested, std::int64_t unix_seconds);

    // Keeps only the last component of a received filename header.
    std::filesystem::path sanitize_received_name(std::string_view header_value);

    TransferredFile receive_file(std::string_view filename_header, std::string_view body, std::int64_t unix_seconds,
                                 const std::filesystem::path &directory = {});

    std::vector<std::byte> load_outbound_file(const std::filesystem::path &path);

} // namespace stompcli::client
