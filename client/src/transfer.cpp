#include "stompcli/client/transfer.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iterator>
#include <utility>

#include "stompcli/encoding/base64.hpp"

namespace stompcli::client
{

    std::string encode_payload(std::span<const std::byte> content)
    {
        return encoding::encode_base64(content);
    }

    std::vector<std::byte> decode_payload(std::string_view text)
    {
        auto decoded = encoding::decode_base64(text);
        if (!decoded)
        {
            throw TransferError("payload is not valid base64");
        }
        return std::move(*decoded);
    }

    std::int64_t unix_now()
    {
        const auto now = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
    }

    std::filesystem::path resolve_received_name(const std::filesystem::path &requested, std::int64_t unix_seconds)
    {
        std::error_code ec;
        if (!std::filesystem::exists(std::filesystem::symlink_status(requested, ec)))
        {
            return requested;
        }
        auto resolved = requested;
        resolved += "." + std::to_string(unix_seconds);
        return resolved;
    }

    std::filesystem::path sanitize_received_name(std::string_view header_value)
    {
        const auto name = std::filesystem::path(header_value).filename();
        if (name.empty() || name == "." || name == "..")
        {
            throw TransferError("refusing to write file named '" + std::string(header_value) + "'");
        }
        return name;
    }

    TransferredFile receive_file(std::string_view filename_header, std::string_view body, std::int64_t unix_seconds,
                                 const std::filesystem::path &directory)
    {
        TransferredFile file;
        file.requested_name = directory / sanitize_received_name(filename_header);
        file.content = decode_payload(body);
        file.resolved_name = resolve_received_name(file.requested_name, unix_seconds);

        std::ofstream out(file.resolved_name, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            throw TransferError("unable to open " + file.resolved_name.string() + " for writing");
        }
        out.write(reinterpret_cast<const char *>(file.content.data()), static_cast<std::streamsize>(file.content.size()));
        out.close();
        if (!out)
        {
            throw TransferError("failed to write " + file.resolved_name.string());
        }
        return file;
    }

    std::vector<std::byte> load_outbound_file(const std::filesystem::path &path)
    {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec))
        {
            throw TransferError("File " + path.string() + " does not exist");
        }
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
        {
            throw TransferError("Unable to open " + path.string());
        }
        std::vector<char> raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (in.bad())
        {
            throw TransferError("Failed to read " + path.string());
        }
        std::vector<std::byte> content(raw.size());
        std::transform(raw.begin(), raw.end(), content.begin(), [](char c)
                       { return static_cast<std::byte>(c); });
        return content;
    }

} // namespace stompcli::client
