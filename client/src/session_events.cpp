#include "stompcli/client/session.hpp"

#include "stompcli/client/transfer.hpp"
#include "stompcli/crypto.hpp"

namespace stompcli::client
{

    void SessionController::on_connecting(const HostAndPort &host_and_port)
    {
        logger_.log("info", "connecting to ", host_and_port.host, ':', host_and_port.port);
        connection_.connect(true);
    }

    void SessionController::on_connected(const Headers &headers, const std::string &body)
    {
        logger_.log("event", "CONNECTED ", headers_to_json(headers).dump());
        presenter_.present("CONNECTED", headers, body);
    }

    void SessionController::on_disconnected()
    {
        logger_.log("event", "DISCONNECTED");
        presenter_.notice("lost connection");
    }

    void SessionController::on_message(const Headers &headers, const std::string &body)
    {
        logger_.log("event", "MESSAGE ", headers_to_json(headers).dump());
        const auto filename = find_header(headers, "filename");
        if (!filename)
        {
            presenter_.present("MESSAGE", headers, body);
            return;
        }

        try
        {
            const auto file = receive_file(*filename, body, unix_now(), receive_directory_);
            logger_.log("transfer", "saved ", file.resolved_name.string(), " (", file.content.size(),
                        " bytes, blake2b ", crypto::hash_bytes(file.content), ")");
            presenter_.present("MESSAGE", headers, "Saved file: " + file.resolved_name.string());
        }
        catch (const std::exception &ex)
        {
            logger_.log("error", to_string(ErrorCode::Resource), ": ", ex.what());
            presenter_.present("MESSAGE", headers, "Unable to save file " + *filename + ": " + ex.what());
        }
    }

    void SessionController::on_error(const Headers &headers, const std::string &body)
    {
        logger_.log("error", to_string(ErrorCode::Protocol), ": ", headers_to_json(headers).dump(), ' ', body);
        presenter_.present("ERROR", headers, body);
    }

    void SessionController::on_receipt(const Headers &headers, const std::string &body)
    {
        logger_.log("event", "RECEIPT ", headers_to_json(headers).dump());
        presenter_.present("RECEIPT", headers, body);
    }

} // namespace stompcli::client
