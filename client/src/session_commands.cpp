#include "stompcli/client/session.hpp"

#include <memory>
#include <sstream>

#include <nlohmann/json.hpp>

#include "stompcli/client/transfer.hpp"
#include "stompcli/stats_listener.hpp"
#include "stompcli/version.hpp"

namespace stompcli::client
{

    namespace
    {

        std::string join_from(const std::vector<std::string> &args, std::size_t first)
        {
            std::string joined;
            for (std::size_t i = first; i < args.size(); ++i)
            {
                if (i > first)
                {
                    joined.push_back(' ');
                }
                joined += args[i];
            }
            return joined;
        }

    } // namespace

    void SessionController::handle_abort(const Args &)
    {
        if (!transaction_id_)
        {
            report(ErrorCode::StateConflict, "Not currently in a transaction");
            return;
        }
        print("Aborting " + *transaction_id_);
        connection_.abort(*transaction_id_);
        logger_.log("tx", "aborted ", *transaction_id_);
        transaction_id_.reset();
    }

    void SessionController::handle_ack(const Args &args)
    {
        if (args.size() < 2)
        {
            report(ErrorCode::Usage, "Expecting: ack <message-id>");
            return;
        }
        connection_.ack({{"message-id", args[1]}}, transaction_id_);
    }

    void SessionController::handle_begin(const Args &)
    {
        if (transaction_id_)
        {
            report(ErrorCode::StateConflict, "Currently in a transaction (" + *transaction_id_ + ")");
            return;
        }
        transaction_id_ = connection_.begin();
        print("Transaction id: " + *transaction_id_);
        logger_.log("tx", "began ", *transaction_id_);
    }

    void SessionController::handle_commit(const Args &)
    {
        if (!transaction_id_)
        {
            report(ErrorCode::StateConflict, "Not currently in a transaction");
            return;
        }
        print("Committing " + *transaction_id_);
        connection_.commit(*transaction_id_);
        logger_.log("tx", "committed ", *transaction_id_);
        transaction_id_.reset();
    }

    void SessionController::handle_disconnect(const Args &)
    {
        try
        {
            connection_.disconnect();
            logger_.log("info", "disconnected");
        }
        catch (const NotConnectedError &ex)
        {
            logger_.log("info", "disconnect ignored: ", ex.what());
        }
    }

    void SessionController::handle_help(const Args &args)
    {
        if (args.size() < 2)
        {
            std::ostringstream names;
            for (const auto &name : catalog_.list())
            {
                names << name << ' ';
            }
            print("Usage: help <command>, where command is one of the following:");
            print("    ");
            print(names.str());
            return;
        }
        const auto usage = catalog_.describe(args[1]);
        if (!usage)
        {
            report(ErrorCode::Usage, "There is no command \"" + args[1] + "\"");
            return;
        }
        print(std::string(*usage));
    }

    void SessionController::handle_send(const Args &args)
    {
        if (args.size() < 3)
        {
            report(ErrorCode::Usage, "Expecting: send <destination> <message>");
            return;
        }
        connection_.send(args[1], join_from(args, 2), transaction_id_, {});
    }

    void SessionController::handle_sendfile(const Args &args)
    {
        if (args.size() < 3)
        {
            report(ErrorCode::Usage, "Expecting: sendfile <destination> <filename>");
            return;
        }
        std::vector<std::byte> content;
        try
        {
            content = load_outbound_file(args[2]);
        }
        catch (const TransferError &ex)
        {
            report(ErrorCode::Resource, ex.what());
            return;
        }
        connection_.send(args[1], encode_payload(content), transaction_id_, {{"filename", args[2]}});
        logger_.log("transfer", "sent ", args[2], " (", content.size(), " bytes) to ", args[1]);
    }

    void SessionController::handle_stats(const Args &args)
    {
        if (args.size() < 2)
        {
            const auto stats = std::dynamic_pointer_cast<StatsListener>(connection_.get_listener(kStatsListenerName));
            if (!stats)
            {
                print("No stats available");
                return;
            }
            print(stats->to_string());
            logger_.log("stats", nlohmann::json(stats->snapshot()).dump());
            return;
        }
        if (args[1] == "on")
        {
            connection_.set_listener(kStatsListenerName, std::make_shared<StatsListener>());
            print("Statistics enabled");
        }
        else if (args[1] == "off")
        {
            connection_.remove_listener(kStatsListenerName);
            print("Statistics disabled");
        }
        else
        {
            report(ErrorCode::Usage, "Expecting: stats [on|off]");
        }
    }

    void SessionController::handle_subscribe(const Args &args)
    {
        if (args.size() < 2)
        {
            report(ErrorCode::Usage, "Expecting: subscribe <destination> [ack]");
            return;
        }
        auto ack = AckMode::Auto;
        if (args.size() > 2)
        {
            const auto mode = ack_mode_from_string(args[2]);
            if (!mode)
            {
                report(ErrorCode::Usage, "Expecting: subscribe <destination> [auto|client]");
                return;
            }
            ack = *mode;
            print("Subscribing to \"" + args[1] + "\" with acknowledge set to \"" + args[2] + "\"");
        }
        else
        {
            print("Subscribing to \"" + args[1] + "\" with auto acknowledge");
        }
        connection_.subscribe(args[1], ack);
    }

    void SessionController::handle_unsubscribe(const Args &args)
    {
        if (args.size() < 2)
        {
            report(ErrorCode::Usage, "Expecting: unsubscribe <destination>");
            return;
        }
        print("Unsubscribing from \"" + args[1] + "\"");
        connection_.unsubscribe(args[1]);
    }

    void SessionController::handle_version(const Args &)
    {
        print("stompcli version " + std::string(stompcli::version()));
    }

} // namespace stompcli::client
