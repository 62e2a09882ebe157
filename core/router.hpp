// filename: core/router.hpp
#pragma once
#include <core/broker_context.hpp>
#include <core/channel_registry.hpp>
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

// Reply to one routed request. Empty fields are still serialized so every
// reply has the same four keys.
struct Response {
    nlohmann::json data = nlohmann::json::object();
    std::string message;
    std::string error;
    std::string message_id;

    nlohmann::json to_json() const;

    // Wire form. Invalid UTF-8 (an operation name taken from a raw HTTP
    // target, say) is replaced with U+FFFD instead of throwing.
    std::string dump() const;
};

enum class Operation {Register, Send, Read, Confirm, Purge, Stats};

// Accepts the canonical names and their aliases (publish, consume,
// acknowledge). A single leading '/' is ignored so HTTP paths map directly.
std::optional<Operation> parse_operation(std::string_view name);

// Maps an operation name plus a JSON request body onto ChannelRegistry
// calls. Holds no state of its own besides the references it was built with.
class Router {
public:
    Router(ChannelRegistry& registry, std::shared_ptr<BrokerContext> ctx);

    Response route(std::string_view operation, const nlohmann::json& body);

    // Parses `raw_body` first; an empty body is treated as {}.
    Response dispatch(std::string_view operation, std::string_view raw_body);

private:
    Response do_register(const nlohmann::json& body);
    Response do_send(const nlohmann::json& body);
    Response do_read(const nlohmann::json& body);
    Response do_confirm(const nlohmann::json& body);
    Response do_purge(const nlohmann::json& body);
    Response do_stats(const nlohmann::json& body);

    Response fail(boost::system::error_code ec, const std::string& detail);

    ChannelRegistry& registry_;
    std::shared_ptr<BrokerContext> ctx_;
};
