// filename: src/router.cpp
#include <core/router.hpp>
#include <iostream>

namespace {

constexpr const char* kChannelField = "channel";
constexpr const char* kMessageIdField = "message_id";
constexpr const char* kDataField = "data";

nlohmann::json stats_json(const ChannelStats& s) {
    return {
        {"ready_messages", s.ready},
        {"unacked_messages", s.unacked},
        {"total", s.total()}
    };
}

// A missing or non-string field leaves `out` untouched and returns false.
bool string_field(const nlohmann::json& body, const char* key, std::string& out) {
    auto it = body.find(key);
    if (it == body.end() || !it->is_string()) return false;
    out = it->get<std::string>();
    return true;
}

std::string required(const char* key) {
    return std::string("Field '") + key + "' is required and must be a string";
}

} // namespace

nlohmann::json Response::to_json() const {
    return {
        {"data", data},
        {"message", message},
        {"error", error},
        {"message_id", message_id}
    };
}

std::string Response::dump() const {
    return to_json().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<Operation> parse_operation(std::string_view name) {
    if (!name.empty() && name.front() == '/') name.remove_prefix(1);
    if (name == "register") return Operation::Register;
    if (name == "send" || name == "publish") return Operation::Send;
    if (name == "read" || name == "consume") return Operation::Read;
    if (name == "confirm" || name == "acknowledge") return Operation::Confirm;
    if (name == "purge") return Operation::Purge;
    if (name == "stats") return Operation::Stats;
    return std::nullopt;
}

Router::Router(ChannelRegistry& registry, std::shared_ptr<BrokerContext> ctx)
    : registry_(registry),
      ctx_(ctx ? std::move(ctx) : std::make_shared<BrokerContext>())
{}

Response Router::dispatch(std::string_view operation, std::string_view raw_body) {
    if (!parse_operation(operation) ||
        raw_body.find_first_not_of(" \t\r\n") == std::string_view::npos) {
        return route(operation, nlohmann::json::object());
    }
    auto body = nlohmann::json::parse(raw_body.begin(), raw_body.end(), nullptr, false);
    if (body.is_discarded()) {
        ctx_->metrics.requests.fetch_add(1, std::memory_order_relaxed);
        return fail(broker_errc::invalid_request, "Request body is not valid JSON");
    }
    return route(operation, body);
}

Response Router::route(std::string_view operation, const nlohmann::json& body) {
    ctx_->metrics.requests.fetch_add(1, std::memory_order_relaxed);

    auto op = parse_operation(operation);
    if (!op) {
        return fail(broker_errc::unknown_operation,
                    "Unknown operation '" + std::string(operation) + "'");
    }
    if (!body.is_object()) {
        return fail(broker_errc::invalid_request, "Request body must be a JSON object");
    }

    Response r;
    switch (*op) {
        case Operation::Register: r = do_register(body); break;
        case Operation::Send:     r = do_send(body); break;
        case Operation::Read:     r = do_read(body); break;
        case Operation::Confirm:  r = do_confirm(body); break;
        case Operation::Purge:    r = do_purge(body); break;
        case Operation::Stats:    r = do_stats(body); break;
    }

    if (ctx_->verbose) {
        std::cout << "[router] " << operation << " -> "
                  << (r.error.empty() ? (r.message.empty() ? "ok" : r.message) : r.error)
                  << (r.message_id.empty() ? "" : " id=" + r.message_id) << "\n";
    }
    return r;
}

Response Router::fail(boost::system::error_code ec, const std::string& detail) {
    ctx_->metrics.errors.fetch_add(1, std::memory_order_relaxed);
    if (ctx_->verbose) {
        std::cerr << "[router] " << ec.category().name() << ":" << ec.value()
                  << " " << detail << "\n";
    }
    Response r;
    r.error = detail;
    return r;
}

Response Router::do_register(const nlohmann::json& body) {
    std::string channel;
    if (!string_field(body, kChannelField, channel)) {
        return fail(broker_errc::invalid_request, required(kChannelField));
    }
    boost::system::error_code ec;
    registry_.register_channel(channel, ec);
    if (ec) {
        return fail(ec, "Channel " + channel + " already exists");
    }
    Response r;
    r.message = "Channel " + channel + " successfully registered";
    return r;
}

Response Router::do_send(const nlohmann::json& body) {
    std::string channel;
    if (!string_field(body, kChannelField, channel)) {
        return fail(broker_errc::invalid_request, required(kChannelField));
    }

    nlohmann::json payload;
    auto it = body.find(kDataField);
    if (it != body.end()) {
        if (!it->is_object()) {
            return fail(broker_errc::invalid_request, "Field 'data' must be a JSON object");
        }
        payload = *it;
    } else {
        payload = body;
        payload.erase(kChannelField);
    }

    boost::system::error_code ec;
    Response r;
    r.data = payload;
    r.message_id = registry_.publish(channel, std::move(payload), ec);
    if (ec) {
        return fail(ec, "Channel " + channel + " does not exist");
    }
    ctx_->metrics.published.fetch_add(1, std::memory_order_relaxed);
    return r;
}

Response Router::do_read(const nlohmann::json& body) {
    std::string channel;
    if (!string_field(body, kChannelField, channel)) {
        return fail(broker_errc::invalid_request, required(kChannelField));
    }
    boost::system::error_code ec;
    auto msg = registry_.consume(channel, ec);
    if (ec) {
        return fail(ec, "Channel " + channel + " does not exist");
    }

    Response r;
    if (!msg) {
        if (registry_.policy().lenient_missing_channel && !registry_.contains(channel)) {
            r.message = "Channel " + channel + " does not exist";
        } else {
            r.message = "No messages in channel";
        }
        return r;
    }
    ctx_->metrics.delivered.fetch_add(1, std::memory_order_relaxed);
    r.data = std::move(msg->payload);
    r.message_id = std::move(msg->id);
    return r;
}

Response Router::do_confirm(const nlohmann::json& body) {
    std::string channel;
    std::string message_id;
    if (!string_field(body, kChannelField, channel)) {
        return fail(broker_errc::invalid_request, required(kChannelField));
    }
    if (!string_field(body, kMessageIdField, message_id)) {
        return fail(broker_errc::invalid_request, required(kMessageIdField));
    }
    boost::system::error_code ec;
    const bool removed = registry_.acknowledge(channel, message_id, ec);
    if (ec) {
        return fail(ec, "Channel " + channel + " does not exist");
    }

    Response r;
    r.message_id = message_id;
    if (removed) {
        ctx_->metrics.acknowledged.fetch_add(1, std::memory_order_relaxed);
        r.message = "Message confirmed!";
    } else {
        r.message = "Message does not exist";
    }
    return r;
}

Response Router::do_purge(const nlohmann::json& body) {
    std::string channel;
    if (!string_field(body, kChannelField, channel)) {
        return fail(broker_errc::invalid_request, required(kChannelField));
    }
    boost::system::error_code ec;
    const std::size_t dropped = registry_.purge(channel, ec);
    if (ec) {
        return fail(ec, "Channel " + channel + " does not exist");
    }
    ctx_->metrics.purged.fetch_add(dropped, std::memory_order_relaxed);
    Response r;
    r.message = "Channel " + channel + " purged";
    return r;
}

Response Router::do_stats(const nlohmann::json& body) {
    Response r;
    auto it = body.find(kChannelField);
    if (it == body.end() || it->is_null()) {
        for (const auto& [name, s] : registry_.stats()) {
            r.data[name] = stats_json(s);
        }
        return r;
    }
    if (!it->is_string()) {
        return fail(broker_errc::invalid_request, "Field 'channel' must be a string");
    }

    const std::string channel = it->get<std::string>();
    boost::system::error_code ec;
    auto s = registry_.stats(channel, ec);
    if (ec) {
        return fail(ec, "Channel " + channel + " does not exist");
    }
    if (s) {
        r.data[channel] = stats_json(*s);
    }
    return r;
}
