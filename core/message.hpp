// filename: core/message.hpp
#pragma once
#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>

// A published message. The payload is opaque to the engine: it is stored and
// handed back, never inspected.
struct Message {
    std::string id;
    nlohmann::json payload = nlohmann::json::object();
};

struct ChannelStats {
    std::size_t ready = 0;
    std::size_t unacked = 0;

    std::size_t total() const noexcept { return ready + unacked; }
};
