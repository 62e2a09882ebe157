// filename: core/channel.hpp
#pragma once
#include <core/message.hpp>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

// Channel: one named FIFO with its delivered-but-unconfirmed set.
// A live message id is in exactly one of ready_ / unacked_. Every method
// takes mutex_, so concurrent consumers never see the same message.
// try_pop never blocks: an empty ready queue yields std::nullopt.
class Channel {
public:
    explicit Channel(std::string name) : name_(std::move(name)) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    const std::string& name() const noexcept { return name_; }

    // append to the tail of the ready queue
    void push(Message msg);

    // move the head of the ready queue into unacked and return a copy of it
    std::optional<Message> try_pop();

    // drop a delivered message; false if the id is not in unacked
    bool ack(const std::string& id);

    // discard everything, ready and unacked; returns how many were dropped
    std::size_t purge();

    ChannelStats stats() const;

private:
    const std::string name_;
    mutable std::mutex mutex_;
    std::deque<Message> ready_;
    std::unordered_map<std::string, Message> unacked_;
};
