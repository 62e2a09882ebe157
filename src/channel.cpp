// filename: src/channel.cpp
#include <core/channel.hpp>

void Channel::push(Message msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    ready_.push_back(std::move(msg));
}

std::optional<Message> Channel::try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ready_.empty()) {
        return std::nullopt;
    }
    Message msg = std::move(ready_.front());
    ready_.pop_front();
    std::string id = msg.id;
    auto it = unacked_.emplace(std::move(id), std::move(msg)).first;
    return it->second;
}

bool Channel::ack(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return unacked_.erase(id) > 0;
}

std::size_t Channel::purge() {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::size_t dropped = ready_.size() + unacked_.size();
    ready_.clear();
    unacked_.clear();
    return dropped;
}

ChannelStats Channel::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ChannelStats s;
    s.ready = ready_.size();
    s.unacked = unacked_.size();
    return s;
}
