// filename: src/channel_registry.cpp
#include <core/channel_registry.hpp>
#include <iostream>
#include <mutex>
#include <stdexcept>

ChannelRegistry::ChannelRegistry(std::shared_ptr<IdGenerator> ids, RegistryPolicy policy)
    : ids_(std::move(ids)),
      policy_(policy)
{
    if (!ids_) {
        throw std::invalid_argument("ChannelRegistry requires an id generator");
    }
}

std::shared_ptr<Channel> ChannelRegistry::find(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    auto it = channels_.find(name);
    return it == channels_.end() ? nullptr : it->second;
}

// only reached with auto_create_on_publish; races with register_channel()
// are settled by the exclusive lock
std::shared_ptr<Channel> ChannelRegistry::find_or_create(const std::string& name) {
    if (auto ch = find(name)) return ch;

    // allocate outside the lock; a throw here leaves the map untouched
    auto fresh = std::make_shared<Channel>(name);
    std::unique_lock<std::shared_mutex> lk(mu_);
    auto [it, inserted] = channels_.try_emplace(name, std::move(fresh));
    if (inserted) {
        std::cout << "[registry] created channel '" << name << "' on publish ("
                  << channels_.size() << " channels)\n";
    }
    return it->second;
}

void ChannelRegistry::register_channel(const std::string& name, boost::system::error_code& ec) {
    ec.clear();
    auto fresh = std::make_shared<Channel>(name);
    std::size_t count = 0;
    {
        std::unique_lock<std::shared_mutex> lk(mu_);
        if (!channels_.try_emplace(name, std::move(fresh)).second) {
            ec = broker_errc::already_exists;
            return;
        }
        count = channels_.size();
    }
    std::cout << "[registry] registered channel '" << name << "' ("
              << count << " channels)\n";
}

std::string ChannelRegistry::publish(const std::string& name, nlohmann::json payload,
                                     boost::system::error_code& ec) {
    ec.clear();
    auto ch = policy_.auto_create_on_publish ? find_or_create(name) : find(name);
    if (!ch) {
        ec = broker_errc::channel_not_found;
        return {};
    }
    Message msg;
    msg.id = ids_->next();
    msg.payload = std::move(payload);
    std::string id = msg.id;
    ch->push(std::move(msg));
    return id;
}

std::optional<Message> ChannelRegistry::consume(const std::string& name,
                                                boost::system::error_code& ec) {
    ec.clear();
    auto ch = find(name);
    if (!ch) {
        if (!policy_.lenient_missing_channel) ec = broker_errc::channel_not_found;
        return std::nullopt;
    }
    return ch->try_pop();
}

bool ChannelRegistry::acknowledge(const std::string& name, const std::string& message_id,
                                  boost::system::error_code& ec) {
    ec.clear();
    auto ch = find(name);
    if (!ch) {
        ec = broker_errc::channel_not_found;
        return false;
    }
    return ch->ack(message_id);
}

std::size_t ChannelRegistry::purge(const std::string& name, boost::system::error_code& ec) {
    ec.clear();
    auto ch = find(name);
    if (!ch) {
        ec = broker_errc::channel_not_found;
        return 0;
    }
    return ch->purge();
}

std::optional<ChannelStats> ChannelRegistry::stats(const std::string& name,
                                                   boost::system::error_code& ec) const {
    ec.clear();
    auto ch = find(name);
    if (!ch) {
        if (!policy_.lenient_missing_channel) ec = broker_errc::channel_not_found;
        return std::nullopt;
    }
    return ch->stats();
}

std::unordered_map<std::string, ChannelStats> ChannelRegistry::stats() const {
    std::vector<std::shared_ptr<Channel>> snapshot;
    {
        std::shared_lock<std::shared_mutex> lk(mu_);
        snapshot.reserve(channels_.size());
        for (const auto& kv : channels_) snapshot.push_back(kv.second);
    }
    std::unordered_map<std::string, ChannelStats> out;
    out.reserve(snapshot.size());
    for (const auto& ch : snapshot) {
        out.emplace(ch->name(), ch->stats());
    }
    return out;
}

bool ChannelRegistry::contains(const std::string& name) const {
    return find(name) != nullptr;
}

std::vector<std::string> ChannelRegistry::channel_names() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    std::vector<std::string> names;
    names.reserve(channels_.size());
    for (const auto& kv : channels_) names.push_back(kv.first);
    return names;
}

std::size_t ChannelRegistry::size() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    return channels_.size();
}
