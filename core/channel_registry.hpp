// filename: core/channel_registry.hpp
#pragma once
#include <core/broker_errors.hpp>
#include <core/channel.hpp>
#include <core/id_generator.hpp>
#include <core/message.hpp>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

// How the registry treats channel names it has never seen.
// Both switches default to the strict behavior.
struct RegistryPolicy {
    // publish() registers an unknown channel instead of failing
    bool auto_create_on_publish = false;
    // consume() and stats(name) on an unknown channel return an empty
    // result instead of channel_not_found
    bool lenient_missing_channel = false;
};

// Owns every channel of a broker process. One instance is created at startup
// and handed by reference to the router and its workers.
//
// The channel map is guarded by a shared_mutex; message state is guarded by
// each Channel's own mutex, so operations on different channels do not
// contend. Channels are never removed, so a looked-up Channel stays valid.
//
// Failures are reported through `ec` using broker_errc; on failure nothing is
// modified.
class ChannelRegistry {
public:
    explicit ChannelRegistry(std::shared_ptr<IdGenerator> ids,
                             RegistryPolicy policy = {});

    ChannelRegistry(const ChannelRegistry&) = delete;
    ChannelRegistry& operator=(const ChannelRegistry&) = delete;

    // broker_errc::already_exists if the name is taken
    void register_channel(const std::string& name, boost::system::error_code& ec);

    // Returns the generated message id, or an empty string on failure.
    std::string publish(const std::string& name, nlohmann::json payload,
                        boost::system::error_code& ec);

    // std::nullopt with no error when the ready queue is empty.
    std::optional<Message> consume(const std::string& name, boost::system::error_code& ec);

    // false with no error when the id is not awaiting confirmation
    bool acknowledge(const std::string& name, const std::string& message_id,
                     boost::system::error_code& ec);

    // Returns the number of messages discarded.
    std::size_t purge(const std::string& name, boost::system::error_code& ec);

    std::optional<ChannelStats> stats(const std::string& name, boost::system::error_code& ec) const;
    std::unordered_map<std::string, ChannelStats> stats() const;

    bool contains(const std::string& name) const;
    std::vector<std::string> channel_names() const;
    std::size_t size() const;

    const RegistryPolicy& policy() const noexcept { return policy_; }

private:
    std::shared_ptr<Channel> find(const std::string& name) const;
    std::shared_ptr<Channel> find_or_create(const std::string& name);

    std::shared_ptr<IdGenerator> ids_;
    const RegistryPolicy policy_;

    mutable std::shared_mutex mu_;
    std::unordered_map<std::string, std::shared_ptr<Channel>> channels_;
};
