// filename: core/broker_client.hpp
#pragma once
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <nlohmann/json.hpp>
#include <string>

// Blocking HTTP client for the broker, one keep-alive connection.
class BrokerClient {
public:
    BrokerClient(std::string host, std::string port);
    ~BrokerClient();

    BrokerClient(const BrokerClient&) = delete;
    BrokerClient& operator=(const BrokerClient&) = delete;

    // Resolve and connect, retrying with exponential backoff.
    // On give-up `ec` holds the last failure.
    void connect(boost::system::error_code& ec, int max_attempts = 6);

    // POST /<operation> with `body`; returns the decoded response object.
    // Throws boost::system::system_error on I/O failure and
    // std::runtime_error if the reply is not JSON.
    nlohmann::json call(const std::string& operation, const nlohmann::json& body);

    void close();

private:
    static constexpr int kBaseBackoffMs = 200;
    static constexpr int kMaxBackoffMs = 5000;

    std::string host_;
    std::string port_;
    boost::asio::io_context io_;
    boost::beast::tcp_stream stream_;
    boost::beast::flat_buffer buffer_;
};
