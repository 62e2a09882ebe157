// filename: src/broker_client.cpp
#include <core/broker_client.hpp>
#include <boost/beast/http.hpp>
#include <algorithm>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace http = boost::beast::http;

BrokerClient::BrokerClient(std::string host, std::string port)
    : host_(std::move(host)),
      port_(std::move(port)),
      stream_(io_)
{}

BrokerClient::~BrokerClient() {
    close();
}

void BrokerClient::connect(boost::system::error_code& ec, int max_attempts) {
    using tcp = boost::asio::ip::tcp;

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        tcp::resolver resolver(io_);
        auto results = resolver.resolve(host_, port_, ec);

        if (ec) {
            std::cerr << "[client] resolve failed (attempt " << attempt << "/" << max_attempts
                      << "): " << ec.message() << "\n";
        } else {
            boost::system::error_code ignore;
            stream_.socket().close(ignore);
            boost::asio::connect(stream_.socket(), results, ec);
            if (!ec) return;
            std::cerr << "[client] connect failed (attempt " << attempt << "/" << max_attempts
                      << "): " << ec.message() << "\n";
        }
        if (attempt == max_attempts) break;
        int backoff = std::min(kMaxBackoffMs, kBaseBackoffMs << (attempt - 1));
        std::this_thread::sleep_for(std::chrono::milliseconds(backoff));
    }
}

nlohmann::json BrokerClient::call(const std::string& operation, const nlohmann::json& body) {
    http::request<http::string_body> req{http::verb::post, "/" + operation, 11};
    req.set(http::field::host, host_);
    req.set(http::field::content_type, "application/json");
    req.keep_alive(true);
    req.body() = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    req.prepare_payload();

    http::write(stream_, req);

    http::response<http::string_body> res;
    http::read(stream_, buffer_, res);

    auto reply = nlohmann::json::parse(res.body(), nullptr, false);
    if (reply.is_discarded() || !reply.is_object()) {
        throw std::runtime_error("non-JSON reply (HTTP " +
                                 std::to_string(res.result_int()) + ")");
    }
    return reply;
}

void BrokerClient::close() {
    boost::system::error_code ignore;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignore);
    stream_.socket().close(ignore);
}
