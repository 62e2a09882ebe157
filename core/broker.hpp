// filename: core/broker.hpp
#pragma once
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <core/broker_context.hpp>
#include <core/router.hpp>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

// Runs `io_context` on the calling thread plus `threads - 1` pool workers and
// returns once it stops. If a handler throws on the calling thread the
// context is stopped and the workers joined before the exception propagates.
void run_io_threads(boost::asio::io_context& io_context, std::size_t threads);

// HTTP front end of the broker: POST /<operation> with a JSON body is handed
// to the Router and the Response is written back as JSON.
//
// The io_context may be run from several threads. Accept handlers run on
// strand_; each session gets a strand of its own.
class Broker {
public:
    // port 0 picks an ephemeral port, see local_port()
    Broker(boost::asio::io_context& io_context,
           unsigned short port,
           Router& router,
           std::shared_ptr<BrokerContext> ctx,
           std::size_t max_body_bytes);

    ~Broker();

    // Start accepting connections
    void start();

    // Stop accepting; open sessions finish their current exchange.
    void stop();

    unsigned short local_port() const;

private:
    void do_accept();
    void setup_acceptor(boost::asio::ip::tcp::acceptor& acc,
                        unsigned short port,
                        const char* label);

    static constexpr unsigned kBackoffBaseMs = 10;
    static constexpr unsigned kBackoffMaxMs = 1000;

    boost::asio::io_context& io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    // serialize accept handlers
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    Router& router_;
    std::shared_ptr<BrokerContext> ctx_;
    std::size_t max_body_bytes_;

    boost::asio::steady_timer acceptor_retry_timer_;
    unsigned backoff_pow2_{0};

    // one per connection, HTTP/1.1 keep-alive
    class Session : public std::enable_shared_from_this<Session> {
    public:
        Session(boost::asio::ip::tcp::socket socket,
                Router& router,
                std::shared_ptr<BrokerContext> ctx,
                std::size_t max_body_bytes)
        : stream_(std::move(socket)),
          router_(router),
          ctx_(std::move(ctx)),
          max_body_bytes_(max_body_bytes) {
            boost::system::error_code ip_ec;
            auto ep = stream_.socket().remote_endpoint(ip_ec);
            peer_ip_ = ip_ec ? std::string("<unknown>") : ep.address().to_string();
          }

        void start();

    private:
        void read_request();
        void on_read(boost::system::error_code ec);
        void handle_request();
        void write_response(bool close_after);
        void fail(const char* where, const boost::system::error_code& ec);
        void reject_malformed(const char* where, const boost::system::error_code& ec);
        void close();

        static constexpr std::chrono::seconds kIdleTimeout{30};

        boost::beast::tcp_stream stream_;
        boost::beast::flat_buffer buffer_;
        std::optional<boost::beast::http::request_parser<boost::beast::http::string_body>> parser_;
        boost::beast::http::response<boost::beast::http::string_body> res_;
        Router& router_;
        std::shared_ptr<BrokerContext> ctx_;
        std::size_t max_body_bytes_;
        std::string peer_ip_;
    };
};
