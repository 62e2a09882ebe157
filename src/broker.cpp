// filename: src/broker.cpp
#include <core/broker.hpp>
#include <core/thread_pool.hpp>
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/ip/v6_only.hpp>
#include <boost/asio/socket_base.hpp>
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>

namespace http = boost::beast::http;

namespace {

// Errors raised by the HTTP parser itself, as opposed to socket failures.
bool is_parse_error(const boost::system::error_code& ec) {
    static const auto& http_category =
        boost::beast::http::make_error_code(http::error::bad_target).category();
    return ec.category() == http_category && ec != http::error::partial_message;
}

std::string operation_from_target(boost::beast::string_view target) {
    std::string op(target.data(), target.size());
    auto q = op.find('?');
    if (q != std::string::npos) op.erase(q);
    return op;
}

} // namespace

void run_io_threads(boost::asio::io_context& io_context, std::size_t threads) {
    std::unique_ptr<ThreadPool> pool;
    if (threads > 1) {
        pool = std::make_unique<ThreadPool>(threads - 1, "io_pool");
        for (std::size_t i = 0; i < pool->size(); ++i) {
            pool->post([&io_context] { io_context.run(); });
        }
    }
    // Enter the I/O event loop, dispatching asynchronous handlers
    try {
        io_context.run();
    } catch (...) {
        // workers are still inside run(); release them before unwinding
        io_context.stop();
        if (pool) pool->stop();
        throw;
    }
    if (pool) pool->stop();
}

Broker::Broker(boost::asio::io_context& io_context,
               unsigned short port,
               Router& router,
               std::shared_ptr<BrokerContext> ctx,
               std::size_t max_body_bytes)
    : io_context_(io_context),
      acceptor_(io_context),
      strand_(io_context.get_executor()),
      router_(router),
      ctx_(std::move(ctx)),
      max_body_bytes_(max_body_bytes),
      acceptor_retry_timer_(io_context)
{
    setup_acceptor(acceptor_, port, "http");

    std::cout << "[broker] ctor: port=" << local_port()
              << " max_body=" << max_body_bytes_ << "\n";
    // Start accepting connections before entering the event loop
    start();
}

Broker::~Broker() {
    boost::system::error_code ignore;
    acceptor_retry_timer_.cancel();
    acceptor_.cancel(ignore);
    acceptor_.close(ignore);
}

void Broker::setup_acceptor(boost::asio::ip::tcp::acceptor& acc,
                            unsigned short port,
                            const char* label)
{
    namespace asio = boost::asio;
    using tcp = asio::ip::tcp;

    boost::system::error_code ec;

    // Try dual-stack IPv6 first
    tcp::endpoint ep6(tcp::v6(), port);
    acc.open(ep6.protocol(), ec);
    if (!ec) {
        acc.set_option(asio::socket_base::reuse_address(true), ec); ec.clear();
        acc.set_option(asio::ip::v6_only(false), ec); ec.clear();
        acc.bind(ep6, ec);
        if (!ec) {
            acc.listen(asio::socket_base::max_listen_connections, ec);
            if (!ec) {
                asio::ip::v6_only v6only_opt;
                bool v6only_value = true;
                acc.get_option(v6only_opt, ec);
                if (!ec) v6only_value = v6only_opt.value();

                std::cout << "[broker] " << label
                          << " listening on [::]:" << acc.local_endpoint(ec).port()
                          << (v6only_value ? " (IPv6-only)" : " (dual-stack)")
                          << "\n";
                return;
            }
        }
        boost::system::error_code ignore;
        acc.close(ignore);
    }

    // Fallback to IPv4-only
    ec.clear();
    tcp::endpoint ep4(tcp::v4(), port);
    acc.open(ep4.protocol(), ec);
    if (ec) {
        std::cerr << "[broker] FAILED to open " << label
                  << " acceptor (v4): " << ec.message() << "\n";
        throw boost::system::system_error(ec);
    }
    acc.set_option(asio::socket_base::reuse_address(true), ec); ec.clear();
    acc.bind(ep4, ec);
    if (ec) {
        std::cerr << "[broker] FAILED to bind " << label
                  << " on 0.0.0.0:" << port << " (v4): " << ec.message() << "\n";
        throw boost::system::system_error(ec);
    }
    acc.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        std::cerr << "[broker] FAILED to listen " << label
                  << " (v4): " << ec.message() << "\n";
        throw boost::system::system_error(ec);
    }
    std::cout << "[broker] " << label
              << " listening on 0.0.0.0:" << acc.local_endpoint(ec).port()
              << " (IPv4-only fallback)\n";
}

void Broker::start() {
    do_accept();
}

void Broker::stop() {
    boost::asio::post(strand_, [this] {
        boost::system::error_code ignore;
        acceptor_retry_timer_.cancel();
        acceptor_.cancel(ignore);
        acceptor_.close(ignore);
        std::cout << "[broker] stopped accepting\n";
    });
}

unsigned short Broker::local_port() const {
    boost::system::error_code ec;
    auto ep = acceptor_.local_endpoint(ec);
    return ec ? 0 : ep.port();
}

// Asynchronously accept connections and re-arm
void Broker::do_accept() {
    using tcp = boost::asio::ip::tcp;

    acceptor_.async_accept(
        boost::asio::make_strand(io_context_),
        boost::asio::bind_executor(strand_,
        [this](const boost::system::error_code& ec, tcp::socket socket) {
            if (ec) {
                if (ec == boost::asio::error::operation_aborted || !acceptor_.is_open()) {
                    return; // shutting down
                }
                // backoff = min(kMaxMs, kBaseMs << pow2), with jitter ±25%
                backoff_pow2_ = std::min<unsigned>(backoff_pow2_ + 1, 7);
                unsigned delay_ms = std::min<unsigned>(kBackoffMaxMs,
                                                       kBackoffBaseMs << backoff_pow2_);
                unsigned jitter = delay_ms / 4;
                unsigned rand0  = static_cast<unsigned>(std::rand()) % (2 * jitter + 1);
                unsigned delay_with_jitter = delay_ms - jitter + rand0;

                std::cerr << "[broker] accept error: " << ec.message()
                          << " (retry in " << delay_with_jitter << " ms)\n";

                acceptor_retry_timer_.expires_after(std::chrono::milliseconds(delay_with_jitter));
                acceptor_retry_timer_.async_wait(
                    boost::asio::bind_executor(
                        strand_,
                        [this](const boost::system::error_code& tec) {
                            if (!tec) do_accept();
                        }));
                return;
            }

            // Success: reset backoff
            backoff_pow2_ = 0;

            boost::system::error_code ep_ec;
            auto ep = socket.remote_endpoint(ep_ec);
            if (!ep_ec && ctx_->is_banned(ep.address().to_string())) {
                std::cerr << "[broker] rejecting banned peer " << ep.address().to_string() << "\n";
                boost::system::error_code ignore;
                socket.shutdown(tcp::socket::shutdown_both, ignore);
                socket.close(ignore);
                do_accept();
                return;
            }

            if (ctx_->verbose) {
                std::cout << "[broker] client connected\n";
            }
            std::make_shared<Session>(
                std::move(socket), router_, ctx_, max_body_bytes_)->start();

            // Re-arm
            do_accept();
        }));
}

void Broker::Session::start() {
    // the socket's executor is this session's strand
    boost::asio::dispatch(stream_.get_executor(),
        [self = shared_from_this()] { self->read_request(); });
}

void Broker::Session::read_request() {
    parser_.emplace();
    parser_->body_limit(max_body_bytes_);
    stream_.expires_after(kIdleTimeout);

    auto self = shared_from_this();
    http::async_read(stream_, buffer_, *parser_,
        [this, self](boost::system::error_code ec, std::size_t) { on_read(ec); });
}

void Broker::Session::on_read(boost::system::error_code ec) {
    if (ec == http::error::end_of_stream || ec == boost::beast::error::timeout) {
        close();
        return;
    }
    if (ec == http::error::body_limit) {
        std::cerr << "[session] " << peer_ip_ << " request body over "
                  << max_body_bytes_ << " bytes\n";
        Response r;
        r.error = "Request body too large";
        res_ = http::response<http::string_body>{};
        res_.version(11);
        res_.keep_alive(false);
        res_.result(http::status::payload_too_large);
        res_.set(http::field::server, "chanq");
        res_.set(http::field::content_type, "application/json");
        res_.body() = r.dump();
        res_.prepare_payload();
        write_response(true);
        return;
    }
    if (ec) {
        if (is_parse_error(ec)) {
            reject_malformed("read", ec);
        } else {
            fail("read", ec);
        }
        return;
    }
    handle_request();
}

void Broker::Session::handle_request() {
    auto req = parser_->release();

    res_ = http::response<http::string_body>{};
    res_.version(req.version());
    res_.keep_alive(req.keep_alive());
    res_.set(http::field::server, "chanq");
    res_.set(http::field::content_type, "application/json");

    if (req.method() != http::verb::post && req.method() != http::verb::get) {
        Response r;
        r.error = "Method not allowed";
        res_.result(http::status::method_not_allowed);
        res_.body() = r.dump();
    } else {
        const std::string op = operation_from_target(req.target());
        Response r = router_.dispatch(op, req.body());
        res_.result(http::status::ok);
        res_.body() = r.dump();
    }
    res_.prepare_payload();
    write_response(!req.keep_alive());
}

void Broker::Session::write_response(bool close_after) {
    auto self = shared_from_this();
    http::async_write(stream_, res_,
        [this, self, close_after](boost::system::error_code ec, std::size_t) {
            if (ec) { fail("write", ec); return; }
            if (close_after) { close(); return; }
            read_request();
        });
}

// Centralized error handling for socket failures
void Broker::Session::fail(const char* where, const boost::system::error_code& ec) {
    if (ec != boost::asio::error::operation_aborted) {
        std::cerr << "[session] " << where << " error: " << ec.message()
                  << " (code=" << ec.value() << ")\n";
    }
    close();
    // Do NOT re-arm another read; let shared_ptr go out of scope naturally.
}

void Broker::Session::reject_malformed(const char* where, const boost::system::error_code& ec) {
    ctx_->metrics.malformed_requests.fetch_add(1, std::memory_order_relaxed);
    std::cerr << "[session] " << where << " MALFORMED request from " << peer_ip_
              << ": " << ec.message() << "\n";
    if (!peer_ip_.empty() && peer_ip_ != "<unknown>" && ctx_->strike(peer_ip_)) {
        std::cerr << "[session] banning IP " << peer_ip_
                  << " for " << std::chrono::duration_cast<std::chrono::seconds>(ctx_->ban_duration).count()
                  << "s due to repeated malformed requests\n";
    }
    close();
}

void Broker::Session::close() {
    // Best-effort shutdown then close; ignore errors if already closed.
    boost::system::error_code ignore;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignore);
    stream_.close();
    buffer_.clear();
}
