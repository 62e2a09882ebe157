// filename: src/broker_main.cpp
#include <core/broker.hpp>
#include <core/broker_config.hpp>
#include <core/broker_context.hpp>
#include <core/channel_registry.hpp>
#include <core/id_generator.hpp>
#include <core/router.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>

int main(int argc, char* argv[]) {
    std::cout << "[broker] main() starting\n";
    if (argc != 2) {
        std::cerr << "Usage: broker <port>\n";
        return 1;
    }

    auto port = parse_positive(argv[1]);
    if (!port || *port > 65535) {
        std::cerr << "[broker] invalid port: '" << argv[1] << "'\n";
        return 1;
    }

    BrokerConfig cfg = config_from_env([](const char* name) { return std::getenv(name); });
    cfg.port = static_cast<unsigned short>(*port);

    std::cout << "[broker] threads=" << cfg.threads
              << " ids=" << (cfg.id_kind == IdKind::Sequential ? "seq" : "uuid")
              << " auto_create=" << cfg.policy.auto_create_on_publish
              << " lenient=" << cfg.policy.lenient_missing_channel << "\n";

    auto ctx = std::make_shared<BrokerContext>();
    ctx->verbose = cfg.verbose;

    ChannelRegistry registry(make_id_generator(cfg.id_kind), cfg.policy);
    Router router(registry, ctx);

    try {
        boost::asio::io_context io_context;
        Broker broker(io_context, cfg.port, router, ctx, cfg.max_body_bytes);

        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int sig) {
            if (ec) return;
            std::cout << "[broker] signal " << sig << ", shutting down\n";
            broker.stop();
            io_context.stop();
        });

        // the main thread is one of the io threads
        run_io_threads(io_context, cfg.threads);
    } catch (const std::exception& e) {
        std::cerr << "[broker] fatal: " << e.what() << "\n";
        return 1;
    }

    std::cout << "[broker] shutdown: channels=" << registry.size()
              << " " << ctx->metrics << "\n";
    return 0;
}
