// filename: src/bench_client.cpp
#include <core/broker_client.hpp>
#include <core/broker_config.hpp>
#include <core/metrics.hpp>
#include <cstdint>
#include <iostream>
#include <string>

namespace {

double rate(std::size_t count, uint64_t elapsed_ns) {
    return elapsed_ns > 0 ? static_cast<double>(count) * 1e9 / static_cast<double>(elapsed_ns) : 0.0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc != 6) {
        std::cerr << "Usage: bench_client <host> <port> <channel> <msg_size> <count>\n";
        return 1;
    }
    const std::string channel = argv[3];
    constexpr std::uint64_t kMaxMsgSize = 64 * 1024 * 1024;
    auto msg_size_arg = parse_positive(argv[4]);
    auto count_arg = parse_positive(argv[5]);
    if (!msg_size_arg || !count_arg || *msg_size_arg > kMaxMsgSize) {
        std::cerr << "[bench] msg_size (<= " << kMaxMsgSize
                  << ") and count must be positive integers\n";
        return 1;
    }
    const std::size_t msg_size = static_cast<std::size_t>(*msg_size_arg);
    const std::size_t count = static_cast<std::size_t>(*count_arg);

    try {
        BrokerClient client(argv[1], argv[2]);
        boost::system::error_code ec;
        client.connect(ec);
        if (ec) {
            std::cerr << "[bench] connect failed: " << ec.message() << "\n";
            return 1;
        }

        auto reg = client.call("register", {{"channel", channel}});
        if (!reg.value("error", std::string()).empty()) {
            std::cout << "[bench] " << reg["error"].get<std::string>() << ", reusing it\n";
        }

        const nlohmann::json send_body = {
            {"channel", channel},
            {"data", {{"blob", std::string(msg_size, 'X')}}}
        };

        const uint64_t start = now_ns();
        for (std::size_t i = 0; i < count; ++i) {
            auto reply = client.call("send", send_body);
            if (!reply.value("error", std::string()).empty()) {
                std::cerr << "[bench] send failed: " << reply["error"].get<std::string>() << "\n";
                return 1;
            }
        }
        const uint64_t sent = now_ns();

        std::size_t consumed = 0;
        for (;;) {
            auto reply = client.call("read", {{"channel", channel}});
            const std::string id = reply.value("message_id", std::string());
            if (id.empty()) break;
            client.call("confirm", {{"channel", channel}, {"message_id", id}});
            ++consumed;
        }
        const uint64_t done = now_ns();

        std::cout << "sent=" << count << " msgs => " << rate(count, sent - start) << " msg/s\n"
                  << "consumed+confirmed=" << consumed << " msgs => "
                  << rate(consumed, done - sent) << " msg/s\n";
    }
    catch (const std::exception& e) {
        std::cerr << "[bench] error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
