// filename: src/chanq_client.cpp
#include <core/broker_client.hpp>
#include <core/router.hpp>
#include <iostream>
#include <string>

namespace {

void usage() {
    std::cerr << "Usage: chanq_client <host> <port> <operation> [channel] [arg]\n"
              << "  register <channel>\n"
              << "  send     <channel> <json-object>\n"
              << "  read     <channel>\n"
              << "  confirm  <channel> <message_id>\n"
              << "  purge    <channel>\n"
              << "  stats    [channel]\n";
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 4 || argc > 6) {
        usage();
        return 1;
    }

    const std::string host = argv[1];
    const std::string port = argv[2];
    const std::string operation = argv[3];

    auto op = parse_operation(operation);
    if (!op) {
        std::cerr << "[client] unknown operation '" << operation << "'\n";
        usage();
        return 1;
    }

    nlohmann::json body = nlohmann::json::object();
    if (argc >= 5) body["channel"] = argv[4];
    if (*op != Operation::Stats && argc < 5) {
        usage();
        return 1;
    }
    if (*op == Operation::Send) {
        if (argc != 6) { usage(); return 1; }
        auto data = nlohmann::json::parse(argv[5], nullptr, false);
        if (data.is_discarded() || !data.is_object()) {
            std::cerr << "[client] payload must be a JSON object: " << argv[5] << "\n";
            return 1;
        }
        body["data"] = std::move(data);
    } else if (*op == Operation::Confirm) {
        if (argc != 6) { usage(); return 1; }
        body["message_id"] = argv[5];
    }

    try {
        BrokerClient client(host, port);
        boost::system::error_code ec;
        client.connect(ec);
        if (ec) {
            std::cerr << "[client] connect failed: " << ec.message() << "\n";
            return 1;
        }
        auto reply = client.call(operation, body);
        std::cout << reply.dump(2) << "\n";
        return reply.value("error", std::string()).empty() ? 0 : 2;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
