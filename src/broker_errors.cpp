// filename: src/broker_errors.cpp
#include <core/broker_errors.hpp>
#include <string>

namespace {

class BrokerCategory : public boost::system::error_category {
public:
    const char* name() const noexcept override { return "broker"; }

    std::string message(int ev) const override {
        switch (static_cast<broker_errc>(ev)) {
            case broker_errc::already_exists:    return "channel already exists";
            case broker_errc::channel_not_found: return "channel does not exist";
            case broker_errc::unknown_operation: return "unknown operation";
            case broker_errc::invalid_request:   return "invalid request";
        }
        return "unknown broker error";
    }
};

} // namespace

const boost::system::error_category& broker_category() noexcept {
    static BrokerCategory category;
    return category;
}
