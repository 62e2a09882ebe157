// filename: core/broker_errors.hpp
#pragma once
#include <boost/system/error_code.hpp>
#include <type_traits>

// Local, recoverable broker conditions. None of these is fatal to the process.
enum class broker_errc {
    already_exists = 1,
    channel_not_found,
    unknown_operation,
    invalid_request
};

const boost::system::error_category& broker_category() noexcept;

inline boost::system::error_code make_error_code(broker_errc e) noexcept {
    return {static_cast<int>(e), broker_category()};
}

namespace boost {
namespace system {
template <>
struct is_error_code_enum<broker_errc> : std::true_type {};
} // namespace system
} // namespace boost
