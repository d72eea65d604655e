// filename: core/errors.hpp
#pragma once
#include <boost/system/error_code.hpp>
#include <type_traits>

// Error kinds reported by jobq. Validation errors come back synchronously,
// connectivity errors only after the reconnect budget is spent.
enum class mq_errc {
    empty_job = 1,
    already_closed,
    cannot_acknowledge,
    transactions_not_supported,
    unsupported_scheme,
    invalid_uri,
    invalid_option,
    connection_lost,
    reconnect_failed,
    end_of_stream,
    unknown_content_type,
    payload_mismatch,
    malformed_frame,
};

const boost::system::error_category& mq_category();

boost::system::error_code make_error_code(mq_errc e);

namespace boost {
namespace system {
template <>
struct is_error_code_enum<mq_errc> : std::true_type {};
} // namespace system
} // namespace boost
