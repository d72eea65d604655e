// filename: core/net_config.hpp
#pragma once
#include <boost/system/error_code.hpp>
#include <core/uri.hpp>
#include <chrono>
#include <string>

// Options of the jobq:// backend. Defaults, then JOBQ_* environment
// variables, then URI query parameters.
struct NetConfig {
    std::chrono::milliseconds backoff_min{200};
    std::chrono::milliseconds backoff_max{30000};
    double backoff_factor = 2.0;
    // tries for the first connect before the broker construction fails
    unsigned connect_attempts = 5;
    // 0 keeps reconnecting forever
    unsigned max_reconnect_attempts = 0;

    std::string buried_queue_suffix = ".buriedQueue";
    std::string buried_exchange_suffix = ".buriedExchange";
    // RepublishBuried stops after this long without a buried message
    std::chrono::milliseconds buried_timeout{500};

    std::string retries_header = "x-retries";
    std::string error_header = "x-error-type";
};

// Malformed variables are skipped with a warning.
void apply_env(NetConfig& cfg);

// invalid_option on the first malformed or unknown parameter
boost::system::error_code apply_query(NetConfig& cfg, const Uri& uri);
