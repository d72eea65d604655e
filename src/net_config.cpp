// filename: src/net_config.cpp
#include <core/net_config.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <limits>

namespace {

const char* const kOptionKeys[] = {
    "backoff_min_ms",
    "backoff_max_ms",
    "backoff_factor",
    "connect_attempts",
    "max_reconnect_attempts",
    "buried_queue_suffix",
    "buried_exchange_suffix",
    "buried_timeout_ms",
    "retries_header",
    "error_header",
};

enum class SetResult { ok, malformed, unknown };

bool to_unsigned(const std::string& v, unsigned& out) {
    std::uint64_t n = 0;
    if (!parse_uint(v, n) || n > std::numeric_limits<unsigned>::max()) return false;
    out = static_cast<unsigned>(n);
    return true;
}

bool to_millis(const std::string& v, std::chrono::milliseconds& out) {
    std::uint64_t n = 0;
    if (!parse_uint(v, n)) return false;
    out = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(n));
    return true;
}

SetResult set_option(NetConfig& cfg, const std::string& key, const std::string& value) {
    bool ok = true;
    if (key == "backoff_min_ms") {
        ok = to_millis(value, cfg.backoff_min);
    } else if (key == "backoff_max_ms") {
        ok = to_millis(value, cfg.backoff_max);
    } else if (key == "backoff_factor") {
        double f = 0;
        ok = parse_double(value, f) && f >= 1.0;
        if (ok) cfg.backoff_factor = f;
    } else if (key == "connect_attempts") {
        unsigned n = 0;
        ok = to_unsigned(value, n) && n > 0;
        if (ok) cfg.connect_attempts = n;
    } else if (key == "max_reconnect_attempts") {
        ok = to_unsigned(value, cfg.max_reconnect_attempts);
    } else if (key == "buried_queue_suffix") {
        ok = !value.empty();
        if (ok) cfg.buried_queue_suffix = value;
    } else if (key == "buried_exchange_suffix") {
        ok = !value.empty();
        if (ok) cfg.buried_exchange_suffix = value;
    } else if (key == "buried_timeout_ms") {
        ok = to_millis(value, cfg.buried_timeout);
    } else if (key == "retries_header") {
        ok = !value.empty();
        if (ok) cfg.retries_header = value;
    } else if (key == "error_header") {
        ok = !value.empty();
        if (ok) cfg.error_header = value;
    } else {
        return SetResult::unknown;
    }
    return ok ? SetResult::ok : SetResult::malformed;
}

std::string env_name(const std::string& key) {
    std::string name = "JOBQ_";
    for (char c : key) name += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return name;
}

} // namespace

void apply_env(NetConfig& cfg) {
    for (const char* key : kOptionKeys) {
        const std::string name = env_name(key);
        const char* env = std::getenv(name.c_str());
        if (!env) continue;
        if (set_option(cfg, key, env) != SetResult::ok) {
            LogLine(LogLevel::warn, "config") << "ignoring " << name << " (malformed): '" << env << "'";
        }
    }
}

boost::system::error_code apply_query(NetConfig& cfg, const Uri& uri) {
    for (const auto& kv : uri.query) {
        switch (set_option(cfg, kv.first, kv.second)) {
            case SetResult::ok:
                break;
            case SetResult::malformed:
                LogLine(LogLevel::error, "config") << "malformed option " << kv.first << "='" << kv.second << "'";
                return make_error_code(mq_errc::invalid_option);
            case SetResult::unknown:
                LogLine(LogLevel::error, "config") << "unknown option '" << kv.first << "'";
                return make_error_code(mq_errc::invalid_option);
        }
    }
    if (cfg.backoff_max < cfg.backoff_min) cfg.backoff_max = cfg.backoff_min;
    return {};
}
