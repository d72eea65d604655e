// filename: src/uri.cpp
#include <core/uri.hpp>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <limits>

namespace {

void trim(const char*& b, const char*& e) {
    while (b < e && std::isspace(static_cast<unsigned char>(*b))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(e[-1]))) --e;
}

bool valid_scheme(const std::string& s) {
    if (s.empty() || !std::isalpha(static_cast<unsigned char>(s[0]))) return false;
    for (char c : s) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

bool split_authority(const std::string& auth, Uri& out) {
    if (auth.empty()) return true;
    if (auth[0] == '[') {
        auto close = auth.find(']');
        if (close == std::string::npos) return false;
        out.host = auth.substr(1, close - 1);
        if (close + 1 < auth.size()) {
            if (auth[close + 1] != ':') return false;
            out.port = auth.substr(close + 2);
        }
    } else {
        auto colon = auth.rfind(':');
        if (colon == std::string::npos) {
            out.host = auth;
        } else {
            out.host = auth.substr(0, colon);
            out.port = auth.substr(colon + 1);
        }
    }
    for (char c : out.port) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

void split_query(const std::string& q, Uri& out) {
    std::size_t pos = 0;
    while (pos <= q.size()) {
        auto amp = q.find('&', pos);
        if (amp == std::string::npos) amp = q.size();
        std::string pair = q.substr(pos, amp - pos);
        if (!pair.empty()) {
            auto eq = pair.find('=');
            if (eq == std::string::npos) {
                out.query[pair] = "";
            } else {
                out.query[pair.substr(0, eq)] = pair.substr(eq + 1);
            }
        }
        pos = amp + 1;
    }
}

} // namespace

bool parse_uri(const std::string& text, Uri& out) {
    out = Uri{};
    auto sep = text.find("://");
    if (sep == std::string::npos) return false;
    out.scheme = text.substr(0, sep);
    if (!valid_scheme(out.scheme)) return false;

    std::string rest = text.substr(sep + 3);
    std::string query;
    auto qmark = rest.find('?');
    if (qmark != std::string::npos) {
        query = rest.substr(qmark + 1);
        rest.resize(qmark);
    }
    auto slash = rest.find('/');
    std::string auth = rest.substr(0, slash);
    if (slash != std::string::npos) out.path = rest.substr(slash);

    if (!split_authority(auth, out)) return false;
    split_query(query, out);
    return true;
}

bool parse_uint(const std::string& text, std::uint64_t& out) {
    const char* b = text.data();
    const char* e = text.data() + text.size();
    trim(b, e);
    if (b == e) return false;
    std::uint64_t v = 0;
    auto res = std::from_chars(b, e, v, 10);
    if (res.ec != std::errc{} || res.ptr != e) return false;
    out = v;
    return true;
}

bool parse_window(const std::string& text, int& out) {
    std::uint64_t v = 0;
    if (!parse_uint(text, v) || v > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
        return false;
    }
    out = static_cast<int>(v);
    return true;
}

bool parse_double(const std::string& text, double& out) {
    const char* b = text.data();
    const char* e = text.data() + text.size();
    trim(b, e);
    if (b == e) return false;
    std::string s(b, e);
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size()) return false;
    out = v;
    return true;
}
