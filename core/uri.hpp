// filename: core/uri.hpp
#pragma once
#include <cstdint>
#include <map>
#include <string>

// scheme://host:port/path?key=value&key=value
struct Uri {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    std::map<std::string, std::string> query;
};

// false if there is no "scheme://" prefix or the authority is malformed
bool parse_uri(const std::string& text, Uri& out);

// Strict number parsing for config values; surrounding spaces are ignored.
bool parse_uint(const std::string& text, std::uint64_t& out);
bool parse_double(const std::string& text, double& out);
// a consumer window: 0 (unlimited) up to INT_MAX
bool parse_window(const std::string& text, int& out);
