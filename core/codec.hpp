// filename: core/codec.hpp
#pragma once
#include <boost/lexical_cast.hpp>
#include <boost/system/error_code.hpp>
#include <core/errors.hpp>
#include <string>
#include <type_traits>

// Payload codecs keyed by content type.
//  text/plain               -> lexical_cast text form (numbers, strings)
//  application/octet-stream -> raw bytes, string-like values only

constexpr const char* kContentTypeText = "text/plain";
constexpr const char* kContentTypeBinary = "application/octet-stream";

template <typename T>
boost::system::error_code encode_payload(const std::string& content_type,
                                         const T& value,
                                         std::string& out) {
    if (content_type == kContentTypeText) {
        try {
            out = boost::lexical_cast<std::string>(value);
        } catch (const boost::bad_lexical_cast&) {
            return make_error_code(mq_errc::payload_mismatch);
        }
        return {};
    }
    if (content_type == kContentTypeBinary) {
        if constexpr (std::is_convertible<const T&, std::string>::value) {
            out = std::string(value);
            return {};
        } else {
            return make_error_code(mq_errc::payload_mismatch);
        }
    }
    return make_error_code(mq_errc::unknown_content_type);
}

template <typename T>
boost::system::error_code decode_payload(const std::string& content_type,
                                         const std::string& raw,
                                         T& value) {
    if (content_type == kContentTypeText) {
        try {
            value = boost::lexical_cast<T>(raw);
        } catch (const boost::bad_lexical_cast&) {
            return make_error_code(mq_errc::payload_mismatch);
        }
        return {};
    }
    if (content_type == kContentTypeBinary) {
        if constexpr (std::is_assignable<T&, const std::string&>::value) {
            value = raw;
            return {};
        } else {
            return make_error_code(mq_errc::payload_mismatch);
        }
    }
    return make_error_code(mq_errc::unknown_content_type);
}
