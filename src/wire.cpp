// filename: src/wire.cpp
#include <core/wire.hpp>
#include <core/uri.hpp>
#include <algorithm>
#include <chrono>
#include <cstring>
#include <limits>
#if defined(_WIN32)
#include <winsock2.h>
#else
#include <arpa/inet.h>
#endif

namespace {

std::int32_t saturate(std::int64_t v) {
    if (v > std::numeric_limits<std::int32_t>::max()) return std::numeric_limits<std::int32_t>::max();
    if (v < std::numeric_limits<std::int32_t>::min()) return std::numeric_limits<std::int32_t>::min();
    return static_cast<std::int32_t>(v);
}

bool known_type(std::uint8_t t) {
    switch (static_cast<FrameType>(t)) {
        case FrameType::declare:
        case FrameType::bind:
        case FrameType::publish:
        case FrameType::publish_batch:
        case FrameType::consume:
        case FrameType::cancel:
        case FrameType::ack:
        case FrameType::nack:
        case FrameType::ok:
        case FrameType::error:
        case FrameType::deliver:
            return true;
    }
    return false;
}

} // namespace

FrameWriter::FrameWriter(FrameType type) {
    buf_.reserve(64);
    buf_.push_back(static_cast<char>(type));
    buf_.resize(kFrameHeaderSize);
}

void FrameWriter::put_u8(std::uint8_t v) {
    buf_.push_back(static_cast<char>(v));
}

void FrameWriter::put_u16(std::uint16_t v) {
    std::uint16_t net = htons(v);
    const char* p = reinterpret_cast<const char*>(&net);
    buf_.insert(buf_.end(), p, p + sizeof(net));
}

void FrameWriter::put_u32(std::uint32_t v) {
    std::uint32_t net = htonl(v);
    const char* p = reinterpret_cast<const char*>(&net);
    buf_.insert(buf_.end(), p, p + sizeof(net));
}

void FrameWriter::put_u64(std::uint64_t v) {
    put_u32(static_cast<std::uint32_t>(v >> 32));
    put_u32(static_cast<std::uint32_t>(v & 0xffffffffu));
}

void FrameWriter::put_str(const std::string& s) {
    put_u32(static_cast<std::uint32_t>(s.size()));
    buf_.insert(buf_.end(), s.begin(), s.end());
}

std::vector<char> FrameWriter::finish() {
    std::uint32_t net = htonl(static_cast<std::uint32_t>(buf_.size() - kFrameHeaderSize));
    std::memcpy(buf_.data() + 1, &net, sizeof(net));
    return std::move(buf_);
}

bool FrameReader::get_u8(std::uint8_t& v) {
    if (len_ - pos_ < 1) return false;
    v = static_cast<std::uint8_t>(data_[pos_]);
    pos_ += 1;
    return true;
}

bool FrameReader::get_u16(std::uint16_t& v) {
    if (len_ - pos_ < sizeof(v)) return false;
    std::uint16_t net;
    std::memcpy(&net, data_ + pos_, sizeof(net));
    v = ntohs(net);
    pos_ += sizeof(net);
    return true;
}

bool FrameReader::get_u32(std::uint32_t& v) {
    if (len_ - pos_ < sizeof(v)) return false;
    std::uint32_t net;
    std::memcpy(&net, data_ + pos_, sizeof(net));
    v = ntohl(net);
    pos_ += sizeof(net);
    return true;
}

bool FrameReader::get_u64(std::uint64_t& v) {
    std::uint32_t hi = 0, lo = 0;
    if (!get_u32(hi) || !get_u32(lo)) return false;
    v = (static_cast<std::uint64_t>(hi) << 32) | lo;
    return true;
}

bool FrameReader::get_i64(std::int64_t& v) {
    std::uint64_t u = 0;
    if (!get_u64(u)) return false;
    v = static_cast<std::int64_t>(u);
    return true;
}

bool FrameReader::get_str(std::string& s) {
    std::uint32_t n = 0;
    if (!get_u32(n)) return false;
    if (len_ - pos_ < n) return false;
    s.assign(data_ + pos_, n);
    pos_ += n;
    return true;
}

boost::system::error_code wire_error(std::uint32_t code) {
    if (code < static_cast<std::uint32_t>(mq_errc::empty_job) ||
        code > static_cast<std::uint32_t>(mq_errc::malformed_frame)) {
        return make_error_code(mq_errc::connection_lost);
    }
    return make_error_code(static_cast<mq_errc>(code));
}

bool parse_frame_header(const char* header, FrameType& type, std::uint32_t& len) {
    const auto t = static_cast<std::uint8_t>(header[0]);
    std::uint32_t net;
    std::memcpy(&net, header + 1, sizeof(net));
    len = ntohl(net);
    if (!known_type(t) || len > kMaxFrameLen) return false;
    type = static_cast<FrameType>(t);
    return true;
}

void write_job(FrameWriter& w, const Job& job, const NetConfig& cfg) {
    w.put_str(job.id);
    w.put_u8(static_cast<std::uint8_t>(job.priority));
    w.put_i64(std::chrono::duration_cast<std::chrono::nanoseconds>(
                  job.timestamp.time_since_epoch()).count());
    w.put_str(job.content_type);

    std::uint16_t count = 0;
    if (job.retries != 0) ++count;
    if (!job.error_type.empty()) ++count;
    w.put_u16(count);
    if (job.retries != 0) {
        w.put_str(cfg.retries_header);
        w.put_u8(static_cast<std::uint8_t>(HeaderTag::int32));
        w.put_u32(static_cast<std::uint32_t>(job.retries));
    }
    if (!job.error_type.empty()) {
        w.put_str(cfg.error_header);
        w.put_u8(static_cast<std::uint8_t>(HeaderTag::string));
        w.put_str(job.error_type);
    }

    w.put_str(job.raw);
}

bool read_job(FrameReader& r, Job& job, const NetConfig& cfg) {
    std::uint8_t prio = 0;
    std::int64_t ts = 0;
    std::uint16_t count = 0;
    if (!r.get_str(job.id) || !r.get_u8(prio) || !r.get_i64(ts) ||
        !r.get_str(job.content_type) || !r.get_u16(count)) {
        return false;
    }
    job.priority = static_cast<Priority>(prio);
    job.timestamp = std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::nanoseconds(ts)));
    job.retries = 0;
    job.error_type.clear();

    for (std::uint16_t i = 0; i < count; ++i) {
        std::string key;
        std::uint8_t tag = 0;
        if (!r.get_str(key) || !r.get_u8(tag)) return false;

        std::int64_t number = 0;
        std::string text;
        bool is_number = true;
        switch (static_cast<HeaderTag>(tag)) {
            case HeaderTag::int16: {
                std::uint16_t v = 0;
                if (!r.get_u16(v)) return false;
                number = static_cast<std::int16_t>(v);
                break;
            }
            case HeaderTag::int32: {
                std::uint32_t v = 0;
                if (!r.get_u32(v)) return false;
                number = static_cast<std::int32_t>(v);
                break;
            }
            case HeaderTag::int64: {
                if (!r.get_i64(number)) return false;
                break;
            }
            case HeaderTag::string: {
                if (!r.get_str(text)) return false;
                is_number = false;
                break;
            }
            default:
                return false;
        }

        if (key == cfg.retries_header) {
            if (is_number) {
                job.retries = saturate(number);
            } else {
                std::uint64_t parsed = 0;
                if (parse_uint(text, parsed)) job.retries = saturate(static_cast<std::int64_t>(
                    std::min<std::uint64_t>(parsed, std::numeric_limits<std::int64_t>::max())));
            }
        } else if (key == cfg.error_header && !is_number) {
            job.error_type = text;
        }
    }

    return r.get_str(job.raw);
}
