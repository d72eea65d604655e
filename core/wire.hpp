// filename: core/wire.hpp
#pragma once
#include <core/errors.hpp>
#include <core/job.hpp>
#include <core/net_config.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// jobq frame protocol.
//
// Frame: type (u8) | body length (u32) | body
// Integers are in network order, strings are u32 length + bytes.
//
// client -> daemon
//   declare        seq u64, queue, max_priority u8, dead_letter_exchange
//   bind           seq u64, exchange, queue
//   publish        seq u64, queue, delay_ms u32, job
//   publish_batch  seq u64, queue, count u32, job...
//   consume        seq u64, consumer_tag u64, queue, window u32
//   cancel         seq u64, consumer_tag u64
//   ack            delivery_tag u64
//   nack           delivery_tag u64, requeue u8, retries i32 (as u32), error_type
// daemon -> client
//   ok             seq u64
//   error          seq u64, code u32 (mq_errc)
//   deliver        consumer_tag u64, delivery_tag u64, job
//
// job: id, priority u8, timestamp i64 (ns since epoch), content_type,
//      headers (u16 count; key, tag u8, value), body

enum class FrameType : std::uint8_t {
    declare = 1,
    bind = 2,
    publish = 3,
    publish_batch = 4,
    consume = 5,
    cancel = 6,
    ack = 7,
    nack = 8,
    ok = 20,
    error = 21,
    deliver = 22,
};

// value type tags of the header table
enum class HeaderTag : std::uint8_t {
    string = 's',
    int16 = 'h',
    int32 = 'i',
    int64 = 'l',
};

constexpr std::size_t kFrameHeaderSize = sizeof(std::uint8_t) + sizeof(std::uint32_t);
constexpr std::uint32_t kMaxFrameLen = 16 * 1024 * 1024;

class FrameWriter {
public:
    explicit FrameWriter(FrameType type);

    void put_u8(std::uint8_t v);
    void put_u16(std::uint16_t v);
    void put_u32(std::uint32_t v);
    void put_u64(std::uint64_t v);
    void put_i64(std::int64_t v) { put_u64(static_cast<std::uint64_t>(v)); }
    void put_str(const std::string& s);

    // fills in the body length and hands over the bytes
    std::vector<char> finish();

private:
    std::vector<char> buf_;
};

class FrameReader {
public:
    FrameReader(const char* data, std::size_t len) : data_(data), len_(len) {}

    bool get_u8(std::uint8_t& v);
    bool get_u16(std::uint16_t& v);
    bool get_u32(std::uint32_t& v);
    bool get_u64(std::uint64_t& v);
    bool get_i64(std::int64_t& v);
    bool get_str(std::string& s);

    bool done() const noexcept { return pos_ == len_; }

private:
    const char* data_;
    std::size_t len_;
    std::size_t pos_ = 0;
};

// Error code carried by an error frame; codes this side does not know
// become connection_lost.
boost::system::error_code wire_error(std::uint32_t code);

// false for unknown frame types and bodies above kMaxFrameLen
bool parse_frame_header(const char* header, FrameType& type, std::uint32_t& len);

void write_job(FrameWriter& w, const Job& job, const NetConfig& cfg);

// The retries header may be int16, int32, int64 or a decimal string; it is
// narrowed to int32 with saturation.
bool read_job(FrameReader& r, Job& job, const NetConfig& cfg);
