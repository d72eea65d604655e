// filename: core/job.hpp
#pragma once
#include <boost/system/error_code.hpp>
#include <core/codec.hpp>
#include <core/errors.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

// Priority levels, numerically comparable. Higher is consumed first.
enum class Priority : std::uint8_t {
    low = 2,
    normal = 4,
    high = 6,
    urgent = 8,
};

struct Job;

// Disposition capability bound to one delivery of a Job.
// pending -> settled; the first ack/reject wins, later calls fail with
// cannot_acknowledge.
class Acknowledger {
public:
    virtual ~Acknowledger() = default;

    boost::system::error_code ack(const Job& job);
    boost::system::error_code reject(const Job& job, bool requeue);

    bool settled() const noexcept { return settled_.load(std::memory_order_acquire); }

protected:
    virtual boost::system::error_code do_ack(const Job& job) = 0;
    virtual boost::system::error_code do_reject(const Job& job, bool requeue) = 0;

private:
    std::atomic<bool> settled_{false};
};

struct Job {
    std::string id;
    Priority priority = Priority::normal;
    std::chrono::system_clock::time_point timestamp{};
    // retries left (or attempted); comes from redelivery headers when present
    std::int32_t retries = 0;
    // kind of error that made the job fail, empty if none
    std::string error_type;
    std::string content_type;
    std::string raw;
    // null until the job is handed out by a JobIter
    std::unique_ptr<Acknowledger> acknowledger;

    // New job with a unique id, normal priority, current time and text/plain.
    static std::shared_ptr<Job> make();

    // Copy of every field except the acknowledger.
    std::shared_ptr<Job> clone() const;

    void set_priority(Priority p) { priority = p; }
    std::size_t size() const noexcept { return raw.size(); }

    template <typename T>
    boost::system::error_code encode(const T& payload) {
        return encode_payload(content_type, payload, raw);
    }

    template <typename T>
    boost::system::error_code decode(T& payload) const {
        return decode_payload(content_type, raw, payload);
    }

    boost::system::error_code ack();
    boost::system::error_code reject(bool requeue);
};

using JobPtr = std::shared_ptr<Job>;

// Filters buried jobs for RepublishBuried. Conditions are and-ed; an empty
// list matches everything.
using RepublishCondition = std::function<bool(const Job&)>;
using RepublishConditions = std::vector<RepublishCondition>;

bool comply(const RepublishConditions& conditions, const Job& job);

std::string generate_job_id();
