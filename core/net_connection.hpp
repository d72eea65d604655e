// filename: core/net_connection.hpp
#pragma once
#include <boost/asio.hpp>
#include <core/backoff.hpp>
#include <core/job.hpp>
#include <core/mutex_queue.hpp>
#include <core/net_config.hpp>
#include <core/wire.hpp>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// One job pushed by the daemon to a consumer.
struct Delivery {
    std::uint64_t delivery_tag = 0;
    // connection generation the delivery arrived on
    std::uint64_t generation = 0;
    JobPtr job;
};

using DeliveryBuffer = MutexQueue<Delivery>;

// Client side of the jobq frame protocol with the reconnect loop.
//
// All socket work happens on one I/O thread behind a strand. Public calls
// post to the strand; requests (declare, bind, publish, consume, cancel)
// block until the daemon confirms them. After a lost connection the loop
// reconnects with exponential backoff, bumps the generation, replays the
// declarations and subscriptions, and resends every unconfirmed request.
class NetConnection {
public:
    NetConnection(std::string host, std::string port, NetConfig cfg);
    ~NetConnection();

    NetConnection(const NetConnection&) = delete;
    NetConnection& operator=(const NetConnection&) = delete;

    // First connect, retried up to connect_attempts times.
    boost::system::error_code open();

    // Idempotent. Pending requests fail with already_closed and every
    // subscription buffer is closed. Must not be called from the I/O thread.
    void close();

    boost::system::error_code declare(const std::string& queue, Priority max_priority,
                                      const std::string& dead_letter_exchange);
    boost::system::error_code bind(const std::string& exchange, const std::string& queue);
    boost::system::error_code publish(const std::string& queue, const Job& job,
                                      std::chrono::milliseconds delay);
    boost::system::error_code publish_batch(const std::string& queue,
                                            const std::vector<JobPtr>& jobs);

    // returns the consumer tag; deliveries are pushed into buffer
    std::uint64_t subscribe(const std::string& queue, int window,
                            std::shared_ptr<DeliveryBuffer> buffer,
                            boost::system::error_code& ec);
    void cancel(std::uint64_t consumer_tag);

    // Settlements of an older generation are dropped: the daemon already
    // requeued those jobs when the connection went away.
    boost::system::error_code ack(std::uint64_t delivery_tag, std::uint64_t generation);
    boost::system::error_code nack(std::uint64_t delivery_tag, std::uint64_t generation,
                                   bool requeue, std::int32_t retries,
                                   const std::string& error_type);

    std::uint64_t generation() const noexcept { return generation_.load(std::memory_order_acquire); }
    bool connected() const noexcept { return connected_flag_.load(std::memory_order_acquire); }
    // reconnect_failed once the retry budget is spent, already_closed after close()
    boost::system::error_code failure() const;
    const NetConfig& config() const noexcept { return cfg_; }

    // confirmed declarations and bindings replayed after a reconnect
    std::size_t declaration_count();

private:
    using Frame = std::shared_ptr<std::vector<char>>;
    using Promise = std::promise<boost::system::error_code>;

    struct Pending {
        Frame frame;
        std::shared_ptr<Promise> done;
        // runs on the strand once the daemon answered ok
        std::function<void()> confirmed;
    };

    struct Subscription {
        std::string queue;
        std::uint32_t window;
        std::weak_ptr<DeliveryBuffer> buffer;
    };

    struct Declaration {
        FrameType type;
        std::string queue;
        // dead-letter exchange for declare, exchange for bind
        std::string exchange;
        std::uint8_t max_priority;
    };

    std::uint64_t next_seq() { return next_seq_.fetch_add(1, std::memory_order_relaxed); }

    boost::system::error_code request(std::uint64_t seq, std::vector<char> frame,
                                      std::function<void()> remember = {},
                                      std::function<void()> confirmed = {});
    boost::system::error_code wait(std::future<boost::system::error_code>& result) const;
    void post_frame(std::vector<char> frame, std::uint64_t generation);

    static std::vector<char> declaration_frame(std::uint64_t seq, const Declaration& d);
    static std::vector<char> consume_frame(std::uint64_t seq, std::uint64_t tag,
                                           const Subscription& sub);

    // strand only
    void do_connect();
    void on_connected();
    void on_connect_failed(const boost::system::error_code& ec);
    void connection_lost(const boost::system::error_code& ec);
    void schedule_reconnect();
    void give_up(const boost::system::error_code& ec);
    void read_header(std::uint64_t gen);
    void read_body(std::uint64_t gen, FrameType type, std::uint32_t len);
    bool handle_frame(FrameType type);
    void complete(std::uint64_t seq, const boost::system::error_code& ec);
    void remember_declaration(const Declaration& d);
    void enqueue_write(Frame frame);
    void do_write();
    void fail_all(const boost::system::error_code& ec);
    void drop_socket();

    const std::string host_;
    const std::string port_;
    const NetConfig cfg_;

    boost::asio::io_context io_;
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    boost::asio::ip::tcp::socket socket_;
    boost::asio::ip::tcp::resolver resolver_;
    boost::asio::steady_timer reconnect_timer_;
    std::thread thread_;

    std::atomic<std::uint64_t> next_seq_{1};
    std::atomic<std::uint64_t> next_consumer_tag_{1};
    std::atomic<std::uint64_t> generation_{0};
    std::atomic<bool> connected_flag_{false};
    std::atomic<bool> closed_{false};
    std::atomic<bool> stopped_{false};

    mutable std::mutex failure_mu_;
    boost::system::error_code failure_;

    // strand-only state
    Backoff backoff_;
    unsigned attempt_ = 0;
    bool connected_ = false;
    bool closing_ = false;
    bool failed_ = false;
    bool writing_ = false;
    std::shared_ptr<Promise> open_promise_;
    std::deque<Frame> write_queue_;
    std::map<std::uint64_t, Pending> pending_;
    std::map<std::uint64_t, Subscription> subscriptions_;
    std::vector<Declaration> declarations_;
    std::array<char, kFrameHeaderSize> header_buf_{};
    std::vector<char> body_buf_;
};
