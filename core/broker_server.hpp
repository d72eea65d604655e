// filename: core/broker_server.hpp
#pragma once
#include <boost/asio.hpp>
#include <core/backoff.hpp>
#include <core/broker_context.hpp>
#include <core/queue.hpp>
#include <core/wire.hpp>
#include <array>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

// jobqd: hosts queues of ctx->backend and serves them over the jobq frame
// protocol. One acceptor; every session shares the server strand, and so do
// the delivery timers of all consumers.
class BrokerServer {
public:
    // port 0 picks a free port, see port()
    BrokerServer(boost::asio::io_context& io_context,
                 unsigned short port,
                 std::shared_ptr<BrokerContext> ctx);

    ~BrokerServer();

    // Start accepting connections
    void start();

    // Closes the acceptor and every session; unsettled deliveries are
    // requeued. Blocks until done when called off the I/O thread.
    void stop();

    unsigned short port() const;

private:
    class Session;

    void listen(unsigned short port);
    void do_accept();
    void retry_accept(const boost::system::error_code& ec);
    void do_stop();

    boost::asio::io_context& io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    // serialize handlers
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    std::shared_ptr<BrokerContext> ctx_;

    boost::asio::steady_timer accept_retry_timer_;
    Backoff accept_backoff_;
    bool stopped_{false};

    std::mutex sessions_mu_;
    std::vector<std::weak_ptr<Session>> sessions_;

    // one client connection
    class Session : public std::enable_shared_from_this<Session> {
    public:
        Session(boost::asio::ip::tcp::socket socket,
                boost::asio::strand<boost::asio::io_context::executor_type> strand,
                std::shared_ptr<BrokerContext> ctx);

        ~Session();

        void start() { read_header(); }
        // strand only
        void stop();

    private:
        using Timer = boost::asio::steady_timer;

        // a subscription; its timer drives deliveries on the strand
        struct Consumer {
            std::string queue;
            std::shared_ptr<JobIter> iter;
            std::shared_ptr<Timer> timer;
        };

        // a delivery waiting for ack or nack
        struct Outstanding {
            std::uint64_t consumer_tag;
            std::string queue;
            JobPtr job;
        };

        void read_header();
        void read_body(FrameType type, uint32_t len);
        bool dispatch(FrameType type);
        bool on_declare(FrameReader& r);
        bool on_bind(FrameReader& r);
        bool on_publish(FrameReader& r);
        bool on_publish_batch(FrameReader& r);
        bool on_consume(FrameReader& r);
        bool on_cancel(FrameReader& r);
        bool on_ack(FrameReader& r);
        bool on_nack(FrameReader& r);

        // hands out whatever the consumer can take now, then re-arms
        void pump(std::uint64_t tag, const std::shared_ptr<Timer>& timer);
        void schedule_pump(std::uint64_t tag, const std::shared_ptr<Timer>& timer, bool at_once);
        void close_consumer(std::uint64_t tag, Consumer& c);
        void close_consumers();

        void deliver(std::uint64_t tag, const std::string& queue, JobPtr job);
        void dead_letter(const Outstanding& o);
        void clamp_priority(const std::string& queue, Job& job);
        void requeue_unacked();

        void reply(std::uint64_t seq, const boost::system::error_code& ec);
        void send(std::vector<char> frame);
        void do_write();
        void fail(const char* where, const boost::system::error_code& ec);
        void reject_malformed(const char* where, uint8_t type, uint32_t len);

        boost::asio::ip::tcp::socket socket_;
        boost::asio::strand<boost::asio::io_context::executor_type> strand_;
        std::shared_ptr<BrokerContext> ctx_;
        std::string peer_ip_;
        bool stopped_{false};

        std::array<char, kFrameHeaderSize> header_{};
        std::vector<char> buffer_;

        std::deque<std::shared_ptr<std::vector<char>>> out_;
        bool writing_{false};

        std::unordered_map<std::uint64_t, Consumer> consumers_;

        std::uint64_t next_delivery_tag_{1};
        std::map<std::uint64_t, Outstanding> unacked_;
    };
};
