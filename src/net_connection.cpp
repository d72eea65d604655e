// filename: src/net_connection.cpp
#include <core/net_connection.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <boost/asio/bind_executor.hpp>
#include <algorithm>
#include <exception>
#include <limits>

namespace {
    // how often a blocked request looks at the I/O thread
    constexpr std::chrono::milliseconds kWaitTick{50};
}

NetConnection::NetConnection(std::string host, std::string port, NetConfig cfg)
    : host_(std::move(host)),
      port_(std::move(port)),
      cfg_(std::move(cfg)),
      strand_(io_.get_executor()),
      work_(boost::asio::make_work_guard(io_)),
      socket_(io_),
      resolver_(io_),
      reconnect_timer_(io_),
      backoff_(cfg_.backoff_min, cfg_.backoff_max, cfg_.backoff_factor)
{
    thread_ = std::thread([this] {
        for (;;) {
            try {
                io_.run();
                break;
            } catch (const std::exception& e) {
                LogLine(LogLevel::error, "net") << "I/O handler threw: " << e.what();
            }
        }
        stopped_.store(true, std::memory_order_release);
    });
}

NetConnection::~NetConnection() {
    close();
}

boost::system::error_code NetConnection::open() {
    auto done = std::make_shared<Promise>();
    auto result = done->get_future();
    boost::asio::post(strand_, [this, done] {
        if (closing_) { done->set_value(make_error_code(mq_errc::already_closed)); return; }
        open_promise_ = done;
        attempt_ = 0;
        do_connect();
    });
    return wait(result);
}

void NetConnection::close() {
    if (closed_.exchange(true, std::memory_order_acq_rel)) return;

    std::promise<void> done;
    auto finished = done.get_future();
    boost::asio::post(strand_, [this, &done] {
        closing_ = true;
        reconnect_timer_.cancel();
        resolver_.cancel();
        drop_socket();
        fail_all(make_error_code(mq_errc::already_closed));
        done.set_value();
    });
    while (finished.wait_for(kWaitTick) != std::future_status::ready) {
        if (stopped_.load(std::memory_order_acquire)) break;
    }

    work_.reset();
    io_.stop();
    if (thread_.joinable()) thread_.join();
    LogLine(LogLevel::debug, "net") << "connection to " << host_ << ":" << port_ << " closed";
}

boost::system::error_code NetConnection::failure() const {
    std::lock_guard<std::mutex> lk(failure_mu_);
    return failure_;
}

std::size_t NetConnection::declaration_count() {
    if (closed_.load(std::memory_order_acquire)) return 0;
    auto count = std::make_shared<std::promise<std::size_t>>();
    auto result = count->get_future();
    boost::asio::post(strand_, [this, count] { count->set_value(declarations_.size()); });
    while (result.wait_for(kWaitTick) != std::future_status::ready) {
        if (stopped_.load(std::memory_order_acquire)) return 0;
    }
    return result.get();
}

boost::system::error_code NetConnection::wait(std::future<boost::system::error_code>& result) const {
    while (result.wait_for(kWaitTick) != std::future_status::ready) {
        if (stopped_.load(std::memory_order_acquire)) {
            return make_error_code(mq_errc::already_closed);
        }
    }
    return result.get();
}

boost::system::error_code NetConnection::request(std::uint64_t seq, std::vector<char> frame,
                                                 std::function<void()> remember,
                                                 std::function<void()> confirmed) {
    if (closed_.load(std::memory_order_acquire)) return make_error_code(mq_errc::already_closed);

    auto done = std::make_shared<Promise>();
    auto result = done->get_future();
    auto shared = std::make_shared<std::vector<char>>(std::move(frame));
    boost::asio::post(strand_, [this, seq, shared, done, remember = std::move(remember),
                                confirmed = std::move(confirmed)]() mutable {
        if (closing_) { done->set_value(make_error_code(mq_errc::already_closed)); return; }
        if (failed_) { done->set_value(failure()); return; }
        if (remember) remember();
        pending_.emplace(seq, Pending{shared, done, std::move(confirmed)});
        // written now or resent by on_connected()
        if (connected_) enqueue_write(shared);
    });
    return wait(result);
}

void NetConnection::post_frame(std::vector<char> frame, std::uint64_t generation) {
    auto shared = std::make_shared<std::vector<char>>(std::move(frame));
    boost::asio::post(strand_, [this, shared, generation] {
        if (!connected_ || generation != generation_.load(std::memory_order_acquire)) {
            LogLine(LogLevel::debug, "net") << "dropping settlement of generation " << generation;
            return;
        }
        enqueue_write(shared);
    });
}

std::vector<char> NetConnection::declaration_frame(std::uint64_t seq, const Declaration& d) {
    FrameWriter w(d.type);
    w.put_u64(seq);
    if (d.type == FrameType::declare) {
        w.put_str(d.queue);
        w.put_u8(d.max_priority);
        w.put_str(d.exchange);
    } else {
        w.put_str(d.exchange);
        w.put_str(d.queue);
    }
    return w.finish();
}

std::vector<char> NetConnection::consume_frame(std::uint64_t seq, std::uint64_t tag,
                                               const Subscription& sub) {
    FrameWriter w(FrameType::consume);
    w.put_u64(seq);
    w.put_u64(tag);
    w.put_str(sub.queue);
    w.put_u32(sub.window);
    return w.finish();
}

boost::system::error_code NetConnection::declare(const std::string& queue, Priority max_priority,
                                                 const std::string& dead_letter_exchange) {
    Declaration d{FrameType::declare, queue, dead_letter_exchange,
                  static_cast<std::uint8_t>(max_priority)};
    const auto seq = next_seq();
    auto frame = declaration_frame(seq, d);
    return request(seq, std::move(frame), {}, [this, d] { remember_declaration(d); });
}

boost::system::error_code NetConnection::bind(const std::string& exchange, const std::string& queue) {
    Declaration d{FrameType::bind, queue, exchange, 0};
    const auto seq = next_seq();
    auto frame = declaration_frame(seq, d);
    return request(seq, std::move(frame), {}, [this, d] { remember_declaration(d); });
}

boost::system::error_code NetConnection::publish(const std::string& queue, const Job& job,
                                                 std::chrono::milliseconds delay) {
    const auto seq = next_seq();
    const auto max_delay = static_cast<std::chrono::milliseconds::rep>(
        std::numeric_limits<std::uint32_t>::max());
    const auto delay_ms = std::clamp<std::chrono::milliseconds::rep>(delay.count(), 0, max_delay);

    FrameWriter w(FrameType::publish);
    w.put_u64(seq);
    w.put_str(queue);
    w.put_u32(static_cast<std::uint32_t>(delay_ms));
    write_job(w, job, cfg_);
    return request(seq, w.finish());
}

boost::system::error_code NetConnection::publish_batch(const std::string& queue,
                                                       const std::vector<JobPtr>& jobs) {
    const auto seq = next_seq();
    FrameWriter w(FrameType::publish_batch);
    w.put_u64(seq);
    w.put_str(queue);
    w.put_u32(static_cast<std::uint32_t>(jobs.size()));
    for (const auto& job : jobs) write_job(w, *job, cfg_);
    return request(seq, w.finish());
}

std::uint64_t NetConnection::subscribe(const std::string& queue, int window,
                                       std::shared_ptr<DeliveryBuffer> buffer,
                                       boost::system::error_code& ec) {
    const auto tag = next_consumer_tag_.fetch_add(1, std::memory_order_relaxed);
    Subscription sub{queue, window > 0 ? static_cast<std::uint32_t>(window) : 0u, buffer};
    const auto seq = next_seq();
    auto frame = consume_frame(seq, tag, sub);
    ec = request(seq, std::move(frame), [this, tag, sub] { subscriptions_[tag] = sub; });
    if (ec) {
        boost::asio::post(strand_, [this, tag] { subscriptions_.erase(tag); });
        return 0;
    }
    LogLine(LogLevel::debug, "net") << "consumer " << tag << " subscribed to '" << queue << "'";
    return tag;
}

void NetConnection::cancel(std::uint64_t consumer_tag) {
    if (closed_.load(std::memory_order_acquire)) return;
    boost::asio::post(strand_, [this, consumer_tag] {
        subscriptions_.erase(consumer_tag);
        if (!connected_) return;
        FrameWriter w(FrameType::cancel);
        w.put_u64(0);
        w.put_u64(consumer_tag);
        enqueue_write(std::make_shared<std::vector<char>>(w.finish()));
    });
}

boost::system::error_code NetConnection::ack(std::uint64_t delivery_tag, std::uint64_t generation) {
    if (closed_.load(std::memory_order_acquire)) return make_error_code(mq_errc::already_closed);
    FrameWriter w(FrameType::ack);
    w.put_u64(delivery_tag);
    post_frame(w.finish(), generation);
    return {};
}

boost::system::error_code NetConnection::nack(std::uint64_t delivery_tag, std::uint64_t generation,
                                              bool requeue, std::int32_t retries,
                                              const std::string& error_type) {
    if (closed_.load(std::memory_order_acquire)) return make_error_code(mq_errc::already_closed);
    FrameWriter w(FrameType::nack);
    w.put_u64(delivery_tag);
    w.put_u8(requeue ? 1 : 0);
    w.put_u32(static_cast<std::uint32_t>(retries));
    w.put_str(error_type);
    post_frame(w.finish(), generation);
    return {};
}

void NetConnection::do_connect() {
    using tcp = boost::asio::ip::tcp;
    resolver_.async_resolve(host_, port_,
        boost::asio::bind_executor(strand_,
            [this](const boost::system::error_code& ec, tcp::resolver::results_type results) {
                if (closing_) return;
                if (ec) { on_connect_failed(ec); return; }
                boost::asio::async_connect(socket_, results,
                    boost::asio::bind_executor(strand_,
                        [this](const boost::system::error_code& cec, const tcp::endpoint&) {
                            if (closing_) return;
                            if (cec) { on_connect_failed(cec); return; }
                            on_connected();
                        }));
            }));
}

void NetConnection::on_connected() {
    boost::system::error_code ignore;
    socket_.set_option(boost::asio::ip::tcp::no_delay(true), ignore);

    connected_ = true;
    attempt_ = 0;
    backoff_.reset();
    const auto gen = generation_.fetch_add(1, std::memory_order_acq_rel) + 1;
    connected_flag_.store(true, std::memory_order_release);
    LogLine(LogLevel::info, "net") << "connected to " << host_ << ":" << port_ << " (generation " << gen << ")";

    // topology first, then consumers, then unconfirmed requests in order
    for (const auto& d : declarations_) {
        enqueue_write(std::make_shared<std::vector<char>>(declaration_frame(0, d)));
    }
    for (auto it = subscriptions_.begin(); it != subscriptions_.end();) {
        if (it->second.buffer.expired()) {
            it = subscriptions_.erase(it);
            continue;
        }
        enqueue_write(std::make_shared<std::vector<char>>(consume_frame(0, it->first, it->second)));
        ++it;
    }
    for (auto& kv : pending_) enqueue_write(kv.second.frame);

    read_header(gen);

    if (open_promise_) {
        open_promise_->set_value({});
        open_promise_.reset();
    }
}

void NetConnection::on_connect_failed(const boost::system::error_code& ec) {
    ++attempt_;
    const unsigned limit = open_promise_ ? cfg_.connect_attempts : cfg_.max_reconnect_attempts;
    LogLine(LogLevel::warn, "net") << "connect to " << host_ << ":" << port_ << " failed (attempt " << attempt_
                                   << (limit ? "/" + std::to_string(limit) : std::string()) << "): "
                                   << ec.message();
    if (limit != 0 && attempt_ >= limit) {
        give_up(make_error_code(mq_errc::reconnect_failed));
        return;
    }
    schedule_reconnect();
}

void NetConnection::connection_lost(const boost::system::error_code& ec) {
    LogLine(LogLevel::warn, "net") << "connection to " << host_ << ":" << port_ << " lost: " << ec.message()
                                   << "; reconnecting";
    drop_socket();
    attempt_ = 0;
    backoff_.reset();
    schedule_reconnect();
}

void NetConnection::schedule_reconnect() {
    const auto delay = backoff_.next();
    LogLine(LogLevel::info, "net") << "retrying in " << delay.count() << " ms";
    reconnect_timer_.expires_after(delay);
    reconnect_timer_.async_wait(
        boost::asio::bind_executor(strand_, [this](const boost::system::error_code& tec) {
            if (tec || closing_) return;
            do_connect();
        }));
}

void NetConnection::give_up(const boost::system::error_code& ec) {
    LogLine(LogLevel::error, "net") << "giving up on " << host_ << ":" << port_ << ": " << ec.message();
    failed_ = true;
    drop_socket();
    fail_all(ec);
}

void NetConnection::fail_all(const boost::system::error_code& ec) {
    {
        std::lock_guard<std::mutex> lk(failure_mu_);
        if (!failure_) failure_ = ec;
    }
    for (auto& kv : pending_) kv.second.done->set_value(ec);
    pending_.clear();
    for (auto& kv : subscriptions_) {
        if (auto buffer = kv.second.buffer.lock()) buffer->close();
    }
    subscriptions_.clear();
    if (open_promise_) {
        open_promise_->set_value(ec);
        open_promise_.reset();
    }
}

void NetConnection::drop_socket() {
    connected_ = false;
    connected_flag_.store(false, std::memory_order_release);
    writing_ = false;
    write_queue_.clear();
    boost::system::error_code ignore;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignore);
    socket_.close(ignore);
}

void NetConnection::read_header(std::uint64_t gen) {
    boost::asio::async_read(
        socket_,
        boost::asio::buffer(header_buf_),
        boost::asio::transfer_exactly(header_buf_.size()),
        boost::asio::bind_executor(strand_, [this, gen](const boost::system::error_code& ec, std::size_t) {
            if (closing_ || !connected_ || gen != generation_.load(std::memory_order_acquire)) return;
            if (ec) { connection_lost(ec); return; }
            FrameType type;
            std::uint32_t len = 0;
            if (!parse_frame_header(header_buf_.data(), type, len)) {
                connection_lost(make_error_code(mq_errc::malformed_frame));
                return;
            }
            read_body(gen, type, len);
        }));
}

void NetConnection::read_body(std::uint64_t gen, FrameType type, std::uint32_t len) {
    body_buf_.resize(len);
    boost::asio::async_read(
        socket_,
        boost::asio::buffer(body_buf_),
        boost::asio::transfer_exactly(body_buf_.size()),
        boost::asio::bind_executor(strand_, [this, gen, type](const boost::system::error_code& ec, std::size_t) {
            if (closing_ || !connected_ || gen != generation_.load(std::memory_order_acquire)) return;
            if (ec) { connection_lost(ec); return; }
            if (!handle_frame(type)) {
                connection_lost(make_error_code(mq_errc::malformed_frame));
                return;
            }
            read_header(gen);
        }));
}

bool NetConnection::handle_frame(FrameType type) {
    FrameReader r(body_buf_.data(), body_buf_.size());
    switch (type) {
    case FrameType::ok: {
        std::uint64_t seq = 0;
        if (!r.get_u64(seq) || !r.done()) return false;
        complete(seq, {});
        return true;
    }
    case FrameType::error: {
        std::uint64_t seq = 0;
        std::uint32_t code = 0;
        if (!r.get_u64(seq) || !r.get_u32(code) || !r.done()) return false;
        complete(seq, wire_error(code));
        return true;
    }
    case FrameType::deliver: {
        std::uint64_t consumer_tag = 0;
        std::uint64_t delivery_tag = 0;
        auto job = std::make_shared<Job>();
        if (!r.get_u64(consumer_tag) || !r.get_u64(delivery_tag) ||
            !read_job(r, *job, cfg_) || !r.done()) {
            return false;
        }
        const auto gen = generation_.load(std::memory_order_acquire);
        std::shared_ptr<DeliveryBuffer> buffer;
        auto it = subscriptions_.find(consumer_tag);
        if (it != subscriptions_.end()) buffer = it->second.buffer.lock();
        if (!buffer || !buffer->push(Delivery{delivery_tag, gen, job})) {
            // consumer went away while the delivery was in flight
            FrameWriter w(FrameType::nack);
            w.put_u64(delivery_tag);
            w.put_u8(1);
            w.put_u32(static_cast<std::uint32_t>(job->retries));
            w.put_str(job->error_type);
            enqueue_write(std::make_shared<std::vector<char>>(w.finish()));
        }
        return true;
    }
    default:
        return false;
    }
}

void NetConnection::complete(std::uint64_t seq, const boost::system::error_code& ec) {
    if (seq == 0) {
        // replayed declaration or subscription
        if (ec) LogLine(LogLevel::warn, "net") << "replay rejected by daemon: " << ec.message();
        return;
    }
    auto it = pending_.find(seq);
    if (it == pending_.end()) return;
    if (!ec && it->second.confirmed) it->second.confirmed();
    it->second.done->set_value(ec);
    pending_.erase(it);
}

void NetConnection::remember_declaration(const Declaration& d) {
    // one entry per queue, or per exchange and queue for bindings; the
    // latest declaration wins
    auto same = std::find_if(declarations_.begin(), declarations_.end(), [&d](const Declaration& e) {
        return e.type == d.type && e.queue == d.queue &&
               (d.type != FrameType::bind || e.exchange == d.exchange);
    });
    if (same != declarations_.end()) {
        *same = d;
    } else {
        declarations_.push_back(d);
    }
}

void NetConnection::enqueue_write(Frame frame) {
    write_queue_.push_back(std::move(frame));
    if (!writing_) do_write();
}

void NetConnection::do_write() {
    writing_ = true;
    auto frame = write_queue_.front();
    const auto gen = generation_.load(std::memory_order_acquire);
    boost::asio::async_write(
        socket_,
        boost::asio::buffer(*frame),
        boost::asio::bind_executor(strand_, [this, frame, gen](const boost::system::error_code& ec, std::size_t) {
            if (closing_ || !connected_ || gen != generation_.load(std::memory_order_acquire)) return;
            if (ec) { connection_lost(ec); return; }
            write_queue_.pop_front();
            if (write_queue_.empty()) {
                writing_ = false;
            } else {
                do_write();
            }
        }));
}
