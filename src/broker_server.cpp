// filename: src/broker_server.cpp
#include <core/broker_server.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/ip/v6_only.hpp>
#include <boost/asio/socket_base.hpp>
#include <algorithm>
#include <chrono>
#include <climits>
#include <future>

namespace {

// deliveries per consumer before yielding the strand
constexpr int kDeliverBatch = 64;

void requeue(const JobPtr& job, const char* where) {
    if (auto ec = job->reject(true)) {
        LogLine(LogLevel::error, "session") << where << ": requeue of job " << job->id << " failed: "
                                            << ec.message();
    }
}

bool is_disconnect(const boost::system::error_code& ec) {
    return ec == boost::asio::error::eof ||
           ec == boost::asio::error::connection_reset ||
           ec == boost::asio::error::operation_aborted;
}

boost::system::error_code open_acceptor(boost::asio::ip::tcp::acceptor& acc,
                                        const boost::asio::ip::tcp::endpoint& ep) {
    namespace asio = boost::asio;
    boost::system::error_code ec;
    acc.open(ep.protocol(), ec);
    if (ec) return ec;
    boost::system::error_code opt_ec;
    acc.set_option(asio::socket_base::reuse_address(true), opt_ec);
    // accept IPv4 peers on the IPv6 socket where the stack allows it
    if (ep.address().is_v6()) acc.set_option(asio::ip::v6_only(false), opt_ec);
    acc.bind(ep, ec);
    if (!ec) acc.listen(asio::socket_base::max_listen_connections, ec);
    if (!ec) return {};
    boost::system::error_code ignore;
    acc.close(ignore);
    return ec;
}

} // namespace

BrokerServer::BrokerServer(boost::asio::io_context& io_context,
                           unsigned short port,
                           std::shared_ptr<BrokerContext> ctx)
    : io_context_(io_context),
      acceptor_(io_context),
      strand_(io_context.get_executor()),
      ctx_(std::move(ctx)),
      accept_retry_timer_(io_context),
      accept_backoff_(std::chrono::milliseconds(10), std::chrono::milliseconds(1000), 2.0)
{
    listen(port);
    // Start accepting connections before entering the event loop
    start();
}

BrokerServer::~BrokerServer() {
    if (!stopped_) {
        boost::system::error_code ignore;
        accept_retry_timer_.cancel();
        acceptor_.cancel(ignore);
        acceptor_.close(ignore);
    }
}

unsigned short BrokerServer::port() const {
    boost::system::error_code ec;
    auto ep = acceptor_.local_endpoint(ec);
    return ec ? 0 : ep.port();
}

// dual-stack IPv6 first, IPv4 only as a fallback
void BrokerServer::listen(unsigned short port) {
    using tcp = boost::asio::ip::tcp;

    auto ec = open_acceptor(acceptor_, tcp::endpoint(tcp::v6(), port));
    if (!ec) {
        LogLine(LogLevel::info, "broker") << "jobqd listening on [::]:" << this->port();
        return;
    }
    LogLine(LogLevel::info, "broker") << "IPv6 listen on port " << port << " failed (" << ec.message()
                                      << "), trying IPv4";
    ec = open_acceptor(acceptor_, tcp::endpoint(tcp::v4(), port));
    if (ec) {
        LogLine(LogLevel::error, "broker") << "cannot listen on port " << port << ": " << ec.message();
        throw boost::system::system_error(ec);
    }
    LogLine(LogLevel::info, "broker") << "jobqd listening on 0.0.0.0:" << this->port();
}

void BrokerServer::start() {
    do_accept();
}

void BrokerServer::stop() {
    if (io_context_.stopped() || io_context_.get_executor().running_in_this_thread()) {
        do_stop();
        return;
    }
    std::promise<void> done;
    auto finished = done.get_future();
    boost::asio::post(strand_, [this, &done] {
        do_stop();
        done.set_value();
    });
    finished.wait();
}

void BrokerServer::do_stop() {
    if (stopped_) return;
    stopped_ = true;

    boost::system::error_code ignore;
    accept_retry_timer_.cancel();
    acceptor_.cancel(ignore);
    acceptor_.close(ignore);

    std::vector<std::shared_ptr<Session>> live;
    {
        std::lock_guard<std::mutex> lk(sessions_mu_);
        for (auto& w : sessions_) {
            if (auto s = w.lock()) live.push_back(std::move(s));
        }
        sessions_.clear();
    }
    for (auto& s : live) s->stop();

    const auto& m = ctx_->metrics;
    LogLine(LogLevel::info, "broker") << "stopped: published=" << m.published.load()
                                      << " delivered=" << m.delivered.load()
                                      << " acked=" << m.acked.load()
                                      << " rejected=" << m.rejected.load()
                                      << " dead_lettered=" << m.dead_lettered.load()
                                      << " malformed=" << m.malformed_frames.load();
}

void BrokerServer::retry_accept(const boost::system::error_code& ec) {
    const auto delay = accept_backoff_.next();
    LogLine(LogLevel::warn, "broker") << "accept error: " << ec.message()
                                      << " (retry in " << delay.count() << " ms)";
    accept_retry_timer_.expires_after(delay);
    accept_retry_timer_.async_wait(
        boost::asio::bind_executor(strand_, [this](const boost::system::error_code& tec) {
            if (!tec && !stopped_) do_accept();
        }));
}

void BrokerServer::do_accept() {
    using tcp = boost::asio::ip::tcp;

    acceptor_.async_accept(
        boost::asio::bind_executor(strand_,
        [this](const boost::system::error_code& ec, tcp::socket socket) {
            if (stopped_ || ec == boost::asio::error::operation_aborted) return;
            if (ec) {
                retry_accept(ec);
                return;
            }
            accept_backoff_.reset();

            boost::system::error_code ep_ec;
            auto ep = socket.remote_endpoint(ep_ec);
            if (!ep_ec && ctx_->banned(ep.address().to_string())) {
                LogLine(LogLevel::warn, "broker") << "rejecting banned peer " << ep.address().to_string();
                boost::system::error_code ignore;
                socket.shutdown(tcp::socket::shutdown_both, ignore);
                socket.close(ignore);
                do_accept();
                return;
            }

            auto session = std::make_shared<Session>(std::move(socket), strand_, ctx_);
            {
                std::lock_guard<std::mutex> lk(sessions_mu_);
                sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                               [](const std::weak_ptr<Session>& w) { return w.expired(); }),
                                sessions_.end());
                sessions_.push_back(session);
            }
            session->start();
            do_accept();
        }));
}

BrokerServer::Session::Session(boost::asio::ip::tcp::socket socket,
                               boost::asio::strand<boost::asio::io_context::executor_type> strand,
                               std::shared_ptr<BrokerContext> ctx)
    : socket_(std::move(socket)),
      strand_(strand),
      ctx_(std::move(ctx)) {
    boost::system::error_code ip_ec;
    auto ep = socket_.remote_endpoint(ip_ec);
    peer_ip_ = ip_ec ? std::string() : ep.address().to_string();
    LogLine(LogLevel::info, "session") << "client " << (peer_ip_.empty() ? "<unknown>" : peer_ip_)
                                       << " connected";
}

BrokerServer::Session::~Session() {
    close_consumers();
    requeue_unacked();
}

void BrokerServer::Session::stop() {
    if (stopped_) return;
    stopped_ = true;
    close_consumers();
    requeue_unacked();
    out_.clear();
    boost::system::error_code ignore;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignore);
    socket_.close(ignore);
    buffer_.clear();
}

void BrokerServer::Session::close_consumer(std::uint64_t tag, Consumer& c) {
    c.timer->cancel();
    if (auto ec = c.iter->close()) {
        LogLine(LogLevel::warn, "session") << "closing consumer " << tag << ": " << ec.message();
    }
}

void BrokerServer::Session::close_consumers() {
    for (auto& kv : consumers_) close_consumer(kv.first, kv.second);
    consumers_.clear();
}

void BrokerServer::Session::requeue_unacked() {
    if (!unacked_.empty()) {
        LogLine(LogLevel::info, "session") << "requeueing " << unacked_.size() << " unsettled deliveries";
    }
    for (auto& kv : unacked_) requeue(kv.second.job, "disconnect");
    unacked_.clear();
}

void BrokerServer::Session::read_header() {
    auto self = shared_from_this();
    boost::asio::async_read(
        socket_,
        boost::asio::buffer(header_),
        boost::asio::transfer_exactly(header_.size()),
        boost::asio::bind_executor(strand_, [this, self](boost::system::error_code ec, std::size_t) {
            if (stopped_) return;
            if (ec) { fail("read_header", ec); return; }
            FrameType type;
            uint32_t len = 0;
            if (!parse_frame_header(header_.data(), type, len)) {
                uint32_t raw_len = 0;
                for (std::size_t i = 1; i < kFrameHeaderSize; ++i) {
                    raw_len = (raw_len << 8) | static_cast<uint8_t>(header_[i]);
                }
                reject_malformed("read_header", static_cast<uint8_t>(header_[0]), raw_len);
                return;
            }
            read_body(type, len);
        }));
}

void BrokerServer::Session::read_body(FrameType type, uint32_t len) {
    buffer_.resize(len);
    auto self = shared_from_this();
    boost::asio::async_read(
        socket_,
        boost::asio::buffer(buffer_),
        boost::asio::transfer_exactly(buffer_.size()),
        boost::asio::bind_executor(strand_, [this, self, type, len](boost::system::error_code ec, std::size_t) {
            if (stopped_) return;
            if (ec) { fail("read_body", ec); return; }
            if (!dispatch(type)) {
                reject_malformed("dispatch", static_cast<uint8_t>(type), len);
                return;
            }
            if (stopped_) return;
            // continue with the next frame
            read_header();
        }));
}

bool BrokerServer::Session::dispatch(FrameType type) {
    FrameReader r(buffer_.data(), buffer_.size());
    switch (type) {
    case FrameType::declare:       return on_declare(r);
    case FrameType::bind:          return on_bind(r);
    case FrameType::publish:       return on_publish(r);
    case FrameType::publish_batch: return on_publish_batch(r);
    case FrameType::consume:       return on_consume(r);
    case FrameType::cancel:        return on_cancel(r);
    case FrameType::ack:           return on_ack(r);
    case FrameType::nack:          return on_nack(r);
    default:
        // daemon-to-client frames
        return false;
    }
}

bool BrokerServer::Session::on_declare(FrameReader& r) {
    uint64_t seq = 0;
    std::string queue;
    uint8_t max_priority = 0;
    std::string dead_letter_exchange;
    if (!r.get_u64(seq) || !r.get_str(queue) || !r.get_u8(max_priority) ||
        !r.get_str(dead_letter_exchange) || !r.done() || queue.empty()) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lk(ctx_->topology_mu);
        ctx_->declarations[queue] = QueueDeclaration{max_priority, dead_letter_exchange};
    }
    boost::system::error_code ec;
    ctx_->backend->queue(queue, ec);
    LogLine(LogLevel::debug, "session") << "declared '" << queue << "' max_priority=" << unsigned(max_priority)
                                        << " dlx='" << dead_letter_exchange << "'";
    reply(seq, ec);
    return true;
}

bool BrokerServer::Session::on_bind(FrameReader& r) {
    uint64_t seq = 0;
    std::string exchange;
    std::string queue;
    if (!r.get_u64(seq) || !r.get_str(exchange) || !r.get_str(queue) || !r.done() ||
        exchange.empty() || queue.empty()) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lk(ctx_->topology_mu);
        ctx_->bindings[exchange].insert(queue);
    }
    boost::system::error_code ec;
    ctx_->backend->queue(queue, ec);
    reply(seq, ec);
    return true;
}

bool BrokerServer::Session::on_publish(FrameReader& r) {
    uint64_t seq = 0;
    std::string queue;
    uint32_t delay_ms = 0;
    auto job = std::make_shared<Job>();
    if (!r.get_u64(seq) || !r.get_str(queue) || !r.get_u32(delay_ms) ||
        !read_job(r, *job, ctx_->config) || !r.done()) {
        return false;
    }

    boost::system::error_code ec;
    auto q = ctx_->backend->queue(queue, ec);
    if (!ec) {
        clamp_priority(queue, *job);
        ec = delay_ms ? q->publish_delayed(job, std::chrono::milliseconds(delay_ms))
                      : q->publish(job);
    }
    if (!ec) ctx_->metrics.published.fetch_add(1, std::memory_order_relaxed);
    reply(seq, ec);
    return true;
}

bool BrokerServer::Session::on_publish_batch(FrameReader& r) {
    uint64_t seq = 0;
    std::string queue;
    uint32_t count = 0;
    if (!r.get_u64(seq) || !r.get_str(queue) || !r.get_u32(count)) return false;

    std::vector<JobPtr> jobs;
    for (uint32_t i = 0; i < count; ++i) {
        auto job = std::make_shared<Job>();
        if (!read_job(r, *job, ctx_->config)) return false;
        jobs.push_back(std::move(job));
    }
    if (!r.done()) return false;

    boost::system::error_code ec;
    auto q = ctx_->backend->queue(queue, ec);
    if (!ec) {
        for (auto& job : jobs) clamp_priority(queue, *job);
        ec = q->transaction([&jobs](Queue& tx) {
            for (const auto& job : jobs) {
                if (auto pec = tx.publish(job)) return pec;
            }
            return boost::system::error_code{};
        });
    }
    if (!ec) ctx_->metrics.published.fetch_add(jobs.size(), std::memory_order_relaxed);
    reply(seq, ec);
    return true;
}

bool BrokerServer::Session::on_consume(FrameReader& r) {
    uint64_t seq = 0;
    uint64_t tag = 0;
    std::string queue;
    uint32_t window = 0;
    if (!r.get_u64(seq) || !r.get_u64(tag) || !r.get_str(queue) || !r.get_u32(window) ||
        !r.done()) {
        return false;
    }

    boost::system::error_code ec;
    std::shared_ptr<JobIter> iter;
    auto q = ctx_->backend->queue(queue, ec);
    if (!ec) iter = q->consume(window > INT_MAX ? INT_MAX : static_cast<int>(window), ec);
    if (ec) {
        reply(seq, ec);
        return true;
    }

    // a resubscription after reconnect reuses the tag
    auto existing = consumers_.find(tag);
    if (existing != consumers_.end()) {
        close_consumer(tag, existing->second);
        consumers_.erase(existing);
    }
    auto timer = std::make_shared<Timer>(strand_);
    consumers_.emplace(tag, Consumer{queue, std::move(iter), timer});

    LogLine(LogLevel::debug, "session") << "consumer " << tag << " on '" << queue << "' window=" << window;
    reply(seq, {});
    schedule_pump(tag, timer, true);
    return true;
}

bool BrokerServer::Session::on_cancel(FrameReader& r) {
    uint64_t seq = 0;
    uint64_t tag = 0;
    if (!r.get_u64(seq) || !r.get_u64(tag) || !r.done()) return false;

    auto it = consumers_.find(tag);
    if (it != consumers_.end()) {
        close_consumer(tag, it->second);
        consumers_.erase(it);
    }
    reply(seq, {});
    return true;
}

bool BrokerServer::Session::on_ack(FrameReader& r) {
    uint64_t delivery_tag = 0;
    if (!r.get_u64(delivery_tag) || !r.done()) return false;

    auto it = unacked_.find(delivery_tag);
    if (it == unacked_.end()) {
        LogLine(LogLevel::warn, "session") << "ack for unknown delivery " << delivery_tag;
        return true;
    }
    if (auto ec = it->second.job->ack()) {
        LogLine(LogLevel::warn, "session") << "ack of delivery " << delivery_tag << ": " << ec.message();
    }
    unacked_.erase(it);
    ctx_->metrics.acked.fetch_add(1, std::memory_order_relaxed);
    return true;
}

bool BrokerServer::Session::on_nack(FrameReader& r) {
    uint64_t delivery_tag = 0;
    uint8_t requeue_flag = 0;
    uint32_t retries = 0;
    std::string error_type;
    if (!r.get_u64(delivery_tag) || !r.get_u8(requeue_flag) || !r.get_u32(retries) ||
        !r.get_str(error_type) || !r.done()) {
        return false;
    }

    auto it = unacked_.find(delivery_tag);
    if (it == unacked_.end()) {
        LogLine(LogLevel::warn, "session") << "nack for unknown delivery " << delivery_tag;
        return true;
    }
    Outstanding o = std::move(it->second);
    unacked_.erase(it);

    o.job->retries = static_cast<int32_t>(retries);
    o.job->error_type = error_type;
    if (requeue_flag) {
        requeue(o.job, "nack");
    } else {
        dead_letter(o);
    }
    ctx_->metrics.rejected.fetch_add(1, std::memory_order_relaxed);
    return true;
}

void BrokerServer::Session::schedule_pump(std::uint64_t tag, const std::shared_ptr<Timer>& timer,
                                          bool at_once) {
    std::weak_ptr<Session> weak = shared_from_this();
    if (at_once) {
        boost::asio::post(strand_, [weak, tag, timer] {
            if (auto self = weak.lock()) self->pump(tag, timer);
        });
        return;
    }
    timer->expires_after(ctx_->poll_interval);
    timer->async_wait(boost::asio::bind_executor(strand_,
        [weak, tag, timer](const boost::system::error_code& ec) {
            if (ec) return;
            if (auto self = weak.lock()) self->pump(tag, timer);
        }));
}

void BrokerServer::Session::pump(std::uint64_t tag, const std::shared_ptr<Timer>& timer) {
    if (stopped_) return;
    auto it = consumers_.find(tag);
    // cancelled, or replaced by a resubscription with its own timer
    if (it == consumers_.end() || it->second.timer != timer) return;
    auto iter = it->second.iter;
    const std::string queue = it->second.queue;

    int handed = 0;
    while (handed < kDeliverBatch) {
        boost::system::error_code ec;
        JobPtr job = iter->try_next(ec);
        if (ec == make_error_code(mq_errc::already_closed)) {
            LogLine(LogLevel::debug, "session") << "consumer " << tag << " on '" << queue << "' closed";
            return;
        }
        if (ec && ec != make_error_code(mq_errc::end_of_stream)) {
            LogLine(LogLevel::warn, "session") << "consumer " << tag << " on '" << queue << "': " << ec.message();
        }
        if (!job) break;
        deliver(tag, queue, std::move(job));
        ++handed;
        if (stopped_) return;
    }
    schedule_pump(tag, timer, handed == kDeliverBatch);
}

void BrokerServer::Session::deliver(std::uint64_t tag, const std::string& queue, JobPtr job) {
    const auto delivery_tag = next_delivery_tag_++;
    FrameWriter w(FrameType::deliver);
    w.put_u64(tag);
    w.put_u64(delivery_tag);
    write_job(w, *job, ctx_->config);
    unacked_.emplace(delivery_tag, Outstanding{tag, queue, std::move(job)});
    ctx_->metrics.delivered.fetch_add(1, std::memory_order_relaxed);
    send(w.finish());
}

void BrokerServer::Session::dead_letter(const Outstanding& o) {
    std::vector<std::string> targets;
    {
        std::lock_guard<std::mutex> lk(ctx_->topology_mu);
        auto d = ctx_->declarations.find(o.queue);
        if (d != ctx_->declarations.end() && !d->second.dead_letter_exchange.empty()) {
            auto b = ctx_->bindings.find(d->second.dead_letter_exchange);
            if (b != ctx_->bindings.end()) targets.assign(b->second.begin(), b->second.end());
        }
    }

    if (targets.empty()) {
        // no dead-letter route: the backend buries it
        if (auto ec = o.job->reject(false)) {
            LogLine(LogLevel::error, "session") << "reject of job " << o.job->id << " failed: " << ec.message();
        }
        return;
    }

    for (const auto& target : targets) {
        boost::system::error_code ec;
        auto q = ctx_->backend->queue(target, ec);
        if (!ec) ec = q->publish(o.job->clone());
        if (ec) {
            LogLine(LogLevel::error, "session") << "dead-lettering job " << o.job->id << " to '" << target
                                                << "' failed: " << ec.message();
        }
    }
    if (auto ec = o.job->ack()) {
        LogLine(LogLevel::warn, "session") << "settling dead-lettered job " << o.job->id << ": " << ec.message();
    }
    ctx_->metrics.dead_lettered.fetch_add(1, std::memory_order_relaxed);
}

void BrokerServer::Session::clamp_priority(const std::string& queue, Job& job) {
    std::lock_guard<std::mutex> lk(ctx_->topology_mu);
    auto it = ctx_->declarations.find(queue);
    if (it == ctx_->declarations.end() || it->second.max_priority == 0) return;
    if (static_cast<uint8_t>(job.priority) > it->second.max_priority) {
        job.priority = static_cast<Priority>(it->second.max_priority);
    }
}

void BrokerServer::Session::reply(std::uint64_t seq, const boost::system::error_code& ec) {
    FrameWriter w(ec ? FrameType::error : FrameType::ok);
    w.put_u64(seq);
    if (ec) {
        uint32_t code = static_cast<uint32_t>(mq_errc::connection_lost);
        if (ec.category() == mq_category()) {
            code = static_cast<uint32_t>(ec.value());
        } else {
            LogLine(LogLevel::warn, "session") << "request " << seq << " failed: " << ec.message();
        }
        w.put_u32(code);
    }
    send(w.finish());
}

void BrokerServer::Session::send(std::vector<char> frame) {
    if (stopped_) return;
    out_.push_back(std::make_shared<std::vector<char>>(std::move(frame)));
    if (!writing_) do_write();
}

void BrokerServer::Session::do_write() {
    writing_ = true;
    auto frame = out_.front();
    auto self = shared_from_this();
    boost::asio::async_write(
        socket_,
        boost::asio::buffer(*frame),
        boost::asio::bind_executor(strand_, [this, self, frame](boost::system::error_code ec, std::size_t) {
            if (stopped_) return;
            if (ec) { fail("write", ec); return; }
            out_.pop_front();
            if (out_.empty()) {
                writing_ = false;
            } else {
                do_write();
            }
        }));
}

// Centralized error handling for Session async operations
void BrokerServer::Session::fail(const char* where, const boost::system::error_code& ec) {
    if (is_disconnect(ec)) {
        LogLine(LogLevel::info, "session") << peer_ip_ << " disconnected";
    } else {
        // include numeric value for grepping
        LogLine(LogLevel::warn, "session") << where << " error: " << ec.message() << " (code=" << ec.value() << ")";
    }
    stop();
}

void BrokerServer::Session::reject_malformed(const char* where, uint8_t type, uint32_t len) {
    ctx_->metrics.malformed_frames.fetch_add(1, std::memory_order_relaxed);
    LogLine(LogLevel::warn, "session") << where << ": malformed frame from "
                                       << (peer_ip_.empty() ? "<unknown>" : peer_ip_)
                                       << " (type=" << unsigned(type) << ", len=" << len
                                       << ", limit=" << kMaxFrameLen << ")";
    if (!peer_ip_.empty() && ctx_->strike(peer_ip_)) {
        LogLine(LogLevel::warn, "session") << "banning " << peer_ip_ << " for "
                                           << std::chrono::duration_cast<std::chrono::seconds>(ctx_->ban_duration).count()
                                           << "s after " << ctx_->bad_frame_threshold << " malformed frames";
    }
    stop();
}
