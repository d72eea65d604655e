// filename: src/jobqd.cpp
#include <core/broker_server.hpp>
#include <core/log.hpp>
#include <core/memory_broker.hpp>
#include <core/net_config.hpp>
#include <boost/asio/signal_set.hpp>
#include <cctype>
#include <charconv>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>

namespace {

// strict positive integer from an environment variable
bool env_uint(const char* name, std::uint64_t& out) {
    const char* env = std::getenv(name);
    if (!env) return false;
    // trim spaces
    const char* b = env; while (*b && std::isspace(static_cast<unsigned char>(*b))) ++b;
    const char* e = env + std::strlen(env);
    while (e > b && std::isspace(static_cast<unsigned char>(e[-1]))) --e;

    std::uint64_t v = 0;
    auto res = std::from_chars(b, e, v, 10);
    if (res.ec != std::errc{} || res.ptr != e || v == 0) {
        std::cerr << "[jobqd] ignoring " << name << " (not a positive integer): '" << env << "'\n";
        return false;
    }
    out = v;
    return true;
}

std::chrono::milliseconds pick_poll_interval() {
    std::uint64_t v = 0;
    if (env_uint("JOBQD_POLL_MS", v)) return std::chrono::milliseconds(v);
    return std::chrono::milliseconds(10);
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cerr << "Usage: jobqd <port>\n";
        return 1;
    }

    std::uint64_t port = 0;
    const char* arg = argv[1];
    auto res = std::from_chars(arg, arg + std::strlen(arg), port, 10);
    if (res.ec != std::errc{} || *res.ptr != '\0' || port > 65535) {
        std::cerr << "[jobqd] bad port '" << arg << "'\n";
        return 1;
    }

    MemoryOptions opts;
    opts.poll_interval = pick_poll_interval();
    auto ctx = std::make_shared<BrokerContext>(std::make_shared<MemoryBroker>(opts));
    ctx->poll_interval = opts.poll_interval;
    apply_env(ctx->config);

    try {
        boost::asio::io_context io_context;
        BrokerServer server(io_context, static_cast<unsigned short>(port), ctx);
        std::cout << "[jobqd] serving on port " << server.port() << "\n";

        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signo) {
            if (ec) return;
            std::cout << "[jobqd] signal " << signo << ", shutting down\n";
            server.stop();
            io_context.stop();
        });

        // Enter the I/O event loop, dispatching asynchronous handlers
        io_context.run();
    } catch (const boost::system::system_error& e) {
        std::cerr << "[jobqd] " << e.what() << "\n";
        return 1;
    }

    if (auto ec = ctx->backend->close()) {
        LogLine(LogLevel::warn, "jobqd") << "closing backend: " << ec.message();
    }
    std::cout << "[jobqd] bye\n";
    return 0;
}
