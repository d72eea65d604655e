// filename: src/pub_client.cpp
#include <core/broker_registry.hpp>
#include <iostream>
#include <string>

namespace {

bool parse_priority(const std::string& s, Priority& out) {
    if (s == "low")    { out = Priority::low; return true; }
    if (s == "normal") { out = Priority::normal; return true; }
    if (s == "high")   { out = Priority::high; return true; }
    if (s == "urgent") { out = Priority::urgent; return true; }
    return false;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc != 4 && argc != 5) {
        std::cerr << "Usage: jobq_pub <uri> <queue> <message> [low|normal|high|urgent]\n";
        return 1;
    }

    const std::string uri = argv[1];
    const std::string queue_name = argv[2];
    const std::string message = argv[3];

    Priority priority = Priority::normal;
    if (argc == 5 && !parse_priority(argv[4], priority)) {
        std::cerr << "[pub] unknown priority '" << argv[4] << "'\n";
        return 1;
    }

    auto registry = BrokerRegistry::with_default_backends();
    boost::system::error_code ec;
    auto broker = registry.make_broker(uri, ec);
    if (ec) {
        std::cerr << "[pub] connect failed: " << ec.message() << "\n";
        return 1;
    }
    std::cout << "[pub] connected\n";

    auto queue = broker->queue(queue_name, ec);
    if (ec) {
        std::cerr << "[pub] queue '" << queue_name << "': " << ec.message() << "\n";
        return 1;
    }

    auto job = Job::make();
    job->set_priority(priority);
    if ((ec = job->encode(message)) || (ec = queue->publish(job))) {
        std::cerr << "[pub] publish failed: " << ec.message() << "\n";
        return 1;
    }

    std::cout << "[SENT] id=" << job->id
              << " queue=" << queue_name
              << " msg=\"" << message << "\"\n";

    if ((ec = broker->close())) {
        std::cerr << "[pub] close failed: " << ec.message() << "\n";
        return 1;
    }
    return 0;
}
