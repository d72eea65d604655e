// filename: src/sub_client.cpp
#include <core/broker_registry.hpp>
#include <core/uri.hpp>
#include <iostream>
#include <limits>
#include <string>

int main(int argc, char* argv[]) {
  if (argc != 4 && argc != 5) {
    std::cerr << "Usage: jobq_sub <uri> <queue> <count> [window]\n";
    return 1;
  }

  const std::string uri = argv[1];
  const std::string queue_name = argv[2];
  std::uint64_t count = 0;
  int window = 0;
  if (!parse_uint(argv[3], count)) {
    std::cerr << "[sub] count must be a non-negative integer\n";
    return 1;
  }
  if (argc == 5 && !parse_window(argv[4], window)) {
    std::cerr << "[sub] window must be an integer from 0 to " << std::numeric_limits<int>::max() << "\n";
    std::cerr << "Usage: jobq_sub <uri> <queue> <count> [window]\n";
    return 1;
  }

  auto registry = BrokerRegistry::with_default_backends();
  boost::system::error_code ec;
  auto broker = registry.make_broker(uri, ec);
  if (ec) {
    std::cerr << "[sub] connect failed: " << ec.message() << "\n";
    return 1;
  }

  auto queue = broker->queue(queue_name, ec);
  std::shared_ptr<JobIter> iter;
  if (!ec) iter = queue->consume(window, ec);
  if (ec) {
    std::cerr << "[sub] consume '" << queue_name << "': " << ec.message() << "\n";
    return 1;
  }

  std::cout << "Subscribed to queue '" << queue_name << "'....\n";

  int status = 0;
  for (std::uint64_t i = 0; i < count; ++i) {
    auto job = iter->next(ec);
    if (ec) {
      if (ec == make_error_code(mq_errc::end_of_stream)) {
        std::cout << "*** Queue drained, exiting\n";
      } else {
        std::cerr << "*** Error: " << ec.message() << "\n";
        status = 1;
      }
      break;
    }

    std::string message;
    if (auto dec = job->decode(message)) {
      std::cerr << "[sub] cannot decode job " << job->id << ": " << dec.message() << "\n";
      message = job->raw;
    }
    std::cout << "[RECV] " << message << std::endl;

    if ((ec = job->ack())) {
      std::cerr << "*** Ack failed: " << ec.message() << "\n";
      status = 1;
      break;
    }
  }

  if ((ec = iter->close()) || (ec = broker->close())) {
    std::cerr << "*** Close failed: " << ec.message() << "\n";
    status = 1;
  }
  return status;
}
