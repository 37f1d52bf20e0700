// Example: wait for a beacon from a named service, optionally with a timeout.
#include "simpdiscover/simpdiscover.h"

#include <chrono>
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

int main(int argc, char** argv) {
  simpdiscover::ListenerConfig config;
  config.service_name = argc > 1 ? argv[1] : "BeaconTestService";
  config.verbose = true;

  std::optional<std::chrono::milliseconds> timeout;
  if (argc > 2) {
    errno = 0;
    const long long secs = std::strtoll(argv[2], nullptr, 10);
    constexpr long long kMaxSecs = std::chrono::milliseconds::max().count() / 1000;
    if (errno == ERANGE || secs < 0 || secs > kMaxSecs) {
      std::cerr << "Invalid timeout: " << argv[2] << std::endl;
      return 1;
    }
    timeout = std::chrono::seconds(secs);
  }

  if (timeout.has_value()) {
    std::cout << "Timeout set to " << timeout->count() << " ms" << std::endl;
  } else {
    std::cout << "No timeout set" << std::endl;
  }
  std::cout << "Waiting for a beacon from service: '" << config.service_name
            << "'" << std::endl;

  simpdiscover::BeaconListener listener(config);
  simpdiscover::Error error;
  if (!listener.Open(&error)) {
    std::cerr << "Failed to open listener (" << simpdiscover::ErrorCodeName(error.code)
              << "): " << error.message << std::endl;
    return 1;
  }
  simpdiscover::Beacon beacon;
  if (!listener.Wait(timeout, &beacon, &error)) {
    std::cerr << simpdiscover::ErrorCodeName(error.code) << ": " << error.message
              << std::endl;
    return 1;
  }
  std::cout << beacon << std::endl;
  return 0;
}
