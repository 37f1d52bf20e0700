// Example: announce a service on the LAN until interrupted or a send fails.
#include "simpdiscover/simpdiscover.h"

#include <cstdlib>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
  simpdiscover::SenderConfig config;
  config.service_name = argc > 1 ? argv[1] : "BeaconTestService";
  config.service_port = 1234;
  if (argc > 2) {
    const long port = std::strtol(argv[2], nullptr, 10);
    if (port <= 0 || port > 0xffff) {
      std::cerr << "Invalid service port: " << argv[2] << std::endl;
      return 1;
    }
    config.service_port = static_cast<uint16_t>(port);
  }
  config.verbose = true;

  simpdiscover::BeaconSender sender(config);
  simpdiscover::Error error;
  if (!sender.Open(&error)) {
    std::cerr << "Failed to open sender (" << simpdiscover::ErrorCodeName(error.code)
              << "): " << error.message << std::endl;
    return 1;
  }
  std::cout << "Announcing '" << config.service_name << "' on port "
            << config.service_port << " to " << sender.destination() << std::endl;
  if (!sender.SendLoop(config.send_period, &error)) {
    std::cerr << "Send loop failed: " << error.message << std::endl;
    return 1;
  }
  return 0;
}
