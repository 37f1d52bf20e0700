// Example: announce a service in the background and wait for our own beacon.
#include "simpdiscover/simpdiscover.h"

#include <chrono>
#include <iostream>
#include <string>

int main() {
  const std::string service_name = "BeaconTestService";

  simpdiscover::SenderConfig sender_config;
  sender_config.service_name = service_name;
  sender_config.service_port = 1234;

  simpdiscover::ListenerConfig listener_config;
  listener_config.service_name = service_name;

  simpdiscover::BeaconListener listener(listener_config);
  simpdiscover::Error error;
  if (!listener.Open(&error)) {
    std::cerr << "Failed to open listener: " << error.message << std::endl;
    return 1;
  }

  simpdiscover::BeaconSender sender(sender_config);
  if (!sender.Open(&error) || !sender.Start(&error)) {
    std::cerr << "Failed to start sender: " << error.message << std::endl;
    return 1;
  }

  simpdiscover::Beacon beacon;
  if (!listener.Wait(std::chrono::seconds(5), &beacon, &error)) {
    std::cerr << simpdiscover::ErrorCodeName(error.code) << ": " << error.message
              << std::endl;
    return 1;
  }
  std::cout << beacon << std::endl;
  sender.Stop();
  return 0;
}
