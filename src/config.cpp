#include "simpdiscover/simpdiscover.h"

#include "udp_socket.h"

namespace simpdiscover {
namespace {

bool Fail(std::string* error, const std::string& message) {
  if (error) {
    *error = message;
  }
  return false;
}

}  // namespace

bool SenderConfig::Validate(std::string* error) const {
  if (broadcast_port == 0) {
    return Fail(error, "broadcast_port must be non-zero");
  }
  if (send_period.count() <= 0) {
    return Fail(error, "send_period must be positive");
  }
  if (service_name.size() > kMaxServiceNameLength) {
    return Fail(error, "service_name must be at most " +
                           std::to_string(kMaxServiceNameLength) + " bytes");
  }
  if (!bind_address.empty() && bind_address != "0.0.0.0") {
    if (!internal::IsValidIpv4(bind_address)) {
      return Fail(error, "bind_address must be a valid IPv4 address");
    }
  }
  if (!internal::IsValidIpv4(broadcast_address)) {
    return Fail(error, "broadcast_address must be a valid IPv4 address");
  }
  return true;
}

bool ListenerConfig::Validate(std::string* error) const {
  if (service_name.size() > kMaxServiceNameLength) {
    return Fail(error, "service_name must be at most " +
                           std::to_string(kMaxServiceNameLength) + " bytes");
  }
  if (!bind_address.empty() && bind_address != "0.0.0.0") {
    if (!internal::IsValidIpv4(bind_address)) {
      return Fail(error, "bind_address must be a valid IPv4 address");
    }
  }
  return true;
}

}  // namespace simpdiscover
