#include "simpdiscover/simpdiscover.h"

#include <iomanip>
#include <ostream>
#include <sstream>

namespace simpdiscover {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kNone:
      return "None";
    case ErrorCode::kInvalidConfig:
      return "InvalidConfig";
    case ErrorCode::kAddressInUse:
      return "AddressInUse";
    case ErrorCode::kBindFailed:
      return "BindFailed";
    case ErrorCode::kNotOpen:
      return "NotOpen";
    case ErrorCode::kIo:
      return "Io";
    case ErrorCode::kTimeout:
      return "Timeout";
  }
  return "Unknown";
}

bool IsBindError(ErrorCode code) {
  return code == ErrorCode::kAddressInUse || code == ErrorCode::kBindFailed;
}

std::string Beacon::ToString() const {
  std::ostringstream oss;
  oss << "Beacon { service_name: '";
  for (const char c : service_name) {
    const auto byte = static_cast<unsigned char>(c);
    if (byte >= 0x20 && byte < 0x7f && byte != '\\' && byte != '\'') {
      oss << c;
    } else {
      oss << "\\x" << std::hex << std::setw(2) << std::setfill('0')
          << static_cast<int>(byte) << std::dec << std::setfill(' ');
    }
  }
  oss << "', service_ip: " << service_ip
      << ", service_port: " << service_port << " }";
  return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Beacon& beacon) {
  return os << beacon.ToString();
}

}  // namespace simpdiscover
