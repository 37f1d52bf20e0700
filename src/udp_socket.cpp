#include "udp_socket.h"

#include <cerrno>
#include <climits>
#include <cstring>
#include <sstream>

#include <arpa/inet.h>
#include <poll.h>
#include <unistd.h>

namespace simpdiscover {
namespace internal {

bool MakeSockaddr(const std::string& address, uint16_t port, sockaddr_in* out) {
  if (!out) {
    return false;
  }
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (address.empty() || address == "0.0.0.0") {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
    return false;
  }
  *out = addr;
  return true;
}

std::string AddrToString(const sockaddr_in& addr) {
  char buffer[INET_ADDRSTRLEN] = {0};
  if (inet_ntop(AF_INET, &addr.sin_addr, buffer, sizeof(buffer)) != nullptr) {
    return buffer;
  }
  return {};
}

bool IsValidIpv4(const std::string& address) {
  if (address.empty()) {
    return false;
  }
  in_addr parsed{};
  return inet_pton(AF_INET, address.c_str(), &parsed) == 1;
}

bool UdpSocket::Open(uint16_t port, const std::string& bind_address,
                     bool allow_broadcast, bool reuse_address) {
  if (fd_ >= 0) {
    return true;
  }
  last_error_.clear();
  last_error_code_ = ErrorCode::kNone;
  sockaddr_in addr{};
  if (!MakeSockaddr(bind_address, port, &addr)) {
    Fail(ErrorCode::kBindFailed, "invalid bind address: " + bind_address);
    return false;
  }
  fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
  if (fd_ < 0) {
    Fail(ErrorCode::kBindFailed,
         "socket() failed: " + std::string(std::strerror(errno)));
    return false;
  }
  if (reuse_address) {
    int reuse = 1;
    if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
      Fail(ErrorCode::kBindFailed, "setsockopt(SO_REUSEADDR) failed: " +
                                       std::string(std::strerror(errno)));
      return false;
    }
  }
  if (allow_broadcast) {
    int broadcast = 1;
    if (::setsockopt(fd_, SOL_SOCKET, SO_BROADCAST, &broadcast, sizeof(broadcast)) < 0) {
      Fail(ErrorCode::kBindFailed, "setsockopt(SO_BROADCAST) failed: " +
                                       std::string(std::strerror(errno)));
      return false;
    }
  }
  if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    const int bind_errno = errno;
    std::ostringstream oss;
    oss << "bind(" << (bind_address.empty() ? "0.0.0.0" : bind_address) << ":"
        << port << ") failed: " << std::strerror(bind_errno);
    Fail(bind_errno == EADDRINUSE ? ErrorCode::kAddressInUse
                                  : ErrorCode::kBindFailed,
         oss.str());
    return false;
  }
  socklen_t len = sizeof(addr);
  if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
    Fail(ErrorCode::kBindFailed,
         "getsockname() failed: " + std::string(std::strerror(errno)));
    return false;
  }
  local_port_ = ntohs(addr.sin_port);
  return true;
}

void UdpSocket::Close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
  local_port_ = 0;
}

void UdpSocket::Fail(ErrorCode code, const std::string& message) {
  last_error_code_ = code;
  last_error_ = message;
  Close();
}

ssize_t UdpSocket::SendTo(const std::vector<uint8_t>& data, const sockaddr_in& addr) {
  return ::sendto(fd_, data.data(), data.size(), 0,
                  reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
}

ssize_t UdpSocket::RecvFrom(uint8_t* buffer, size_t length, sockaddr_in* addr,
                            socklen_t* addr_len) {
  return ::recvfrom(fd_, buffer, length, 0,
                    reinterpret_cast<sockaddr*>(addr), addr_len);
}

int UdpSocket::WaitReadable(std::optional<std::chrono::milliseconds> timeout) {
  if (fd_ < 0) {
    errno = EBADF;
    return -1;
  }
  pollfd pfd{};
  pfd.fd = fd_;
  pfd.events = POLLIN;
  int timeout_ms = -1;
  if (timeout.has_value()) {
    const auto ms = timeout->count();
    timeout_ms = ms < 0 ? 0 : (ms > INT_MAX ? INT_MAX : static_cast<int>(ms));
  }
  const int ready = ::poll(&pfd, 1, timeout_ms);
  if (ready < 0) {
    return -1;
  }
  return ready == 0 ? 0 : 1;
}

}  // namespace internal
}  // namespace simpdiscover
