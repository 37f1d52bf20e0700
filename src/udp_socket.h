#pragma once

#include "simpdiscover/simpdiscover.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>

namespace simpdiscover {
namespace internal {

// Convert a string address and port into a sockaddr_in.
bool MakeSockaddr(const std::string& address, uint16_t port, sockaddr_in* out);

// Dotted-quad form of the address in `addr`, or empty on failure.
std::string AddrToString(const sockaddr_in& addr);

bool IsValidIpv4(const std::string& address);

// Minimal UDP socket wrapper for send/recv with broadcast support.
class UdpSocket {
 public:
  UdpSocket() = default;
  ~UdpSocket() { Close(); }

  UdpSocket(const UdpSocket&) = delete;
  UdpSocket& operator=(const UdpSocket&) = delete;

  bool Open(uint16_t port, const std::string& bind_address,
            bool allow_broadcast, bool reuse_address);
  void Close();

  int fd() const { return fd_; }
  uint16_t local_port() const { return local_port_; }
  const std::string& last_error() const { return last_error_; }
  ErrorCode last_error_code() const { return last_error_code_; }

  ssize_t SendTo(const std::vector<uint8_t>& data, const sockaddr_in& addr);
  ssize_t RecvFrom(uint8_t* buffer, size_t length, sockaddr_in* addr,
                   socklen_t* addr_len);

  // Block until readable: 1 if readable, 0 on timeout, -1 on error.
  // nullopt waits forever; timeouts are capped at INT_MAX ms per call.
  int WaitReadable(std::optional<std::chrono::milliseconds> timeout);

 private:
  void Fail(ErrorCode code, const std::string& message);

  int fd_ = -1;
  uint16_t local_port_ = 0;
  std::string last_error_;
  ErrorCode last_error_code_ = ErrorCode::kNone;
};

}  // namespace internal
}  // namespace simpdiscover
