#include "simpdiscover/simpdiscover.h"

#include "logging.h"
#include "udp_socket.h"

#include <array>
#include <cerrno>
#include <cstring>
#include <sstream>

namespace simpdiscover {

struct BeaconListener::Impl {
  explicit Impl(ListenerConfig config) : config_(std::move(config)) {}

  bool Open(Error* error) {
    if (socket_.fd() >= 0) {
      return true;
    }
    std::string message;
    if (!config_.Validate(&message)) {
      return Fail(ErrorCode::kInvalidConfig, message, error);
    }
    if (!socket_.Open(config_.listening_port, config_.bind_address, true,
                      config_.reuse_address)) {
      return Fail(socket_.last_error_code(), socket_.last_error(), error);
    }
    std::ostringstream oss;
    oss << "Socket bound to: " << config_.bind_address << ":"
        << socket_.local_port();
    internal::LogInfo(oss.str(), config_.log_callback, config_.verbose);
    return true;
  }

  void Close() { socket_.Close(); }

  // Bound -> Waiting -> {Matched, TimedOut, ReceiveError}. Waiting loops on
  // datagrams that are not beacons or that name another service.
  bool Wait(std::optional<std::chrono::milliseconds> timeout, Beacon* out,
            Error* error) {
    if (socket_.fd() < 0) {
      return Fail(ErrorCode::kNotOpen, "listener is not open", error);
    }
    if (timeout.has_value() && timeout->count() < 0) {
      timeout = std::chrono::milliseconds(0);
    }
    const auto start = std::chrono::steady_clock::now();
    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (timeout.has_value()) {
      // A timeout past the clock's range is treated as no timeout.
      const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::time_point::max() - start);
      if (*timeout < headroom) {
        deadline = start + *timeout;
      }
    }
    internal::LogInfo("Waiting for a beacon from service: '" +
                          config_.service_name + "'",
                      config_.log_callback, config_.verbose);

    std::array<uint8_t, kMaxDatagramSize> buffer{};
    bool polled = false;
    while (true) {
      std::optional<std::chrono::milliseconds> remaining;
      if (deadline.has_value()) {
        const auto left = std::chrono::ceil<std::chrono::milliseconds>(
            *deadline - std::chrono::steady_clock::now());
        // An expired deadline ends the wait even while datagrams keep arriving.
        if (left.count() <= 0 && polled) {
          return TimedOut(*timeout, error);
        }
        remaining = left.count() < 0 ? std::chrono::milliseconds(0) : left;
      }
      polled = true;
      const int ready = socket_.WaitReadable(remaining);
      if (ready < 0) {
        if (errno == EINTR) {
          continue;
        }
        return Fail(ErrorCode::kIo,
                    "poll() failed: " + std::string(std::strerror(errno)),
                    error);
      }
      if (ready == 0) {
        // Re-checked against the deadline at the top of the loop.
        continue;
      }

      sockaddr_in addr{};
      socklen_t addr_len = sizeof(addr);
      const ssize_t bytes =
          socket_.RecvFrom(buffer.data(), buffer.size(), &addr, &addr_len);
      if (bytes < 0) {
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
          continue;
        }
        return Fail(ErrorCode::kIo,
                    "recvfrom() failed: " + std::string(std::strerror(errno)),
                    error);
      }
      ++metrics_.datagrams_received;
      const std::string source = internal::AddrToString(addr);

      BeaconFrame frame;
      if (!DecodeBeacon(buffer.data(), static_cast<size_t>(bytes), &frame)) {
        ++metrics_.non_beacons;
        internal::LogInfo("Discarded non-beacon datagram from " + source,
                          config_.log_callback, config_.verbose);
        continue;
      }
      if (frame.service_name != config_.service_name) {
        ++metrics_.filtered;
        continue;
      }

      ++metrics_.beacons_matched;
      Beacon beacon;
      beacon.service_ip = source;
      beacon.service_port = frame.service_port;
      beacon.service_name = std::move(frame.service_name);
      internal::LogInfo("Beacon received: " + beacon.ToString(),
                        config_.log_callback, config_.verbose);
      if (out) {
        *out = std::move(beacon);
      }
      return true;
    }
  }

  bool IsOpen() const { return socket_.fd() >= 0; }
  uint16_t LocalPort() const { return socket_.local_port(); }
  const std::string& ServiceName() const { return config_.service_name; }
  Error GetLastError() const { return last_error_; }
  ListenerMetrics GetMetrics() const { return metrics_; }

 private:
  bool TimedOut(std::chrono::milliseconds timeout, Error* error) {
    std::ostringstream oss;
    oss << "no beacon from service '" << config_.service_name << "' within "
        << timeout.count() << " ms";
    return Fail(ErrorCode::kTimeout, oss.str(), error);
  }

  bool Fail(ErrorCode code, const std::string& message, Error* error) {
    // Timeouts are logged at info level only.
    if (code == ErrorCode::kTimeout) {
      internal::LogInfo(message, config_.log_callback, config_.verbose);
    } else {
      internal::LogError(message, config_.log_callback);
    }
    last_error_ = Error{code, message};
    if (error) {
      *error = last_error_;
    }
    return false;
  }

  ListenerConfig config_;
  internal::UdpSocket socket_;
  Error last_error_;
  ListenerMetrics metrics_;
};

BeaconListener::BeaconListener(ListenerConfig config)
    : impl_(new Impl(std::move(config))) {}

BeaconListener::~BeaconListener() { impl_->Close(); }

bool BeaconListener::Open(Error* error) { return impl_->Open(error); }
void BeaconListener::Close() { impl_->Close(); }

bool BeaconListener::Wait(std::optional<std::chrono::milliseconds> timeout,
                          Beacon* out, Error* error) {
  return impl_->Wait(timeout, out, error);
}

bool BeaconListener::is_open() const { return impl_->IsOpen(); }
uint16_t BeaconListener::local_port() const { return impl_->LocalPort(); }

const std::string& BeaconListener::service_name() const {
  return impl_->ServiceName();
}

Error BeaconListener::GetLastError() const { return impl_->GetLastError(); }

ListenerMetrics BeaconListener::GetMetrics() const { return impl_->GetMetrics(); }

}  // namespace simpdiscover
