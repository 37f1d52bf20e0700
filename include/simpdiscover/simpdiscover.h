#pragma once

#include "simpdiscover/frame_codec.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace simpdiscover {

/**
 * UDP port beacons are broadcast to when none is configured.
 */
constexpr uint16_t kDefaultBroadcastPort = 9002;

using LogCallback = std::function<void(const std::string&)>;

/**
 * Failure categories reported by senders and listeners.
 */
enum class ErrorCode {
  kNone,
  /// Configuration rejected by Validate().
  kInvalidConfig,
  /// bind() failed with EADDRINUSE.
  kAddressInUse,
  /// Any other socket(), setsockopt() or bind() failure.
  kBindFailed,
  /// Operation on a sender/listener that is not open.
  kNotOpen,
  /// Send or receive failure.
  kIo,
  /// Wait() expired without a matching beacon.
  kTimeout,
};

/// Stable name of an error code, e.g. "AddressInUse".
const char* ErrorCodeName(ErrorCode code);

/// True for the two bind failure codes.
bool IsBindError(ErrorCode code);

struct Error {
  ErrorCode code = ErrorCode::kNone;
  /// Human readable description, including the address and errno text.
  std::string message;
};

/**
 * A beacon received by a BeaconListener.
 */
struct Beacon {
  /// IPv4 address the beacon was sent from.
  std::string service_ip;
  /// Port the announced service listens on.
  uint16_t service_port = 0;
  /// Raw service name bytes.
  std::string service_name;

  /// Printable form; non-printable name bytes are escaped as \xNN.
  std::string ToString() const;
};

std::ostream& operator<<(std::ostream& os, const Beacon& beacon);

/**
 * Configuration for a BeaconSender.
 */
struct SenderConfig {
  /// Port of the service being announced.
  uint16_t service_port = 0;
  /// Name of the service being announced (raw bytes).
  std::string service_name;
  /// UDP port beacons are sent to.
  uint16_t broadcast_port = kDefaultBroadcastPort;

  /// Local bind address for the sending socket (port is always ephemeral).
  std::string bind_address = "0.0.0.0";
  /// Destination address for beacons.
  std::string broadcast_address = "255.255.255.255";

  /// Period used by Start() for the background send loop.
  std::chrono::milliseconds send_period{1000};

  /// Log informational messages in addition to errors.
  bool verbose = false;
  /// Optional log callback (defaults to stderr).
  LogCallback log_callback;

  /**
   * Validate configuration values.
   *
   * @param error Optional output string describing the first validation error.
   * @return true if the configuration is valid.
   */
  bool Validate(std::string* error = nullptr) const;
};

/**
 * Configuration for a BeaconListener.
 */
struct ListenerConfig {
  /// Only beacons whose service name equals this value are returned.
  std::string service_name;
  /// UDP port to listen on; 0 binds an ephemeral port.
  uint16_t listening_port = kDefaultBroadcastPort;

  /// Local bind address (usually 0.0.0.0 to receive broadcasts).
  std::string bind_address = "0.0.0.0";
  /**
   * Set SO_REUSEADDR so several listeners can share a port. While enabled, a
   * second listener on an occupied port binds successfully; kAddressInUse is
   * only reported when this is false or the current owner did not set it.
   */
  bool reuse_address = true;

  /// Log informational messages in addition to errors.
  bool verbose = false;
  /// Optional log callback (defaults to stderr).
  LogCallback log_callback;

  bool Validate(std::string* error = nullptr) const;
};

struct SenderMetrics {
  uint64_t packets_sent = 0;
  uint64_t send_errors = 0;
};

struct ListenerMetrics {
  uint64_t datagrams_received = 0;
  /// Datagrams discarded because they were not beacons.
  uint64_t non_beacons = 0;
  /// Beacons discarded because they named another service.
  uint64_t filtered = 0;
  uint64_t beacons_matched = 0;
};

/**
 * Periodically broadcasts a beacon announcing one service.
 */
class BeaconSender {
 public:
  explicit BeaconSender(SenderConfig config);
  /// Stop the background loop and close the socket.
  ~BeaconSender();

  BeaconSender(const BeaconSender&) = delete;
  BeaconSender& operator=(const BeaconSender&) = delete;

  /**
   * Validate the configuration, bind an ephemeral broadcast-enabled socket
   * and precompute the beacon payload.
   *
   * @return false on failure; `error` receives kInvalidConfig,
   * kAddressInUse or kBindFailed.
   */
  bool Open(Error* error = nullptr);
  /// Stop the background loop and release the socket.
  void Close();

  /**
   * Send the beacon once.
   *
   * @return number of bytes sent, or nullopt with kIo/kNotOpen in `error`.
   */
  std::optional<size_t> SendOne(Error* error = nullptr);

  /**
   * Send a beacon every `period` on the calling thread.
   *
   * Returns false with the error on the first failed send, or true once
   * Stop() is called from another thread. A Stop() stays in effect until the
   * next Open() or Start(), so a loop entered after Stop() returns true after
   * its first send.
   */
  bool SendLoop(std::chrono::milliseconds period, Error* error = nullptr);

  /// Run SendLoop(config.send_period) on a background thread.
  bool Start(Error* error = nullptr);
  /// Interrupt SendLoop() and join the background thread, if any.
  void Stop();

  bool is_open() const;
  bool is_running() const;
  /// Port the sending socket was bound to, or 0 if not open.
  uint16_t local_port() const;
  /// Precomputed payload; empty until Open() succeeds.
  const std::vector<uint8_t>& payload() const;
  /// Destination as "address:port".
  std::string destination() const;

  /// Return the most recent error, including background loop failures.
  Error GetLastError() const;
  SenderMetrics GetMetrics() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

/**
 * Blocks until a beacon for a given service name is received.
 *
 * A listener must be driven by a single caller at a time; concurrent calls to
 * Wait() on one instance are not supported.
 */
class BeaconListener {
 public:
  explicit BeaconListener(ListenerConfig config);
  ~BeaconListener();

  BeaconListener(const BeaconListener&) = delete;
  BeaconListener& operator=(const BeaconListener&) = delete;

  /**
   * Validate the configuration and bind the receiving socket with broadcast
   * reception enabled.
   *
   * @return false on failure; `error` receives kInvalidConfig,
   * kAddressInUse or kBindFailed.
   */
  bool Open(Error* error = nullptr);
  void Close();

  /**
   * Wait for a beacon matching the configured service name.
   *
   * Datagrams that are not beacons, and beacons for other services, are
   * discarded. With a timeout, the whole call is bounded by it; with
   * nullopt, or a timeout too large for the steady clock, it blocks until a
   * match or a receive error. Negative timeouts poll once.
   *
   * @return true and fills `out` on a match; false with kTimeout, kIo or
   * kNotOpen in `error`.
   */
  bool Wait(std::optional<std::chrono::milliseconds> timeout, Beacon* out,
            Error* error = nullptr);

  bool is_open() const;
  /// Port the socket is bound to, or 0 if not open.
  uint16_t local_port() const;
  const std::string& service_name() const;

  Error GetLastError() const;
  ListenerMetrics GetMetrics() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace simpdiscover
