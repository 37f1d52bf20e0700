#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace simpdiscover {

/**
 * Beacon wire format (all integers big-endian):
 *
 *   offset 0  magic number (0xBEEF)
 *   offset 2  advertised service port
 *   offset 4  service name bytes, up to the end of the datagram
 */
constexpr uint16_t kBeaconMagic = 0xBEEF;
constexpr size_t kBeaconHeaderSize = 4;

/**
 * Receive buffer capacity. Larger datagrams are truncated by the transport.
 */
constexpr size_t kMaxDatagramSize = 1024;
constexpr size_t kMaxServiceNameLength = kMaxDatagramSize - kBeaconHeaderSize;

/**
 * Fields carried by one decoded beacon datagram.
 */
struct BeaconFrame {
  /// Advertised application port (not the UDP broadcast port).
  uint16_t service_port = 0;
  /// Raw service name bytes; may contain NULs or non-UTF-8 data.
  std::string service_name;
};

/// Build the beacon payload for a service.
std::vector<uint8_t> EncodeBeacon(uint16_t service_port,
                                  const std::string& service_name);

/// Return true if the buffer starts with the beacon magic number.
bool IsBeacon(const uint8_t* data, size_t length);

/**
 * Decode a received datagram.
 *
 * @return false if the buffer is not a beacon (too short or wrong magic).
 */
bool DecodeBeacon(const uint8_t* data, size_t length, BeaconFrame* out);
bool DecodeBeacon(const std::vector<uint8_t>& data, BeaconFrame* out);

}  // namespace simpdiscover
