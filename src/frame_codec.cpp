#include "simpdiscover/frame_codec.h"

namespace simpdiscover {
namespace {

constexpr size_t kOffsetMagic = 0x00;
constexpr size_t kOffsetServicePort = 0x02;
constexpr size_t kOffsetServiceName = kBeaconHeaderSize;

// Read big-endian integers from packet bytes.
uint16_t ReadBe16(const uint8_t* data, size_t offset) {
  return static_cast<uint16_t>((data[offset] << 8) | data[offset + 1]);
}

// Write big-endian integers into packet payloads.
void WriteBe16(std::vector<uint8_t>& data, size_t offset, uint32_t value) {
  data[offset] = static_cast<uint8_t>((value >> 8) & 0xff);
  data[offset + 1] = static_cast<uint8_t>(value & 0xff);
}

}  // namespace

std::vector<uint8_t> EncodeBeacon(uint16_t service_port,
                                  const std::string& service_name) {
  std::vector<uint8_t> packet(kBeaconHeaderSize);
  packet.reserve(kBeaconHeaderSize + service_name.size());
  WriteBe16(packet, kOffsetMagic, kBeaconMagic);
  WriteBe16(packet, kOffsetServicePort, service_port);
  packet.insert(packet.end(), service_name.begin(), service_name.end());
  return packet;
}

bool IsBeacon(const uint8_t* data, size_t length) {
  if (!data || length < kBeaconHeaderSize) {
    return false;
  }
  return ReadBe16(data, kOffsetMagic) == kBeaconMagic;
}

bool DecodeBeacon(const uint8_t* data, size_t length, BeaconFrame* out) {
  if (!out || !IsBeacon(data, length)) {
    return false;
  }
  out->service_port = ReadBe16(data, kOffsetServicePort);
  // The name has no length prefix; it runs to the end of the datagram.
  out->service_name.assign(reinterpret_cast<const char*>(data + kOffsetServiceName),
                           length - kOffsetServiceName);
  return true;
}

bool DecodeBeacon(const std::vector<uint8_t>& data, BeaconFrame* out) {
  return DecodeBeacon(data.data(), data.size(), out);
}

}  // namespace simpdiscover
