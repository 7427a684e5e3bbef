#pragma once

#include "orvibo/orvibo.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace orvibo {

#ifdef ORVIBO_TESTING
namespace test {

/**
 * Wraps the internal UDP transport so tests can drive send/receive directly.
 */
class TransportTester {
 public:
  explicit TransportTester(const Config& config);
  ~TransportTester();

  TransportTester(const TransportTester&) = delete;
  TransportTester& operator=(const TransportTester&) = delete;

  void Send(const Bytes& frame, const std::string& address, uint16_t port);
  std::optional<Frame> Receive(std::optional<Command> expected, int slices);
  std::optional<Frame> ReceiveDrain(std::optional<Command> expected, int slices);
  /// Local port the socket is bound to.
  uint16_t local_port() const;
  TransportMetrics metrics() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

bool ParseDiscoveryResponse(const Bytes& data, bool scan_kind_tag, DeviceRecord* out);

Bytes BuildSubscribePayload(const Identity& identity);
Bytes BuildLearnArmFrame(const Identity& identity);
Bytes BuildBlastFrame(const Identity& identity, uint16_t packet_id, const Bytes& signal);
Bytes BuildControlFrame(const Identity& identity, bool on);

/// Locate identity + filler in a learn frame and return the signal after the sub-header.
bool ExtractLearnedSignal(const Bytes& frame, const Identity& identity, Bytes* out);

/// Hex dump with known constants annotated.
std::string DescribeFrame(const Bytes& frame);

}  // namespace test
#endif

}  // namespace orvibo
