#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace orvibo {

using Bytes = std::vector<uint8_t>;
using Identity = std::array<uint8_t, 6>;

/**
 * Well-known control port (UDP) used for discovery and device commands.
 */
constexpr uint16_t kControlPort = 10000;

/**
 * Wire constants shared by the frame codec and the device procedures.
 */
constexpr std::array<uint8_t, 2> kMagic = {0x68, 0x64};
constexpr std::array<uint8_t, 6> kSpaces6 = {0x20, 0x20, 0x20, 0x20, 0x20, 0x20};
constexpr std::array<uint8_t, 4> kZeros4 = {0x00, 0x00, 0x00, 0x00};

constexpr size_t kFrameHeaderSize = 6;
/// Bytes counted by the length field besides the payload (length + command).
constexpr uint16_t kLengthFieldBase = 4;
/// Largest payload the 16-bit length field can describe.
constexpr size_t kMaxPayloadSize = 0xffff - kLengthFieldBase;

/**
 * Two-byte command codes found at offset 4 of every frame.
 */
enum class Command : uint16_t {
  kDiscover = 0x7161,
  kSubscribe = 0x636c,
  kControl = 0x6463,
  kSocketEvent = 0x7366,
  kLearnIr = 0x6c73,
  kBlastIr = 0x6963,
};

/// RF433 blasting shares the control command code.
constexpr Command kBlastRf433 = Command::kControl;

/**
 * Device class reported by discovery.
 */
enum class DeviceKind {
  kUnknown,
  kSwitch,
  kIrda,
};

/// Return "switch", "irda" or "unknown".
std::string KindName(DeviceKind kind);
/// Parse a kind name; "socket" is accepted for switches. Unknown text maps to kUnknown.
DeviceKind ParseKind(const std::string& name);

/// Return the identity with its byte order reversed.
Identity ReverseIdentity(const Identity& identity);
/// Format an identity as 12 lowercase hex digits.
std::string FormatIdentity(const Identity& identity);
/// Parse 12 hex digits (separators ':' and '-' are ignored).
bool ParseIdentity(const std::string& text, Identity* out);

/**
 * Frame header fields read at fixed offsets.
 */
struct FrameHeader {
  /// Declared length (bytes 2-3, big-endian).
  uint16_t length = 0;
  /// Command code (bytes 4-5).
  uint16_t command = 0;
};

/**
 * Build a frame: magic + length + command + payload parts in order.
 *
 * @throws Error if the parts exceed kMaxPayloadSize.
 */
Bytes EncodeFrame(Command command, std::initializer_list<Bytes> parts = {});

/**
 * Read the length and command fields without validating the payload.
 *
 * @return false if fewer than kFrameHeaderSize bytes are available.
 */
bool DecodeHeader(const uint8_t* data, size_t length, FrameHeader* out);
bool DecodeHeader(const Bytes& data, FrameHeader* out);

/// True if the magic matches and the length field agrees with the datagram size.
bool IsWellFormedFrame(const uint8_t* data, size_t length);

/**
 * One received datagram and the address it came from.
 */
struct Frame {
  /// Sender IPv4 address.
  std::string source_address;
  /// Raw datagram bytes, header included.
  Bytes data;

  uint16_t length() const;
  uint16_t command() const;
  bool Is(Command expected) const { return command() == static_cast<uint16_t>(expected); }
  /// Bytes after the 6-byte header.
  Bytes payload() const;
};

/**
 * Device address, identity and kind, as produced by discovery.
 */
struct DeviceRecord {
  /// Dotted IPv4 address.
  std::string address;
  /// 6-byte physical address.
  Identity identity = {0, 0, 0, 0, 0, 0};
  DeviceKind kind = DeviceKind::kUnknown;
};

/**
 * Errors raised by the core. Device behavior (no answer, wrong kind, learn
 * timeout) is reported through return values instead.
 */
class Error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// The socket failed or reported an exceptional condition.
class TransportError : public Error {
 public:
  using Error::Error;
};

/// A requested address did not answer a discovery pass.
class DeviceNotFoundError : public Error {
 public:
  using Error::Error;
};

/// A signal label is missing from the repository.
class SignalNotFoundError : public Error {
 public:
  using Error::Error;
};

enum class LogLevel {
  kDebug,
  kInfo,
  kWarning,
  kError,
};

/**
 * Socket, timing and logging configuration.
 */
struct Config {
  using LogCallback = std::function<void(LogLevel, const std::string&)>;

  /// Local bind address for sockets (usually 0.0.0.0).
  std::string bind_address = "0.0.0.0";
  /// Local port for discovery and per-operation sockets (0 picks any port).
  uint16_t bind_port = kControlPort;
  /// Remote port devices listen on.
  uint16_t device_port = kControlPort;
  /// Broadcast address used for discovery packets.
  std::string broadcast_address = "255.255.255.255";

  /// Length of one send/receive polling slice.
  std::chrono::milliseconds poll_interval{1000};
  /// Slices to wait for the socket to become writable before a send is dropped.
  int send_slices = 10;
  /// Slices a single receive may spend skipping unrelated frames.
  int receive_slices = 10;
  /// Upper bound on discovery responses handled in one pass.
  int max_discovery_responses = 512;

  /// Minimum spacing between two subscriptions to the same device.
  std::chrono::milliseconds subscribe_interval{100};
  /// Overall wait for a signal while learning.
  std::chrono::milliseconds learn_timeout{15000};

  /// Also search the whole discovery response for the kind tag when it is
  /// not at its fixed offset.
  bool scan_kind_tag = false;

  /// Messages below this level are dropped.
  LogLevel min_log_level = LogLevel::kInfo;
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
 * Counters for frame flow on the sockets a device or discovery pass used.
 */
struct TransportMetrics {
  uint64_t frames_sent = 0;
  uint64_t frames_received = 0;
  /// Well-formed frames dropped because their command did not match.
  uint64_t frames_discarded = 0;
  uint64_t malformed_frames = 0;
};

/**
 * Captured signals keyed by a caller-supplied label.
 */
class SignalStore {
 public:
  virtual ~SignalStore() = default;

  /// Return the bytes stored under label; throws SignalNotFoundError.
  virtual Bytes Load(const std::string& label) = 0;
  /// Store bytes under label, replacing any previous value.
  virtual bool Save(const std::string& label, const Bytes& signal) = 0;
};

/**
 * One file per label inside a directory.
 */
class FileSignalStore : public SignalStore {
 public:
  explicit FileSignalStore(std::string directory);

  Bytes Load(const std::string& label) override;
  bool Save(const std::string& label, const Bytes& signal) override;

  /// Labels currently stored, sorted.
  std::vector<std::string> List() const;
  const std::string& directory() const { return directory_; }

  /// Labels may not be empty, start with '.', or contain path separators.
  static bool IsValidLabel(const std::string& label);

 private:
  std::string directory_;
};

class MemorySignalStore : public SignalStore {
 public:
  Bytes Load(const std::string& label) override;
  bool Save(const std::string& label, const Bytes& signal) override;

  size_t size() const { return signals_.size(); }
  bool Contains(const std::string& label) const;

 private:
  std::map<std::string, Bytes> signals_;
};

/**
 * Broadcast a discovery frame and collect every answering device.
 *
 * @param metrics Optional counters updated for the pass.
 * @return map from device address to record.
 * @throws TransportError if the socket cannot be opened or fails.
 */
std::map<std::string, DeviceRecord> DiscoverAll(const Config& config = Config(),
                                                TransportMetrics* metrics = nullptr);

/**
 * Run a discovery pass and return the device at address.
 *
 * @throws DeviceNotFoundError if address did not answer.
 */
DeviceRecord DiscoverDevice(const std::string& address, const Config& config = Config());

enum class LearnOutcome {
  kCaptured,
  kTimedOut,
  kFailed,
};

struct LearnResult {
  LearnOutcome outcome = LearnOutcome::kFailed;
  /// Raw signal bytes when captured.
  Bytes signal;

  bool ok() const { return outcome == LearnOutcome::kCaptured; }
};

/**
 * A single appliance. Each command subscribes first, on either a short-lived
 * socket or the retained one in keep-connection mode. A device must not be
 * used from two threads at once.
 */
class Device {
 public:
  /// Throws TransportError if config does not validate.
  explicit Device(DeviceRecord record, Config config = Config());
  ~Device();

  Device(Device&&) noexcept;
  Device& operator=(Device&&) noexcept;
  Device(const Device&) = delete;
  Device& operator=(const Device&) = delete;

  /// Discover the device at address and construct it; throws DeviceNotFoundError.
  static Device FromAddress(const std::string& address, Config config = Config());

  const DeviceRecord& record() const;
  const std::string& address() const { return record().address; }
  const Identity& identity() const { return record().identity; }
  DeviceKind kind() const { return record().kind; }

  /// Set the repository used by Learn and Emit.
  void SetSignalStore(std::shared_ptr<SignalStore> store);

  /// Retain one socket across calls; returns false if the subscription fails.
  bool SetKeepConnection(bool keep);
  bool keep_connection() const;
  /// Release the retained socket, if any.
  void Close();

  /**
   * Subscribe to the device.
   *
   * @return last byte of the response (device state), or nullopt without an answer.
   */
  std::optional<uint8_t> Subscribe();

  /// Switch state from a fresh subscription; nullopt if unanswered or not a switch.
  std::optional<bool> IsOn();
  /// Turn a switch on or off; false on no answer or wrong kind.
  bool SetOn(bool on);

  /**
   * Arm learning mode and wait for one remote control signal.
   *
   * @param label If non-empty, the signal is saved under this label.
   */
  LearnResult Learn(const std::string& label = std::string());
  LearnResult Learn(const std::string& label, std::chrono::milliseconds timeout);

  /// Replay a stored signal. Throws SignalNotFoundError if it cannot be loaded.
  bool Emit(const std::string& label);
  /// Replay stored signals in order; a missing label aborts the rest.
  bool EmitSequence(const std::vector<std::string>& labels);
  /// Replay raw signal bytes. Signals too large for one frame return false.
  bool EmitSignal(const Bytes& signal);

  /// Return counters for every socket this device used.
  TransportMetrics GetMetrics() const;

  /// Orvibo[type=..., ip=..., mac=...]
  std::string ToString() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace orvibo
