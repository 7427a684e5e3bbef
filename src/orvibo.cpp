#include "orvibo/orvibo.h"
#include "orvibo/test_hooks.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

namespace orvibo {
namespace {

constexpr size_t kOffsetLength = 0x02;
constexpr size_t kOffsetCommand = 0x04;

// Discovery response: header + 0x00 + identity + SPACES_6 + reversed identity
// + SPACES_6 + 6-byte type tag ("SOC002", "IRD005", ...).
constexpr size_t kOffsetDiscoveryIdentity = 0x07;
constexpr size_t kOffsetDiscoveryKindTag = 0x1f;
constexpr size_t kKindTagSize = 3;
constexpr char kSwitchTag[] = "SOC";
constexpr char kIrdaTag[] = "IRD";

constexpr uint8_t kLearnArm[] = {0x01, 0x00};
constexpr uint8_t kEmitTag[] = {0x65, 0x00, 0x00, 0x00};
// BLAST_IR payload: identity + SPACES_6 + emit tag + 2-byte packet id + signal.
constexpr size_t kMaxBlastSignalSize =
    kMaxPayloadSize - (6 + kSpaces6.size() + sizeof(kEmitTag) + 2);

// LEARN_IR frames declaring this length carry no signal.
constexpr uint16_t kEmptyLearnLength = 0x0018;
// Bytes between the identity marker and the signal in a learn frame.
constexpr size_t kLearnSignalSubHeader = 6;

constexpr uint8_t kStateOn = 0x01;
constexpr uint8_t kStateOff = 0x00;

constexpr size_t kMaxDatagramSize = 4096;

uint16_t ReadBe16(const uint8_t* data, size_t offset) {
  return static_cast<uint16_t>((data[offset] << 8) | data[offset + 1]);
}

void AppendBe16(Bytes& data, uint16_t value) {
  data.push_back(static_cast<uint8_t>((value >> 8) & 0xff));
  data.push_back(static_cast<uint8_t>(value & 0xff));
}

template <size_t N>
Bytes ToBytes(const std::array<uint8_t, N>& value) {
  return Bytes(value.begin(), value.end());
}

template <size_t N>
Bytes ToBytes(const uint8_t (&value)[N]) {
  return Bytes(value, value + N);
}

const char* LevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarning:
      return "warning";
    case LogLevel::kError:
      return "error";
  }
  return "?";
}

void Log(LogLevel level, const std::string& message, const Config* config) {
  if (config && level < config->min_log_level) {
    return;
  }
  if (config && config->log_callback) {
    config->log_callback(level, message);
    return;
  }
  std::cerr << "[orvibo] " << LevelName(level) << ": " << message << std::endl;
}

bool IsLogged(LogLevel level, const Config& config) {
  return level >= config.min_log_level;
}

std::string CommandName(uint16_t command) {
  switch (static_cast<Command>(command)) {
    case Command::kDiscover:
      return "DISCOVER";
    case Command::kSubscribe:
      return "SUBSCRIBE";
    case Command::kControl:
      return "CONTROL";
    case Command::kSocketEvent:
      return "SOCKET_EVENT";
    case Command::kLearnIr:
      return "LEARN_IR";
    case Command::kBlastIr:
      return "BLAST_IR";
  }
  std::ostringstream oss;
  oss << "0x" << std::hex << std::setw(4) << std::setfill('0') << command;
  return oss.str();
}

template <size_t N>
bool MatchesAt(const Bytes& data, size_t offset, const std::array<uint8_t, N>& pattern) {
  return offset + N <= data.size() &&
         std::equal(pattern.begin(), pattern.end(), data.begin() + offset);
}

// Hex dump with the magic, command and filler runs spelled out.
std::string DescribeBytes(const Bytes& data) {
  std::ostringstream oss;
  size_t offset = 0;
  if (MatchesAt(data, 0, kMagic) && data.size() >= kFrameHeaderSize) {
    oss << "MAGIC len=" << ReadBe16(data.data(), kOffsetLength) << ' '
        << CommandName(ReadBe16(data.data(), kOffsetCommand));
    offset = kFrameHeaderSize;
  }
  bool in_hex = false;
  while (offset < data.size()) {
    if (MatchesAt(data, offset, kSpaces6)) {
      oss << " SPACES_6";
      offset += kSpaces6.size();
      in_hex = false;
      continue;
    }
    if (MatchesAt(data, offset, kZeros4)) {
      oss << " ZEROS_4";
      offset += kZeros4.size();
      in_hex = false;
      continue;
    }
    if (!in_hex) {
      oss << ' ';
      in_hex = true;
    }
    oss << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<int>(data[offset]) << std::dec;
    ++offset;
  }
  return oss.str();
}

// Convert a string address and port into a sockaddr_in.
bool MakeSockaddr(const std::string& address, uint16_t port, sockaddr_in* out) {
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

std::string ErrnoMessage(const std::string& what) {
  return what + " failed: " + std::strerror(errno);
}

// Minimal UDP socket wrapper for send/recv with broadcast support.
class UdpSocket {
 public:
  UdpSocket() = default;
  ~UdpSocket() { Close(); }

  UdpSocket(const UdpSocket&) = delete;
  UdpSocket& operator=(const UdpSocket&) = delete;

  bool Open(uint16_t port, const std::string& bind_address) {
    if (fd_ >= 0) {
      return true;
    }
    fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd_ < 0) {
      last_error_ = ErrnoMessage("socket()");
      return false;
    }
    int enable = 1;
    if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable)) < 0) {
      last_error_ = ErrnoMessage("setsockopt(SO_REUSEADDR)");
      Close();
      return false;
    }
    if (::setsockopt(fd_, SOL_SOCKET, SO_BROADCAST, &enable, sizeof(enable)) < 0) {
      last_error_ = ErrnoMessage("setsockopt(SO_BROADCAST)");
      Close();
      return false;
    }
    sockaddr_in addr{};
    if (!MakeSockaddr(bind_address, port, &addr)) {
      last_error_ = "invalid bind address: " + bind_address;
      Close();
      return false;
    }
    if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
      std::ostringstream oss;
      oss << "bind(" << bind_address << ":" << port << ") failed: "
          << std::strerror(errno);
      last_error_ = oss.str();
      Close();
      return false;
    }
    return true;
  }

  // Restrict the socket to a single peer.
  bool Connect(const sockaddr_in& peer) {
    if (::connect(fd_, reinterpret_cast<const sockaddr*>(&peer), sizeof(peer)) < 0) {
      last_error_ = ErrnoMessage("connect()");
      return false;
    }
    connected_ = true;
    return true;
  }

  void Close() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
    connected_ = false;
  }

  int fd() const { return fd_; }
  bool connected() const { return connected_; }
  const std::string& last_error() const { return last_error_; }

  uint16_t LocalPort() const {
    sockaddr_in addr{};
    socklen_t addr_len = sizeof(addr);
    if (fd_ < 0 ||
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &addr_len) < 0) {
      return 0;
    }
    return ntohs(addr.sin_port);
  }

  ssize_t SendTo(const Bytes& data, const sockaddr_in& addr) {
    if (connected_) {
      return ::send(fd_, data.data(), data.size(), 0);
    }
    return ::sendto(fd_, data.data(), data.size(), 0,
                    reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
  }

  ssize_t RecvFrom(uint8_t* buffer, size_t length, sockaddr_in* addr,
                   socklen_t* addr_len) {
    return ::recvfrom(fd_, buffer, length, 0,
                      reinterpret_cast<sockaddr*>(addr), addr_len);
  }

 private:
  int fd_ = -1;
  bool connected_ = false;
  std::string last_error_;
};

// One socket plus the slice-based send/receive used by every exchange.
// Responses are matched by command only; the protocol has no transaction ids.
class Transport {
 public:
  Transport(const Config& config, TransportMetrics* metrics)
      : config_(config), metrics_(metrics) {}

  // Bind the configured local port.
  void Open() {
    if (!socket_.Open(config_.bind_port, config_.bind_address)) {
      throw TransportError(socket_.last_error());
    }
  }

  // Bind an ephemeral port and connect to a single device.
  void OpenConnected(const std::string& address, uint16_t port) {
    sockaddr_in peer{};
    if (!MakeSockaddr(address, port, &peer)) {
      throw TransportError("invalid device address: " + address);
    }
    if (!socket_.Open(0, config_.bind_address) || !socket_.Connect(peer)) {
      const std::string error = socket_.last_error();
      socket_.Close();
      throw TransportError(error);
    }
  }

  void Close() { socket_.Close(); }
  uint16_t local_port() const { return socket_.LocalPort(); }

  void Send(const Bytes& frame, const std::string& address, uint16_t port) {
    if (frame.empty()) {
      return;
    }
    sockaddr_in dest{};
    if (!MakeSockaddr(address, port, &dest)) {
      throw TransportError("invalid destination address: " + address);
    }
    for (int slice = 0; slice < config_.send_slices; ++slice) {
      if (!WaitReady(/*for_write=*/true)) {
        continue;
      }
      const ssize_t sent = socket_.SendTo(frame, dest);
      if (sent < 0) {
        throw TransportError(ErrnoMessage("sendto(" + address + ")"));
      }
      if (static_cast<size_t>(sent) != frame.size()) {
        std::ostringstream oss;
        oss << "Partial send to " << address << ": " << sent << " of "
            << frame.size() << " bytes";
        throw TransportError(oss.str());
      }
      ++metrics_->frames_sent;
      if (IsLogged(LogLevel::kDebug, config_)) {
        Log(LogLevel::kDebug, "Packet to " + address + ": " + DescribeBytes(frame),
            &config_);
      }
      return;
    }
    Log(LogLevel::kDebug, "Socket not writable, dropped packet to " + address,
        &config_);
  }

  // Wait for the first frame carrying the expected command. A quiet slice
  // ends the wait; unrelated frames use up slices.
  std::optional<Frame> Receive(std::optional<Command> expected, int slices) {
    std::array<uint8_t, kMaxDatagramSize> buffer{};
    for (int slice = 0; slice < slices; ++slice) {
      if (!WaitReady(/*for_write=*/false)) {
        return std::nullopt;
      }
      sockaddr_in addr{};
      socklen_t addr_len = sizeof(addr);
      const ssize_t bytes = socket_.RecvFrom(buffer.data(), buffer.size(),
                                             &addr, &addr_len);
      if (bytes < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
          continue;
        }
        throw TransportError(ErrnoMessage("recvfrom()"));
      }
      const size_t length = static_cast<size_t>(bytes);
      if (!IsWellFormedFrame(buffer.data(), length)) {
        ++metrics_->malformed_frames;
        Log(LogLevel::kDebug,
            "Malformed packet from " + AddrToString(addr) + ": " +
                DescribeBytes(Bytes(buffer.begin(), buffer.begin() + length)),
            &config_);
        continue;
      }
      Frame frame;
      frame.source_address = AddrToString(addr);
      frame.data.assign(buffer.begin(), buffer.begin() + length);
      ++metrics_->frames_received;
      if (IsLogged(LogLevel::kDebug, config_)) {
        Log(LogLevel::kDebug,
            "Packet from " + frame.source_address + ": " + DescribeBytes(frame.data),
            &config_);
      }
      if (expected.has_value() && !frame.Is(expected.value())) {
        ++metrics_->frames_discarded;
        continue;
      }
      return frame;
    }
    return std::nullopt;
  }

  // Receive until nothing more arrives and keep the last matching frame.
  std::optional<Frame> ReceiveDrain(std::optional<Command> expected, int slices) {
    std::optional<Frame> last;
    while (true) {
      std::optional<Frame> frame = Receive(expected, slices);
      if (!frame.has_value()) {
        return last;
      }
      last = std::move(frame);
    }
  }

 private:
  // Wait one slice for readiness; throws on an exceptional condition.
  bool WaitReady(bool for_write) {
    const int fd = socket_.fd();
    if (fd < 0) {
      throw TransportError("socket is not open");
    }
    fd_set ready_fds;
    fd_set error_fds;
    FD_ZERO(&ready_fds);
    FD_ZERO(&error_fds);
    FD_SET(fd, &ready_fds);
    FD_SET(fd, &error_fds);
    const auto interval = config_.poll_interval;
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(interval.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((interval.count() % 1000) * 1000);
    const int ready = ::select(fd + 1, for_write ? nullptr : &ready_fds,
                               for_write ? &ready_fds : nullptr, &error_fds, &tv);
    if (ready < 0) {
      if (errno == EINTR) {
        return false;
      }
      throw TransportError(ErrnoMessage("select()"));
    }
    if (ready > 0 && FD_ISSET(fd, &error_fds)) {
      throw TransportError(for_write ? "Failed while sending packet"
                                     : "Getting response failed");
    }
    return ready > 0 && FD_ISSET(fd, &ready_fds);
  }

  const Config& config_;
  TransportMetrics* metrics_;
  UdpSocket socket_;
};

bool ParseDiscoveryResponse(const uint8_t* data, size_t length, bool scan_kind_tag,
                            DeviceRecord* out) {
  if (!out || length < kOffsetDiscoveryIdentity + out->identity.size()) {
    return false;
  }
  std::memcpy(out->identity.data(), data + kOffsetDiscoveryIdentity,
              out->identity.size());
  out->kind = DeviceKind::kUnknown;

  auto tag_at = [&](size_t offset, const char* tag) {
    return offset + kKindTagSize <= length &&
           std::memcmp(data + offset, tag, kKindTagSize) == 0;
  };
  if (tag_at(kOffsetDiscoveryKindTag, kSwitchTag)) {
    out->kind = DeviceKind::kSwitch;
  } else if (tag_at(kOffsetDiscoveryKindTag, kIrdaTag)) {
    out->kind = DeviceKind::kIrda;
  } else if (scan_kind_tag) {
    const uint8_t* end = data + length;
    auto contains = [&](const char* tag) {
      return std::search(data, end, tag, tag + kKindTagSize) != end;
    };
    if (contains(kSwitchTag)) {
      out->kind = DeviceKind::kSwitch;
    } else if (contains(kIrdaTag)) {
      out->kind = DeviceKind::kIrda;
    }
  }
  return true;
}

Bytes BuildSubscribePayload(const Identity& identity) {
  Bytes payload;
  payload.reserve(2 * (identity.size() + kSpaces6.size()));
  const Identity reversed = ReverseIdentity(identity);
  payload.insert(payload.end(), identity.begin(), identity.end());
  payload.insert(payload.end(), kSpaces6.begin(), kSpaces6.end());
  payload.insert(payload.end(), reversed.begin(), reversed.end());
  payload.insert(payload.end(), kSpaces6.begin(), kSpaces6.end());
  return payload;
}

Bytes BuildLearnArmFrame(const Identity& identity) {
  return EncodeFrame(Command::kLearnIr,
                     {ToBytes(identity), ToBytes(kSpaces6), ToBytes(kLearnArm),
                      ToBytes(kZeros4)});
}

Bytes BuildBlastFrame(const Identity& identity, uint16_t packet_id, const Bytes& signal) {
  Bytes id;
  AppendBe16(id, packet_id);
  return EncodeFrame(Command::kBlastIr,
                     {ToBytes(identity), ToBytes(kSpaces6), ToBytes(kEmitTag), id,
                      signal});
}

Bytes BuildControlFrame(const Identity& identity, bool on) {
  return EncodeFrame(Command::kControl,
                     {ToBytes(identity), ToBytes(kSpaces6), ToBytes(kZeros4),
                      Bytes{on ? kStateOn : kStateOff}});
}

// The signal follows identity + SPACES_6 and a fixed sub-header.
bool ExtractLearnedSignal(const Bytes& frame, const Identity& identity, Bytes* out) {
  Bytes marker = ToBytes(identity);
  marker.insert(marker.end(), kSpaces6.begin(), kSpaces6.end());
  const auto it = std::search(frame.begin(), frame.end(), marker.begin(), marker.end());
  if (it == frame.end()) {
    return false;
  }
  const size_t start = static_cast<size_t>(it - frame.begin()) + marker.size() +
                       kLearnSignalSubHeader;
  if (start > frame.size()) {
    return false;
  }
  out->assign(frame.begin() + start, frame.end());
  return true;
}

}  // namespace

std::string KindName(DeviceKind kind) {
  switch (kind) {
    case DeviceKind::kSwitch:
      return "switch";
    case DeviceKind::kIrda:
      return "irda";
    case DeviceKind::kUnknown:
      break;
  }
  return "unknown";
}

DeviceKind ParseKind(const std::string& name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "switch" || lower == "socket") {
    return DeviceKind::kSwitch;
  }
  if (lower == "irda") {
    return DeviceKind::kIrda;
  }
  return DeviceKind::kUnknown;
}

Identity ReverseIdentity(const Identity& identity) {
  Identity reversed = identity;
  std::reverse(reversed.begin(), reversed.end());
  return reversed;
}

std::string FormatIdentity(const Identity& identity) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (uint8_t byte : identity) {
    oss << std::setw(2) << static_cast<int>(byte);
  }
  return oss.str();
}

bool ParseIdentity(const std::string& text, Identity* out) {
  std::string digits;
  for (char c : text) {
    if (c == ':' || c == '-') {
      continue;
    }
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return false;
    }
    digits.push_back(c);
  }
  if (!out || digits.size() != out->size() * 2) {
    return false;
  }
  for (size_t i = 0; i < out->size(); ++i) {
    (*out)[i] = static_cast<uint8_t>(std::stoul(digits.substr(i * 2, 2), nullptr, 16));
  }
  return true;
}

Bytes EncodeFrame(Command command, std::initializer_list<Bytes> parts) {
  size_t payload_size = 0;
  for (const Bytes& part : parts) {
    payload_size += part.size();
  }
  if (payload_size > kMaxPayloadSize) {
    throw Error("frame payload too large: " + std::to_string(payload_size) + " bytes");
  }
  Bytes frame;
  frame.reserve(kFrameHeaderSize + payload_size);
  frame.insert(frame.end(), kMagic.begin(), kMagic.end());
  AppendBe16(frame, static_cast<uint16_t>(kLengthFieldBase + payload_size));
  AppendBe16(frame, static_cast<uint16_t>(command));
  for (const Bytes& part : parts) {
    frame.insert(frame.end(), part.begin(), part.end());
  }
  return frame;
}

bool DecodeHeader(const uint8_t* data, size_t length, FrameHeader* out) {
  if (!out || length < kFrameHeaderSize) {
    return false;
  }
  out->length = ReadBe16(data, kOffsetLength);
  out->command = ReadBe16(data, kOffsetCommand);
  return true;
}

bool DecodeHeader(const Bytes& data, FrameHeader* out) {
  return DecodeHeader(data.data(), data.size(), out);
}

bool IsWellFormedFrame(const uint8_t* data, size_t length) {
  FrameHeader header;
  if (!DecodeHeader(data, length, &header)) {
    return false;
  }
  if (std::memcmp(data, kMagic.data(), kMagic.size()) != 0) {
    return false;
  }
  return header.length == length - kMagic.size();
}

uint16_t Frame::length() const {
  FrameHeader header;
  return DecodeHeader(data, &header) ? header.length : 0;
}

uint16_t Frame::command() const {
  FrameHeader header;
  return DecodeHeader(data, &header) ? header.command : 0;
}

Bytes Frame::payload() const {
  if (data.size() <= kFrameHeaderSize) {
    return {};
  }
  return Bytes(data.begin() + kFrameHeaderSize, data.end());
}

bool Config::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  auto is_valid_ipv4 = [](const std::string& addr) {
    if (addr.empty()) {
      return false;
    }
    in_addr parsed{};
    return inet_pton(AF_INET, addr.c_str(), &parsed) == 1;
  };
  if (!bind_address.empty() && bind_address != "0.0.0.0") {
    if (!is_valid_ipv4(bind_address)) {
      return fail("bind_address must be a valid IPv4 address");
    }
  }
  if (!is_valid_ipv4(broadcast_address)) {
    return fail("broadcast_address must be a valid IPv4 address");
  }
  if (device_port == 0) {
    return fail("device_port must be non-zero");
  }
  if (poll_interval.count() <= 0) {
    return fail("poll_interval must be positive");
  }
  if (send_slices <= 0 || receive_slices <= 0) {
    return fail("send_slices and receive_slices must be positive");
  }
  if (max_discovery_responses <= 0) {
    return fail("max_discovery_responses must be positive");
  }
  if (subscribe_interval.count() < 0) {
    return fail("subscribe_interval must not be negative");
  }
  if (learn_timeout.count() <= 0) {
    return fail("learn_timeout must be positive");
  }
  return true;
}

std::map<std::string, DeviceRecord> DiscoverAll(const Config& config,
                                                TransportMetrics* metrics) {
  std::string error;
  if (!config.Validate(&error)) {
    throw TransportError("invalid configuration: " + error);
  }
  TransportMetrics local_metrics;
  Transport transport(config, metrics ? metrics : &local_metrics);
  transport.Open();

  Log(LogLevel::kDebug, "Discovering devices via " + config.broadcast_address, &config);
  transport.Send(EncodeFrame(Command::kDiscover), config.broadcast_address,
                 config.device_port);

  std::map<std::string, DeviceRecord> devices;
  for (int i = 0; i < config.max_discovery_responses; ++i) {
    std::optional<Frame> response =
        transport.Receive(Command::kDiscover, config.receive_slices);
    if (!response.has_value()) {
      break;
    }
    DeviceRecord record;
    if (!ParseDiscoveryResponse(response->data.data(), response->data.size(),
                                config.scan_kind_tag, &record)) {
      // Our own broadcast and other replies without an identity.
      continue;
    }
    record.address = response->source_address;
    Log(LogLevel::kDebug,
        "Discovered " + record.address + " type=" + KindName(record.kind) +
            " mac=" + FormatIdentity(record.identity),
        &config);
    devices[record.address] = record;
  }
  return devices;
}

DeviceRecord DiscoverDevice(const std::string& address, const Config& config) {
  const auto devices = DiscoverAll(config);
  const auto it = devices.find(address);
  if (it == devices.end()) {
    std::ostringstream oss;
    oss << "Device ip=" << address << " not found in [";
    bool first = true;
    for (const auto& entry : devices) {
      oss << (first ? "" : ", ") << entry.first;
      first = false;
    }
    oss << "]";
    throw DeviceNotFoundError(oss.str());
  }
  return it->second;
}

struct Device::Impl {
  Impl(DeviceRecord record, Config config)
      : record_(std::move(record)),
        config_(std::move(config)),
        last_subscribe_(std::chrono::steady_clock::now() - std::chrono::seconds(1)),
        rng_(std::random_device{}()) {}

  void Log(LogLevel level, const std::string& message) const {
    orvibo::Log(level, "Orvibo@" + record_.address + ": " + message, &config_);
  }

  // Run fn on the retained socket, or on a socket opened for this call only.
  template <typename Fn>
  auto WithTransport(Fn&& fn) {
    if (retained_) {
      return fn(*retained_);
    }
    Transport transport(config_, &metrics_);
    transport.Open();
    return fn(transport);
  }

  void SendFrame(Transport& transport, const Bytes& frame) {
    transport.Send(frame, record_.address, config_.device_port);
  }

  std::optional<uint8_t> SubscribeOn(Transport& transport) {
    const auto elapsed = std::chrono::steady_clock::now() - last_subscribe_;
    if (elapsed < config_.subscribe_interval) {
      // The hardware rejects subscriptions issued faster than this.
      std::this_thread::sleep_for(config_.subscribe_interval - elapsed);
    }
    std::optional<Frame> response;
    try {
      SendFrame(transport, EncodeFrame(Command::kSubscribe,
                                       {BuildSubscribePayload(record_.identity)}));
      response = transport.ReceiveDrain(Command::kSubscribe, config_.receive_slices);
    } catch (const TransportError&) {
      last_subscribe_ = std::chrono::steady_clock::now();
      throw;
    }
    last_subscribe_ = std::chrono::steady_clock::now();
    if (!response.has_value()) {
      return std::nullopt;
    }
    const Bytes payload = response->payload();
    if (payload.empty()) {
      Log(LogLevel::kWarning, "Subscription response carries no state");
      return std::nullopt;
    }
    return payload.back();
  }

  bool RequireKind(DeviceKind expected, const char* action) const {
    if (record_.kind == expected) {
      return true;
    }
    Log(LogLevel::kWarning, std::string("Attempt to ") + action +
                                " for device with type " + KindName(record_.kind));
    return false;
  }

  uint16_t NextPacketId() {
    std::uniform_int_distribution<unsigned int> dist(0, 0xffff);
    uint16_t id = static_cast<uint16_t>(dist(rng_));
    while (last_packet_id_.has_value() && id == last_packet_id_.value()) {
      id = static_cast<uint16_t>(dist(rng_));
    }
    last_packet_id_ = id;
    return id;
  }

  bool Blast(Transport& transport, const Bytes& signal) {
    if (signal.size() > kMaxBlastSignalSize) {
      Log(LogLevel::kWarning, "Signal of " + std::to_string(signal.size()) +
                                  " bytes does not fit in one packet");
      return false;
    }
    SendFrame(transport, BuildBlastFrame(record_.identity, NextPacketId(), signal));
    transport.ReceiveDrain(std::nullopt, config_.receive_slices);
    return true;
  }

  LearnResult LearnOn(Transport& transport, const std::string& label,
                      std::chrono::milliseconds timeout) {
    LearnResult result;
    if (!SubscribeOn(transport).has_value()) {
      Log(LogLevel::kWarning,
          "Subscription failed while entering Learning IR/RF433 mode");
      return result;
    }
    if (!RequireKind(DeviceKind::kIrda, "enter Learning IR/RF433 mode")) {
      return result;
    }

    Log(LogLevel::kDebug, "Entering Learning IR/RF433 mode");
    SendFrame(transport, BuildLearnArmFrame(record_.identity));
    if (!transport.Receive(Command::kLearnIr, config_.receive_slices).has_value()) {
      Log(LogLevel::kWarning, "Failed to enter Learning IR/RF433 mode");
      return result;
    }

    Log(LogLevel::kInfo, "Waiting " + std::to_string(timeout.count()) +
                             " ms for IR/RF433 signal...");
    const auto start = std::chrono::steady_clock::now();
    std::optional<Frame> captured;
    Bytes signal;
    while (!captured.has_value()) {
      const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start);
      if (elapsed > timeout) {
        Log(LogLevel::kWarning, "Nothing happened during " +
                                    std::to_string(timeout.count()) + " ms");
        result.outcome = LearnOutcome::kTimedOut;
        return result;
      }
      std::optional<Frame> frame = transport.Receive(std::nullopt, 1);
      if (!frame.has_value()) {
        Log(LogLevel::kInfo, "Remaining time: " +
                                 std::to_string((timeout - elapsed).count() / 1000) +
                                 " s");
        continue;
      }
      if (frame->length() == kEmptyLearnLength) {
        Log(LogLevel::kDebug, "Skipped empty packet: " + DescribeBytes(frame->data));
        continue;
      }
      if (frame->Is(Command::kLearnIr) &&
          ExtractLearnedSignal(frame->data, record_.identity, &signal)) {
        captured = std::move(frame);
        continue;
      }
      Log(LogLevel::kDebug, "Skipped unexpected packet: " + DescribeBytes(frame->data));
    }

    if (label.empty()) {
      Log(LogLevel::kInfo, "IR/RF433 signal captured");
    } else if (!store_) {
      Log(LogLevel::kWarning, "No signal store set, \"" + label + "\" not saved");
    } else if (!store_->Save(label, signal)) {
      Log(LogLevel::kWarning, "Failed to save signal \"" + label + "\"");
    } else {
      Log(LogLevel::kInfo, "IR/RF433 signal captured and saved to \"" + label + "\"");
    }
    result.outcome = LearnOutcome::kCaptured;
    result.signal = std::move(signal);
    return result;
  }

  bool EmitOn(Transport& transport, const std::vector<std::string>* labels,
              const Bytes* raw_signal) {
    if (!SubscribeOn(transport).has_value()) {
      Log(LogLevel::kWarning, "Subscription failed while emitting IR signal");
      return false;
    }
    if (!RequireKind(DeviceKind::kIrda, "emit IR signal")) {
      return false;
    }
    if (raw_signal) {
      if (!Blast(transport, *raw_signal)) {
        return false;
      }
    } else {
      for (const std::string& label : *labels) {
        if (!store_) {
          throw SignalNotFoundError("no signal store set, cannot load \"" + label + "\"");
        }
        Log(LogLevel::kDebug, "Reading IR signal \"" + label + "\"");
        if (!Blast(transport, store_->Load(label))) {
          return false;
        }
      }
    }
    Log(LogLevel::kInfo, "IR signal emitted successfully");
    return true;
  }

  DeviceRecord record_;
  Config config_;
  TransportMetrics metrics_;
  std::shared_ptr<SignalStore> store_;
  std::unique_ptr<Transport> retained_;
  std::chrono::steady_clock::time_point last_subscribe_;
  std::mt19937 rng_;
  std::optional<uint16_t> last_packet_id_;
};

Device::Device(DeviceRecord record, Config config) {
  std::string error;
  if (!config.Validate(&error)) {
    throw TransportError("invalid configuration: " + error);
  }
  impl_.reset(new Impl(std::move(record), std::move(config)));
}

Device::~Device() = default;
Device::Device(Device&&) noexcept = default;
Device& Device::operator=(Device&&) noexcept = default;

Device Device::FromAddress(const std::string& address, Config config) {
  Log(LogLevel::kDebug, "MAC address is not provided. Discovering " + address, &config);
  DeviceRecord record = DiscoverDevice(address, config);
  return Device(std::move(record), std::move(config));
}

const DeviceRecord& Device::record() const { return impl_->record_; }

void Device::SetSignalStore(std::shared_ptr<SignalStore> store) {
  impl_->store_ = std::move(store);
}

bool Device::SetKeepConnection(bool keep) {
  Close();
  if (!keep) {
    return true;
  }
  auto transport = std::make_unique<Transport>(impl_->config_, &impl_->metrics_);
  transport->OpenConnected(impl_->record_.address, impl_->config_.device_port);
  if (!impl_->SubscribeOn(*transport).has_value()) {
    impl_->Log(LogLevel::kWarning, "Connection subscription error");
    return false;
  }
  impl_->retained_ = std::move(transport);
  return true;
}

bool Device::keep_connection() const { return impl_->retained_ != nullptr; }

void Device::Close() {
  if (impl_ && impl_->retained_) {
    impl_->retained_->Close();
    impl_->retained_.reset();
  }
}

std::optional<uint8_t> Device::Subscribe() {
  return impl_->WithTransport(
      [this](Transport& transport) { return impl_->SubscribeOn(transport); });
}

std::optional<bool> Device::IsOn() {
  return impl_->WithTransport([this](Transport& transport) -> std::optional<bool> {
    const std::optional<uint8_t> state = impl_->SubscribeOn(transport);
    if (!state.has_value()) {
      impl_->Log(LogLevel::kWarning, "Subscription failed while reading switch state");
      return std::nullopt;
    }
    if (!impl_->RequireKind(DeviceKind::kSwitch, "read switch state")) {
      return std::nullopt;
    }
    return state.value() == kStateOn;
  });
}

bool Device::SetOn(bool on) {
  return impl_->WithTransport([this, on](Transport& transport) {
    if (!impl_->SubscribeOn(transport).has_value()) {
      impl_->Log(LogLevel::kWarning, "Subscription failed while switching");
      return false;
    }
    if (!impl_->RequireKind(DeviceKind::kSwitch, "switch power")) {
      return false;
    }
    impl_->SendFrame(transport, BuildControlFrame(impl_->record_.identity, on));
    if (!transport.Receive(Command::kControl, impl_->config_.receive_slices).has_value()) {
      impl_->Log(LogLevel::kWarning, "No response to switch command");
      return false;
    }
    return true;
  });
}

LearnResult Device::Learn(const std::string& label) {
  return Learn(label, impl_->config_.learn_timeout);
}

LearnResult Device::Learn(const std::string& label, std::chrono::milliseconds timeout) {
  return impl_->WithTransport([&](Transport& transport) {
    return impl_->LearnOn(transport, label, timeout);
  });
}

bool Device::Emit(const std::string& label) {
  return EmitSequence(std::vector<std::string>{label});
}

bool Device::EmitSequence(const std::vector<std::string>& labels) {
  return impl_->WithTransport([&](Transport& transport) {
    return impl_->EmitOn(transport, &labels, nullptr);
  });
}

bool Device::EmitSignal(const Bytes& signal) {
  return impl_->WithTransport([&](Transport& transport) {
    return impl_->EmitOn(transport, nullptr, &signal);
  });
}

TransportMetrics Device::GetMetrics() const { return impl_->metrics_; }

std::string Device::ToString() const {
  const DeviceRecord& record = impl_->record_;
  std::ostringstream oss;
  oss << "Orvibo[type=" << KindName(record.kind) << ", ip="
      << (record.address.empty() ? "Unknown" : record.address)
      << ", mac=" << FormatIdentity(record.identity) << "]";
  return oss.str();
}

#ifdef ORVIBO_TESTING
namespace test {

struct TransportTester::Impl {
  explicit Impl(const Config& cfg) : config(cfg), transport(config, &metrics) {}
  Config config;
  TransportMetrics metrics;
  Transport transport;
};

TransportTester::TransportTester(const Config& config)
    : impl_(new TransportTester::Impl(config)) {
  impl_->transport.Open();
}

TransportTester::~TransportTester() = default;

void TransportTester::Send(const Bytes& frame, const std::string& address, uint16_t port) {
  impl_->transport.Send(frame, address, port);
}

std::optional<Frame> TransportTester::Receive(std::optional<Command> expected, int slices) {
  return impl_->transport.Receive(expected, slices);
}

std::optional<Frame> TransportTester::ReceiveDrain(std::optional<Command> expected,
                                                   int slices) {
  return impl_->transport.ReceiveDrain(expected, slices);
}

uint16_t TransportTester::local_port() const { return impl_->transport.local_port(); }

TransportMetrics TransportTester::metrics() const { return impl_->metrics; }

bool ParseDiscoveryResponse(const Bytes& data, bool scan_kind_tag, DeviceRecord* out) {
  return orvibo::ParseDiscoveryResponse(data.data(), data.size(), scan_kind_tag, out);
}

Bytes BuildSubscribePayload(const Identity& identity) {
  return orvibo::BuildSubscribePayload(identity);
}

Bytes BuildLearnArmFrame(const Identity& identity) {
  return orvibo::BuildLearnArmFrame(identity);
}

Bytes BuildBlastFrame(const Identity& identity, uint16_t packet_id, const Bytes& signal) {
  return orvibo::BuildBlastFrame(identity, packet_id, signal);
}

Bytes BuildControlFrame(const Identity& identity, bool on) {
  return orvibo::BuildControlFrame(identity, on);
}

bool ExtractLearnedSignal(const Bytes& frame, const Identity& identity, Bytes* out) {
  return orvibo::ExtractLearnedSignal(frame, identity, out);
}

std::string DescribeFrame(const Bytes& frame) { return DescribeBytes(frame); }

}  // namespace test
#endif

}  // namespace orvibo
