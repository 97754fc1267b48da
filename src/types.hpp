#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sendmer {

// 32-byte SHA-256 digest naming one immutable blob.
class ContentHash {
public:
  static constexpr std::size_t kSize = 32;
  using Bytes = std::array<unsigned char, kSize>;

  ContentHash() = default;
  explicit ContentHash(const Bytes& bytes) : bytes_(bytes) {}

  static ContentHash of(const void* data, std::size_t size);
  static std::optional<ContentHash> from_hex(std::string_view hex);
  static std::optional<ContentHash> from_bytes(const unsigned char* data, std::size_t size);

  const Bytes& bytes() const { return bytes_; }
  std::string to_hex() const;
  // First 8 hex characters, for log lines.
  std::string short_hex() const { return to_hex().substr(0, 8); }

  bool operator==(const ContentHash& other) const { return bytes_ == other.bytes_; }
  bool operator!=(const ContentHash& other) const { return bytes_ != other.bytes_; }
  bool operator<(const ContentHash& other) const { return bytes_ < other.bytes_; }

private:
  Bytes bytes_{};
};

struct ContentHashHasher {
  std::size_t operator()(const ContentHash& hash) const;
};

// HashSeq marks a blob whose content is a sequence of hashes (a collection root).
enum class BlobFormat {
  Raw,
  HashSeq
};

const char* to_string(BlobFormat format);
std::optional<BlobFormat> blob_format_from_string(std::string_view text);

struct HashAndFormat {
  ContentHash hash;
  BlobFormat format = BlobFormat::Raw;
};

struct TransportAddr {
  enum class Kind {
    Ip,
    Relay
  };
  Kind kind = Kind::Ip;
  // "host:port" for Ip ("[v6]:port" for IPv6), a URL for Relay.
  std::string value;

  static TransportAddr ip(std::string host_port) { return {Kind::Ip, std::move(host_port)}; }
  static TransportAddr relay(std::string url) { return {Kind::Relay, std::move(url)}; }

  bool operator==(const TransportAddr& other) const {
    return kind == other.kind && value == other.value;
  }
};

struct EndpointAddr {
  std::string id;
  std::vector<TransportAddr> addrs;

  bool has_relay() const;
  bool has_ip() const;
};

// Which reachability hints a ticket discloses.
enum class AddrInfoOptions {
  Id,
  RelayAndAddresses,
  Relay,
  Addresses
};

const char* to_string(AddrInfoOptions options);
std::optional<AddrInfoOptions> addr_info_options_from_string(std::string_view text);

struct RelayModeOption {
  enum class Mode {
    Disabled,
    Default,
    Custom
  };
  Mode mode = Mode::Default;
  std::string url;

  static RelayModeOption parse(const std::string& text);
  std::string to_string() const;
};

struct TransferStats {
  uint64_t bytes_read = 0;
  uint64_t bytes_written = 0;
  std::chrono::steady_clock::duration elapsed{};

  double elapsed_seconds() const {
    return std::chrono::duration<double>(elapsed).count();
  }
};

} // namespace sendmer
