#include "types.hpp"

#include <algorithm>
#include <cstring>

#include "utils.hpp"

namespace sendmer {

ContentHash ContentHash::of(const void* data, std::size_t size) {
  return ContentHash(sha256_digest(data, size));
}

std::optional<ContentHash> ContentHash::from_hex(std::string_view hex) {
  if(hex.size() != kSize * 2) return std::nullopt;
  std::vector<unsigned char> raw;
  if(!bytes_from_hex(hex, raw)) return std::nullopt;
  return from_bytes(raw.data(), raw.size());
}

std::optional<ContentHash> ContentHash::from_bytes(const unsigned char* data, std::size_t size) {
  if(size != kSize) return std::nullopt;
  Bytes bytes{};
  std::memcpy(bytes.data(), data, kSize);
  return ContentHash(bytes);
}

std::string ContentHash::to_hex() const {
  return hex_from_bytes(bytes_.data(), bytes_.size());
}

std::size_t ContentHashHasher::operator()(const ContentHash& hash) const {
  std::size_t out = 0;
  std::memcpy(&out, hash.bytes().data(), sizeof(out));
  return out;
}

const char* to_string(BlobFormat format) {
  switch(format) {
    case BlobFormat::Raw: return "raw";
    case BlobFormat::HashSeq: return "hash_seq";
  }
  return "raw";
}

std::optional<BlobFormat> blob_format_from_string(std::string_view text) {
  if(text == "raw") return BlobFormat::Raw;
  if(text == "hash_seq") return BlobFormat::HashSeq;
  return std::nullopt;
}

bool EndpointAddr::has_relay() const {
  return std::any_of(addrs.begin(), addrs.end(),
    [](const TransportAddr& a){ return a.kind == TransportAddr::Kind::Relay; });
}

bool EndpointAddr::has_ip() const {
  return std::any_of(addrs.begin(), addrs.end(),
    [](const TransportAddr& a){ return a.kind == TransportAddr::Kind::Ip; });
}

const char* to_string(AddrInfoOptions options) {
  switch(options) {
    case AddrInfoOptions::Id: return "id";
    case AddrInfoOptions::RelayAndAddresses: return "relay_and_addresses";
    case AddrInfoOptions::Relay: return "relay";
    case AddrInfoOptions::Addresses: return "addresses";
  }
  return "relay_and_addresses";
}

std::optional<AddrInfoOptions> addr_info_options_from_string(std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  lowered.erase(std::remove(lowered.begin(), lowered.end(), '-'), lowered.end());
  lowered.erase(std::remove(lowered.begin(), lowered.end(), '_'), lowered.end());
  if(lowered == "id") return AddrInfoOptions::Id;
  if(lowered == "relayandaddresses") return AddrInfoOptions::RelayAndAddresses;
  if(lowered == "relay") return AddrInfoOptions::Relay;
  if(lowered == "addresses") return AddrInfoOptions::Addresses;
  return std::nullopt;
}

RelayModeOption RelayModeOption::parse(const std::string& text) {
  RelayModeOption out;
  if(text == "disabled") {
    out.mode = Mode::Disabled;
  } else if(text == "default" || text.empty()) {
    out.mode = Mode::Default;
  } else {
    out.mode = Mode::Custom;
    out.url = text;
  }
  return out;
}

std::string RelayModeOption::to_string() const {
  switch(mode) {
    case Mode::Disabled: return "disabled";
    case Mode::Default: return "default";
    case Mode::Custom: return url;
  }
  return "default";
}

} // namespace sendmer
