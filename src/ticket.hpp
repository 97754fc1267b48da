#pragma once

#include <string>
#include <utility>

#include "types.hpp"

namespace sendmer {

// Keeps only the hints `options` discloses. Never touches the id.
void apply_options(EndpointAddr& addr, AddrInfoOptions options);

// Everything a receiver needs to find and verify shared data.
struct Ticket {
  static constexpr const char* kPrefix = "blob";

  EndpointAddr addr;
  ContentHash hash;
  BlobFormat format = BlobFormat::HashSeq;

  Ticket() = default;
  Ticket(EndpointAddr addr, const ContentHash& hash, BlobFormat format)
  : addr(std::move(addr)), hash(hash), format(format) {}

  // "blob" followed by the lowercase hex of the MessagePack body.
  std::string to_string() const;
  // Throws TicketError.
  static Ticket parse(const std::string& text);
};

} // namespace sendmer
