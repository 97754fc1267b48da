#include "ticket.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "utils.hpp"

using json = nlohmann::json;

namespace sendmer {

void apply_options(EndpointAddr& addr, AddrInfoOptions options) {
  auto keep_only = [&](TransportAddr::Kind kind){
    addr.addrs.erase(std::remove_if(addr.addrs.begin(), addr.addrs.end(),
                                    [&](const TransportAddr& a){ return a.kind != kind; }),
                     addr.addrs.end());
  };
  switch(options) {
    case AddrInfoOptions::Id:
      addr.addrs.clear();
      break;
    case AddrInfoOptions::RelayAndAddresses:
      break;
    case AddrInfoOptions::Relay:
      keep_only(TransportAddr::Kind::Relay);
      break;
    case AddrInfoOptions::Addresses:
      keep_only(TransportAddr::Kind::Ip);
      break;
  }
}

std::string Ticket::to_string() const {
  json addrs = json::array();
  for(const auto& a : addr.addrs) {
    addrs.push_back({{a.kind == TransportAddr::Kind::Ip ? "ip" : "relay", a.value}});
  }
  json body = {
    {"addr", {{"id", addr.id}, {"addrs", addrs}}},
    {"hash", hash.to_hex()},
    {"format", sendmer::to_string(format)}
  };
  return std::string(kPrefix) + hex_from_bytes(json::to_msgpack(body));
}

Ticket Ticket::parse(const std::string& text) {
  const std::string prefix(kPrefix);
  if(text.compare(0, prefix.size(), prefix) != 0) {
    throw TicketError("ticket must start with '" + prefix + "'");
  }
  std::vector<unsigned char> raw;
  if(!bytes_from_hex(std::string_view(text).substr(prefix.size()), raw) || raw.empty()) {
    throw TicketError("ticket body is not valid hex");
  }

  Ticket ticket;
  try {
    auto body = json::from_msgpack(raw);
    const auto& addr = body.at("addr");
    ticket.addr.id = addr.at("id").get<std::string>();
    for(const auto& entry : addr.at("addrs")) {
      if(entry.contains("ip")) {
        ticket.addr.addrs.push_back(TransportAddr::ip(entry.at("ip").get<std::string>()));
      } else if(entry.contains("relay")) {
        ticket.addr.addrs.push_back(TransportAddr::relay(entry.at("relay").get<std::string>()));
      } else {
        throw TicketError("ticket holds an unknown address kind");
      }
    }
    auto hash = ContentHash::from_hex(body.at("hash").get<std::string>());
    if(!hash) throw TicketError("ticket hash is malformed");
    ticket.hash = *hash;
    auto format = blob_format_from_string(body.at("format").get<std::string>());
    if(!format) throw TicketError("ticket format is unknown");
    ticket.format = *format;
  } catch(const json::exception& e) {
    throw TicketError(std::string("ticket is malformed: ") + e.what());
  }
  if(ticket.addr.id.empty()) {
    throw TicketError("ticket has no endpoint id");
  }
  return ticket;
}

} // namespace sendmer
