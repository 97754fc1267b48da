#include "endpoint.hpp"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <istream>
#include <stdexcept>

#include "log.hpp"
#include "protocol.hpp"
#include "utils.hpp"

namespace sendmer {

namespace {

constexpr std::size_t kMaxLineSize = 96 * 1024 * 1024;
constexpr std::chrono::milliseconds kIoTimeout{30000};

// Reads the hello line off an accepted socket and hands the socket to the handler
// registered for the requested protocol.
class IncomingHandshake : public std::enable_shared_from_this<IncomingHandshake> {
public:
  IncomingHandshake(Endpoint& endpoint, asio::ip::tcp::socket socket, Logger* logger)
    : endpoint_(endpoint),
      socket_(std::move(socket)),
      timer_(endpoint.io()),
      read_buf_(64 * 1024),
      logger_(logger) {}

  void start() {
    auto self = shared_from_this();
    timer_.expires_after(Endpoint::kHandshakeTimeout);
    timer_.async_wait([this, self](const std::error_code& ec){
      if(ec) return;
      log_debug(logger_, "handshake timed out");
      std::error_code ignored;
      socket_.close(ignored);
    });
    asio::async_read_until(socket_, read_buf_, "\n",
      [this, self](std::error_code ec, std::size_t){
        timer_.cancel();
        if(ec) {
          log_debug(logger_, "handshake read error: {}", ec.message());
          return;
        }
        std::istream is(&read_buf_);
        std::string line;
        std::getline(is, line);
        handle_hello(line);
      });
  }

private:
  void handle_hello(const std::string& line) {
    nlohmann::json hello;
    try {
      hello = nlohmann::json::parse(line);
    } catch(const std::exception& ex) {
      log_warn(logger_, "Failed to parse hello: {}", ex.what());
      refuse(kErrBadRequest, "expected a hello message");
      return;
    }
    if(message_type(hello) != "hello") {
      refuse(kErrBadRequest, "expected a hello message");
      return;
    }
    auto alpn_field = string_field(hello, "alpn");
    auto target_field = string_field(hello, "endpoint_id");
    if(!alpn_field || !target_field) {
      log_warn(logger_, "Malformed hello: {}", line);
      refuse(kErrBadRequest, "hello fields must be strings");
      return;
    }
    const auto& alpn = *alpn_field;
    const auto& target = *target_field;
    auto handler = endpoint_.handler_for(alpn);
    if(!handler) {
      refuse(kErrUnsupportedAlpn, "no handler for " + alpn);
      return;
    }
    if(target != endpoint_.id()) {
      refuse(kErrWrongEndpoint, "this is endpoint " + endpoint_.id());
      return;
    }
    auto self = shared_from_this();
    auto ack = std::make_shared<std::string>(make_hello_ack(endpoint_.id()).dump() + "\n");
    asio::async_write(socket_, asio::buffer(*ack),
      [this, self, ack, handler](std::error_code ec, std::size_t){
        if(ec) {
          log_debug(logger_, "handshake write error: {}", ec.message());
          return;
        }
        handler->accept(std::move(socket_));
      });
  }

  void refuse(const std::string& kind, const std::string& message) {
    auto self = shared_from_this();
    auto reply = std::make_shared<std::string>(make_error(0, kind, message).dump() + "\n");
    asio::async_write(socket_, asio::buffer(*reply),
      [this, self, reply](std::error_code, std::size_t){
        std::error_code ignored;
        socket_.close(ignored);
      });
  }

  Endpoint& endpoint_;
  asio::ip::tcp::socket socket_;
  asio::steady_timer timer_;
  asio::streambuf read_buf_;
  Logger* logger_;
};

bool usable_interface_addr(const asio::ip::address& address) {
  if(address.is_unspecified()) return false;
  if(address.is_v6()) {
    auto v6 = address.to_v6();
    if(v6.is_link_local() || v6.is_v4_mapped()) return false;
  }
  return true;
}

std::vector<asio::ip::address> interface_addresses(bool want_v6) {
  std::vector<asio::ip::address> out;
  ifaddrs* list = nullptr;
  if(getifaddrs(&list) != 0) return out;
  for(auto* it = list; it != nullptr; it = it->ifa_next) {
    if(!it->ifa_addr || !(it->ifa_flags & IFF_UP)) continue;
    if(!want_v6 && it->ifa_addr->sa_family == AF_INET) {
      auto* sin = reinterpret_cast<sockaddr_in*>(it->ifa_addr);
      asio::ip::address_v4 v4(ntohl(sin->sin_addr.s_addr));
      out.emplace_back(v4);
    } else if(want_v6 && it->ifa_addr->sa_family == AF_INET6) {
      auto* sin6 = reinterpret_cast<sockaddr_in6*>(it->ifa_addr);
      asio::ip::address_v6::bytes_type bytes;
      std::memcpy(bytes.data(), sin6->sin6_addr.s6_addr, bytes.size());
      out.emplace_back(asio::ip::address_v6(bytes));
    }
  }
  freeifaddrs(list);
  return out;
}

} // namespace

// ---- helpers --------------------------------------------------------------

std::vector<unsigned char> get_or_create_secret(Logger* logger) {
  if(const char* env = std::getenv("SENDMER_SECRET")) {
    std::vector<unsigned char> secret;
    if(bytes_from_hex(env, secret) && secret.size() == 32) {
      return secret;
    }
    throw Error("SENDMER_SECRET must be 64 hex characters");
  }
  auto secret = random_bytes(32);
  log_debug(logger, "using a fresh secret key; set SENDMER_SECRET to reuse an endpoint id");
  return secret;
}

asio::ip::tcp::endpoint parse_socket_addr(const std::string& text) {
  std::string host;
  std::string port;
  if(!text.empty() && text.front() == '[') {
    auto close = text.find(']');
    if(close == std::string::npos || close + 1 >= text.size() || text[close + 1] != ':') {
      throw Error("invalid socket address '" + text + "'");
    }
    host = text.substr(1, close - 1);
    port = text.substr(close + 2);
  } else {
    auto colon = text.rfind(':');
    if(colon == std::string::npos) {
      throw Error("invalid socket address '" + text + "' (expected host:port)");
    }
    host = text.substr(0, colon);
    port = text.substr(colon + 1);
  }
  std::error_code ec;
  auto address = asio::ip::make_address(host, ec);
  if(ec) {
    throw Error("invalid address '" + host + "': " + ec.message());
  }
  int port_value = 0;
  try {
    port_value = std::stoi(port);
  } catch(const std::exception&) {
    throw Error("invalid port '" + port + "'");
  }
  if(port_value < 0 || port_value > 65535) {
    throw Error("invalid port '" + port + "'");
  }
  return {address, static_cast<unsigned short>(port_value)};
}

std::string format_socket_addr(const asio::ip::tcp::endpoint& endpoint) {
  auto address = endpoint.address();
  if(address.is_v6()) {
    return "[" + address.to_string() + "]:" + std::to_string(endpoint.port());
  }
  return address.to_string() + ":" + std::to_string(endpoint.port());
}

// ---- client connection ----------------------------------------------------

// Connects to the address this connection was created for. A cancel() issued
// before or during the attempt aborts it.
void TcpConnection::open(std::chrono::milliseconds timeout) {
  asio::ip::tcp::endpoint target;
  try {
    target = parse_socket_addr(remote_);
  } catch(const Error& e) {
    throw NetworkError(NetworkErrorKind::Connection, e.what());
  }
  check_cancelled(NetworkErrorKind::Connection);
  std::error_code result = asio::error::would_block;
  socket_.async_connect(target, [&](const std::error_code& ec){ result = ec; });
  run_for(timeout);
  check_cancelled(NetworkErrorKind::Connection);
  if(result) {
    throw NetworkError(NetworkErrorKind::Connection,
                       "connect to " + remote_ + " failed: " +
                       (result == asio::error::operation_aborted ? std::string("timed out") : result.message()));
  }
  std::error_code ignored;
  socket_.set_option(asio::ip::tcp::no_delay(true), ignored);
}

TcpConnection::TcpConnection(std::string remote, std::chrono::milliseconds io_timeout)
  : socket_(io_),
    read_buf_(kMaxLineSize),
    remote_(std::move(remote)),
    io_timeout_(io_timeout) {}

TcpConnection::~TcpConnection() {
  close();
}

// Runs the pending operation; on timeout the socket is closed so the
// operation completes with operation_aborted.
void TcpConnection::run_for(std::chrono::milliseconds timeout) {
  io_.restart();
  io_.run_for(timeout);
  if(!io_.stopped()) {
    std::error_code ignored;
    socket_.close(ignored);
    io_.run();
  }
}

void TcpConnection::check_cancelled(NetworkErrorKind kind) const {
  if(cancelled_.load()) {
    throw NetworkError(kind, "connection to " + remote_ + " was cancelled");
  }
}

void TcpConnection::send_json(const nlohmann::json& message) {
  check_cancelled(NetworkErrorKind::TransportSend);
  auto line = message.dump() + "\n";
  std::error_code result = asio::error::would_block;
  asio::async_write(socket_, asio::buffer(line),
                    [&](const std::error_code& ec, std::size_t){ result = ec; });
  run_for(io_timeout_);
  if(result) {
    throw NetworkError(NetworkErrorKind::TransportSend,
                       "write to " + remote_ + " failed: " + result.message());
  }
}

nlohmann::json TcpConnection::read_json(NetworkErrorKind on_failure) {
  check_cancelled(on_failure);
  std::error_code result = asio::error::would_block;
  asio::async_read_until(socket_, read_buf_, "\n",
                         [&](const std::error_code& ec, std::size_t){ result = ec; });
  run_for(io_timeout_);
  if(result) {
    throw NetworkError(on_failure, "read from " + remote_ + " failed: " + result.message());
  }
  std::istream is(&read_buf_);
  std::string line;
  std::getline(is, line);
  try {
    return nlohmann::json::parse(line);
  } catch(const nlohmann::json::exception& e) {
    throw NetworkError(NetworkErrorKind::Decode, "malformed message from " + remote_ + ": " + e.what());
  }
}

void TcpConnection::read_exact(char* data, std::size_t size, NetworkErrorKind on_failure) {
  check_cancelled(on_failure);
  // Bytes that arrived together with the last line.
  std::size_t have = std::min(size, read_buf_.size());
  if(have > 0) {
    asio::buffer_copy(asio::buffer(data, have), read_buf_.data(), have);
    read_buf_.consume(have);
  }
  if(have == size) return;
  std::error_code result = asio::error::would_block;
  asio::async_read(socket_, asio::buffer(data + have, size - have),
                   [&](const std::error_code& ec, std::size_t){ result = ec; });
  run_for(io_timeout_);
  if(result) {
    throw NetworkError(on_failure, "read from " + remote_ + " failed: " + result.message());
  }
}

void TcpConnection::cancel() {
  if(cancelled_.exchange(true)) return;
  asio::post(io_, [this]{
    std::error_code ignored;
    socket_.close(ignored);
  });
}

void TcpConnection::close() {
  std::error_code ignored;
  if(socket_.is_open()) {
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
  }
}

// ---- endpoint -------------------------------------------------------------

std::shared_ptr<Endpoint> Endpoint::bind(EndpointOptions options) {
  auto endpoint = std::make_shared<Endpoint>(std::move(options));
  endpoint->open_acceptor(endpoint->options_.bind_v4);
  if(!endpoint->options_.bind_v6.empty()) {
    endpoint->open_acceptor(endpoint->options_.bind_v6);
  }
  endpoint->collect_direct_addrs();
  for(auto& acceptor : endpoint->acceptors_) {
    endpoint->start_accept(*acceptor);
  }
  auto* raw = endpoint.get();
  asio::post(endpoint->io_, [raw]{
    std::lock_guard<std::mutex> lock(raw->online_mutex_);
    raw->online_ = true;
    raw->online_cv_.notify_all();
  });
  endpoint->io_thread_ = std::thread([raw]{
    for(;;) {
      try {
        raw->io_.run();
        break;
      } catch(const std::exception& e) {
        log_error(raw->options_.logger.get(), "endpoint handler failed: {}", e.what());
      }
    }
  });
  log_debug(endpoint->options_.logger.get(), "endpoint {} bound", endpoint->id_.substr(0, 8));
  return endpoint;
}

Endpoint::Endpoint(EndpointOptions options)
  : options_(std::move(options)),
    work_(asio::make_work_guard(io_)) {
  if(options_.secret.empty()) {
    options_.secret = get_or_create_secret(options_.logger.get());
  }
  if(options_.secret.size() != 32) {
    throw Error("endpoint secret must be 32 bytes");
  }
  id_ = hex_from_bytes(sha256_digest(options_.secret.data(), options_.secret.size()).data(), 32);
}

Endpoint::~Endpoint() {
  shutdown(std::chrono::milliseconds(2000));
}

void Endpoint::open_acceptor(const std::string& bind_addr) {
  tcp::endpoint local;
  try {
    local = parse_socket_addr(bind_addr);
  } catch(const Error& e) {
    throw NetworkError(NetworkErrorKind::Connection, std::string("bind: ") + e.what());
  }
  auto acceptor = std::make_unique<tcp::acceptor>(io_);
  std::error_code ec;
  acceptor->open(local.protocol(), ec);
  if(!ec) acceptor->set_option(tcp::acceptor::reuse_address(true), ec);
  if(!ec && local.address().is_v6()) acceptor->set_option(asio::ip::v6_only(true), ec);
  if(!ec) acceptor->bind(local, ec);
  if(!ec) acceptor->listen(asio::socket_base::max_listen_connections, ec);
  if(ec) {
    throw NetworkError(NetworkErrorKind::Connection,
                       "unable to bind " + bind_addr + ": " + ec.message());
  }
  acceptors_.push_back(std::move(acceptor));
}

void Endpoint::collect_direct_addrs() {
  direct_addrs_.clear();
  for(const auto& acceptor : acceptors_) {
    auto local = acceptor->local_endpoint();
    if(!local.address().is_unspecified()) {
      direct_addrs_.push_back(TransportAddr::ip(format_socket_addr(local)));
      continue;
    }
    for(const auto& address : interface_addresses(local.address().is_v6())) {
      if(!usable_interface_addr(address)) continue;
      direct_addrs_.push_back(TransportAddr::ip(format_socket_addr({address, local.port()})));
    }
  }
}

void Endpoint::start_accept(tcp::acceptor& acceptor) {
  acceptor.async_accept(
    [this, &acceptor](std::error_code ec, tcp::socket socket){
      if(ec) {
        if(ec != asio::error::operation_aborted) {
          log_error(options_.logger.get(), "Accept error: {}", ec.message());
        }
      } else {
        std::error_code remote_ec;
        auto remote = socket.remote_endpoint(remote_ec);
        log_debug(options_.logger.get(), "Accepted connection from {}",
                  remote_ec ? std::string("?") : format_socket_addr(remote));
        std::make_shared<IncomingHandshake>(*this, std::move(socket), options_.logger.get())->start();
      }
      if(!shut_down_.load() && acceptor.is_open()) {
        start_accept(acceptor);
      }
    });
}

void Endpoint::accept(const std::string& alpn, std::shared_ptr<ProtocolHandler> handler) {
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  handlers_[alpn] = std::move(handler);
}

std::shared_ptr<ProtocolHandler> Endpoint::handler_for(const std::string& alpn) const {
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  auto it = handlers_.find(alpn);
  return it == handlers_.end() ? nullptr : it->second;
}

EndpointAddr Endpoint::addr() const {
  EndpointAddr out;
  out.id = id_;
  switch(options_.relay.mode) {
    case RelayModeOption::Mode::Disabled:
      break;
    case RelayModeOption::Mode::Default:
      if(!options_.default_relay_url.empty()) {
        out.addrs.push_back(TransportAddr::relay(options_.default_relay_url));
      }
      break;
    case RelayModeOption::Mode::Custom:
      out.addrs.push_back(TransportAddr::relay(options_.relay.url));
      break;
  }
  out.addrs.insert(out.addrs.end(), direct_addrs_.begin(), direct_addrs_.end());
  return out;
}

bool Endpoint::wait_online(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(online_mutex_);
  return online_cv_.wait_for(lock, timeout, [this]{ return online_; });
}

std::shared_ptr<Connection> Endpoint::connect(const EndpointAddr& addr, const std::string& alpn) {
  if(shut_down_.load()) {
    throw NetworkError(NetworkErrorKind::Connection, "endpoint is shut down");
  }
  std::vector<std::string> candidates;
  for(const auto& hint : addr.addrs) {
    if(hint.kind == TransportAddr::Kind::Ip) candidates.push_back(hint.value);
  }
  if(candidates.empty()) {
    throw NetworkError(NetworkErrorKind::Connection,
                       addr.has_relay()
                         ? "the ticket only carries relay addresses and relayed connections are not supported"
                         : "the ticket carries no addresses and endpoint discovery is not supported");
  }

  std::string last_error;
  for(const auto& candidate : candidates) {
    try {
      // Registered before dialing so shutdown() can abort the dial and the hello.
      auto conn = std::make_shared<TcpConnection>(candidate, kIoTimeout);
      {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        if(shut_down_.load()) {
          throw NetworkError(NetworkErrorKind::Connection, "endpoint is shut down");
        }
        clients_.erase(std::remove_if(clients_.begin(), clients_.end(),
                                      [](const std::weak_ptr<Connection>& c){ return c.expired(); }),
                       clients_.end());
        clients_.push_back(conn);
      }
      conn->open(kConnectTimeout);
      conn->send_json(make_hello(alpn, addr.id));
      auto reply = conn->read_json(NetworkErrorKind::Connection);
      auto type = message_type(reply);
      if(type == "hello_ack") {
        log_debug(options_.logger.get(), "connected to {} via {}", addr.id.substr(0, 8), candidate);
        return conn;
      }
      last_error = type == "error"
        ? error_from_reply(reply, NetworkErrorKind::Connection).what()
        : "unexpected handshake reply '" + type + "'";
    } catch(const NetworkError& e) {
      last_error = e.what();
    }
    log_debug(options_.logger.get(), "dial {} failed: {}", candidate, last_error);
    if(shut_down_.load()) {
      throw NetworkError(NetworkErrorKind::Connection, "endpoint is shut down");
    }
  }
  throw NetworkError(NetworkErrorKind::Connection,
                     "unable to reach endpoint " + addr.id.substr(0, 8) + ": " + last_error);
}

bool Endpoint::shutdown(std::chrono::milliseconds timeout) {
  if(shut_down_.exchange(true)) return true;

  {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    for(auto& weak : clients_) {
      if(auto conn = weak.lock()) conn->cancel();
    }
    clients_.clear();
  }

  std::vector<std::shared_ptr<ProtocolHandler>> handlers;
  {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    for(auto& entry : handlers_) handlers.push_back(entry.second);
  }

  asio::post(io_, [this]{
    for(auto& acceptor : acceptors_) {
      std::error_code ignored;
      acceptor->close(ignored);
    }
  });
  for(auto& handler : handlers) handler->shutdown();

  auto deadline = std::chrono::steady_clock::now() + timeout;
  bool drained = false;
  while(true) {
    drained = true;
    for(auto& handler : handlers) {
      if(handler->active_connections() > 0) drained = false;
    }
    if(drained || std::chrono::steady_clock::now() >= deadline) break;
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  if(!drained) {
    log_warn(options_.logger.get(), "endpoint shutdown timed out with open connections");
  }

  work_.reset();
  io_.stop();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
  acceptors_.clear();
  return drained;
}

} // namespace sendmer
