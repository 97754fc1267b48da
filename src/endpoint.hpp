#pragma once

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "errors.hpp"
#include "types.hpp"

namespace sendmer {

class Logger;

// Established, handshaken client stream. Blocking; every operation is bounded by a timeout.
class Connection {
public:
  virtual ~Connection() = default;

  virtual void send_json(const nlohmann::json& message) = 0;
  // `on_failure` names the request phase reported if the read fails.
  virtual nlohmann::json read_json(NetworkErrorKind on_failure) = 0;
  virtual void read_exact(char* data, std::size_t size, NetworkErrorKind on_failure) = 0;
  // May be called from any thread; the pending or next operation fails.
  virtual void cancel() = 0;
  virtual void close() = 0;
  virtual const std::string& remote() const = 0;
};

class TcpConnection : public Connection {
public:
  // `remote` is the "host:port" that open() connects to.
  TcpConnection(std::string remote, std::chrono::milliseconds io_timeout);
  ~TcpConnection() override;

  void open(std::chrono::milliseconds timeout);

  void send_json(const nlohmann::json& message) override;
  nlohmann::json read_json(NetworkErrorKind on_failure) override;
  void read_exact(char* data, std::size_t size, NetworkErrorKind on_failure) override;
  void cancel() override;
  void close() override;
  const std::string& remote() const override { return remote_; }

private:
  void run_for(std::chrono::milliseconds timeout);
  void check_cancelled(NetworkErrorKind kind) const;

  asio::io_context io_;
  asio::ip::tcp::socket socket_;
  asio::streambuf read_buf_;
  std::string remote_;
  std::chrono::milliseconds io_timeout_;
  std::atomic<bool> cancelled_{false};
};

// Server side of one protocol id. Called on the endpoint's io thread.
class ProtocolHandler {
public:
  virtual ~ProtocolHandler() = default;
  virtual void accept(asio::ip::tcp::socket socket) = 0;
  // Thread-safe: close every connection this handler owns.
  virtual void shutdown() = 0;
  virtual std::size_t active_connections() const = 0;
};

struct EndpointOptions {
  RelayModeOption relay;
  // Relay hint advertised when relay mode is Default; empty advertises none.
  std::string default_relay_url;
  std::string bind_v4 = "0.0.0.0:0";
  // Empty: no IPv6 socket.
  std::string bind_v6;
  // Empty: SENDMER_SECRET from the environment, otherwise a fresh random key.
  std::vector<unsigned char> secret;
  std::shared_ptr<Logger> logger;
};

// 32-byte endpoint secret, from SENDMER_SECRET (hex) or random.
std::vector<unsigned char> get_or_create_secret(Logger* logger);

// host:port, or [v6]:port
asio::ip::tcp::endpoint parse_socket_addr(const std::string& text);
std::string format_socket_addr(const asio::ip::tcp::endpoint& endpoint);

class Endpoint {
public:
  static constexpr std::chrono::milliseconds kConnectTimeout{5000};
  static constexpr std::chrono::milliseconds kHandshakeTimeout{10000};

  static std::shared_ptr<Endpoint> bind(EndpointOptions options);

  explicit Endpoint(EndpointOptions options);
  ~Endpoint();
  Endpoint(const Endpoint&) = delete;
  Endpoint& operator=(const Endpoint&) = delete;

  void accept(const std::string& alpn, std::shared_ptr<ProtocolHandler> handler);
  std::shared_ptr<ProtocolHandler> handler_for(const std::string& alpn) const;

  const std::string& id() const { return id_; }
  const std::vector<unsigned char>& secret() const { return options_.secret; }
  EndpointAddr addr() const;

  bool wait_online(std::chrono::milliseconds timeout);

  // Dials each direct address in turn. Relay-only and id-only addresses cannot be reached.
  std::shared_ptr<Connection> connect(const EndpointAddr& addr, const std::string& alpn);

  // Returns false if connections were still open when the bound ran out.
  bool shutdown(std::chrono::milliseconds timeout);
  bool is_shut_down() const { return shut_down_.load(); }

  asio::io_context& io() { return io_; }

private:
  using tcp = asio::ip::tcp;

  void open_acceptor(const std::string& bind_addr);
  void start_accept(tcp::acceptor& acceptor);
  void collect_direct_addrs();

  EndpointOptions options_;
  std::string id_;
  asio::io_context io_;
  asio::executor_work_guard<asio::io_context::executor_type> work_;
  std::thread io_thread_;
  std::vector<std::unique_ptr<tcp::acceptor>> acceptors_;
  std::vector<TransportAddr> direct_addrs_;

  mutable std::mutex handlers_mutex_;
  std::map<std::string, std::shared_ptr<ProtocolHandler>> handlers_;

  std::mutex clients_mutex_;
  std::vector<std::weak_ptr<Connection>> clients_;

  std::mutex online_mutex_;
  std::condition_variable online_cv_;
  bool online_ = false;
  std::atomic<bool> shut_down_{false};
};

} // namespace sendmer
