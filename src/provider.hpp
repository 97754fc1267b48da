#pragma once
#include <asio.hpp>
#include <atomic>
#include <cstdint>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "blob_store.hpp"
#include "endpoint.hpp"

namespace sendmer {

class Logger;

struct ProviderEvent {
    enum class Kind {
        ClientConnected,
        RequestReceived,
        TransferProgress,
        TransferCompleted,
        TransferAborted,
        ConnectionClosed
    };
    Kind kind = Kind::ClientConnected;
    uint64_t connection_id = 0;
    uint64_t request_id = 0;
    ContentHash hash;
    uint64_t size = 0;
    uint64_t offset = 0;
    std::string remote;
};

const char* to_string(ProviderEvent::Kind kind);

using ProviderEventSink = std::function<void(const ProviderEvent&)>;

class BlobsProtocol;

// One accepted client. Requests are served strictly in order; the read loop
// pauses while a blob is being streamed.
class ProviderConnection : public std::enable_shared_from_this<ProviderConnection> {
public:
    static std::shared_ptr<ProviderConnection> create(asio::ip::tcp::socket sock,
                                                      std::shared_ptr<BlobsProtocol> protocol,
                                                      uint64_t id);
    ~ProviderConnection();

    void start();
    void close();
    uint64_t id() const { return id_; }
    asio::ip::tcp::socket::executor_type executor() { return socket_.get_executor(); }

private:
    ProviderConnection(asio::ip::tcp::socket sock, std::shared_ptr<BlobsProtocol> protocol, uint64_t id);
    void do_read();
    void handle_line(std::string line);
    void handle_get_sizes(uint64_t request_id, const nlohmann::json& request);
    void handle_get(uint64_t request_id, const nlohmann::json& request);
    void stream_next_chunk();
    void send_line(const nlohmann::json& message, std::function<void()> then);
    void reply_error(uint64_t request_id, const std::string& kind, const std::string& message);
    void notify(ProviderEvent::Kind kind, uint64_t request_id = 0,
                const ContentHash& hash = ContentHash(), uint64_t size = 0, uint64_t offset = 0);

    struct ActiveTransfer {
        uint64_t request_id = 0;
        ContentHash hash;
        uint64_t size = 0;
        uint64_t offset = 0;
        std::ifstream in;
        std::vector<char> buffer;
    };

    asio::ip::tcp::socket socket_;
    std::shared_ptr<BlobsProtocol> protocol_;
    asio::streambuf read_buf_;
    std::string remote_;
    std::string write_line_;
    std::unique_ptr<ActiveTransfer> transfer_;
    uint64_t id_;
    bool closed_ = false;
};

// Serves blobs from a store to connections routed by the endpoint.
class BlobsProtocol : public ProtocolHandler, public std::enable_shared_from_this<BlobsProtocol> {
public:
    BlobsProtocol(std::shared_ptr<Store> store,
                  ProviderEventSink events,
                  std::shared_ptr<Logger> logger);

    void accept(asio::ip::tcp::socket socket) override;
    void shutdown() override;
    std::size_t active_connections() const override;

    const std::shared_ptr<Store>& store() const { return store_; }
    Logger* logger() const { return logger_.get(); }

    void notify(const ProviderEvent& event);
    void on_closed(uint64_t connection_id);

private:
    std::shared_ptr<Store> store_;
    ProviderEventSink events_;
    std::shared_ptr<Logger> logger_;
    mutable std::mutex connections_mutex_;
    std::map<uint64_t, std::weak_ptr<ProviderConnection>> connections_;
    std::atomic<uint64_t> next_connection_id_{1};
    std::atomic<bool> shut_down_{false};
};

} // namespace sendmer
