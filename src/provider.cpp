#include "provider.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include <algorithm>
#include <istream>

namespace sendmer {

const char* to_string(ProviderEvent::Kind kind) {
    switch(kind) {
        case ProviderEvent::Kind::ClientConnected: return "client-connected";
        case ProviderEvent::Kind::RequestReceived: return "request-received";
        case ProviderEvent::Kind::TransferProgress: return "transfer-progress";
        case ProviderEvent::Kind::TransferCompleted: return "transfer-completed";
        case ProviderEvent::Kind::TransferAborted: return "transfer-aborted";
        case ProviderEvent::Kind::ConnectionClosed: return "connection-closed";
    }
    return "unknown";
}

// ---- connection -------------------------------------------------------------

std::shared_ptr<ProviderConnection> ProviderConnection::create(asio::ip::tcp::socket sock,
                                                               std::shared_ptr<BlobsProtocol> protocol,
                                                               uint64_t id)
{
    return std::shared_ptr<ProviderConnection>(new ProviderConnection(std::move(sock), std::move(protocol), id));
}

ProviderConnection::ProviderConnection(asio::ip::tcp::socket sock, std::shared_ptr<BlobsProtocol> protocol, uint64_t id)
: socket_(std::move(sock)), protocol_(std::move(protocol)), read_buf_(64 * 1024), id_(id)
{
    std::error_code ec;
    auto remote = socket_.remote_endpoint(ec);
    remote_ = ec ? std::string("?") : format_socket_addr(remote);
}

ProviderConnection::~ProviderConnection(){
    std::error_code ignored;
    socket_.close(ignored);
    if(!closed_) protocol_->on_closed(id_);
}

void ProviderConnection::start(){
    notify(ProviderEvent::Kind::ClientConnected);
    do_read();
}

void ProviderConnection::do_read(){
    auto self = shared_from_this();
    asio::async_read_until(socket_, read_buf_, "\n",
        [this, self](std::error_code ec, std::size_t){
            if(ec){
                if(ec != asio::error::eof && ec != asio::error::operation_aborted){
                    log_debug(protocol_->logger(), "Provider read error from {}: {}", remote_, ec.message());
                }
                close();
                return;
            }
            std::istream is(&read_buf_);
            std::string line;
            std::getline(is, line);
            if(line.empty()){
                do_read();
                return;
            }
            handle_line(std::move(line));
        });
}

void ProviderConnection::handle_line(std::string line){
    nlohmann::json request;
    try{
        request = nlohmann::json::parse(line);
    } catch(const std::exception& ex){
        log_warn(protocol_->logger(), "Failed to parse request: {}  raw: {}", ex.what(), line);
        reply_error(0, kErrBadRequest, "request is not valid JSON");
        return;
    }
    auto request_id = request_id_field(request);
    if(!request_id){
        log_warn(protocol_->logger(), "Malformed request from {}: {}", remote_, line);
        reply_error(0, kErrBadRequest, "request must be an object with an unsigned request_id");
        return;
    }
    auto type = message_type(request);
    if(type == "get_sizes"){
        handle_get_sizes(*request_id, request);
    } else if(type == "get"){
        handle_get(*request_id, request);
    } else if(type == "done"){
        close();
    } else {
        reply_error(*request_id, kErrBadRequest, "unknown request '" + type + "'");
    }
}

void ProviderConnection::handle_get_sizes(uint64_t request_id, const nlohmann::json& request){
    auto hash = hash_field(request, "hash");
    if(!hash){
        reply_error(request_id, kErrBadRequest, "missing or malformed hash");
        return;
    }
    std::vector<ContentHash> children;
    std::vector<uint64_t> sizes;
    try{
        auto& store = *protocol_->store();
        auto root_size = store.blob_size(*hash);
        if(!root_size){
            reply_error(request_id, kErrNotFound, "blob " + hash->short_hex() + " not found");
            return;
        }
        if(*root_size > kMaxHashSeqSize){
            reply_error(request_id, kErrBadRequest, "hash sequence exceeds the size limit");
            return;
        }
        children = hash_seq_from_bytes(store.read_bytes(*hash));
        sizes.reserve(children.size());
        for(const auto& child : children){
            auto size = store.blob_size(child);
            if(!size){
                reply_error(request_id, kErrNotFound, "child " + child.short_hex() + " not found");
                return;
            }
            sizes.push_back(*size);
        }
    } catch(const StoreError& e){
        reply_error(request_id, kErrInternal, e.what());
        return;
    }
    auto self = shared_from_this();
    send_line(make_sizes(request_id, children, sizes), [this, self]{ do_read(); });
}

void ProviderConnection::handle_get(uint64_t request_id, const nlohmann::json& request){
    auto hash = hash_field(request, "hash");
    if(!hash){
        reply_error(request_id, kErrBadRequest, "missing or malformed hash");
        return;
    }
    BlobSource source;
    try{
        source = protocol_->store()->open_blob(*hash);
    } catch(const StoreError& e){
        log_debug(protocol_->logger(), "get {} from {}: {}", hash->short_hex(), remote_, e.what());
        reply_error(request_id, kErrNotFound, e.what());
        return;
    }
    auto transfer = std::make_unique<ActiveTransfer>();
    transfer->request_id = request_id;
    transfer->hash = *hash;
    transfer->size = source.size;
    transfer->in.open(source.path, std::ios::binary);
    if(!transfer->in){
        reply_error(request_id, kErrInternal, "unable to open blob " + hash->short_hex());
        return;
    }
    transfer->buffer.resize(kIoChunkSize);
    transfer_ = std::move(transfer);
    notify(ProviderEvent::Kind::RequestReceived, request_id, *hash, source.size);

    auto self = shared_from_this();
    send_line(make_blob_header(request_id, *hash, source.size), [this, self]{ stream_next_chunk(); });
}

void ProviderConnection::stream_next_chunk(){
    if(!transfer_) return;
    auto& t = *transfer_;
    if(t.offset >= t.size){
        notify(ProviderEvent::Kind::TransferCompleted, t.request_id, t.hash, t.size, t.offset);
        transfer_.reset();
        do_read();
        return;
    }
    auto want = static_cast<std::size_t>(std::min<uint64_t>(t.buffer.size(), t.size - t.offset));
    t.in.read(t.buffer.data(), static_cast<std::streamsize>(want));
    if(static_cast<std::size_t>(t.in.gcount()) != want){
        // The header already promised `size` bytes; the only way out is to drop the stream.
        log_error(protocol_->logger(), "blob {} shrank while being sent to {}", t.hash.short_hex(), remote_);
        close();
        return;
    }
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(t.buffer.data(), want),
        [this, self, want](std::error_code ec, std::size_t){
            if(ec){
                log_debug(protocol_->logger(), "Provider write error to {}: {}", remote_, ec.message());
                close();
                return;
            }
            if(!transfer_) return;
            transfer_->offset += want;
            notify(ProviderEvent::Kind::TransferProgress, transfer_->request_id, transfer_->hash,
                   transfer_->size, transfer_->offset);
            stream_next_chunk();
        });
}

void ProviderConnection::send_line(const nlohmann::json& message, std::function<void()> then){
    write_line_ = message.dump() + "\n";
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(write_line_),
        [this, self, then = std::move(then)](std::error_code ec, std::size_t){
            if(ec){
                log_debug(protocol_->logger(), "Provider write error to {}: {}", remote_, ec.message());
                close();
                return;
            }
            if(then) then();
        });
}

void ProviderConnection::reply_error(uint64_t request_id, const std::string& kind, const std::string& message){
    auto self = shared_from_this();
    send_line(make_error(request_id, kind, message), [this, self]{ do_read(); });
}

void ProviderConnection::notify(ProviderEvent::Kind kind, uint64_t request_id,
                                const ContentHash& hash, uint64_t size, uint64_t offset){
    ProviderEvent event;
    event.kind = kind;
    event.connection_id = id_;
    event.request_id = request_id;
    event.hash = hash;
    event.size = size;
    event.offset = offset;
    event.remote = remote_;
    protocol_->notify(event);
}

void ProviderConnection::close(){
    if(closed_) return;
    closed_ = true;
    std::error_code ignored;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
    if(transfer_){
        notify(ProviderEvent::Kind::TransferAborted, transfer_->request_id, transfer_->hash,
               transfer_->size, transfer_->offset);
        transfer_.reset();
    }
    notify(ProviderEvent::Kind::ConnectionClosed);
    protocol_->on_closed(id_);
}

// ---- protocol ---------------------------------------------------------------

BlobsProtocol::BlobsProtocol(std::shared_ptr<Store> store,
                             ProviderEventSink events,
                             std::shared_ptr<Logger> logger)
: store_(std::move(store)), events_(std::move(events)), logger_(std::move(logger))
{
}

void BlobsProtocol::accept(asio::ip::tcp::socket socket){
    if(shut_down_.load()){
        std::error_code ignored;
        socket.close(ignored);
        return;
    }
    auto id = next_connection_id_.fetch_add(1);
    auto conn = ProviderConnection::create(std::move(socket), shared_from_this(), id);
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_[id] = conn;
    }
    conn->start();
}

void BlobsProtocol::shutdown(){
    shut_down_ = true;
    std::vector<std::shared_ptr<ProviderConnection>> live;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for(auto& entry : connections_){
            if(auto conn = entry.second.lock()) live.push_back(conn);
        }
    }
    for(auto& conn : live){
        asio::post(conn->executor(), [conn]{ conn->close(); });
    }
}

std::size_t BlobsProtocol::active_connections() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.size();
}

void BlobsProtocol::notify(const ProviderEvent& event){
    log_trace(logger_.get(), "provider event {} conn={} req={}",
              to_string(event.kind), event.connection_id, event.request_id);
    if(!events_) return;
    try{
        events_(event);
    } catch(const std::exception& e){
        log_warn(logger_.get(), "provider event handler failed: {}", e.what());
    }
}

void BlobsProtocol::on_closed(uint64_t connection_id){
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.erase(connection_id);
}

} // namespace sendmer
