#include "protocol.hpp"

namespace sendmer {

json make_hello(const std::string& alpn, const std::string& endpoint_id) {
    json j;
    j["type"] = "hello";
    j["alpn"] = alpn;
    j["endpoint_id"] = endpoint_id;
    return j;
}

json make_hello_ack(const std::string& endpoint_id) {
    json j;
    j["type"] = "hello_ack";
    j["endpoint_id"] = endpoint_id;
    return j;
}

json make_get_sizes(uint64_t request_id, const ContentHash& hash) {
    json j;
    j["type"] = "get_sizes";
    j["request_id"] = request_id;
    j["hash"] = hash.to_hex();
    return j;
}

json make_sizes(uint64_t request_id,
                const std::vector<ContentHash>& hash_seq,
                const std::vector<uint64_t>& sizes) {
    json hashes = json::array();
    for(const auto& h : hash_seq) hashes.push_back(h.to_hex());
    json j;
    j["type"] = "sizes";
    j["request_id"] = request_id;
    j["hash_seq"] = std::move(hashes);
    j["sizes"] = sizes;
    return j;
}

json make_get(uint64_t request_id, const ContentHash& hash) {
    json j;
    j["type"] = "get";
    j["request_id"] = request_id;
    j["hash"] = hash.to_hex();
    return j;
}

json make_blob_header(uint64_t request_id, const ContentHash& hash, uint64_t size) {
    json j;
    j["type"] = "blob";
    j["request_id"] = request_id;
    j["hash"] = hash.to_hex();
    j["size"] = size;
    return j;
}

json make_error(uint64_t request_id, const std::string& kind, const std::string& message) {
    json j;
    j["type"] = "error";
    j["request_id"] = request_id;
    j["kind"] = kind;
    j["message"] = message;
    return j;
}

json make_done() {
    json j;
    j["type"] = "done";
    return j;
}

std::string message_type(const json& message) {
    if(!message.is_object()) return {};
    auto it = message.find("type");
    if(it == message.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

std::optional<ContentHash> hash_field(const json& message, const char* key) {
    auto it = message.find(key);
    if(it == message.end() || !it->is_string()) return std::nullopt;
    return ContentHash::from_hex(it->get<std::string>());
}

std::optional<std::string> string_field(const json& message, const char* key) {
    if(!message.is_object()) return std::nullopt;
    auto it = message.find(key);
    if(it == message.end()) return std::string();
    if(!it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

std::optional<uint64_t> request_id_field(const json& message) {
    if(!message.is_object()) return std::nullopt;
    auto it = message.find("request_id");
    if(it == message.end()) return uint64_t{0};
    if(!it->is_number_unsigned()) return std::nullopt;
    return it->get<uint64_t>();
}

NetworkError error_from_reply(const json& reply, NetworkErrorKind phase) {
    if(!reply.is_object()) {
        return NetworkError(NetworkErrorKind::Decode, "error reply is not an object");
    }
    auto kind_it = reply.find("kind");
    auto message_it = reply.find("message");
    if((kind_it != reply.end() && !kind_it->is_string()) ||
       (message_it != reply.end() && !message_it->is_string())) {
        return NetworkError(NetworkErrorKind::Decode, "malformed error reply: " + reply.dump());
    }
    std::string kind = kind_it == reply.end() ? std::string() : kind_it->get<std::string>();
    std::string message = message_it == reply.end() ? std::string("remote reported an error")
                                                    : message_it->get<std::string>();
    if(kind == kErrBadRequest) {
        return NetworkError(NetworkErrorKind::BadRequest, message);
    }
    return NetworkError(phase, kind.empty() ? message : kind + ": " + message);
}

} // namespace sendmer
