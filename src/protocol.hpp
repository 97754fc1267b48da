#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "errors.hpp"
#include "types.hpp"

namespace sendmer {

using json = nlohmann::json;

// protocol.hpp
// One JSON object per line; a "blob" header line is followed by exactly `size` raw bytes.
inline constexpr const char* kBlobsAlpn = "/sendmer/blobs/1";
inline constexpr uint64_t kMaxHashSeqSize = 32ull * 1024 * 1024;

// Wire values of the "kind" field in error replies.
inline constexpr const char* kErrNotFound = "not_found";
inline constexpr const char* kErrBadRequest = "bad_request";
inline constexpr const char* kErrUnsupportedAlpn = "unsupported_alpn";
inline constexpr const char* kErrWrongEndpoint = "wrong_endpoint";
inline constexpr const char* kErrInternal = "internal";

json make_hello(const std::string& alpn, const std::string& endpoint_id);
json make_hello_ack(const std::string& endpoint_id);
json make_get_sizes(uint64_t request_id, const ContentHash& hash);
json make_sizes(uint64_t request_id,
                const std::vector<ContentHash>& hash_seq,
                const std::vector<uint64_t>& sizes);
json make_get(uint64_t request_id, const ContentHash& hash);
json make_blob_header(uint64_t request_id, const ContentHash& hash, uint64_t size);
json make_error(uint64_t request_id, const std::string& kind, const std::string& message);
json make_done();

std::string message_type(const json& message);

// Reads a hex hash field; nullopt when absent or malformed.
std::optional<ContentHash> hash_field(const json& message, const char* key);

// Reads a string field; "" when absent, nullopt when present with another type.
std::optional<std::string> string_field(const json& message, const char* key);

// Reads "request_id"; 0 when absent, nullopt when it is not an unsigned integer.
std::optional<uint64_t> request_id_field(const json& message);

// Turns an "error" reply into the exception the requester should see.
NetworkError error_from_reply(const json& reply, NetworkErrorKind phase);

} // namespace sendmer
