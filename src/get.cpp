#include "get.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>

#include "utils.hpp"

namespace sendmer {

namespace {

uint64_t next_request_id() {
  static std::atomic<uint64_t> next{1};
  return next.fetch_add(1);
}

void fetch_blob(Store& store,
                Connection& conn,
                const ContentHash& hash,
                uint64_t& offset,
                const GetProgressHandler& on_item) {
  auto request_id = next_request_id();
  conn.send_json(make_get(request_id, hash));

  auto header = conn.read_json(NetworkErrorKind::Header);
  auto type = message_type(header);
  if(type == "error") {
    throw error_from_reply(header, NetworkErrorKind::Header);
  }
  if(type != "blob") {
    throw NetworkError(NetworkErrorKind::Decode, "expected a blob header, got '" + type + "'");
  }
  auto announced = hash_field(header, "hash");
  if(!announced || *announced != hash) {
    throw NetworkError(NetworkErrorKind::Decode, "blob header names a different hash");
  }
  auto size_it = header.find("size");
  if(size_it == header.end() || !size_it->is_number_unsigned()) {
    throw NetworkError(NetworkErrorKind::Decode, "blob header has no size");
  }
  uint64_t size = size_it->get<uint64_t>();

  auto writer = store.begin_blob(hash);
  std::vector<char> buffer(kIoChunkSize);
  uint64_t remaining = size;
  while(remaining > 0) {
    auto want = static_cast<std::size_t>(std::min<uint64_t>(buffer.size(), remaining));
    conn.read_exact(buffer.data(), want, NetworkErrorKind::Connection);
    writer->write(buffer.data(), want);
    remaining -= want;
    offset += want;
    on_item(GetProgress{offset});
  }
  if(!writer->commit()) {
    throw NetworkError(NetworkErrorKind::Decode,
                       "content received for " + hash.short_hex() + " does not match its hash");
  }
}

} // namespace

HashSeqAndSizes get_hash_seq_and_sizes(Connection& conn,
                                       const ContentHash& root,
                                       uint64_t max_size) {
  auto request_id = next_request_id();
  conn.send_json(make_get_sizes(request_id, root));
  auto reply = conn.read_json(NetworkErrorKind::Header);
  auto type = message_type(reply);
  if(type == "error") {
    throw error_from_reply(reply, NetworkErrorKind::Header);
  }
  if(type != "sizes") {
    throw NetworkError(NetworkErrorKind::Decode, "expected sizes, got '" + type + "'");
  }

  HashSeqAndSizes out;
  try {
    auto hashes = reply.at("hash_seq");
    if(hashes.size() * ContentHash::kSize > max_size) {
      throw NetworkError(NetworkErrorKind::BadRequest,
                         "hash sequence of " + std::to_string(hashes.size()) + " entries exceeds the size cap");
    }
    for(const auto& entry : hashes) {
      auto hash = ContentHash::from_hex(entry.get<std::string>());
      if(!hash) throw NetworkError(NetworkErrorKind::Decode, "malformed hash in sequence");
      out.hash_seq.push_back(*hash);
    }
    out.sizes = reply.at("sizes").get<std::vector<uint64_t>>();
  } catch(const nlohmann::json::exception& e) {
    throw NetworkError(NetworkErrorKind::Decode, std::string("malformed sizes reply: ") + e.what());
  }
  if(out.sizes.size() != out.hash_seq.size()) {
    throw NetworkError(NetworkErrorKind::Decode, "sizes reply lists " + std::to_string(out.sizes.size()) +
                       " sizes for " + std::to_string(out.hash_seq.size()) + " hashes");
  }
  auto bytes = hash_seq_to_bytes(out.hash_seq);
  if(ContentHash::of(bytes.data(), bytes.size()) != root) {
    throw NetworkError(NetworkErrorKind::Decode, "hash sequence does not match root " + root.short_hex());
  }
  return out;
}

void execute_get(Store& store,
                 Connection& conn,
                 const LocalInfo& local,
                 const GetProgressHandler& on_item) {
  auto started = std::chrono::steady_clock::now();
  uint64_t offset = 0;
  try {
    std::vector<ContentHash> wanted = local.missing;
    if(!local.root_present) {
      fetch_blob(store, conn, local.root.hash, offset, on_item);
      if(local.root.format == BlobFormat::HashSeq) {
        wanted.clear();
        for(const auto& child : hash_seq_from_bytes(store.read_bytes(local.root.hash))) {
          if(!store.has(child)) wanted.push_back(child);
        }
      }
    }
    for(const auto& hash : wanted) {
      fetch_blob(store, conn, hash, offset, on_item);
    }
    conn.send_json(make_done());
  } catch(const NetworkError& e) {
    on_item(GetFailed{e.kind(), e.what()});
    return;
  } catch(const StoreError& e) {
    on_item(GetFailed{NetworkErrorKind::LocalFailure, e.what()});
    return;
  } catch(const std::filesystem::filesystem_error& e) {
    on_item(GetFailed{NetworkErrorKind::LocalFailure, e.what()});
    return;
  }
  TransferStats stats;
  stats.bytes_read = offset;
  stats.bytes_written = offset;
  stats.elapsed = std::chrono::steady_clock::now() - started;
  on_item(GetDone{stats});
}

} // namespace sendmer
