#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <variant>
#include <vector>

#include "blob_store.hpp"
#include "endpoint.hpp"
#include "errors.hpp"
#include "protocol.hpp"
#include "types.hpp"

namespace sendmer {

struct HashSeqAndSizes {
  // Children of the root, metadata blob first.
  std::vector<ContentHash> hash_seq;
  std::vector<uint64_t> sizes;
};

// Asks the provider for the children of a HashSeq root and their sizes. The
// returned sequence is checked against the root hash and the size cap.
HashSeqAndSizes get_hash_seq_and_sizes(Connection& conn,
                                       const ContentHash& root,
                                       uint64_t max_size = kMaxHashSeqSize);

struct GetProgress { uint64_t offset = 0; };
struct GetDone { TransferStats stats; };
struct GetFailed {
  NetworkErrorKind kind = NetworkErrorKind::Connection;
  std::string message;
};

using GetProgressItem = std::variant<GetProgress, GetDone, GetFailed>;
using GetProgressHandler = std::function<void(const GetProgressItem& item)>;

// Fetches what `local` reports as missing (the root first when absent) and
// commits each blob only after its hash checks out.
void execute_get(Store& store,
                 Connection& conn,
                 const LocalInfo& local,
                 const GetProgressHandler& on_item);

} // namespace sendmer
