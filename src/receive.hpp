#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "blob_store.hpp"
#include "collection.hpp"
#include "endpoint.hpp"
#include "event_bus.hpp"
#include "get.hpp"
#include "session.hpp"
#include "ticket.hpp"
#include "types.hpp"

namespace sendmer {

class Logger;

struct ReceiveOptions {
  // Unset: ~/Downloads when it exists, otherwise the current directory.
  std::optional<std::filesystem::path> output_dir;
  RelayModeOption relay;
  std::string default_relay_url;
  std::string magic_ipv4_addr;
  std::string magic_ipv6_addr;
  // Empty: SENDMER_SECRET or a fresh key.
  std::vector<unsigned char> secret;
  std::shared_ptr<CancellationToken> cancel;
  std::shared_ptr<Logger> logger;
};

struct ReceiveResult {
  std::string message;
  std::filesystem::path file_path;
  TransferStats stats;
};

struct RetryPolicy {
  int attempts = 3;
  std::chrono::milliseconds backoff_step{250};
};

using ConnectFn = std::function<std::shared_ptr<Connection>()>;
using FetchSizesFn = std::function<HashSeqAndSizes(Connection& conn)>;

// Asks for the hash sequence and sizes, reconnecting before each retry and
// sleeping backoff_step * attempt in between. A failed initial connect is not
// retried; a failed reconnect keeps the previous connection. After the last
// attempt the last NetworkError is rethrown.
HashSeqAndSizes get_sizes_with_retries(const ConnectFn& connect,
                                       const FetchSizesFn& fetch,
                                       const RetryPolicy& policy = RetryPolicy(),
                                       Logger* logger = nullptr);

// Turns raw get offsets into throttled Receiver progress events.
class DownloadProgressReporter {
public:
  static constexpr uint64_t kThreshold = 1ull << 20;

  DownloadProgressReporter(AppHandle app, uint64_t total);

  void on_offset(uint64_t offset);
  // Always emits processed == total.
  void finish();

private:
  double speed_for(uint64_t bytes) const;

  AppHandle app_;
  uint64_t total_;
  uint64_t last_reported_ = 0;
  std::chrono::steady_clock::time_point started_;
};

// Writes every entry below `output_dir` in collection order. Emits the file
// names first. Throws ExportConflictError on the first existing target and
// ExportError for any other fault.
void export_collection(Store& store,
                       const Collection& collection,
                       const std::filesystem::path& output_dir,
                       const AppHandle& app,
                       Logger* logger = nullptr);

std::filesystem::path default_output_dir();

// Runs one receive session. Cancelling the token in `options` aborts it with
// CancellationError; the working directory is always removed.
ReceiveResult receive(const std::string& ticket,
                      const ReceiveOptions& options,
                      const AppHandle& app);

} // namespace sendmer
