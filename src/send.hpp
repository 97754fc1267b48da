#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "blob_store.hpp"
#include "collection.hpp"
#include "endpoint.hpp"
#include "event_bus.hpp"
#include "provide_progress.hpp"
#include "session.hpp"
#include "types.hpp"

namespace sendmer {

class Logger;

struct SendOptions {
  RelayModeOption relay;
  std::string default_relay_url;
  AddrInfoOptions ticket_type = AddrInfoOptions::RelayAndAddresses;
  std::string magic_ipv4_addr;
  std::string magic_ipv6_addr;
  // Empty: SENDMER_SECRET or a fresh key.
  std::vector<unsigned char> secret;
  std::shared_ptr<CancellationToken> cancel;
  std::shared_ptr<Logger> logger;
};

// Keeps a share alive: the endpoint serving it, the store, the root tag and
// the working directory. stop() or destruction tears all of it down.
class ShareHandle {
public:
  static constexpr std::chrono::milliseconds kShutdownTimeout{2000};

  ShareHandle(std::shared_ptr<Endpoint> endpoint,
              std::shared_ptr<FsStore> store,
              std::shared_ptr<ProvideProgress> progress,
              TempTag tag,
              std::filesystem::path working_dir,
              std::shared_ptr<Logger> logger);
  ~ShareHandle();
  ShareHandle(const ShareHandle&) = delete;
  ShareHandle& operator=(const ShareHandle&) = delete;

  void stop();
  bool stopped() const;

  Endpoint& endpoint() { return *endpoint_; }
  Store& store() { return *store_; }
  const ProvideProgress& progress() const { return *progress_; }
  const std::filesystem::path& working_dir() const { return working_dir_; }

private:
  std::shared_ptr<Endpoint> endpoint_;
  std::shared_ptr<FsStore> store_;
  std::shared_ptr<ProvideProgress> progress_;
  TempTag tag_;
  std::filesystem::path working_dir_;
  std::shared_ptr<Logger> logger_;
  mutable std::mutex mutex_;
  bool stopped_ = false;
};

struct SendResult {
  std::string ticket;
  std::string hash;
  uint64_t size = 0;
  // "file" or "directory"
  std::string entry_type;
  Collection collection;
  std::chrono::steady_clock::duration import_time{};
  std::unique_ptr<ShareHandle> share;
};

// Imports `path` and starts serving it. Refuses to share the current
// directory itself. Cancelling the token in `options` before the share is
// ready throws CancellationError and removes the working directory.
SendResult start_share(const std::filesystem::path& path,
                       const SendOptions& options,
                       const AppHandle& app);

} // namespace sendmer
