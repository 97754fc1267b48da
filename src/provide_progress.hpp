#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "event_bus.hpp"
#include "provider.hpp"

namespace sendmer {

class Logger;

// Folds provider events into Sender transfer events. Each client connection is
// one reporting window: Started on its first request, Completed when it closes
// cleanly, Failed when a request was aborted.
class ProvideProgress {
public:
  explicit ProvideProgress(AppHandle app, std::shared_ptr<Logger> logger = nullptr);

  void on_event(const ProviderEvent& event);

  ProviderEventSink sink();
  std::size_t tracked_connections() const;

private:
  struct RequestState {
    ContentHash hash;
    uint64_t size = 0;
    uint64_t offset = 0;
  };

  struct ConnectionState {
    std::string remote;
    std::map<uint64_t, RequestState> requests;
    uint64_t finished_bytes = 0;
    bool started = false;
    bool aborted = false;
    std::chrono::steady_clock::time_point started_at;
  };

  void apply(const ProviderEvent& event, std::vector<TransferEvent>& out);
  TransferProgress progress_of(const ConnectionState& state) const;

  AppHandle app_;
  std::shared_ptr<Logger> logger_;
  mutable std::mutex mutex_;
  std::unordered_map<uint64_t, ConnectionState> connections_;
};

} // namespace sendmer
