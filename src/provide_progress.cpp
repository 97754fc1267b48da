#include "provide_progress.hpp"

#include <exception>

#include "log.hpp"

namespace sendmer {

ProvideProgress::ProvideProgress(AppHandle app, std::shared_ptr<Logger> logger)
  : app_(std::move(app)), logger_(std::move(logger)) {}

ProviderEventSink ProvideProgress::sink() {
  return [this](const ProviderEvent& event){ on_event(event); };
}

std::size_t ProvideProgress::tracked_connections() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.size();
}

void ProvideProgress::on_event(const ProviderEvent& event) {
  std::vector<TransferEvent> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
      apply(event, pending);
    } catch(const std::exception& e) {
      log_warn(logger_.get(), "skipping progress update for {} on connection {}: {}",
               to_string(event.kind), event.connection_id, e.what());
      pending.clear();
    }
  }
  for(const auto& ev : pending) {
    emit_event(app_, ev);
  }
}

TransferProgress ProvideProgress::progress_of(const ConnectionState& state) const {
  TransferProgress progress;
  progress.role = Role::Sender;
  progress.processed = state.finished_bytes;
  progress.total = state.finished_bytes;
  for(const auto& entry : state.requests) {
    progress.processed += entry.second.offset;
    progress.total += entry.second.size;
  }
  auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - state.started_at).count();
  progress.speed = elapsed > 0.0 ? static_cast<double>(progress.processed) / elapsed : 0.0;
  return progress;
}

void ProvideProgress::apply(const ProviderEvent& event, std::vector<TransferEvent>& out) {
  switch(event.kind) {
    case ProviderEvent::Kind::ClientConnected: {
      auto& state = connections_[event.connection_id];
      state.remote = event.remote;
      log_info(logger_.get(), "client connected from {}", event.remote);
      break;
    }
    case ProviderEvent::Kind::RequestReceived: {
      auto& state = connections_.at(event.connection_id);
      state.requests[event.request_id] = RequestState{event.hash, event.size, 0};
      if(!state.started) {
        state.started = true;
        state.started_at = std::chrono::steady_clock::now();
        out.push_back(TransferStarted{Role::Sender});
      }
      log_debug(logger_.get(), "request {} for {} ({} bytes) from {}",
                event.request_id, event.hash.short_hex(), event.size, state.remote);
      break;
    }
    case ProviderEvent::Kind::TransferProgress: {
      auto& state = connections_.at(event.connection_id);
      state.requests.at(event.request_id).offset = event.offset;
      out.push_back(progress_of(state));
      break;
    }
    case ProviderEvent::Kind::TransferCompleted: {
      auto& state = connections_.at(event.connection_id);
      auto it = state.requests.find(event.request_id);
      if(it != state.requests.end()) {
        state.finished_bytes += it->second.size;
        state.requests.erase(it);
      }
      out.push_back(progress_of(state));
      break;
    }
    case ProviderEvent::Kind::TransferAborted: {
      auto& state = connections_.at(event.connection_id);
      state.aborted = true;
      state.requests.erase(event.request_id);
      log_warn(logger_.get(), "transfer of {} to {} aborted at {}/{} bytes",
               event.hash.short_hex(), state.remote, event.offset, event.size);
      break;
    }
    case ProviderEvent::Kind::ConnectionClosed: {
      auto it = connections_.find(event.connection_id);
      if(it == connections_.end()) break;
      if(it->second.started) {
        if(it->second.aborted) {
          out.push_back(TransferFailed{Role::Sender, "transfer to " + it->second.remote + " was aborted"});
        } else {
          out.push_back(TransferCompleted{Role::Sender});
        }
      }
      log_info(logger_.get(), "client {} disconnected", it->second.remote);
      connections_.erase(it);
      break;
    }
  }
}

} // namespace sendmer
