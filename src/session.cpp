#include "session.hpp"

#include <exception>
#include <thread>

#include "errors.hpp"
#include "log.hpp"

namespace fs = std::filesystem;

namespace sendmer {

void CancellationToken::cancel() {
  std::map<CallbackId, Callback> callbacks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(cancelled_) return;
    cancelled_ = true;
    callbacks.swap(callbacks_);
  }
  cv_.notify_all();
  for(auto& entry : callbacks) {
    if(entry.second) entry.second();
  }
}

bool CancellationToken::cancelled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cancelled_;
}

bool CancellationToken::wait_for(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this]{ return cancelled_; });
}

CancellationToken::CallbackId CancellationToken::on_cancel(Callback callback) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(!cancelled_) {
      auto id = next_id_++;
      callbacks_.emplace(id, std::move(callback));
      return id;
    }
  }
  if(callback) callback();
  return 0;
}

void CancellationToken::remove_callback(CallbackId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.erase(id);
}

SessionController::SessionController(fs::path working_dir,
                                     std::shared_ptr<CancellationToken> cancel,
                                     std::shared_ptr<Logger> logger)
: working_dir_(std::move(working_dir)),
  cancel_(cancel ? std::move(cancel) : std::make_shared<CancellationToken>()),
  logger_(std::move(logger))
{
}

void SessionController::add_shutdown_hook(std::function<void()> hook) {
  std::lock_guard<std::mutex> lock(hooks_mutex_);
  hooks_.push_back(std::move(hook));
}

void SessionController::run_shutdown_hooks() {
  std::vector<std::function<void()>> hooks;
  {
    std::lock_guard<std::mutex> lock(hooks_mutex_);
    hooks = hooks_;
  }
  for(auto& hook : hooks) {
    try {
      hook();
    } catch(const std::exception& e) {
      log_warn(logger_.get(), "shutdown step failed: {}", e.what());
    }
  }
}

void SessionController::remove_working_dir(const fs::path& dir, Logger* logger) {
  if(dir.empty()) return;
  std::error_code ec;
  fs::remove_all(dir, ec);
  if(ec) {
    log_warn(logger, "unable to remove {}: {}", dir.string(), ec.message());
  } else {
    log_debug(logger, "removed {}", dir.string());
  }
}

void SessionController::run(const std::function<void()>& body) {
  struct RunState {
    std::mutex mutex;
    std::condition_variable cv;
    bool finished = false;
    std::exception_ptr error;
  };
  auto state = std::make_shared<RunState>();
  auto wake_id = cancel_->on_cancel([state]{
    std::lock_guard<std::mutex> lock(state->mutex);
    state->cv.notify_all();
  });

  std::thread worker([state, &body]{
    std::exception_ptr error;
    try {
      body();
    } catch(...) {
      error = std::current_exception();
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    state->error = error;
    state->finished = true;
    state->cv.notify_all();
  });

  {
    std::unique_lock<std::mutex> lock(state->mutex);
    state->cv.wait(lock, [&]{ return state->finished || cancel_->cancelled(); });
  }
  cancel_->remove_callback(wake_id);

  if(cancel_->cancelled()) {
    log_debug(logger_.get(), "session cancelled, shutting down");
    run_shutdown_hooks();
    worker.join();
    remove_working_dir(working_dir_, logger_.get());
    throw CancellationError();
  }

  worker.join();
  if(state->error) {
    run_shutdown_hooks();
    remove_working_dir(working_dir_, logger_.get());
    std::rethrow_exception(state->error);
  }
  if(!keep_working_dir_) {
    remove_working_dir(working_dir_, logger_.get());
  }
}

} // namespace sendmer
