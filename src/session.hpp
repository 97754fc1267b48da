#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace sendmer {

class Logger;

// Shared cancellation signal. Cancelling is sticky and thread-safe.
class CancellationToken {
public:
  using Callback = std::function<void()>;
  using CallbackId = std::size_t;

  void cancel();
  bool cancelled() const;
  // True when cancelled before the timeout ran out.
  bool wait_for(std::chrono::milliseconds timeout) const;

  // Runs `callback` on cancel, or right away when already cancelled.
  CallbackId on_cancel(Callback callback);
  void remove_callback(CallbackId id);

private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  bool cancelled_ = false;
  std::map<CallbackId, Callback> callbacks_;
  CallbackId next_id_ = 1;
};

// Runs one send or receive body against a cancellation token. Whichever
// finishes first wins; cancellation always beats a body that completes later.
// The working directory is removed on failure and cancellation, and on
// success too unless the caller keeps it for a long-lived share.
class SessionController {
public:
  SessionController(std::filesystem::path working_dir,
                    std::shared_ptr<CancellationToken> cancel,
                    std::shared_ptr<Logger> logger = nullptr);

  // Hooks run in registration order when the session is cancelled. They must
  // make the body return promptly (close the store, cancel the connection).
  void add_shutdown_hook(std::function<void()> hook);

  void set_keep_working_dir(bool keep) { keep_working_dir_ = keep; }

  // Throws CancellationError on cancel, else rethrows whatever the body threw.
  void run(const std::function<void()>& body);

  const std::filesystem::path& working_dir() const { return working_dir_; }

  static void remove_working_dir(const std::filesystem::path& dir, Logger* logger);

private:
  void run_shutdown_hooks();

  std::filesystem::path working_dir_;
  std::shared_ptr<CancellationToken> cancel_;
  std::shared_ptr<Logger> logger_;
  std::mutex hooks_mutex_;
  std::vector<std::function<void()>> hooks_;
  bool keep_working_dir_ = false;
};

} // namespace sendmer
