#pragma once

#include "endpoint.hpp"
#include "errors.hpp"
#include "event_bus.hpp"
#include "log.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace sendmer::test {

// Throws with `message` so the runner reports which check failed.
inline void expect(bool condition, const std::string& message) {
  if(!condition) throw std::runtime_error(message);
}

inline void write_file(const std::filesystem::path& path, const std::string& content) {
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if(!out) throw std::runtime_error("unable to write " + path.string());
  out << content;
}

inline std::string read_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if(!in) throw std::runtime_error("unable to read " + path.string());
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Deterministic filler so a corrupted byte shows up in comparisons.
inline std::string patterned_bytes(std::size_t size, unsigned seed = 0) {
  std::string out(size, '\0');
  for(std::size_t i = 0; i < size; ++i) {
    out[i] = static_cast<char>((i * 31 + seed * 7) & 0xff);
  }
  return out;
}

// Unique directory below the system temp dir, removed on destruction.
class TempDir {
public:
  explicit TempDir(const std::string& label = "test") {
    path_ = std::filesystem::temp_directory_path() /
            ("sendmer-" + label + "-" + hex_from_bytes(random_bytes(6)));
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

// Switches the working directory for the lifetime of the guard.
class ScopedCurrentPath {
public:
  explicit ScopedCurrentPath(const std::filesystem::path& dir)
    : previous_(std::filesystem::current_path()) {
    std::filesystem::current_path(dir);
  }

  ~ScopedCurrentPath() {
    std::error_code ec;
    std::filesystem::current_path(previous_, ec);
  }

  ScopedCurrentPath(const ScopedCurrentPath&) = delete;
  ScopedCurrentPath& operator=(const ScopedCurrentPath&) = delete;

private:
  std::filesystem::path previous_;
};

class LogCapture {
public:
  LogCapture() = default;

  ~LogCapture() {
    detach_all();
  }

  void attach(const std::shared_ptr<Logger>& logger,
              const std::string& label = std::string()) {
    if(!logger) return;
    auto handle = logger->add_listener(
      [this, label](void*,
                    const std::string& channel,
                    spdlog::level::level_enum,
                    const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if(!label.empty()) {
          lines_.emplace_back(label + ": " + message);
        } else {
          lines_.emplace_back(channel + ": " + message);
        }
        cv_.notify_all();
        return false;
      },
      nullptr);
    std::lock_guard<std::mutex> lock(attachments_mutex_);
    attachments_.push_back({logger, handle});
  }

  void detach_all() {
    std::vector<Attachment> pending;
    {
      std::lock_guard<std::mutex> lock(attachments_mutex_);
      pending.swap(attachments_);
    }
    for(auto& attachment : pending) {
      if(attachment.logger && attachment.handle != 0) {
        attachment.logger->remove_listener(attachment.handle);
      }
    }
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
  }

  bool contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(lines_.begin(), lines_.end(),
      [&](const std::string& line){ return line.find(needle) != std::string::npos; });
  }

  bool wait_for_substring(const std::string& needle,
                          std::chrono::milliseconds timeout) {
    auto predicate = [&]{
      return std::any_of(lines_.begin(), lines_.end(),
        [&](const std::string& line){ return line.find(needle) != std::string::npos; });
    };
    std::unique_lock<std::mutex> lock(mutex_);
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while(!predicate()) {
      if(cv_.wait_until(lock, deadline) == std::cv_status::timeout) break;
    }
    return predicate();
  }

private:
  struct Attachment {
    std::shared_ptr<Logger> logger;
    LogListenerHandle handle = 0;
  };

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::string> lines_;
  std::mutex attachments_mutex_;
  std::vector<Attachment> attachments_;
};

inline bool wait_for_condition(std::function<bool()> predicate,
                               std::chrono::milliseconds timeout,
                               std::chrono::milliseconds interval = std::chrono::milliseconds(50)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while(std::chrono::steady_clock::now() < deadline) {
    if(predicate()) return true;
    std::this_thread::sleep_for(interval);
  }
  return predicate();
}

// Keeps every event it sees, in order.
class RecordingEmitter : public EventEmitter {
public:
  void emit(const TransferEvent& event) override {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
  }

  std::vector<TransferEvent> events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
  }

  std::vector<std::string> names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    for(const auto& event : events_) out.push_back(event_name(event));
    return out;
  }

  std::size_t count(const std::string& name) const {
    auto all = names();
    return static_cast<std::size_t>(std::count(all.begin(), all.end(), name));
  }

  std::vector<TransferProgress> progress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TransferProgress> out;
    for(const auto& event : events_) {
      if(const auto* p = std::get_if<TransferProgress>(&event)) out.push_back(*p);
    }
    return out;
  }

private:
  mutable std::mutex mutex_;
  std::vector<TransferEvent> events_;
};

// Fails every delivery. Used to show that emit failures never reach the caller.
class ThrowingEmitter : public EventEmitter {
public:
  void emit(const TransferEvent& event) override {
    ++attempts;
    throw std::runtime_error("observer rejected " + event_name(event));
  }

  std::size_t attempts = 0;
};

// Scripted connection: each read_json pops the next reply, or throws the
// scripted NetworkError kind.
class FakeConnection : public Connection {
public:
  struct Step {
    bool fail = false;
    NetworkErrorKind kind = NetworkErrorKind::Connection;
    nlohmann::json reply;
  };

  explicit FakeConnection(std::string remote = "fake:0") : remote_(std::move(remote)) {}

  void push_reply(nlohmann::json reply) { steps_.push_back({false, NetworkErrorKind::Connection, std::move(reply)}); }
  void push_failure(NetworkErrorKind kind) { steps_.push_back({true, kind, nullptr}); }

  void send_json(const nlohmann::json& message) override { sent.push_back(message); }

  nlohmann::json read_json(NetworkErrorKind on_failure) override {
    if(steps_.empty()) throw NetworkError(on_failure, "no scripted reply");
    auto step = std::move(steps_.front());
    steps_.pop_front();
    if(step.fail) throw NetworkError(step.kind, "scripted failure");
    return step.reply;
  }

  void read_exact(char*, std::size_t, NetworkErrorKind on_failure) override {
    throw NetworkError(on_failure, "no payload scripted");
  }

  void cancel() override { cancelled = true; }
  void close() override { closed = true; }
  const std::string& remote() const override { return remote_; }

  std::vector<nlohmann::json> sent;
  bool cancelled = false;
  bool closed = false;

private:
  std::string remote_;
  std::deque<Step> steps_;
};

} // namespace sendmer::test
