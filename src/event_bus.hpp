#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace sendmer {

enum class Role {
  Sender,
  Receiver
};

const char* to_string(Role role);

struct TransferStarted {
  Role role = Role::Sender;
};

struct TransferProgress {
  Role role = Role::Sender;
  uint64_t processed = 0;
  uint64_t total = 0;
  // bytes per second
  double speed = 0.0;
};

struct TransferCompleted {
  Role role = Role::Sender;
};

struct TransferFailed {
  Role role = Role::Sender;
  std::string message;
};

struct TransferFileNames {
  Role role = Role::Receiver;
  std::vector<std::string> file_names;
};

// Notification only. Events never carry control flow or error state back to the caller.
using TransferEvent = std::variant<TransferStarted,
                                   TransferProgress,
                                   TransferCompleted,
                                   TransferFailed,
                                   TransferFileNames>;

// "started", "progress", "completed", "failed" or "file-names"
const char* event_state(const TransferEvent& event);
Role event_role(const TransferEvent& event);
// "transfer:<role>:<state>", e.g. "transfer:receiver:progress"
std::string event_name(const TransferEvent& event);

class EventEmitter {
public:
  virtual ~EventEmitter() = default;
  virtual void emit(const TransferEvent& event) = 0;
};

// Null means no observer.
using AppHandle = std::shared_ptr<EventEmitter>;

// Delivers the event if a sink is present. A throwing sink is logged and ignored.
void emit_event(const AppHandle& app, const TransferEvent& event);

} // namespace sendmer
