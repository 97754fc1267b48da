#include "event_bus.hpp"

#include <exception>

#include "log.hpp"

namespace sendmer {

const char* to_string(Role role) {
  switch(role) {
    case Role::Sender: return "sender";
    case Role::Receiver: return "receiver";
  }
  return "sender";
}

namespace {

struct StateVisitor {
  const char* operator()(const TransferStarted&) const { return "started"; }
  const char* operator()(const TransferProgress&) const { return "progress"; }
  const char* operator()(const TransferCompleted&) const { return "completed"; }
  const char* operator()(const TransferFailed&) const { return "failed"; }
  const char* operator()(const TransferFileNames&) const { return "file-names"; }
};

} // namespace

const char* event_state(const TransferEvent& event) {
  return std::visit(StateVisitor{}, event);
}

Role event_role(const TransferEvent& event) {
  return std::visit([](const auto& e){ return e.role; }, event);
}

std::string event_name(const TransferEvent& event) {
  return std::string("transfer:") + to_string(event_role(event)) + ":" + event_state(event);
}

void emit_event(const AppHandle& app, const TransferEvent& event) {
  if(!app) return;
  try {
    app->emit(event);
  } catch(const std::exception& e) {
    log_warn(nullptr, "Failed to emit event {}: {}", event_name(event), e.what());
  } catch(...) {
    log_warn(nullptr, "Failed to emit event {}: unknown exception", event_name(event));
  }
}

} // namespace sendmer
