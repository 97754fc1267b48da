#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <string>

#include "event_bus.hpp"

namespace sendmer {

// Draws one text meter per reporting window on a terminal stream.
class CliEventEmitter : public EventEmitter {
public:
  explicit CliEventEmitter(std::string prefix, std::ostream& out, std::size_t width = 40);

  void emit(const TransferEvent& event) override;

  static std::string format_meter(uint64_t processed, uint64_t total, std::size_t width);

private:
  void draw_locked(const std::string& line);
  void clear_locked();

  std::string prefix_;
  std::ostream& out_;
  std::size_t width_;
  std::mutex mutex_;
  bool active_ = false;
  std::size_t line_width_ = 0;
};

} // namespace sendmer
