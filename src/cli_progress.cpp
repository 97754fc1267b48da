#include "cli_progress.hpp"

#include <algorithm>
#include <ostream>
#include <variant>

#include <spdlog/fmt/fmt.h>

#include "utils.hpp"

namespace sendmer {

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

CliEventEmitter::CliEventEmitter(std::string prefix, std::ostream& out, std::size_t width)
: prefix_(std::move(prefix)), out_(out), width_(std::max<std::size_t>(1, width))
{
}

std::string CliEventEmitter::format_meter(uint64_t processed, uint64_t total, std::size_t width) {
  const std::size_t slots = std::max<std::size_t>(1, width);
  std::size_t filled = 0;
  if(total > 0) {
    auto clamped = std::min(processed, total);
    filled = static_cast<std::size_t>((static_cast<double>(clamped) / static_cast<double>(total)) * slots);
  }
  std::string bar(filled, '#');
  bar.append(slots - filled, '.');
  return "[" + bar + "]";
}

void CliEventEmitter::draw_locked(const std::string& line) {
  std::string rendered = "\r" + line;
  out_ << rendered;
  if(rendered.size() < line_width_) {
    out_ << std::string(line_width_ - rendered.size(), ' ');
  } else {
    line_width_ = rendered.size();
  }
  out_.flush();
}

void CliEventEmitter::clear_locked() {
  if(line_width_ > 0) {
    out_ << "\r" << std::string(line_width_, ' ') << "\r";
    out_.flush();
  }
  line_width_ = 0;
}

void CliEventEmitter::emit(const TransferEvent& event) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::visit(overloaded{
    [&](const TransferStarted&){
      active_ = true;
      draw_locked(fmt::format("[{}] {}", prefix_, format_meter(0, 0, width_)));
    },
    [&](const TransferProgress& p){
      active_ = true;
      double percent = p.total > 0
        ? 100.0 * static_cast<double>(std::min(p.processed, p.total)) / static_cast<double>(p.total)
        : 0.0;
      draw_locked(fmt::format("[{}] {} {:.1f}% {}/{} {}/s",
                              prefix_,
                              format_meter(p.processed, p.total, width_),
                              percent,
                              human_bytes(p.processed),
                              human_bytes(p.total),
                              human_bytes(static_cast<uint64_t>(std::max(0.0, p.speed)))));
    },
    [&](const TransferCompleted&){
      if(!active_) return;
      active_ = false;
      clear_locked();
    },
    [&](const TransferFailed& f){
      if(active_) out_ << "\n";
      active_ = false;
      line_width_ = 0;
      out_ << "[" << prefix_ << "] failed: " << f.message << "\n";
      out_.flush();
    },
    [&](const TransferFileNames&){}
  }, event);
}

} // namespace sendmer
