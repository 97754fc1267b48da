#include "cli.hpp"

#include <asio.hpp>

#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <thread>

#include "cli_progress.hpp"
#include "command_line_parser.hpp"
#include "endpoint.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "receive.hpp"
#include "send.hpp"
#include "session.hpp"
#include "settings_manager.hpp"
#include "utils.hpp"

namespace sendmer {

namespace {

// Turns SIGINT/SIGTERM into a cancellation for as long as it lives.
class SignalWatcher {
public:
  explicit SignalWatcher(std::shared_ptr<CancellationToken> cancel)
  : cancel_(std::move(cancel)),
    work_(asio::make_work_guard(io_)),
    signals_(io_, SIGINT, SIGTERM)
  {
    signals_.async_wait([this](const std::error_code& ec, int){
      if(!ec) cancel_->cancel();
    });
    thread_ = std::thread([this]{ io_.run(); });
  }

  ~SignalWatcher() {
    std::error_code ignored;
    signals_.cancel(ignored);
    work_.reset();
    io_.stop();
    if(thread_.joinable()) thread_.join();
  }

private:
  std::shared_ptr<CancellationToken> cancel_;
  asio::io_context io_;
  asio::executor_work_guard<asio::io_context::executor_type> work_;
  asio::signal_set signals_;
  std::thread thread_;
};

AppHandle make_progress(const SettingsManager& settings, const char* prefix) {
  if(settings.get<bool>("no_progress")) return nullptr;
  auto width = settings.get<int>("meter_size");
  return std::make_shared<CliEventEmitter>(prefix, std::cerr,
                                           static_cast<std::size_t>(width > 0 ? width : 40));
}

std::vector<unsigned char> resolve_secret(const SettingsManager& settings, Logger* logger) {
  auto secret = get_or_create_secret(logger);
  if(settings.get<bool>("show_secret")) {
    print_err(logger, "using secret key {}", hex_from_bytes(secret));
  }
  return secret;
}

int run_send(const std::string& path,
             const SettingsManager& settings,
             const std::shared_ptr<Logger>& logger,
             const std::shared_ptr<CancellationToken>& cancel) {
  auto ticket_type = addr_info_options_from_string(settings.get<std::string>("ticket_type"));
  if(!ticket_type) {
    print_err(logger.get(), "invalid ticket type '{}'", settings.get<std::string>("ticket_type"));
    return kExitFailure;
  }

  SendOptions options;
  options.relay = RelayModeOption::parse(settings.get<std::string>("relay"));
  options.default_relay_url = settings.get<std::string>("default_relay");
  options.ticket_type = *ticket_type;
  options.magic_ipv4_addr = settings.get<std::string>("magic_ipv4_addr");
  options.magic_ipv6_addr = settings.get<std::string>("magic_ipv6_addr");
  options.secret = resolve_secret(settings, logger.get());
  options.cancel = cancel;
  options.logger = logger;

  auto result = start_share(path, options, make_progress(settings, "send"));

  print_out(logger.get(), "imported {} {}, {}, hash {}",
            result.entry_type, path, human_bytes(result.size), result.hash);
  if(settings.get<int>("verbose") > 1) {
    for(const auto& entry : result.collection) {
      print_out(logger.get(), "    {} {}", entry.second.to_hex(), entry.first);
    }
    double seconds = std::chrono::duration<double>(result.import_time).count();
    auto rate = seconds > 0.0 ? static_cast<uint64_t>(static_cast<double>(result.size) / seconds) : 0;
    print_out(logger.get(), "{}s, {}/s", seconds, human_bytes(rate));
  }
  print_out(logger.get(), "to get this data, use");
  print_out(logger.get(), "sendmer receive {}", result.ticket);

  while(!cancel->wait_for(std::chrono::seconds(1))) {}

  print_out(logger.get(), "shutting down");
  result.share->stop();
  return kExitSuccess;
}

int run_receive(const std::string& ticket,
                const SettingsManager& settings,
                const std::shared_ptr<Logger>& logger,
                const std::shared_ptr<CancellationToken>& cancel) {
  ReceiveOptions options;
  auto output_dir = settings.get<std::string>("output_dir");
  if(!output_dir.empty()) options.output_dir = std::filesystem::path(output_dir);
  options.relay = RelayModeOption::parse(settings.get<std::string>("relay"));
  options.default_relay_url = settings.get<std::string>("default_relay");
  options.magic_ipv4_addr = settings.get<std::string>("magic_ipv4_addr");
  options.magic_ipv6_addr = settings.get<std::string>("magic_ipv6_addr");
  options.secret = resolve_secret(settings, logger.get());
  options.cancel = cancel;
  options.logger = logger;

  auto result = receive(ticket, options, make_progress(settings, "recv"));
  print_out(logger.get(), "{}", result.message);
  log_debug(logger.get(), "files written to {}", result.file_path.string());
  return kExitSuccess;
}

} // namespace

int run_cli(int argc, char* argv[]) {
  SettingsManager settings;
  CommandLineParser parser("sendmer");
  ParsedCommand command;
  try {
    command = parser.parse(argc, argv, settings);
  } catch(const Error& e) {
    print_err(nullptr, "{}", e.what());
    parser.usage();
    return kExitFailure;
  }
  if(settings.help_requested()) {
    parser.usage();
    return kExitSuccess;
  }

  auto config = settings.get<std::string>("config");
  if(!config.empty()) {
    std::string error;
    if(!settings.load_from_file(config, error)) {
      print_err(nullptr, "{}", error);
      return kExitFailure;
    }
  }

  init_logging(settings.get<int>("verbose"));
  auto logger = std::make_shared<Logger>();
  if(settings.get<int>("verbose") > 0) {
    log_debug(logger.get(), "settings: {}", settings.get_json().dump());
  }

  auto cancel = std::make_shared<CancellationToken>();
  SignalWatcher signals(cancel);

  try {
    if(command.command == Subcommand::Send) {
      return run_send(command.target, settings, logger, cancel);
    }
    return run_receive(command.target, settings, logger, cancel);
  } catch(const CancellationError& e) {
    print_err(logger.get(), "{}", e.what());
    return kExitCancelled;
  } catch(const Error& e) {
    print_err(logger.get(), "error ({}): {}", to_string(e.category()), e.what());
    return kExitFailure;
  } catch(const std::filesystem::filesystem_error& e) {
    print_err(logger.get(), "error ({}): {}", to_string(ErrorCategory::LocalFilesystem), e.what());
    return kExitFailure;
  }
}

} // namespace sendmer
