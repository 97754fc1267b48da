#include "receive.hpp"

#include <algorithm>
#include <cstdlib>
#include <numeric>
#include <thread>
#include <variant>

#include "errors.hpp"
#include "log.hpp"
#include "path_validator.hpp"
#include "protocol.hpp"

namespace fs = std::filesystem;

namespace sendmer {

namespace {

constexpr std::chrono::milliseconds kShutdownTimeout{2000};

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

void log_get_error(Logger* logger, const NetworkError& e) {
  switch(e.kind()) {
    case NetworkErrorKind::Connection:
      log_error(logger, "connection error: {}", e.what());
      break;
    case NetworkErrorKind::Header:
      log_error(logger, "reading blob header error: {}", e.what());
      break;
    case NetworkErrorKind::Decode:
      log_error(logger, "decoding error: {}", e.what());
      break;
    case NetworkErrorKind::TransportSend:
      log_error(logger, "error sending request: {}", e.what());
      break;
    case NetworkErrorKind::Closing:
      log_error(logger, "error at closing: {}", e.what());
      break;
    case NetworkErrorKind::BadRequest:
      log_error(logger, "bad request: {}", e.what());
      break;
    case NetworkErrorKind::LocalFailure:
      log_error(logger, "local failure: {}", e.what());
      break;
  }
}

} // namespace

HashSeqAndSizes get_sizes_with_retries(const ConnectFn& connect,
                                       const FetchSizesFn& fetch,
                                       const RetryPolicy& policy,
                                       Logger* logger) {
  auto connection = connect();
  std::optional<NetworkError> last_error;
  for(int attempt = 1; attempt <= policy.attempts; ++attempt) {
    try {
      return fetch(*connection);
    } catch(const NetworkError& e) {
      log_warn(logger, "attempt {} to get sizes failed: {}", attempt, e.what());
      last_error = e;
    }
    if(attempt == policy.attempts) break;
    std::this_thread::sleep_for(policy.backoff_step * attempt);
    try {
      connection = connect();
    } catch(const NetworkError& e) {
      log_warn(logger, "reconnect failed: {}", e.what());
    }
  }
  if(!last_error) {
    throw NetworkError(NetworkErrorKind::Connection, "unknown error getting sizes");
  }
  log_get_error(logger, *last_error);
  throw *last_error;
}

DownloadProgressReporter::DownloadProgressReporter(AppHandle app, uint64_t total)
: app_(std::move(app)), total_(total), started_(std::chrono::steady_clock::now())
{
}

double DownloadProgressReporter::speed_for(uint64_t bytes) const {
  double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();
  return elapsed > 0.0 ? static_cast<double>(bytes) / elapsed : 0.0;
}

void DownloadProgressReporter::on_offset(uint64_t offset) {
  if(offset <= last_reported_ || offset - last_reported_ <= kThreshold) return;
  last_reported_ = offset;
  auto processed = std::min(offset, total_);
  emit_event(app_, TransferProgress{Role::Receiver, processed, total_, speed_for(offset)});
}

void DownloadProgressReporter::finish() {
  last_reported_ = total_;
  emit_event(app_, TransferProgress{Role::Receiver, total_, total_, speed_for(total_)});
}

void export_collection(Store& store,
                       const Collection& collection,
                       const fs::path& output_dir,
                       const AppHandle& app,
                       Logger* logger) {
  auto names = collection.names();
  if(!names.empty()) {
    emit_event(app, TransferFileNames{Role::Receiver, names});
  }
  for(const auto& entry : collection) {
    auto target = get_export_path(output_dir, entry.first);
    std::error_code ec;
    if(fs::exists(fs::symlink_status(target, ec))) {
      throw ExportConflictError(target);
    }
    ExportOptions options;
    options.hash = entry.second;
    options.target = target;
    std::optional<std::string> failure;
    store.export_blob(options, [&](const ExportProgressItem& item){
      std::visit(overloaded{
        [&](const ExportSize& s){ log_trace(logger, "exporting {} ({} bytes)", entry.first, s.size); },
        [&](const ExportCopyProgress&){},
        [&](const ExportDone&){ log_trace(logger, "exported {}", target.string()); },
        [&](const ExportFailed& f){ failure = f.message; }
      }, item);
    });
    if(failure) {
      throw ExportError("error exporting " + entry.first + ": " + *failure);
    }
  }
}

fs::path default_output_dir() {
  if(const char* home = std::getenv("HOME")) {
    fs::path downloads = fs::path(home) / "Downloads";
    std::error_code ec;
    if(fs::is_directory(downloads, ec)) return downloads;
  }
  return fs::current_path();
}

ReceiveResult receive(const std::string& ticket_text,
                      const ReceiveOptions& options,
                      const AppHandle& app) {
  auto* logger = options.logger.get();
  auto ticket = Ticket::parse(ticket_text);
  if(ticket.format != BlobFormat::HashSeq) {
    throw TicketError("ticket does not name a collection");
  }

  auto working_dir = fs::temp_directory_path() / (".sendmer-recv-" + ticket.hash.to_hex());
  std::shared_ptr<Endpoint> endpoint;
  std::shared_ptr<FsStore> store;
  try {
    EndpointOptions endpoint_options;
    endpoint_options.relay = options.relay;
    endpoint_options.default_relay_url = options.default_relay_url;
    if(!options.magic_ipv4_addr.empty()) endpoint_options.bind_v4 = options.magic_ipv4_addr;
    endpoint_options.bind_v6 = options.magic_ipv6_addr;
    endpoint_options.secret = options.secret;
    endpoint_options.logger = options.logger;
    endpoint = Endpoint::bind(std::move(endpoint_options));
    store = FsStore::load(working_dir, options.logger);
  } catch(const std::exception& e) {
    if(endpoint) endpoint->shutdown(kShutdownTimeout);
    SessionController::remove_working_dir(working_dir, logger);
    emit_event(app, TransferFailed{Role::Receiver, e.what()});
    throw;
  }
  log_trace(logger, "load done!");

  SessionController session(working_dir, options.cancel, options.logger);
  session.add_shutdown_hook([store]{ store->shutdown(); });
  session.add_shutdown_hook([endpoint]{ endpoint->shutdown(kShutdownTimeout); });

  ReceiveResult result;
  try {
    session.run([&]{
      HashAndFormat root{ticket.hash, ticket.format};
      auto local = store->local(root);
      uint64_t total_files = 0;
      uint64_t payload_size = 0;

      if(!local.is_complete()) {
        emit_event(app, TransferStarted{Role::Receiver});

        auto connect = [&]{ return endpoint->connect(ticket.addr, kBlobsAlpn); };
        auto sizes = get_sizes_with_retries(connect,
                                            [&](Connection& conn){ return get_hash_seq_and_sizes(conn, ticket.hash); },
                                            RetryPolicy(),
                                            logger);
        if(!sizes.sizes.empty()) {
          payload_size = std::accumulate(sizes.sizes.begin() + 1, sizes.sizes.end(), uint64_t{0});
          total_files = sizes.sizes.size() - 1;
        }

        DownloadProgressReporter reporter(app, payload_size);
        emit_event(app, TransferProgress{Role::Receiver, 0, payload_size, 0.0});

        auto connection = endpoint->connect(ticket.addr, kBlobsAlpn);
        std::optional<NetworkError> failure;
        execute_get(*store, *connection, local, [&](const GetProgressItem& item){
          std::visit(overloaded{
            [&](const GetProgress& p){ reporter.on_offset(p.offset); },
            [&](const GetDone& d){
              result.stats = d.stats;
              reporter.finish();
            },
            [&](const GetFailed& f){ failure.emplace(f.kind, f.message); }
          }, item);
        });
        connection->close();
        if(failure) {
          log_get_error(logger, *failure);
          throw *failure;
        }
      } else {
        total_files = local.children ? *local.children - 1 : 0;
        auto children = hash_seq_from_bytes(store->read_bytes(ticket.hash));
        for(std::size_t i = 1; i < children.size(); ++i) {
          payload_size += store->blob_size(children[i]).value_or(0);
        }
        emit_event(app, TransferStarted{Role::Receiver});
        emit_event(app, TransferCompleted{Role::Receiver});
      }

      auto collection = Collection::load(ticket.hash, *store);
      auto output_dir = options.output_dir ? *options.output_dir : default_output_dir();
      export_collection(*store, collection, output_dir, app, logger);
      if(!local.is_complete()) {
        emit_event(app, TransferCompleted{Role::Receiver});
      }

      result.message = "Downloaded " + std::to_string(total_files) + " files, " +
                       std::to_string(payload_size) + " bytes";
      result.file_path = output_dir;
    });
  } catch(const CancellationError& e) {
    log_warn(logger, "Operation cancelled by user");
    emit_event(app, TransferFailed{Role::Receiver, e.what()});
    throw;
  } catch(const std::exception& e) {
    log_error(logger, "Download operation failed: {}", e.what());
    emit_event(app, TransferFailed{Role::Receiver, e.what()});
    throw;
  }

  store->shutdown();
  endpoint->shutdown(kShutdownTimeout);
  return result;
}

} // namespace sendmer
