#include "send.hpp"

#include "errors.hpp"
#include "import.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include "provider.hpp"
#include "ticket.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace sendmer {

namespace {

constexpr std::chrono::seconds kOnlineTimeout{30};

} // namespace

ShareHandle::ShareHandle(std::shared_ptr<Endpoint> endpoint,
                         std::shared_ptr<FsStore> store,
                         std::shared_ptr<ProvideProgress> progress,
                         TempTag tag,
                         fs::path working_dir,
                         std::shared_ptr<Logger> logger)
: endpoint_(std::move(endpoint)),
  store_(std::move(store)),
  progress_(std::move(progress)),
  tag_(std::move(tag)),
  working_dir_(std::move(working_dir)),
  logger_(std::move(logger))
{
}

ShareHandle::~ShareHandle() {
  stop();
}

bool ShareHandle::stopped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stopped_;
}

void ShareHandle::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(stopped_) return;
    stopped_ = true;
  }
  tag_.reset();
  if(!endpoint_->shutdown(kShutdownTimeout)) {
    log_warn(logger_.get(), "connections still open after {} ms, closing anyway", kShutdownTimeout.count());
  }
  store_->shutdown();
  SessionController::remove_working_dir(working_dir_, logger_.get());
}

SendResult start_share(const fs::path& path,
                       const SendOptions& options,
                       const AppHandle& app) {
  auto* logger = options.logger.get();
  auto cwd = fs::current_path();
  std::error_code ec;
  auto target = fs::weakly_canonical(cwd / path, ec);
  if(!ec && target == fs::weakly_canonical(cwd, ec)) {
    throw Error("can not share from the current directory");
  }

  auto working_dir = cwd / (".sendmer-send-" + hex_from_bytes(random_bytes(16)));
  if(fs::exists(working_dir, ec)) {
    throw Error("can not share twice from the same directory: " + cwd.string());
  }

  std::shared_ptr<Endpoint> endpoint;
  std::shared_ptr<FsStore> store;
  auto progress = std::make_shared<ProvideProgress>(app, options.logger);
  std::shared_ptr<BlobsProtocol> blobs;
  try {
    fs::create_directories(working_dir);
    EndpointOptions endpoint_options;
    endpoint_options.relay = options.relay;
    endpoint_options.default_relay_url = options.default_relay_url;
    if(!options.magic_ipv4_addr.empty()) endpoint_options.bind_v4 = options.magic_ipv4_addr;
    endpoint_options.bind_v6 = options.magic_ipv6_addr;
    endpoint_options.secret = options.secret;
    endpoint_options.logger = options.logger;
    endpoint = Endpoint::bind(std::move(endpoint_options));
    store = FsStore::load(working_dir, options.logger);
    blobs = std::make_shared<BlobsProtocol>(
      store,
      [progress](const ProviderEvent& event){ progress->on_event(event); },
      options.logger);
  } catch(const std::exception& e) {
    log_error(logger, "unable to set up share: {}", e.what());
    SessionController::remove_working_dir(working_dir, logger);
    throw;
  }

  SessionController session(working_dir, options.cancel, options.logger);
  session.set_keep_working_dir(true);
  session.add_shutdown_hook([store]{ store->shutdown(); });
  session.add_shutdown_hook([endpoint]{ endpoint->shutdown(ShareHandle::kShutdownTimeout); });

  SendResult result;
  ImportResult imported;
  try {
    session.run([&]{
      auto t0 = std::chrono::steady_clock::now();
      imported = import_path(path, store, app, logger);
      result.import_time = std::chrono::steady_clock::now() - t0;

      endpoint->accept(kBlobsAlpn, blobs);
      if(options.relay.mode != RelayModeOption::Mode::Disabled &&
         !endpoint->wait_online(kOnlineTimeout)) {
        throw NetworkError(NetworkErrorKind::Connection, "endpoint did not come online in time");
      }
    });
  } catch(const std::exception& e) {
    log_debug(logger, "share setup failed: {}", e.what());
    store->shutdown();
    endpoint->shutdown(ShareHandle::kShutdownTimeout);
    throw;
  }

  auto addr = endpoint->addr();
  apply_options(addr, options.ticket_type);
  Ticket ticket(addr, imported.tag.hash(), BlobFormat::HashSeq);

  result.ticket = ticket.to_string();
  result.hash = imported.tag.hash().to_hex();
  result.size = imported.size;
  result.entry_type = fs::is_regular_file(path, ec) ? "file" : "directory";
  result.collection = std::move(imported.collection);
  result.share = std::make_unique<ShareHandle>(endpoint, store, progress,
                                               std::move(imported.tag), working_dir, options.logger);
  log_info(logger, "sharing {} as {}", path.string(), result.hash.substr(0, 8));
  return result;
}

} // namespace sendmer
