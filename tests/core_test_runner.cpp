#include "blob_store.hpp"
#include "cli_progress.hpp"
#include "collection.hpp"
#include "command_line_parser.hpp"
#include "errors.hpp"
#include "get.hpp"
#include "import.hpp"
#include "log.hpp"
#include "path_validator.hpp"
#include "protocol.hpp"
#include "provide_progress.hpp"
#include "receive.hpp"
#include "session.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"
#include "ticket.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <variant>
#include <vector>

using namespace sendmer;
using sendmer::test::expect;

namespace fs = std::filesystem;

namespace {

struct TestContext {
  sendmer::test::LogCapture& logs;
  std::shared_ptr<Logger> logger;
  bool verbose = false;
};

struct TestCase {
  std::string name;
  std::function<bool(TestContext&)> fn;
};

template<typename E, typename F>
bool throws(F&& fn) {
  try {
    fn();
  } catch(const E&) {
    return true;
  }
  return false;
}

ParsedCommand parse_args(const std::vector<std::string>& args, SettingsManager& settings) {
  std::vector<std::string> storage = args;
  std::vector<char*> argv;
  for(auto& arg : storage) argv.push_back(arg.data());
  CommandLineParser parser("sendmer");
  return parser.parse(static_cast<int>(argv.size()), argv.data(), settings);
}

EndpointAddr sample_addr() {
  EndpointAddr addr;
  addr.id = std::string(64, 'a');
  addr.addrs.push_back(TransportAddr::ip("127.0.0.1:4433"));
  addr.addrs.push_back(TransportAddr::ip("[::1]:4433"));
  addr.addrs.push_back(TransportAddr::relay("https://relay.example.net./"));
  return addr;
}

// Refuses any file called "bad.bin".
class FailingStore : public FsStore {
public:
  using FsStore::FsStore;

  static std::shared_ptr<FailingStore> create(const fs::path& root) {
    fs::create_directories(root / "data");
    fs::create_directories(root / "refs");
    fs::create_directories(root / "tmp");
    return std::make_shared<FailingStore>(root, nullptr);
  }

  void add_path(const AddPathOptions& options, const AddProgressHandler& on_item) override {
    if(options.path.filename() == "bad.bin") {
      AddProgressItem item = AddError{"device not ready"};
      on_item(item);
      return;
    }
    FsStore::add_path(options, on_item);
  }
};

// Fails every blob write with a filesystem error.
class FullDiskStore : public FsStore {
public:
  using FsStore::FsStore;

  std::unique_ptr<BlobWriter> begin_blob(const ContentHash&) override {
    throw fs::filesystem_error("no space left", std::make_error_code(std::errc::no_space_on_device));
  }
};

// Throws something that is not a std::exception.
class OddEmitter : public EventEmitter {
public:
  void emit(const TransferEvent&) override {
    ++attempts;
    throw 42;
  }

  std::size_t attempts = 0;
};

// ---- paths ----------------------------------------------------------------

bool test_path_validation(TestContext&) {
  expect(canonicalized_path_to_string("dir/sub/file.txt", true) == "dir/sub/file.txt", "relative path kept");
  expect(canonicalized_path_to_string("/abs/file", false) == "/abs/file", "absolute path gets a leading slash");
  expect(throws<PathValidationError>([]{ canonicalized_path_to_string("/abs/file", true); }),
         "absolute path refused when a relative one is required");
  expect(throws<PathValidationError>([]{ canonicalized_path_to_string("a/../b", true); }), "parent reference refused");
  expect(throws<PathValidationError>([]{ canonicalized_path_to_string("./a", true); }), "current dir reference refused");

  expect(throws<PathValidationError>([]{ validate_path_component("a/b"); }), "separator inside component refused");
  expect(throws<PathValidationError>([]{ validate_path_component(".."); }), "parent component refused");
  expect(throws<PathValidationError>([]{ validate_path_component(""); }), "empty component refused");

  fs::path root("/out");
  expect(get_export_path(root, "d/f.txt") == root / "d" / "f.txt", "export path joins components");
  expect(throws<PathValidationError>([&]{ get_export_path(root, "d/../../etc/passwd"); }), "escape refused");
  return true;
}

// ---- tickets --------------------------------------------------------------

bool test_ticket_address_policies(TestContext&) {
  auto id_only = sample_addr();
  apply_options(id_only, AddrInfoOptions::Id);
  expect(id_only.addrs.empty(), "id policy drops every hint");
  expect(id_only.id == sample_addr().id, "id kept");

  auto relay_only = sample_addr();
  apply_options(relay_only, AddrInfoOptions::Relay);
  expect(relay_only.addrs.size() == 1 && relay_only.has_relay() && !relay_only.has_ip(), "relay policy keeps relay only");

  auto ip_only = sample_addr();
  apply_options(ip_only, AddrInfoOptions::Addresses);
  expect(ip_only.addrs.size() == 2 && ip_only.has_ip() && !ip_only.has_relay(), "address policy keeps direct addresses");

  auto both = sample_addr();
  apply_options(both, AddrInfoOptions::RelayAndAddresses);
  expect(both.addrs.size() == 3, "combined policy keeps everything");

  expect(addr_info_options_from_string("relay_and_addresses") == AddrInfoOptions::RelayAndAddresses, "parse ticket type");
  expect(!addr_info_options_from_string("everything"), "unknown ticket type");
  return true;
}

bool test_ticket_text_form(TestContext&) {
  auto hash = ContentHash::of("collection", 10);
  Ticket ticket(sample_addr(), hash, BlobFormat::HashSeq);
  auto text = ticket.to_string();
  expect(text.rfind("blob", 0) == 0, "ticket starts with blob");

  auto parsed = Ticket::parse(text);
  expect(parsed.addr.id == ticket.addr.id, "id survives");
  expect(parsed.addr.addrs == ticket.addr.addrs, "hints survive in order");
  expect(parsed.hash == hash, "hash survives");
  expect(parsed.format == BlobFormat::HashSeq, "format survives");

  expect(throws<TicketError>([]{ Ticket::parse("nodeabc"); }), "wrong prefix");
  expect(throws<TicketError>([]{ Ticket::parse("blobzz"); }), "bad hex");
  expect(throws<TicketError>([]{ Ticket::parse("blob"); }), "empty body");
  expect(throws<TicketError>([]{ Ticket::parse("blob00"); }), "body is not a ticket");
  return true;
}

// ---- store and import -----------------------------------------------------

bool test_single_file_import(TestContext& ctx) {
  sendmer::test::TempDir dir("import-one");
  auto file = dir.path() / "somefile.bin";
  sendmer::test::write_file(file, sendmer::test::patterned_bytes(100));
  auto store = FsStore::load(dir.path() / "store", ctx.logger);

  auto events = std::make_shared<sendmer::test::RecordingEmitter>();
  auto result = import_path(file, store, events, ctx.logger.get());
  expect(result.collection.size() == 1, "one entry");
  expect(result.collection.entries().front().first == "somefile.bin", "entry named after the file");
  expect(result.size == 100, "size adds up");
  expect(result.tag.valid() && result.tag.format() == BlobFormat::HashSeq, "root is a hash sequence");
  expect(store->tag_count(result.tag.hash()) == 1, "root is protected");

  auto names = events->names();
  expect(!names.empty() && names.front() == "transfer:sender:started", "import starts a window");
  expect(names.back() == "transfer:sender:completed", "import closes the window");
  auto progress = events->progress();
  expect(!progress.empty() && progress.back().processed == 1 && progress.back().total == 1, "progress counts files");
  return true;
}

bool test_collection_order(TestContext& ctx) {
  sendmer::test::TempDir dir("import-dir");
  auto root = dir.path() / "photos";
  sendmer::test::write_file(root / "b.txt", "bee");
  sendmer::test::write_file(root / "a.txt", "ay");
  sendmer::test::write_file(root / "sub" / "c.txt", "sea");
  auto store = FsStore::load(dir.path() / "store", ctx.logger);

  auto result = import_path(root, store, nullptr, ctx.logger.get(), 3);
  std::vector<std::string> expected = {"photos/a.txt", "photos/b.txt", "photos/sub/c.txt"};
  expect(result.collection.names() == expected, "names are relative to the parent and sorted");
  expect(result.size == 8, "sizes add up");

  auto loaded = Collection::load(result.tag.hash(), *store);
  expect(loaded.names() == expected, "stored collection reads back in order");
  expect(loaded.entries() == result.collection.entries(), "hashes read back");
  return true;
}

bool test_emitter_failure_is_ignored(TestContext& ctx) {
  sendmer::test::TempDir dir("emit-fail");
  auto file = dir.path() / "note.txt";
  sendmer::test::write_file(file, "hello");
  auto store = FsStore::load(dir.path() / "store", ctx.logger);

  auto emitter = std::make_shared<sendmer::test::ThrowingEmitter>();
  auto result = import_path(file, store, emitter, ctx.logger.get());
  expect(result.collection.size() == 1, "import finished");
  expect(emitter->attempts >= 3, "every event was still offered");
  return true;
}

bool test_emitter_odd_throw_is_ignored(TestContext&) {
  auto emitter = std::make_shared<OddEmitter>();
  AppHandle app = emitter;
  emit_event(app, TransferStarted{Role::Receiver});
  emit_event(app, TransferCompleted{Role::Receiver});
  expect(emitter->attempts == 2, "both events offered");
  return true;
}

bool test_import_failure(TestContext& ctx) {
  sendmer::test::TempDir dir("import-fail");
  auto root = dir.path() / "data";
  sendmer::test::write_file(root / "good.bin", "fine");
  sendmer::test::write_file(root / "bad.bin", "broken");
  auto store = FailingStore::create(dir.path() / "store");

  auto events = std::make_shared<sendmer::test::RecordingEmitter>();
  bool failed = false;
  try {
    import_path(root, store, events, ctx.logger.get(), 1);
  } catch(const ImportError& e) {
    failed = std::string(e.what()).find("device not ready") != std::string::npos;
  }
  expect(failed, "import error carries the store message");
  expect(events->count("transfer:sender:failed") == 1, "failure reported once");
  expect(events->count("transfer:sender:completed") == 0, "no completion after failure");
  expect(throws<ImportError>([&]{ import_path(dir.path() / "missing", store, nullptr); }), "missing path refused");
  return true;
}

bool test_store_round_trip(TestContext& ctx) {
  sendmer::test::TempDir dir("round-trip");
  auto root = dir.path() / "docs";
  auto big = sendmer::test::patterned_bytes(kIoChunkSize * 2 + 17, 3);
  sendmer::test::write_file(root / "big.bin", big);
  sendmer::test::write_file(root / "empty.txt", "");
  auto store = FsStore::load(dir.path() / "store", ctx.logger);

  auto result = import_path(root, store, nullptr, ctx.logger.get());
  auto out = dir.path() / "out";
  fs::create_directories(out);
  auto events = std::make_shared<sendmer::test::RecordingEmitter>();
  export_collection(*store, result.collection, out, events, ctx.logger.get());

  expect(sendmer::test::read_file(out / "docs" / "big.bin") == big, "large file restored");
  expect(fs::exists(out / "docs" / "empty.txt") && fs::file_size(out / "docs" / "empty.txt") == 0, "empty file restored");
  auto recorded = events->events();
  expect(!recorded.empty(), "file names announced");
  const auto* names = std::get_if<TransferFileNames>(&recorded.front());
  expect(names && names->file_names == result.collection.names(), "names match the collection");
  return true;
}

bool test_export_conflict(TestContext& ctx) {
  sendmer::test::TempDir dir("conflict");
  auto root = dir.path() / "pair";
  sendmer::test::write_file(root / "a.txt", "first");
  sendmer::test::write_file(root / "b.txt", "second");
  auto store = FsStore::load(dir.path() / "store", ctx.logger);
  auto result = import_path(root, store, nullptr, ctx.logger.get());

  auto out = dir.path() / "out";
  sendmer::test::write_file(out / "pair" / "b.txt", "keep me");
  bool conflict = false;
  try {
    export_collection(*store, result.collection, out, nullptr, ctx.logger.get());
  } catch(const ExportConflictError& e) {
    conflict = e.target() == out / "pair" / "b.txt";
  }
  expect(conflict, "existing target reported");
  expect(sendmer::test::read_file(out / "pair" / "b.txt") == "keep me", "existing file untouched");
  return true;
}

bool test_store_shutdown_stops_streams(TestContext& ctx) {
  sendmer::test::TempDir dir("store-stop");
  auto big = dir.path() / "big.bin";
  sendmer::test::write_file(big, sendmer::test::patterned_bytes(kIoChunkSize * 8, 5));

  auto copying = FsStore::load(dir.path() / "copying", ctx.logger);
  std::optional<std::string> add_error;
  std::size_t chunks = 0;
  copying->add_path({big, ImportMode::Copy, BlobFormat::Raw}, [&](const AddProgressItem& item){
    if(std::holds_alternative<AddCopyProgress>(item) && ++chunks == 1) copying->shutdown();
    if(const auto* e = std::get_if<AddError>(&item)) add_error = e->message;
    expect(!std::holds_alternative<AddDone>(item), "copy finished after shutdown");
  });
  expect(add_error && add_error->find("shut down") != std::string::npos, "copy stopped by shutdown");
  expect(chunks == 1, "no chunk copied after shutdown");
  expect(fs::is_empty(dir.path() / "copying" / "tmp"), "staging file removed");

  auto referencing = FsStore::load(dir.path() / "referencing", ctx.logger);
  add_error.reset();
  referencing->add_path({big, ImportMode::TryReference, BlobFormat::Raw}, [&](const AddProgressItem& item){
    if(std::holds_alternative<AddOutboardProgress>(item)) referencing->shutdown();
    if(const auto* e = std::get_if<AddError>(&item)) add_error = e->message;
  });
  expect(add_error && add_error->find("shut down") != std::string::npos, "hashing stopped by shutdown");

  auto exporting = FsStore::load(dir.path() / "exporting", ctx.logger);
  auto imported = import_path(big, exporting, nullptr, ctx.logger.get());
  auto target = dir.path() / "out" / "big.bin";
  std::optional<std::string> export_error;
  exporting->export_blob({imported.collection.entries().front().second, target},
                         [&](const ExportProgressItem& item){
    if(std::holds_alternative<ExportCopyProgress>(item)) exporting->shutdown();
    if(const auto* e = std::get_if<ExportFailed>(&item)) export_error = e->message;
  });
  expect(export_error && export_error->find("shut down") != std::string::npos, "export stopped by shutdown");
  expect(!fs::exists(target), "nothing exported");
  expect(fs::is_empty(dir.path() / "out"), "partial export removed");
  return true;
}

bool test_export_never_replaces(TestContext& ctx) {
  sendmer::test::TempDir dir("no-replace");
  auto source = dir.path() / "photo.raw";
  sendmer::test::write_file(source, sendmer::test::patterned_bytes(kIoChunkSize * 3, 9));
  auto store = FsStore::load(dir.path() / "store", ctx.logger);
  auto imported = import_path(source, store, nullptr, ctx.logger.get());

  auto target = dir.path() / "out" / "photo.raw";
  bool raced = false;
  std::optional<std::string> failure;
  bool done = false;
  store->export_blob({imported.collection.entries().front().second, target},
                     [&](const ExportProgressItem& item){
    // Another writer claims the name while the copy is under way.
    if(std::holds_alternative<ExportCopyProgress>(item) && !raced) {
      raced = true;
      sendmer::test::write_file(target, "written by someone else");
    }
    if(const auto* e = std::get_if<ExportFailed>(&item)) failure = e->message;
    if(std::holds_alternative<ExportDone>(item)) done = true;
  });
  expect(raced, "target created mid-export");
  expect(!done, "export did not complete");
  expect(failure && failure->find("already exists") != std::string::npos, "failure names the conflict");
  expect(sendmer::test::read_file(target) == "written by someone else", "concurrent file untouched");
  std::size_t entries = 0;
  for(const auto& entry : fs::directory_iterator(dir.path() / "out")) {
    (void)entry;
    ++entries;
  }
  expect(entries == 1, "no partial file left beside the target");

  auto blocker = dir.path() / "blocker";
  sendmer::test::write_file(blocker, "a file, not a directory");
  expect(throws<StoreError>([&]{ FsStore::load(blocker / "store", ctx.logger); }),
         "store under a regular file refused as a store error");
  return true;
}

// ---- requests -------------------------------------------------------------

bool test_sizes_reply_checked(TestContext&) {
  auto meta = ContentHash::of("meta", 4);
  auto child = ContentHash::of("child", 5);
  std::vector<ContentHash> seq = {meta, child};
  auto bytes = hash_seq_to_bytes(seq);
  auto root = ContentHash::of(bytes.data(), bytes.size());

  sendmer::test::FakeConnection good;
  good.push_reply(make_sizes(1, seq, {40, 5}));
  auto result = get_hash_seq_and_sizes(good, root);
  expect(result.hash_seq == seq, "sequence returned");
  expect(result.sizes == std::vector<uint64_t>({40, 5}), "sizes returned");
  expect(good.sent.size() == 1 && message_type(good.sent.front()) == "get_sizes", "request sent");

  sendmer::test::FakeConnection forged;
  forged.push_reply(make_sizes(1, {child}, {5}));
  bool decode = false;
  try {
    get_hash_seq_and_sizes(forged, root);
  } catch(const NetworkError& e) {
    decode = e.kind() == NetworkErrorKind::Decode;
  }
  expect(decode, "sequence not matching the root is rejected");

  sendmer::test::FakeConnection oversized;
  oversized.push_reply(make_sizes(1, seq, {40, 5}));
  bool bad_request = false;
  try {
    get_hash_seq_and_sizes(oversized, root, ContentHash::kSize);
  } catch(const NetworkError& e) {
    bad_request = e.kind() == NetworkErrorKind::BadRequest;
  }
  expect(bad_request, "sequence over the cap is rejected");
  return true;
}

bool test_error_reply_fields(TestContext&) {
  auto typed = error_from_reply({{"type", "error"}, {"kind", "bad_request"}, {"message", "no"}},
                                NetworkErrorKind::Header);
  expect(typed.kind() == NetworkErrorKind::BadRequest, "bad request mapped");

  auto odd_kind = error_from_reply({{"type", "error"}, {"kind", 5}, {"message", "no"}},
                                   NetworkErrorKind::Header);
  expect(odd_kind.kind() == NetworkErrorKind::Decode, "numeric kind is a decode error");
  auto odd_message = error_from_reply({{"type", "error"}, {"message", nullptr}}, NetworkErrorKind::Header);
  expect(odd_message.kind() == NetworkErrorKind::Decode, "null message is a decode error");

  expect(request_id_field({{"type", "get"}}) == uint64_t{0}, "missing request id reads as zero");
  expect(!request_id_field({{"request_id", "seven"}}), "string request id refused");
  expect(!request_id_field({{"request_id", -1}}), "negative request id refused");
  expect(!request_id_field(nlohmann::json::array()), "non-object refused");
  expect(!string_field({{"alpn", 5}}, "alpn"), "numeric alpn refused");
  expect(string_field({{"alpn", "x"}}, "alpn") == std::string("x"), "string field read");
  return true;
}

bool test_get_local_failures(TestContext&) {
  sendmer::test::TempDir dir("get-local");
  fs::create_directories(dir.path() / "store" / "tmp");
  FullDiskStore store(dir.path() / "store", nullptr);
  auto hash = ContentHash::of("hello", 5);

  sendmer::test::FakeConnection conn;
  conn.push_reply(make_blob_header(1, hash, 5));
  LocalInfo local;
  local.root = {hash, BlobFormat::Raw};
  std::optional<GetFailed> failed;
  execute_get(store, conn, local, [&](const GetProgressItem& item){
    if(const auto* f = std::get_if<GetFailed>(&item)) failed = *f;
  });
  expect(failed.has_value(), "failure reported");
  expect(failed->kind == NetworkErrorKind::LocalFailure, "filesystem error is a local failure");
  expect(failed->message.find("no space left") != std::string::npos, "message kept");
  return true;
}

bool test_sizes_retry_recovers(TestContext& ctx) {
  int connects = 0;
  int fetches = 0;
  RetryPolicy policy{3, std::chrono::milliseconds(1)};
  auto result = get_sizes_with_retries(
    [&]{ ++connects; return std::make_shared<sendmer::test::FakeConnection>(); },
    [&](Connection&) {
      if(++fetches < 3) throw NetworkError(NetworkErrorKind::Header, "stream reset");
      HashSeqAndSizes out;
      out.sizes = {1, 2};
      return out;
    },
    policy, ctx.logger.get());
  expect(result.sizes.size() == 2, "third attempt succeeded");
  expect(fetches == 3, "three attempts");
  expect(connects == 3, "reconnected before each retry");
  return true;
}

bool test_sizes_retry_gives_up(TestContext& ctx) {
  int connects = 0;
  int fetches = 0;
  RetryPolicy policy{3, std::chrono::milliseconds(1)};
  const NetworkErrorKind kinds[] = {NetworkErrorKind::Connection, NetworkErrorKind::Decode, NetworkErrorKind::Header};
  bool last_kind = false;
  try {
    get_sizes_with_retries(
      [&]{ ++connects; return std::make_shared<sendmer::test::FakeConnection>(); },
      [&](Connection&) -> HashSeqAndSizes {
        auto kind = kinds[fetches++];
        throw NetworkError(kind, "attempt failed");
      },
      policy, ctx.logger.get());
  } catch(const NetworkError& e) {
    last_kind = e.kind() == NetworkErrorKind::Header;
  }
  expect(last_kind, "last error is rethrown");
  expect(fetches == 3 && connects == 3, "no reconnect after the final attempt");

  bool initial = throws<NetworkError>([&]{
    get_sizes_with_retries(
      []() -> std::shared_ptr<Connection> { throw NetworkError(NetworkErrorKind::Connection, "unreachable"); },
      [](Connection&) { return HashSeqAndSizes{}; },
      policy, ctx.logger.get());
  });
  expect(initial, "initial connect failure is not retried");
  return true;
}

bool test_download_progress_throttle(TestContext&) {
  auto events = std::make_shared<sendmer::test::RecordingEmitter>();
  const uint64_t total = 3ull << 20;
  DownloadProgressReporter reporter(events, total);
  reporter.on_offset(DownloadProgressReporter::kThreshold);
  reporter.on_offset(DownloadProgressReporter::kThreshold + 1);
  reporter.on_offset(2ull << 20);
  reporter.on_offset(5ull << 20);
  reporter.finish();

  auto progress = events->progress();
  expect(progress.size() == 3, "only steps over the threshold are reported, plus the final one");
  expect(progress[0].processed == DownloadProgressReporter::kThreshold + 1, "first report");
  expect(progress[1].processed == total, "processed is clamped to the total");
  expect(progress[2].processed == total && progress[2].total == total, "final report covers everything");
  for(const auto& p : progress) {
    expect(p.role == Role::Receiver, "receiver role");
  }
  return true;
}

// ---- sessions -------------------------------------------------------------

bool test_session_cancellation(TestContext& ctx) {
  sendmer::test::TempDir dir("session");
  auto working = dir.path() / ".sendmer-recv-test";
  fs::create_directories(working / "data");

  auto cancel = std::make_shared<CancellationToken>();
  SessionController session(working, cancel, ctx.logger);
  std::atomic<bool> stop{false};
  std::atomic<bool> hook_ran{false};
  session.add_shutdown_hook([&]{ hook_ran = true; stop = true; });
  session.add_shutdown_hook([]{ throw std::runtime_error("already closed"); });

  std::thread canceller([cancel]{
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    cancel->cancel();
  });
  bool cancelled = false;
  try {
    session.run([&]{
      while(!stop) std::this_thread::sleep_for(std::chrono::milliseconds(5));
    });
  } catch(const CancellationError& e) {
    cancelled = std::string(e.what()) == "Operation cancelled";
  }
  canceller.join();
  expect(cancelled, "cancellation reported");
  expect(hook_ran, "shutdown hooks ran");
  expect(!fs::exists(working), "working directory removed");
  expect(ctx.logs.contains("already closed"), "failing hook logged");
  return true;
}

bool test_session_outcomes(TestContext& ctx) {
  sendmer::test::TempDir dir("session-outcomes");

  auto failed_dir = dir.path() / "failed";
  fs::create_directories(failed_dir);
  SessionController failing(failed_dir, nullptr, ctx.logger);
  expect(throws<ImportError>([&]{ failing.run([]{ throw ImportError("nothing to import"); }); }), "body error rethrown");
  expect(!fs::exists(failed_dir), "removed after failure");

  auto kept_dir = dir.path() / "kept";
  fs::create_directories(kept_dir);
  SessionController keeping(kept_dir, std::make_shared<CancellationToken>(), ctx.logger);
  keeping.set_keep_working_dir(true);
  keeping.run([]{});
  expect(fs::exists(kept_dir), "kept after success when asked");

  auto done_dir = dir.path() / "done";
  fs::create_directories(done_dir);
  SessionController finishing(done_dir, std::make_shared<CancellationToken>(), ctx.logger);
  finishing.run([]{});
  expect(!fs::exists(done_dir), "removed after success by default");

  auto token = std::make_shared<CancellationToken>();
  token->cancel();
  bool immediate = false;
  expect(token->on_cancel([&]{ immediate = true; }) == 0 && immediate, "late callback runs at once");
  expect(token->wait_for(std::chrono::milliseconds(1)), "wait sees the cancel");
  return true;
}

bool test_session_error_cleanup_order(TestContext& ctx) {
  sendmer::test::TempDir dir("session-order");
  auto working = dir.path() / "work";
  fs::create_directories(working / "data");

  SessionController session(working, std::make_shared<CancellationToken>(), ctx.logger);
  bool hook_ran = false;
  bool dir_present_in_hook = false;
  session.add_shutdown_hook([&]{
    hook_ran = true;
    dir_present_in_hook = fs::exists(working / "data");
  });
  expect(throws<ExportError>([&]{ session.run([]{ throw ExportError("disk went away"); }); }),
         "body error rethrown");
  expect(hook_ran, "shutdown hooks ran on failure");
  expect(dir_present_in_hook, "hooks ran before the working directory was removed");
  expect(!fs::exists(working), "working directory removed");
  return true;
}

// ---- provider progress ----------------------------------------------------

bool test_provide_progress_windows(TestContext& ctx) {
  auto events = std::make_shared<sendmer::test::RecordingEmitter>();
  ProvideProgress progress(events, ctx.logger);
  auto sink = progress.sink();
  auto hash = ContentHash::of("blob", 4);

  auto event = [](ProviderEvent::Kind kind, uint64_t conn, uint64_t req, const ContentHash& h,
                  uint64_t size, uint64_t offset){
    ProviderEvent e;
    e.kind = kind;
    e.connection_id = conn;
    e.request_id = req;
    e.hash = h;
    e.size = size;
    e.offset = offset;
    e.remote = "127.0.0.1:9000";
    return e;
  };

  sink(event(ProviderEvent::Kind::ClientConnected, 1, 0, ContentHash(), 0, 0));
  sink(event(ProviderEvent::Kind::RequestReceived, 1, 7, hash, 100, 0));
  sink(event(ProviderEvent::Kind::TransferProgress, 1, 7, hash, 100, 50));
  sink(event(ProviderEvent::Kind::TransferCompleted, 1, 7, hash, 100, 100));
  sink(event(ProviderEvent::Kind::ConnectionClosed, 1, 0, ContentHash(), 0, 0));

  std::vector<std::string> expected = {
    "transfer:sender:started",
    "transfer:sender:progress",
    "transfer:sender:progress",
    "transfer:sender:completed"
  };
  expect(events->names() == expected, "clean connection is one window");
  auto p = events->progress();
  expect(p[0].processed == 50 && p[0].total == 100, "partial progress");
  expect(p[1].processed == 100 && p[1].total == 100, "finished progress");

  sink(event(ProviderEvent::Kind::ClientConnected, 2, 0, ContentHash(), 0, 0));
  sink(event(ProviderEvent::Kind::RequestReceived, 2, 1, hash, 100, 0));
  sink(event(ProviderEvent::Kind::TransferAborted, 2, 1, hash, 100, 10));
  sink(event(ProviderEvent::Kind::ConnectionClosed, 2, 0, ContentHash(), 0, 0));
  expect(events->names().back() == "transfer:sender:failed", "aborted connection fails its window");

  sink(event(ProviderEvent::Kind::TransferProgress, 99, 1, hash, 100, 10));
  expect(ctx.logs.contains("skipping progress update"), "unknown connection skipped");
  expect(progress.tracked_connections() == 0, "closed connections forgotten");

  sink(event(ProviderEvent::Kind::ClientConnected, 3, 0, ContentHash(), 0, 0));
  auto before = events->names().size();
  sink(event(ProviderEvent::Kind::ConnectionClosed, 3, 0, ContentHash(), 0, 0));
  expect(events->names().size() == before, "connection without requests reports nothing");
  return true;
}

// ---- command line ---------------------------------------------------------

bool test_command_line(TestContext&) {
  SettingsManager settings;
  auto parsed = parse_args({"sendmer", "receive", "blobabc", "-o", "/tmp/out", "-vv", "--no-progress"}, settings);
  expect(parsed.command == Subcommand::Receive, "receive subcommand");
  expect(parsed.target == "blobabc", "ticket captured");
  expect(settings.get<std::string>("output_dir") == "/tmp/out", "output dir alias");
  expect(settings.get<int>("verbose") == 2, "verbosity counted");
  expect(settings.get<bool>("no_progress"), "dashed long option");

  SettingsManager send_settings;
  auto send = parse_args({"sendmer", "send", "photos", "--ticket-type", "id", "--relay", "disabled"}, send_settings);
  expect(send.command == Subcommand::Send && send.target == "photos", "send subcommand");
  expect(send_settings.get<std::string>("ticket_type") == "id", "ticket type");
  expect(RelayModeOption::parse(send_settings.get<std::string>("relay")).mode == RelayModeOption::Mode::Disabled,
         "relay mode");

  SettingsManager bad;
  bool invalid = false;
  try {
    parse_args({"sendmer", "share", "x"}, bad);
  } catch(const Error& e) {
    invalid = std::string(e.what()).find("Available subcommands") != std::string::npos;
  }
  expect(invalid, "unknown subcommand lists the choices");
  SettingsManager missing;
  expect(throws<Error>([&]{ parse_args({"sendmer", "send"}, missing); }), "missing path");
  SettingsManager unknown;
  expect(throws<Error>([&]{ parse_args({"sendmer", "send", "x", "--colour"}, unknown); }), "unknown option");

  SettingsManager help;
  parse_args({"sendmer", "--help"}, help);
  expect(help.help_requested(), "help short-circuits");
  return true;
}

bool test_settings_file(TestContext&) {
  sendmer::test::TempDir dir("settings");
  auto config = dir.path() / "sendmer.json";
  sendmer::test::write_file(config, R"({"meter_size": 12, "output-dir": "/from/file", "colour": true})");

  SettingsManager settings;
  parse_args({"sendmer", "receive", "blobabc", "--output-dir", "/from/cli"}, settings);
  std::string error;
  expect(settings.load_from_file(config, error), "file loads: " + error);
  expect(settings.get<int>("meter_size") == 12, "file value applied");
  expect(settings.get<std::string>("output_dir") == "/from/cli", "command line wins");

  sendmer::test::write_file(config, R"({"meter_size": "wide"})");
  SettingsManager wrong;
  expect(!wrong.load_from_file(config, error) && !error.empty(), "type mismatch reported");
  return true;
}

bool test_progress_meter(TestContext&) {
  expect(CliEventEmitter::format_meter(50, 100, 10) == "[#####.....]", "half full");
  expect(CliEventEmitter::format_meter(0, 0, 4) == "[....]", "unknown total is empty");
  expect(CliEventEmitter::format_meter(200, 100, 4) == "[####]", "overshoot is clamped");

  std::ostringstream out;
  CliEventEmitter emitter("recv", out, 10);
  emitter.emit(TransferStarted{Role::Receiver});
  emitter.emit(TransferProgress{Role::Receiver, 5, 10, 0.0});
  emitter.emit(TransferFailed{Role::Receiver, "connection lost"});
  expect(out.str().find("[recv] [#####.....] 50.0%") != std::string::npos, "meter line drawn");
  expect(out.str().find("[recv] failed: connection lost\n") != std::string::npos, "failure printed");
  return true;
}

} // namespace

int main(int argc, char** argv) {
  bool verbose = (std::getenv("SENDMER_TEST_VERBOSE") != nullptr);
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    }
  }

  bool show_logs = (std::getenv("SENDMER_TEST_LOGS") != nullptr) || verbose;
  const bool suppress_logs = !show_logs;
  init_logging(verbose ? 2 : 0);
  if(suppress_logs) {
    set_log_passthrough(false);
  }
  sendmer::test::LogCapture logs;
  auto logger = std::make_shared<Logger>("core-test");
  logs.attach(logger);
  TestContext ctx{logs, logger, verbose};
  std::vector<TestCase> tests = {
    {"path_validation", test_path_validation},
    {"ticket_address_policies", test_ticket_address_policies},
    {"ticket_text_form", test_ticket_text_form},
    {"single_file_import", test_single_file_import},
    {"collection_order", test_collection_order},
    {"emitter_failure_is_ignored", test_emitter_failure_is_ignored},
    {"emitter_odd_throw_is_ignored", test_emitter_odd_throw_is_ignored},
    {"import_failure", test_import_failure},
    {"store_round_trip", test_store_round_trip},
    {"export_conflict", test_export_conflict},
    {"store_shutdown_stops_streams", test_store_shutdown_stops_streams},
    {"export_never_replaces", test_export_never_replaces},
    {"sizes_reply_checked", test_sizes_reply_checked},
    {"error_reply_fields", test_error_reply_fields},
    {"get_local_failures", test_get_local_failures},
    {"sizes_retry_recovers", test_sizes_retry_recovers},
    {"sizes_retry_gives_up", test_sizes_retry_gives_up},
    {"download_progress_throttle", test_download_progress_throttle},
    {"session_cancellation", test_session_cancellation},
    {"session_outcomes", test_session_outcomes},
    {"session_error_cleanup_order", test_session_error_cleanup_order},
    {"provide_progress_windows", test_provide_progress_windows},
    {"command_line", test_command_line},
    {"settings_file", test_settings_file},
    {"progress_meter", test_progress_meter}
  };

  std::size_t failures = 0;
  std::cout << "Running " << tests.size() << " core tests: " << std::flush;

  for(std::size_t idx = 0; idx < tests.size(); ++idx) {
    const auto& test = tests[idx];
    logs.clear();
    bool passed = false;
    try {
      passed = test.fn(ctx);
    } catch(const std::exception& e) {
      passed = false;
      std::cerr << "Exception in test " << test.name << ": " << e.what() << "\n";
    }
    if(passed) {
      std::cout << '.' << std::flush;
    } else {
      std::cout << 'F' << " (" << test.name << ")\n";
      failures++;
      for(const auto& line : logs.snapshot()) {
        std::cout << "    " << line << "\n";
      }
      if(idx + 1 < tests.size()) {
        std::cout << "Running " << tests.size() << " core tests: " << std::flush;
      }
    }
  }
  std::cout << "\n";
  if(suppress_logs) {
    set_log_passthrough(true);
  }
  if(failures == 0) {
    std::cout << "PASS (" << tests.size() << " tests)\n";
    return 0;
  }
  std::cout << "FAIL (" << failures << "/" << tests.size() << " failed)\n";
  return 1;
}
