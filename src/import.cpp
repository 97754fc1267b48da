#include "import.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <thread>
#include <variant>

#include "errors.hpp"
#include "log.hpp"
#include "path_validator.hpp"

namespace fs = std::filesystem;

namespace sendmer {

namespace {

struct ImportRecord {
  std::string name;
  TempTag tag;
  uint64_t size = 0;
};

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

ImportRecord import_one(Store& store, const ImportSource& source, Logger* logger) {
  AddPathOptions options;
  options.path = source.path;
  options.mode = ImportMode::TryReference;
  options.format = BlobFormat::Raw;

  ImportRecord record;
  record.name = source.name;
  bool done = false;
  store.add_path(options, [&](AddProgressItem& item){
    std::visit(overloaded{
      [&](AddSize& s){ record.size = s.size; },
      [&](AddCopyProgress& p){ log_trace(logger, "copying {} {}", source.name, p.offset); },
      [&](AddCopyDone&){ log_trace(logger, "computing outboard {}", source.name); },
      [&](AddOutboardProgress& p){ log_trace(logger, "outboard {} {}", source.name, p.offset); },
      [&](AddError& e){
        throw ImportError("error importing " + source.name + ": " + e.message);
      },
      [&](AddDone& d){
        record.tag = std::move(d.tag);
        done = true;
      }
    }, item);
  });
  if(!done) {
    throw ImportError("import of " + source.name + " ended without a tag");
  }
  return record;
}

} // namespace

std::vector<ImportSource> collect_import_sources(const fs::path& path) {
  std::vector<ImportSource> out;
  auto root = path.parent_path();
  auto add = [&](const fs::path& file){
    auto relative = file.lexically_relative(root);
    out.push_back({canonicalized_path_to_string(relative, true), file});
  };

  std::error_code ec;
  auto status = fs::symlink_status(path, ec);
  if(ec) throw ImportError("path " + path.string() + " does not exist");
  if(fs::is_regular_file(status)) {
    add(path);
    return out;
  }
  if(!fs::is_directory(status)) return out;

  fs::recursive_directory_iterator it(path, fs::directory_options::none, ec);
  if(ec) throw ImportError("unable to read " + path.string() + ": " + ec.message());
  for(fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
    if(ec) throw ImportError("unable to read " + path.string() + ": " + ec.message());
    const auto& entry = *it;
    if(entry.is_symlink(ec)) continue;
    if(entry.is_regular_file(ec)) add(entry.path());
  }
  if(ec) throw ImportError("unable to read " + path.string() + ": " + ec.message());
  return out;
}

ImportResult import_path(const fs::path& path,
                         const std::shared_ptr<Store>& store,
                         const AppHandle& app,
                         Logger* logger,
                         std::size_t parallelism) {
  std::error_code ec;
  auto canonical = fs::canonical(path, ec);
  if(ec || !fs::exists(canonical)) {
    throw ImportError("path " + path.string() + " does not exist");
  }

  auto sources = collect_import_sources(canonical);
  const uint64_t total = sources.size();
  log_debug(logger, "importing {} files from {}", total, canonical.string());

  emit_event(app, TransferStarted{Role::Sender});
  emit_event(app, TransferProgress{Role::Sender, 0, total, 0.0});

  if(parallelism == 0) {
    parallelism = std::max(1u, std::thread::hardware_concurrency());
  }
  parallelism = std::min<std::size_t>(parallelism, std::max<std::size_t>(1, sources.size()));

  std::mutex job_mutex;
  std::deque<std::size_t> job_queue;
  for(std::size_t i = 0; i < sources.size(); ++i) job_queue.push_back(i);
  std::vector<ImportRecord> records;
  records.reserve(sources.size());
  uint64_t finished = 0;
  std::optional<std::string> failure;

  auto take_job = [&]() -> std::optional<std::size_t> {
    std::lock_guard<std::mutex> lock(job_mutex);
    if(failure || job_queue.empty()) return std::nullopt;
    auto job = job_queue.front();
    job_queue.pop_front();
    return job;
  };

  auto worker_fn = [&](){
    while(auto job = take_job()) {
      const auto& source = sources[*job];
      try {
        auto record = import_one(*store, source, logger);
        uint64_t done_count = 0;
        {
          std::lock_guard<std::mutex> lock(job_mutex);
          records.push_back(std::move(record));
          done_count = ++finished;
        }
        emit_event(app, TransferProgress{Role::Sender, done_count, total, 0.0});
      } catch(const std::exception& e) {
        log_debug(logger, "import of {} failed: {}", source.name, e.what());
        std::lock_guard<std::mutex> lock(job_mutex);
        if(!failure) failure = e.what();
      }
    }
  };

  std::vector<std::thread> workers;
  workers.reserve(parallelism);
  for(std::size_t i = 0; i < parallelism; ++i) {
    workers.emplace_back(worker_fn);
  }
  for(auto& thread : workers) {
    if(thread.joinable()) thread.join();
  }

  if(failure) {
    emit_event(app, TransferFailed{Role::Sender, *failure});
    throw ImportError(*failure);
  }

  std::sort(records.begin(), records.end(),
            [](const ImportRecord& a, const ImportRecord& b){ return a.name < b.name; });

  ImportResult result;
  for(const auto& record : records) {
    result.size += record.size;
    result.collection.push(record.name, record.tag.hash());
  }
  try {
    result.tag = result.collection.store(*store);
  } catch(const StoreError& e) {
    emit_event(app, TransferFailed{Role::Sender, e.what()});
    throw ImportError(std::string("unable to store collection: ") + e.what());
  }
  // The root now protects every entry.
  records.clear();

  emit_event(app, TransferCompleted{Role::Sender});
  log_debug(logger, "imported {} as {} ({} bytes)", canonical.string(), result.tag.hash().short_hex(), result.size);
  return result;
}

} // namespace sendmer
