#include "blob_store.hpp"

#include <nlohmann/json.hpp>

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>

#include "errors.hpp"
#include "log.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace sendmer {

namespace {

int64_t mtime_ticks(const fs::path& path) {
  return static_cast<int64_t>(fs::last_write_time(path).time_since_epoch().count());
}

// Reads `path` in kIoChunkSize pieces, feeding `sink` and reporting the running offset.
void stream_file(const fs::path& path,
                 const std::function<void(const char*, std::size_t)>& sink,
                 const std::function<void(uint64_t)>& on_offset) {
  std::ifstream in(path, std::ios::binary);
  if(!in) {
    throw StoreError("unable to open " + path.string());
  }
  std::vector<char> buffer(kIoChunkSize);
  uint64_t offset = 0;
  while(in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    auto got = static_cast<std::size_t>(in.gcount());
    if(got == 0) break;
    sink(buffer.data(), got);
    offset += got;
    if(on_offset) on_offset(offset);
  }
  if(in.bad()) {
    throw StoreError("read failed for " + path.string());
  }
}

ContentHash hash_file(const fs::path& path, const std::function<void(uint64_t)>& on_offset) {
  Sha256Hasher hasher;
  stream_file(path, [&](const char* data, std::size_t size){ hasher.update(data, size); }, on_offset);
  return ContentHash(hasher.finish());
}

void write_file_atomically(const fs::path& staging, const fs::path& destination,
                           const char* data, std::size_t size) {
  {
    std::ofstream out(staging, std::ios::binary | std::ios::trunc);
    if(!out) throw StoreError("unable to create " + staging.string());
    out.write(data, static_cast<std::streamsize>(size));
    if(!out) throw StoreError("write failed for " + staging.string());
  }
  fs::rename(staging, destination);
}

// Moves `staging` to `target` without ever replacing a file that appeared at
// `target` in the meantime. `staging` is left for the caller to remove.
void publish_no_replace(const fs::path& staging, const fs::path& target) {
  if(::link(staging.c_str(), target.c_str()) == 0) return;
  int err = errno;
  if(err == EEXIST) {
    throw StoreError("target " + target.string() + " already exists");
  }
  if(err != EPERM && err != ENOTSUP && err != EOPNOTSUPP) {
    throw StoreError("unable to create " + target.string() + ": " + std::strerror(err));
  }
  // No hard links on this filesystem.
  std::error_code ec;
  if(fs::exists(target, ec)) {
    throw StoreError("target " + target.string() + " already exists");
  }
  fs::rename(staging, target);
}

} // namespace

// ---- tags -----------------------------------------------------------------

void TagRegistry::acquire(const ContentHash& hash) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++counts_[hash];
}

void TagRegistry::release(const ContentHash& hash) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = counts_.find(hash);
  if(it == counts_.end()) return;
  if(--it->second == 0) counts_.erase(it);
}

std::size_t TagRegistry::count(const ContentHash& hash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = counts_.find(hash);
  return it == counts_.end() ? 0 : it->second;
}

TempTag::TempTag(std::shared_ptr<TagRegistry> registry, HashAndFormat value)
  : registry_(std::move(registry)), value_(value) {
  if(registry_) registry_->acquire(value_.hash);
}

TempTag::~TempTag() {
  reset();
}

TempTag::TempTag(TempTag&& other) noexcept
  : registry_(std::move(other.registry_)), value_(other.value_) {
  other.registry_.reset();
}

TempTag& TempTag::operator=(TempTag&& other) noexcept {
  if(this != &other) {
    reset();
    registry_ = std::move(other.registry_);
    value_ = other.value_;
    other.registry_.reset();
  }
  return *this;
}

void TempTag::reset() {
  if(registry_) {
    registry_->release(value_.hash);
    registry_.reset();
  }
}

// ---- hash sequences -------------------------------------------------------

std::vector<ContentHash> hash_seq_from_bytes(const std::vector<unsigned char>& data) {
  if(data.size() % ContentHash::kSize != 0) {
    throw StoreError("hash sequence length " + std::to_string(data.size()) +
                     " is not a multiple of " + std::to_string(ContentHash::kSize));
  }
  std::vector<ContentHash> out;
  out.reserve(data.size() / ContentHash::kSize);
  for(std::size_t pos = 0; pos < data.size(); pos += ContentHash::kSize) {
    ContentHash::Bytes bytes{};
    std::memcpy(bytes.data(), data.data() + pos, ContentHash::kSize);
    out.emplace_back(bytes);
  }
  return out;
}

std::vector<unsigned char> hash_seq_to_bytes(const std::vector<ContentHash>& hashes) {
  std::vector<unsigned char> out;
  out.reserve(hashes.size() * ContentHash::kSize);
  for(const auto& hash : hashes) {
    out.insert(out.end(), hash.bytes().begin(), hash.bytes().end());
  }
  return out;
}

// ---- writer ---------------------------------------------------------------

BlobWriter::BlobWriter(fs::path staging, fs::path destination, ContentHash expected)
  : staging_(std::move(staging)),
    destination_(std::move(destination)),
    expected_(expected),
    out_(staging_, std::ios::binary | std::ios::trunc) {
  if(!out_) {
    throw StoreError("unable to create " + staging_.string());
  }
}

BlobWriter::~BlobWriter() {
  if(!committed_) {
    out_.close();
    std::error_code ec;
    fs::remove(staging_, ec);
  }
}

void BlobWriter::write(const char* data, std::size_t size) {
  out_.write(data, static_cast<std::streamsize>(size));
  if(!out_) {
    throw StoreError("write failed for " + staging_.string());
  }
  hasher_.update(data, size);
  written_ += size;
}

bool BlobWriter::commit() {
  out_.close();
  if(out_.fail()) {
    throw StoreError("unable to flush " + staging_.string());
  }
  ContentHash actual(hasher_.finish());
  if(actual != expected_) {
    return false;
  }
  std::error_code ec;
  fs::rename(staging_, destination_, ec);
  if(ec) {
    throw StoreError("unable to store " + destination_.string() + ": " + ec.message());
  }
  committed_ = true;
  return true;
}

// ---- store ----------------------------------------------------------------

std::shared_ptr<FsStore> FsStore::load(const fs::path& root, std::shared_ptr<Logger> logger) {
  for(const char* sub : {"data", "refs", "tmp"}) {
    std::error_code ec;
    fs::create_directories(root / sub, ec);
    if(ec) {
      throw StoreError("unable to create store at " + root.string() + ": " + ec.message());
    }
  }
  return std::make_shared<FsStore>(root, std::move(logger));
}

FsStore::FsStore(fs::path root, std::shared_ptr<Logger> logger)
  : root_(std::move(root)),
    logger_(std::move(logger)),
    tags_(std::make_shared<TagRegistry>()) {}

void FsStore::ensure_open() const {
  if(shut_down_.load()) {
    throw StoreError("store at " + root_.string() + " is shut down");
  }
}

fs::path FsStore::data_path(const ContentHash& hash) const {
  return root_ / "data" / hash.to_hex();
}

fs::path FsStore::ref_path(const ContentHash& hash) const {
  return root_ / "refs" / (hash.to_hex() + ".json");
}

fs::path FsStore::staging_path() const {
  return root_ / "tmp" / (hex_from_bytes(random_bytes(12)) + ".part");
}

std::optional<BlobSource> FsStore::locate(const ContentHash& hash) const {
  std::error_code ec;
  auto owned = data_path(hash);
  if(fs::is_regular_file(owned, ec)) {
    return BlobSource{owned, fs::file_size(owned)};
  }
  auto ref = ref_path(hash);
  if(!fs::is_regular_file(ref, ec)) {
    return std::nullopt;
  }
  fs::path source;
  uint64_t size = 0;
  int64_t mtime = 0;
  try {
    json doc;
    std::ifstream in(ref);
    in >> doc;
    source = doc.value("path", std::string());
    size = doc.value("size", uint64_t{0});
    mtime = doc.value("mtime", int64_t{0});
  } catch(const json::exception& e) {
    throw StoreError("corrupt reference " + ref.string() + ": " + e.what());
  }
  if(source.empty() || !fs::is_regular_file(source, ec)) {
    throw StoreError("referenced file " + source.string() + " is gone");
  }
  if(fs::file_size(source) != size || mtime_ticks(source) != mtime) {
    throw StoreError("referenced file " + source.string() + " changed since import");
  }
  return BlobSource{source, size};
}

void FsStore::write_reference(const ContentHash& hash, const fs::path& source, uint64_t size) {
  json doc = {
    {"path", source.string()},
    {"size", size},
    {"mtime", mtime_ticks(source)}
  };
  auto text = doc.dump();
  write_file_atomically(staging_path(), ref_path(hash), text.data(), text.size());
}

void FsStore::add_path(const AddPathOptions& options, const AddProgressHandler& on_item) {
  auto emit = [&](AddProgressItem item){ on_item(item); };
  // Every chunk checks for shutdown so a cancelled import stops mid-file.
  auto copied = [&](uint64_t offset){ ensure_open(); emit(AddCopyProgress{offset}); };
  auto hashed = [&](uint64_t offset){ ensure_open(); emit(AddOutboardProgress{offset}); };
  fs::path staging;
  try {
    ensure_open();
    std::error_code ec;
    if(!fs::is_regular_file(options.path, ec)) {
      throw StoreError(options.path.string() + " is not a regular file");
    }
    uint64_t size = fs::file_size(options.path);
    emit(AddSize{size});

    ContentHash hash;
    if(options.mode == ImportMode::Copy) {
      staging = staging_path();
      {
        std::ofstream out(staging, std::ios::binary | std::ios::trunc);
        if(!out) throw StoreError("unable to create " + staging.string());
        stream_file(options.path,
                    [&](const char* data, std::size_t n){
                      out.write(data, static_cast<std::streamsize>(n));
                      if(!out) throw StoreError("write failed for " + staging.string());
                    },
                    copied);
      }
      emit(AddCopyDone{});
      hash = hash_file(staging, hashed);
      if(!fs::exists(data_path(hash), ec)) {
        fs::rename(staging, data_path(hash));
        staging.clear();
      }
    } else {
      emit(AddCopyDone{});
      auto mtime_before = mtime_ticks(options.path);
      hash = hash_file(options.path, hashed);
      if(fs::file_size(options.path) != size || mtime_ticks(options.path) != mtime_before) {
        throw StoreError(options.path.string() + " changed while it was being imported");
      }
      if(!fs::exists(data_path(hash), ec)) {
        write_reference(hash, fs::absolute(options.path), size);
      }
    }
    log_trace(logger_.get(), "stored {} as {} ({} bytes)", options.path.string(), hash.short_hex(), size);
    emit(AddDone{temp_tag({hash, options.format})});
  } catch(const StoreError& e) {
    emit(AddError{e.what()});
  } catch(const fs::filesystem_error& e) {
    emit(AddError{e.what()});
  }
  if(!staging.empty()) {
    std::error_code ec;
    fs::remove(staging, ec);
  }
}

TempTag FsStore::add_bytes(const std::vector<unsigned char>& data, BlobFormat format) {
  ensure_open();
  auto hash = ContentHash::of(data.data(), data.size());
  std::error_code ec;
  if(!fs::exists(data_path(hash), ec)) {
    write_file_atomically(staging_path(), data_path(hash),
                          reinterpret_cast<const char*>(data.data()), data.size());
  }
  return temp_tag({hash, format});
}

void FsStore::export_blob(const ExportOptions& options, const ExportProgressHandler& on_item) {
  fs::path staging;
  try {
    ensure_open();
    auto source = locate(options.hash);
    if(!source) {
      throw StoreError("blob " + options.hash.to_hex() + " is not in the store");
    }
    on_item(ExportSize{source->size});

    std::error_code ec;
    if(fs::exists(options.target, ec)) {
      throw StoreError("target " + options.target.string() + " already exists");
    }
    auto parent = options.target.parent_path();
    if(!parent.empty()) fs::create_directories(parent);
    staging = parent / ("." + options.target.filename().string() + "." +
                        hex_from_bytes(random_bytes(6)) + ".part");
    {
      std::ofstream out(staging, std::ios::binary | std::ios::trunc);
      if(!out) throw StoreError("unable to create " + staging.string());
      stream_file(source->path,
                  [&](const char* data, std::size_t n){
                    out.write(data, static_cast<std::streamsize>(n));
                    if(!out) throw StoreError("write failed for " + staging.string());
                  },
                  [&](uint64_t offset){
                    ensure_open();
                    on_item(ExportCopyProgress{offset});
                  });
    }
    publish_no_replace(staging, options.target);
    on_item(ExportDone{});
  } catch(const StoreError& e) {
    on_item(ExportFailed{e.what()});
  } catch(const fs::filesystem_error& e) {
    on_item(ExportFailed{e.what()});
  }
  if(!staging.empty()) {
    std::error_code ec;
    fs::remove(staging, ec);
  }
}

LocalInfo FsStore::local(const HashAndFormat& root) {
  ensure_open();
  LocalInfo info;
  info.root = root;
  auto root_size = blob_size(root.hash);
  if(!root_size) return info;
  info.root_present = true;
  info.local_bytes = *root_size;
  if(root.format != BlobFormat::HashSeq) return info;

  auto children = hash_seq_from_bytes(read_bytes(root.hash));
  info.children = children.size();
  for(const auto& child : children) {
    if(auto size = blob_size(child)) {
      info.local_bytes += *size;
    } else {
      info.missing.push_back(child);
    }
  }
  return info;
}

bool FsStore::has(const ContentHash& hash) {
  return blob_size(hash).has_value();
}

std::optional<uint64_t> FsStore::blob_size(const ContentHash& hash) {
  ensure_open();
  try {
    auto source = locate(hash);
    if(!source) return std::nullopt;
    return source->size;
  } catch(const StoreError& e) {
    log_debug(logger_.get(), "treating {} as missing: {}", hash.short_hex(), e.what());
    return std::nullopt;
  }
}

std::vector<unsigned char> FsStore::read_bytes(const ContentHash& hash) {
  auto source = open_blob(hash);
  std::vector<unsigned char> out;
  out.reserve(static_cast<std::size_t>(source.size));
  stream_file(source.path,
              [&](const char* data, std::size_t n){
                out.insert(out.end(), data, data + n);
              },
              [&](uint64_t){ ensure_open(); });
  return out;
}

BlobSource FsStore::open_blob(const ContentHash& hash) {
  ensure_open();
  auto source = locate(hash);
  if(!source) {
    throw StoreError("blob " + hash.to_hex() + " is not in the store");
  }
  return *source;
}

std::unique_ptr<BlobWriter> FsStore::begin_blob(const ContentHash& expected) {
  ensure_open();
  return std::make_unique<BlobWriter>(staging_path(), data_path(expected), expected);
}

TempTag FsStore::temp_tag(const HashAndFormat& value) {
  return TempTag(tags_, value);
}

std::size_t FsStore::tag_count(const ContentHash& hash) const {
  return tags_->count(hash);
}

void FsStore::shutdown() {
  if(shut_down_.exchange(true)) return;
  log_debug(logger_.get(), "store {} shut down", root_.string());
}

} // namespace sendmer
