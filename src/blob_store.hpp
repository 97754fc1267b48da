#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "types.hpp"
#include "utils.hpp"

namespace sendmer {

class Logger;

inline constexpr std::size_t kIoChunkSize = 256 * 1024;

// Reference counts for blobs that must stay alive while a session uses them.
class TagRegistry {
public:
  void acquire(const ContentHash& hash);
  void release(const ContentHash& hash);
  std::size_t count(const ContentHash& hash) const;

private:
  mutable std::mutex mutex_;
  std::unordered_map<ContentHash, std::size_t, ContentHashHasher> counts_;
};

// Move-only token protecting one blob for as long as it lives.
class TempTag {
public:
  TempTag() = default;
  TempTag(std::shared_ptr<TagRegistry> registry, HashAndFormat value);
  ~TempTag();

  TempTag(TempTag&& other) noexcept;
  TempTag& operator=(TempTag&& other) noexcept;
  TempTag(const TempTag&) = delete;
  TempTag& operator=(const TempTag&) = delete;

  const ContentHash& hash() const { return value_.hash; }
  BlobFormat format() const { return value_.format; }
  const HashAndFormat& hash_and_format() const { return value_; }
  bool valid() const { return static_cast<bool>(registry_); }
  void reset();

private:
  std::shared_ptr<TagRegistry> registry_;
  HashAndFormat value_;
};

enum class ImportMode {
  Copy,
  // Keep the data where it is and remember size and mtime; reads fail once the source changes.
  TryReference
};

struct AddPathOptions {
  std::filesystem::path path;
  ImportMode mode = ImportMode::TryReference;
  BlobFormat format = BlobFormat::Raw;
};

struct AddSize { uint64_t size = 0; };
struct AddCopyProgress { uint64_t offset = 0; };
struct AddCopyDone {};
struct AddOutboardProgress { uint64_t offset = 0; };
struct AddError { std::string message; };
struct AddDone { TempTag tag; };

using AddProgressItem = std::variant<AddSize,
                                     AddCopyProgress,
                                     AddCopyDone,
                                     AddOutboardProgress,
                                     AddError,
                                     AddDone>;

// Items arrive in order; a handler may throw to abandon the import.
using AddProgressHandler = std::function<void(AddProgressItem& item)>;

struct ExportOptions {
  ContentHash hash;
  std::filesystem::path target;
};

struct ExportSize { uint64_t size = 0; };
struct ExportCopyProgress { uint64_t offset = 0; };
struct ExportDone {};
struct ExportFailed { std::string message; };

using ExportProgressItem = std::variant<ExportSize,
                                        ExportCopyProgress,
                                        ExportDone,
                                        ExportFailed>;

using ExportProgressHandler = std::function<void(const ExportProgressItem& item)>;

// What part of a root (and, for HashSeq, its children) is present locally.
struct LocalInfo {
  HashAndFormat root;
  bool root_present = false;
  // Children not present; only known once the root is present.
  std::vector<ContentHash> missing;
  uint64_t local_bytes = 0;
  // Number of hashes in the root sequence, metadata entry included.
  std::optional<std::size_t> children;

  bool is_complete() const { return root_present && missing.empty(); }
};

// Readable view of one stored blob.
struct BlobSource {
  std::filesystem::path path;
  uint64_t size = 0;
};

// Streams a blob into the store's staging area and commits it only if the
// received bytes hash to the expected value.
class BlobWriter {
public:
  BlobWriter(std::filesystem::path staging, std::filesystem::path destination, ContentHash expected);
  ~BlobWriter();
  BlobWriter(const BlobWriter&) = delete;
  BlobWriter& operator=(const BlobWriter&) = delete;

  void write(const char* data, std::size_t size);
  // False (and nothing stored) when the content does not hash to the expected value.
  bool commit();

  uint64_t written() const { return written_; }

private:
  std::filesystem::path staging_;
  std::filesystem::path destination_;
  ContentHash expected_;
  std::ofstream out_;
  Sha256Hasher hasher_;
  uint64_t written_ = 0;
  bool committed_ = false;
};

std::vector<ContentHash> hash_seq_from_bytes(const std::vector<unsigned char>& data);
std::vector<unsigned char> hash_seq_to_bytes(const std::vector<ContentHash>& hashes);

class Store {
public:
  virtual ~Store() = default;

  virtual void add_path(const AddPathOptions& options, const AddProgressHandler& on_item) = 0;
  virtual TempTag add_bytes(const std::vector<unsigned char>& data, BlobFormat format) = 0;
  virtual void export_blob(const ExportOptions& options, const ExportProgressHandler& on_item) = 0;
  virtual LocalInfo local(const HashAndFormat& root) = 0;

  virtual bool has(const ContentHash& hash) = 0;
  virtual std::optional<uint64_t> blob_size(const ContentHash& hash) = 0;
  virtual std::vector<unsigned char> read_bytes(const ContentHash& hash) = 0;
  virtual BlobSource open_blob(const ContentHash& hash) = 0;
  virtual std::unique_ptr<BlobWriter> begin_blob(const ContentHash& expected) = 0;

  virtual TempTag temp_tag(const HashAndFormat& value) = 0;
  virtual std::size_t tag_count(const ContentHash& hash) const = 0;

  virtual void shutdown() = 0;
  virtual bool is_shut_down() const = 0;
};

// Directory-backed store: data/<hex> for owned blobs, refs/<hex>.json for
// referenced files, tmp/ for staging.
class FsStore : public Store {
public:
  static std::shared_ptr<FsStore> load(const std::filesystem::path& root,
                                       std::shared_ptr<Logger> logger = nullptr);

  FsStore(std::filesystem::path root, std::shared_ptr<Logger> logger);

  void add_path(const AddPathOptions& options, const AddProgressHandler& on_item) override;
  TempTag add_bytes(const std::vector<unsigned char>& data, BlobFormat format) override;
  void export_blob(const ExportOptions& options, const ExportProgressHandler& on_item) override;
  LocalInfo local(const HashAndFormat& root) override;

  bool has(const ContentHash& hash) override;
  std::optional<uint64_t> blob_size(const ContentHash& hash) override;
  std::vector<unsigned char> read_bytes(const ContentHash& hash) override;
  BlobSource open_blob(const ContentHash& hash) override;
  std::unique_ptr<BlobWriter> begin_blob(const ContentHash& expected) override;

  TempTag temp_tag(const HashAndFormat& value) override;
  std::size_t tag_count(const ContentHash& hash) const override;

  void shutdown() override;
  bool is_shut_down() const override { return shut_down_.load(); }

  const std::filesystem::path& root() const { return root_; }

private:
  void ensure_open() const;
  std::filesystem::path data_path(const ContentHash& hash) const;
  std::filesystem::path ref_path(const ContentHash& hash) const;
  std::filesystem::path staging_path() const;
  std::optional<BlobSource> locate(const ContentHash& hash) const;
  void write_reference(const ContentHash& hash, const std::filesystem::path& source, uint64_t size);

  std::filesystem::path root_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<TagRegistry> tags_;
  std::atomic<bool> shut_down_{false};
};

} // namespace sendmer
