#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "blob_store.hpp"
#include "collection.hpp"
#include "event_bus.hpp"

namespace sendmer {

class Logger;

struct ImportResult {
  // Protects the collection root and, through it, every entry.
  TempTag tag;
  uint64_t size = 0;
  Collection collection;
};

struct ImportSource {
  std::string name;
  std::filesystem::path path;
};

// Regular files under `path` (or `path` itself) named relative to its parent.
// Symlinks are skipped.
std::vector<ImportSource> collect_import_sources(const std::filesystem::path& path);

// Imports a file or directory into `store` as one collection. A single file
// becomes a collection with one entry named like the file.
//
// Files are imported on up to `parallelism` threads (0 picks the processor
// count). If any file fails, the files already in flight finish and the
// whole import throws ImportError.
ImportResult import_path(const std::filesystem::path& path,
                         const std::shared_ptr<Store>& store,
                         const AppHandle& app,
                         Logger* logger = nullptr,
                         std::size_t parallelism = 0);

} // namespace sendmer
