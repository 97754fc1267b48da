#pragma once

#include <string>
#include <utility>
#include <vector>

#include "blob_store.hpp"
#include "types.hpp"

namespace sendmer {

inline constexpr const char* kCollectionHeader = "CollectionV0.";

// Ordered (name, hash) pairs. Stored as a HashSeq root [meta, child...] where
// meta is a JSON blob carrying the header and the names.
class Collection {
public:
  using Entry = std::pair<std::string, ContentHash>;

  Collection() = default;
  explicit Collection(std::vector<Entry> entries) : entries_(std::move(entries)) {}

  void push(std::string name, const ContentHash& hash) {
    entries_.emplace_back(std::move(name), hash);
  }

  const std::vector<Entry>& entries() const { return entries_; }
  std::size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }
  std::vector<Entry>::const_iterator begin() const { return entries_.begin(); }
  std::vector<Entry>::const_iterator end() const { return entries_.end(); }

  std::vector<std::string> names() const;

  // Persists meta and root blobs and returns the tag protecting the root.
  TempTag store(Store& store) const;

  static Collection load(const ContentHash& root, Store& store);

private:
  std::vector<Entry> entries_;
};

} // namespace sendmer
