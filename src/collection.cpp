#include "collection.hpp"

#include <nlohmann/json.hpp>

#include "errors.hpp"

using json = nlohmann::json;

namespace sendmer {

std::vector<std::string> Collection::names() const {
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for(const auto& entry : entries_) out.push_back(entry.first);
  return out;
}

TempTag Collection::store(Store& store) const {
  json meta;
  meta["header"] = kCollectionHeader;
  meta["names"] = names();
  auto text = meta.dump();
  auto meta_tag = store.add_bytes(std::vector<unsigned char>(text.begin(), text.end()), BlobFormat::Raw);

  std::vector<ContentHash> hashes;
  hashes.reserve(entries_.size() + 1);
  hashes.push_back(meta_tag.hash());
  for(const auto& entry : entries_) hashes.push_back(entry.second);
  return store.add_bytes(hash_seq_to_bytes(hashes), BlobFormat::HashSeq);
}

Collection Collection::load(const ContentHash& root, Store& store) {
  auto hashes = hash_seq_from_bytes(store.read_bytes(root));
  if(hashes.empty()) {
    throw StoreError("collection " + root.short_hex() + " has no metadata entry");
  }
  auto meta_bytes = store.read_bytes(hashes.front());
  std::string header;
  std::vector<std::string> names;
  try {
    auto meta = json::parse(meta_bytes.begin(), meta_bytes.end());
    header = meta.value("header", std::string());
    names = meta.value("names", std::vector<std::string>());
  } catch(const json::exception& e) {
    throw StoreError("collection metadata is malformed: " + std::string(e.what()));
  }
  if(header != kCollectionHeader) {
    throw StoreError("collection metadata has an unexpected header");
  }
  if(names.size() != hashes.size() - 1) {
    throw StoreError("collection lists " + std::to_string(names.size()) + " names for " +
                     std::to_string(hashes.size() - 1) + " blobs");
  }
  Collection out;
  for(std::size_t i = 0; i < names.size(); ++i) {
    out.push(std::move(names[i]), hashes[i + 1]);
  }
  return out;
}

} // namespace sendmer
