#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

struct evp_md_ctx_st;

namespace sendmer {

std::string hex_from_bytes(const unsigned char* data, std::size_t size);
std::string hex_from_bytes(const std::vector<unsigned char>&);
// Returns false on odd length or a non-hex character.
bool bytes_from_hex(std::string_view hex, std::vector<unsigned char>& out);

std::array<unsigned char, 32> sha256_digest(const void* data, std::size_t size);
std::string sha256_hex(const std::string& data);

std::vector<unsigned char> random_bytes(std::size_t count);

// Streaming SHA-256 over OpenSSL's EVP interface.
class Sha256Hasher {
public:
  Sha256Hasher();
  ~Sha256Hasher();
  Sha256Hasher(const Sha256Hasher&) = delete;
  Sha256Hasher& operator=(const Sha256Hasher&) = delete;

  void update(const void* data, std::size_t size);
  std::array<unsigned char, 32> finish();

private:
  evp_md_ctx_st* ctx_ = nullptr;
};

// "1.50 MiB" style rendering.
std::string human_bytes(uint64_t bytes);

} // namespace sendmer
