#include "utils.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace sendmer {

std::string hex_from_bytes(const unsigned char* data, std::size_t size){
    std::ostringstream oss;
    for(std::size_t i = 0; i < size; ++i) oss << std::hex << std::setw(2) << std::setfill('0') << (int)data[i];
    return oss.str();
}

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    return hex_from_bytes(b.data(), b.size());
}

namespace {
int hex_value(char c){
    if(c >= '0' && c <= '9') return c - '0';
    if(c >= 'a' && c <= 'f') return c - 'a' + 10;
    if(c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}
}

bool bytes_from_hex(std::string_view hex, std::vector<unsigned char>& out){
    if(hex.size() % 2 != 0) return false;
    out.clear();
    out.reserve(hex.size() / 2);
    for(std::size_t i = 0; i < hex.size(); i += 2){
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if(hi < 0 || lo < 0) return false;
        out.push_back(static_cast<unsigned char>((hi << 4) | lo));
    }
    return true;
}

std::array<unsigned char, 32> sha256_digest(const void* data, std::size_t size){
    Sha256Hasher hasher;
    hasher.update(data, size);
    return hasher.finish();
}

std::string sha256_hex(const std::string &data){
    auto digest = sha256_digest(data.data(), data.size());
    return hex_from_bytes(digest.data(), digest.size());
}

std::vector<unsigned char> random_bytes(std::size_t count){
    std::vector<unsigned char> out(count);
    if(count > 0 && RAND_bytes(out.data(), static_cast<int>(count)) != 1){
        throw std::runtime_error("RAND_bytes failed");
    }
    return out;
}

Sha256Hasher::Sha256Hasher() : ctx_(EVP_MD_CTX_new()) {
    if(!ctx_ || EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1){
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("unable to initialise SHA-256 context");
    }
}

Sha256Hasher::~Sha256Hasher(){
    EVP_MD_CTX_free(ctx_);
}

void Sha256Hasher::update(const void* data, std::size_t size){
    if(size == 0) return;
    if(EVP_DigestUpdate(ctx_, data, size) != 1){
        throw std::runtime_error("SHA-256 update failed");
    }
}

std::array<unsigned char, 32> Sha256Hasher::finish(){
    std::array<unsigned char, 32> out{};
    unsigned int len = 0;
    if(EVP_DigestFinal_ex(ctx_, out.data(), &len) != 1 || len != out.size()){
        throw std::runtime_error("SHA-256 finalisation failed");
    }
    return out;
}

std::string human_bytes(uint64_t bytes){
    static constexpr const char* kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while(value >= 1024.0 && unit + 1 < sizeof(kUnits) / sizeof(kUnits[0])){
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    if(unit == 0){
        oss << bytes << " " << kUnits[unit];
    } else {
        oss << std::fixed << std::setprecision(2) << value << " " << kUnits[unit];
    }
    return oss.str();
}

} // namespace sendmer
