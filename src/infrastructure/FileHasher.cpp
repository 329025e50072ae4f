#include "infrastructure/FileHasher.hpp"
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <openssl/evp.h>

namespace tidyfile::infrastructure {

std::optional<std::string> FileHasher::Md5Hex(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        std::cerr << "[FileHasher] Cannot open " << path << std::endl;
        return std::nullopt;
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        std::cerr << "[FileHasher] MD5 context initialization failed" << std::endl;
        return std::nullopt;
    }

    char buffer[64 * 1024];
    while (in.read(buffer, sizeof(buffer)) || in.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), buffer, static_cast<std::size_t>(in.gcount())) != 1) {
            std::cerr << "[FileHasher] Digest update failed for " << path << std::endl;
            return std::nullopt;
        }
    }
    if (in.bad()) {
        std::cerr << "[FileHasher] Read error on " << path << std::endl;
        return std::nullopt;
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &length) != 1) {
        std::cerr << "[FileHasher] Digest finalization failed for " << path << std::endl;
        return std::nullopt;
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return oss.str();
}

} // namespace tidyfile::infrastructure
