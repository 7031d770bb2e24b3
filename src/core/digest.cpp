#include "core/digest.hpp"

#include <openssl/evp.h>

#include <format>
#include <stdexcept>

namespace sentinel {

std::string sha256_hex(std::string_view data) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    if (EVP_Digest(data.data(), data.size(), hash, &hash_len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    std::string result;
    result.reserve(hash_len * 2);
    for (unsigned int i = 0; i < hash_len; ++i) {
        result += std::format("{:02x}", hash[i]);
    }
    return result;
}

} // namespace sentinel
