#include "fingerprint.hpp"
#include <openssl/sha.h>
#include <iomanip>
#include <sstream>

std::string sha256_hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_CTX ctx;
    SHA256_Init(&ctx);
    SHA256_Update(&ctx, data.data(), data.size());
    SHA256_Final(hash, &ctx);
    std::ostringstream ss;
    for (unsigned char c : hash) ss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return ss.str();
}

std::string short_fingerprint(const std::string& a, const std::string& b, size_t len) {
    std::string joined = a;
    joined.push_back('\0');
    joined += b;
    return sha256_hex(joined).substr(0, len);
}
