#pragma once

#include <string>
#include <filesystem>
#include <array>
#include <openssl/sha.h>
#include <fstream>

namespace chunkfetch {

inline std::string sha256_hex(const unsigned char* digest, size_t len) {
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(hex[(digest[i] >> 4) & 0x0F]);
        out.push_back(hex[digest[i] & 0x0F]);
    }
    return out;
}

// Incremental digest for data that arrives in pieces (e.g. assembly).
// finalize() returns an empty string if OpenSSL reported a failure.
class StreamingSha256 {
public:
    StreamingSha256() { ok_ = SHA256_Init(&ctx_) == 1; }

    void update(const char* data, size_t len) {
        if (!ok_ || len == 0) return;
        ok_ = SHA256_Update(&ctx_, data, len) == 1;
    }

    std::string finalize() {
        if (!ok_) return "";
        std::array<unsigned char, SHA256_DIGEST_LENGTH> hash{};
        if (SHA256_Final(hash.data(), &ctx_) != 1) return "";
        return sha256_hex(hash.data(), hash.size());
    }

private:
    SHA256_CTX ctx_;
    bool ok_{false};
};

inline std::string sha256_text(const std::string& text) {
    StreamingSha256 sha;
    sha.update(text.data(), text.size());
    return sha.finalize();
}

inline std::string sha256_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return "";
    StreamingSha256 sha;
    std::array<char, 8192> buf{};
    while (file) {
        file.read(buf.data(), buf.size());
        std::streamsize n = file.gcount();
        if (n > 0) sha.update(buf.data(), static_cast<size_t>(n));
    }
    if (file.bad()) return "";
    return sha.finalize();
}

}  // namespace chunkfetch
