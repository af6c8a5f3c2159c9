#include "download/chunk_address.h"

#include <cstdio>
#include <filesystem>

#include "utils/http_url.h"
#include "utils/sha256.h"

namespace chunkfetch {

ChunkAddressBuilder::ChunkAddressBuilder(const DownloadConfig& cfg)
    : base_url_(trimTrailingSlash(cfg.base_url)),
      prefix_(cfg.chunk_prefix),
      download_dir_(cfg.download_dir),
      file_name_(cfg.file_name),
      total_chunks_(cfg.total_chunks),
      chunk_size_(cfg.chunk_size),
      expected_total_bytes_(cfg.expected_total_bytes),
      chunk_sha256_(cfg.chunk_sha256) {}

std::string ChunkExpectation::checkSize(uint64_t size) const {
    if (size == 0) {
        return "empty chunk";
    }
    if (exact_size != 0 && size != exact_size) {
        return "size " + std::to_string(size) + " != expected " + std::to_string(exact_size);
    }
    if (max_size != 0 && size > max_size) {
        return "size " + std::to_string(size) + " exceeds chunk size " + std::to_string(max_size);
    }
    return "";
}

std::string ChunkExpectation::check(const std::string& bytes) const {
    auto reason = checkSize(bytes.size());
    if (!reason.empty() || sha256.empty()) {
        return reason;
    }
    const auto actual = sha256_text(bytes);
    if (actual != sha256) {
        return "checksum mismatch (expected " + sha256 + ", got " + actual + ")";
    }
    return "";
}

std::string ChunkAddressBuilder::chunkFileName(const std::string& prefix, size_t index) {
    char number[24];
    std::snprintf(number, sizeof(number), "%02zu", index + 1);
    return prefix + number;
}

ChunkAddress ChunkAddressBuilder::address(size_t index) const {
    ChunkAddress addr;
    addr.index = index;
    addr.file_name = chunkFileName(prefix_, index);
    addr.remote_url = base_url_ + "/" + addr.file_name;
    addr.local_path = (std::filesystem::path(download_dir_) / addr.file_name).string();

    addr.expect.max_size = chunk_size_;
    if (chunk_size_ != 0 && expected_total_bytes_ != 0) {
        // every chunk but the last is full-sized; the last holds the remainder
        const uint64_t before = static_cast<uint64_t>(chunk_size_) * index;
        if (index + 1 < total_chunks_) {
            addr.expect.exact_size = chunk_size_;
        } else if (expected_total_bytes_ > before) {
            addr.expect.exact_size = expected_total_bytes_ - before;
        }
    }
    if (index < chunk_sha256_.size()) {
        addr.expect.sha256 = chunk_sha256_[index];
    }
    return addr;
}

std::vector<ChunkAddress> ChunkAddressBuilder::all() const {
    std::vector<ChunkAddress> out;
    out.reserve(total_chunks_);
    for (size_t i = 0; i < total_chunks_; ++i) {
        out.push_back(address(i));
    }
    return out;
}

std::string ChunkAddressBuilder::finalArtifactPath() const {
    return (std::filesystem::path(download_dir_) / file_name_).string();
}

}  // namespace chunkfetch
