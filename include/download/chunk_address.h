#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "utils/config.h"

namespace chunkfetch {

/// What a complete chunk must look like. Zero / empty members are unchecked.
struct ChunkExpectation {
    uint64_t exact_size{0};
    uint64_t max_size{0};
    std::string sha256;

    // Empty string when `size` is acceptable, otherwise the reason it is not.
    std::string checkSize(uint64_t size) const;
    // Size and digest check of an in-memory chunk.
    std::string check(const std::string& bytes) const;
};

struct ChunkAddress {
    size_t index{0};          // 0-based
    std::string remote_url;   // {base_url}/{prefix}{NN}
    std::string file_name;    // {prefix}{NN}
    std::string local_path;   // {download_dir}/{prefix}{NN}
    ChunkExpectation expect;
};

/// Derives remote part URLs and local part paths from a DownloadConfig.
/// Part numbers in names are 1-based and zero-padded to two digits (part01..part07).
class ChunkAddressBuilder {
public:
    explicit ChunkAddressBuilder(const DownloadConfig& cfg);

    static std::string chunkFileName(const std::string& prefix, size_t index);

    ChunkAddress address(size_t index) const;
    std::vector<ChunkAddress> all() const;

    std::string finalArtifactPath() const;
    size_t totalChunks() const { return total_chunks_; }

private:
    std::string base_url_;
    std::string prefix_;
    std::string download_dir_;
    std::string file_name_;
    size_t total_chunks_;
    size_t chunk_size_;
    uint64_t expected_total_bytes_;
    std::vector<std::string> chunk_sha256_;
};

}  // namespace chunkfetch
