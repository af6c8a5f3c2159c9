#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "download/chunk_store.h"
#include "download/download_error.h"

namespace chunkfetch {

/// Concatenates chunk files in ascending index order into the final artifact.
/// The artifact is built under "<final>.assembling" and renamed into place only after
/// every chunk was appended and the result validated; a failed assembly leaves no final file.
class Assembler {
public:
    Assembler(const LocalChunkStore& store, uint64_t expected_total_bytes = 0, std::string expected_sha256 = "");

    DownloadResult<std::string> assemble(const std::vector<size_t>& chunk_indices) const;

    /// Bytes written by the last successful assemble().
    uint64_t lastAssembledBytes() const { return last_bytes_; }

private:
    const LocalChunkStore& store_;
    uint64_t expected_total_bytes_;
    std::string expected_sha256_;
    mutable uint64_t last_bytes_{0};
};

}  // namespace chunkfetch
