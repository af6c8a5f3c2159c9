#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <vector>

#include "download/chunk_address.h"
#include "download/download_error.h"
#include "utils/config.h"

namespace chunkfetch {

/// Chunk files in the durable download directory. Presence of a valid chunk file is the
/// only resume state; there is no manifest or journal.
///
/// write() stages bytes in "<chunk>.partial" and renames it into place, so a chunk file is
/// either absent or complete. Calls for different indices share no mutable state.
class LocalChunkStore {
public:
    explicit LocalChunkStore(const DownloadConfig& cfg);

    size_t totalChunks() const { return addresses_.size(); }
    const ChunkAddress& address(size_t index) const { return addresses_.at(index); }
    const std::vector<ChunkAddress>& addresses() const { return addresses_; }

    /// True iff the chunk file exists at its deterministic path.
    bool exists(size_t index) const;

    /// Indices whose chunk file is present and valid. Unreadable or invalid files
    /// are logged and reported as missing. Leftover ".partial" files are removed.
    std::set<size_t> scanExisting() const;

    DownloadResult<void> write(size_t index, const std::string& bytes) const;
    DownloadResult<std::string> read(size_t index) const;

    /// Delete chunk files (after a successful assembly). Returns how many were removed.
    size_t removeChunks() const;

    bool finalArtifactExists() const;
    const std::string& finalArtifactPath() const { return final_path_; }
    const std::string& directory() const { return dir_; }

    DownloadResult<void> ensureDirectory() const;

private:
    bool isValidOnDisk(const ChunkAddress& addr) const;

    std::string dir_;
    std::string final_path_;
    std::vector<ChunkAddress> addresses_;
};

}  // namespace chunkfetch
