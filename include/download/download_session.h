#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <vector>

#include "download/chunk_address.h"
#include "download/download_error.h"
#include "utils/config.h"

namespace chunkfetch {

enum class ChunkPresence {
    Missing,
    OnDisk,
    InMemoryPending,  // fetched, not yet flushed to disk
};

enum class DownloadPhase {
    Idle,
    Checking,
    Downloading,
    Assembling,
    Complete,
    AlreadyAvailable,
    Failed,
    Cancelled,
};

struct ChunkRecord {
    size_t index{0};
    std::string remote_url;
    std::string local_path;
    ChunkPresence presence{ChunkPresence::Missing};
};

/// State of one ensureModelAvailable() run. Copies handed to observers are snapshots.
struct DownloadSession {
    DownloadConfig config;
    DownloadPhase phase{DownloadPhase::Idle};
    std::vector<ChunkRecord> chunks;
    size_t completed_count{0};
    double progress{0.0};
    std::string status_message;
    DownloadErrorCode error{DownloadErrorCode::Ok};

    static DownloadSession begin(const DownloadConfig& config, const std::vector<ChunkAddress>& addresses);

    size_t totalChunks() const { return chunks.size(); }

    /// Mark indices found on disk at start.
    void markExisting(const std::set<size_t>& existing);
    void markPending(size_t index);
    /// Mark a freshly written chunk and advance progress (never decreases).
    void markStored(size_t index);

    void setPhase(DownloadPhase next, std::string message);
    void fail(DownloadErrorCode code, const std::string& reason);

    bool isDownloading() const {
        return phase == DownloadPhase::Checking || phase == DownloadPhase::Downloading ||
               phase == DownloadPhase::Assembling;
    }
    bool isFinished() const {
        return phase == DownloadPhase::Complete || phase == DownloadPhase::AlreadyAvailable ||
               phase == DownloadPhase::Failed || phase == DownloadPhase::Cancelled;
    }

    static std::string phaseToString(DownloadPhase phase);

private:
    void recomputeProgress();
};

}  // namespace chunkfetch
