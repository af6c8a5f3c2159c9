#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <set>
#include <vector>

#include "download/chunk_fetcher.h"
#include "download/chunk_store.h"
#include "download/download_error.h"

namespace chunkfetch {

struct SchedulerOptions {
    size_t max_concurrency{3};
    int max_attempts{3};
    std::chrono::milliseconds attempt_timeout{60000};
};

/// Hooks invoked from the thread that called run(), never from fetch workers.
struct SchedulerCallbacks {
    std::function<void(const std::set<size_t>& existing)> on_scan;
    std::function<void(size_t index)> on_fetch_started;
    std::function<void(size_t index, size_t completed, size_t total)> on_chunk_stored;
};

/// Drives at most `max_concurrency` chunk fetches at a time over the chunks missing from the
/// store, writing each chunk as it arrives. Completions are handled one at a time on the
/// calling thread, so per-chunk bookkeeping needs no locking.
class ChunkScheduler {
public:
    ChunkScheduler(const ChunkFetcher& fetcher, const LocalChunkStore& store, SchedulerOptions options);

    // On success returns all chunk indices in assembly order (0..N-1).
    // The first terminal failure stops scheduling; fetches already in flight are
    // allowed to finish and successful ones are still written for a later resume.
    DownloadResult<std::vector<size_t>> run(const std::atomic<bool>& cancelled,
                                            const SchedulerCallbacks& callbacks = {});

    /// Highest number of simultaneous fetches seen by the last run().
    size_t peakInFlight() const { return peak_in_flight_; }

private:
    const ChunkFetcher& fetcher_;
    const LocalChunkStore& store_;
    SchedulerOptions options_;
    size_t peak_in_flight_{0};
};

}  // namespace chunkfetch
