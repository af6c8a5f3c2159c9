#pragma once

#include <atomic>
#include <chrono>
#include <string>

#include "download/chunk_address.h"
#include "download/chunk_transport.h"
#include "download/download_error.h"
#include "download/retry_policy.h"

namespace chunkfetch {

/// Fetches one chunk with a per-attempt timeout and a bounded retry loop.
/// Success is exactly HTTP 200 with a non-empty body that satisfies the chunk expectation.
class ChunkFetcher {
public:
    explicit ChunkFetcher(ChunkTransport& transport,
                          std::chrono::milliseconds backoff_step = std::chrono::seconds(2),
                          SleepFn sleep = sleepFor);

    // Returns the chunk bytes, ServerError after the attempt budget is exhausted (carrying the
    // last attempt's failure), InvalidUrl for an unparsable URL, or Cancelled when `cancelled`
    // is raised between attempts.
    DownloadResult<std::string> fetch(const std::string& url,
                                      int attempt_budget,
                                      std::chrono::milliseconds per_attempt_timeout,
                                      const ChunkExpectation& expect = {},
                                      const std::atomic<bool>* cancelled = nullptr) const;

private:
    ChunkTransport& transport_;
    std::chrono::milliseconds backoff_step_;
    SleepFn sleep_;
};

}  // namespace chunkfetch
