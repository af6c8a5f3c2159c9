#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "download/chunk_fetcher.h"
#include "download/chunk_store.h"
#include "download/chunk_transport.h"
#include "download/download_error.h"
#include "download/download_session.h"
#include "utils/config.h"

namespace chunkfetch {

/// Receives a snapshot on every phase or progress change.
using ProgressListener = std::function<void(const DownloadSession& snapshot)>;

/// Entry point for consumers: makes sure the final artifact exists, resuming from chunk
/// files left by earlier runs, and reports progress while it works.
class ModelDownloadCoordinator {
public:
    /// Uses the cpp-httplib transport.
    explicit ModelDownloadCoordinator(DownloadConfig config);

    /// Injected transport (must outlive the coordinator) and sleep function for retry backoff.
    ModelDownloadCoordinator(DownloadConfig config, ChunkTransport& transport, SleepFn sleep = sleepFor);

    ModelDownloadCoordinator(const ModelDownloadCoordinator&) = delete;
    ModelDownloadCoordinator& operator=(const ModelDownloadCoordinator&) = delete;

    /// Returns the final artifact path. If it already exists no network access happens.
    /// Otherwise missing chunks are fetched, all chunks assembled, and the path returned,
    /// or the first fatal error. Safe to call again after a failure; completed chunks are kept.
    DownloadResult<std::string> ensureModelAvailable();

    /// Runs ensureModelAvailable() on a background thread.
    std::future<DownloadResult<std::string>> ensureModelAvailableAsync();

    /// Snapshot of the current (or last) session.
    DownloadSession currentProgress() const;

    /// Stop scheduling new chunk fetches. In-flight fetches finish; chunks on disk are kept.
    /// The request stays pending until the current (or next) session ends.
    void cancel();

    /// Whether the final artifact is present. No network access.
    bool isModelAvailable() const;
    std::optional<std::string> modelPath() const;

    size_t subscribe(ProgressListener listener);
    void unsubscribe(size_t id);

    const DownloadConfig& config() const { return config_; }

private:
    DownloadResult<std::string> runSession();
    DownloadResult<std::string> finish(DownloadResult<std::string> result);
    void update(const std::function<void(DownloadSession&)>& mutate);

    DownloadConfig config_;
    std::unique_ptr<ChunkTransport> owned_transport_;
    ChunkTransport& transport_;
    ChunkFetcher fetcher_;
    LocalChunkStore store_;

    std::atomic<bool> cancelled_{false};
    std::mutex run_mutex_;

    mutable std::mutex session_mutex_;
    DownloadSession session_;

    std::mutex listeners_mutex_;
    std::map<size_t, ProgressListener> listeners_;
    size_t next_listener_id_{1};
};

}  // namespace chunkfetch
