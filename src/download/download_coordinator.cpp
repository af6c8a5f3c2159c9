#include "download/download_coordinator.h"

#include <filesystem>
#include <spdlog/spdlog.h>
#include <utility>
#include <vector>

#include "download/assembler.h"
#include "download/chunk_scheduler.h"
#include "utils/file_lock.h"

namespace chunkfetch {

ModelDownloadCoordinator::ModelDownloadCoordinator(DownloadConfig config)
    : config_(std::move(config)),
      owned_transport_(makeHttpChunkTransport()),
      transport_(*owned_transport_),
      fetcher_(transport_, config_.backoff_step),
      store_(config_),
      session_(DownloadSession::begin(config_, store_.addresses())) {}

ModelDownloadCoordinator::ModelDownloadCoordinator(DownloadConfig config, ChunkTransport& transport, SleepFn sleep)
    : config_(std::move(config)),
      transport_(transport),
      fetcher_(transport_, config_.backoff_step, std::move(sleep)),
      store_(config_),
      session_(DownloadSession::begin(config_, store_.addresses())) {}

bool ModelDownloadCoordinator::isModelAvailable() const {
    return store_.finalArtifactExists();
}

std::optional<std::string> ModelDownloadCoordinator::modelPath() const {
    if (!store_.finalArtifactExists()) return std::nullopt;
    return store_.finalArtifactPath();
}

DownloadSession ModelDownloadCoordinator::currentProgress() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return session_;
}

void ModelDownloadCoordinator::cancel() {
    if (!cancelled_.exchange(true)) {
        spdlog::info("ModelDownloadCoordinator: cancel requested");
    }
}

size_t ModelDownloadCoordinator::subscribe(ProgressListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    const size_t id = next_listener_id_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void ModelDownloadCoordinator::unsubscribe(size_t id) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.erase(id);
}

void ModelDownloadCoordinator::update(const std::function<void(DownloadSession&)>& mutate) {
    DownloadSession snapshot;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        mutate(session_);
        snapshot = session_;
    }
    std::vector<ProgressListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        for (const auto& entry : listeners_) listeners.push_back(entry.second);
    }
    for (const auto& listener : listeners) {
        try {
            listener(snapshot);
        } catch (const std::exception& e) {
            spdlog::warn("ModelDownloadCoordinator: progress listener threw: {}", e.what());
        }
    }
}

std::future<DownloadResult<std::string>> ModelDownloadCoordinator::ensureModelAvailableAsync() {
    return std::async(std::launch::async, [this]() { return ensureModelAvailable(); });
}

DownloadResult<std::string> ModelDownloadCoordinator::ensureModelAvailable() {
    std::unique_lock<std::mutex> run_lock(run_mutex_, std::try_to_lock);
    if (!run_lock.owns_lock()) {
        return DownloadResult<std::string>::failure(DownloadErrorCode::Busy, "a download session is already running");
    }
    update([&](DownloadSession& s) { s = DownloadSession::begin(config_, store_.addresses()); });
    auto result = finish(runSession());
    // cleared at the end so a cancel() racing the async start is not lost
    cancelled_.store(false);
    return result;
}

DownloadResult<std::string> ModelDownloadCoordinator::finish(DownloadResult<std::string> result) {
    if (!result.ok()) {
        spdlog::error("ModelDownloadCoordinator: {} ({})", result.error_message, to_string(result.error));
        update([&](DownloadSession& s) { s.fail(result.error, result.error_message); });
    }
    return result;
}

DownloadResult<std::string> ModelDownloadCoordinator::runSession() {
    using R = DownloadResult<std::string>;

    auto valid = validateDownloadConfig(config_);
    if (!valid.ok()) {
        return R::failure(valid.error, valid.error_message);
    }

    if (store_.finalArtifactExists()) {
        spdlog::info("ModelDownloadCoordinator: {} already available", store_.finalArtifactPath());
        update([](DownloadSession& s) { s.setPhase(DownloadPhase::AlreadyAvailable, "model already installed"); });
        return R::success(store_.finalArtifactPath());
    }

    auto dir = store_.ensureDirectory();
    if (!dir.ok()) {
        return R::failure(dir.error, dir.error_message);
    }

    FileLock session_lock(std::filesystem::path(store_.directory()) / (config_.file_name + ".lock"));
    if (!session_lock.locked()) {
        return R::failure(DownloadErrorCode::Busy,
                          "another process is downloading " + config_.file_name + " (" +
                              session_lock.path().string() + ")");
    }
    // another process may have finished while we waited for the lock
    if (store_.finalArtifactExists()) {
        update([](DownloadSession& s) { s.setPhase(DownloadPhase::AlreadyAvailable, "model already installed"); });
        return R::success(store_.finalArtifactPath());
    }

    spdlog::info("ModelDownloadCoordinator: downloading {} as {} chunks from {}", config_.file_name,
                 config_.total_chunks, config_.base_url);
    update([](DownloadSession& s) { s.setPhase(DownloadPhase::Checking, "checking existing chunks"); });

    SchedulerOptions options;
    options.max_concurrency = config_.max_concurrency;
    options.max_attempts = config_.max_attempts;
    options.attempt_timeout = config_.attempt_timeout;
    ChunkScheduler scheduler(fetcher_, store_, options);

    SchedulerCallbacks callbacks;
    callbacks.on_scan = [this](const std::set<size_t>& existing) {
        update([&](DownloadSession& s) {
            s.markExisting(existing);
            s.setPhase(DownloadPhase::Downloading, "existing chunks: " + std::to_string(s.completed_count) + "/" +
                                                       std::to_string(s.totalChunks()));
        });
    };
    callbacks.on_fetch_started = [this](size_t index) {
        update([&](DownloadSession& s) { s.markPending(index); });
    };
    callbacks.on_chunk_stored = [this](size_t index, size_t completed, size_t total) {
        update([&](DownloadSession& s) {
            s.markStored(index);
            s.status_message = "chunk " + std::to_string(completed) + "/" + std::to_string(total) + " downloaded";
        });
    };

    auto ready = scheduler.run(cancelled_, callbacks);
    if (!ready.ok()) {
        return R::failure(ready.error, ready.error_message);
    }

    update([](DownloadSession& s) { s.setPhase(DownloadPhase::Assembling, "assembling chunks"); });
    Assembler assembler(store_, config_.expected_total_bytes, config_.artifact_sha256);
    auto assembled = assembler.assemble(*ready.data);
    if (!assembled.ok()) {
        return assembled;
    }

    if (config_.cleanup_chunks) {
        const size_t removed = store_.removeChunks();
        spdlog::info("ModelDownloadCoordinator: removed {} chunk files", removed);
    }

    update([](DownloadSession& s) { s.setPhase(DownloadPhase::Complete, "download complete"); });
    return assembled;
}

}  // namespace chunkfetch
