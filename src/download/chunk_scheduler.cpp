#include "download/chunk_scheduler.h"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <spdlog/spdlog.h>

namespace chunkfetch {

namespace {

struct Completion {
    size_t index{0};
    DownloadResult<std::string> result;
};

// Joins any fetch thread still running when run() unwinds early.
class WorkerJoiner {
public:
    explicit WorkerJoiner(std::map<size_t, std::thread>& workers) : workers_(workers) {}
    ~WorkerJoiner() {
        for (auto& entry : workers_) {
            if (entry.second.joinable()) entry.second.join();
        }
    }

private:
    std::map<size_t, std::thread>& workers_;
};

}  // namespace

ChunkScheduler::ChunkScheduler(const ChunkFetcher& fetcher, const LocalChunkStore& store, SchedulerOptions options)
    : fetcher_(fetcher), store_(store), options_(options) {
    options_.max_concurrency = std::max<size_t>(1, options_.max_concurrency);
}

DownloadResult<std::vector<size_t>> ChunkScheduler::run(const std::atomic<bool>& cancelled,
                                                        const SchedulerCallbacks& callbacks) {
    using R = DownloadResult<std::vector<size_t>>;
    const size_t total = store_.totalChunks();
    peak_in_flight_ = 0;

    // Init
    const std::set<size_t> existing = store_.scanExisting();
    if (callbacks.on_scan) callbacks.on_scan(existing);

    std::vector<size_t> missing;
    for (size_t i = 0; i < total; ++i) {
        if (existing.count(i) == 0) missing.push_back(i);
    }
    std::vector<bool> on_disk(total, false);
    for (auto index : existing) on_disk[index] = true;
    size_t completed = existing.size();

    if (!missing.empty()) {
        spdlog::info("ChunkScheduler: {} of {} chunks to fetch (concurrency {})", missing.size(), total,
                     options_.max_concurrency);

        auto dir = store_.ensureDirectory();
        if (!dir.ok()) {
            return R::failure(dir.error, dir.error_message);
        }
    }

    // Draining
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<Completion> done;
    std::map<size_t, std::thread> workers;
    WorkerJoiner joiner(workers);
    size_t next = 0;
    size_t in_flight = 0;
    std::optional<DownloadResult<void>> first_failure;

    auto launch = [&](size_t index) {
        const ChunkAddress& addr = store_.address(index);
        if (callbacks.on_fetch_started) callbacks.on_fetch_started(index);
        ++in_flight;
        peak_in_flight_ = std::max(peak_in_flight_, in_flight);
        workers.emplace(index, std::thread([&, addr]() {
            DownloadResult<std::string> result;
            try {
                result = fetcher_.fetch(addr.remote_url, options_.max_attempts, options_.attempt_timeout,
                                        addr.expect, &cancelled);
            } catch (const std::exception& e) {
                result = DownloadResult<std::string>::failure(DownloadErrorCode::ServerError, e.what());
            }
            {
                std::lock_guard<std::mutex> lock(mutex);
                done.push_back(Completion{addr.index, std::move(result)});
            }
            cv.notify_one();
        }));
    };

    auto can_schedule = [&]() {
        return !first_failure && !cancelled.load() && next < missing.size();
    };

    while (can_schedule() && in_flight < options_.max_concurrency) {
        launch(missing[next++]);
    }

    while (in_flight > 0) {
        Completion c;
        {
            std::unique_lock<std::mutex> lock(mutex);
            cv.wait(lock, [&]() { return !done.empty(); });
            c = std::move(done.front());
            done.pop_front();
        }
        --in_flight;
        auto worker = workers.find(c.index);
        if (worker != workers.end()) {
            worker->second.join();
            workers.erase(worker);
        }

        if (c.result.ok()) {
            auto written = store_.write(c.index, *c.result.data);
            if (written.ok()) {
                on_disk[c.index] = true;
                ++completed;
                spdlog::info("ChunkScheduler: chunk {}/{} stored ({})", completed, total,
                             store_.address(c.index).file_name);
                if (callbacks.on_chunk_stored) callbacks.on_chunk_stored(c.index, completed, total);
            } else {
                spdlog::error("ChunkScheduler: {}", written.error_message);
                if (!first_failure) first_failure = written;
            }
        } else if (!first_failure) {
            spdlog::error("ChunkScheduler: chunk {} failed: {}", store_.address(c.index).file_name,
                          c.result.error_message);
            first_failure = DownloadResult<void>::failure(c.result.error, c.result.error_message);
        }

        while (can_schedule() && in_flight < options_.max_concurrency) {
            launch(missing[next++]);
        }
    }

    if (first_failure && first_failure->error != DownloadErrorCode::Cancelled) {
        return R::failure(first_failure->error, first_failure->error_message);
    }
    if (completed < total) {
        if (cancelled.load() || first_failure) {
            spdlog::info("ChunkScheduler: cancelled with {}/{} chunks on disk", completed, total);
            return R::failure(DownloadErrorCode::Cancelled, "download cancelled");
        }
        return R::failure(DownloadErrorCode::AssemblyError,
                          "scheduler finished with " + std::to_string(completed) + "/" + std::to_string(total) +
                              " chunks");
    }

    // Complete
    std::vector<size_t> ready;
    ready.reserve(total);
    for (size_t i = 0; i < total; ++i) {
        if (!on_disk[i]) {
            return R::failure(DownloadErrorCode::AssemblyError, "chunk " + std::to_string(i) + " not on disk");
        }
        ready.push_back(i);
    }
    return R::success(std::move(ready));
}

}  // namespace chunkfetch
