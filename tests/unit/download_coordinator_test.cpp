#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "download/download_coordinator.h"
#include "test_support.h"
#include "utils/file_lock.h"
#include "utils/sha256.h"

using namespace chunkfetch;
using namespace chunkfetch::test;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

std::string partUrl(size_t number) {
    return "http://chunks.test/models/" + ChunkAddressBuilder::chunkFileName("model.part", number - 1);
}

std::string partBody(size_t number) {
    return std::string(10, static_cast<char>('a' + number - 1));
}

void serveAll(FakeTransport& transport, size_t chunks) {
    for (size_t n = 1; n <= chunks; ++n) transport.serve(partUrl(n), partBody(n));
}

std::string expectedArtifact(size_t chunks) {
    std::string out;
    for (size_t n = 1; n <= chunks; ++n) out += partBody(n);
    return out;
}

// Collects progress values seen by a listener.
class ProgressRecorder {
public:
    ProgressListener listener() {
        return [this](const DownloadSession& s) {
            std::lock_guard<std::mutex> lock(mutex_);
            progress_.push_back(s.progress);
            phases_.push_back(s.phase);
        };
    }
    std::vector<double> progress() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return progress_;
    }
    std::vector<DownloadPhase> phases() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return phases_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<double> progress_;
    std::vector<DownloadPhase> phases_;
};

}  // namespace

TEST(ModelDownloadCoordinatorTest, DownloadsAssemblesAndCleansUp) {
    TempDir tmp("coordinator");
    auto cfg = makeTestConfig(tmp.path, 4);
    cfg.expected_total_bytes = 40;
    cfg.artifact_sha256 = sha256_text(expectedArtifact(4));

    FakeTransport transport;
    serveAll(transport, 4);
    RecordingSleeper sleeper;
    ModelDownloadCoordinator coordinator(cfg, transport, sleeper.fn());
    EXPECT_FALSE(coordinator.isModelAvailable());
    EXPECT_FALSE(coordinator.modelPath().has_value());

    auto res = coordinator.ensureModelAvailable();
    ASSERT_TRUE(res.ok()) << res.error_message;
    EXPECT_EQ(fs::path(*res.data), tmp.path / "model.gguf");
    EXPECT_EQ(readFile(*res.data), expectedArtifact(4));
    EXPECT_EQ(transport.totalCalls(), 4);

    for (size_t n = 1; n <= 4; ++n) {
        EXPECT_FALSE(fs::exists(tmp.path / ChunkAddressBuilder::chunkFileName("model.part", n - 1)));
    }
    EXPECT_FALSE(fs::exists(tmp.path / "model.gguf.assembling"));

    auto snapshot = coordinator.currentProgress();
    EXPECT_EQ(snapshot.phase, DownloadPhase::Complete);
    EXPECT_DOUBLE_EQ(snapshot.progress, 1.0);
    EXPECT_EQ(snapshot.status_message, "download complete");
    EXPECT_TRUE(coordinator.isModelAvailable());
    ASSERT_TRUE(coordinator.modelPath().has_value());
    EXPECT_EQ(*coordinator.modelPath(), *res.data);
}

TEST(ModelDownloadCoordinatorTest, ExistingArtifactSkipsNetwork) {
    TempDir tmp("coordinator");
    auto cfg = makeTestConfig(tmp.path, 3);
    writeFile(tmp.path / "model.gguf", "already here");

    FakeTransport transport;
    serveAll(transport, 3);
    ModelDownloadCoordinator coordinator(cfg, transport);

    auto res = coordinator.ensureModelAvailable();
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(transport.totalCalls(), 0);
    EXPECT_EQ(readFile(*res.data), "already here");

    auto snapshot = coordinator.currentProgress();
    EXPECT_EQ(snapshot.phase, DownloadPhase::AlreadyAvailable);
    EXPECT_DOUBLE_EQ(snapshot.progress, 1.0);
    EXPECT_EQ(snapshot.status_message, "model already installed");
}

TEST(ModelDownloadCoordinatorTest, ResumesFromChunksOnDisk) {
    TempDir tmp("coordinator");
    auto cfg = makeTestConfig(tmp.path, 5);
    writeFile(tmp.path / "model.part01", partBody(1));
    writeFile(tmp.path / "model.part04", partBody(4));

    FakeTransport transport;
    serveAll(transport, 5);
    ModelDownloadCoordinator coordinator(cfg, transport);

    auto res = coordinator.ensureModelAvailable();
    ASSERT_TRUE(res.ok()) << res.error_message;
    EXPECT_EQ(transport.calls(partUrl(1)), 0);
    EXPECT_EQ(transport.calls(partUrl(4)), 0);
    EXPECT_EQ(transport.totalCalls(), 3);
    EXPECT_EQ(readFile(*res.data), expectedArtifact(5));
}

TEST(ModelDownloadCoordinatorTest, ProgressIsMonotonicAndEndsAtOne) {
    TempDir tmp("coordinator");
    auto cfg = makeTestConfig(tmp.path, 6);
    writeFile(tmp.path / "model.part02", partBody(2));

    FakeTransport transport;
    serveAll(transport, 6);
    transport.setDelay(5ms);
    ModelDownloadCoordinator coordinator(cfg, transport);
    ProgressRecorder recorder;
    coordinator.subscribe(recorder.listener());

    auto res = coordinator.ensureModelAvailable();
    ASSERT_TRUE(res.ok()) << res.error_message;

    auto progress = recorder.progress();
    ASSERT_FALSE(progress.empty());
    for (size_t i = 1; i < progress.size(); ++i) {
        EXPECT_GE(progress[i], progress[i - 1]) << "at update " << i;
    }
    EXPECT_DOUBLE_EQ(progress.back(), 1.0);

    auto phases = recorder.phases();
    EXPECT_NE(std::find(phases.begin(), phases.end(), DownloadPhase::Checking), phases.end());
    EXPECT_NE(std::find(phases.begin(), phases.end(), DownloadPhase::Assembling), phases.end());
    EXPECT_EQ(phases.back(), DownloadPhase::Complete);
}

TEST(ModelDownloadCoordinatorTest, UnsubscribedListenerStopsReceiving) {
    TempDir tmp("coordinator");
    auto cfg = makeTestConfig(tmp.path, 2);
    FakeTransport transport;
    serveAll(transport, 2);
    ModelDownloadCoordinator coordinator(cfg, transport);

    ProgressRecorder kept;
    ProgressRecorder dropped;
    coordinator.subscribe(kept.listener());
    const auto id = coordinator.subscribe(dropped.listener());
    coordinator.unsubscribe(id);
    // a throwing listener must not break the session
    coordinator.subscribe([](const DownloadSession&) { throw std::runtime_error("listener bug"); });

    ASSERT_TRUE(coordinator.ensureModelAvailable().ok());
    EXPECT_FALSE(kept.progress().empty());
    EXPECT_TRUE(dropped.progress().empty());
}

TEST(ModelDownloadCoordinatorTest, FailureKeepsChunksAndRetryResumes) {
    TempDir tmp("coordinator");
    auto cfg = makeTestConfig(tmp.path, 3);
    cfg.max_concurrency = 1;

    FakeTransport transport;
    transport.serve(partUrl(1), partBody(1));
    transport.handle(partUrl(2), [](int) { return TransportResponse{503, "", ""}; });
    transport.serve(partUrl(3), partBody(3));
    RecordingSleeper sleeper;
    ModelDownloadCoordinator coordinator(cfg, transport, sleeper.fn());

    auto res = coordinator.ensureModelAvailable();
    EXPECT_EQ(res.error, DownloadErrorCode::ServerError);
    EXPECT_EQ(transport.calls(partUrl(2)), 3);
    EXPECT_FALSE(fs::exists(tmp.path / "model.gguf"));
    EXPECT_TRUE(fs::exists(tmp.path / "model.part01"));

    auto failed = coordinator.currentProgress();
    EXPECT_EQ(failed.phase, DownloadPhase::Failed);
    EXPECT_EQ(failed.error, DownloadErrorCode::ServerError);
    EXPECT_EQ(failed.status_message.rfind("failed: ", 0), 0u);

    transport.serve(partUrl(2), partBody(2));
    res = coordinator.ensureModelAvailable();
    ASSERT_TRUE(res.ok()) << res.error_message;
    EXPECT_EQ(transport.calls(partUrl(1)), 1);
    EXPECT_EQ(transport.calls(partUrl(2)), 4);
    EXPECT_EQ(readFile(*res.data), expectedArtifact(3));
}

TEST(ModelDownloadCoordinatorTest, InvalidBaseUrlFailsWithoutNetwork) {
    TempDir tmp("coordinator");
    auto cfg = makeTestConfig(tmp.path, 2);
    cfg.base_url = "::not-a-url::";

    FakeTransport transport;
    ModelDownloadCoordinator coordinator(cfg, transport);
    auto res = coordinator.ensureModelAvailable();
    EXPECT_EQ(res.error, DownloadErrorCode::InvalidUrl);
    EXPECT_EQ(transport.totalCalls(), 0);
    EXPECT_EQ(coordinator.currentProgress().phase, DownloadPhase::Failed);
}

TEST(ModelDownloadCoordinatorTest, KeepsChunksWhenCleanupDisabled) {
    TempDir tmp("coordinator");
    auto cfg = makeTestConfig(tmp.path, 2);
    cfg.cleanup_chunks = false;

    FakeTransport transport;
    serveAll(transport, 2);
    ModelDownloadCoordinator coordinator(cfg, transport);
    ASSERT_TRUE(coordinator.ensureModelAvailable().ok());
    EXPECT_TRUE(fs::exists(tmp.path / "model.part01"));
    EXPECT_TRUE(fs::exists(tmp.path / "model.part02"));
}

TEST(ModelDownloadCoordinatorTest, CancelStopsAndNextCallResumes) {
    TempDir tmp("coordinator");
    auto cfg = makeTestConfig(tmp.path, 4);
    cfg.max_concurrency = 1;

    FakeTransport transport;
    serveAll(transport, 4);
    ModelDownloadCoordinator coordinator(cfg, transport);
    bool cancel_once = true;
    coordinator.subscribe([&](const DownloadSession& s) {
        if (cancel_once && s.completed_count == 1) {
            cancel_once = false;
            coordinator.cancel();
        }
    });

    auto res = coordinator.ensureModelAvailable();
    EXPECT_EQ(res.error, DownloadErrorCode::Cancelled);
    EXPECT_EQ(coordinator.currentProgress().phase, DownloadPhase::Cancelled);
    EXPECT_EQ(coordinator.currentProgress().status_message, "cancelled");
    EXPECT_TRUE(fs::exists(tmp.path / "model.part01"));
    EXPECT_FALSE(fs::exists(tmp.path / "model.gguf"));
    const int calls_before = transport.totalCalls();
    EXPECT_LT(calls_before, 4);

    res = coordinator.ensureModelAvailable();
    ASSERT_TRUE(res.ok()) << res.error_message;
    EXPECT_EQ(transport.totalCalls(), 4);
    EXPECT_EQ(readFile(*res.data), expectedArtifact(4));
}

TEST(ModelDownloadCoordinatorTest, CancelRightAfterAsyncStartIsHonoured) {
    for (int round = 0; round < 20; ++round) {
        TempDir tmp("coordinator");
        auto cfg = makeTestConfig(tmp.path, 4);
        cfg.max_concurrency = 1;

        FakeTransport transport;
        serveAll(transport, 4);
        transport.setDelay(5ms);
        ModelDownloadCoordinator coordinator(cfg, transport);

        auto pending = coordinator.ensureModelAvailableAsync();
        coordinator.cancel();
        auto res = pending.get();
        EXPECT_EQ(res.error, DownloadErrorCode::Cancelled) << "round " << round;
        EXPECT_LE(transport.totalCalls(), 1);
        EXPECT_FALSE(fs::exists(tmp.path / "model.gguf"));

        // the request was consumed by that session
        auto again = coordinator.ensureModelAvailable();
        ASSERT_TRUE(again.ok()) << again.error_message;
    }
}

TEST(ModelDownloadCoordinatorTest, ConcurrentCallReportsBusy) {
    TempDir tmp("coordinator");
    auto cfg = makeTestConfig(tmp.path, 2);

    FakeTransport transport;
    serveAll(transport, 2);
    transport.setDelay(300ms);
    ModelDownloadCoordinator coordinator(cfg, transport);

    auto first = coordinator.ensureModelAvailableAsync();
    // wait until the first session has started fetching
    for (int i = 0; i < 200 && transport.totalCalls() == 0; ++i) std::this_thread::sleep_for(5ms);
    auto second = coordinator.ensureModelAvailable();
    EXPECT_EQ(second.error, DownloadErrorCode::Busy);

    auto res = first.get();
    ASSERT_TRUE(res.ok()) << res.error_message;
    EXPECT_EQ(transport.totalCalls(), 2);
}

TEST(ModelDownloadCoordinatorTest, LockHeldByAnotherProcessReportsBusy) {
    TempDir tmp("coordinator");
    auto cfg = makeTestConfig(tmp.path, 2);
    FileLock held(tmp.path / "model.gguf.lock");
    ASSERT_TRUE(held.locked());

    FakeTransport transport;
    serveAll(transport, 2);
    ModelDownloadCoordinator coordinator(cfg, transport);
    auto res = coordinator.ensureModelAvailable();
    EXPECT_EQ(res.error, DownloadErrorCode::Busy);
    EXPECT_EQ(transport.totalCalls(), 0);
}
