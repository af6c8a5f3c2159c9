#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "download/download_error.h"

namespace chunkfetch {

/// Static description of one chunked artifact and how to fetch it.
struct DownloadConfig {
    std::string base_url;
    std::string file_name;     // final artifact name (e.g. qwen3-1.7b-q4_0.gguf)
    std::string chunk_prefix;  // remote/local part name prefix (e.g. qwen3-1.7b-q4_0.part)
    size_t total_chunks{1};
    size_t chunk_size{0};      // nominal size of every chunk but the last
    std::string download_dir;

    size_t max_concurrency{3};
    int max_attempts{3};
    std::chrono::milliseconds attempt_timeout{60000};
    std::chrono::milliseconds backoff_step{2000};
    bool cleanup_chunks{true};

    // Optional integrity data. chunk_sha256 is either empty or one digest per chunk.
    std::vector<std::string> chunk_sha256;
    std::string artifact_sha256;
    uint64_t expected_total_bytes{0};
};

/// Compiled-in configuration for the bundled Qwen3 1.7B artifact.
DownloadConfig defaultDownloadConfig();

/// Default durable directory (~/.chunkfetch/models).
std::string defaultDownloadDir();

DownloadConfig loadDownloadConfig();
// Defaults, then JSON file (CHUNKFETCH_CONFIG or ~/.chunkfetch/config.json), then CHUNKFETCH_* env.
// The second member describes which sources were applied.
std::pair<DownloadConfig, std::string> loadDownloadConfigWithLog();

/// Reject malformed configuration before any network or disk access.
DownloadResult<void> validateDownloadConfig(const DownloadConfig& cfg);

}  // namespace chunkfetch
