#include "utils/config.h"
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <spdlog/spdlog.h>
#include "utils/file_lock.h"
#include "utils/http_url.h"

namespace chunkfetch {

namespace {

constexpr const char* kDefaultBaseUrl = "https://pub-c75ca8dacc774c2f908a6bc2b8730696.r2.dev";
constexpr const char* kDefaultFileName = "qwen3-1.7b-q4_0.gguf";
constexpr const char* kDefaultChunkPrefix = "qwen3-1.7b-q4_0.part";
constexpr size_t kDefaultTotalChunks = 7;  // 1016.8 MB / 160 MB
constexpr size_t kDefaultChunkSize = 160ull * 1024 * 1024;
constexpr const char* kDataDir = ".chunkfetch";

std::optional<std::string> getEnvValue(const char* name) {
    if (!name || !*name) {
        return std::nullopt;
    }
    if (const char* v = std::getenv(name)) {
        return std::string(v);
    }
    return std::nullopt;
}

std::filesystem::path homeDir() {
    if (auto home = getEnvValue("HOME")) {
        if (!home->empty()) return *home;
    }
    if (auto profile = getEnvValue("USERPROFILE")) {
        if (!profile->empty()) return *profile;
    }
    return std::filesystem::temp_directory_path();
}

std::filesystem::path defaultConfigPath() {
    return homeDir() / kDataDir / "config.json";
}

bool readJsonWithLock(const std::filesystem::path& path, nlohmann::json& out) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return false;
    FileLock lock(path);
    try {
        std::ifstream ifs(path);
        if (!ifs.is_open()) return false;
        ifs >> out;
        return true;
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Config: failed to parse {}: {}", path.string(), e.what());
        return false;
    }
}

bool isHexDigest(const std::string& value) {
    return value.size() == 64 && std::all_of(value.begin(), value.end(), [](unsigned char c) {
               return std::isdigit(c) || (c >= 'a' && c <= 'f');
           });
}

std::string lowerAscii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

void applyJson(const nlohmann::json& j, DownloadConfig& cfg) {
    auto read_string = [&](const char* key, std::string& dst) {
        if (j.contains(key) && j[key].is_string()) dst = j[key].get<std::string>();
    };
    read_string("base_url", cfg.base_url);
    read_string("file_name", cfg.file_name);
    read_string("chunk_prefix", cfg.chunk_prefix);
    read_string("download_dir", cfg.download_dir);

    if (j.contains("total_chunks") && j["total_chunks"].is_number_unsigned()) {
        cfg.total_chunks = j["total_chunks"].get<size_t>();
    }
    if (j.contains("chunk_size") && j["chunk_size"].is_number_unsigned()) {
        cfg.chunk_size = j["chunk_size"].get<size_t>();
    }
    if (j.contains("concurrency") && j["concurrency"].is_number_unsigned()) {
        const auto v = j["concurrency"].get<size_t>();
        if (v > 0 && v < 64) cfg.max_concurrency = v;
    }
    if (j.contains("max_attempts") && j["max_attempts"].is_number_unsigned()) {
        const auto v = j["max_attempts"].get<uint64_t>();
        if (v >= 1 && v <= 100) cfg.max_attempts = static_cast<int>(v);
    }
    if (j.contains("timeout_ms") && j["timeout_ms"].is_number_unsigned()) {
        cfg.attempt_timeout = std::chrono::milliseconds(j["timeout_ms"].get<long long>());
    }
    if (j.contains("backoff_ms") && j["backoff_ms"].is_number_unsigned()) {
        cfg.backoff_step = std::chrono::milliseconds(j["backoff_ms"].get<long long>());
    }
    if (j.contains("cleanup_chunks") && j["cleanup_chunks"].is_boolean()) {
        cfg.cleanup_chunks = j["cleanup_chunks"].get<bool>();
    }
    if (j.contains("expected_total_bytes") && j["expected_total_bytes"].is_number_unsigned()) {
        cfg.expected_total_bytes = j["expected_total_bytes"].get<uint64_t>();
    }
    if (j.contains("artifact_sha256") && j["artifact_sha256"].is_string()) {
        cfg.artifact_sha256 = lowerAscii(j["artifact_sha256"].get<std::string>());
    }
    if (j.contains("chunk_sha256") && j["chunk_sha256"].is_array()) {
        std::vector<std::string> digests;
        for (const auto& item : j["chunk_sha256"]) {
            if (item.is_string()) digests.push_back(lowerAscii(item.get<std::string>()));
        }
        cfg.chunk_sha256 = std::move(digests);
    }
}

template <typename Fn>
bool applyNumericEnv(const char* name, std::ostringstream& log, Fn&& apply) {
    auto env = getEnvValue(name);
    if (!env) return false;
    try {
        long long v = std::stoll(*env);
        if (!apply(v)) {
            spdlog::warn("Config: ignoring out-of-range {}={}", name, *env);
            return false;
        }
        log << "env:" << name << "=" << v << " ";
        return true;
    } catch (const std::exception&) {
        spdlog::warn("Config: ignoring malformed {}={}", name, *env);
        return false;
    }
}

}  // namespace

std::string defaultDownloadDir() {
    return (homeDir() / kDataDir / "models").string();
}

DownloadConfig defaultDownloadConfig() {
    DownloadConfig cfg;
    cfg.base_url = kDefaultBaseUrl;
    cfg.file_name = kDefaultFileName;
    cfg.chunk_prefix = kDefaultChunkPrefix;
    cfg.total_chunks = kDefaultTotalChunks;
    cfg.chunk_size = kDefaultChunkSize;
    cfg.download_dir = defaultDownloadDir();
    return cfg;
}

DownloadConfig loadDownloadConfig() {
    auto info = loadDownloadConfigWithLog();
    return info.first;
}

std::pair<DownloadConfig, std::string> loadDownloadConfigWithLog() {
    DownloadConfig cfg = defaultDownloadConfig();
    std::ostringstream log;
    bool used_file = false;
    bool used_env = false;

    std::filesystem::path cfg_path;
    if (auto env = getEnvValue("CHUNKFETCH_CONFIG")) {
        cfg_path = *env;
    } else {
        cfg_path = defaultConfigPath();
    }

    if (!cfg_path.empty()) {
        nlohmann::json j;
        if (readJsonWithLock(cfg_path, j) && j.is_object()) {
            applyJson(j, cfg);
            log << "file=" << cfg_path << " ";
            used_file = true;
        }
    }

    if (auto v = getEnvValue("CHUNKFETCH_BASE_URL")) {
        cfg.base_url = *v;
        log << "env:BASE_URL=" << *v << " ";
        used_env = true;
    }
    if (auto v = getEnvValue("CHUNKFETCH_DOWNLOAD_DIR")) {
        cfg.download_dir = *v;
        log << "env:DOWNLOAD_DIR=" << *v << " ";
        used_env = true;
    }

    used_env |= applyNumericEnv("CHUNKFETCH_CONCURRENCY", log, [&](long long v) {
        if (v <= 0 || v >= 64) return false;
        cfg.max_concurrency = static_cast<size_t>(v);
        return true;
    });
    used_env |= applyNumericEnv("CHUNKFETCH_MAX_ATTEMPTS", log, [&](long long v) {
        if (v < 1 || v > 100) return false;
        cfg.max_attempts = static_cast<int>(v);
        return true;
    });
    used_env |= applyNumericEnv("CHUNKFETCH_TIMEOUT_MS", log, [&](long long v) {
        if (v <= 0) return false;
        cfg.attempt_timeout = std::chrono::milliseconds(v);
        return true;
    });
    used_env |= applyNumericEnv("CHUNKFETCH_BACKOFF_MS", log, [&](long long v) {
        if (v < 0) return false;
        cfg.backoff_step = std::chrono::milliseconds(v);
        return true;
    });

    if (log.tellp() > 0) log << "|";
    log << "sources=";
    if (used_env) log << "env";
    if (used_file) {
        if (used_env) log << ",";
        log << "file";
    }
    if (!used_env && !used_file) log << "default";

    return {cfg, log.str()};
}

DownloadResult<void> validateDownloadConfig(const DownloadConfig& cfg) {
    using R = DownloadResult<void>;
    const HttpUrl url = parseUrl(cfg.base_url);
    if (!url.valid() || !isHttpScheme(url.scheme)) {
        return R::failure(DownloadErrorCode::InvalidUrl, "invalid base URL: '" + cfg.base_url + "'");
    }
    if (cfg.file_name.empty() || cfg.chunk_prefix.empty()) {
        return R::failure(DownloadErrorCode::InvalidUrl, "file name and chunk prefix must not be empty");
    }
    if (cfg.file_name.find('/') != std::string::npos || cfg.chunk_prefix.find('/') != std::string::npos) {
        return R::failure(DownloadErrorCode::InvalidUrl, "file name and chunk prefix must be plain names");
    }
    if (cfg.total_chunks < 1) {
        return R::failure(DownloadErrorCode::InvalidUrl, "total chunk count must be at least 1");
    }
    if (cfg.download_dir.empty()) {
        return R::failure(DownloadErrorCode::InvalidUrl, "download directory must not be empty");
    }
    if (!cfg.chunk_sha256.empty()) {
        if (cfg.chunk_sha256.size() != cfg.total_chunks) {
            return R::failure(DownloadErrorCode::InvalidUrl,
                              "chunk_sha256 has " + std::to_string(cfg.chunk_sha256.size()) +
                                  " entries, expected " + std::to_string(cfg.total_chunks));
        }
        for (const auto& digest : cfg.chunk_sha256) {
            if (!isHexDigest(digest)) {
                return R::failure(DownloadErrorCode::InvalidUrl, "malformed chunk digest: " + digest);
            }
        }
    }
    if (!cfg.artifact_sha256.empty() && !isHexDigest(cfg.artifact_sha256)) {
        return R::failure(DownloadErrorCode::InvalidUrl, "malformed artifact digest");
    }
    if (cfg.max_concurrency == 0 || cfg.max_attempts < 1) {
        return R::failure(DownloadErrorCode::InvalidUrl, "concurrency and attempt budget must be positive");
    }
    if (cfg.attempt_timeout.count() <= 0) {
        return R::failure(DownloadErrorCode::InvalidUrl, "attempt timeout must be positive");
    }
    if (cfg.backoff_step.count() < 0) {
        return R::failure(DownloadErrorCode::InvalidUrl, "backoff step must not be negative");
    }
    if (cfg.chunk_size > 0 && cfg.expected_total_bytes > 0) {
        // the last chunk must hold between 1 and chunk_size bytes
        const uint64_t needed = (cfg.expected_total_bytes - 1) / cfg.chunk_size + 1;
        if (needed != cfg.total_chunks) {
            return R::failure(DownloadErrorCode::InvalidUrl,
                              std::to_string(cfg.expected_total_bytes) + " bytes in chunks of " +
                                  std::to_string(cfg.chunk_size) + " need " + std::to_string(needed) +
                                  " chunks, configured " + std::to_string(cfg.total_chunks));
        }
    }
    return R::success();
}

}  // namespace chunkfetch
