#include "download/chunk_store.h"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <spdlog/spdlog.h>

#include "utils/sha256.h"

namespace fs = std::filesystem;

namespace chunkfetch {

namespace {

constexpr const char* kPartialSuffix = ".partial";

}  // namespace

LocalChunkStore::LocalChunkStore(const DownloadConfig& cfg)
    : dir_(cfg.download_dir) {
    ChunkAddressBuilder builder(cfg);
    addresses_ = builder.all();
    final_path_ = builder.finalArtifactPath();
}

bool LocalChunkStore::exists(size_t index) const {
    if (index >= addresses_.size()) return false;
    std::error_code ec;
    return fs::is_regular_file(addresses_[index].local_path, ec);
}

bool LocalChunkStore::isValidOnDisk(const ChunkAddress& addr) const {
    std::error_code ec;
    if (!fs::is_regular_file(addr.local_path, ec)) {
        return false;
    }
    const auto size = fs::file_size(addr.local_path, ec);
    if (ec) {
        spdlog::warn("LocalChunkStore: cannot stat {}: {}", addr.local_path, ec.message());
        return false;
    }
    auto reason = addr.expect.checkSize(size);
    if (reason.empty() && !addr.expect.sha256.empty()) {
        const auto actual = sha256_file(addr.local_path);
        if (actual.empty()) {
            reason = "unreadable";
        } else if (actual != addr.expect.sha256) {
            reason = "checksum mismatch";
        }
    }
    if (!reason.empty()) {
        spdlog::warn("LocalChunkStore: ignoring chunk {} ({}), it will be fetched again",
                     addr.file_name, reason);
        return false;
    }
    return true;
}

std::set<size_t> LocalChunkStore::scanExisting() const {
    std::set<size_t> present;
    for (const auto& addr : addresses_) {
        std::error_code ec;
        fs::remove(addr.local_path + kPartialSuffix, ec);
        if (isValidOnDisk(addr)) {
            spdlog::debug("LocalChunkStore: found existing chunk {}", addr.file_name);
            present.insert(addr.index);
        }
    }
    spdlog::info("LocalChunkStore: {}/{} chunks present in {}", present.size(), addresses_.size(), dir_);
    return present;
}

DownloadResult<void> LocalChunkStore::ensureDirectory() const {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        return DownloadResult<void>::failure(DownloadErrorCode::IoError,
                                             "cannot create directory " + dir_ + ": " + ec.message());
    }
    return DownloadResult<void>::success();
}

DownloadResult<void> LocalChunkStore::write(size_t index, const std::string& bytes) const {
    using R = DownloadResult<void>;
    if (index >= addresses_.size()) {
        return R::failure(DownloadErrorCode::IoError, "chunk index out of range: " + std::to_string(index));
    }
    const auto& addr = addresses_[index];
    const std::string staging = addr.local_path + kPartialSuffix;

    auto dir = ensureDirectory();
    if (!dir.ok()) return dir;

    {
        std::ofstream ofs(staging, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            return R::failure(DownloadErrorCode::IoError, "cannot open " + staging + " for writing");
        }
        ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        ofs.flush();
        if (!ofs) {
            ofs.close();
            std::error_code ec;
            fs::remove(staging, ec);
            return R::failure(DownloadErrorCode::IoError, "short write to " + staging);
        }
    }

    std::error_code ec;
    fs::rename(staging, addr.local_path, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(staging, rm_ec);
        return R::failure(DownloadErrorCode::IoError,
                          "cannot move " + staging + " into place: " + ec.message());
    }
    spdlog::debug("LocalChunkStore: saved {} ({} bytes)", addr.local_path, bytes.size());
    return R::success();
}

DownloadResult<std::string> LocalChunkStore::read(size_t index) const {
    using R = DownloadResult<std::string>;
    if (index >= addresses_.size()) {
        return R::failure(DownloadErrorCode::IoError, "chunk index out of range: " + std::to_string(index));
    }
    const auto& path = addresses_[index].local_path;
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open()) {
        return R::failure(DownloadErrorCode::IoError, "cannot open " + path);
    }
    std::string bytes((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (ifs.bad()) {
        return R::failure(DownloadErrorCode::IoError, "read error on " + path);
    }
    return R::success(std::move(bytes));
}

size_t LocalChunkStore::removeChunks() const {
    size_t removed = 0;
    for (const auto& addr : addresses_) {
        std::error_code ec;
        if (fs::remove(addr.local_path, ec)) {
            ++removed;
        } else if (ec) {
            spdlog::warn("LocalChunkStore: failed to remove {}: {}", addr.local_path, ec.message());
        }
    }
    return removed;
}

bool LocalChunkStore::finalArtifactExists() const {
    std::error_code ec;
    return fs::is_regular_file(final_path_, ec);
}

}  // namespace chunkfetch
