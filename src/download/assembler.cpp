#include "download/assembler.h"

#include <filesystem>
#include <fstream>
#include <spdlog/spdlog.h>
#include <utility>

#include "utils/sha256.h"

namespace fs = std::filesystem;

namespace chunkfetch {

Assembler::Assembler(const LocalChunkStore& store, uint64_t expected_total_bytes, std::string expected_sha256)
    : store_(store), expected_total_bytes_(expected_total_bytes), expected_sha256_(std::move(expected_sha256)) {}

DownloadResult<std::string> Assembler::assemble(const std::vector<size_t>& chunk_indices) const {
    using R = DownloadResult<std::string>;
    const size_t total = store_.totalChunks();

    if (chunk_indices.size() != total) {
        return R::failure(DownloadErrorCode::AssemblyError,
                          "expected " + std::to_string(total) + " chunks, got " + std::to_string(chunk_indices.size()));
    }
    for (size_t i = 0; i < total; ++i) {
        if (chunk_indices[i] != i) {
            return R::failure(DownloadErrorCode::AssemblyError,
                              "chunk list out of order at position " + std::to_string(i));
        }
    }

    const std::string final_path = store_.finalArtifactPath();
    const std::string staging = final_path + ".assembling";

    auto discard = [&](const std::string& reason) {
        std::error_code ec;
        fs::remove(staging, ec);
        spdlog::error("Assembler: {}", reason);
        return R::failure(DownloadErrorCode::AssemblyError, reason);
    };

    uint64_t written = 0;
    StreamingSha256 digest;
    {
        std::ofstream out(staging, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return discard("cannot open " + staging + " for writing");
        }
        for (size_t index : chunk_indices) {
            if (!store_.exists(index)) {
                return discard("chunk " + store_.address(index).file_name + " missing at assembly time");
            }
            auto chunk = store_.read(index);
            if (!chunk.ok()) {
                return discard(chunk.error_message);
            }
            const std::string& bytes = *chunk.data;
            if (bytes.empty()) {
                return discard("chunk " + store_.address(index).file_name + " is empty");
            }
            out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
            if (!out) {
                return discard("write failed on " + staging);
            }
            if (!expected_sha256_.empty()) digest.update(bytes.data(), bytes.size());
            written += bytes.size();
            spdlog::debug("Assembler: appended {} ({} bytes)", store_.address(index).file_name, bytes.size());
        }
        out.flush();
        if (!out) {
            return discard("flush failed on " + staging);
        }
    }

    std::error_code ec;
    const auto on_disk = fs::file_size(staging, ec);
    if (ec || on_disk != written) {
        return discard("assembled size mismatch: wrote " + std::to_string(written) + " bytes");
    }
    if (expected_total_bytes_ != 0 && written != expected_total_bytes_) {
        return discard("assembled " + std::to_string(written) + " bytes, expected " +
                       std::to_string(expected_total_bytes_));
    }
    if (!expected_sha256_.empty()) {
        const auto actual = digest.finalize();
        if (actual != expected_sha256_) {
            return discard("artifact checksum mismatch (expected " + expected_sha256_ + ", got " + actual + ")");
        }
    }

    fs::rename(staging, final_path, ec);
    if (ec) {
        return discard("cannot move " + staging + " into place: " + ec.message());
    }
    last_bytes_ = written;
    spdlog::info("Assembler: wrote {} ({} bytes from {} chunks)", final_path, written, total);
    return R::success(final_path);
}

}  // namespace chunkfetch
