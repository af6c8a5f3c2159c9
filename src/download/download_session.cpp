#include "download/download_session.h"

#include <algorithm>
#include <utility>

namespace chunkfetch {

DownloadSession DownloadSession::begin(const DownloadConfig& config, const std::vector<ChunkAddress>& addresses) {
    DownloadSession session;
    session.config = config;
    session.chunks.reserve(addresses.size());
    for (const auto& addr : addresses) {
        session.chunks.push_back(ChunkRecord{addr.index, addr.remote_url, addr.local_path, ChunkPresence::Missing});
    }
    return session;
}

void DownloadSession::markExisting(const std::set<size_t>& existing) {
    for (auto index : existing) {
        if (index < chunks.size() && chunks[index].presence != ChunkPresence::OnDisk) {
            chunks[index].presence = ChunkPresence::OnDisk;
            ++completed_count;
        }
    }
    recomputeProgress();
}

void DownloadSession::markPending(size_t index) {
    if (index < chunks.size() && chunks[index].presence == ChunkPresence::Missing) {
        chunks[index].presence = ChunkPresence::InMemoryPending;
    }
}

void DownloadSession::markStored(size_t index) {
    if (index >= chunks.size() || chunks[index].presence == ChunkPresence::OnDisk) return;
    chunks[index].presence = ChunkPresence::OnDisk;
    ++completed_count;
    recomputeProgress();
}

void DownloadSession::recomputeProgress() {
    if (chunks.empty()) return;
    const double fraction = static_cast<double>(completed_count) / static_cast<double>(chunks.size());
    progress = std::max(progress, std::min(1.0, fraction));
}

void DownloadSession::setPhase(DownloadPhase next, std::string message) {
    phase = next;
    status_message = std::move(message);
    if (next == DownloadPhase::Complete || next == DownloadPhase::AlreadyAvailable) {
        progress = 1.0;
    }
}

void DownloadSession::fail(DownloadErrorCode code, const std::string& reason) {
    error = code;
    if (code == DownloadErrorCode::Cancelled) {
        setPhase(DownloadPhase::Cancelled, "cancelled");
    } else {
        setPhase(DownloadPhase::Failed, "failed: " + reason);
    }
}

std::string DownloadSession::phaseToString(DownloadPhase phase) {
    switch (phase) {
        case DownloadPhase::Idle:
            return "idle";
        case DownloadPhase::Checking:
            return "checking";
        case DownloadPhase::Downloading:
            return "downloading";
        case DownloadPhase::Assembling:
            return "assembling";
        case DownloadPhase::Complete:
            return "complete";
        case DownloadPhase::AlreadyAvailable:
            return "already_available";
        case DownloadPhase::Failed:
            return "failed";
        case DownloadPhase::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

}  // namespace chunkfetch
