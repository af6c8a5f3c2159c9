#pragma once

#include <chrono>
#include <memory>
#include <string>

namespace chunkfetch {

/// Outcome of a single GET. status is 0 when no HTTP response was received.
struct TransportResponse {
    int status{0};
    std::string body;
    std::string error;  // transport-level failure description
};

/// One network attempt for one URL. Implementations must be safe to call
/// concurrently from several threads.
class ChunkTransport {
public:
    virtual ~ChunkTransport() = default;
    virtual TransportResponse get(const std::string& url, std::chrono::milliseconds timeout) = 0;
};

/// cpp-httplib backed transport (follows redirects, HTTPS when built with OpenSSL).
class HttpChunkTransport : public ChunkTransport {
public:
    TransportResponse get(const std::string& url, std::chrono::milliseconds timeout) override;
};

std::unique_ptr<ChunkTransport> makeHttpChunkTransport();

}  // namespace chunkfetch
