#include "download/chunk_transport.h"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include "utils/http_url.h"

namespace chunkfetch {

namespace {

std::unique_ptr<httplib::Client> makeClient(const HttpUrl& url, std::chrono::milliseconds timeout) {
    if (!url.valid()) {
        return nullptr;
    }

#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
    if (url.scheme == "https") {
        return nullptr;  // HTTPS is not supported in this build
    }
#endif

    auto client = std::make_unique<httplib::Client>(url.origin());
    if (client && client->is_valid()) {
        const auto sec = static_cast<time_t>(timeout.count() / 1000);
        const auto usec = static_cast<time_t>((timeout.count() % 1000) * 1000);
        client->set_connection_timeout(sec, usec);
        client->set_read_timeout(sec, usec);
        client->set_write_timeout(sec, usec);
        client->set_follow_location(true);
        return client;
    }

    return nullptr;
}

}  // namespace

TransportResponse HttpChunkTransport::get(const std::string& url, std::chrono::milliseconds timeout) {
    TransportResponse out;
    const HttpUrl parsed = parseUrl(url);
    auto client = makeClient(parsed, timeout);
    if (!client) {
        out.error = "failed to create HTTP client for '" + url + "'";
        return out;
    }

    auto result = client->Get(parsed.path);
    if (!result) {
        out.error = httplib::to_string(result.error());
        spdlog::debug("HttpChunkTransport: GET {} failed: {}", url, out.error);
        return out;
    }
    out.status = result->status;
    out.body = std::move(result->body);
    return out;
}

std::unique_ptr<ChunkTransport> makeHttpChunkTransport() {
    return std::make_unique<HttpChunkTransport>();
}

}  // namespace chunkfetch
