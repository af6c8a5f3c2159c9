#include "download/chunk_fetcher.h"

#include <spdlog/spdlog.h>
#include <utility>

#include "utils/http_url.h"

namespace chunkfetch {

ChunkFetcher::ChunkFetcher(ChunkTransport& transport,
                           std::chrono::milliseconds backoff_step,
                           SleepFn sleep)
    : transport_(transport), backoff_step_(backoff_step), sleep_(std::move(sleep)) {
    if (!sleep_) sleep_ = sleepFor;
}

DownloadResult<std::string> ChunkFetcher::fetch(const std::string& url,
                                                int attempt_budget,
                                                std::chrono::milliseconds per_attempt_timeout,
                                                const ChunkExpectation& expect,
                                                const std::atomic<bool>* cancelled) const {
    using R = DownloadResult<std::string>;

    const HttpUrl parsed = parseUrl(url);
    if (!parsed.valid() || !isHttpScheme(parsed.scheme)) {
        return R::failure(DownloadErrorCode::InvalidUrl, "invalid chunk URL: '" + url + "'");
    }

    const RetryPolicy policy = RetryPolicy::linear(attempt_budget, backoff_step_);
    std::string last_error = "no attempt made";

    for (int attempt = 1; attempt <= policy.maxAttempts(); ++attempt) {
        if (cancelled && cancelled->load()) {
            return R::failure(DownloadErrorCode::Cancelled, "cancelled before attempt " + std::to_string(attempt));
        }

        spdlog::debug("ChunkFetcher: GET {} (attempt {}/{})", url, attempt, policy.maxAttempts());
        TransportResponse res = transport_.get(url, per_attempt_timeout);

        if (res.status == 200 && !res.body.empty()) {
            auto reason = expect.check(res.body);
            if (reason.empty()) {
                return R::success(std::move(res.body));
            }
            last_error = std::move(reason);
        } else if (res.status == 0) {
            last_error = res.error.empty() ? "transport error" : res.error;
        } else if (res.status == 200) {
            last_error = "empty response body";
        } else {
            last_error = "HTTP " + std::to_string(res.status);
        }

        spdlog::warn("ChunkFetcher: {} failed (attempt {}/{}): {}", url, attempt, policy.maxAttempts(),
                     last_error);

        if (policy.shouldRetry(attempt)) {
            const auto delay = policy.delayAfter(attempt);
            spdlog::info("ChunkFetcher: retrying {} in {} ms", url, delay.count());
            sleep_(delay);
        }
    }

    return R::failure(DownloadErrorCode::ServerError,
                      "giving up on " + url + " after " + std::to_string(policy.maxAttempts()) +
                          " attempts: " + last_error);
}

}  // namespace chunkfetch
