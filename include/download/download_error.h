#pragma once

#include <optional>
#include <string>
#include <utility>

namespace chunkfetch {

/// Error codes for download operations
enum class DownloadErrorCode {
    Ok = 0,
    /// Malformed configuration (bad base URL, empty names, zero chunks)
    InvalidUrl,
    /// Non-200 response or transport failure
    ServerError,
    /// Local storage read/write failure
    IoError,
    /// Missing or unreadable chunk at assembly time, or final validation failure
    AssemblyError,
    /// Session stopped by cancel()
    Cancelled,
    /// Another process holds the download directory lock
    Busy,
};

const char* to_string(DownloadErrorCode code);

/// Result of download operations (generic template)
template<typename T>
struct DownloadResult {
    DownloadErrorCode error{DownloadErrorCode::Ok};
    std::string error_message;
    std::optional<T> data;

    bool ok() const { return error == DownloadErrorCode::Ok; }

    static DownloadResult success(T value) {
        DownloadResult r;
        r.data = std::move(value);
        return r;
    }

    static DownloadResult failure(DownloadErrorCode code, std::string message) {
        DownloadResult r;
        r.error = code;
        r.error_message = std::move(message);
        return r;
    }
};

/// Specialization for void type (no data member)
template<>
struct DownloadResult<void> {
    DownloadErrorCode error{DownloadErrorCode::Ok};
    std::string error_message;

    bool ok() const { return error == DownloadErrorCode::Ok; }

    static DownloadResult success() { return {}; }

    static DownloadResult failure(DownloadErrorCode code, std::string message) {
        DownloadResult r;
        r.error = code;
        r.error_message = std::move(message);
        return r;
    }
};

}  // namespace chunkfetch
