#include "download/download_error.h"

namespace chunkfetch {

const char* to_string(DownloadErrorCode code) {
    switch (code) {
        case DownloadErrorCode::Ok:
            return "OK";
        case DownloadErrorCode::InvalidUrl:
            return "INVALID_URL";
        case DownloadErrorCode::ServerError:
            return "SERVER_ERROR";
        case DownloadErrorCode::IoError:
            return "IO_ERROR";
        case DownloadErrorCode::AssemblyError:
            return "ASSEMBLY_ERROR";
        case DownloadErrorCode::Cancelled:
            return "CANCELLED";
        case DownloadErrorCode::Busy:
            return "BUSY";
    }
    return "UNKNOWN";
}

}  // namespace chunkfetch
