// logger.h - spdlog setup for chunkfetch (console + daily JSONL file)
#pragma once

#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <vector>

namespace chunkfetch::logger {

struct LogOptions {
    std::string level{"info"};
    std::string dir;  // empty: console only
    int retention_days{7};
};

// Case-insensitive; unknown text maps to info.
spdlog::level::level_enum parse_level(const std::string& level_text);

// CHUNKFETCH_LOG_DIR, or ~/.chunkfetch/logs.
std::string get_log_dir();

// <dir>/chunkfetch.jsonl.YYYY-MM-DD for today.
std::string get_log_file_path(const std::string& dir);

// CHUNKFETCH_LOG_RETENTION_DAYS when in 1..364, otherwise 7.
int get_retention_days();

// CHUNKFETCH_LOG_LEVEL / CHUNKFETCH_LOG_DIR / CHUNKFETCH_LOG_RETENTION_DAYS.
LogOptions options_from_env();

// Delete chunkfetch.jsonl.* files dated before today minus retention_days.
void cleanup_old_logs(const std::string& log_dir, int retention_days);

// JSON object members for one log payload. A leading "Component: " becomes
// "component", the rest "msg"; both are escaped.
std::string json_fields(std::string_view payload);

// Replace the default logger. Without sinks, logs go to stdout.
void init(const std::string& level = "info",
          const std::string& pattern = "[%Y-%m-%d %T.%e] [%l] %v",
          std::vector<spdlog::sink_ptr> sinks = {});

// Console sink plus a JSONL file sink in options.dir (after retention cleanup).
// Returns the log file path, or an empty string when only the console is used.
std::string init_with(const LogOptions& options);

void init_from_env();

}  // namespace chunkfetch::logger
