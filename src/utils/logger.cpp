#include "utils/logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <memory>
#include <nlohmann/json.hpp>
#include <sstream>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fs = std::filesystem;

namespace chunkfetch::logger {

namespace {

constexpr const char* kLogFileBase = "chunkfetch.jsonl";
constexpr const char* kConsolePattern = "[%Y-%m-%d %T.%e] [%l] %v";
constexpr const char* kJsonPattern = R"({"ts":"%Y-%m-%dT%H:%M:%S.%e","level":"%l",%j})";
constexpr int kDefaultRetentionDays = 7;

std::string format_date(std::chrono::system_clock::time_point tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_value{};
#ifdef _WIN32
    localtime_s(&tm_value, &t);
#else
    localtime_r(&t, &tm_value);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm_value, "%Y-%m-%d");
    return oss.str();
}

std::string home_dir() {
    if (const char* home = std::getenv("HOME")) return home;
    if (const char* profile = std::getenv("USERPROFILE")) return profile;
    return fs::temp_directory_path().string();
}

bool looks_like_component(std::string_view name) {
    return !name.empty() && name.size() <= 40 && std::all_of(name.begin(), name.end(), [](unsigned char c) {
               return std::isalnum(c) || c == '_';
           });
}

// %j: the payload as JSON members (see json_fields).
class JsonFieldsFlag : public spdlog::custom_flag_formatter {
public:
    void format(const spdlog::details::log_msg& msg, const std::tm&, spdlog::memory_buf_t& dest) override {
        const std::string fields = json_fields(std::string_view(msg.payload.data(), msg.payload.size()));
        dest.append(fields.data(), fields.data() + fields.size());
    }

    std::unique_ptr<custom_flag_formatter> clone() const override {
        return std::make_unique<JsonFieldsFlag>();
    }
};

}  // namespace

spdlog::level::level_enum parse_level(const std::string& level_text) {
    std::string lower = level_text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "critical" || lower == "fatal") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return spdlog::level::info;
}

std::string get_log_dir() {
    if (const char* env = std::getenv("CHUNKFETCH_LOG_DIR")) {
        if (*env) return env;
    }
    return (fs::path(home_dir()) / ".chunkfetch" / "logs").string();
}

std::string get_log_file_path(const std::string& dir) {
    return (fs::path(dir) / (std::string(kLogFileBase) + "." + format_date(std::chrono::system_clock::now())))
        .string();
}

int get_retention_days() {
    if (const char* env = std::getenv("CHUNKFETCH_LOG_RETENTION_DAYS")) {
        try {
            const int days = std::stoi(env);
            if (days > 0 && days < 365) return days;
        } catch (const std::exception&) {
            // no logger yet; keep the default
        }
    }
    return kDefaultRetentionDays;
}

LogOptions options_from_env() {
    LogOptions options;
    if (const char* env = std::getenv("CHUNKFETCH_LOG_LEVEL")) options.level = env;
    options.dir = get_log_dir();
    options.retention_days = get_retention_days();
    return options;
}

void cleanup_old_logs(const std::string& log_dir, int retention_days) {
    std::error_code ec;
    if (!fs::is_directory(log_dir, ec)) return;

    const std::string cutoff = format_date(std::chrono::system_clock::now() - std::chrono::hours(24 * retention_days));
    const std::string prefix = std::string(kLogFileBase) + ".";

    for (const auto& entry : fs::directory_iterator(log_dir, ec)) {
        if (!entry.is_regular_file()) continue;
        const std::string name = entry.path().filename().string();
        if (name.rfind(prefix, 0) != 0) continue;
        // YYYY-MM-DD sorts chronologically
        if (name.substr(prefix.size()) < cutoff) {
            std::error_code rm_ec;
            fs::remove(entry.path(), rm_ec);
        }
    }
}

std::string json_fields(std::string_view payload) {
    nlohmann::json fields = nlohmann::json::object();
    const auto colon = payload.find(": ");
    if (colon != std::string_view::npos && looks_like_component(payload.substr(0, colon))) {
        fields["component"] = std::string(payload.substr(0, colon));
        payload.remove_prefix(colon + 2);
    }
    fields["msg"] = std::string(payload);
    // invalid UTF-8 in a URL or path must not throw from inside a sink
    std::string dumped = fields.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return dumped.substr(1, dumped.size() - 2);  // drop the braces
}

void init(const std::string& level, const std::string& pattern, std::vector<spdlog::sink_ptr> sinks) {
    if (sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    auto logger = std::make_shared<spdlog::logger>("chunkfetch", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    if (!pattern.empty()) {
        spdlog::set_pattern(pattern);
    }
    spdlog::set_level(parse_level(level));
    spdlog::flush_on(spdlog::level::info);
}

std::string init_with(const LogOptions& options) {
    std::vector<spdlog::sink_ptr> sinks;
    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_pattern(kConsolePattern);
    sinks.push_back(console);

    std::string log_path;
    std::string problem;
    if (!options.dir.empty()) {
        std::error_code ec;
        fs::create_directories(options.dir, ec);
        if (ec) {
            problem = "log dir unavailable: " + ec.message();
        } else {
            cleanup_old_logs(options.dir, options.retention_days);
            const std::string path = get_log_file_path(options.dir);
            try {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path);
                auto formatter = std::make_unique<spdlog::pattern_formatter>();
                formatter->add_flag<JsonFieldsFlag>('j').set_pattern(kJsonPattern);
                file_sink->set_formatter(std::move(formatter));
                sinks.push_back(file_sink);
                log_path = path;
            } catch (const spdlog::spdlog_ex& e) {
                problem = std::string("file sink unavailable: ") + e.what();
            }
        }
    }

    // per-sink formatters stay in place
    init(options.level, "", sinks);

    if (!problem.empty()) {
        spdlog::warn("Logger: {}", problem);
    } else if (!log_path.empty()) {
        spdlog::info("Logger: writing {}", log_path);
    }
    return log_path;
}

void init_from_env() {
    init_with(options_from_env());
}

}  // namespace chunkfetch::logger
