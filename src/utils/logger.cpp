#include "utils/logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <optional>
#include <sstream>
#include <utility>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fs = std::filesystem;

namespace kvplane::logger {

namespace {

constexpr const char* kFilePrefix = "kvplane.jsonl.";
constexpr int kDefaultRetentionDays = 7;
constexpr int kMaxRetentionDays = 365;

constexpr const char* kConsolePattern = "[%Y-%m-%d %T.%e] [%l] %v";
constexpr const char* kJsonPattern =
    R"({"ts":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","logger":"%n","tid":%t,"msg":"%v"})";

std::optional<std::string> env(const char* name) {
    const char* v = std::getenv(name);
    if (!v || !*v) return std::nullopt;
    return std::string(v);
}

// YYYY-MM-DD in local time; ISO dates compare correctly as strings.
std::string local_date(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d");
    return oss.str();
}

fs::path home_dir() {
    if (auto home = env("HOME")) return *home;
    if (auto profile = env("USERPROFILE")) return *profile;
    return fs::temp_directory_path();
}

}  // namespace

spdlog::level::level_enum parse_level(const std::string& level_text) {
    std::string lower(level_text.size(), '\0');
    std::transform(level_text.begin(), level_text.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    static const std::pair<const char*, spdlog::level::level_enum> kNames[] = {
        {"trace", spdlog::level::trace},   {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},     {"warn", spdlog::level::warn},
        {"warning", spdlog::level::warn},  {"error", spdlog::level::err},
        {"critical", spdlog::level::critical}, {"fatal", spdlog::level::critical},
        {"off", spdlog::level::off},
    };
    for (const auto& [name, lvl] : kNames) {
        if (lower == name) return lvl;
    }
    return spdlog::level::info;
}

std::string get_log_dir() {
    if (auto dir = env("KVPLANE_LOG_DIR")) return *dir;
    return (home_dir() / ".kvplane" / "logs").string();
}

std::string get_log_file_path() {
    return (fs::path(get_log_dir()) / (kFilePrefix + local_date(std::chrono::system_clock::now())))
        .string();
}

int get_retention_days() {
    auto v = env("KVPLANE_LOG_RETENTION_DAYS");
    if (!v) return kDefaultRetentionDays;
    try {
        int days = std::stoi(*v);
        if (days > 0 && days < kMaxRetentionDays) return days;
    } catch (const std::exception&) {
        // Runs before the logger exists; nothing to report to.
    }
    return kDefaultRetentionDays;
}

void cleanup_old_logs(const std::string& log_dir, int retention_days) {
    std::error_code ec;
    if (!fs::is_directory(log_dir, ec)) return;

    const std::string cutoff =
        local_date(std::chrono::system_clock::now() - std::chrono::hours(24 * retention_days));
    const std::string prefix(kFilePrefix);

    for (fs::directory_iterator it(log_dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        const std::string name = it->path().filename().string();
        if (name.compare(0, prefix.size(), prefix) != 0) continue;
        if (name.substr(prefix.size()) < cutoff) {
            std::error_code rm_ec;
            fs::remove(it->path(), rm_ec);
        }
    }
}

LogSettings settings_from_env() {
    LogSettings s;
    s.level = env("KVPLANE_LOG_LEVEL").value_or("info");
    s.dir = get_log_dir();
    s.retention_days = get_retention_days();
    return s;
}

void init(const std::string& level,
          const std::string& pattern,
          const std::string& file_path,
          std::vector<spdlog::sink_ptr> additional_sinks) {
    std::vector<spdlog::sink_ptr> sinks = std::move(additional_sinks);
    if (sinks.empty()) {
        fs::path path = file_path.empty() ? fs::path(get_log_file_path()) : fs::path(file_path);
        if (path.has_parent_path()) fs::create_directories(path.parent_path());
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), false));
    }

    auto logger = std::make_shared<spdlog::logger>("kvplane", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    // An empty pattern keeps whatever each sink was given.
    if (!pattern.empty()) spdlog::set_pattern(pattern);
    spdlog::set_level(parse_level(level));
    spdlog::flush_on(spdlog::level::info);
}

void init(const LogSettings& settings) {
    fs::create_directories(settings.dir);
    cleanup_old_logs(settings.dir, settings.retention_days);

    const std::string path =
        (fs::path(settings.dir) / (kFilePrefix + local_date(std::chrono::system_clock::now())))
            .string();

    std::vector<spdlog::sink_ptr> sinks;
    if (settings.console) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_pattern(kConsolePattern);
        sinks.push_back(console);
    }
    auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, false);
    file->set_pattern(kJsonPattern);
    sinks.push_back(file);

    init(settings.level, "", "", std::move(sinks));
    spdlog::info("kvplane logging to {} (level={}, retention={}d)", path, settings.level,
                 settings.retention_days);
}

void init_from_env() {
    init(settings_from_env());
}

}  // namespace kvplane::logger
