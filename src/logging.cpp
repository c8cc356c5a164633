#include "hybridrag/logging.hpp"
#include "hybridrag/error.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <mutex>
#include <vector>

namespace hybridrag {
namespace {

constexpr const char* kLoggerName = "hybridrag";
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

std::mutex& logger_mutex() {
    static std::mutex mutex;
    return mutex;
}

std::shared_ptr<spdlog::logger>& logger_slot() {
    static std::shared_ptr<spdlog::logger> instance;
    return instance;
}

std::shared_ptr<spdlog::logger> build_logger(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    if (!config.file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file, false));
        } catch (const spdlog::spdlog_ex& e) {
            throw ConfigurationError("cannot open log file: " + std::string(e.what()), config.file);
        }
    }

    auto created = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    created->set_level(parse_log_level(config.level));
    created->set_pattern(kPattern);
    created->flush_on(spdlog::level::warn);
    return created;
}

} // namespace

spdlog::level::level_enum parse_log_level(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    if (lowered == "trace") return spdlog::level::trace;
    if (lowered == "debug") return spdlog::level::debug;
    if (lowered == "info") return spdlog::level::info;
    if (lowered == "warn" || lowered == "warning") return spdlog::level::warn;
    if (lowered == "error") return spdlog::level::err;
    if (lowered == "critical") return spdlog::level::critical;
    if (lowered == "off") return spdlog::level::off;
    throw ConfigurationError("unknown log level '" + name + "'", "logging.level");
}

void initialize_logging(const LoggingConfig& config) {
    auto created = build_logger(config);
    std::lock_guard<std::mutex> lock(logger_mutex());
    logger_slot() = std::move(created);
}

void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(logger_mutex());
    auto& slot = logger_slot();
    if (!slot) {
        slot = build_logger(LoggingConfig{});
    }
    return slot;
}

} // namespace hybridrag
