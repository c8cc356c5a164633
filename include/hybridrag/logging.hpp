#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace hybridrag {

struct LoggingConfig {
    std::string level = "info";
    std::string file;            // empty: no file sink
    bool console = true;
};

// Parses trace|debug|info|warn|warning|error|critical|off; throws ConfigurationError otherwise.
spdlog::level::level_enum parse_log_level(const std::string& name);

// (Re)builds the process-wide "hybridrag" logger from config.
void initialize_logging(const LoggingConfig& config);

void set_log_level(spdlog::level::level_enum level);

// Process-wide logger; created with console defaults on first use.
std::shared_ptr<spdlog::logger> logger();

} // namespace hybridrag

// Convenience macros
#define HYBRIDRAG_LOG_TRACE(...)    ::hybridrag::logger()->trace(__VA_ARGS__)
#define HYBRIDRAG_LOG_DEBUG(...)    ::hybridrag::logger()->debug(__VA_ARGS__)
#define HYBRIDRAG_LOG_INFO(...)     ::hybridrag::logger()->info(__VA_ARGS__)
#define HYBRIDRAG_LOG_WARN(...)     ::hybridrag::logger()->warn(__VA_ARGS__)
#define HYBRIDRAG_LOG_ERROR(...)    ::hybridrag::logger()->error(__VA_ARGS__)
#define HYBRIDRAG_LOG_CRITICAL(...) ::hybridrag::logger()->critical(__VA_ARGS__)
