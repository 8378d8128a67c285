#ifndef RSIM_INCLUDE_CORE_LOGGING_H
#define RSIM_INCLUDE_CORE_LOGGING_H

#include <spdlog/spdlog.h>
#include <string>
#include <string_view>

namespace rsim {

// Parse a log level string like "trace|debug|info|warn|error|critical|off".
// Returns fallback when unknown or empty.
spdlog::level::level_enum parse_log_level(std::string_view s, spdlog::level::level_enum fallback = spdlog::level::info);

struct LogInitConfig {
	spdlog::level::level_enum level = spdlog::level::info;
	std::string file_path; // Empty means no file sink
	bool use_color = true;
};

// Pick a log level and optional file sink from the environment and the command line.
// CLI flags: --log-level <level>, --log-file <path>, --no-color (also --flag=value forms).
// Env vars: RSIM_LOG_LEVEL, RSIM_LOG_FILE. The command line wins.
LogInitConfig determine_log_config(int argc, char **argv, spdlog::level::level_enum default_level = spdlog::level::info);

// Install the "rsim" default logger: console sink plus an optional rotating file sink.
void init_logging(const LogInitConfig &cfg);

// Flush and release sinks.
void shutdown_logging();

}

#endif
