#include <chrono>
#include <core/logging.h>
#include <cstdlib>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <vector>

namespace rsim {

static std::string_view trim(std::string_view s) {
	auto is_space = [](unsigned char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; };
	std::size_t b = 0, e = s.size();
	while (b < e && is_space(static_cast<unsigned char>(s[b]))) {
		b++;
	}
	while (e > b && is_space(static_cast<unsigned char>(s[e - 1]))) {
		e--;
	}
	return s.substr(b, e - b);
}

spdlog::level::level_enum parse_log_level(std::string_view s, spdlog::level::level_enum fallback) {
	s = trim(s);
	if (s == "trace") {
		return spdlog::level::trace;
	}
	if (s == "debug") {
		return spdlog::level::debug;
	}
	if (s == "info") {
		return spdlog::level::info;
	}
	if (s == "warn" || s == "warning") {
		return spdlog::level::warn;
	}
	if (s == "error" || s == "err") {
		return spdlog::level::err;
	}
	if (s == "critical" || s == "fatal") {
		return spdlog::level::critical;
	}
	if (s == "off" || s == "quiet") {
		return spdlog::level::off;
	}
	return fallback;
}

LogInitConfig determine_log_config(int argc, char **argv, spdlog::level::level_enum default_level) {
	LogInitConfig cfg;
	cfg.level = default_level;

	if (const char *env_level = std::getenv("RSIM_LOG_LEVEL")) {
		cfg.level = parse_log_level(env_level, cfg.level);
	}
	if (const char *env_file = std::getenv("RSIM_LOG_FILE")) {
		if (env_file[0] != '\0') {
			cfg.file_path = env_file;
		}
	}

	const std::string_view level_prefix = "--log-level=";
	const std::string_view file_prefix = "--log-file=";
	for (int i = 1; i < argc; i++) {
		std::string_view a = argv[i] ? argv[i] : "";
		if (a == "--log-level" && i + 1 < argc) {
			cfg.level = parse_log_level(argv[++i], cfg.level);
		} else if (a.substr(0, level_prefix.size()) == level_prefix) {
			cfg.level = parse_log_level(a.substr(level_prefix.size()), cfg.level);
		} else if (a == "--log-file" && i + 1 < argc) {
			cfg.file_path = argv[++i];
		} else if (a.substr(0, file_prefix.size()) == file_prefix) {
			cfg.file_path = std::string(a.substr(file_prefix.size()));
		} else if (a == "--no-color") {
			cfg.use_color = false;
		}
	}
	return cfg;
}

void init_logging(const LogInitConfig &cfg) {
	std::vector<spdlog::sink_ptr> sinks;
	if (cfg.use_color) {
		sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
	} else {
		sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());
	}

	std::string file_error;
	if (!cfg.file_path.empty()) {
		// 5 MB per file, keep 3 files
		constexpr std::size_t max_size = 5 * 1024 * 1024;
		constexpr std::size_t max_files = 3;
		try {
			sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(cfg.file_path, max_size, max_files));
		} catch (const spdlog::spdlog_ex &e) {
			file_error = e.what();
		}
	}

	auto logger = std::make_shared<spdlog::logger>("rsim", sinks.begin(), sinks.end());
	logger->set_level(cfg.level);
	logger->flush_on(spdlog::level::warn);
	spdlog::set_default_logger(logger);
	spdlog::set_level(cfg.level);
	spdlog::set_pattern("[%H:%M:%S.%e] [tid %t] [%^%l%$] %v");
	spdlog::flush_every(std::chrono::seconds(1));

	if (!file_error.empty()) {
		spdlog::warn("Cannot open log file {}: {}", cfg.file_path, file_error);
	}
	spdlog::info("Logging initialized (level={}, file={})", spdlog::level::to_string_view(cfg.level), cfg.file_path.empty() ? "none" : cfg.file_path);
}

void shutdown_logging() {
	spdlog::shutdown();
}

}
