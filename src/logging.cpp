#include "gridchunk/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <stdexcept>

namespace gridchunk {

namespace {
// from_str maps unknown names to off; only "off" itself may do that
bool parse_level(const std::string& name, spdlog::level::level_enum& level) {
    level = spdlog::level::from_str(name);
    return level != spdlog::level::off || name == "off";
}

std::shared_ptr<spdlog::logger> make_logger() {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto log = std::make_shared<spdlog::logger>("gridchunk", sink);
    log->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");

    spdlog::level::level_enum level = spdlog::level::info;
    const char* env = std::getenv("GRIDCHUNK_LOG_LEVEL");
    bool valid = !env || parse_level(env, level);
    log->set_level(valid ? level : spdlog::level::info);
    if (!valid) {
        log->warn("Ignoring unknown GRIDCHUNK_LOG_LEVEL '{}'", env);
    }
    return log;
}
}

std::shared_ptr<spdlog::logger> logger() {
    static auto log = make_logger();
    return log;
}

void set_log_level(const std::string& level) {
    spdlog::level::level_enum parsed;
    if (!parse_level(level, parsed)) {
        throw std::invalid_argument("Unknown log level: " + level);
    }
    logger()->set_level(parsed);
}

void add_log_file(const std::filesystem::path& path) {
    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string());
    sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
    logger()->sinks().push_back(sink);
}

} // namespace gridchunk
