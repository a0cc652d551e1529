#pragma once

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <string>

namespace gridchunk {

// Process-wide "gridchunk" logger. The initial level comes from
// GRIDCHUNK_LOG_LEVEL when set, info otherwise.
std::shared_ptr<spdlog::logger> logger();

// Accepts spdlog level names: trace, debug, info, warn, error, critical, off.
// Throws std::invalid_argument for anything else.
void set_log_level(const std::string& level);

void add_log_file(const std::filesystem::path& path);

} // namespace gridchunk
