#pragma once
#include <spdlog/spdlog.h>
#include <memory>
#include <string>

// Shared "guardrag" logger on stderr. stdout is reserved for result blocks
// that a parent process may parse.
std::shared_ptr<spdlog::logger> logger();

// Level name as understood by spdlog ("trace" .. "off"); unknown names fall
// back to info.
void set_log_level(const std::string& level);
