#pragma once
/*
 * Logging
 *
 * Purpose: route the spdlog default logger to a file; the terminal belongs to ncurses.
 * Levels: trace, debug, info, warn, error, off.
 */
#include <filesystem>
#include <string>
#include <string_view>
#include <spdlog/spdlog.h>

bool parse_log_level(std::string_view name, spdlog::level::level_enum& out);

// Replaces the default logger. On failure the old logger stays and msg says why.
bool setup_logging(const std::filesystem::path& path, std::string_view level, std::string& msg);
