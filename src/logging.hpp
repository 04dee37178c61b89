#pragma once
/*
 * Logging
 *
 * Purpose: route spdlog's default logger to a file; the terminal belongs to
 *          the UI so nothing may be printed to stdout/stderr while it runs.
 */
#include <string>

bool setup_logging(const std::string& path, const std::string& level, std::string& msg);
