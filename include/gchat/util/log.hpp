/*
 * GChat Console Logging
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Tagged console output ([gchat], [warn], [error], [DEBUG]). Debug lines are
 *   printed only when enabled with -d / debug=true.
 */
#pragma once
#include <string>

namespace gchat::log {

void set_debug(bool on);
bool debug_enabled();
// Suppress all output (used by tests).
void set_quiet(bool on);

void info(const std::string& msg);
void warn(const std::string& msg);
void error(const std::string& msg);
void debug(const std::string& msg);

} // namespace gchat::log
