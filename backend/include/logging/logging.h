#pragma once

#include "config/config.h"

/**
 * Install the process-wide spdlog logger described by `cfg`.
 *
 * With an empty file name logs go to stderr; otherwise they are appended to
 * the file so the terminal stays free for the status view. Returns false if
 * the file sink could not be created (the stderr logger stays in place).
 */
bool setup_logging(const LogConfig& cfg);
