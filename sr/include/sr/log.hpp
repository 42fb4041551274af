/*
 * Part of the StripRequest (SR) project.
 *
 * SPDX-FileCopyrightText: 2025 StripRequest contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of StripRequest (SR). See LICENSE for details.
 */

#pragma once
#include <string>

namespace sr {

// Thread-safe logging (to file + stderr when verbose).
// An empty path disables the file sink.
void set_log_file(const std::string& path);
void set_log_verbosity(int level);
void log_line(const std::string& line);

} // namespace sr
