/*
 * Part of the HeaderVerify (HV) project.
 *
 * SPDX-FileCopyrightText: 2025 HeaderVerify contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HeaderVerify (HV). See LICENSE for details.
 */

#pragma once
#include <string>

namespace hv {

// Thread-safe logging (to file + stdout).
// An empty path disables the file sink; stdout is always written.
void set_log_file(const std::string& path);
void log_line(const std::string& line);

// Timestamped, level-tagged variants: "<utc> [INFO] msg".
void log_info(const std::string& msg);
void log_warn(const std::string& msg);
void log_error(const std::string& msg);

} // namespace hv
