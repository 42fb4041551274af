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
#include <utility>
#include <vector>

namespace sr::internal {

void trim_inplace(std::string& s);
std::string trim_copy(std::string s);
std::string upper_copy(std::string s);

// Split on every occurrence of delim. Trailing empty pieces are dropped;
// an empty input yields no pieces.
std::vector<std::string> split(const std::string& s, const std::string& delim);

// Key = first piece, value = remaining pieces concatenated without delim.
std::pair<std::string, std::string> fold_pair(const std::string& s, char delim);

// "\r\n" -> "\n"
std::string normalize_newlines(const std::string& s);

// Strict base-10 integer; whole string must be consumed.
bool parse_int(const std::string& s, long long& out);

} // namespace sr::internal
