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
#include <initializer_list>
#include <vector>
#include <cstddef>

namespace sr {

// Ordered string -> string mapping. Keeps first-insertion order; setting an
// existing key overwrites its value in place (duplicates collapse, last value wins).
class FieldMap {
public:
    using Entry          = std::pair<std::string, std::string>;
    using const_iterator = std::vector<Entry>::const_iterator;

    FieldMap() = default;
    FieldMap(std::initializer_list<Entry> init);

    void set(const std::string& key, const std::string& value);
    bool erase(const std::string& key);

    bool contains(const std::string& key) const;
    // Empty string if absent.
    std::string get(const std::string& key) const;

    std::size_t size() const { return _entries.size(); }
    bool empty() const { return _entries.empty(); }

    const_iterator begin() const { return _entries.begin(); }
    const_iterator end() const { return _entries.end(); }

    bool operator==(const FieldMap& o) const { return _entries == o._entries; }
    bool operator!=(const FieldMap& o) const { return !(*this == o); }

private:
    std::vector<Entry> _entries;
};

} // namespace sr
