/*
 * This file is open source software, licensed to you under the terms
 * of the Apache License, Version 2.0 (the "License").  See the NOTICE file
 * distributed with this work for additional information regarding copyright
 * ownership.  You may not use this file except in compliance with the License.
 *
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 */
/*
 * Copyright (C) 2020 ScyllaDB
 */

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

// The warehouse's own table schema: type keywords, repetition modes and nested fields.
namespace bqconv::descriptor {

enum class field_mode {
    REQUIRED,
    NULLABLE,
    REPEATED,
};

const char* to_string(field_mode mode);
// Throws malformed_value_exception for anything but the three upper-case mode names.
field_mode parse_field_mode(std::string_view text);
std::ostream& operator<<(std::ostream& out, field_mode mode);

struct table_field_schema {
    std::string name;
    std::string type;
    // Unset means NULLABLE.
    std::optional<field_mode> mode;
    // Only for STRUCT and RECORD.
    std::vector<table_field_schema> fields;
    std::optional<std::string> description;

    bool is_repeated() const { return mode == field_mode::REPEATED; }
    bool is_required() const { return mode == field_mode::REQUIRED; }
    bool is_nullable() const { return !mode || *mode == field_mode::NULLABLE; }
};

using table_schema = std::vector<table_field_schema>;

bool operator==(const table_field_schema& a, const table_field_schema& b);
inline bool operator!=(const table_field_schema& a, const table_field_schema& b) { return !(a == b); }

std::ostream& operator<<(std::ostream& out, const table_field_schema& f);

} // namespace bqconv::descriptor
