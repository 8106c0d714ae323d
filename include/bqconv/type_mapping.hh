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

#include <bqconv/schema.hh>
#include <bqconv/value.hh>
#include <optional>
#include <string>
#include <string_view>

// Immutable lookup tables shared by the converters. Built on first use, never modified.
namespace bqconv::type_mapping {

// External keyword of a canonical primitive.
std::string_view keyword_for(schema::type_name name);

// External keyword of a known logical identifier, or nothing.
std::optional<std::string_view> keyword_for_logical(std::string_view identifier);

// Keyword of a terminal type. Arrays map to ARRAY and rows to STRUCT. A logical type
// without a table entry resolves through its base type only when it is pass-through.
// Throws unsupported_type_exception otherwise.
std::string keyword_for(const schema::field_type& type);

// Storage wire types. The ordinals are hashed into schema fingerprints and must never change.
enum class wire_type : int32_t {
    DOUBLE = 0,
    FLOAT = 1,
    INT64 = 2,
    UINT64 = 3,
    INT32 = 4,
    FIXED64 = 5,
    FIXED32 = 6,
    BOOL = 7,
    STRING = 8,
    GROUP = 9,
    MESSAGE = 10,
    BYTES = 11,
    UINT32 = 12,
    ENUM = 13,
    SFIXED32 = 14,
    SFIXED64 = 15,
    SINT32 = 16,
    SINT64 = 17,
};

std::optional<wire_type> wire_type_for_keyword(std::string_view keyword);

// Parses the text form of a primitive. DATETIME yields a timestamp, or null for empty text.
using primitive_parser = value (*)(std::string_view text);

// Every primitive has a parser.
primitive_parser parser_for(schema::type_name name);

} // namespace bqconv::type_mapping
