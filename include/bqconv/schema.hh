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

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace bqconv::schema {

enum class type_name {
    BYTE,
    INT16,
    INT32,
    INT64,
    FLOAT,
    DOUBLE,
    DECIMAL,
    BOOLEAN,
    STRING,
    BYTES,
    // An instant on the UTC time line, millisecond precision.
    DATETIME,
};

// How a logical type is represented outside the canonical model.
enum class logical_representation {
    DATE,
    TIME,
    DATETIME,
    TIME_WITH_LOCAL_TZ,
    PASS_THROUGH,
    ENUM,
};

// Identifiers of the logical types known to the type mapping tables.
namespace identifiers {
constexpr std::string_view DATE = "date";
constexpr std::string_view TIME = "time";
constexpr std::string_view DATETIME = "datetime";
constexpr std::string_view TIME_WITH_LOCAL_TZ = "time_with_local_tz";
constexpr std::string_view ENUM = "enum";
} // namespace identifiers

struct field_type;
class schema;

struct primitive_type {
    type_name name;
};

struct array_type {
    std::shared_ptr<const field_type> element;
};

struct map_type {
    std::shared_ptr<const field_type> key;
    std::shared_ptr<const field_type> value;
};

struct row_type {
    std::shared_ptr<const schema> row_schema;
};

struct logical_type {
    std::string identifier;
    std::shared_ptr<const field_type> base;
    logical_representation representation;
    // Labels by ordinal, only for ENUM.
    std::vector<std::string> enum_values;
};

using type_variant = std::variant<
    primitive_type,
    array_type,
    map_type,
    row_type,
    logical_type
>;

struct field_type {
    type_variant type;
    bool nullable = false;

    static field_type of(type_name name);
    static field_type byte() { return of(type_name::BYTE); }
    static field_type int16() { return of(type_name::INT16); }
    static field_type int32() { return of(type_name::INT32); }
    static field_type int64() { return of(type_name::INT64); }
    static field_type float32() { return of(type_name::FLOAT); }
    static field_type float64() { return of(type_name::DOUBLE); }
    static field_type decimal() { return of(type_name::DECIMAL); }
    static field_type boolean() { return of(type_name::BOOLEAN); }
    static field_type string() { return of(type_name::STRING); }
    static field_type bytes() { return of(type_name::BYTES); }
    static field_type datetime() { return of(type_name::DATETIME); }
    static field_type array(field_type element);
    static field_type map(field_type key, field_type value);
    static field_type row(schema row_schema);
    static field_type logical(std::string identifier, field_type base, logical_representation representation,
            std::vector<std::string> enum_values = {});
    static field_type date();
    static field_type time();
    static field_type local_datetime();
    static field_type time_with_local_tz();
    static field_type enumeration(std::vector<std::string> values);
    static field_type pass_through(std::string identifier, field_type base);

    field_type with_nullable(bool value) const {
        field_type copy = *this;
        copy.nullable = value;
        return copy;
    }

    const primitive_type* as_primitive() const { return std::get_if<primitive_type>(&type); }
    const array_type* as_array() const { return std::get_if<array_type>(&type); }
    const map_type* as_map() const { return std::get_if<map_type>(&type); }
    const row_type* as_row() const { return std::get_if<row_type>(&type); }
    const logical_type* as_logical() const { return std::get_if<logical_type>(&type); }
};

struct field {
    std::string name;
    field_type type;
    std::optional<std::string> description;

    bool nullable() const { return type.nullable; }
};

// Ordered fields with unique names. The order is the positional order of row values.
class schema {
    std::vector<field> _fields;
public:
    schema() = default;
    // Throws structural_mismatch_exception on a duplicate field name.
    explicit schema(std::vector<field> fields);

    const std::vector<field>& fields() const { return _fields; }
    size_t size() const { return _fields.size(); }
    const field& field_at(size_t index) const { return _fields.at(index); }
    std::optional<size_t> index_of(std::string_view name) const;
};

bool operator==(const primitive_type& a, const primitive_type& b);
bool operator==(const array_type& a, const array_type& b);
bool operator==(const map_type& a, const map_type& b);
bool operator==(const row_type& a, const row_type& b);
bool operator==(const logical_type& a, const logical_type& b);
bool operator==(const field_type& a, const field_type& b);
bool operator==(const field& a, const field& b);
bool operator==(const schema& a, const schema& b);
inline bool operator!=(const field_type& a, const field_type& b) { return !(a == b); }
inline bool operator!=(const schema& a, const schema& b) { return !(a == b); }

const char* to_string(type_name name);
std::string to_string(const field_type& type);
std::ostream& operator<<(std::ostream& out, const field_type& type);
std::ostream& operator<<(std::ostream& out, const schema& s);

} // namespace bqconv::schema
