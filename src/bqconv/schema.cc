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

#include <bqconv/schema.hh>
#include <bqconv/exception.hh>
#include <bqconv/overloaded.hh>

#include <sstream>
#include <unordered_set>

namespace bqconv::schema {

namespace {

bool same_pointee(const std::shared_ptr<const field_type>& a, const std::shared_ptr<const field_type>& b) {
    if (a == b) {
        return true;
    }
    return a && b && *a == *b;
}

} // namespace

field_type field_type::of(type_name name) {
    return field_type{primitive_type{name}};
}

field_type field_type::array(field_type element) {
    return field_type{array_type{std::make_shared<const field_type>(std::move(element))}};
}

field_type field_type::map(field_type key, field_type value) {
    return field_type{map_type{
            std::make_shared<const field_type>(std::move(key)),
            std::make_shared<const field_type>(std::move(value))}};
}

field_type field_type::row(schema row_schema) {
    return field_type{row_type{std::make_shared<const schema>(std::move(row_schema))}};
}

field_type field_type::logical(std::string identifier, field_type base, logical_representation representation,
        std::vector<std::string> enum_values) {
    return field_type{logical_type{
            std::move(identifier),
            std::make_shared<const field_type>(std::move(base)),
            representation,
            std::move(enum_values)}};
}

field_type field_type::date() {
    // Days since the epoch.
    return logical(std::string(identifiers::DATE), int64(), logical_representation::DATE);
}

field_type field_type::time() {
    // Nanoseconds since midnight.
    return logical(std::string(identifiers::TIME), int64(), logical_representation::TIME);
}

field_type field_type::local_datetime() {
    schema base{{
        field{"date", int64()},
        field{"time", int64()},
    }};
    return logical(std::string(identifiers::DATETIME), row(std::move(base)), logical_representation::DATETIME);
}

field_type field_type::time_with_local_tz() {
    return logical(std::string(identifiers::TIME_WITH_LOCAL_TZ), datetime(),
            logical_representation::TIME_WITH_LOCAL_TZ);
}

field_type field_type::enumeration(std::vector<std::string> values) {
    return logical(std::string(identifiers::ENUM), int32(), logical_representation::ENUM, std::move(values));
}

field_type field_type::pass_through(std::string identifier, field_type base) {
    return logical(std::move(identifier), std::move(base), logical_representation::PASS_THROUGH);
}

schema::schema(std::vector<field> fields) : _fields(std::move(fields)) {
    std::unordered_set<std::string_view> names;
    for (const field& f : _fields) {
        if (!names.insert(f.name).second) {
            throw structural_mismatch_exception(seastar::format("Duplicate field name \"{}\" in schema", f.name));
        }
    }
}

std::optional<size_t> schema::index_of(std::string_view name) const {
    for (size_t i = 0; i < _fields.size(); ++i) {
        if (_fields[i].name == name) {
            return i;
        }
    }
    return std::nullopt;
}

bool operator==(const primitive_type& a, const primitive_type& b) {
    return a.name == b.name;
}

bool operator==(const array_type& a, const array_type& b) {
    return same_pointee(a.element, b.element);
}

bool operator==(const map_type& a, const map_type& b) {
    return same_pointee(a.key, b.key) && same_pointee(a.value, b.value);
}

bool operator==(const row_type& a, const row_type& b) {
    if (a.row_schema == b.row_schema) {
        return true;
    }
    return a.row_schema && b.row_schema && *a.row_schema == *b.row_schema;
}

bool operator==(const logical_type& a, const logical_type& b) {
    return a.identifier == b.identifier
            && a.representation == b.representation
            && a.enum_values == b.enum_values
            && same_pointee(a.base, b.base);
}

bool operator==(const field_type& a, const field_type& b) {
    return a.nullable == b.nullable && a.type == b.type;
}

bool operator==(const field& a, const field& b) {
    return a.name == b.name && a.type == b.type && a.description == b.description;
}

bool operator==(const schema& a, const schema& b) {
    return a.fields() == b.fields();
}

const char* to_string(type_name name) {
    switch (name) {
    case type_name::BYTE: return "BYTE";
    case type_name::INT16: return "INT16";
    case type_name::INT32: return "INT32";
    case type_name::INT64: return "INT64";
    case type_name::FLOAT: return "FLOAT";
    case type_name::DOUBLE: return "DOUBLE";
    case type_name::DECIMAL: return "DECIMAL";
    case type_name::BOOLEAN: return "BOOLEAN";
    case type_name::STRING: return "STRING";
    case type_name::BYTES: return "BYTES";
    case type_name::DATETIME: return "DATETIME";
    }
    return "UNKNOWN";
}

std::ostream& operator<<(std::ostream& out, const field_type& type) {
    std::visit(overloaded {
        [&] (const primitive_type& x) { out << to_string(x.name); },
        [&] (const array_type& x) { out << "ARRAY<" << *x.element << ">"; },
        [&] (const map_type& x) { out << "MAP<" << *x.key << ", " << *x.value << ">"; },
        [&] (const row_type& x) { out << "ROW<" << *x.row_schema << ">"; },
        [&] (const logical_type& x) { out << "LOGICAL<" << x.identifier << ", " << *x.base << ">"; },
    }, type.type);
    if (!type.nullable) {
        out << " NOT NULL";
    }
    return out;
}

std::ostream& operator<<(std::ostream& out, const schema& s) {
    const char* separator = "";
    for (const field& f : s.fields()) {
        out << separator << f.name << " " << f.type;
        separator = ", ";
    }
    return out;
}

std::string to_string(const field_type& type) {
    std::ostringstream out;
    out << type;
    return out.str();
}

} // namespace bqconv::schema
