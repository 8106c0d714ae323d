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

#include <bqconv/text_encoder.hh>
#include <bqconv/base64.hh>
#include <bqconv/exception.hh>
#include <bqconv/overloaded.hh>
#include <bqconv/time_format.hh>

#include <fmt/format.h>
#include <sstream>

namespace bqconv::text {

using schema::field_type;
using schema::logical_representation;
using schema::type_name;

namespace {

// Whole floating point values keep a ".0" so they read back as floating point.
template <typename Float>
std::string format_floating(Float x) {
    std::string out = fmt::format("{}", x);
    if (out.find_first_of(".eEn") == std::string::npos) {
        out += ".0";
    }
    return out;
}

// Text form of a value independent of its declared type.
std::string default_text(const value& v) {
    return std::visit(overloaded {
        [] (const std::monostate&) { return std::string("null"); },
        [] (const float& x) { return format_floating(x); },
        [] (const double& x) { return format_floating(x); },
        [] (const bool& x) { return std::string(x ? "true" : "false"); },
        [] (const decimal& x) { return x.to_string(); },
        [] (const std::string& x) { return x; },
        [] (const bytes& x) { return base64_encode(x); },
        [] (const timestamp& x) { return format_timestamp(x); },
        [] (const date& x) { return format_date(x); },
        [] (const time_of_day& x) { return format_time(x); },
        [] (const local_date_time& x) { return format_local_date_time(x); },
        [] (const enum_value& x) { return fmt::format("{}", x.ordinal); },
        [&] (const array_value&) { std::ostringstream out; out << v; return out.str(); },
        [&] (const map_value&) { std::ostringstream out; out << v; return out.str(); },
        [&] (const row_value&) { std::ostringstream out; out << v; return out.str(); },
        [] (const auto& x) { return fmt::format("{}", x); },
    }, v.v);
}

text_value encode_primitive(type_name name, const value& v) {
    switch (name) {
    case type_name::DATETIME:
        if (auto ts = v.get_if<timestamp>()) {
            return format_timestamp(*ts);
        }
        break;
    case type_name::BYTES:
        if (auto b = v.get_if<bytes>()) {
            return base64_encode(*b);
        }
        break;
    default:
        break;
    }
    return default_text(v);
}

text_value encode_logical(const schema::logical_type& logical, const field_type& type, const value& v) {
    switch (logical.representation) {
    case logical_representation::DATE:
        if (auto d = v.get_if<date>()) {
            return format_date(*d);
        }
        break;
    case logical_representation::TIME:
        // Seconds are always written, the fraction only when non-zero.
        if (auto t = v.get_if<time_of_day>()) {
            return format_time(*t);
        }
        break;
    case logical_representation::DATETIME:
        if (auto dt = v.get_if<local_date_time>()) {
            return format_local_date_time(*dt);
        }
        break;
    case logical_representation::TIME_WITH_LOCAL_TZ:
        if (auto ts = v.get_if<timestamp>()) {
            return format_timestamp(*ts);
        }
        break;
    case logical_representation::ENUM:
        if (auto e = v.get_if<enum_value>()) {
            if (e->ordinal < 0 || static_cast<size_t>(e->ordinal) >= logical.enum_values.size()) {
                throw malformed_value_exception(seastar::format(
                        "Enum ordinal {} out of range for {} labels", e->ordinal, logical.enum_values.size()));
            }
            return logical.enum_values[e->ordinal];
        }
        break;
    case logical_representation::PASS_THROUGH:
        return encode(logical.base->with_nullable(type.nullable), v);
    }
    return default_text(v);
}

} // namespace

text_value encode(const field_type& type, const value& v) {
    if (v.is_null()) {
        if (!type.nullable) {
            throw non_nullable_null_exception::of(schema::to_string(type));
        }
        return nullptr;
    }
    return std::visit(overloaded {
        [&] (const schema::primitive_type& x) { return encode_primitive(x.name, v); },
        [&] (const schema::array_type& x) {
            auto array = v.get_if<array_value>();
            if (!array) {
                throw unsupported_type_exception::shape(shape_name(v), schema::to_string(type));
            }
            text_value out = text_value::array();
            for (const value& element : array->elements) {
                out.push_back(encode(*x.element, element));
            }
            return out;
        },
        [&] (const schema::map_type& x) {
            auto map = v.get_if<map_value>();
            if (!map) {
                throw unsupported_type_exception::shape(shape_name(v), schema::to_string(type));
            }
            text_value out = text_value::array();
            for (const auto& [key, entry] : map->entries) {
                text_value pair = text_value::object();
                pair[map_key_key] = encode(*x.key, key);
                pair[map_value_key] = encode(*x.value, entry);
                out.push_back(std::move(pair));
            }
            return out;
        },
        [&] (const schema::row_type& x) {
            auto row = v.get_if<row_value>();
            if (!row) {
                throw unsupported_type_exception::shape(shape_name(v), schema::to_string(type));
            }
            return encode_row(*x.row_schema, *row);
        },
        [&] (const schema::logical_type& x) { return encode_logical(x, type, v); },
    }, type.type);
}

text_value encode_row(const schema::schema& s, const row_value& row) {
    if (row.values.size() != s.size()) {
        throw structural_mismatch_exception(seastar::format(
                "Row has {} values but the schema has {} fields", row.values.size(), s.size()));
    }
    text_value out = text_value::object();
    for (size_t i = 0; i < s.size(); ++i) {
        const schema::field& f = s.field_at(i);
        try {
            out[f.name] = encode(f.type, row.values[i]);
        } catch (bqconv_exception& e) {
            e.add_field_context(f.name);
            throw;
        }
    }
    return out;
}

} // namespace bqconv::text
