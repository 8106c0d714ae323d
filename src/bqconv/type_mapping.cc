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

#include <bqconv/type_mapping.hh>
#include <bqconv/base64.hh>
#include <bqconv/exception.hh>
#include <bqconv/overloaded.hh>
#include <bqconv/time_format.hh>

#include <boost/algorithm/string/predicate.hpp>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <unordered_map>

namespace bqconv::type_mapping {

using schema::type_name;

namespace {

const std::unordered_map<std::string_view, std::string_view>& logical_keywords() {
    static const std::unordered_map<std::string_view, std::string_view> table {
        {schema::identifiers::DATE, "DATE"},
        {schema::identifiers::TIME, "TIME"},
        {schema::identifiers::DATETIME, "DATETIME"},
        {schema::identifiers::TIME_WITH_LOCAL_TZ, "TIME"},
        {schema::identifiers::ENUM, "STRING"},
    };
    return table;
}

const std::unordered_map<std::string_view, wire_type>& wire_types() {
    static const std::unordered_map<std::string_view, wire_type> table {
        {"INT64", wire_type::INT64},
        {"INTEGER", wire_type::INT64},
        {"TIME", wire_type::INT64},
        {"DATETIME", wire_type::INT64},
        {"TIMESTAMP", wire_type::INT64},
        {"FLOAT64", wire_type::DOUBLE},
        {"FLOAT", wire_type::DOUBLE},
        {"STRING", wire_type::STRING},
        {"GEOGRAPHY", wire_type::STRING},
        {"JSON", wire_type::STRING},
        {"BOOL", wire_type::BOOL},
        {"BOOLEAN", wire_type::BOOL},
        {"BYTES", wire_type::BYTES},
        {"NUMERIC", wire_type::BYTES},
        {"BIGNUMERIC", wire_type::BYTES},
        {"DATE", wire_type::INT32},
        {"STRUCT", wire_type::MESSAGE},
        {"RECORD", wire_type::MESSAGE},
    };
    return table;
}

[[noreturn]] void bad_number(std::string_view text, const char* what) {
    throw malformed_value_exception(seastar::format("For input string: \"{}\" ({} expected)", text, what));
}

template <typename Integer>
Integer parse_integer(std::string_view text) {
    std::string_view digits = text;
    if (!digits.empty() && digits.front() == '+') {
        digits.remove_prefix(1);
    }
    Integer result{};
    auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), result);
    if (digits.empty() || ec != std::errc() || end != digits.data() + digits.size()) {
        bad_number(text, "integer");
    }
    return result;
}

double parse_double(std::string_view text) {
    std::string s(text);
    char* end = nullptr;
    double result = std::strtod(s.c_str(), &end);
    if (s.empty() || end != s.c_str() + s.size()) {
        bad_number(text, "floating point");
    }
    return result;
}

float parse_float(std::string_view text) {
    std::string s(text);
    char* end = nullptr;
    float result = std::strtof(s.c_str(), &end);
    if (s.empty() || end != s.c_str() + s.size()) {
        bad_number(text, "floating point");
    }
    return result;
}

value parse_byte(std::string_view text) { return parse_integer<int8_t>(text); }
value parse_int16(std::string_view text) { return parse_integer<int16_t>(text); }
value parse_int32(std::string_view text) { return parse_integer<int32_t>(text); }
value parse_int64(std::string_view text) { return parse_integer<int64_t>(text); }
value parse_float32(std::string_view text) { return parse_float(text); }
value parse_float64(std::string_view text) { return parse_double(text); }
value parse_decimal(std::string_view text) { return decimal::parse(text); }
// Anything but a case-insensitive "true" is false.
value parse_boolean(std::string_view text) { return boost::algorithm::iequals(text, "true"); }
value parse_string(std::string_view text) { return std::string(text); }
value parse_bytes(std::string_view text) { return base64_decode(text); }

value parse_datetime(std::string_view text) {
    if (text.empty()) {
        return value();
    }
    if (boost::algorithm::ends_with(text, "UTC")) {
        return parse_timestamp(text);
    }
    // Fractional seconds since the epoch.
    double millis = parse_double(text) * 1000;
    // 2^63 is exact as a double, the largest int64 is not.
    constexpr double int64_limit = 9223372036854775808.0;
    if (!std::isfinite(millis) || millis < -int64_limit || millis >= int64_limit) {
        throw malformed_value_exception(seastar::format("Timestamp \"{}\" is outside the supported range", text));
    }
    return timestamp{static_cast<int64_t>(millis)};
}

} // namespace

std::string_view keyword_for(type_name name) {
    switch (name) {
    case type_name::BYTE:
    case type_name::INT16:
    case type_name::INT32:
    case type_name::INT64:
        return "INT64";
    case type_name::FLOAT:
    case type_name::DOUBLE:
        return "FLOAT64";
    case type_name::DECIMAL: return "NUMERIC";
    case type_name::BOOLEAN: return "BOOL";
    case type_name::STRING: return "STRING";
    case type_name::BYTES: return "BYTES";
    case type_name::DATETIME: return "TIMESTAMP";
    }
    throw unsupported_type_exception(seastar::format("Cannot convert type {} to BigQuery type", static_cast<int>(name)));
}

std::optional<std::string_view> keyword_for_logical(std::string_view identifier) {
    auto it = logical_keywords().find(identifier);
    if (it == logical_keywords().end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string keyword_for(const schema::field_type& type) {
    return std::visit(overloaded {
        [] (const schema::primitive_type& x) { return std::string(keyword_for(x.name)); },
        [] (const schema::array_type&) { return std::string("ARRAY"); },
        [] (const schema::row_type&) { return std::string("STRUCT"); },
        [&] (const schema::map_type&) -> std::string {
            throw unsupported_type_exception(
                    seastar::format("Cannot convert type {} to BigQuery type", schema::to_string(type)));
        },
        [] (const schema::logical_type& x) {
            if (auto keyword = keyword_for_logical(x.identifier)) {
                return std::string(*keyword);
            }
            if (x.representation == schema::logical_representation::PASS_THROUGH) {
                return keyword_for(*x.base);
            }
            throw unsupported_type_exception(
                    seastar::format("Cannot convert logical type: {} to BigQuery type", x.identifier));
        },
    }, type.type);
}

std::optional<wire_type> wire_type_for_keyword(std::string_view keyword) {
    auto it = wire_types().find(keyword);
    if (it == wire_types().end()) {
        return std::nullopt;
    }
    return it->second;
}

primitive_parser parser_for(type_name name) {
    switch (name) {
    case type_name::BYTE: return parse_byte;
    case type_name::INT16: return parse_int16;
    case type_name::INT32: return parse_int32;
    case type_name::INT64: return parse_int64;
    case type_name::FLOAT: return parse_float32;
    case type_name::DOUBLE: return parse_float64;
    case type_name::DECIMAL: return parse_decimal;
    case type_name::BOOLEAN: return parse_boolean;
    case type_name::STRING: return parse_string;
    case type_name::BYTES: return parse_bytes;
    case type_name::DATETIME: return parse_datetime;
    }
    throw unsupported_type_exception(seastar::format("No text parser for type {}", static_cast<int>(name)));
}

} // namespace bqconv::type_mapping
