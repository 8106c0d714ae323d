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

#include <boost/date_time/gregorian/gregorian_types.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace bqconv {

using bytes = std::vector<uint8_t>;

// Arbitrary precision decimal: unscaled * 10^-scale.
class decimal {
    boost::multiprecision::cpp_int _unscaled;
    int32_t _scale = 0;
public:
    decimal() = default;
    decimal(boost::multiprecision::cpp_int unscaled, int32_t scale)
        : _unscaled(std::move(unscaled))
        , _scale(scale) {}

    // Accepts [+-]digits[.digits][(e|E)[+-]digits]. Throws malformed_value_exception.
    static decimal parse(std::string_view text);

    const boost::multiprecision::cpp_int& unscaled() const { return _unscaled; }
    int32_t scale() const { return _scale; }
    // Plain notation, no exponent.
    std::string to_string() const;
};

// Milliseconds since 1970-01-01T00:00:00Z.
struct timestamp {
    int64_t millis;
};

using date = boost::gregorian::date;
using time_of_day = boost::posix_time::time_duration;
using local_date_time = boost::posix_time::ptime;

struct enum_value {
    int32_t ordinal;
};

struct value;

struct array_value {
    std::vector<value> elements;
};

// Entries keep insertion order and are not deduplicated.
struct map_value {
    std::vector<std::pair<value, value>> entries;
};

// Positional values, in the field order of the schema supplied alongside.
struct row_value {
    std::vector<value> values;
};

using value_variant = std::variant<
    std::monostate,
    int8_t,
    int16_t,
    int32_t,
    int64_t,
    float,
    double,
    bool,
    decimal,
    std::string,
    bytes,
    timestamp,
    date,
    time_of_day,
    local_date_time,
    enum_value,
    array_value,
    map_value,
    row_value
>;

struct value {
    value_variant v;

    value() = default;
    template <typename T, typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, value>>>
    value(T&& x) : v(std::forward<T>(x)) {}

    bool is_null() const { return std::holds_alternative<std::monostate>(v); }
    template <typename T>
    const T* get_if() const { return std::get_if<T>(&v); }
};

bool operator==(const decimal& a, const decimal& b);
bool operator==(const timestamp& a, const timestamp& b);
bool operator==(const enum_value& a, const enum_value& b);
bool operator==(const array_value& a, const array_value& b);
bool operator==(const map_value& a, const map_value& b);
bool operator==(const row_value& a, const row_value& b);
bool operator==(const value& a, const value& b);
inline bool operator!=(const value& a, const value& b) { return !(a == b); }
inline bool operator!=(const row_value& a, const row_value& b) { return !(a == b); }

// Name of the held alternative, for error messages.
const char* shape_name(const value& v);

std::ostream& operator<<(std::ostream& out, const decimal& d);
std::ostream& operator<<(std::ostream& out, const value& v);
std::ostream& operator<<(std::ostream& out, const row_value& r);

} // namespace bqconv
