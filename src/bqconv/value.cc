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

#include <bqconv/value.hh>
#include <bqconv/exception.hh>
#include <bqconv/overloaded.hh>
#include <bqconv/time_format.hh>

#include <charconv>
#include <limits>

namespace bqconv {

namespace {

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

size_t count_digits(std::string_view text, size_t pos) {
    size_t n = 0;
    while (pos + n < text.size() && is_digit(text[pos + n])) {
        ++n;
    }
    return n;
}

} // namespace

decimal decimal::parse(std::string_view text) {
    auto fail = [&] {
        return malformed_value_exception(seastar::format("Text '{}' is not a valid decimal number", text));
    };
    size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        negative = text[pos] == '-';
        ++pos;
    }
    size_t integral = count_digits(text, pos);
    std::string digits(text.substr(pos, integral));
    pos += integral;
    size_t fractional = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        fractional = count_digits(text, pos);
        digits.append(text.substr(pos, fractional));
        pos += fractional;
    }
    if (digits.empty()) {
        throw fail();
    }
    int64_t exponent = 0;
    if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
        ++pos;
        if (pos < text.size() && text[pos] == '+') {
            ++pos;
        }
        auto [end, ec] = std::from_chars(text.data() + pos, text.data() + text.size(), exponent);
        if (ec != std::errc() || end == text.data() + pos) {
            throw fail();
        }
        pos = end - text.data();
    }
    if (pos != text.size()) {
        throw fail();
    }
    int64_t scale = static_cast<int64_t>(fractional) - exponent;
    if (scale > std::numeric_limits<int32_t>::max() || scale < std::numeric_limits<int32_t>::min()) {
        throw fail();
    }
    boost::multiprecision::cpp_int unscaled(digits);
    if (negative) {
        unscaled = -unscaled;
    }
    return decimal(std::move(unscaled), static_cast<int32_t>(scale));
}

std::string decimal::to_string() const {
    boost::multiprecision::cpp_int magnitude = abs(_unscaled);
    std::string digits = magnitude.str();
    std::string out = _unscaled < 0 ? "-" : "";
    if (_scale <= 0) {
        out += digits;
        if (_unscaled != 0) {
            out.append(static_cast<size_t>(-static_cast<int64_t>(_scale)), '0');
        }
        return out;
    }
    size_t scale = static_cast<size_t>(_scale);
    if (digits.size() <= scale) {
        digits.insert(0, scale - digits.size() + 1, '0');
    }
    out += digits.substr(0, digits.size() - scale);
    out += '.';
    out += digits.substr(digits.size() - scale);
    return out;
}

bool operator==(const decimal& a, const decimal& b) {
    return a.scale() == b.scale() && a.unscaled() == b.unscaled();
}

bool operator==(const timestamp& a, const timestamp& b) {
    return a.millis == b.millis;
}

bool operator==(const enum_value& a, const enum_value& b) {
    return a.ordinal == b.ordinal;
}

bool operator==(const array_value& a, const array_value& b) {
    return a.elements == b.elements;
}

bool operator==(const map_value& a, const map_value& b) {
    return a.entries == b.entries;
}

bool operator==(const row_value& a, const row_value& b) {
    return a.values == b.values;
}

bool operator==(const value& a, const value& b) {
    return a.v == b.v;
}

const char* shape_name(const value& v) {
    return std::visit(overloaded {
        [] (const std::monostate&) { return "null"; },
        [] (const int8_t&) { return "byte"; },
        [] (const int16_t&) { return "int16"; },
        [] (const int32_t&) { return "int32"; },
        [] (const int64_t&) { return "int64"; },
        [] (const float&) { return "float"; },
        [] (const double&) { return "double"; },
        [] (const bool&) { return "boolean"; },
        [] (const decimal&) { return "decimal"; },
        [] (const std::string&) { return "string"; },
        [] (const bytes&) { return "bytes"; },
        [] (const timestamp&) { return "timestamp"; },
        [] (const date&) { return "date"; },
        [] (const time_of_day&) { return "time"; },
        [] (const local_date_time&) { return "datetime"; },
        [] (const enum_value&) { return "enum"; },
        [] (const array_value&) { return "array"; },
        [] (const map_value&) { return "map"; },
        [] (const row_value&) { return "row"; },
    }, v.v);
}

std::ostream& operator<<(std::ostream& out, const decimal& d) {
    return out << d.to_string();
}

std::ostream& operator<<(std::ostream& out, const row_value& r) {
    out << "{";
    const char* separator = "";
    for (const value& v : r.values) {
        out << separator << v;
        separator = ", ";
    }
    return out << "}";
}

std::ostream& operator<<(std::ostream& out, const value& v) {
    std::visit(overloaded {
        [&] (const std::monostate&) { out << "null"; },
        // Printed as numbers, not characters.
        [&] (const int8_t& x) { out << static_cast<int>(x); },
        [&] (const bool& x) { out << (x ? "true" : "false"); },
        [&] (const std::string& x) { out << '"' << x << '"'; },
        [&] (const bytes& x) { out << "bytes[" << x.size() << "]"; },
        [&] (const timestamp& x) { out << format_timestamp(x); },
        [&] (const date& x) { out << format_date(x); },
        [&] (const time_of_day& x) { out << format_time(x); },
        [&] (const local_date_time& x) { out << format_local_date_time(x); },
        [&] (const enum_value& x) { out << "enum(" << x.ordinal << ")"; },
        [&] (const array_value& x) {
            out << "[";
            const char* separator = "";
            for (const value& e : x.elements) {
                out << separator << e;
                separator = ", ";
            }
            out << "]";
        },
        [&] (const map_value& x) {
            out << "{";
            const char* separator = "";
            for (const auto& [k, e] : x.entries) {
                out << separator << k << ": " << e;
                separator = ", ";
            }
            out << "}";
        },
        [&] (const row_value& x) { out << x; },
        [&] (const auto& x) { out << x; },
    }, v.v);
    return out;
}

} // namespace bqconv
