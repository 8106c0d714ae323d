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

#include <bqconv/time_format.hh>
#include <bqconv/exception.hh>

#include <fmt/format.h>
#include <stdexcept>

namespace bqconv {

namespace {

constexpr int64_t millis_per_day = 86400000;
constexpr int64_t nanos_per_day = 86400000000000;

const date epoch_date{1970, 1, 1};

int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

// Cursor over the text being parsed. Every mismatch is reported against the whole input.
class text_cursor {
    std::string_view _text;
    std::string_view _what;
    size_t _pos = 0;
public:
    text_cursor(std::string_view text, std::string_view what) : _text(text), _what(what) {}

    [[noreturn]] void fail() const {
        throw malformed_value_exception(seastar::format("Text '{}' could not be parsed as {}", _text, _what));
    }
    bool at_end() const { return _pos == _text.size(); }
    bool peek(char c) const { return _pos < _text.size() && _text[_pos] == c; }
    void expect(char c) {
        if (!peek(c)) {
            fail();
        }
        ++_pos;
    }
    void expect(std::string_view literal) {
        if (_text.substr(_pos, literal.size()) != literal) {
            fail();
        }
        _pos += literal.size();
    }
    int fixed_digits(size_t n) {
        int result = 0;
        for (size_t i = 0; i < n; ++i) {
            if (_pos >= _text.size() || _text[_pos] < '0' || _text[_pos] > '9') {
                fail();
            }
            result = result * 10 + (_text[_pos] - '0');
            ++_pos;
        }
        return result;
    }
    // Reads 1 to max_digits digits, scaled to exactly `scale` digits (truncating or zero padding).
    int64_t fraction(size_t max_digits, size_t scale) {
        size_t start = _pos;
        int64_t result = 0;
        size_t used = 0;
        while (_pos < _text.size() && _text[_pos] >= '0' && _text[_pos] <= '9') {
            if (_pos - start >= max_digits) {
                fail();
            }
            if (used < scale) {
                result = result * 10 + (_text[_pos] - '0');
                ++used;
            }
            ++_pos;
        }
        if (_pos == start) {
            fail();
        }
        for (; used < scale; ++used) {
            result *= 10;
        }
        return result;
    }
    void expect_end() {
        if (!at_end()) {
            fail();
        }
    }
};

date read_date(text_cursor& cursor) {
    int year = cursor.fixed_digits(4);
    cursor.expect('-');
    int month = cursor.fixed_digits(2);
    cursor.expect('-');
    int day = cursor.fixed_digits(2);
    try {
        return date(year, month, day);
    } catch (const std::out_of_range&) {
        cursor.fail();
    }
}

// Seconds are optional only when `seconds_required` is false. Returns microseconds of day.
int64_t read_time(text_cursor& cursor, bool seconds_required, size_t max_fraction_digits) {
    int hours = cursor.fixed_digits(2);
    cursor.expect(':');
    int minutes = cursor.fixed_digits(2);
    int seconds = 0;
    int64_t micros = 0;
    if (seconds_required || cursor.peek(':')) {
        cursor.expect(':');
        seconds = cursor.fixed_digits(2);
        if (cursor.peek('.')) {
            cursor.expect('.');
            micros = cursor.fraction(max_fraction_digits, 6);
        }
    }
    if (hours > 23 || minutes > 59 || seconds > 59) {
        cursor.fail();
    }
    return ((hours * 60 + minutes) * 60 + seconds) * int64_t(1000000) + micros;
}

int64_t days_since_epoch(const date& d) {
    return (d - epoch_date).days();
}

std::string format_ymd(const date& d) {
    return fmt::format("{:04d}-{:02d}-{:02d}",
            static_cast<int>(d.year()), static_cast<int>(d.month()), static_cast<int>(d.day()));
}

std::string format_hms(const time_of_day& t) {
    std::string out = fmt::format("{:02d}:{:02d}:{:02d}", t.hours(), t.minutes(), t.seconds());
    int64_t micros = t.total_microseconds() % 1000000;
    if (micros != 0) {
        out += fmt::format(".{:06d}", micros);
    }
    return out;
}

} // namespace

std::string format_timestamp(timestamp ts) {
    int64_t day = floor_div(ts.millis, millis_per_day);
    int64_t millis_of_day = ts.millis - day * millis_per_day;
    date d = date_from_epoch_days(day);
    int64_t seconds_of_day = millis_of_day / 1000;
    return fmt::format("{} {:02d}:{:02d}:{:02d}.{:03d} UTC",
            format_ymd(d),
            seconds_of_day / 3600,
            (seconds_of_day / 60) % 60,
            seconds_of_day % 60,
            millis_of_day % 1000);
}

timestamp parse_timestamp(std::string_view text) {
    text_cursor cursor(text, "a timestamp");
    date d = read_date(cursor);
    cursor.expect(' ');
    int64_t micros_of_day = read_time(cursor, true, 6);
    cursor.expect(" UTC");
    cursor.expect_end();
    return timestamp{days_since_epoch(d) * millis_per_day + micros_of_day / 1000};
}

std::string format_date(const date& d) {
    return format_ymd(d);
}

date parse_date(std::string_view text) {
    text_cursor cursor(text, "a date");
    date d = read_date(cursor);
    cursor.expect_end();
    return d;
}

std::string format_time(const time_of_day& t) {
    return format_hms(t);
}

time_of_day parse_time(std::string_view text) {
    text_cursor cursor(text, "a time");
    int64_t micros = read_time(cursor, false, 9);
    cursor.expect_end();
    return boost::posix_time::microseconds(micros);
}

std::string format_local_date_time(const local_date_time& dt) {
    return format_ymd(dt.date()) + 'T' + format_hms(dt.time_of_day());
}

local_date_time parse_local_date_time(std::string_view text) {
    text_cursor cursor(text, "a datetime");
    date d = read_date(cursor);
    if (cursor.peek(' ')) {
        cursor.expect(' ');
    } else {
        cursor.expect('T');
    }
    int64_t micros = read_time(cursor, false, 9);
    cursor.expect_end();
    return local_date_time(d, boost::posix_time::microseconds(micros));
}

date date_from_epoch_days(int64_t days) {
    // Boost.Date_Time keeps day numbers in 32 bits and covers years 1400 to 9999 only.
    static const int64_t first_day = (date(1400, 1, 1) - epoch_date).days();
    static const int64_t last_day = (date(9999, 12, 31) - epoch_date).days();
    if (days < first_day || days > last_day) {
        throw malformed_value_exception(seastar::format("Epoch day {} is outside the supported date range", days));
    }
    return epoch_date + boost::gregorian::days(days);
}

time_of_day time_from_nanos_of_day(int64_t nanos) {
    if (nanos < 0 || nanos >= nanos_per_day) {
        throw malformed_value_exception(seastar::format("Invalid value for nano of day: {}", nanos));
    }
    return boost::posix_time::microseconds(nanos / 1000);
}

} // namespace bqconv
