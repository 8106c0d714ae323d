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

#define BOOST_TEST_MODULE bqconv

#include <bqconv/base64.hh>
#include <bqconv/exception.hh>
#include <bqconv/time_format.hh>
#include <bqconv/value.hh>

#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/test/included/unit_test.hpp>
#include <limits>

using namespace bqconv;

BOOST_AUTO_TEST_CASE(decimal_parse_and_print) {
    decimal d = decimal::parse("123.4500");
    BOOST_CHECK_EQUAL(d.scale(), 4);
    BOOST_CHECK_EQUAL(d.unscaled(), boost::multiprecision::cpp_int(1234500));
    BOOST_CHECK_EQUAL(d.to_string(), "123.4500");

    BOOST_CHECK_EQUAL(decimal::parse("-0.001").to_string(), "-0.001");
    BOOST_CHECK_EQUAL(decimal::parse("+42").to_string(), "42");
    BOOST_CHECK_EQUAL(decimal::parse(".5").to_string(), "0.5");
    BOOST_CHECK_EQUAL(decimal::parse("1.5E3").to_string(), "1500");
    BOOST_CHECK_EQUAL(decimal::parse("15e-3").to_string(), "0.015");

    // 38 digits do not fit any machine integer.
    std::string big = "12345678901234567890123456789.123456789";
    BOOST_CHECK_EQUAL(decimal::parse(big).to_string(), big);
}

BOOST_AUTO_TEST_CASE(decimal_equality_includes_scale) {
    BOOST_CHECK(decimal::parse("1.5") == decimal(15, 1));
    BOOST_CHECK(!(decimal::parse("1.50") == decimal::parse("1.5")));
}

BOOST_AUTO_TEST_CASE(decimal_parse_rejects_garbage) {
    BOOST_CHECK_THROW(decimal::parse(""), malformed_value_exception);
    BOOST_CHECK_THROW(decimal::parse("-"), malformed_value_exception);
    BOOST_CHECK_THROW(decimal::parse("1.2.3"), malformed_value_exception);
    BOOST_CHECK_THROW(decimal::parse("12abc"), malformed_value_exception);
    BOOST_CHECK_THROW(decimal::parse("1e"), malformed_value_exception);
}

BOOST_AUTO_TEST_CASE(base64_known_values) {
    BOOST_CHECK_EQUAL(base64_encode(bytes{'h', 'e', 'l', 'l', 'o'}), "aGVsbG8=");
    BOOST_CHECK_EQUAL(base64_encode(bytes{0x00, 0x01, 0x02, 0xfe, 0xff}), "AAEC/v8=");
    BOOST_CHECK_EQUAL(base64_encode(bytes{'a', 'b'}), "YWI=");
    BOOST_CHECK_EQUAL(base64_encode(bytes{}), "");

    bytes decoded = base64_decode("AAEC/v8=");
    bytes expected{0x00, 0x01, 0x02, 0xfe, 0xff};
    BOOST_CHECK_EQUAL_COLLECTIONS(decoded.begin(), decoded.end(), expected.begin(), expected.end());
    BOOST_CHECK(base64_decode("YWI=") == (bytes{'a', 'b'}));
    BOOST_CHECK(base64_decode("").empty());
}

BOOST_AUTO_TEST_CASE(base64_rejects_malformed) {
    BOOST_CHECK_THROW(base64_decode("abc"), malformed_value_exception);
    BOOST_CHECK_THROW(base64_decode("ab!="), malformed_value_exception);
    BOOST_CHECK_THROW(base64_decode("a==="), malformed_value_exception);
}

BOOST_AUTO_TEST_CASE(timestamp_format) {
    BOOST_CHECK_EQUAL(format_timestamp(timestamp{1565920327123}), "2019-08-16 01:52:07.123 UTC");
    BOOST_CHECK_EQUAL(format_timestamp(timestamp{0}), "1970-01-01 00:00:00.000 UTC");
    BOOST_CHECK_EQUAL(format_timestamp(timestamp{-1}), "1969-12-31 23:59:59.999 UTC");
}

BOOST_AUTO_TEST_CASE(timestamp_parse) {
    BOOST_CHECK(parse_timestamp("2019-08-16 01:52:07.123 UTC") == timestamp{1565920327123});
    BOOST_CHECK(parse_timestamp("2019-08-16 01:52:07 UTC") == timestamp{1565920327000});
    // Microseconds are truncated.
    BOOST_CHECK(parse_timestamp("2019-08-16 01:52:07.123456 UTC") == timestamp{1565920327123});
    BOOST_CHECK(parse_timestamp("2019-08-16 01:52:07.1 UTC") == timestamp{1565920327100});

    BOOST_CHECK_THROW(parse_timestamp("2019-08-16T01:52:07.123 UTC"), malformed_value_exception);
    BOOST_CHECK_THROW(parse_timestamp("2019-08-16 01:52:07.1234567 UTC"), malformed_value_exception);
    BOOST_CHECK_THROW(parse_timestamp("2019-02-30 01:52:07 UTC"), malformed_value_exception);
    BOOST_CHECK_THROW(parse_timestamp("2019-08-16 24:00:00 UTC"), malformed_value_exception);
    BOOST_CHECK_THROW(parse_timestamp("2019-08-16 01:52:07"), malformed_value_exception);
}

BOOST_AUTO_TEST_CASE(time_format_keeps_seconds) {
    using boost::posix_time::hours;
    using boost::posix_time::minutes;
    using boost::posix_time::seconds;
    using boost::posix_time::microseconds;

    BOOST_CHECK_EQUAL(format_time(hours(12) + minutes(30)), "12:30:00");
    BOOST_CHECK_EQUAL(format_time(hours(1) + minutes(2) + seconds(3) + microseconds(4)), "01:02:03.000004");
    BOOST_CHECK_EQUAL(format_time(hours(23) + minutes(59) + seconds(59) + microseconds(500000)), "23:59:59.500000");
}

BOOST_AUTO_TEST_CASE(time_parse) {
    using boost::posix_time::hours;
    using boost::posix_time::minutes;
    using boost::posix_time::seconds;
    using boost::posix_time::microseconds;

    BOOST_CHECK_EQUAL(parse_time("12:30"), hours(12) + minutes(30));
    BOOST_CHECK_EQUAL(parse_time("12:30:15"), hours(12) + minutes(30) + seconds(15));
    BOOST_CHECK_EQUAL(parse_time("12:30:15.25"), hours(12) + minutes(30) + seconds(15) + microseconds(250000));
    BOOST_CHECK_EQUAL(parse_time("12:30:15.123456789"), hours(12) + minutes(30) + seconds(15) + microseconds(123456));
    BOOST_CHECK_THROW(parse_time("7:30"), malformed_value_exception);
    BOOST_CHECK_THROW(parse_time("12:60"), malformed_value_exception);
}

BOOST_AUTO_TEST_CASE(date_and_datetime) {
    BOOST_CHECK_EQUAL(format_date(date(2019, 8, 16)), "2019-08-16");
    BOOST_CHECK_EQUAL(parse_date("2019-08-16"), date(2019, 8, 16));
    BOOST_CHECK_EQUAL(date_from_epoch_days(18124), date(2019, 8, 16));
    BOOST_CHECK_EQUAL(date_from_epoch_days(-1), date(1969, 12, 31));
    BOOST_CHECK_THROW(parse_date("2019-13-01"), malformed_value_exception);

    local_date_time dt(date(2019, 8, 16), boost::posix_time::hours(1) + boost::posix_time::minutes(52));
    BOOST_CHECK_EQUAL(format_local_date_time(dt), "2019-08-16T01:52:00");
    BOOST_CHECK_EQUAL(parse_local_date_time("2019-08-16T01:52"), dt);
    BOOST_CHECK_EQUAL(parse_local_date_time("2019-08-16 01:52:00"), dt);

    local_date_time fractional(date(2019, 8, 16), boost::posix_time::hours(1) + boost::posix_time::microseconds(7));
    BOOST_CHECK_EQUAL(format_local_date_time(fractional), "2019-08-16T01:00:00.000007");
    BOOST_CHECK_EQUAL(parse_local_date_time("2019-08-16T01:00:00.000007"), fractional);
}

BOOST_AUTO_TEST_CASE(epoch_days_outside_calendar_range) {
    BOOST_CHECK_EQUAL(date_from_epoch_days(2932896), date(9999, 12, 31));
    BOOST_CHECK_EQUAL(date_from_epoch_days(-208188), date(1400, 1, 1));
    BOOST_CHECK_THROW(date_from_epoch_days(2932897), malformed_value_exception);
    BOOST_CHECK_THROW(date_from_epoch_days(-208189), malformed_value_exception);
    // Must not wrap around the 32-bit day number.
    BOOST_CHECK_THROW(date_from_epoch_days(int64_t(4294967296)), malformed_value_exception);
    BOOST_CHECK_THROW(date_from_epoch_days(int64_t(4294967296) + 18124), malformed_value_exception);
    BOOST_CHECK_THROW(date_from_epoch_days(std::numeric_limits<int64_t>::min()), malformed_value_exception);
}

BOOST_AUTO_TEST_CASE(time_from_nanos) {
    BOOST_CHECK_EQUAL(time_from_nanos_of_day(3723000004000), boost::posix_time::time_duration(1, 2, 3) + boost::posix_time::microseconds(4));
    BOOST_CHECK_THROW(time_from_nanos_of_day(-1), malformed_value_exception);
    BOOST_CHECK_THROW(time_from_nanos_of_day(86400000000000), malformed_value_exception);
}

BOOST_AUTO_TEST_CASE(value_equality_and_shape) {
    value a = array_value{{value(int64_t(1)), value(std::string("x")), value()}};
    value b = array_value{{value(int64_t(1)), value(std::string("x")), value()}};
    BOOST_CHECK_EQUAL(a, b);
    BOOST_CHECK_NE(a, value(array_value{}));
    BOOST_CHECK_EQUAL(shape_name(a), "array");
    BOOST_CHECK_EQUAL(shape_name(value()), "null");
    BOOST_CHECK_EQUAL(shape_name(value(int32_t(3))), "int32");
    // Same number, different width.
    BOOST_CHECK_NE(value(int32_t(3)), value(int64_t(3)));
}
