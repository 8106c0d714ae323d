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

#include <bqconv/value.hh>
#include <string>
#include <string_view>

// Fixed text formats of the warehouse for timestamps, dates, times and civil date-times.
// All parse functions throw malformed_value_exception.
namespace bqconv {

// "yyyy-MM-dd HH:mm:ss.SSS UTC", always three fractional digits.
std::string format_timestamp(timestamp ts);
// "yyyy-MM-dd HH:mm:ss[.f] UTC" with 1 to 6 fractional digits, truncated to milliseconds.
timestamp parse_timestamp(std::string_view text);

// "yyyy-MM-dd"
std::string format_date(const date& d);
date parse_date(std::string_view text);

// "HH:mm:ss" when the sub-second part is zero, "HH:mm:ss.SSSSSS" otherwise.
std::string format_time(const time_of_day& t);
// "HH:mm[:ss[.f]]" with 1 to 9 fractional digits, truncated to microseconds.
time_of_day parse_time(std::string_view text);

// format_date() + 'T' + format_time()
std::string format_local_date_time(const local_date_time& dt);
local_date_time parse_local_date_time(std::string_view text);

date date_from_epoch_days(int64_t days);
time_of_day time_from_nanos_of_day(int64_t nanos);

} // namespace bqconv
