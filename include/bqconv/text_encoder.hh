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
#include <bqconv/text_row.hh>
#include <bqconv/value.hh>

namespace bqconv::text {

// Scalars are written as JSON strings so that 64-bit integers and decimals survive
// JSON number handling. Timestamps are "yyyy-MM-dd HH:mm:ss.SSS UTC", bytes are base64.
// Throws non_nullable_null_exception for a null in a non-nullable position.
text_value encode(const schema::field_type& type, const value& v);

// An object keyed by field name, in schema order. Field errors name the field.
text_value encode_row(const schema::schema& s, const row_value& row);

} // namespace bqconv::text
