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

#include <bqconv/descriptor.hh>
#include <bqconv/value.hh>

#include <nlohmann/json.hpp>
#include <string_view>

// External forms of the table schema. Malformed input throws malformed_value_exception.
namespace bqconv::descriptor {

// The REST shape {"fields": [{"name", "type", "mode", "fields", "description"}, ...]}.
// A bare array of fields is accepted too.
table_schema from_json(const nlohmann::ordered_json& j);
table_schema parse_json(std::string_view text);
nlohmann::ordered_json to_json(const table_schema& fields);

// Thrift compact protocol, see table_schema.thrift.
bytes serialize_table_schema(const table_schema& fields);
table_schema deserialize_table_schema(const bytes& data);

} // namespace bqconv::descriptor
