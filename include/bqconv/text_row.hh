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

#include <nlohmann/json.hpp>

namespace bqconv::text {

// JSON-like row shape of the warehouse REST API. Objects keep insertion order.
using text_value = nlohmann::ordered_json;

// Envelope keys of the positional tabledata shape {"f": [{"v": ...}, ...]}.
constexpr const char* fields_key = "f";
constexpr const char* value_key = "v";

// Entry keys of a map encoded as a list of structs.
constexpr const char* map_key_key = "key";
constexpr const char* map_value_key = "value";

} // namespace bqconv::text
