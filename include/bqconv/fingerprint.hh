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
#include <cstdint>

namespace bqconv::fingerprint {

// Deterministic 64-bit identity of a table schema, embedded into persisted and streamed
// messages. Per field, the 32-bit murmur3 hashes of the name, the repeated flag, the
// required flag and the storage wire type ordinal are summed with wraparound, plus the
// fingerprint of nested fields for STRUCT and RECORD. Field order does not affect the result.
//
// Any change to this computation breaks compatibility with existing messages.
//
// Throws unsupported_type_exception for a type keyword without a wire type.
int64_t hash_schema(const descriptor::table_schema& fields);

} // namespace bqconv::fingerprint
