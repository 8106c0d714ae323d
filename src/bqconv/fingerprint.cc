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

#include <bqconv/fingerprint.hh>
#include <bqconv/exception.hh>
#include <bqconv/type_mapping.hh>
#include "bqconv/murmur3.hh"

namespace bqconv::fingerprint {

namespace {

// Adds a signed 32-bit hash to a 64-bit accumulator, wrapping on overflow.
void accumulate(uint64_t& acc, int32_t hash) {
    acc += static_cast<uint64_t>(static_cast<int64_t>(hash));
}

} // namespace

int64_t hash_schema(const descriptor::table_schema& fields) {
    uint64_t acc = 0;
    for (const descriptor::table_field_schema& f : fields) {
        auto wire = type_mapping::wire_type_for_keyword(f.type);
        if (!wire) {
            throw unsupported_type_exception::keyword(f.type);
        }
        accumulate(acc, murmur3_32_string(f.name));
        accumulate(acc, murmur3_32_int(f.is_repeated() ? 1 : 0));
        accumulate(acc, murmur3_32_int(f.is_required() ? 1 : 0));
        accumulate(acc, murmur3_32_int(static_cast<int32_t>(*wire)));
        if (*wire == type_mapping::wire_type::MESSAGE) {
            acc += static_cast<uint64_t>(hash_schema(f.fields));
        }
    }
    return static_cast<int64_t>(acc);
}

} // namespace bqconv::fingerprint
