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

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace bqconv {

// MurmurHash3 x86 32-bit. Bit-compatible with Guava's Hashing.murmur3_32() for
// UTF-8 strings and for 32-bit integers hashed as 4 little-endian bytes.
uint32_t murmur3_32(const uint8_t* data, size_t size, uint32_t seed = 0);

inline int32_t murmur3_32_string(std::string_view utf8) {
    return static_cast<int32_t>(murmur3_32(reinterpret_cast<const uint8_t*>(utf8.data()), utf8.size()));
}

int32_t murmur3_32_int(int32_t x);

} // namespace bqconv
