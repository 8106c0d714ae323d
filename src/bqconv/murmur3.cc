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

#include "bqconv/murmur3.hh"

namespace bqconv {

namespace {

constexpr uint32_t c1 = 0xcc9e2d51;
constexpr uint32_t c2 = 0x1b873593;

uint32_t rotl32(uint32_t x, int r) {
    return (x << r) | (x >> (32 - r));
}

uint32_t mix_k1(uint32_t k1) {
    k1 *= c1;
    k1 = rotl32(k1, 15);
    k1 *= c2;
    return k1;
}

uint32_t mix_h1(uint32_t h1, uint32_t k1) {
    h1 ^= k1;
    h1 = rotl32(h1, 13);
    return h1 * 5 + 0xe6546b64;
}

uint32_t fmix32(uint32_t h1, uint32_t length) {
    h1 ^= length;
    h1 ^= h1 >> 16;
    h1 *= 0x85ebca6b;
    h1 ^= h1 >> 13;
    h1 *= 0xc2b2ae35;
    h1 ^= h1 >> 16;
    return h1;
}

uint32_t load_le32(const uint8_t* p) {
    return uint32_t(p[0]) | (uint32_t(p[1]) << 8) | (uint32_t(p[2]) << 16) | (uint32_t(p[3]) << 24);
}

} // namespace

uint32_t murmur3_32(const uint8_t* data, size_t size, uint32_t seed) {
    uint32_t h1 = seed;
    size_t blocks = size / 4;
    for (size_t i = 0; i < blocks; ++i) {
        h1 = mix_h1(h1, mix_k1(load_le32(data + i * 4)));
    }
    const uint8_t* tail = data + blocks * 4;
    uint32_t k1 = 0;
    switch (size & 3) {
    case 3:
        k1 ^= uint32_t(tail[2]) << 16;
        [[fallthrough]];
    case 2:
        k1 ^= uint32_t(tail[1]) << 8;
        [[fallthrough]];
    case 1:
        k1 ^= tail[0];
        h1 ^= mix_k1(k1);
    }
    return fmix32(h1, static_cast<uint32_t>(size));
}

int32_t murmur3_32_int(int32_t x) {
    uint32_t h1 = mix_h1(0, mix_k1(static_cast<uint32_t>(x)));
    return static_cast<int32_t>(fmix32(h1, 4));
}

} // namespace bqconv
