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

#include <bqconv/base64.hh>
#include <bqconv/exception.hh>

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/transform_width.hpp>

namespace bqconv {

namespace {

using namespace boost::archive::iterators;

using base64_encoder = base64_from_binary<transform_width<bytes::const_iterator, 6, 8>>;
using base64_decoder = transform_width<binary_from_base64<std::string::const_iterator>, 8, 6>;

bool in_alphabet(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
}

} // namespace

std::string base64_encode(const bytes& data) {
    std::string out(base64_encoder(data.begin()), base64_encoder(data.end()));
    out.append((3 - data.size() % 3) % 3, '=');
    return out;
}

bytes base64_decode(std::string_view text) {
    if (text.size() % 4 != 0) {
        throw malformed_value_exception(seastar::format("Base64 text of length {} is not a multiple of 4", text.size()));
    }
    size_t padding = 0;
    while (padding < 2 && padding < text.size() && text[text.size() - 1 - padding] == '=') {
        ++padding;
    }
    for (size_t i = 0; i < text.size() - padding; ++i) {
        if (!in_alphabet(text[i])) {
            throw malformed_value_exception(seastar::format("Illegal base64 character at offset {}", i));
        }
    }
    // Padding decodes as zero bits which are dropped afterwards.
    std::string input(text);
    input.replace(input.size() - padding, padding, padding, 'A');
    bytes out(base64_decoder(input.cbegin()), base64_decoder(input.cend()));
    out.resize(out.size() - padding);
    return out;
}

} // namespace bqconv
