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

#include <bqconv/exception.hh>
#include <bqconv/value.hh>

#include <thrift/Thrift.h>
#include <thrift/protocol/TCompactProtocol.h>
#include <thrift/transport/TBufferTransports.h>

// Compact protocol encoding of generated thrift structs to and from owned byte buffers.
namespace bqconv::thrift_io {

using memory_buffer = apache::thrift::transport::TMemoryBuffer;
using compact_protocol_factory = apache::thrift::protocol::TCompactProtocolFactoryT<memory_buffer>;

template <typename Message>
bytes encode(const Message& msg) {
    auto transport = std::make_shared<memory_buffer>();
    auto protocol = compact_protocol_factory{}.getProtocol(transport);
    msg.write(protocol.get());
    uint8_t* data;
    uint32_t size;
    transport->getBuffer(&data, &size);
    return bytes(data, data + size);
}

// The whole buffer must hold exactly one message.
// Throws malformed_value_exception for truncated, corrupt or trailing input.
template <typename Message>
Message decode(const bytes& data, const char* what) {
    auto transport = std::make_shared<memory_buffer>(const_cast<uint8_t*>(data.data()),
            static_cast<uint32_t>(data.size()), memory_buffer::OBSERVE);
    auto protocol = compact_protocol_factory{}.getProtocol(transport);
    Message msg;
    try {
        msg.read(protocol.get());
    } catch (const apache::thrift::TException& e) {
        throw malformed_value_exception(seastar::format("Could not deserialize {}: {}", what, e.what()));
    }
    if (uint32_t left = transport->available_read(); left != 0) {
        throw malformed_value_exception(seastar::format("Could not deserialize {}: {} trailing bytes", what, left));
    }
    return msg;
}

} // namespace bqconv::thrift_io
