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

#include <seastar/core/print.hh>
#include <exception>
#include <string>

namespace bqconv {

// Root of everything thrown by the converters. While the exception unwinds through
// nested rows the message is prefixed with the dotted path of the field being converted.
class bqconv_exception : public std::exception {
    std::string _detail;
    std::string _field_path;
    std::string _msg;
public:
    explicit bqconv_exception(const char* msg) : _detail(msg), _msg(msg) {}

    explicit bqconv_exception(std::string msg) : _detail(msg), _msg(std::move(msg)) {}

    // Called innermost field first.
    void add_field_context(const std::string& field_name) {
        _field_path = _field_path.empty() ? field_name : field_name + "." + _field_path;
        _msg = seastar::format("Error converting field \"{}\": {}", _field_path, _detail);
    }

    const std::string& field_path() const { return _field_path; }

    const char* what() const noexcept override { return _msg.c_str(); }
};

// Input the converters cannot map. The caller may retry with different input or options.
class conversion_exception : public bqconv_exception {
public:
    using bqconv_exception::bqconv_exception;
};

class unsupported_type_exception : public conversion_exception {
public:
    using conversion_exception::conversion_exception;

    static unsupported_type_exception keyword(const std::string& type_keyword) {
        return unsupported_type_exception(
                seastar::format("Converting BigQuery type {} to canonical type is unsupported", type_keyword));
    }

    static unsupported_type_exception shape(const std::string& actual, const std::string& declared) {
        return unsupported_type_exception(
                seastar::format("Converting value of shape '{}' to '{}' is not supported", actual, declared));
    }
};

class non_nullable_null_exception : public conversion_exception {
public:
    using conversion_exception::conversion_exception;

    static non_nullable_null_exception of(const std::string& declared) {
        return non_nullable_null_exception(
                seastar::format("Received null value for non-nullable type {}", declared));
    }
};

class structural_mismatch_exception : public conversion_exception {
public:
    using conversion_exception::conversion_exception;
};

class precision_loss_exception : public conversion_exception {
public:
    using conversion_exception::conversion_exception;
};

class malformed_value_exception : public conversion_exception {
public:
    using conversion_exception::conversion_exception;
};

// A logical type none of the converters knows about. This is a defect in the
// schema or in this library, not bad input, so it is kept outside conversion_exception.
class unknown_logical_type_exception : public bqconv_exception {
public:
    explicit unknown_logical_type_exception(const std::string& identifier)
        : bqconv_exception(seastar::format("Unknown logical type {}", identifier)) {}
};

} // namespace bqconv
