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
#include <bqconv/options.hh>
#include <bqconv/schema.hh>

namespace bqconv {

// REPEATED wraps the resolved type in an array, unless it resolved to a map.
// A field is nullable unless its mode is REQUIRED.
// Throws unsupported_type_exception for an unknown type keyword.
schema::schema descriptor_to_schema(const descriptor::table_schema& fields,
        const schema_conversion_options& options = schema_conversion_options());

// Non-nullable fields become REQUIRED, arrays and maps REPEATED. Maps become a
// STRUCT of `key` and `value`. Throws structural_mismatch_exception for an array
// of arrays and unsupported_type_exception for a type without a keyword.
descriptor::table_schema schema_to_descriptor(const schema::schema& s);

} // namespace bqconv
