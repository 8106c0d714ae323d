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

#include <bqconv/options.hh>
#include <bqconv/schema.hh>
#include <bqconv/value.hh>

#include <avro/Generic.hh>

// Maps values decoded by avro-cpp (the warehouse's export format) into canonical values.
// Unions are resolved to their selected branch, a null branch is a null value.
namespace bqconv::avro_decoder {

// Throws non_nullable_null_exception, precision_loss_exception (sub-millisecond timestamps
// under truncate_timestamps::REJECT), unsupported_type_exception for a datum of the wrong
// shape and unknown_logical_type_exception for a logical type without an Avro mapping.
value decode(const schema::field_type& type, const avro::GenericDatum& datum,
        const conversion_options& options = conversion_options());

// Fields are matched by name, a missing field is null. Field errors name the field.
row_value decode_record(const schema::schema& s, const avro::GenericRecord& record,
        const conversion_options& options = conversion_options());

} // namespace bqconv::avro_decoder
