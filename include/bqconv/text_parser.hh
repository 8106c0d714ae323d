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
#include <bqconv/schema.hh>
#include <bqconv/text_row.hh>
#include <bqconv/value.hh>

namespace bqconv::text {

// Parses a row in the positional tabledata shape {"f": [{"v": ...}, ...]}. The position of
// each schema field is looked up by name in `fields`, whose order may differ from the schema.
row_value parse_with_descriptor(const schema::schema& s, const descriptor::table_schema& fields, const text_value& row);

// Parses an object keyed by field name. An absent key is null.
row_value parse_without_descriptor(const schema::schema& s, const text_value& row);

} // namespace bqconv::text
