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

#include <bqconv/schema_translator.hh>
#include <bqconv/exception.hh>
#include <bqconv/type_mapping.hh>
#include "bqconv/logger.hh"

namespace bqconv {

using descriptor::field_mode;
using descriptor::table_field_schema;
using schema::field_type;

namespace {

constexpr std::string_view map_key_field_name = "key";
constexpr std::string_view map_value_field_name = "value";

schema::field field_from_descriptor(const table_field_schema& f, const schema_conversion_options& options);

bool is_map_candidate(const std::vector<table_field_schema>& nested) {
    return nested.size() == 2
            && nested[0].name == map_key_field_name
            && nested[1].name == map_value_field_name;
}

field_type type_from_keyword(const table_field_schema& f, const schema_conversion_options& options) {
    const std::string& keyword = f.type;
    if (keyword == "STRING") {
        return field_type::string();
    } else if (keyword == "BYTES") {
        return field_type::bytes();
    } else if (keyword == "INT64" || keyword == "INTEGER") {
        return field_type::int64();
    } else if (keyword == "FLOAT64" || keyword == "FLOAT") {
        return field_type::float64();
    } else if (keyword == "BOOL" || keyword == "BOOLEAN") {
        return field_type::boolean();
    } else if (keyword == "NUMERIC") {
        return field_type::decimal();
    } else if (keyword == "TIMESTAMP") {
        return field_type::datetime();
    } else if (keyword == "TIME") {
        return field_type::time();
    } else if (keyword == "DATE") {
        return field_type::date();
    } else if (keyword == "DATETIME") {
        return field_type::local_datetime();
    } else if (keyword == "STRUCT" || keyword == "RECORD") {
        if (options.infer_maps() && is_map_candidate(f.fields)) {
            bqlogger.debug("Inferred map for struct field {}", f.name);
            schema::field key = field_from_descriptor(f.fields[0], options);
            schema::field value = field_from_descriptor(f.fields[1], options);
            return field_type::map(std::move(key.type), std::move(value.type));
        }
        return field_type::row(descriptor_to_schema(f.fields, options));
    }
    throw unsupported_type_exception::keyword(keyword);
}

schema::field field_from_descriptor(const table_field_schema& f, const schema_conversion_options& options) {
    field_type type = type_from_keyword(f, options);
    if (f.is_repeated() && !type.as_map()) {
        type = field_type::array(std::move(type));
    }
    type.nullable = !f.is_required();
    schema::field result{f.name, std::move(type), std::nullopt};
    if (f.description && !f.description->empty()) {
        result.description = f.description;
    }
    return result;
}

table_field_schema field_to_descriptor(const schema::field& f) {
    table_field_schema result;
    result.name = f.name;
    if (f.description && !f.description->empty()) {
        result.description = f.description;
    }
    if (!f.nullable()) {
        result.mode = field_mode::REQUIRED;
    }
    const field_type* type = &f.type;
    if (auto array = type->as_array()) {
        type = array->element.get();
        if (type->as_array()) {
            throw structural_mismatch_exception(
                    seastar::format("Array of collection is not supported in BigQuery (field \"{}\")", f.name));
        }
        result.mode = field_mode::REPEATED;
    }
    if (auto row = type->as_row()) {
        result.fields = schema_to_descriptor(*row->row_schema);
        result.type = "STRUCT";
    } else if (auto map = type->as_map()) {
        result.fields = {
            field_to_descriptor(schema::field{std::string(map_key_field_name), *map->key, std::nullopt}),
            field_to_descriptor(schema::field{std::string(map_value_field_name), *map->value, std::nullopt}),
        };
        result.mode = field_mode::REPEATED;
        result.type = "STRUCT";
    } else {
        result.type = type_mapping::keyword_for(*type);
    }
    return result;
}

} // namespace

schema::schema descriptor_to_schema(const descriptor::table_schema& fields, const schema_conversion_options& options) {
    std::vector<schema::field> result;
    result.reserve(fields.size());
    for (const table_field_schema& f : fields) {
        result.push_back(field_from_descriptor(f, options));
    }
    return schema::schema(std::move(result));
}

descriptor::table_schema schema_to_descriptor(const schema::schema& s) {
    descriptor::table_schema result;
    result.reserve(s.size());
    for (const schema::field& f : s.fields()) {
        result.push_back(field_to_descriptor(f));
    }
    return result;
}

} // namespace bqconv
