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

#include <bqconv/text_parser.hh>
#include <bqconv/exception.hh>
#include <bqconv/overloaded.hh>
#include <bqconv/time_format.hh>
#include <bqconv/type_mapping.hh>

#include <algorithm>

namespace bqconv::text {

using descriptor::table_schema;
using schema::field_type;
using schema::logical_representation;

namespace {

value to_value(const field_type& type, const text_value& raw, const table_schema* nested);
row_value parse_positional(const schema::schema& s, const table_schema& fields, const text_value& row);

const char* json_shape(const text_value& raw) {
    return raw.type_name();
}

[[noreturn]] void not_supported(const text_value& raw, const field_type& type) {
    throw unsupported_type_exception::shape(json_shape(raw), schema::to_string(type));
}

// Lists carry their elements in a {"v": ...} envelope, encoder output does not.
const text_value& unwrap(const text_value& element) {
    if (element.is_object() && element.size() == 1 && element.contains(value_key)) {
        return element[value_key];
    }
    return element;
}

value parse_scalar(const field_type& type, const text_value& raw, const std::string& text, const table_schema* nested) {
    if (auto primitive = type.as_primitive()) {
        return type_mapping::parser_for(primitive->name)(text);
    }
    auto logical = type.as_logical();
    if (!logical) {
        not_supported(raw, type);
    }
    switch (logical->representation) {
    case logical_representation::DATE:
        return parse_date(text);
    case logical_representation::TIME:
        return parse_time(text);
    case logical_representation::DATETIME:
        return parse_local_date_time(text);
    case logical_representation::TIME_WITH_LOCAL_TZ:
        return type_mapping::parser_for(schema::type_name::DATETIME)(text);
    case logical_representation::ENUM: {
        const auto& labels = logical->enum_values;
        for (size_t i = 0; i < labels.size(); ++i) {
            if (labels[i] == text) {
                return enum_value{static_cast<int32_t>(i)};
            }
        }
        throw malformed_value_exception(seastar::format("Unknown enum label '{}'", text));
    }
    case logical_representation::PASS_THROUGH:
        return to_value(logical->base->with_nullable(type.nullable), raw, nested);
    }
    not_supported(raw, type);
}

value parse_list(const field_type& type, const text_value& raw, const table_schema* nested) {
    if (auto array = type.as_array()) {
        array_value out;
        out.elements.reserve(raw.size());
        for (const text_value& element : raw) {
            out.elements.push_back(to_value(*array->element, unwrap(element), nested));
        }
        return out;
    }
    if (auto map = type.as_map()) {
        map_value out;
        for (const text_value& element : raw) {
            const text_value& entry = unwrap(element);
            if (entry.is_object() && entry.contains(map_key_key) && entry.contains(map_value_key)) {
                out.entries.emplace_back(
                        to_value(*map->key, entry[map_key_key], nullptr),
                        to_value(*map->value, entry[map_value_key], nullptr));
            } else if (entry.is_object() && entry.contains(fields_key) && entry[fields_key].is_array()
                    && entry[fields_key].size() == 2) {
                // Positional {"f": [{"v": key}, {"v": value}]}
                const text_value& f = entry[fields_key];
                out.entries.emplace_back(
                        to_value(*map->key, unwrap(f[0]), nullptr),
                        to_value(*map->value, unwrap(f[1]), nullptr));
            } else {
                throw structural_mismatch_exception(seastar::format(
                        "Map entry must be an object with \"key\" and \"value\", got {}", entry.dump()));
            }
        }
        return out;
    }
    if (auto logical = type.as_logical(); logical && logical->representation == logical_representation::PASS_THROUGH) {
        return to_value(logical->base->with_nullable(type.nullable), raw, nested);
    }
    not_supported(raw, type);
}

value parse_object(const field_type& type, const text_value& raw, const table_schema* nested) {
    if (auto row = type.as_row()) {
        if (nested && raw.contains(fields_key)) {
            return parse_positional(*row->row_schema, *nested, raw);
        }
        return parse_without_descriptor(*row->row_schema, raw);
    }
    if (auto logical = type.as_logical(); logical && logical->representation == logical_representation::PASS_THROUGH) {
        return to_value(logical->base->with_nullable(type.nullable), raw, nested);
    }
    not_supported(raw, type);
}

value to_value(const field_type& type, const text_value& raw, const table_schema* nested) {
    if (raw.is_null()) {
        if (!type.nullable) {
            throw non_nullable_null_exception::of(schema::to_string(type));
        }
        return value();
    }
    if (raw.is_string()) {
        value result = parse_scalar(type, raw, raw.get_ref<const std::string&>(), nested);
        // An empty timestamp is null.
        if (result.is_null() && !type.nullable) {
            throw non_nullable_null_exception::of(schema::to_string(type));
        }
        return result;
    }
    if (raw.is_number() || raw.is_boolean()) {
        return parse_scalar(type, raw, raw.dump(), nested);
    }
    if (raw.is_array()) {
        return parse_list(type, raw, nested);
    }
    if (raw.is_object()) {
        return parse_object(type, raw, nested);
    }
    not_supported(raw, type);
}

value parse_field(const schema::field& f, const text_value& raw, const table_schema* nested) {
    if (raw.is_null() && !f.nullable()) {
        throw non_nullable_null_exception(
                seastar::format("Received null value for non-nullable field \"{}\"", f.name));
    }
    return to_value(f.type, raw, nested);
}

row_value parse_positional(const schema::schema& s, const table_schema& fields, const text_value& row) {
    if (!row.is_object() || !row.contains(fields_key) || !row[fields_key].is_array()) {
        throw structural_mismatch_exception(seastar::format("Expected a row of the form {{\"f\": [...]}}, got {}", row.dump()));
    }
    const text_value& cells = row[fields_key];
    row_value out;
    out.values.reserve(s.size());
    for (const schema::field& f : s.fields()) {
        try {
            auto it = std::find_if(fields.begin(), fields.end(), [&] (const descriptor::table_field_schema& d) {
                return d.name == f.name;
            });
            size_t index = it - fields.begin();
            if (it == fields.end() || index >= cells.size()) {
                throw structural_mismatch_exception(seastar::format("No value for field \"{}\" in row", f.name));
            }
            const text_value& raw = unwrap(cells[index]);
            out.values.push_back(parse_field(f, raw, it->fields.empty() ? nullptr : &it->fields));
        } catch (bqconv_exception& e) {
            e.add_field_context(f.name);
            throw;
        }
    }
    return out;
}

} // namespace

row_value parse_with_descriptor(const schema::schema& s, const table_schema& fields, const text_value& row) {
    return parse_positional(s, fields, row);
}

row_value parse_without_descriptor(const schema::schema& s, const text_value& row) {
    if (!row.is_object()) {
        throw structural_mismatch_exception(seastar::format("Expected an object row, got {}", row.type_name()));
    }
    static const text_value missing;
    row_value out;
    out.values.reserve(s.size());
    for (const schema::field& f : s.fields()) {
        try {
            auto it = row.find(f.name);
            out.values.push_back(parse_field(f, it == row.end() ? missing : *it, nullptr));
        } catch (bqconv_exception& e) {
            e.add_field_context(f.name);
            throw;
        }
    }
    return out;
}

} // namespace bqconv::text
