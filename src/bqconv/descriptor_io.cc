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

#include <bqconv/descriptor_io.hh>
#include <bqconv/exception.hh>
#include "bqconv/thrift_io.hh"
#include "bqconv/table_schema_types.h"

namespace bqconv::descriptor {

using json = nlohmann::ordered_json;

namespace {

table_field_schema field_from_json(const json& j) {
    if (!j.is_object()) {
        throw malformed_value_exception(seastar::format("Field descriptor must be an object, got {}", j.dump()));
    }
    auto required_string = [&] (const char* key) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_string()) {
            throw malformed_value_exception(seastar::format("Field descriptor {} has no string \"{}\"", j.dump(), key));
        }
        return it->get<std::string>();
    };
    table_field_schema f;
    f.name = required_string("name");
    f.type = required_string("type");
    if (auto it = j.find("mode"); it != j.end() && !it->is_null()) {
        if (!it->is_string()) {
            throw malformed_value_exception(seastar::format("Mode of field \"{}\" must be a string", f.name));
        }
        f.mode = parse_field_mode(it->get_ref<const std::string&>());
    }
    if (auto it = j.find("description"); it != j.end() && !it->is_null()) {
        if (!it->is_string()) {
            throw malformed_value_exception(seastar::format("Description of field \"{}\" must be a string", f.name));
        }
        f.description = it->get<std::string>();
    }
    if (auto it = j.find("fields"); it != j.end() && !it->is_null()) {
        f.fields = from_json(*it);
    }
    return f;
}

json field_to_json(const table_field_schema& f) {
    json j = json::object();
    j["name"] = f.name;
    j["type"] = f.type;
    if (f.mode) {
        j["mode"] = to_string(*f.mode);
    }
    if (!f.fields.empty()) {
        j["fields"] = to_json(f.fields)["fields"];
    }
    if (f.description) {
        j["description"] = *f.description;
    }
    return j;
}

void flatten(const table_field_schema& f, std::vector<format::SchemaElement>& out) {
    format::SchemaElement element;
    element.__set_name(f.name);
    element.__set_type(f.type);
    if (f.mode) {
        element.__set_mode(static_cast<format::FieldMode::type>(*f.mode));
    }
    if (f.description) {
        element.__set_description(*f.description);
    }
    if (!f.fields.empty()) {
        element.__set_num_children(static_cast<int32_t>(f.fields.size()));
    }
    out.push_back(std::move(element));
    for (const table_field_schema& child : f.fields) {
        flatten(child, out);
    }
}

field_mode mode_from_thrift(format::FieldMode::type mode) {
    switch (mode) {
    case format::FieldMode::REQUIRED: return field_mode::REQUIRED;
    case format::FieldMode::NULLABLE: return field_mode::NULLABLE;
    case format::FieldMode::REPEATED: return field_mode::REPEATED;
    }
    throw malformed_value_exception(seastar::format("Unknown field mode {}", static_cast<int>(mode)));
}

// Rebuilds the field at `index` and its num_children descendants, advancing `index` past them.
table_field_schema unflatten_field(const std::vector<format::SchemaElement>& flat, size_t& index) {
    if (index >= flat.size()) {
        throw malformed_value_exception("Could not build schema tree: unexpected end of flat schema");
    }
    const format::SchemaElement& current = flat[index++];
    table_field_schema f;
    f.name = current.name;
    f.type = current.type;
    if (current.__isset.mode) {
        f.mode = mode_from_thrift(current.mode);
    }
    if (current.__isset.description) {
        f.description = current.description;
    }
    if (current.__isset.num_children) {
        if (current.num_children < 0 || static_cast<size_t>(current.num_children) > flat.size() - index) {
            throw malformed_value_exception(seastar::format(
                    "Could not build schema tree: field \"{}\" claims {} children", f.name, current.num_children));
        }
        f.fields.reserve(current.num_children);
        for (int32_t i = 0; i < current.num_children; ++i) {
            f.fields.push_back(unflatten_field(flat, index));
        }
    }
    return f;
}

table_schema unflatten(const std::vector<format::SchemaElement>& flat) {
    table_schema result;
    size_t index = 0;
    while (index < flat.size()) {
        result.push_back(unflatten_field(flat, index));
    }
    return result;
}

} // namespace

table_schema from_json(const json& j) {
    const json* fields = &j;
    if (j.is_object()) {
        auto it = j.find("fields");
        if (it == j.end()) {
            throw malformed_value_exception("Table schema object has no \"fields\"");
        }
        fields = &*it;
    }
    if (!fields->is_array()) {
        throw malformed_value_exception(seastar::format("Expected a list of fields, got {}", fields->type_name()));
    }
    table_schema result;
    result.reserve(fields->size());
    for (const json& f : *fields) {
        result.push_back(field_from_json(f));
    }
    return result;
}

table_schema parse_json(std::string_view text) {
    json j;
    try {
        j = json::parse(text.begin(), text.end());
    } catch (const json::parse_error& e) {
        throw malformed_value_exception(seastar::format("Could not parse table schema: {}", e.what()));
    }
    return from_json(j);
}

json to_json(const table_schema& fields) {
    json array = json::array();
    for (const table_field_schema& f : fields) {
        array.push_back(field_to_json(f));
    }
    json j = json::object();
    j["fields"] = std::move(array);
    return j;
}

bytes serialize_table_schema(const table_schema& fields) {
    format::TableSchema msg;
    std::vector<format::SchemaElement> flat;
    for (const table_field_schema& f : fields) {
        flatten(f, flat);
    }
    msg.__set_fields(std::move(flat));
    return thrift_io::encode(msg);
}

table_schema deserialize_table_schema(const bytes& data) {
    return unflatten(thrift_io::decode<format::TableSchema>(data, "table schema").fields);
}

} // namespace bqconv::descriptor
