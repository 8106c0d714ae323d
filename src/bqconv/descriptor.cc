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

#include <bqconv/descriptor.hh>
#include <bqconv/exception.hh>

namespace bqconv::descriptor {

const char* to_string(field_mode mode) {
    switch (mode) {
    case field_mode::REQUIRED: return "REQUIRED";
    case field_mode::NULLABLE: return "NULLABLE";
    case field_mode::REPEATED: return "REPEATED";
    }
    return "UNKNOWN";
}

field_mode parse_field_mode(std::string_view text) {
    for (field_mode mode : {field_mode::REQUIRED, field_mode::NULLABLE, field_mode::REPEATED}) {
        if (text == to_string(mode)) {
            return mode;
        }
    }
    throw malformed_value_exception(seastar::format("Unknown field mode '{}'", text));
}

std::ostream& operator<<(std::ostream& out, field_mode mode) {
    return out << to_string(mode);
}

bool operator==(const table_field_schema& a, const table_field_schema& b) {
    return a.name == b.name
            && a.type == b.type
            && a.mode == b.mode
            && a.fields == b.fields
            && a.description == b.description;
}

std::ostream& operator<<(std::ostream& out, const table_field_schema& f) {
    out << f.name << " " << f.type;
    if (f.mode) {
        out << " " << *f.mode;
    }
    if (!f.fields.empty()) {
        out << " (";
        const char* separator = "";
        for (const table_field_schema& child : f.fields) {
            out << separator << child;
            separator = ", ";
        }
        out << ")";
    }
    return out;
}

} // namespace bqconv::descriptor
