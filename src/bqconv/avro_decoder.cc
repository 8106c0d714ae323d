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

#include <bqconv/avro_decoder.hh>
#include <bqconv/exception.hh>
#include <bqconv/overloaded.hh>
#include <bqconv/time_format.hh>
#include "bqconv/logger.hh"

#include <avro/Types.hh>
#include <limits>

namespace bqconv::avro_decoder {

using schema::field_type;
using schema::logical_representation;
using schema::type_name;

namespace {

// NUMERIC is exported with precision 38 and scale 9.
constexpr int32_t numeric_scale = 9;
constexpr int64_t micros_per_day = 86400000000;

[[noreturn]] void wrong_shape(const avro::GenericDatum& datum, const field_type& type) {
    throw unsupported_type_exception::shape(avro::toString(datum.type()), schema::to_string(type));
}

void expect(const avro::GenericDatum& datum, avro::Type expected, const field_type& type) {
    if (datum.type() != expected) {
        wrong_shape(datum, type);
    }
}

int64_t read_long(const avro::GenericDatum& datum, const field_type& type) {
    switch (datum.type()) {
    case avro::AVRO_LONG: return datum.value<int64_t>();
    case avro::AVRO_INT: return datum.value<int32_t>();
    default: wrong_shape(datum, type);
    }
}

double read_double(const avro::GenericDatum& datum, const field_type& type) {
    switch (datum.type()) {
    case avro::AVRO_DOUBLE: return datum.value<double>();
    case avro::AVRO_FLOAT: return datum.value<float>();
    default: wrong_shape(datum, type);
    }
}

bytes read_bytes(const avro::GenericDatum& datum, const field_type& type) {
    switch (datum.type()) {
    case avro::AVRO_BYTES: return datum.value<std::vector<uint8_t>>();
    case avro::AVRO_FIXED: return datum.value<avro::GenericFixed>().value();
    default: wrong_shape(datum, type);
    }
}

std::string read_string(const avro::GenericDatum& datum, const field_type& type) {
    switch (datum.type()) {
    case avro::AVRO_STRING: return datum.value<std::string>();
    case avro::AVRO_ENUM: return datum.value<avro::GenericEnum>().symbol();
    default: wrong_shape(datum, type);
    }
}

timestamp micros_to_timestamp(int64_t micros, truncate_timestamps policy) {
    if (micros % 1000 != 0) {
        if (policy == truncate_timestamps::REJECT) {
            throw precision_loss_exception(seastar::format(
                    "BigQuery data contained value {} with sub-millisecond precision, which is not supported."
                    " You can enable truncating timestamps to millisecond precision"
                    " with the truncate_timestamps conversion option", micros));
        }
        bqlogger.trace("Truncating timestamp {} to millisecond precision", micros);
    }
    return timestamp{micros / 1000};
}

// Big-endian two's complement.
decimal decode_numeric(const bytes& data) {
    boost::multiprecision::cpp_int unscaled;
    import_bits(unscaled, data.begin(), data.end(), 8);
    if (!data.empty() && (data.front() & 0x80)) {
        unscaled -= boost::multiprecision::cpp_int(1) << (8 * data.size());
    }
    return decimal(std::move(unscaled), numeric_scale);
}

value decode_primitive(type_name name, const avro::GenericDatum& datum, const field_type& type,
        const conversion_options& options) {
    switch (name) {
    case type_name::BYTE: return static_cast<int8_t>(read_long(datum, type));
    case type_name::INT16: return static_cast<int16_t>(read_long(datum, type));
    case type_name::INT32: return static_cast<int32_t>(read_long(datum, type));
    case type_name::INT64: return read_long(datum, type);
    case type_name::FLOAT: return static_cast<float>(read_double(datum, type));
    case type_name::DOUBLE: return read_double(datum, type);
    case type_name::BOOLEAN:
        expect(datum, avro::AVRO_BOOL, type);
        return datum.value<bool>();
    case type_name::STRING: return read_string(datum, type);
    case type_name::BYTES: return read_bytes(datum, type);
    case type_name::DECIMAL: return decode_numeric(read_bytes(datum, type));
    case type_name::DATETIME:
        // Microseconds since the epoch.
        return micros_to_timestamp(read_long(datum, type), options.timestamp_policy());
    }
    wrong_shape(datum, type);
}

value decode_map(const schema::map_type& map, const avro::GenericDatum& datum, const field_type& type,
        const conversion_options& options) {
    map_value out;
    if (datum.type() == avro::AVRO_MAP) {
        for (const auto& [key, entry] : datum.value<avro::GenericMap>().value()) {
            out.entries.emplace_back(decode(*map.key, avro::GenericDatum(key), options), decode(*map.value, entry, options));
        }
        return out;
    }
    expect(datum, avro::AVRO_ARRAY, type);
    for (const avro::GenericDatum& element : datum.value<avro::GenericArray>().value()) {
        expect(element, avro::AVRO_RECORD, type);
        const auto& record = element.value<avro::GenericRecord>();
        if (record.fieldCount() != 2) {
            throw structural_mismatch_exception(seastar::format(
                    "Map entry record must have 2 fields, got {}", record.fieldCount()));
        }
        out.entries.emplace_back(decode(*map.key, record.fieldAt(0), options), decode(*map.value, record.fieldAt(1), options));
    }
    return out;
}

value decode_logical(const schema::logical_type& logical, const avro::GenericDatum& datum, const field_type& type,
        const conversion_options& options) {
    switch (logical.representation) {
    case logical_representation::DATE:
        return date_from_epoch_days(read_long(datum, type));
    case logical_representation::TIME: {
        int64_t micros = read_long(datum, type);
        if (micros < 0 || micros >= micros_per_day) {
            throw malformed_value_exception(seastar::format("Invalid value for time of day in microseconds: {}", micros));
        }
        return time_from_nanos_of_day(micros * 1000);
    }
    case logical_representation::DATETIME:
        expect(datum, avro::AVRO_STRING, type);
        return parse_local_date_time(datum.value<std::string>());
    case logical_representation::TIME_WITH_LOCAL_TZ:
        return micros_to_timestamp(read_long(datum, type), options.timestamp_policy());
    case logical_representation::PASS_THROUGH:
        return decode(*logical.base, datum, options);
    case logical_representation::ENUM:
        break;
    }
    throw unknown_logical_type_exception(logical.identifier);
}

} // namespace

value decode(const field_type& type, const avro::GenericDatum& datum, const conversion_options& options) {
    if (datum.type() == avro::AVRO_NULL) {
        if (!type.nullable) {
            throw non_nullable_null_exception::of(schema::to_string(type));
        }
        return value();
    }
    return std::visit(overloaded {
        [&] (const schema::primitive_type& x) { return decode_primitive(x.name, datum, type, options); },
        [&] (const schema::array_type& x) {
            expect(datum, avro::AVRO_ARRAY, type);
            array_value out;
            for (const avro::GenericDatum& element : datum.value<avro::GenericArray>().value()) {
                out.elements.push_back(decode(*x.element, element, options));
            }
            return value(std::move(out));
        },
        [&] (const schema::map_type& x) { return decode_map(x, datum, type, options); },
        [&] (const schema::row_type& x) {
            expect(datum, avro::AVRO_RECORD, type);
            return value(decode_record(*x.row_schema, datum.value<avro::GenericRecord>(), options));
        },
        [&] (const schema::logical_type& x) { return decode_logical(x, datum, type, options); },
    }, type.type);
}

row_value decode_record(const schema::schema& s, const avro::GenericRecord& record, const conversion_options& options) {
    static const avro::GenericDatum missing;
    row_value out;
    out.values.reserve(s.size());
    for (const schema::field& f : s.fields()) {
        try {
            const avro::GenericDatum& datum = record.hasField(f.name) ? record.field(f.name) : missing;
            out.values.push_back(decode(f.type, datum, options));
        } catch (bqconv_exception& e) {
            e.add_field_context(f.name);
            throw;
        }
    }
    return out;
}

} // namespace bqconv::avro_decoder
