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

#define BOOST_TEST_MODULE bqconv

#include <bqconv/exception.hh>
#include <bqconv/schema_translator.hh>
#include <bqconv/type_mapping.hh>

#include <boost/test/included/unit_test.hpp>

using namespace bqconv;
using descriptor::field_mode;
using descriptor::table_field_schema;
using schema::field;
using schema::field_type;

namespace {

table_field_schema column(std::string name, std::string type, std::optional<field_mode> mode = std::nullopt,
        std::vector<table_field_schema> fields = {}) {
    return table_field_schema{std::move(name), std::move(type), mode, std::move(fields), std::nullopt};
}

} // namespace

BOOST_AUTO_TEST_CASE(keywords_to_canonical_types) {
    descriptor::table_schema fields{
        column("s", "STRING"),
        column("b", "BYTES"),
        column("i", "INT64"),
        column("i2", "INTEGER"),
        column("f", "FLOAT64"),
        column("f2", "FLOAT"),
        column("bo", "BOOL"),
        column("bo2", "BOOLEAN"),
        column("n", "NUMERIC"),
        column("ts", "TIMESTAMP"),
        column("t", "TIME"),
        column("d", "DATE"),
        column("dt", "DATETIME"),
    };
    schema::schema s = descriptor_to_schema(fields);
    BOOST_REQUIRE_EQUAL(s.size(), fields.size());
    BOOST_CHECK_EQUAL(s.field_at(0).type, field_type::string().with_nullable(true));
    BOOST_CHECK_EQUAL(s.field_at(1).type, field_type::bytes().with_nullable(true));
    BOOST_CHECK_EQUAL(s.field_at(2).type, field_type::int64().with_nullable(true));
    BOOST_CHECK_EQUAL(s.field_at(3).type, field_type::int64().with_nullable(true));
    BOOST_CHECK_EQUAL(s.field_at(4).type, field_type::float64().with_nullable(true));
    BOOST_CHECK_EQUAL(s.field_at(5).type, field_type::float64().with_nullable(true));
    BOOST_CHECK_EQUAL(s.field_at(6).type, field_type::boolean().with_nullable(true));
    BOOST_CHECK_EQUAL(s.field_at(7).type, field_type::boolean().with_nullable(true));
    BOOST_CHECK_EQUAL(s.field_at(8).type, field_type::decimal().with_nullable(true));
    BOOST_CHECK_EQUAL(s.field_at(9).type, field_type::datetime().with_nullable(true));
    BOOST_CHECK_EQUAL(s.field_at(10).type, field_type::time().with_nullable(true));
    BOOST_CHECK_EQUAL(s.field_at(11).type, field_type::date().with_nullable(true));
    BOOST_CHECK_EQUAL(s.field_at(12).type, field_type::local_datetime().with_nullable(true));
}

BOOST_AUTO_TEST_CASE(modes_drive_nullability_and_repetition) {
    descriptor::table_schema fields{
        column("required", "INT64", field_mode::REQUIRED),
        column("nullable", "INT64", field_mode::NULLABLE),
        column("unset", "INT64"),
        column("repeated", "INT64", field_mode::REPEATED),
    };
    schema::schema s = descriptor_to_schema(fields);
    BOOST_CHECK(!s.field_at(0).nullable());
    BOOST_CHECK(s.field_at(1).nullable());
    BOOST_CHECK(s.field_at(2).nullable());
    BOOST_CHECK_EQUAL(s.field_at(3).type, field_type::array(field_type::int64()).with_nullable(true));
}

BOOST_AUTO_TEST_CASE(unknown_keyword_is_unsupported) {
    descriptor::table_schema fields{column("g", "GEOGRAPHY")};
    BOOST_CHECK_THROW(descriptor_to_schema(fields), unsupported_type_exception);
    try {
        descriptor_to_schema(fields);
    } catch (const unsupported_type_exception& e) {
        BOOST_CHECK_EQUAL(std::string(e.what()), "Converting BigQuery type GEOGRAPHY to canonical type is unsupported");
    }
}

BOOST_AUTO_TEST_CASE(nested_struct_and_description) {
    table_field_schema address = column("address", "RECORD", std::nullopt, {
        column("city", "STRING", field_mode::REQUIRED),
        column("zip", "INT64"),
    });
    address.description = "where";
    schema::schema s = descriptor_to_schema({address});

    schema::schema nested{{
        field{"city", field_type::string(), std::nullopt},
        field{"zip", field_type::int64().with_nullable(true), std::nullopt},
    }};
    BOOST_CHECK_EQUAL(s.field_at(0).type, field_type::row(nested).with_nullable(true));
    BOOST_CHECK(s.field_at(0).description == std::optional<std::string>("where"));

    table_field_schema empty_description = column("x", "STRING");
    empty_description.description = "";
    BOOST_CHECK(!descriptor_to_schema({empty_description}).field_at(0).description);
}

BOOST_AUTO_TEST_CASE(map_inference) {
    descriptor::table_schema fields{
        column("m", "STRUCT", field_mode::REPEATED, {
            column("key", "STRING", field_mode::REQUIRED),
            column("value", "INT64", field_mode::REQUIRED),
        }),
    };

    schema::schema inferred = descriptor_to_schema(fields, schema_conversion_options().with_infer_maps(true));
    BOOST_CHECK_EQUAL(inferred.field_at(0).type,
            field_type::map(field_type::string(), field_type::int64()).with_nullable(true));

    schema::schema literal = descriptor_to_schema(fields);
    schema::schema entry{{
        field{"key", field_type::string(), std::nullopt},
        field{"value", field_type::int64(), std::nullopt},
    }};
    BOOST_CHECK_EQUAL(literal.field_at(0).type, field_type::array(field_type::row(entry)).with_nullable(true));
}

BOOST_AUTO_TEST_CASE(map_inference_requires_exact_shape) {
    auto options = schema_conversion_options().with_infer_maps(true);
    descriptor::table_schema swapped{
        column("m", "STRUCT", field_mode::REPEATED, {column("value", "INT64"), column("key", "STRING")}),
    };
    BOOST_CHECK(descriptor_to_schema(swapped, options).field_at(0).type.as_array());

    descriptor::table_schema extra{
        column("m", "STRUCT", field_mode::REPEATED, {column("key", "STRING"), column("value", "INT64"), column("x", "INT64")}),
    };
    BOOST_CHECK(descriptor_to_schema(extra, options).field_at(0).type.as_array());
}

BOOST_AUTO_TEST_CASE(schema_to_descriptor_modes_and_keywords) {
    schema::schema s{{
        field{"b", field_type::byte(), std::nullopt},
        field{"i16", field_type::int16().with_nullable(true), std::nullopt},
        field{"f", field_type::float32(), std::nullopt},
        field{"dec", field_type::decimal(), std::nullopt},
        field{"ts", field_type::datetime(), std::string("event time")},
        field{"tags", field_type::array(field_type::string()).with_nullable(true), std::nullopt},
        field{"day", field_type::date(), std::nullopt},
        field{"tz", field_type::time_with_local_tz(), std::nullopt},
        field{"color", field_type::enumeration({"RED", "GREEN"}), std::nullopt},
        field{"uuid", field_type::pass_through("uuid", field_type::string()), std::nullopt},
    }};
    descriptor::table_schema d = schema_to_descriptor(s);
    BOOST_REQUIRE_EQUAL(d.size(), s.size());
    BOOST_CHECK_EQUAL(d[0], column("b", "INT64", field_mode::REQUIRED));
    BOOST_CHECK_EQUAL(d[1], column("i16", "INT64"));
    BOOST_CHECK_EQUAL(d[2], column("f", "FLOAT64", field_mode::REQUIRED));
    BOOST_CHECK_EQUAL(d[3], column("dec", "NUMERIC", field_mode::REQUIRED));
    BOOST_CHECK_EQUAL(d[4].type, "TIMESTAMP");
    BOOST_CHECK(d[4].description == std::optional<std::string>("event time"));
    BOOST_CHECK_EQUAL(d[5], column("tags", "STRING", field_mode::REPEATED));
    BOOST_CHECK_EQUAL(d[6].type, "DATE");
    BOOST_CHECK_EQUAL(d[7].type, "TIME");
    BOOST_CHECK_EQUAL(d[8].type, "STRING");
    BOOST_CHECK_EQUAL(d[9].type, "STRING");
}

BOOST_AUTO_TEST_CASE(schema_to_descriptor_map_and_array_of_map) {
    field_type map = field_type::map(field_type::string(), field_type::int64().with_nullable(true));
    schema::schema s{{
        field{"m", map, std::nullopt},
        field{"ms", field_type::array(map).with_nullable(true), std::nullopt},
    }};
    descriptor::table_schema d = schema_to_descriptor(s);
    table_field_schema expected = column("m", "STRUCT", field_mode::REPEATED, {
        column("key", "STRING", field_mode::REQUIRED),
        column("value", "INT64"),
    });
    BOOST_CHECK_EQUAL(d[0], expected);
    expected.name = "ms";
    BOOST_CHECK_EQUAL(d[1], expected);

    schema::schema back = descriptor_to_schema(d, schema_conversion_options().with_infer_maps(true));
    BOOST_CHECK_EQUAL(back.field_at(0).type, map.with_nullable(true));
}

BOOST_AUTO_TEST_CASE(array_of_array_is_rejected) {
    schema::schema s{{
        field{"a", field_type::array(field_type::array(field_type::int64())), std::nullopt},
    }};
    BOOST_CHECK_THROW(schema_to_descriptor(s), structural_mismatch_exception);
}

BOOST_AUTO_TEST_CASE(logical_without_keyword_is_unsupported) {
    schema::schema s{{
        field{"x", field_type::logical("geo", field_type::string(), schema::logical_representation::ENUM), std::nullopt},
    }};
    BOOST_CHECK_THROW(schema_to_descriptor(s), unsupported_type_exception);
}

BOOST_AUTO_TEST_CASE(round_trip_preserves_schema) {
    schema::schema nested{{
        field{"street", field_type::string().with_nullable(true), std::nullopt},
        field{"number", field_type::int64(), std::nullopt},
    }};
    schema::schema s{{
        field{"id", field_type::int64(), std::nullopt},
        field{"name", field_type::string().with_nullable(true), std::string("display name")},
        field{"score", field_type::float64().with_nullable(true), std::nullopt},
        field{"active", field_type::boolean(), std::nullopt},
        field{"blob", field_type::bytes().with_nullable(true), std::nullopt},
        field{"amount", field_type::decimal(), std::nullopt},
        field{"at", field_type::datetime().with_nullable(true), std::nullopt},
        field{"day", field_type::date(), std::nullopt},
        field{"clock", field_type::time().with_nullable(true), std::nullopt},
        field{"local", field_type::local_datetime(), std::nullopt},
        field{"tags", field_type::array(field_type::string()).with_nullable(true), std::nullopt},
        field{"address", field_type::row(nested).with_nullable(true), std::nullopt},
        field{"history", field_type::array(field_type::row(nested)).with_nullable(true), std::nullopt},
    }};
    BOOST_CHECK_EQUAL(descriptor_to_schema(schema_to_descriptor(s)), s);
}

BOOST_AUTO_TEST_CASE(duplicate_field_names_are_rejected) {
    descriptor::table_schema fields{column("a", "INT64"), column("a", "STRING")};
    BOOST_CHECK_THROW(descriptor_to_schema(fields), structural_mismatch_exception);
}

BOOST_AUTO_TEST_CASE(type_mapping_tables) {
    using type_mapping::wire_type;
    BOOST_CHECK_EQUAL(std::string(type_mapping::keyword_for(schema::type_name::INT16)), "INT64");
    BOOST_CHECK_EQUAL(std::string(type_mapping::keyword_for(schema::type_name::DATETIME)), "TIMESTAMP");
    BOOST_CHECK(type_mapping::keyword_for_logical("time_with_local_tz") == std::optional<std::string_view>("TIME"));
    BOOST_CHECK(!type_mapping::keyword_for_logical("uuid"));
    BOOST_CHECK(type_mapping::wire_type_for_keyword("DATE") == wire_type::INT32);
    BOOST_CHECK(type_mapping::wire_type_for_keyword("RECORD") == wire_type::MESSAGE);
    BOOST_CHECK(type_mapping::wire_type_for_keyword("NUMERIC") == wire_type::BYTES);
    BOOST_CHECK(!type_mapping::wire_type_for_keyword("ARRAY"));
}

BOOST_AUTO_TEST_CASE(primitive_text_parsers) {
    using schema::type_name;
    auto parse = [] (type_name name, std::string_view text) { return type_mapping::parser_for(name)(text); };
    BOOST_CHECK_EQUAL(parse(type_name::BYTE, "-128"), value(int8_t(-128)));
    BOOST_CHECK_THROW(parse(type_name::BYTE, "128"), malformed_value_exception);
    BOOST_CHECK_EQUAL(parse(type_name::INT32, "+17"), value(int32_t(17)));
    BOOST_CHECK_EQUAL(parse(type_name::INT64, "9223372036854775807"), value(int64_t(9223372036854775807)));
    BOOST_CHECK_THROW(parse(type_name::INT64, "12x"), malformed_value_exception);
    BOOST_CHECK_THROW(parse(type_name::INT64, ""), malformed_value_exception);
    BOOST_CHECK_EQUAL(parse(type_name::DOUBLE, "2.5"), value(2.5));
    BOOST_CHECK_EQUAL(parse(type_name::FLOAT, "0.5"), value(0.5f));
    BOOST_CHECK_THROW(parse(type_name::DOUBLE, "2.5.1"), malformed_value_exception);
    BOOST_CHECK_EQUAL(parse(type_name::BOOLEAN, "TRUE"), value(true));
    BOOST_CHECK_EQUAL(parse(type_name::BOOLEAN, "yes"), value(false));
    BOOST_CHECK_EQUAL(parse(type_name::STRING, "abc"), value(std::string("abc")));
    BOOST_CHECK_EQUAL(parse(type_name::BYTES, "YWI="), value(bytes{'a', 'b'}));
    BOOST_CHECK_EQUAL(parse(type_name::DECIMAL, "1.25"), value(decimal::parse("1.25")));
    BOOST_CHECK_EQUAL(parse(type_name::DATETIME, "2019-08-16 01:52:07.123 UTC"), value(timestamp{1565920327123}));
    BOOST_CHECK_EQUAL(parse(type_name::DATETIME, "1565920327.5"), value(timestamp{1565920327500}));
    BOOST_CHECK(parse(type_name::DATETIME, "").is_null());
}
