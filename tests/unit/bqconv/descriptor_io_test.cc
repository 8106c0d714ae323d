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

#include <bqconv/descriptor_io.hh>
#include <bqconv/exception.hh>

#include <boost/test/included/unit_test.hpp>

using namespace bqconv;
using namespace bqconv::descriptor;

namespace {

table_field_schema column(std::string name, std::string type, std::optional<field_mode> mode = std::nullopt,
        std::vector<table_field_schema> fields = {}, std::optional<std::string> description = std::nullopt) {
    return table_field_schema{std::move(name), std::move(type), mode, std::move(fields), std::move(description)};
}

table_schema orders() {
    return {
        column("id", "INT64", field_mode::REQUIRED),
        column("note", "STRING", std::nullopt, {}, std::string("free text")),
        column("lines", "RECORD", field_mode::REPEATED, {
            column("sku", "STRING", field_mode::REQUIRED),
            column("price", "NUMERIC"),
            column("extra", "STRUCT", field_mode::NULLABLE, {column("gift", "BOOL")}),
        }),
        column("placed", "TIMESTAMP"),
    };
}

} // namespace

BOOST_AUTO_TEST_CASE(parse_rest_json) {
    table_schema fields = parse_json(R"({"fields": [
        {"name": "id", "type": "INT64", "mode": "REQUIRED"},
        {"name": "note", "type": "STRING", "description": "free text"},
        {"name": "lines", "type": "RECORD", "mode": "REPEATED", "fields": [
            {"name": "sku", "type": "STRING", "mode": "REQUIRED"},
            {"name": "price", "type": "NUMERIC"},
            {"name": "extra", "type": "STRUCT", "mode": "NULLABLE", "fields": [{"name": "gift", "type": "BOOL"}]}
        ]},
        {"name": "placed", "type": "TIMESTAMP"}
    ]})");
    BOOST_CHECK(fields == orders());
}

BOOST_AUTO_TEST_CASE(parse_bare_array) {
    table_schema fields = parse_json(R"([{"name": "id", "type": "INT64"}])");
    BOOST_REQUIRE_EQUAL(fields.size(), 1u);
    BOOST_CHECK_EQUAL(fields[0], column("id", "INT64"));
}

BOOST_AUTO_TEST_CASE(json_round_trip) {
    nlohmann::ordered_json j = to_json(orders());
    BOOST_CHECK(from_json(j) == orders());
    // Absent modes and empty nested lists are not written.
    BOOST_CHECK(!j["fields"][3].contains("mode"));
    BOOST_CHECK(!j["fields"][0].contains("fields"));
    BOOST_CHECK_EQUAL(j["fields"][1]["description"], "free text");
}

BOOST_AUTO_TEST_CASE(malformed_json) {
    BOOST_CHECK_THROW(parse_json("{"), malformed_value_exception);
    BOOST_CHECK_THROW(parse_json(R"({"fields": 3})"), malformed_value_exception);
    BOOST_CHECK_THROW(parse_json(R"([{"type": "INT64"}])"), malformed_value_exception);
    BOOST_CHECK_THROW(parse_json(R"([{"name": "id", "type": 7}])"), malformed_value_exception);
    BOOST_CHECK_THROW(parse_json(R"([{"name": "id", "type": "INT64", "mode": "required"}])"), malformed_value_exception);
}

BOOST_AUTO_TEST_CASE(thrift_round_trip) {
    bytes data = serialize_table_schema(orders());
    BOOST_CHECK(!data.empty());
    BOOST_CHECK(deserialize_table_schema(data) == orders());
    BOOST_CHECK(deserialize_table_schema(serialize_table_schema({})).empty());
}

BOOST_AUTO_TEST_CASE(malformed_thrift) {
    bytes data = serialize_table_schema(orders());
    bytes truncated(data.begin(), data.begin() + data.size() / 2);
    BOOST_CHECK_THROW(deserialize_table_schema(truncated), malformed_value_exception);

    bytes trailing = data;
    trailing.push_back(0);
    BOOST_CHECK_THROW(deserialize_table_schema(trailing), malformed_value_exception);

    BOOST_CHECK_THROW(deserialize_table_schema(bytes{0xff, 0xff, 0xff}), malformed_value_exception);
}
