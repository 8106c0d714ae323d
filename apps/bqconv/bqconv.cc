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
#include <bqconv/descriptor_io.hh>
#include <bqconv/exception.hh>
#include <bqconv/fingerprint.hh>
#include <bqconv/schema_translator.hh>
#include <bqconv/text_encoder.hh>
#include <bqconv/text_parser.hh>
#include "bqconv/logger.hh"

#include <avro/DataFile.hh>
#include <seastar/core/app-template.hh>
#include <seastar/core/thread.hh>
#include <fmt/format.h>
#include <fstream>
#include <iostream>
#include <sstream>

using namespace seastar;

using std::cerr;
using std::cout;
using std::endl;

namespace {

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error(format("Could not open {}", path));
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    return contents.str();
}

struct command_context {
    bqconv::descriptor::table_schema descriptor;
    bqconv::schema_conversion_options schema_options;
    bqconv::conversion_options options;
    std::string input_path;
};

// Prints the canonical schema of the descriptor.
void print_schema(const command_context& ctx) {
    cout << bqconv::descriptor_to_schema(ctx.descriptor, ctx.schema_options) << endl;
}

// Converts the descriptor to the canonical schema and back.
void print_descriptor(const command_context& ctx) {
    auto s = bqconv::descriptor_to_schema(ctx.descriptor, ctx.schema_options);
    cout << bqconv::descriptor::to_json(bqconv::schema_to_descriptor(s)).dump(2) << endl;
}

void print_fingerprint(const command_context& ctx) {
    cout << bqconv::fingerprint::hash_schema(ctx.descriptor) << endl;
}

void print_wire(const command_context& ctx) {
    bqconv::bytes wire = bqconv::descriptor::serialize_table_schema(ctx.descriptor);
    std::string hex;
    for (uint8_t b : wire) {
        hex += fmt::format("{:02x}", b);
    }
    cout << hex << endl;
}

// Newline-delimited JSON rows keyed by field name, parsed and encoded again.
void convert_rows(const command_context& ctx) {
    if (ctx.input_path.empty()) {
        throw std::runtime_error("--input is required for the rows command");
    }
    auto s = bqconv::descriptor_to_schema(ctx.descriptor, ctx.schema_options);
    std::ifstream in(ctx.input_path);
    if (!in) {
        throw std::runtime_error(format("Could not open {}", ctx.input_path));
    }
    std::string line;
    size_t line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        if (line.empty()) {
            bqconv::bqlogger.warn("Skipping empty line {}", line_number);
            continue;
        }
        bqconv::text::text_value raw;
        try {
            raw = bqconv::text::text_value::parse(line);
        } catch (const bqconv::text::text_value::parse_error& e) {
            throw std::runtime_error(format("Line {}: {}", line_number, e.what()));
        }
        bqconv::row_value row = bqconv::text::parse_without_descriptor(s, raw);
        bqconv::bqlogger.debug("Line {}: {} values", line_number, row.values.size());
        cout << bqconv::text::encode_row(s, row).dump() << endl;
    }
}

// Records of an Avro object container file, decoded and encoded as text rows.
void convert_avro(const command_context& ctx) {
    if (ctx.input_path.empty()) {
        throw std::runtime_error("--input is required for the avro command");
    }
    auto s = bqconv::descriptor_to_schema(ctx.descriptor, ctx.schema_options);
    avro::DataFileReader<avro::GenericDatum> reader(ctx.input_path.c_str());
    avro::GenericDatum datum(reader.dataSchema());
    size_t count = 0;
    while (reader.read(datum)) {
        if (datum.type() != avro::AVRO_RECORD) {
            throw std::runtime_error(format("Expected Avro records in {}", ctx.input_path));
        }
        bqconv::row_value row = bqconv::avro_decoder::decode_record(s, datum.value<avro::GenericRecord>(), ctx.options);
        cout << bqconv::text::encode_row(s, row).dump() << endl;
        ++count;
    }
    reader.close();
    bqconv::bqlogger.debug("Decoded {} records with timestamp policy {}", count, bqconv::to_string(ctx.options.timestamp_policy()));
}

int run_command(const std::string& command, const command_context& ctx) {
    if (command == "schema") {
        print_schema(ctx);
    } else if (command == "descriptor") {
        print_descriptor(ctx);
    } else if (command == "fingerprint") {
        print_fingerprint(ctx);
    } else if (command == "wire") {
        print_wire(ctx);
    } else if (command == "rows") {
        convert_rows(ctx);
    } else if (command == "avro") {
        convert_avro(ctx);
    } else {
        cerr << "Unknown command: " << command << endl;
        return 2;
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    app_template app;
    namespace bpo = boost::program_options;
    app.add_options()
        ("descriptor,d", bpo::value<std::string>()->required(), "table schema in JSON form")
        ("command,c", bpo::value<std::string>()->default_value("schema"),
                "one of: schema, descriptor, fingerprint, wire, rows, avro")
        ("input,i", bpo::value<std::string>()->default_value(""),
                "newline-delimited JSON rows for the rows command, an Avro container file for the avro command")
        ("infer-maps", bpo::bool_switch(), "read REPEATED key/value structs as maps")
        ("truncate-timestamps", bpo::bool_switch(), "truncate sub-millisecond timestamps instead of failing");

    try {
        return app.run(argc, argv, [&app] {
            auto& args = app.configuration();
            return seastar::async([&args] {
                command_context ctx;
                ctx.descriptor = bqconv::descriptor::parse_json(read_file(args["descriptor"].as<std::string>()));
                ctx.schema_options = ctx.schema_options.with_infer_maps(args["infer-maps"].as<bool>());
                ctx.options = ctx.options.with_truncate_timestamps(args["truncate-timestamps"].as<bool>()
                        ? bqconv::truncate_timestamps::TRUNCATE
                        : bqconv::truncate_timestamps::REJECT);
                ctx.input_path = args["input"].as<std::string>();
                return run_command(args["command"].as<std::string>(), ctx);
            }).handle_exception([] (std::exception_ptr e) {
                cerr << "An error occurred: " << e << endl;
                return 1;
            });
        });
    } catch (const std::exception& e) {
        cerr << "Couldn't start application: " << e.what() << "\n";
        return 1;
    }
}
