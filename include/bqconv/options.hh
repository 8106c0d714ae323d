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

#include <ostream>

namespace bqconv {

// What to do with a timestamp that carries sub-millisecond precision.
enum class truncate_timestamps {
    REJECT,
    TRUNCATE,
};

inline const char* to_string(truncate_timestamps policy) {
    return policy == truncate_timestamps::TRUNCATE ? "truncate" : "reject";
}

inline std::ostream& operator<<(std::ostream& out, truncate_timestamps policy) {
    return out << to_string(policy);
}

class conversion_options {
    truncate_timestamps _truncate_timestamps = truncate_timestamps::REJECT;
public:
    conversion_options() = default;

    truncate_timestamps timestamp_policy() const { return _truncate_timestamps; }

    conversion_options with_truncate_timestamps(truncate_timestamps policy) const {
        conversion_options copy = *this;
        copy._truncate_timestamps = policy;
        return copy;
    }
};

class schema_conversion_options {
    bool _infer_maps = false;
public:
    schema_conversion_options() = default;

    // A REPEATED struct of exactly `key` then `value` becomes a map instead of an array of rows.
    bool infer_maps() const { return _infer_maps; }

    schema_conversion_options with_infer_maps(bool infer) const {
        schema_conversion_options copy = *this;
        copy._infer_maps = infer;
        return copy;
    }
};

} // namespace bqconv
