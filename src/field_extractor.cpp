// Copyright 2025 Siddhant Biradar
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "docstream/field_extractor.hpp"
#include "docstream/pull_parser.hpp"
#include <fstream>
#include <utility>
#include <vector>

namespace docstream {

namespace {

// A requested path whose value is still being assembled
struct Capture {
    std::string field;
    ValueBuilder builder;
};

} // namespace

json extract_fields(std::istream &in, const std::set<std::string> &fields) {
    json result = json::object();
    PullParser parser(in);
    std::vector<Capture> active;

    while (auto event = parser.next()) {
        // Feed open captures first; a nested request starting at this
        // event gets its own builder below
        for (auto it = active.begin(); it != active.end();) {
            it->builder.feed(*event);
            if (it->builder.complete()) {
                result[it->field] = it->builder.take();
                it = active.erase(it);
            } else {
                ++it;
            }
        }

        bool starts_value = event->kind == EventKind::StartMap ||
                            event->kind == EventKind::StartArray || is_scalar(event->kind);
        if (!starts_value || fields.count(event->path) == 0)
            continue;

        if (is_scalar(event->kind)) {
            result[event->path] = event->value;
        } else {
            Capture capture{event->path, ValueBuilder()};
            capture.builder.feed(*event);
            active.push_back(std::move(capture));
        }
    }

    return result;
}

std::optional<json> read_fields(const std::string &path, const std::set<std::string> &fields,
                                const Logger &log) {
    std::ifstream file(path);
    if (!file.is_open()) {
        log.error("No file found at " + path);
        return std::nullopt;
    }

    json result = extract_fields(file, fields);
    log.debug("Extracted " + std::to_string(result.size()) + " of " +
              std::to_string(fields.size()) + " fields from " + path);
    return result;
}

} // namespace docstream
