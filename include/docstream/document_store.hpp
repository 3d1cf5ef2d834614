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

#pragma once

#include "array_cursor.hpp"
#include "logging.hpp"
#include "streaming_writer.hpp"
#include "types.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace docstream {

// Serialize a whole value (UTF-8, non-ASCII kept literal), replacing any
// existing content. Returns false if the file could not be written.
bool write_document(const std::string &path, const json &value, const Logger &log = Logger(),
                    int indent = 2);

// Parse a whole file. std::nullopt if it does not exist; ParseError if it
// is not valid JSON.
std::optional<json> read_document(const std::string &path, const Logger &log = Logger());

// Result of a partial read: extracted fields plus one open cursor per item
// path, keyed by the path's first segment
struct PartialDocument {
    json fields = json::object();
    std::map<std::string, ArrayCursor> cursors;
};

// A JSON document on disk, bound to one path and configuration
class JsonDocument {
public:
    explicit JsonDocument(std::string path, const IoConfig &config = IoConfig{});

    const std::string &path() const { return path_; }
    const IoConfig &config() const { return config_; }

    bool write(const json &value) const;

    bool write_streaming(const json &eager, const std::vector<StreamedKey> &streamed) const;

    std::optional<json> read() const;

    std::optional<json> read_fields(const std::set<std::string> &fields) const;

    // Throws std::invalid_argument on a malformed expression
    std::optional<ArrayCursor> open_cursor(const std::string &expression) const;

    std::optional<PartialDocument> read_partial(const std::set<std::string> &fields,
                                                const std::vector<std::string> &item_paths) const;

private:
    std::string path_;
    IoConfig config_;
    Logger log_;
};

} // namespace docstream
