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

#include "docstream/document_store.hpp"
#include "docstream/field_extractor.hpp"
#include <fstream>
#include <utility>

namespace docstream {

bool write_document(const std::string &path, const json &value, const Logger &log, int indent) {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        log.error("Failed to open file for writing: " + path);
        return false;
    }

    file << value.dump(indent, ' ', false);
    file.flush();
    if (!file) {
        log.error("Failed to write file: " + path);
        return false;
    }
    log.info("Wrote " + path);
    return true;
}

std::optional<json> read_document(const std::string &path, const Logger &log) {
    std::ifstream file(path);
    if (!file.is_open()) {
        log.error("No file found at " + path);
        return std::nullopt;
    }

    try {
        return json::parse(file);
    } catch (const json::parse_error &e) {
        throw ParseError(e.byte, e.what());
    }
}

JsonDocument::JsonDocument(std::string path, const IoConfig &config)
    : path_(std::move(path)), config_(config), log_(config) {}

bool JsonDocument::write(const json &value) const {
    return write_document(path_, value, log_, config_.indent);
}

bool JsonDocument::write_streaming(const json &eager,
                                   const std::vector<StreamedKey> &streamed) const {
    return docstream::write_streaming(path_, eager, streamed, log_);
}

std::optional<json> JsonDocument::read() const { return read_document(path_, log_); }

std::optional<json> JsonDocument::read_fields(const std::set<std::string> &fields) const {
    return docstream::read_fields(path_, fields, log_);
}

std::optional<ArrayCursor> JsonDocument::open_cursor(const std::string &expression) const {
    return ArrayCursor::open(path_, PathExpression::parse(expression), log_);
}

std::optional<PartialDocument>
JsonDocument::read_partial(const std::set<std::string> &fields,
                           const std::vector<std::string> &item_paths) const {
    // Validate every expression before opening anything
    std::vector<PathExpression> expressions;
    expressions.reserve(item_paths.size());
    for (const auto &item_path : item_paths)
        expressions.push_back(PathExpression::parse(item_path));

    PartialDocument partial;

    if (!fields.empty()) {
        auto extracted = docstream::read_fields(path_, fields, log_);
        if (!extracted)
            return std::nullopt;
        partial.fields = std::move(*extracted);
    }

    // Each cursor gets its own handle
    for (const auto &expression : expressions) {
        auto cursor = ArrayCursor::open(path_, expression, log_);
        if (!cursor)
            return std::nullopt;
        if (partial.cursors.count(expression.head()))
            log_.warning("Replacing cursor for '" + expression.head() + "' with '" +
                         expression.prefix() + "'");
        partial.cursors.insert_or_assign(expression.head(), std::move(*cursor));
    }

    return std::optional<PartialDocument>(std::move(partial));
}

} // namespace docstream
