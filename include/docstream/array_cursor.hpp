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

#include "logging.hpp"
#include "path_expression.hpp"
#include "pull_parser.hpp"
#include "types.hpp"
#include <fstream>
#include <memory>
#include <optional>
#include <string>

namespace docstream {

// Forward-only, single-pass sequence over the values selected by a path
// expression. Owns the file handle from open() until exhaustion, close()
// or destruction, whichever comes first. Not restartable.
class ArrayCursor {
public:
    // std::nullopt if the file cannot be opened
    static std::optional<ArrayCursor> open(const std::string &path,
                                           const PathExpression &expression,
                                           const Logger &log = Logger());

    ~ArrayCursor();

    ArrayCursor(ArrayCursor &&other) noexcept;
    ArrayCursor &operator=(ArrayCursor &&other) noexcept;
    ArrayCursor(const ArrayCursor &) = delete;
    ArrayCursor &operator=(const ArrayCursor &) = delete;

    // Next selected value, or std::nullopt at end of sequence (and on every
    // call after that). A ParseError closes the cursor before propagating.
    std::optional<json> next();

    // Release the file handle. Safe to call repeatedly.
    void close();

    bool exhausted() const { return exhausted_; }

    const std::string &path() const { return path_; }
    const PathExpression &expression() const { return expression_; }

    // Items produced so far
    std::size_t count() const { return count_; }

private:
    ArrayCursor(std::string path, PathExpression expression, std::unique_ptr<std::ifstream> file,
                Logger log);

    std::string path_;
    PathExpression expression_;
    std::unique_ptr<std::ifstream> file_;
    std::unique_ptr<PullParser> parser_;
    Logger log_;
    std::size_t count_ = 0;
    bool exhausted_ = false;
};

} // namespace docstream
