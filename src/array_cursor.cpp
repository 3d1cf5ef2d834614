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

#include "docstream/array_cursor.hpp"
#include <exception>
#include <utility>

namespace docstream {

std::optional<ArrayCursor> ArrayCursor::open(const std::string &path,
                                             const PathExpression &expression,
                                             const Logger &log) {
    auto file = std::make_unique<std::ifstream>(path);
    if (!file->is_open()) {
        log.error("No file found at " + path);
        return std::nullopt;
    }

    log.debug("Opened cursor over " + path + " at '" + expression.prefix() + "'");
    return ArrayCursor(path, expression, std::move(file), log);
}

ArrayCursor::ArrayCursor(std::string path, PathExpression expression,
                         std::unique_ptr<std::ifstream> file, Logger log)
    : path_(std::move(path)), expression_(std::move(expression)), file_(std::move(file)),
      parser_(std::make_unique<PullParser>(*file_)), log_(std::move(log)) {}

ArrayCursor::~ArrayCursor() { close(); }

ArrayCursor::ArrayCursor(ArrayCursor &&other) noexcept
    : path_(std::move(other.path_)), expression_(std::move(other.expression_)),
      file_(std::move(other.file_)), parser_(std::move(other.parser_)),
      log_(std::move(other.log_)), count_(other.count_), exhausted_(other.exhausted_) {
    other.exhausted_ = true;
}

ArrayCursor &ArrayCursor::operator=(ArrayCursor &&other) noexcept {
    if (this != &other) {
        close();

        path_ = std::move(other.path_);
        expression_ = std::move(other.expression_);
        file_ = std::move(other.file_);
        parser_ = std::move(other.parser_);
        log_ = std::move(other.log_);
        count_ = other.count_;
        exhausted_ = other.exhausted_;

        other.exhausted_ = true;
    }
    return *this;
}

std::optional<json> ArrayCursor::next() {
    if (exhausted_)
        return std::nullopt;

    try {
        ValueBuilder builder;
        while (auto event = parser_->next()) {
            if (builder.started()) {
                builder.feed(*event);
                if (builder.complete()) {
                    count_++;
                    return builder.take();
                }
                continue;
            }

            if (event->path != expression_.prefix())
                continue;

            if (is_scalar(event->kind)) {
                count_++;
                return std::move(event->value);
            }
            if (event->kind == EventKind::StartMap || event->kind == EventKind::StartArray)
                builder.feed(*event);
        }
    } catch (const std::exception &) {
        close();
        throw;
    }

    close();
    return std::nullopt;
}

void ArrayCursor::close() {
    if (exhausted_)
        return;
    exhausted_ = true;

    // Parser holds a reference to the stream, drop it first
    parser_.reset();
    if (file_)
        file_->close();
    file_.reset();

    log_.debug("Closed cursor over " + path_ + " after " + std::to_string(count_) + " items");
}

} // namespace docstream
