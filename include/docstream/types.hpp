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

#include <cstddef>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace docstream {

// Document values keep object members in insertion order
using json = nlohmann::ordered_json;

// Malformed JSON encountered while reading a document
class ParseError : public std::runtime_error {
public:
    ParseError(std::size_t position, const std::string &message)
        : std::runtime_error("JSON parse error at position " + std::to_string(position) + ": " +
                             message),
          position_(position) {}

    std::size_t position() const { return position_; }

private:
    std::size_t position_;
};

// Join a dotted event path with one more segment
inline std::string join_path(const std::string &prefix, const std::string &segment) {
    if (prefix.empty())
        return segment;
    return prefix + "." + segment;
}

} // namespace docstream
