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

#include <string>
#include <vector>

namespace docstream {

// Dotted address of a value inside a document, e.g. "results.item".
// Literal segments select object members by exact key; the reserved
// segment "item" selects every element of the array at that point.
class PathExpression {
public:
    static constexpr const char *WILDCARD = "item";

    struct Segment {
        std::string key;
        bool wildcard;
    };

    // Throws std::invalid_argument on an empty expression or empty segment
    static PathExpression parse(const std::string &text);

    const std::vector<Segment> &segments() const { return segments_; }

    // Event path carried by the values this expression selects
    const std::string &prefix() const { return prefix_; }

    // First segment
    const std::string &head() const { return segments_.front().key; }

    bool has_wildcard() const;

private:
    std::vector<Segment> segments_;
    std::string prefix_;
};

} // namespace docstream
