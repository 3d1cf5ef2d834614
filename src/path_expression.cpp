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

#include "docstream/path_expression.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace docstream {

PathExpression PathExpression::parse(const std::string &text) {
    if (text.empty())
        throw std::invalid_argument("Empty path expression");

    PathExpression expr;
    std::stringstream ss(text);
    std::string segment;
    while (std::getline(ss, segment, '.')) {
        if (segment.empty())
            throw std::invalid_argument("Empty segment in path expression: " + text);
        expr.segments_.push_back(Segment{segment, segment == WILDCARD});
    }
    // getline drops a trailing empty segment
    if (text.back() == '.')
        throw std::invalid_argument("Empty segment in path expression: " + text);

    expr.prefix_ = text;
    return expr;
}

bool PathExpression::has_wildcard() const {
    return std::any_of(segments_.begin(), segments_.end(),
                       [](const Segment &s) { return s.wildcard; });
}

} // namespace docstream
