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
#include "types.hpp"
#include <istream>
#include <optional>
#include <set>
#include <string>

namespace docstream {

// Capture the values at the requested paths in one pass over the stream.
// Names are matched against full event paths, so nested members need
// their dotted path ("config.name"). Missing names are simply absent from
// the returned object. The whole stream is always consumed.
json extract_fields(std::istream &in, const std::set<std::string> &fields);

// Same over a file. Returns std::nullopt if the file cannot be opened.
// Throws ParseError on malformed content.
std::optional<json> read_fields(const std::string &path, const std::set<std::string> &fields,
                                const Logger &log = Logger());

} // namespace docstream
