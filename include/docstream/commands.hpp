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

#include "document_store.hpp"
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace docstream {

// Command implementations for the command-line tool.
// Each returns the process exit code and writes results to `out`.

int cmd_show(const JsonDocument &doc, std::ostream &out);
int cmd_fields(const JsonDocument &doc, const std::set<std::string> &fields, std::ostream &out);
int cmd_items(const JsonDocument &doc, const std::string &item_path, std::ostream &out);
int cmd_count(const JsonDocument &doc, const std::string &item_path, std::ostream &out);

// Write `output` with the extracted fields as eager members and the items
// at `item_path` streamed under `key` (defaults to the path's first segment)
int cmd_export(const JsonDocument &doc, const std::string &item_path,
               const std::set<std::string> &fields, const std::string &key,
               const std::string &output, const IoConfig &config, std::ostream &out);

} // namespace docstream
