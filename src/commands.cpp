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

#include "docstream/commands.hpp"
#include <filesystem>
#include <iostream>

namespace docstream {

namespace fs = std::filesystem;

int cmd_show(const JsonDocument &doc, std::ostream &out) {
    try {
        auto value = doc.read();
        if (!value)
            return 1;
        out << value->dump(doc.config().indent, ' ', false) << std::endl;
        return 0;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int cmd_fields(const JsonDocument &doc, const std::set<std::string> &fields, std::ostream &out) {
    try {
        auto extracted = doc.read_fields(fields);
        if (!extracted)
            return 1;
        out << extracted->dump(doc.config().indent, ' ', false) << std::endl;
        return 0;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int cmd_items(const JsonDocument &doc, const std::string &item_path, std::ostream &out) {
    try {
        auto cursor = doc.open_cursor(item_path);
        if (!cursor)
            return 1;
        while (auto item = cursor->next())
            out << item->dump() << "\n";
        out.flush();
        return 0;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int cmd_count(const JsonDocument &doc, const std::string &item_path, std::ostream &out) {
    try {
        auto cursor = doc.open_cursor(item_path);
        if (!cursor)
            return 1;
        while (cursor->next()) {
        }
        out << cursor->count() << std::endl;
        return 0;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int cmd_export(const JsonDocument &doc, const std::string &item_path,
               const std::set<std::string> &fields, const std::string &key,
               const std::string &output, const IoConfig &config, std::ostream &out) {
    try {
        std::error_code ec;
        if (fs::exists(output, ec) && fs::equivalent(doc.path(), output, ec)) {
            std::cerr << "Error: Output must differ from the input document" << std::endl;
            return 1;
        }

        auto partial = doc.read_partial(fields, {item_path});
        if (!partial)
            return 1;

        auto cursor_it = partial->cursors.begin();
        std::string member = key.empty() ? cursor_it->first : key;

        JsonDocument target(output, config);
        std::vector<StreamedKey> streamed = {{member, items_from(cursor_it->second)}};
        if (!target.write_streaming(partial->fields, streamed))
            return 1;

        out << "Wrote " << cursor_it->second.count() << " items under '" << member << "' to "
            << output << std::endl;
        return 0;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

} // namespace docstream
