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

#include <cxxopts.hpp>
#include <iostream>

#include "docstream/commands.hpp"
#include "docstream/version.hpp"

using namespace docstream;

int main(int argc, char *argv[]) {
    cxxopts::Options options(
        "docstream", "Read and write large JSON documents without loading them into memory");

    auto opts = options.add_options();
    opts("h,help", "Print help");
    opts("version", "Print version");
    opts("v,verbose", "Log cursor and writer activity to stderr");
    opts("f,file", "JSON document to read", cxxopts::value<std::string>());
    opts("fields", "Extract fields (comma-separated dotted paths, no spaces)",
         cxxopts::value<std::vector<std::string>>());
    opts("items", "Stream the items at a path expression, one per line",
         cxxopts::value<std::string>());
    opts("count", "Count the items at a path expression", cxxopts::value<std::string>());
    opts("export", "Write --items (and --fields) to a new document", cxxopts::value<std::string>());
    opts("key", "Member name for exported items (default: first segment of --items)",
         cxxopts::value<std::string>()->default_value(""));
    opts("indent", "Indentation for whole-document writes",
         cxxopts::value<int>()->default_value("2"));

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            std::cout << "Examples:" << std::endl;
            std::cout << "  docstream -f run.json                         Pretty-print a document"
                      << std::endl;
            std::cout << "  docstream -f run.json --fields id,meta.name   Extract two fields"
                      << std::endl;
            std::cout << "  docstream -f run.json --items results.item    Stream array items"
                      << std::endl;
            std::cout << "  docstream -f run.json --count results.item    Count array items"
                      << std::endl;
            std::cout << "  docstream -f run.json --items results.item --fields id "
                         "--export out.json"
                      << std::endl;
            return 0;
        }

        if (result.count("version")) {
            std::cout << "docstream v" << VERSION_STRING << std::endl;
            return 0;
        }

        if (!result.count("file")) {
            std::cerr << "Error: --file is required" << std::endl;
            std::cout << options.help() << std::endl;
            return 1;
        }

        IoConfig config;
        config.verbose = result.count("verbose") > 0;
        config.indent = result["indent"].as<int>();

        JsonDocument doc(result["file"].as<std::string>(), config);

        std::set<std::string> fields;
        if (result.count("fields")) {
            for (const auto &field : result["fields"].as<std::vector<std::string>>())
                fields.insert(field);
        }

        if (result.count("export")) {
            if (!result.count("items")) {
                std::cerr << "Error: --export requires --items" << std::endl;
                return 1;
            }
            return cmd_export(doc, result["items"].as<std::string>(), fields,
                              result["key"].as<std::string>(), result["export"].as<std::string>(),
                              config, std::cout);
        }

        if (result.count("count"))
            return cmd_count(doc, result["count"].as<std::string>(), std::cout);

        if (result.count("items"))
            return cmd_items(doc, result["items"].as<std::string>(), std::cout);

        if (!fields.empty())
            return cmd_fields(doc, fields, std::cout);

        return cmd_show(doc, std::cout);

    } catch (const cxxopts::exceptions::exception &e) {
        std::cerr << "Error parsing options: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
