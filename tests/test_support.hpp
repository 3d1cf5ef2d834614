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

#include "docstream/logging.hpp"
#include "docstream/types.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace docstream::test {

namespace fs = std::filesystem;

// Scratch directory removed when the test ends
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = fs::temp_directory_path() /
                ("docstream_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    std::string file(const std::string &name) const { return (path_ / name).string(); }

private:
    fs::path path_;
};

inline void write_text(const std::string &path, const std::string &text) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << text;
}

inline std::string read_text(const std::string &path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// Logger whose messages are kept for inspection
struct CapturedLog {
    std::shared_ptr<std::vector<std::pair<LogLevel, std::string>>> messages =
        std::make_shared<std::vector<std::pair<LogLevel, std::string>>>();

    Logger logger() const {
        auto sink = messages;
        return Logger(true, [sink](LogLevel level, const std::string &message) {
            sink->emplace_back(level, message);
        });
    }

    IoConfig config() const {
        IoConfig config;
        auto sink = messages;
        config.log_callback = [sink](LogLevel level, const std::string &message) {
            sink->emplace_back(level, message);
        };
        return config;
    }

    std::size_t count_containing(const std::string &needle) const {
        std::size_t n = 0;
        for (const auto &entry : *messages) {
            if (entry.second.find(needle) != std::string::npos)
                n++;
        }
        return n;
    }
};

} // namespace docstream::test

// gtest would otherwise print values through their iterators
namespace nlohmann {
inline void PrintTo(const docstream::json &value, std::ostream *os) { *os << value.dump(); }
} // namespace nlohmann
