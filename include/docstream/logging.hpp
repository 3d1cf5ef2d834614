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

#include <functional>
#include <string>

namespace docstream {

enum class LogLevel { Debug, Info, Warning, Error };

inline const char *log_level_to_string(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warning:
        return "warning";
    case LogLevel::Error:
        return "error";
    default:
        return "unknown";
    }
}

// Receives every message when installed
using LogCallback = std::function<void(LogLevel level, const std::string &message)>;

// I/O layer configuration
struct IoConfig {
    bool verbose = false;
    LogCallback log_callback = nullptr;

    // Indentation used for whole-document writes
    int indent = 2;
};

// Logging context handed to each component.
// Without a callback, warnings and errors go to stderr and debug/info
// messages only when verbose is set.
class Logger {
public:
    Logger() = default;
    explicit Logger(const IoConfig &config);
    Logger(bool verbose, LogCallback callback);

    void debug(const std::string &message) const;
    void info(const std::string &message) const;
    void warning(const std::string &message) const;
    void error(const std::string &message) const;

    void log(LogLevel level, const std::string &message) const;

    bool verbose() const { return verbose_; }

private:
    bool verbose_ = false;
    LogCallback callback_ = nullptr;
};

} // namespace docstream
