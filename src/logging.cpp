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

#include "docstream/logging.hpp"
#include <iostream>
#include <utility>

namespace docstream {

Logger::Logger(const IoConfig &config)
    : verbose_(config.verbose), callback_(config.log_callback) {}

Logger::Logger(bool verbose, LogCallback callback)
    : verbose_(verbose), callback_(std::move(callback)) {}

void Logger::debug(const std::string &message) const { log(LogLevel::Debug, message); }
void Logger::info(const std::string &message) const { log(LogLevel::Info, message); }
void Logger::warning(const std::string &message) const { log(LogLevel::Warning, message); }
void Logger::error(const std::string &message) const { log(LogLevel::Error, message); }

void Logger::log(LogLevel level, const std::string &message) const {
    if (callback_) {
        callback_(level, message);
        return;
    }

    switch (level) {
    case LogLevel::Error:
        std::cerr << "Error: " << message << std::endl;
        break;
    case LogLevel::Warning:
        std::cerr << "Warning: " << message << std::endl;
        break;
    case LogLevel::Info:
    case LogLevel::Debug:
        if (verbose_)
            std::cerr << "[" << log_level_to_string(level) << "] " << message << std::endl;
        break;
    }
}

} // namespace docstream
