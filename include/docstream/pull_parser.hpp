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

#include "types.hpp"
#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace docstream {

enum class EventKind {
    StartMap,
    MapKey,
    EndMap,
    StartArray,
    EndArray,
    Null,
    Boolean,
    Number,
    String
};

const char *event_kind_to_string(EventKind kind);

// True for Null, Boolean, Number and String
bool is_scalar(EventKind kind);

// One parse event.
// path is "" for the root, "a.b" for members, "a.item" for array elements.
// MapKey, EndMap and EndArray carry the path of their container.
struct Event {
    std::string path;
    EventKind kind;
    json value;
};

// Pull-based JSON tokenizer over a character stream.
// Produces one event per next() call without building a parse tree.
class PullParser {
public:
    explicit PullParser(std::istream &in);

    // Next event, or std::nullopt once the root value is complete.
    // Throws ParseError on malformed input.
    std::optional<Event> next();

    // Bytes consumed so far
    std::size_t position() const { return position_; }

    bool finished() const { return state_ == State::Finished; }

private:
    enum class State {
        Value,        // Expecting a value
        ValueOrClose, // Just after '['
        KeyOrClose,   // Just after '{'
        Key,          // After ',' inside an object
        Colon,        // After a member key
        CommaOrClose, // After a value inside a container
        End,          // Root value done, only whitespace may follow
        Finished
    };

    struct Frame {
        bool object;
        std::string path;
        std::string member_path; // Path of the member currently being read
    };

    std::istream &in_;
    std::size_t position_ = 0;
    State state_ = State::Value;
    std::vector<Frame> stack_;

    int peek_char();
    int get_char();
    void skip_whitespace();

    [[noreturn]] void fail(const std::string &message) const;

    Event read_value();
    Event close_container(char closer);
    void after_value();
    std::string value_path() const;

    std::string read_string_token();
    std::string read_number_token();
    std::string read_literal_token();
    json decode_token(const std::string &token, std::size_t start);
};

// Assembles a full value from a balanced run of events
// (a single scalar, or StartMap/StartArray through the matching end).
class ValueBuilder {
public:
    void feed(const Event &event);

    bool complete() const { return complete_; }

    bool started() const { return started_; }

    // Hand over the built value and reset
    json take();

private:
    json root_;
    std::vector<json *> stack_;
    std::string pending_key_;
    bool started_ = false;
    bool complete_ = false;

    json *attach(json value);
    json &top();
};

} // namespace docstream
