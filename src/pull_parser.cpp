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

#include "docstream/pull_parser.hpp"
#include <stdexcept>
#include <utility>

namespace docstream {

namespace {

constexpr int END_OF_INPUT = std::istream::traits_type::eof();

bool is_number_char(int c) {
    return (c >= '0' && c <= '9') || c == '-' || c == '+' || c == '.' || c == 'e' || c == 'E';
}

} // namespace

const char *event_kind_to_string(EventKind kind) {
    switch (kind) {
    case EventKind::StartMap:
        return "start_map";
    case EventKind::MapKey:
        return "map_key";
    case EventKind::EndMap:
        return "end_map";
    case EventKind::StartArray:
        return "start_array";
    case EventKind::EndArray:
        return "end_array";
    case EventKind::Null:
        return "null";
    case EventKind::Boolean:
        return "boolean";
    case EventKind::Number:
        return "number";
    case EventKind::String:
        return "string";
    default:
        return "unknown";
    }
}

bool is_scalar(EventKind kind) {
    return kind == EventKind::Null || kind == EventKind::Boolean || kind == EventKind::Number ||
           kind == EventKind::String;
}

PullParser::PullParser(std::istream &in) : in_(in) {}

int PullParser::peek_char() { return in_.peek(); }

int PullParser::get_char() {
    int c = in_.get();
    if (c != END_OF_INPUT)
        position_++;
    return c;
}

void PullParser::skip_whitespace() {
    while (true) {
        int c = peek_char();
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r')
            return;
        get_char();
    }
}

void PullParser::fail(const std::string &message) const { throw ParseError(position_, message); }

std::optional<Event> PullParser::next() {
    while (true) {
        if (state_ == State::Finished)
            return std::nullopt;

        skip_whitespace();
        int c = peek_char();

        switch (state_) {
        case State::End:
            if (c != END_OF_INPUT)
                fail("unexpected trailing data after document");
            state_ = State::Finished;
            return std::nullopt;

        case State::Value:
            return read_value();

        case State::ValueOrClose:
            if (c == ']')
                return close_container(']');
            return read_value();

        case State::KeyOrClose:
            if (c == '}')
                return close_container('}');
            [[fallthrough]];

        case State::Key: {
            if (c != '"')
                fail("expected object key");
            std::size_t start = position_;
            json key = decode_token(read_string_token(), start);
            Frame &frame = stack_.back();
            frame.member_path = join_path(frame.path, key.get<std::string>());
            state_ = State::Colon;
            return Event{frame.path, EventKind::MapKey, std::move(key)};
        }

        case State::Colon:
            if (c != ':')
                fail("expected ':' after object key");
            get_char();
            state_ = State::Value;
            continue;

        case State::CommaOrClose:
            if (c == ',') {
                get_char();
                state_ = stack_.back().object ? State::Key : State::Value;
                continue;
            }
            if (c == '}' || c == ']')
                return close_container(static_cast<char>(c));
            if (c == END_OF_INPUT)
                fail("unexpected end of input");
            fail("expected ',' or closing bracket");

        case State::Finished:
            return std::nullopt;
        }
    }
}

Event PullParser::read_value() {
    std::string path = value_path();
    int c = peek_char();

    if (c == '{') {
        get_char();
        stack_.push_back(Frame{true, path, ""});
        state_ = State::KeyOrClose;
        return Event{std::move(path), EventKind::StartMap, nullptr};
    }
    if (c == '[') {
        get_char();
        stack_.push_back(Frame{false, path, ""});
        state_ = State::ValueOrClose;
        return Event{std::move(path), EventKind::StartArray, nullptr};
    }

    std::size_t start = position_;
    EventKind kind = EventKind::Null;
    json value;

    if (c == '"') {
        kind = EventKind::String;
        value = decode_token(read_string_token(), start);
    } else if (c == '-' || (c >= '0' && c <= '9')) {
        kind = EventKind::Number;
        value = decode_token(read_number_token(), start);
    } else if (c == 't' || c == 'f' || c == 'n') {
        std::string literal = read_literal_token();
        if (literal == "true" || literal == "false") {
            kind = EventKind::Boolean;
            value = (literal == "true");
        } else if (literal == "null") {
            kind = EventKind::Null;
        } else {
            throw ParseError(start, "invalid literal '" + literal + "'");
        }
    } else if (c == END_OF_INPUT) {
        fail("unexpected end of input");
    } else {
        fail(std::string("unexpected character '") + static_cast<char>(c) + "'");
    }

    after_value();
    return Event{std::move(path), kind, std::move(value)};
}

Event PullParser::close_container(char closer) {
    if (stack_.back().object != (closer == '}'))
        fail(std::string("mismatched '") + closer + "'");

    get_char();
    Frame frame = std::move(stack_.back());
    stack_.pop_back();
    after_value();
    return Event{std::move(frame.path), frame.object ? EventKind::EndMap : EventKind::EndArray,
                 nullptr};
}

void PullParser::after_value() { state_ = stack_.empty() ? State::End : State::CommaOrClose; }

std::string PullParser::value_path() const {
    if (stack_.empty())
        return "";
    const Frame &top = stack_.back();
    if (top.object)
        return top.member_path;
    return join_path(top.path, "item");
}

std::string PullParser::read_string_token() {
    std::string token;
    token.push_back(static_cast<char>(get_char())); // opening quote

    while (true) {
        int c = get_char();
        if (c == END_OF_INPUT)
            fail("unterminated string");
        token.push_back(static_cast<char>(c));

        if (c == '\\') {
            int escaped = get_char();
            if (escaped == END_OF_INPUT)
                fail("unterminated string");
            token.push_back(static_cast<char>(escaped));
        } else if (c == '"') {
            return token;
        }
    }
}

std::string PullParser::read_number_token() {
    std::string token;
    while (is_number_char(peek_char()))
        token.push_back(static_cast<char>(get_char()));
    return token;
}

std::string PullParser::read_literal_token() {
    std::string token;
    while (true) {
        int c = peek_char();
        if (c < 'a' || c > 'z')
            break;
        token.push_back(static_cast<char>(get_char()));
    }
    return token;
}

// Scalar decoding (escapes, surrogates, UTF-8 validation, number types)
// is delegated to nlohmann
json PullParser::decode_token(const std::string &token, std::size_t start) {
    try {
        return json::parse(token);
    } catch (const json::parse_error &e) {
        throw ParseError(start, e.what());
    }
}

void ValueBuilder::feed(const Event &event) {
    if (complete_)
        throw std::logic_error("ValueBuilder: value already complete");
    started_ = true;

    switch (event.kind) {
    case EventKind::StartMap:
        stack_.push_back(attach(json::object()));
        break;
    case EventKind::StartArray:
        stack_.push_back(attach(json::array()));
        break;
    case EventKind::MapKey:
        pending_key_ = event.value.get<std::string>();
        break;
    case EventKind::EndMap:
    case EventKind::EndArray:
        if (stack_.empty())
            throw std::logic_error("ValueBuilder: unbalanced end event");
        stack_.pop_back();
        if (stack_.empty())
            complete_ = true;
        break;
    default:
        attach(event.value);
        if (stack_.empty())
            complete_ = true;
        break;
    }
}

json ValueBuilder::take() {
    json out = std::move(root_);
    root_ = json();
    stack_.clear();
    pending_key_.clear();
    started_ = false;
    complete_ = false;
    return out;
}

// Containers on the stack are only ever ancestors of the value being
// attached, so growing the innermost one never moves a stacked pointer.
// The root is stacked as nullptr so the builder itself stays movable.
json *ValueBuilder::attach(json value) {
    if (stack_.empty()) {
        root_ = std::move(value);
        return nullptr;
    }

    json &parent = top();
    if (parent.is_object()) {
        json &slot = parent[pending_key_];
        slot = std::move(value);
        return &slot;
    }
    parent.push_back(std::move(value));
    return &parent.back();
}

json &ValueBuilder::top() { return stack_.back() ? *stack_.back() : root_; }

} // namespace docstream
