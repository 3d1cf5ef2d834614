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

#include "docstream/streaming_writer.hpp"
#include "docstream/array_cursor.hpp"
#include <fstream>
#include <set>
#include <stdexcept>
#include <utility>

namespace docstream {

ItemSource items_from(ArrayCursor &cursor) {
    return [&cursor]() { return cursor.next(); };
}

ItemSource items_from(std::vector<json> values) {
    return [values = std::move(values), index = std::size_t{0}]() mutable -> std::optional<json> {
        if (index >= values.size())
            return std::nullopt;
        return values[index++];
    };
}

const char *writer_state_to_string(StreamingWriter::State state) {
    switch (state) {
    case StreamingWriter::State::Start:
        return "start";
    case StreamingWriter::State::EmittingEagerKeys:
        return "emitting-eager-keys";
    case StreamingWriter::State::EmittingStreamedKeys:
        return "emitting-streamed-keys";
    case StreamingWriter::State::ArrayOpen:
        return "array-open";
    case StreamingWriter::State::DrainingItems:
        return "draining-items";
    case StreamingWriter::State::Closed:
        return "closed";
    default:
        return "unknown";
    }
}

StreamingWriter::StreamingWriter(std::ostream &out) : out_(out) {}

void StreamingWriter::expect(bool ok, const char *operation) const {
    if (!ok) {
        throw std::logic_error(std::string("StreamingWriter: cannot ") + operation +
                               " in state " + writer_state_to_string(state_));
    }
}

// Separators go before every member but the first, so the last member is
// never followed by one
void StreamingWriter::begin_member(const std::string &key) {
    if (members_ > 0)
        out_ << ",\n";
    out_ << "  " << json(key).dump() << ": ";
    members_++;
}

void StreamingWriter::begin() {
    expect(state_ == State::Start, "begin");
    out_ << "{\n";
    state_ = State::EmittingEagerKeys;
}

void StreamingWriter::write_eager(const std::string &key, const json &value) {
    expect(state_ == State::EmittingEagerKeys, "write an eager key");
    begin_member(key);
    out_ << value.dump();
}

void StreamingWriter::open_array(const std::string &key) {
    expect(state_ == State::EmittingEagerKeys || state_ == State::EmittingStreamedKeys,
           "open an array");
    begin_member(key);
    out_ << "[\n";
    items_ = 0;
    state_ = State::ArrayOpen;
}

void StreamingWriter::write_item(const json &item) {
    expect(state_ == State::ArrayOpen || state_ == State::DrainingItems, "write an item");
    if (items_ > 0)
        out_ << ",\n";
    out_ << "    " << item.dump();
    items_++;
    state_ = State::DrainingItems;
}

void StreamingWriter::close_array() {
    expect(state_ == State::ArrayOpen || state_ == State::DrainingItems, "close an array");
    out_ << "\n  ]";
    state_ = State::EmittingStreamedKeys;
}

void StreamingWriter::finish() {
    expect(state_ == State::EmittingEagerKeys || state_ == State::EmittingStreamedKeys, "finish");
    if (members_ > 0)
        out_ << "\n";
    out_ << "}\n";
    state_ = State::Closed;
}

std::size_t StreamingWriter::write_streamed(const std::string &key, const ItemSource &items) {
    if (!items)
        throw std::invalid_argument("No item source for streamed key: " + key);

    open_array(key);
    std::size_t count = 0;
    while (auto item = items()) {
        write_item(*item);
        count++;
    }
    close_array();
    return count;
}

bool write_streaming(const std::string &path, const json &eager,
                     const std::vector<StreamedKey> &streamed, const Logger &log) {
    if (!eager.is_object())
        throw std::invalid_argument("Eager members must be a JSON object");

    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        log.error("Failed to open file for writing: " + path);
        return false;
    }

    std::set<std::string> streamed_keys;
    for (const auto &member : streamed)
        streamed_keys.insert(member.key);

    StreamingWriter writer(file);
    writer.begin();

    for (auto it = eager.begin(); it != eager.end(); ++it) {
        if (streamed_keys.count(it.key())) {
            log.debug("Key '" + it.key() + "' is streamed, skipping its eager value");
            continue;
        }
        writer.write_eager(it.key(), it.value());
    }

    for (const auto &member : streamed) {
        std::size_t count = writer.write_streamed(member.key, member.items);
        log.debug("Streamed " + std::to_string(count) + " items under '" + member.key + "'");
    }

    writer.finish();
    file.flush();
    if (!file) {
        log.error("Failed to write file: " + path);
        return false;
    }
    log.info("Wrote " + std::to_string(writer.members_written()) + " members to " + path);
    return true;
}

} // namespace docstream
