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
#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace docstream {

class ArrayCursor;

// Lazy sequence of values, pulled until it returns std::nullopt
using ItemSource = std::function<std::optional<json>()>;

// A member whose array value is drained from a lazy source while writing
struct StreamedKey {
    std::string key;
    ItemSource items;
};

// Source over a cursor; the cursor must outlive the source
ItemSource items_from(ArrayCursor &cursor);

// Source over values already in memory
ItemSource items_from(std::vector<json> values);

// Incremental writer for a single JSON object whose members are either
// written whole (eager) or as arrays filled item by item (streamed).
//
//   Start -> EmittingEagerKeys -> EmittingStreamedKeys -> Closed
//
// Every streamed member goes ArrayOpen -> DrainingItems -> back to
// EmittingStreamedKeys. Out-of-order calls throw std::logic_error.
class StreamingWriter {
public:
    enum class State {
        Start,
        EmittingEagerKeys,
        EmittingStreamedKeys,
        ArrayOpen,
        DrainingItems,
        Closed
    };

    explicit StreamingWriter(std::ostream &out);

    void begin();
    void write_eager(const std::string &key, const json &value);
    void open_array(const std::string &key);
    void write_item(const json &item);
    void close_array();
    void finish();

    // Drain a whole source into one streamed member
    std::size_t write_streamed(const std::string &key, const ItemSource &items);

    State state() const { return state_; }
    std::size_t members_written() const { return members_; }

private:
    std::ostream &out_;
    State state_ = State::Start;
    std::size_t members_ = 0;
    std::size_t items_ = 0;

    void begin_member(const std::string &key);
    void expect(bool ok, const char *operation) const;
};

const char *writer_state_to_string(StreamingWriter::State state);

// Write `eager` members (in their order) followed by one array per streamed
// key, draining each source as it is written. Eager members that share a
// name with a streamed key are skipped. Throws std::invalid_argument if
// `eager` is not an object. Returns false if the file could not be written.
bool write_streaming(const std::string &path, const json &eager,
                     const std::vector<StreamedKey> &streamed, const Logger &log = Logger());

} // namespace docstream
