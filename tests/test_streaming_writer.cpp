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

#include "docstream/array_cursor.hpp"
#include "docstream/document_store.hpp"
#include "docstream/streaming_writer.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>

using namespace docstream;
using namespace docstream::test;

namespace {

// No ",," and no separator directly before a closing bracket
void expect_clean_separators(const std::string &text) {
    std::string compact;
    for (char c : text) {
        if (c != ' ' && c != '\n')
            compact.push_back(c);
    }
    EXPECT_EQ(compact.find(",,"), std::string::npos) << text;
    EXPECT_EQ(compact.find(",]"), std::string::npos) << text;
    EXPECT_EQ(compact.find(",}"), std::string::npos) << text;
    EXPECT_EQ(compact.find("[,"), std::string::npos) << text;
    EXPECT_EQ(compact.find("{,"), std::string::npos) << text;
}

} // namespace

class StreamingWriterTest : public ::testing::Test {
protected:
    TempDir dir;
    CapturedLog log;
};

TEST_F(StreamingWriterTest, MixedEagerAndStreamedLayout) {
    std::string path = dir.file("out.json");
    json eager = json::object();
    eager["a"] = 1;
    eager["b"] = 2;

    ASSERT_TRUE(write_streaming(path, eager, {{"c", items_from({10, 20, 30})}}, log.logger()));

    EXPECT_EQ(read_text(path), "{\n"
                               "  \"a\": 1,\n"
                               "  \"b\": 2,\n"
                               "  \"c\": [\n"
                               "    10,\n"
                               "    20,\n"
                               "    30\n"
                               "  ]\n"
                               "}\n");

    auto back = read_document(path);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->dump(), R"({"a":1,"b":2,"c":[10,20,30]})");
}

TEST_F(StreamingWriterTest, EagerOnlyEndsWithoutSeparator) {
    std::string path = dir.file("eager.json");
    json eager = json::parse(R"({"name": "run", "meta": {"k": [1, 2]}})");

    ASSERT_TRUE(write_streaming(path, eager, {}));
    EXPECT_EQ(read_text(path), "{\n"
                               "  \"name\": \"run\",\n"
                               "  \"meta\": {\"k\":[1,2]}\n"
                               "}\n");
}

TEST_F(StreamingWriterTest, SeveralStreamedKeysEachDrainTheirOwnSource) {
    std::string path = dir.file("multi.json");
    std::vector<StreamedKey> streamed = {
        {"first", items_from({json("x"), json("y")})},
        {"second", items_from({json::parse(R"({"n": 1})")})},
    };

    ASSERT_TRUE(write_streaming(path, json::object(), streamed));
    std::string text = read_text(path);
    EXPECT_EQ(text, "{\n"
                    "  \"first\": [\n"
                    "    \"x\",\n"
                    "    \"y\"\n"
                    "  ],\n"
                    "  \"second\": [\n"
                    "    {\"n\":1}\n"
                    "  ]\n"
                    "}\n");
    expect_clean_separators(text);
}

TEST_F(StreamingWriterTest, EmptyStreamedArrayStaysValid) {
    std::string path = dir.file("empty.json");
    json eager = json::object();
    eager["id"] = 7;

    ASSERT_TRUE(write_streaming(path, eager, {{"results", items_from(std::vector<json>{})}}));
    std::string text = read_text(path);
    EXPECT_EQ(text, "{\n  \"id\": 7,\n  \"results\": [\n\n  ]\n}\n");
    expect_clean_separators(text);

    auto back = read_document(path);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->dump(), R"({"id":7,"results":[]})");
}

TEST_F(StreamingWriterTest, NoMembersWritesEmptyObject) {
    std::string path = dir.file("none.json");
    ASSERT_TRUE(write_streaming(path, json::object(), {}));
    EXPECT_EQ(read_text(path), "{\n}\n");
    auto back = read_document(path);
    ASSERT_TRUE(back.has_value());
    EXPECT_TRUE(back->empty());
}

TEST_F(StreamingWriterTest, StreamedKeyOverridesEagerValue) {
    std::string path = dir.file("override.json");
    json eager = json::parse(R"({"results": "placeholder", "id": 1})");

    ASSERT_TRUE(
        write_streaming(path, eager, {{"results", items_from({1, 2})}}, log.logger()));
    auto back = read_document(path);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->dump(), R"({"id":1,"results":[1,2]})");
    EXPECT_EQ(log.count_containing("skipping its eager value"), 1u);
}

TEST_F(StreamingWriterTest, KeysAreEscapedAndTextKeptLiteral) {
    std::string path = dir.file("escape.json");
    json eager = json::object();
    eager["say \"hi\""] = "caf\xC3\xA9";

    ASSERT_TRUE(write_streaming(path, eager, {}));
    EXPECT_EQ(read_text(path), "{\n  \"say \\\"hi\\\"\": \"caf\xC3\xA9\"\n}\n");
}

TEST(StreamingWriterStateTest, ItemsAreWrittenAsTheyArePulled) {
    std::ostringstream out;
    StreamingWriter writer(out);
    writer.begin();

    int produced = 0;
    std::vector<bool> previous_written;
    ItemSource source = [&]() -> std::optional<json> {
        if (produced > 0) {
            std::string marker = "    " + std::to_string(produced - 1);
            previous_written.push_back(out.str().find(marker) != std::string::npos);
        }
        if (produced == 3)
            return std::nullopt;
        return json(produced++);
    };

    EXPECT_EQ(writer.write_streamed("n", source), 3u);
    writer.finish();
    EXPECT_EQ(previous_written, (std::vector<bool>{true, true, true}));
    EXPECT_EQ(out.str(), "{\n  \"n\": [\n    0,\n    1,\n    2\n  ]\n}\n");
}

TEST_F(StreamingWriterTest, CopiesItemsFromCursor) {
    std::string source_path = dir.file("source.json");
    write_text(source_path, R"({"results": [{"p": 1}, {"p": 2}], "tail": true})");
    auto cursor = ArrayCursor::open(source_path, PathExpression::parse("results.item"));
    ASSERT_TRUE(cursor.has_value());

    std::string path = dir.file("copy.json");
    json eager = json::object();
    eager["copied"] = true;
    ASSERT_TRUE(write_streaming(path, eager, {{"results", items_from(*cursor)}}));
    EXPECT_TRUE(cursor->exhausted());

    auto back = read_document(path);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->dump(), R"({"copied":true,"results":[{"p":1},{"p":2}]})");
}

TEST_F(StreamingWriterTest, RejectsNonObjectEager) {
    EXPECT_THROW(write_streaming(dir.file("bad.json"), json::array(), {}), std::invalid_argument);
}

TEST_F(StreamingWriterTest, UnwritablePathReportsFailure) {
    std::string path = dir.file("missing_dir/out.json");
    EXPECT_FALSE(write_streaming(path, json::object(), {}, log.logger()));
    EXPECT_EQ(log.count_containing("Failed to open file for writing"), 1u);
}

TEST(StreamingWriterStateTest, FollowsStateMachine) {
    std::ostringstream out;
    StreamingWriter writer(out);
    EXPECT_EQ(writer.state(), StreamingWriter::State::Start);
    writer.begin();
    EXPECT_EQ(writer.state(), StreamingWriter::State::EmittingEagerKeys);
    writer.write_eager("a", 1);
    writer.open_array("b");
    EXPECT_EQ(writer.state(), StreamingWriter::State::ArrayOpen);
    writer.write_item("x");
    EXPECT_EQ(writer.state(), StreamingWriter::State::DrainingItems);
    writer.close_array();
    EXPECT_EQ(writer.state(), StreamingWriter::State::EmittingStreamedKeys);
    writer.finish();
    EXPECT_EQ(writer.state(), StreamingWriter::State::Closed);
    EXPECT_EQ(writer.members_written(), 2u);
    EXPECT_EQ(out.str(), "{\n  \"a\": 1,\n  \"b\": [\n    \"x\"\n  ]\n}\n");
}

TEST(StreamingWriterStateTest, RejectsOutOfOrderCalls) {
    std::ostringstream out;
    StreamingWriter writer(out);
    EXPECT_THROW(writer.write_eager("a", 1), std::logic_error);
    writer.begin();
    EXPECT_THROW(writer.begin(), std::logic_error);
    EXPECT_THROW(writer.write_item(1), std::logic_error);
    writer.open_array("s");
    EXPECT_THROW(writer.finish(), std::logic_error);
    EXPECT_THROW(writer.write_eager("late", 1), std::logic_error);
    writer.close_array();
    EXPECT_THROW(writer.write_eager("late", 1), std::logic_error);
    writer.finish();
    EXPECT_THROW(writer.open_array("after"), std::logic_error);
}
