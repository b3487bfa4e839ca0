#include <gtest/gtest.h>

#include "api/decoders.hpp"
#include "errors.hpp"
#include "json_codec.hpp"
#include "line_reducer.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace ollama_client;

class LineReducerTest : public ::testing::Test {
protected:
    bool Feed(StreamingLineReducer& reducer, const std::string& data) {
        return reducer.OnData(data.data(), data.size());
    }

    JsonCodec codec;
    GenerateResponseDecoder generate;
    ChatResponseDecoder chat;
};

TEST_F(LineReducerTest, ConcatenatesUntilDone) {
    StreamingLineReducer reducer(codec, generate);
    ASSERT_TRUE(reducer.OnStatus(200));
    EXPECT_TRUE(Feed(reducer, "{\"response\":\"Hel\",\"done\":false}\n"));
    EXPECT_TRUE(Feed(reducer, "{\"response\":\"lo\",\"done\":false}\n"));
    EXPECT_FALSE(Feed(reducer, "{\"response\":\"\",\"done\":true}\n"));
    EXPECT_TRUE(reducer.finished());
    EXPECT_EQ(reducer.accumulated(), "Hello");
    EXPECT_EQ(reducer.lines_consumed(), 3u);
}

TEST_F(LineReducerTest, LinesSplitAcrossChunks) {
    StreamingLineReducer reducer(codec, generate);
    reducer.OnStatus(200);
    EXPECT_TRUE(Feed(reducer, "{\"respon"));
    EXPECT_TRUE(Feed(reducer, "se\":\"a\",\"done\":false}\n{\"response\":"));
    EXPECT_TRUE(Feed(reducer, "\"b\",\"done\":false}\r\n"));
    EXPECT_EQ(reducer.accumulated(), "ab");
    EXPECT_EQ(reducer.lines_consumed(), 2u);
}

TEST_F(LineReducerTest, StopsInsideAChunkAtTheFinalLine) {
    std::vector<std::string> seen;
    StreamingLineReducer reducer(codec, generate, [&](const Fragment& f) { seen.push_back(f.text); });
    reducer.OnStatus(200);
    EXPECT_FALSE(Feed(reducer,
                      "{\"response\":\"x\",\"done\":false}\n"
                      "{\"response\":\"\",\"done\":true}\n"
                      "{\"response\":\"trailing\",\"done\":false}\n"));
    EXPECT_EQ(reducer.accumulated(), "x");
    EXPECT_EQ(seen.size(), 2u);
    EXPECT_FALSE(Feed(reducer, "{\"response\":\"more\",\"done\":false}\n"));
    EXPECT_EQ(reducer.accumulated(), "x");
}

TEST_F(LineReducerTest, FinalFragmentWithTextIsKept) {
    StreamingLineReducer reducer(codec, generate);
    reducer.OnStatus(200);
    Feed(reducer, "{\"response\":\"all at once\",\"done\":true}\n");
    EXPECT_EQ(reducer.accumulated(), "all at once");
}

TEST_F(LineReducerTest, BlankLinesAreIgnored) {
    int fragments = 0;
    StreamingLineReducer reducer(codec, generate, [&](const Fragment&) { fragments++; });
    reducer.OnStatus(200);
    Feed(reducer, "\n\r\n   \n{\"response\":\"a\",\"done\":false}\n\n");
    EXPECT_EQ(fragments, 1);
    EXPECT_EQ(reducer.lines_consumed(), 1u);
}

TEST_F(LineReducerTest, PartialLastLineIsProcessedAtEnd) {
    StreamingLineReducer reducer(codec, generate);
    reducer.OnStatus(200);
    Feed(reducer, "{\"response\":\"a\",\"done\":false}\n{\"response\":\"b\",\"done\":false}");
    EXPECT_EQ(reducer.accumulated(), "a");
    reducer.OnEnd();
    EXPECT_EQ(reducer.accumulated(), "ab");
}

TEST_F(LineReducerTest, ErrorLinesAreConcatenatedInOrder) {
    std::vector<Fragment> seen;
    StreamingLineReducer reducer(codec, generate, [&](const Fragment& f) { seen.push_back(f); });
    ASSERT_TRUE(reducer.OnStatus(400));
    EXPECT_TRUE(Feed(reducer, "{\"error\":\"first \"}\n{\"error\":\"second\"}\n"));
    reducer.OnEnd();
    EXPECT_EQ(reducer.accumulated(), "first second");
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_TRUE(seen[0].is_error);
}

TEST_F(LineReducerTest, UnauthorizedSkipsBody) {
    StreamingLineReducer reducer(codec, generate);
    EXPECT_FALSE(reducer.OnStatus(401));
    EXPECT_EQ(reducer.status_class(), StatusClass::kUnauthorized);
    EXPECT_EQ(reducer.accumulated(), "Unauthorized");
}

TEST_F(LineReducerTest, OtherErrorKeepsRawLines) {
    StreamingLineReducer reducer(codec, generate);
    reducer.OnStatus(502);
    Feed(reducer, "bad gateway\n");
    EXPECT_EQ(reducer.accumulated(), "bad gateway");
}

TEST_F(LineReducerTest, MalformedLineIsCapturedAndStopsReading) {
    StreamingLineReducer reducer(codec, generate);
    reducer.OnStatus(200);
    EXPECT_TRUE(Feed(reducer, "{\"response\":\"a\",\"done\":false}\n"));
    EXPECT_FALSE(Feed(reducer, "{not json}\n"));
    EXPECT_FALSE(Feed(reducer, "{\"response\":\"b\",\"done\":false}\n"));
    EXPECT_THROW(reducer.RethrowIfFailed(), DecodeError);
}

TEST_F(LineReducerTest, ThrowingSinkIsCaptured) {
    StreamingLineReducer reducer(codec, generate, [](const Fragment&) { throw std::runtime_error("sink failed"); });
    reducer.OnStatus(200);
    EXPECT_FALSE(Feed(reducer, "{\"response\":\"a\",\"done\":false}\n"));
    EXPECT_THROW(reducer.RethrowIfFailed(), std::runtime_error);
}

TEST_F(LineReducerTest, ChatTerminalLineWithoutMessage) {
    StreamingLineReducer reducer(codec, chat);
    reducer.OnStatus(200);
    Feed(reducer, "{\"message\":{\"role\":\"assistant\",\"content\":\"Hi\"},\"done\":false}\n");
    EXPECT_FALSE(Feed(reducer, "{\"done\":true,\"total_duration\":123}\n"));
    EXPECT_EQ(reducer.accumulated(), "Hi");
}

TEST_F(LineReducerTest, WrongFieldTypeIsADecodeError) {
    StreamingLineReducer reducer(codec, generate);
    reducer.OnStatus(200);
    EXPECT_FALSE(Feed(reducer, "{\"response\":1,\"done\":false}\n"));
    EXPECT_THROW(reducer.RethrowIfFailed(), DecodeError);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
