//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_content_framer.cpp
// Purpose: Tests for the stdio framers (newline-delimited and Content-Length) and framing selection
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "mcpchain/ContentFramer.h"

using mcpchain::IContentFramer;
using Status = mcpchain::IContentFramer::DecodeStatus;

//==========================================================================================================
// Newline framing
//==========================================================================================================

TEST(NewlineFramerTest, EncodeAppendsSingleNewline) {
    auto framer = mcpchain::MakeNewlineFramer();
    EXPECT_EQ(framer->encode("{\"jsonrpc\":\"2.0\"}"), std::string("{\"jsonrpc\":\"2.0\"}\n"));
}

TEST(NewlineFramerTest, DecodesLinesInOrder) {
    auto framer = mcpchain::MakeNewlineFramer();
    std::string buffer = "{\"id\":1}\n{\"id\":2}\n{\"id\":";

    auto first = framer->tryDecode(buffer);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value(), "{\"id\":1}");

    auto second = framer->tryDecode(buffer);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second.value(), "{\"id\":2}");

    // Trailing partial line stays buffered
    EXPECT_FALSE(framer->tryDecode(buffer).has_value());
    EXPECT_EQ(buffer, "{\"id\":");
}

TEST(NewlineFramerTest, SkipsBlankLinesAndStripsCarriageReturn) {
    auto framer = mcpchain::MakeNewlineFramer();
    const std::string buffer = "\r\n  \n{\"x\":1}\r\nnext";
    auto ex = framer->tryDecodeEx(buffer);
    EXPECT_EQ(ex.status, Status::Ok);
    ASSERT_TRUE(ex.payload.has_value());
    EXPECT_EQ(ex.payload.value(), "{\"x\":1}");
    EXPECT_EQ(ex.bytesConsumed, buffer.find("next"));
}

TEST(NewlineFramerTest, IncompleteLineReportsLeadingBlankBytes) {
    auto framer = mcpchain::MakeNewlineFramer();
    auto ex = framer->tryDecodeEx("\n\n{\"partial\"");
    EXPECT_EQ(ex.status, Status::Incomplete);
    EXPECT_FALSE(ex.payload.has_value());
    EXPECT_EQ(ex.bytesConsumed, 2u);

    auto none = framer->tryDecodeEx("{}");
    EXPECT_EQ(none.status, Status::Incomplete);
    EXPECT_EQ(none.bytesConsumed, 0u);
}

TEST(NewlineFramerTest, OverlongLineIsDroppedThenDecodingResumes) {
    auto framer = mcpchain::MakeNewlineFramer(4);
    std::string buffer = "abcdef\nok\n";

    auto ex = framer->tryDecodeEx(buffer);
    EXPECT_EQ(ex.status, Status::BodyTooLarge);
    EXPECT_FALSE(ex.payload.has_value());
    EXPECT_EQ(ex.bytesConsumed, 7u);

    buffer.erase(0, ex.bytesConsumed);
    auto next = framer->tryDecode(buffer);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next.value(), "ok");
    EXPECT_TRUE(buffer.empty());
}

TEST(NewlineFramerTest, UnterminatedOverlongLineConsumesWholeBuffer) {
    auto framer = mcpchain::MakeNewlineFramer(4);
    auto ex = framer->tryDecodeEx("abcdef");
    EXPECT_EQ(ex.status, Status::BodyTooLarge);
    EXPECT_EQ(ex.bytesConsumed, 6u);
}

//==========================================================================================================
// Content-Length framing
//==========================================================================================================

TEST(ContentLengthFramerTest, EncodeWritesHeaderThenBody) {
    auto framer = mcpchain::MakeContentLengthFramer();
    EXPECT_EQ(framer->encode("{\"id\":7}"), std::string("Content-Length: 8\r\n\r\n{\"id\":7}"));
}

TEST(ContentLengthFramerTest, BodyAtLimitDecodesWithFrameSize) {
    auto framer = mcpchain::MakeContentLengthFramer(4);
    const std::string buffer = "Content-Length: 4\r\n\r\nabcd";
    auto ex = framer->tryDecodeEx(buffer);
    EXPECT_EQ(ex.status, Status::Ok);
    ASSERT_TRUE(ex.payload.has_value());
    EXPECT_EQ(ex.payload.value(), "abcd");
    EXPECT_EQ(ex.bytesConsumed, buffer.size());
    EXPECT_EQ(ex.frameSize, buffer.size());
}

TEST(ContentLengthFramerTest, PartialBodyKnowsFrameSize) {
    auto framer = mcpchain::MakeContentLengthFramer();
    const std::string header = "Content-Length: 10\r\n\r\n";
    auto ex = framer->tryDecodeEx(header + "{}");
    EXPECT_EQ(ex.status, Status::Incomplete);
    EXPECT_EQ(ex.bytesConsumed, 0u);
    EXPECT_EQ(ex.frameSize, header.size() + 10);
}

TEST(ContentLengthFramerTest, PartialHeaderIsIncomplete) {
    auto framer = mcpchain::MakeContentLengthFramer();
    auto ex = framer->tryDecodeEx("Content-Len");
    EXPECT_EQ(ex.status, Status::Incomplete);
    EXPECT_EQ(ex.frameSize, 0u);
}

TEST(ContentLengthFramerTest, HeaderNameIsCaseInsensitiveAmongOtherHeaders) {
    auto framer = mcpchain::MakeContentLengthFramer();
    std::string buffer = "Content-Type: application/json\r\nCONTENT-LENGTH:  2\r\n\r\n{}";
    auto payload = framer->tryDecode(buffer);
    ASSERT_TRUE(payload.has_value());
    EXPECT_EQ(payload.value(), "{}");
    EXPECT_TRUE(buffer.empty());
}

TEST(ContentLengthFramerTest, MissingOrMalformedLengthDropsHeaderBlock) {
    auto framer = mcpchain::MakeContentLengthFramer();

    const std::string noLength = "Content-Type: x\r\n\r\n{}";
    auto missing = framer->tryDecodeEx(noLength);
    EXPECT_EQ(missing.status, Status::InvalidHeader);
    EXPECT_EQ(missing.bytesConsumed, noLength.find("{}"));

    const std::string badLength = "Content-Length: 1x\r\n\r\n{}";
    auto malformed = framer->tryDecodeEx(badLength);
    EXPECT_EQ(malformed.status, Status::InvalidHeader);
    EXPECT_EQ(malformed.bytesConsumed, badLength.find("{}"));
}

TEST(ContentLengthFramerTest, OversizedBodyIsRejectedAndTryDecodeLeavesBuffer) {
    auto framer = mcpchain::MakeContentLengthFramer(4);
    std::string buffer = "Content-Length: 5\r\n\r\nabcde";
    auto ex = framer->tryDecodeEx(buffer);
    EXPECT_EQ(ex.status, Status::BodyTooLarge);
    EXPECT_EQ(ex.bytesConsumed, buffer.find("abcde"));

    // Recovery is the reader's decision
    EXPECT_FALSE(framer->tryDecode(buffer).has_value());
    EXPECT_EQ(buffer, "Content-Length: 5\r\n\r\nabcde");
}

TEST(ContentLengthFramerTest, BackToBackFrames) {
    auto framer = mcpchain::MakeContentLengthFramer();
    std::string buffer = framer->encode("{\"id\":1}") + framer->encode("{\"id\":2}");
    auto a = framer->tryDecode(buffer);
    auto b = framer->tryDecode(buffer);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(a.value(), "{\"id\":1}");
    EXPECT_EQ(b.value(), "{\"id\":2}");
    EXPECT_TRUE(buffer.empty());
}

//==========================================================================================================
// Framing selection
//==========================================================================================================

TEST(FramingTest, ParseFramingAcceptsNamesCaseInsensitively) {
    EXPECT_EQ(mcpchain::ParseFraming("newline"), mcpchain::Framing::Newline);
    EXPECT_EQ(mcpchain::ParseFraming("NDJSON"), mcpchain::Framing::Newline);
    EXPECT_EQ(mcpchain::ParseFraming("Content-Length"), mcpchain::Framing::ContentLength);
    EXPECT_EQ(mcpchain::ParseFraming("lsp"), mcpchain::Framing::ContentLength);
    EXPECT_FALSE(mcpchain::ParseFraming("xml").has_value());
    EXPECT_FALSE(mcpchain::ParseFraming("").has_value());
}

TEST(FramingTest, ToStringMatchesParseFraming) {
    for (auto f : {mcpchain::Framing::Newline, mcpchain::Framing::ContentLength}) {
        EXPECT_EQ(mcpchain::ParseFraming(mcpchain::ToString(f)), f);
    }
}

TEST(FramingTest, MakeFramerSelectsImplementation) {
    auto line = mcpchain::MakeFramer(mcpchain::Framing::Newline);
    auto lsp = mcpchain::MakeFramer(mcpchain::Framing::ContentLength);
    EXPECT_EQ(line->encode("{}"), "{}\n");
    EXPECT_EQ(lsp->encode("{}"), "Content-Length: 2\r\n\r\n{}");
}
