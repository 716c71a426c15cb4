#include <gtest/gtest.h>

#include <random>
#include <vector>

#include "../lib/decoder.hpp"
#include "../lib/errors.hpp"

using namespace Dockwire;

namespace {
    ProtocolError::Code protocolCode(const std::function<void()>& action) {
        try {
            action();
        } catch (const ProtocolError& e) {
            return e.code();
        }
        ADD_FAILURE() << "no ProtocolError thrown";
        return ProtocolError::Code::UnexpectedStatus;
    }

    std::string demuxHeader(std::uint8_t kind, std::uint32_t length) {
        std::string header(DEMUX_HEADER_SIZE, '\0');
        header[0] = static_cast<char>(kind);
        header[4] = static_cast<char>((length >> 24) & 0xff);
        header[5] = static_cast<char>((length >> 16) & 0xff);
        header[6] = static_cast<char>((length >> 8) & 0xff);
        header[7] = static_cast<char>(length & 0xff);
        return header;
    }
}

TEST(ChunkedDecoderTest, DecodesSingleChunk) {
    StringSource source("4\r\ntest\r\n0\r\n\r\n");
    ChunkedDecoder decoder(source);
    EXPECT_EQ(readAll(decoder), "test");
}

TEST(ChunkedDecoderTest, DecodesAcrossFragmentedReads) {
    StringSource source("5;name=value\r\nhello\r\n7\r\n, world\r\n0\r\n\r\n", 3);
    ChunkedDecoder decoder(source);
    EXPECT_EQ(readAll(decoder), "hello, world");
}

TEST(ChunkedDecoderTest, CollectsTrailers) {
    StringSource source("3\r\nabc\r\n0\r\nX-Checksum: 42\r\nX-Other:  value \r\n\r\n");
    ChunkedDecoder decoder(source);
    EXPECT_EQ(readAll(decoder), "abc");
    ASSERT_EQ(decoder.trailers().size(), 2u);
    EXPECT_EQ(decoder.trailers()[0].first, "X-Checksum");
    EXPECT_EQ(decoder.trailers()[0].second, "42");
    EXPECT_EQ(decoder.trailers()[1].second, "value");
}

TEST(ChunkedDecoderTest, RejectsNonHexSize) {
    StringSource source("zz\r\nabc\r\n0\r\n\r\n");
    ChunkedDecoder decoder(source);
    EXPECT_EQ(protocolCode([&] { readAll(decoder); }), ProtocolError::Code::ChunkSizeInvalid);
}

TEST(ChunkedDecoderTest, RejectsChunkLongerThanDeclared) {
    StringSource source("2\r\nabc\r\n0\r\n\r\n");
    ChunkedDecoder decoder(source);
    EXPECT_EQ(protocolCode([&] { readAll(decoder); }), ProtocolError::Code::ChunkSizeInvalid);
}

TEST(ChunkedDecoderTest, TruncatedChunkIsShortRead) {
    StringSource source("a\r\nabc");
    ChunkedDecoder decoder(source);
    EXPECT_EQ(protocolCode([&] { readAll(decoder); }), ProtocolError::Code::ShortRead);
}

TEST(ChunkedDecoderTest, MissingTerminatorIsShortRead) {
    StringSource source("3\r\nabc\r\n");
    ChunkedDecoder decoder(source);
    EXPECT_EQ(protocolCode([&] { readAll(decoder); }), ProtocolError::Code::ShortRead);
}

TEST(ChunkedDecoderTest, RejectsMalformedTrailer) {
    StringSource source("0\r\nno colon here\r\n\r\n");
    ChunkedDecoder decoder(source);
    EXPECT_EQ(protocolCode([&] { readAll(decoder); }), ProtocolError::Code::TrailerMalformed);
}

TEST(LengthLimitedSourceTest, StopsAtContentLength) {
    StringSource source("0123456789");
    LengthLimitedSource body(source, 4);
    EXPECT_EQ(readAll(body), "0123");
}

TEST(LengthLimitedSourceTest, EarlyEndIsShortRead) {
    StringSource source("012");
    LengthLimitedSource body(source, 10);
    EXPECT_EQ(protocolCode([&] { readAll(body); }), ProtocolError::Code::ShortRead);
}

TEST(DemuxDecoderTest, SplitsStdoutAndStderr) {
    std::string wire = encodeDemuxFrame(StreamKind::Stdout, "out line\n") +
                       encodeDemuxFrame(StreamKind::Stderr, "err line\n") +
                       encodeDemuxFrame(StreamKind::Stdout, "");
    StringSource source(wire, 5);
    DemuxDecoder decoder(source);

    EXPECT_EQ(decoder.next(), (DemuxFrame{StreamKind::Stdout, "out line\n"}));
    EXPECT_EQ(decoder.next(), (DemuxFrame{StreamKind::Stderr, "err line\n"}));
    EXPECT_EQ(decoder.next(), (DemuxFrame{StreamKind::Stdout, ""}));
    EXPECT_EQ(decoder.next(), std::nullopt);
}

TEST(DemuxDecoderTest, TruncatedPayloadIsShortRead) {
    StringSource source(demuxHeader(1, 10) + "hello");
    DemuxDecoder decoder(source);
    EXPECT_EQ(protocolCode([&] { decoder.next(); }), ProtocolError::Code::ShortRead);
}

TEST(DemuxDecoderTest, TruncatedHeaderIsShortRead) {
    StringSource source(demuxHeader(1, 10).substr(0, 5));
    DemuxDecoder decoder(source);
    EXPECT_EQ(protocolCode([&] { decoder.next(); }), ProtocolError::Code::ShortRead);
}

TEST(DemuxDecoderTest, IgnoresReservedBytes) {
    std::string header = demuxHeader(2, 2);
    header[1] = '\x7f';
    header[3] = '\x01';
    StringSource source(header + "ok");
    DemuxDecoder decoder(source);
    EXPECT_EQ(decoder.next(), (DemuxFrame{StreamKind::Stderr, "ok"}));
}

TEST(DemuxDecoderTest, RejectsUnknownKindAndOversizedFrames) {
    StringSource badKind(demuxHeader(3, 1) + "x");
    DemuxDecoder first(badKind);
    EXPECT_EQ(protocolCode([&] { first.next(); }), ProtocolError::Code::InvalidFrame);

    StringSource huge(demuxHeader(1, MAX_DEMUX_FRAME + 1));
    DemuxDecoder second(huge);
    EXPECT_EQ(protocolCode([&] { second.next(); }), ProtocolError::Code::InvalidFrame);
}

TEST(LogStreamTest, TtyStreamIsRawConsole) {
    StringSource source("plain terminal output");
    LogStream stream(source, true);
    auto output = stream.next();
    ASSERT_TRUE(output);
    EXPECT_EQ(output->kind, OutputKind::Console);
    EXPECT_EQ(output->message, "plain terminal output");
    EXPECT_FALSE(stream.next());
}

TEST(LogStreamTest, MultiplexedStreamKeepsKinds) {
    StringSource source(encodeDemuxFrame(StreamKind::Stderr, "boom") + encodeDemuxFrame(StreamKind::Stdout, "fine"));
    LogStream stream(source, false);
    EXPECT_EQ(stream.next(), (LogOutput{OutputKind::Stderr, "boom"}));
    EXPECT_EQ(stream.next(), (LogOutput{OutputKind::Stdout, "fine"}));
    EXPECT_EQ(stream.next(), std::nullopt);
}

TEST(JsonLineDecoderTest, ReadsProgressLines) {
    StringSource source("{\"stream\":\"Step 1/2\\n\"}\r\n\n{\"status\":\"done\"}\n", 4);
    JsonLineDecoder decoder(source);

    auto first = decoder.next();
    ASSERT_TRUE(first);
    EXPECT_EQ((*first)["stream"], "Step 1/2\n");
    auto second = decoder.next();
    ASSERT_TRUE(second);
    EXPECT_EQ((*second)["status"], "done");
    EXPECT_FALSE(decoder.next());
}

TEST(JsonLineDecoderTest, AcceptsDocumentSpanningLines) {
    StringSource source("{\"aux\":\n {\"ID\": \"sha256:1\"}\n}\n{\"x\":1}");
    JsonLineDecoder decoder(source);

    auto first = decoder.next();
    ASSERT_TRUE(first);
    EXPECT_EQ((*first)["aux"]["ID"], "sha256:1");
    auto second = decoder.next();
    ASSERT_TRUE(second);
    EXPECT_EQ((*second)["x"], 1);
    EXPECT_FALSE(decoder.next());
}

TEST(JsonLineDecoderTest, RejectsGarbage) {
    StringSource source("{\"ok\":true}\nnot json at all\n");
    JsonLineDecoder decoder(source);
    EXPECT_TRUE(decoder.next());
    EXPECT_EQ(protocolCode([&] { decoder.next(); }), ProtocolError::Code::InvalidJson);
}

TEST(JsonLineDecoderTest, TruncatedDocumentIsInvalid) {
    StringSource source("{\"stream\":\"partial");
    JsonLineDecoder decoder(source);
    EXPECT_EQ(protocolCode([&] { decoder.next(); }), ProtocolError::Code::InvalidJson);
}

TEST(JsonLineDecoderTest, SyntaxErrorOnLastByteOfLineIsInvalid) {
    StringSource source("{\"a\":1,}\n{\"b\":2}\n");
    JsonLineDecoder decoder(source);
    EXPECT_EQ(protocolCode([&] { decoder.next(); }), ProtocolError::Code::InvalidJson);
}

// Generated frame sequences decoded through sources of varying read sizes.
class DemuxSequenceTest : public ::testing::TestWithParam<std::size_t> {
protected:
    static std::vector<DemuxFrame> generateFrames() {
        std::mt19937 rng(20240611);
        const std::vector<std::size_t> edgeLengths = {0, 1, 7, 8, 9};
        std::vector<DemuxFrame> frames;
        for (int i = 0; i < 200; ++i) {
            std::size_t length = rng() % 2 == 0 ? edgeLengths[rng() % edgeLengths.size()] : rng() % 3001;
            std::string payload(length, '\0');
            for (auto& byte : payload) byte = static_cast<char>(rng() & 0xff);
            frames.push_back(DemuxFrame{static_cast<StreamKind>(rng() % 3), std::move(payload)});
        }
        return frames;
    }
};

TEST_P(DemuxSequenceTest, DecodesEveryFrameInOrder) {
    const auto frames = generateFrames();
    std::string wire;
    for (const auto& frame : frames) wire += encodeDemuxFrame(frame.kind, frame.payload);

    StringSource source(wire, GetParam());
    DemuxDecoder decoder(source);
    for (std::size_t i = 0; i < frames.size(); ++i) {
        auto frame = decoder.next();
        ASSERT_TRUE(frame.has_value()) << "frame " << i;
        ASSERT_EQ(*frame, frames[i]) << "frame " << i;
    }
    EXPECT_FALSE(decoder.next().has_value());
}

INSTANTIATE_TEST_SUITE_P(ReadSizes, DemuxSequenceTest, ::testing::Values(1, 3, 8, 9, 4096));
