#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>

#include "../lib/buildSession.hpp"
#include "../lib/errors.hpp"
#include "../lib/fileSync.hpp"
#include "test_helpers.hpp"

using namespace Dockwire;
using Dockwire::test::FakeDaemon;
using Dockwire::test::TempDir;

namespace {
    // Records what an invocation sends back, running its posted work on a local context.
    class RecordingChannel : public InvocationChannel {
    public:
        explicit RecordingChannel(Metadata metadata) : metadata_(std::move(metadata)) {}

        void send(std::string data) override { sent.push_back(decodePacket(data)); }
        void finish() override { finished = true; }
        void fail(unsigned code, const std::string& message) override {
            failedCode = code;
            failure = message;
        }

        boost::asio::io_context& context() override { return ioContext; }
        const std::string& method() const override { return method_; }
        const Metadata& metadata() const override { return metadata_; }

        void drain() {
            ioContext.restart();
            ioContext.run();
        }

        boost::asio::io_context ioContext;
        std::vector<Packet> sent;
        bool finished = false;
        std::optional<unsigned> failedCode;
        std::string failure;

    private:
        std::string method_ = "/moby.filesync.v1.FileSync/DiffCopy";
        Metadata metadata_;
    };

    std::string request(std::uint32_t id, const std::string& path = {}) {
        return encodePacket(Packet{PacketType::Req, id, std::nullopt, path});
    }

    class DiffCopyTest : public ::testing::Test {
    protected:
        TempDir context;
        std::shared_ptr<FileSyncProvider> provider;

        void SetUp() override {
            context.write("a.txt", "alpha");
            context.write("dir/b.txt", "bravo");
            provider = std::make_shared<FileSyncProvider>(std::map<std::string, std::filesystem::path>{
                {"context", context.path()}});
        }

        std::unique_ptr<Invocation> startCall(RecordingChannel& channel) {
            auto invocation = provider->invoke("/moby.filesync.v1.FileSync/DiffCopy");
            invocation->start(channel);
            return invocation;
        }
    };
}

TEST(FilePacketTest, EncodesStatAndData) {
    FileStat stat;
    stat.path = "dir/b.txt";
    stat.mode = 0644;
    stat.size = 5;
    stat.modTime = 1700000000123456789;

    Packet decoded = decodePacket(encodePacket(Packet{PacketType::Stat, 7, stat, {}}));
    EXPECT_EQ(decoded.type, PacketType::Stat);
    EXPECT_EQ(decoded.id, 7u);
    ASSERT_TRUE(decoded.stat.has_value());
    EXPECT_EQ(*decoded.stat, stat);

    std::string bytes = encodePacket(Packet{PacketType::Data, 1, std::nullopt, "xyz"});
    EXPECT_EQ(bytes, std::string("\x02\0\0\0\x01\0\0\0\0xyz", 12));
}

TEST(FilePacketTest, RejectsMalformedPackets) {
    EXPECT_THROW(decodePacket("short"), ProtocolError);
    EXPECT_THROW(decodePacket(std::string("\x09\0\0\0\0\0\0\0\0", 9)), ProtocolError);
    EXPECT_THROW(decodePacket(std::string("\x00\0\0\0\0\0\0\0\x10{}", 11)), ProtocolError);
    EXPECT_THROW(decodePacket(std::string("\x00\0\0\0\0\0\0\0\x02[]", 11)), ProtocolError);
}

TEST(FilePacketTest, OrdersByPathComponents) {
    EXPECT_TRUE(pathComponentsLess("a", "a/b"));
    EXPECT_TRUE(pathComponentsLess("a/b", "a-b"));
    EXPECT_TRUE(pathComponentsLess("dir/z", "dira"));
    EXPECT_FALSE(pathComponentsLess("b", "a/z"));
}

TEST(WalkDirectoryTest, HonorsExcludesAndRestoresParents) {
    TempDir root;
    root.write("Dockerfile", "FROM scratch\n");
    root.write("logs/app.log", "x");
    root.write("vendor/keep/file.txt", "keep");
    root.write("vendor/drop.txt", "drop");

    auto entries = walkDirectory(root.path(), PathFilter({}, {"logs", "vendor", "!vendor/keep/file.txt"}));
    std::vector<std::string> paths;
    for (const auto& entry : entries) paths.push_back(entry.path);
    EXPECT_EQ(paths, (std::vector<std::string>{"Dockerfile", "vendor", "vendor/keep", "vendor/keep/file.txt"}));

    EXPECT_TRUE(entries[1].isDir());
    EXPECT_TRUE(entries[3].isRegular());
    EXPECT_EQ(entries[3].size, 4);
}

TEST(WalkDirectoryTest, FollowPathsSurviveExcludes) {
    TempDir root;
    root.write("Dockerfile", "FROM scratch\n");
    root.write("src/main.cpp", "int main() {}\n");

    auto entries = walkDirectory(root.path(), PathFilter({}, {"*"}), {"Dockerfile"});
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].path, "Dockerfile");
}

TEST(WalkDirectoryTest, RecordsSymlinks) {
    TempDir root;
    root.write("target.txt", "data");
    std::filesystem::create_symlink("target.txt", root.path() / "link");

    FileStat link = statPath(root.path(), "link");
    EXPECT_TRUE(link.mode & FileMode::Symlink);
    EXPECT_FALSE(link.isRegular());
    EXPECT_EQ(link.linkname, "target.txt");
}

TEST_F(DiffCopyTest, ListsWholeDirectoryThenEndMarker) {
    RecordingChannel channel(Metadata{{"dir-name", {"context"}}});
    auto call = startCall(channel);
    call->onData(request(0, "/"));

    ASSERT_EQ(channel.sent.size(), 4u);
    const std::vector<std::string> expected = {"a.txt", "dir", "dir/b.txt"};
    for (std::uint32_t i = 0; i < 3; ++i) {
        EXPECT_EQ(channel.sent[i].type, PacketType::Stat);
        EXPECT_EQ(channel.sent[i].id, i);
        ASSERT_TRUE(channel.sent[i].stat.has_value());
        EXPECT_EQ(channel.sent[i].stat->path, expected[i]);
    }
    EXPECT_EQ(channel.sent[3].type, PacketType::Stat);
    EXPECT_FALSE(channel.sent[3].stat.has_value());
    EXPECT_FALSE(channel.finished);
}

TEST_F(DiffCopyTest, TransfersRequestedFile) {
    RecordingChannel channel(Metadata{{"dir-name", {"context"}}});
    auto call = startCall(channel);
    call->onData(request(0));
    channel.sent.clear();

    call->onData(request(2));
    channel.drain();
    ASSERT_EQ(channel.sent.size(), 2u);
    EXPECT_EQ(channel.sent[0].type, PacketType::Data);
    EXPECT_EQ(channel.sent[0].id, 2u);
    EXPECT_EQ(channel.sent[0].data, "bravo");
    EXPECT_EQ(channel.sent[1].type, PacketType::Fin);
    EXPECT_EQ(channel.sent[1].id, 2u);
}

TEST_F(DiffCopyTest, LargeFilesAreChunked) {
    context.write("big.bin", std::string(FILE_CHUNK * 2 + 10, 'z'));
    RecordingChannel channel(Metadata{{"dir-name", {"context"}}, {"include-patterns", {"big.bin"}}});
    auto call = startCall(channel);
    call->onData(request(0));
    ASSERT_EQ(channel.sent.size(), 2u);
    channel.sent.clear();

    call->onData(request(0));
    channel.drain();
    ASSERT_EQ(channel.sent.size(), 4u);
    EXPECT_EQ(channel.sent[0].data.size(), FILE_CHUNK);
    EXPECT_EQ(channel.sent[1].data.size(), FILE_CHUNK);
    EXPECT_EQ(channel.sent[2].data.size(), 10u);
    EXPECT_EQ(channel.sent[3].type, PacketType::Fin);
}

TEST_F(DiffCopyTest, UnknownIdGetsErrorAndCallStaysOpen) {
    RecordingChannel channel(Metadata{{"dir-name", {"context"}}});
    auto call = startCall(channel);
    call->onData(request(0));
    channel.sent.clear();

    call->onData(encodePacket(Packet{PacketType::Data, 5, std::nullopt, "junk"}));
    ASSERT_EQ(channel.sent.size(), 1u);
    EXPECT_EQ(channel.sent[0].type, PacketType::Err);
    EXPECT_EQ(channel.sent[0].id, 5u);
    EXPECT_FALSE(channel.finished);
    EXPECT_FALSE(channel.failedCode.has_value());

    call->onData(request(1));
    ASSERT_EQ(channel.sent.size(), 2u);
    EXPECT_EQ(channel.sent[1].type, PacketType::Err);
    EXPECT_EQ(channel.sent[1].id, 1u);

    call->onData(request(0));
    channel.drain();
    EXPECT_EQ(channel.sent.back().type, PacketType::Fin);
}

TEST_F(DiffCopyTest, ErrorFromReceiverDropsTransfer) {
    context.write("big.bin", std::string(FILE_CHUNK * 4, 'q'));
    RecordingChannel channel(Metadata{{"dir-name", {"context"}}, {"include-patterns", {"big.bin"}}});
    auto call = startCall(channel);
    call->onData(request(0));
    channel.sent.clear();

    call->onData(request(0));
    channel.ioContext.restart();
    channel.ioContext.run_one();
    call->onData(encodePacket(Packet{PacketType::Err, 0, std::nullopt, "disk full"}));
    channel.drain();

    ASSERT_EQ(channel.sent.size(), 1u);
    EXPECT_EQ(channel.sent[0].type, PacketType::Data);
    EXPECT_FALSE(channel.failedCode.has_value());
}

TEST_F(DiffCopyTest, MalformedPacketFailsCall) {
    RecordingChannel channel(Metadata{{"dir-name", {"context"}}});
    auto call = startCall(channel);
    call->onData("bad");
    EXPECT_EQ(channel.failedCode, StatusCode::InvalidArgument);
}

TEST_F(DiffCopyTest, ReceiverFinEndsCall) {
    RecordingChannel channel(Metadata{{"dir-name", {"context"}}});
    auto call = startCall(channel);
    call->onData(request(0));
    channel.sent.clear();

    call->onData(encodePacket(Packet{PacketType::Fin, 0, std::nullopt, {}}));
    ASSERT_EQ(channel.sent.size(), 1u);
    EXPECT_EQ(channel.sent[0].type, PacketType::Fin);
    EXPECT_TRUE(channel.finished);
}

TEST_F(DiffCopyTest, CloseFinishesCall) {
    RecordingChannel channel(Metadata{{"dir-name", {"context"}}});
    auto call = startCall(channel);
    call->onClose();
    EXPECT_TRUE(channel.finished);
}

TEST_F(DiffCopyTest, UnknownDirectoryIsNotFound) {
    RecordingChannel missing(Metadata{{"dir-name", {"elsewhere"}}});
    startCall(missing);
    EXPECT_EQ(missing.failedCode, StatusCode::NotFound);

    RecordingChannel unnamed(Metadata{});
    startCall(unnamed);
    EXPECT_EQ(unnamed.failedCode, StatusCode::InvalidArgument);
}

TEST_F(DiffCopyTest, ScopedRequestListsOnlyMatchingEntries) {
    RecordingChannel channel(Metadata{{"dir-name", {"context"}}});
    auto call = startCall(channel);
    call->onData(request(0, "dir"));

    ASSERT_EQ(channel.sent.size(), 3u);
    EXPECT_EQ(channel.sent[0].stat->path, "dir");
    EXPECT_EQ(channel.sent[1].stat->path, "dir/b.txt");
    EXPECT_FALSE(channel.sent[2].stat.has_value());
}

TEST_F(DiffCopyTest, ErrorPacketOverSessionKeepsStreamAndSessionUsable) {
    BuildSession session("filesync-test");
    session.addService(provider);
    auto [client, peer] = Dockwire::test::connectionPair();
    session.start(std::move(client));
    FakeDaemon daemon(std::move(peer));

    daemon.open(1, "/moby.filesync.v1.FileSync/DiffCopy", Metadata{{"dir-name", {"context"}}});
    daemon.send({FrameType::Data, 1, request(0)});
    std::size_t stats = 0;
    while (true) {
        SessionFrame frame = daemon.next();
        ASSERT_EQ(frame.type, FrameType::Data);
        ASSERT_EQ(frame.stream, 1u);
        Packet packet = decodePacket(frame.payload);
        ASSERT_EQ(packet.type, PacketType::Stat);
        if (!packet.stat) break;
        ++stats;
    }
    EXPECT_EQ(stats, 3u);

    daemon.send({FrameType::Data, 1, encodePacket(Packet{PacketType::Data, 5, std::nullopt, "junk"})});
    SessionFrame error = daemon.next();
    ASSERT_EQ(error.type, FrameType::Data);
    EXPECT_EQ(error.stream, 1u);
    Packet errorPacket = decodePacket(error.payload);
    EXPECT_EQ(errorPacket.type, PacketType::Err);
    EXPECT_EQ(errorPacket.id, 5u);

    daemon.open(3, "/grpc.health.v1.Health/Check");
    daemon.send({FrameType::Close, 3, ""});
    SessionFrame health = daemon.next();
    EXPECT_EQ(health.type, FrameType::Data);
    EXPECT_EQ(health.stream, 3u);
    EXPECT_EQ(daemon.next().type, FrameType::Close);

    daemon.send({FrameType::Data, 1, request(0)});
    SessionFrame data = daemon.next();
    ASSERT_EQ(data.type, FrameType::Data);
    EXPECT_EQ(data.stream, 1u);
    Packet dataPacket = decodePacket(data.payload);
    EXPECT_EQ(dataPacket.type, PacketType::Data);
    EXPECT_EQ(dataPacket.data, "alpha");
    Packet fin = decodePacket(daemon.next().payload);
    EXPECT_EQ(fin.type, PacketType::Fin);
    EXPECT_EQ(fin.id, 0u);

    EXPECT_FALSE(session.failure().has_value());
    session.close();
}
