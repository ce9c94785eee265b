#include "peer/internal/peerSession.hpp"
#include "peer/internal/pieceManager.hpp"
#include "networking/fileParsing.hpp"
#include "networking/internal/fileParsing/fileUtil.hpp"
#include "networking/messageFormatting.hpp"
#include "networking/socket.hpp"
#include "errorCodes.hpp"
#include "testUtil.hpp"

#include <gtest/gtest.h>
#include <memory>

using namespace csw;

namespace {

class PeerSessionTest : public ::testing::Test {
protected:
    Config               config = test::testConfig();
    std::vector<uint8_t> bytes;
    FileDescriptor       descriptor;
    std::vector<Chunk>   chunks;
    uint64_t             uuid = 0;
    std::atomic<bool>    shutdown = false;

    void SetUp() override {
        bytes = test::makeBytes(10 * config.chunk_size - 100, 31);
        auto split = splitFile("session.bin", bytes, config.chunk_size);
        ASSERT_TRUE(split);
        descriptor = split->first;
        chunks     = split->second;
        uuid       = fileIdentifier(descriptor);
        ASSERT_EQ(descriptor.chunk_count, 10u);
    }

    std::shared_ptr<PieceManager> makeManager() {
        return std::make_shared<PieceManager>(descriptor,
                                              std::chrono::milliseconds(config.request_timeout_ms));
    }

    std::shared_ptr<PieceManager> fullManager() {
        auto pm = makeManager();
        EXPECT_EQ(pm->loadLocalFile(bytes), EXIT_SUCCESS);
        return pm;
    }
};

//plays the seeding side of the handshake, advertising bits
bool answerHandshake(int sock, uint64_t uuid, const std::vector<bool>& bits) {
    std::vector<uint8_t> in;
    if (tcp::recvMessage(sock, in, toTimeval(2000)) <= 0 || parseHello(in) != uuid)
        return false;
    if (tcp::sendMessage(sock, createHello(uuid)) != EXIT_SUCCESS)
        return false;
    if (tcp::recvMessage(sock, in, toTimeval(2000)) <= 0 || !parseAvailability(in))
        return false;
    return tcp::sendMessage(sock, createAvailability(bits)) == EXIT_SUCCESS;
}

//answers every chunk request with reply(index) until BYE or the socket closes
void serveRequests(int sock, const std::function<std::vector<uint8_t>(size_t)>& reply) {
    std::vector<uint8_t> in;
    while (tcp::recvMessage(sock, in, toTimeval(3000)) > 0) {
        if (in.front() != REQUEST_CHUNK)
            return;
        std::vector<uint8_t> out = reply(parseChunkRequest(in));
        if (!out.empty() && tcp::sendMessage(sock, out) != EXIT_SUCCESS)
            return;
    }
}

} //namespace

TEST_F(PeerSessionTest, LeecherGetsEveryChunkFromASeeder) {
    test::TestSeeder seeder(config);
    seeder.files[uuid] = fullManager();
    ASSERT_TRUE(seeder.start());

    auto leecher = makeManager();
    EXPECT_EQ(downloadFromPeer(seeder.address(), uuid, *leecher, config, shutdown), EXIT_SUCCESS);
    ASSERT_TRUE(leecher->isComplete());
    for (size_t i = 0; i < 10; ++i)
        EXPECT_EQ(leecher->state(i), ChunkState::HAVE);

    auto out = test::tempPath("session_out.bin");
    ASSERT_EQ(leecher->reassemble(out), EXIT_SUCCESS);
    auto got = readFile(out);
    ASSERT_TRUE(got);
    EXPECT_EQ(got.value(), bytes);
}

TEST_F(PeerSessionTest, PartialSeederOnlyGivesWhatItHas) {
    auto partial = bytes;
    for (size_t i = 5; i < 10; ++i)
        partial[descriptor.chunkOffset(i)] ^= 0xFF;

    test::TestSeeder seeder(config);
    auto seeded = makeManager();
    ASSERT_EQ(seeded->loadLocalFile(partial), CORRUPT_CHUNK);
    seeder.files[uuid] = seeded;
    ASSERT_TRUE(seeder.start());

    auto leecher = makeManager();
    EXPECT_EQ(downloadFromPeer(seeder.address(), uuid, *leecher, config, shutdown), EXIT_SUCCESS);
    EXPECT_EQ(leecher->haveCount(), 5u);
    EXPECT_EQ(leecher->availability(), seeded->availability());
}

TEST_F(PeerSessionTest, UnservedFileIsRefused) {
    test::TestSeeder seeder(config);
    ASSERT_TRUE(seeder.start());

    auto leecher = makeManager();
    EXPECT_EQ(downloadFromPeer(seeder.address(), uuid, *leecher, config, shutdown), EXIT_FAILURE);
    EXPECT_EQ(leecher->haveCount(), 0u);
}

TEST_F(PeerSessionTest, UnreachablePeer) {
    auto leecher = makeManager();
    SourceInfo nobody{"127.0.0.1", test::closedPort()};
    EXPECT_EQ(downloadFromPeer(nobody, uuid, *leecher, config, shutdown), PEER_UNREACHABLE);
}

TEST_F(PeerSessionTest, DescriptorIsFetchedAndChecked) {
    test::TestSeeder seeder(config);
    seeder.files[uuid] = fullManager();
    ASSERT_TRUE(seeder.start());

    auto fetched = fetchDescriptor(seeder.address(), uuid, config);
    ASSERT_TRUE(fetched);
    EXPECT_EQ(fetched.value(), descriptor);

    EXPECT_FALSE(fetchDescriptor(seeder.address(), uuid + 1, config));
}

TEST_F(PeerSessionTest, DescriptorNotMatchingTheUuidIsRejected) {
    FileDescriptor other = descriptor;
    other.f_name = "renamed.bin";

    test::ScriptedPeer liar([&](int sock) {
        std::vector<uint8_t> in;
        if (tcp::recvMessage(sock, in, toTimeval(2000)) > 0)
            tcp::sendMessage(sock, createDescriptorMessage(other));
    });
    ASSERT_TRUE(liar.ok());
    EXPECT_FALSE(fetchDescriptor(liar.address(), uuid, config));
}

TEST_F(PeerSessionTest, NotFoundClearsTheBitAndTheSessionEnds) {
    test::ScriptedPeer peer([&](int sock) {
        if (!answerHandshake(sock, uuid, test::allBits(10)))
            return;
        serveRequests(sock, [](size_t index) { return createNotFound(index); });
    });
    ASSERT_TRUE(peer.ok());

    auto leecher = makeManager();
    EXPECT_EQ(downloadFromPeer(peer.address(), uuid, *leecher, config, shutdown), EXIT_SUCCESS);
    EXPECT_EQ(leecher->haveCount(), 0u);
    for (size_t i = 0; i < 10; ++i)
        EXPECT_EQ(leecher->state(i), ChunkState::MISSING);
}

TEST_F(PeerSessionTest, WrongSizedAvailabilityIsAViolation) {
    test::ScriptedPeer peer([&](int sock) {
        answerHandshake(sock, uuid, test::allBits(11));
    });
    ASSERT_TRUE(peer.ok());

    auto leecher = makeManager();
    EXPECT_EQ(downloadFromPeer(peer.address(), uuid, *leecher, config, shutdown), PROTOCOL_VIOLATION);
}

TEST_F(PeerSessionTest, SilentPeerIsGivenUpOnAndRequestsReleased) {
    test::ScriptedPeer peer([&](int sock) {
        if (!answerHandshake(sock, uuid, test::allBits(10)))
            return;
        //never answer, just wait for the other side to hang up
        serveRequests(sock, [](size_t) { return std::vector<uint8_t>(); });
    });
    ASSERT_TRUE(peer.ok());

    auto leecher = makeManager();
    EXPECT_EQ(downloadFromPeer(peer.address(), uuid, *leecher, config, shutdown), PEER_UNREACHABLE);
    for (size_t i = 0; i < 10; ++i)
        EXPECT_EQ(leecher->state(i), ChunkState::MISSING);
}

TEST_F(PeerSessionTest, CorruptingPeerIsExcludedChunkByChunk) {
    test::ScriptedPeer peer([&](int sock) {
        if (!answerHandshake(sock, uuid, test::allBits(10)))
            return;
        serveRequests(sock, [&](size_t index) {
            std::vector<uint8_t> data = chunks[index].data;
            data[0] ^= 0xFF;
            return createDataChunk({index, data});
        });
    });
    ASSERT_TRUE(peer.ok());

    auto leecher = makeManager();
    EXPECT_EQ(downloadFromPeer(peer.address(), uuid, *leecher, config, shutdown), EXIT_SUCCESS);
    EXPECT_EQ(leecher->haveCount(), 0u);
    for (size_t i = 0; i < 10; ++i) {
        EXPECT_EQ(leecher->failureCount(i), MAX_CHUNK_FAILURES);
        EXPECT_EQ(leecher->state(i), ChunkState::MISSING);
    }
}

TEST_F(PeerSessionTest, OutOfRangeChunkIsAViolation) {
    test::ScriptedPeer peer([&](int sock) {
        if (!answerHandshake(sock, uuid, test::allBits(10)))
            return;
        serveRequests(sock, [&](size_t) { return createDataChunk({42, chunks[0].data}); });
    });
    ASSERT_TRUE(peer.ok());

    auto leecher = makeManager();
    EXPECT_EQ(downloadFromPeer(peer.address(), uuid, *leecher, config, shutdown), PROTOCOL_VIOLATION);
}

TEST_F(PeerSessionTest, SeederClosesOnRequestForUnadvertisedChunk) {
    auto partial = bytes;
    partial[descriptor.chunkOffset(7)] ^= 0xFF;

    test::TestSeeder seeder(config);
    auto seeded = makeManager();
    ASSERT_EQ(seeded->loadLocalFile(partial), CORRUPT_CHUNK);
    seeder.files[uuid] = seeded;
    ASSERT_TRUE(seeder.start());

    int sock = -1;
    auto opened = openSocket(false, 0);
    ASSERT_TRUE(opened);
    sock = opened->first;
    ASSERT_EQ(tcp::connect(sock, seeder.address(), toTimeval(500)), EXIT_SUCCESS);

    std::vector<uint8_t> in;
    ASSERT_EQ(tcp::sendMessage(sock, createHello(uuid)), EXIT_SUCCESS);
    ASSERT_GT(tcp::recvMessage(sock, in, toTimeval(1000)), 0);
    EXPECT_EQ(parseHello(in), uuid);

    ASSERT_EQ(tcp::sendMessage(sock, createAvailability(std::vector<bool>(10, false))), EXIT_SUCCESS);
    ASSERT_GT(tcp::recvMessage(sock, in, toTimeval(1000)), 0);
    auto advertised = parseAvailability(in);
    ASSERT_TRUE(advertised);
    EXPECT_FALSE((*advertised)[7]);

    ASSERT_EQ(tcp::sendMessage(sock, createChunkRequest(6)), EXIT_SUCCESS);
    ASSERT_GT(tcp::recvMessage(sock, in, toTimeval(1000)), 0);
    EXPECT_EQ(parseDataChunk(in).second, chunks[6].data);

    ASSERT_EQ(tcp::sendMessage(sock, createChunkRequest(7)), EXIT_SUCCESS);
    EXPECT_EQ(tcp::recvMessage(sock, in, toTimeval(1000)), -1);
    closeSocket(sock);
}

TEST_F(PeerSessionTest, SeederRejectsRequestsBeforeHello) {
    test::TestSeeder seeder(config);
    seeder.files[uuid] = fullManager();
    ASSERT_TRUE(seeder.start());

    auto opened = openSocket(false, 0);
    ASSERT_TRUE(opened);
    int sock = opened->first;
    ASSERT_EQ(tcp::connect(sock, seeder.address(), toTimeval(500)), EXIT_SUCCESS);

    std::vector<uint8_t> in;
    ASSERT_EQ(tcp::sendMessage(sock, createChunkRequest(0)), EXIT_SUCCESS);
    EXPECT_EQ(tcp::recvMessage(sock, in, toTimeval(1000)), -1);
    closeSocket(sock);
}
