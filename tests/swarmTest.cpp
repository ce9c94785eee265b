#include "peer/peer.hpp"
#include "peer/internal/downloadFile.hpp"
#include "peer/internal/pieceManager.hpp"
#include "tracker/tracker.hpp"
#include "networking/fileParsing.hpp"
#include "networking/internal/fileParsing/fileUtil.hpp"
#include "errorCodes.hpp"
#include "testUtil.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <thread>

using namespace csw;
using namespace std::chrono_literals;

namespace {

//every test gets its own tracker, declared first so it outlives the peers
class SwarmTest : public ::testing::Test {
protected:
    Config                   config = test::testConfig();
    std::unique_ptr<Tracker> tracker;

    std::vector<uint8_t> bytes;
    FileDescriptor       descriptor;
    uint64_t             uuid = 0;

    void SetUp() override {
        tracker = std::make_unique<Tracker>(config);
        ASSERT_EQ(tracker->start(), EXIT_SUCCESS);
        config.tracker_port = tracker->port();

        bytes = test::makeBytes(10 * config.chunk_size - 1, 41);
        auto split = splitFile("swarm.bin", bytes, config.chunk_size);
        ASSERT_TRUE(split);
        descriptor = split->first;
        uuid       = fileIdentifier(descriptor);
    }

    //a manager holding only the chunks in [first, last)
    std::shared_ptr<PieceManager> holding(size_t first, size_t last) {
        auto pm = std::make_shared<PieceManager>(descriptor,
                                                 std::chrono::milliseconds(config.request_timeout_ms));
        auto damaged = bytes;
        for (size_t i = 0; i < descriptor.chunk_count; ++i)
            if (i < first || i >= last)
                damaged[descriptor.chunkOffset(i)] ^= 0xFF;
        pm->loadLocalFile(damaged);
        EXPECT_EQ(pm->haveCount(), last - first);
        return pm;
    }

    //waits until the tracker has at least rows registrations
    bool waitForRows(size_t rows) {
        auto give_up = std::chrono::steady_clock::now() + 5s;
        while (tracker->peerRegistry().rowCount() < rows) {
            if (std::chrono::steady_clock::now() > give_up)
                return false;
            std::this_thread::sleep_for(10ms);
        }
        return true;
    }
};

} //namespace

TEST_F(SwarmTest, LeechersWithDisjointHalvesBothComplete) {
    std::atomic<bool> stop_a = false;
    std::atomic<bool> stop_b = false;
    SwarmPeer a(config, stop_a);
    SwarmPeer b(config, stop_b);
    ASSERT_EQ(a.start(), EXIT_SUCCESS);
    ASSERT_EQ(b.start(), EXIT_SUCCESS);

    auto pm_a = holding(0, 5);
    auto pm_b = holding(5, 10);
    ASSERT_EQ(a.share(uuid, pm_a), EXIT_SUCCESS);
    ASSERT_EQ(b.share(uuid, pm_b), EXIT_SUCCESS);

    int res_a = EXIT_FAILURE;
    int res_b = EXIT_FAILURE;
    std::thread ta([&]() { res_a = attemptFileDownload(uuid, *pm_a, a.address(), config, stop_a); });
    std::thread tb([&]() { res_b = attemptFileDownload(uuid, *pm_b, b.address(), config, stop_b); });
    ta.join();
    tb.join();

    EXPECT_EQ(res_a, EXIT_SUCCESS);
    EXPECT_EQ(res_b, EXIT_SUCCESS);
    EXPECT_EQ(pm_a->availability(), test::allBits(10));
    EXPECT_EQ(pm_b->availability(), test::allBits(10));

    auto out = test::tempPath("swarm_a.bin");
    ASSERT_EQ(pm_a->reassemble(out), EXIT_SUCCESS);
    auto got = readFile(out);
    ASSERT_TRUE(got);
    EXPECT_EQ(got.value(), bytes);
}

TEST_F(SwarmTest, StoppedPeerLeavesTheSwarm) {
    std::atomic<bool> stop_a = false;
    {
        SwarmPeer a(config, stop_a);
        ASSERT_EQ(a.start(), EXIT_SUCCESS);
        ASSERT_EQ(a.share(uuid, holding(0, 10)), EXIT_SUCCESS);
        EXPECT_EQ(tracker->peerRegistry().rowCount(), 1u);
    }
    EXPECT_TRUE(stop_a.load());
    EXPECT_EQ(tracker->peerRegistry().rowCount(), 0u);
}

TEST_F(SwarmTest, HeartbeatRefreshesAvailability) {
    std::atomic<bool> stop_a = false;
    SwarmPeer a(config, stop_a);
    ASSERT_EQ(a.start(), EXIT_SUCCESS);

    auto pm = holding(0, 3);
    ASSERT_EQ(a.share(uuid, pm), EXIT_SUCCESS);
    ASSERT_EQ(pm->loadLocalFile(bytes), EXIT_SUCCESS);

    //a couple of heartbeats
    std::this_thread::sleep_for(std::chrono::milliseconds(3 * config.heartbeat_interval_ms));

    std::vector<PeerRecord> peers;
    ASSERT_EQ(tracker->peerRegistry().listPeers(uuid, SourceInfo{}, peers), EXIT_SUCCESS);
    ASSERT_EQ(peers.size(), 1u);
    EXPECT_TRUE(peers[0].isSeeder());
}

TEST_F(SwarmTest, DownloadRunsOutOfPeersWithHalfTheFile) {
    std::atomic<bool> stop_seed  = false;
    std::atomic<bool> stop_leech = false;
    SwarmPeer half_seeder(config, stop_seed);
    SwarmPeer leecher(config, stop_leech);
    ASSERT_EQ(half_seeder.start(), EXIT_SUCCESS);
    ASSERT_EQ(leecher.start(), EXIT_SUCCESS);
    ASSERT_EQ(half_seeder.share(uuid, holding(0, 5)), EXIT_SUCCESS);

    auto pm = holding(0, 0);
    ASSERT_EQ(leecher.share(uuid, pm), EXIT_SUCCESS);
    EXPECT_EQ(attemptFileDownload(uuid, *pm, leecher.address(), config, stop_leech), SWARM_EXHAUSTED);
    EXPECT_EQ(pm->haveCount(), 5u);
    EXPECT_FALSE(pm->isComplete());
}

TEST_F(SwarmTest, EmptySwarmIsExhausted) {
    std::atomic<bool> stop = false;
    auto pm = holding(0, 0);
    EXPECT_EQ(attemptFileDownload(uuid, *pm, SourceInfo{"127.0.0.1", 1}, config, stop), SWARM_EXHAUSTED);
}

TEST_F(SwarmTest, ShutdownAbandonsTheDownload) {
    std::atomic<bool> stop = true;
    auto pm = holding(0, 0);
    EXPECT_EQ(attemptFileDownload(uuid, *pm, SourceInfo{"127.0.0.1", 1}, config, stop), EXIT_FAILURE);
}

TEST_F(SwarmTest, PickSessionPeersSkipsUselessOnes) {
    auto pm = holding(0, 5);
    std::vector<PeerRecord> peers = {
        {{"127.0.0.1", 7001}, std::vector<bool>(10, false)},  //nothing we lack
        {{"127.0.0.1", 7002}, std::vector<bool>(9, true)},    //wrong file size
        {{"127.0.0.1", 7003}, test::allBits(10)},
        {{"127.0.0.1", 7004}, test::allBits(10)},
    };
    auto picked = pickSessionPeers(peers, *pm, 5);
    ASSERT_EQ(picked.size(), 2u);
    EXPECT_EQ(picked[0].port, 7003);
    EXPECT_EQ(picked[1].port, 7004);

    EXPECT_EQ(pickSessionPeers(peers, *pm, 1).size(), 1u);
}

TEST_F(SwarmTest, SeedThenLeechByUuid) {
    auto source = test::tempPath("seeded.bin");
    ASSERT_EQ(writeFile(source, bytes.data(), bytes.size()), EXIT_SUCCESS);

    std::atomic<bool> stop_seed = false;
    int seed_res = EXIT_FAILURE;
    std::thread seeder([&]() { seed_res = seedFile(source, config, stop_seed); });

    //stops and joins the seeder however the test exits
    struct SeederGuard {
        std::atomic<bool>& stop;
        std::thread&       thread;
        ~SeederGuard() {
            stop = true;
            if (thread.joinable())
                thread.join();
        }
    } guard{stop_seed, seeder};

    ASSERT_TRUE(waitForRows(1));

    auto descriptor_path = source;
    descriptor_path += ".cswd";
    auto saved = loadDescriptor(descriptor_path);
    ASSERT_TRUE(saved);
    EXPECT_EQ(saved->f_name, source.filename().string());
    EXPECT_EQ(saved->chunk_count, descriptor.chunk_count);
    const uint64_t seeded = fileIdentifier(saved.value());

    auto out = test::tempPath("leeched.bin");
    std::atomic<bool> stop_leech = false;
    EXPECT_EQ(leechFile(std::to_string(seeded), out, config, stop_leech, false), EXIT_SUCCESS);
    auto got = readFile(out);
    ASSERT_TRUE(got);
    EXPECT_EQ(got.value(), bytes);

    stop_seed = true;
    seeder.join();
    EXPECT_EQ(seed_res, EXIT_SUCCESS);
}

TEST_F(SwarmTest, LeechResumesFromAPartialCopy) {
    std::atomic<bool> stop_seed = false;
    SwarmPeer seeder(config, stop_seed);
    ASSERT_EQ(seeder.start(), EXIT_SUCCESS);
    ASSERT_EQ(seeder.share(uuid, holding(0, 10)), EXIT_SUCCESS);

    auto descriptor_path = test::tempPath("resume.cswd");
    ASSERT_EQ(saveDescriptor(descriptor, descriptor_path), EXIT_SUCCESS);

    auto out = test::tempPath("resume.bin");
    auto partial = bytes;
    partial[descriptor.chunkOffset(2)] ^= 0xFF;
    ASSERT_EQ(writeFile(out, partial.data(), partial.size()), EXIT_SUCCESS);

    std::atomic<bool> stop_leech = false;
    EXPECT_EQ(leechFile(descriptor_path.string(), out, config, stop_leech, false), EXIT_SUCCESS);
    auto got = readFile(out);
    ASSERT_TRUE(got);
    EXPECT_EQ(got.value(), bytes);
}

TEST_F(SwarmTest, LeechFailsWithoutATracker) {
    Config no_tracker = config;
    no_tracker.tracker_port = test::closedPort();

    std::atomic<bool> stop = false;
    EXPECT_EQ(leechFile(std::to_string(uuid), test::tempPath("never.bin"), no_tracker, stop, false),
              TRACKER_UNREACHABLE);

    auto pm = holding(0, 0);
    EXPECT_EQ(attemptFileDownload(uuid, *pm, SourceInfo{"127.0.0.1", 1}, no_tracker, stop),
              TRACKER_UNREACHABLE);
}

TEST_F(SwarmTest, LeechRejectsAnUnknownSource) {
    std::atomic<bool> stop = false;
    EXPECT_EQ(leechFile("not-a-uuid", test::tempPath("x.bin"), config, stop, false), EXIT_FAILURE);
    //nobody seeds this uuid
    EXPECT_EQ(leechFile("12345", test::tempPath("y.bin"), config, stop, false), EXIT_FAILURE);
}
