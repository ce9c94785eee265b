#include "tracker/tracker.hpp"
#include "tracker/internal/internal/trackerActions.hpp"
#include "peer/internal/trackerRequests.hpp"
#include "peer/internal/internal/peerNetworking.hpp"
#include "networking/messageFormatting.hpp"
#include "networking/socket.hpp"
#include "errorCodes.hpp"
#include "testUtil.hpp"

#include <gtest/gtest.h>
#include <memory>

using namespace csw;
using namespace std::chrono_literals;

TEST(TrackerActions, UnknownCodeGetsFail) {
    Registry registry(5s);
    auto reply = handleTrackerRequest({HELLO, 1, 2, 3}, registry);
    ASSERT_FALSE(reply.empty());
    EXPECT_EQ(reply.front(), FAIL);
    EXPECT_EQ(parseFailMessage(reply), "Unknown request code 9.");

    reply = handleTrackerRequest({}, registry);
    EXPECT_EQ(reply.front(), FAIL);
}

TEST(TrackerActions, MalformedRegistrationIsRefused) {
    Registry registry(5s);
    auto reply = handleTrackerRequest({REGISTER_REQUEST, 0, 0}, registry);
    EXPECT_EQ(reply.front(), FAIL);
    EXPECT_EQ(registry.rowCount(), 0u);
}

TEST(TrackerActions, RegisterThenList) {
    Registry registry(5s);
    Registration reg{55, PeerRecord{SourceInfo{"127.0.0.1", 4000}, {true, false}}};
    auto reply = handleTrackerRequest(createRegisterRequest(reg), registry);
    ASSERT_EQ(reply, std::vector<uint8_t>{REGISTER_OK});

    reply = handleTrackerRequest(createPeerListRequest({55, SourceInfo{"127.0.0.1", 0}}), registry);
    auto peers = parsePeerList(reply);
    ASSERT_TRUE(peers);
    ASSERT_EQ(peers->size(), 1u);
    EXPECT_EQ((*peers)[0].peer, reg.record.peer);
    EXPECT_EQ((*peers)[0].availability, reg.record.availability);

    reply = handleTrackerRequest(createDeregisterRequest({55, reg.record.peer}), registry);
    EXPECT_EQ(reply, std::vector<uint8_t>{DEREGISTER_OK});
    EXPECT_EQ(registry.rowCount(), 0u);
}

namespace {

class TrackerTest : public ::testing::Test {
protected:
    Config                   config = test::testConfig();
    std::unique_ptr<Tracker> tracker;

    void SetUp() override {
        tracker = std::make_unique<Tracker>(config);
        ASSERT_EQ(tracker->start(), EXIT_SUCCESS);
        config.tracker_port = tracker->port();
        ASSERT_NE(config.tracker_port, 0);
    }
};

} //namespace

TEST_F(TrackerTest, PeersSeeEachOtherButNotThemselves) {
    const uint64_t uuid = 0xABCDEF;
    Registration a{uuid, PeerRecord{SourceInfo{"127.0.0.1", 6001}, {true, true}}};
    Registration b{uuid, PeerRecord{SourceInfo{"127.0.0.1", 6002}, {false, true}}};
    ASSERT_EQ(registerWithTracker(a, config), EXIT_SUCCESS);
    ASSERT_EQ(registerWithTracker(b, config), EXIT_SUCCESS);

    std::vector<PeerRecord> peers;
    ASSERT_EQ(requestPeerList({uuid, a.record.peer}, peers, config), EXIT_SUCCESS);
    ASSERT_EQ(peers.size(), 1u);
    EXPECT_EQ(peers[0].peer, b.record.peer);
    EXPECT_EQ(peers[0].availability, b.record.availability);

    ASSERT_EQ(deregisterFromTracker({uuid, b.record.peer}, config), EXIT_SUCCESS);
    ASSERT_EQ(requestPeerList({uuid, a.record.peer}, peers, config), EXIT_SUCCESS);
    EXPECT_TRUE(peers.empty());
}

TEST_F(TrackerTest, UnknownFileGivesAnEmptyList) {
    std::vector<PeerRecord> peers = {PeerRecord{}};
    ASSERT_EQ(requestPeerList({999, SourceInfo{"127.0.0.1", 0}}, peers, config), EXIT_SUCCESS);
    EXPECT_TRUE(peers.empty());
}

TEST_F(TrackerTest, ConnectionServesSeveralRequests) {
    int sock = connectToSource(SourceInfo{"127.0.0.1", config.tracker_port}, toTimeval(500));
    ASSERT_GE(sock, 0);

    Registration reg{7, PeerRecord{SourceInfo{"127.0.0.1", 6100}, {true}}};
    std::vector<uint8_t> reply;
    EXPECT_EQ(sendAndRecv(sock, createRegisterRequest(reg), reply, REGISTER_OK, toTimeval(1000)),
              EXIT_SUCCESS);

    //an unknown code doesn't end the connection
    ASSERT_EQ(tcp::sendMessage(sock, {0x7F}), EXIT_SUCCESS);
    ASSERT_GT(tcp::recvMessage(sock, reply, toTimeval(1000)), 0);
    EXPECT_EQ(reply.front(), FAIL);

    EXPECT_EQ(sendAndRecv(sock, createPeerListRequest({7, SourceInfo{"127.0.0.1", 0}}), reply,
                          PEER_LIST, toTimeval(1000)),
              EXIT_SUCCESS);
    auto peers = parsePeerList(reply);
    ASSERT_TRUE(peers);
    EXPECT_EQ(peers->size(), 1u);
    closeSocket(sock);
}

TEST_F(TrackerTest, RestartedTrackerIsRebuiltByReRegistration) {
    Registration reg{8, PeerRecord{SourceInfo{"127.0.0.1", 6200}, {true}}};
    ASSERT_EQ(registerWithTracker(reg, config), EXIT_SUCCESS);

    tracker.reset();
    Config restarted = config;
    tracker = std::make_unique<Tracker>(restarted);
    ASSERT_EQ(tracker->start(), EXIT_SUCCESS);
    config.tracker_port = tracker->port();

    std::vector<PeerRecord> peers;
    ASSERT_EQ(requestPeerList({8, SourceInfo{"127.0.0.1", 0}}, peers, config), EXIT_SUCCESS);
    EXPECT_TRUE(peers.empty());

    ASSERT_EQ(registerWithTracker(reg, config), EXIT_SUCCESS);
    ASSERT_EQ(requestPeerList({8, SourceInfo{"127.0.0.1", 0}}, peers, config), EXIT_SUCCESS);
    EXPECT_EQ(peers.size(), 1u);
}

TEST(TrackerRequests, NoTrackerIsReportedAsUnreachable) {
    Config config = test::testConfig();
    config.tracker_port = test::closedPort();

    Registration reg{1, PeerRecord{SourceInfo{"127.0.0.1", 6300}, {true}}};
    EXPECT_EQ(registerWithTracker(reg, config), TRACKER_UNREACHABLE);

    std::vector<PeerRecord> peers;
    EXPECT_EQ(requestPeerList({1, SourceInfo{"127.0.0.1", 0}}, peers, config), TRACKER_UNREACHABLE);
}
