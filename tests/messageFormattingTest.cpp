#include "networking/messageFormatting.hpp"
#include "networking/internal/messageFormatting/byteOrdering.hpp"

#include <gtest/gtest.h>

using namespace csw;

TEST(ByteOrdering, BitmapPacksIndexZeroIntoTheHighBit) {
    std::vector<bool> bits = {true, false, false, false, false, false, false, false,
                              false, true};
    std::vector<uint8_t> packed = packBits(bits);
    ASSERT_EQ(packed.size(), 2u);
    EXPECT_EQ(packed[0], 0x80);
    EXPECT_EQ(packed[1], 0x40);
    EXPECT_EQ(unpackBits(packed.data(), bits.size()), bits);
    EXPECT_EQ(bitmapLen(0), 0u);
    EXPECT_EQ(bitmapLen(9), 2u);
}

TEST(MessageFormatting, FailMessageCarriesItsReason) {
    auto msg = createFailMessage("no such file");
    ASSERT_FALSE(msg.empty());
    EXPECT_EQ(msg.front(), FAIL);
    EXPECT_EQ(parseFailMessage(msg), "no such file");

    EXPECT_TRUE(createFailMessage("").empty());
    EXPECT_EQ(parseFailMessage({FAIL}), "");
    EXPECT_EQ(parseFailMessage({HELLO, 'x'}), "");
}

TEST(MessageFormatting, RegisterRequestLayout) {
    Registration reg;
    reg.uuid = 0x0102030405060708ull;
    reg.record.peer = {"10.1.2.3", 6000};
    reg.record.availability = {true, true, false};

    auto msg = createRegisterRequest(reg);
    //code, uuid, port, ip, bit count, one bitmap byte
    ASSERT_EQ(msg.size(), 1u + 8 + 2 + 4 + 8 + 1);
    EXPECT_EQ(msg[0], REGISTER_REQUEST);
    EXPECT_EQ(msg[1], 0x01);
    EXPECT_EQ(msg[8], 0x08);
    EXPECT_EQ(msg[9], 6000 >> 8);
    EXPECT_EQ(msg[10], 6000 & 0xFF);
    EXPECT_EQ(msg[11], 10);
    EXPECT_EQ(msg[14], 3);
    EXPECT_EQ(msg.back(), 0xC0);

    Registration parsed = parseRegisterRequest(msg);
    EXPECT_EQ(parsed.uuid, reg.uuid);
    EXPECT_EQ(parsed.record.peer, reg.record.peer);
    EXPECT_EQ(parsed.record.availability, reg.record.availability);
}

TEST(MessageFormatting, RegisterRequestRejectsBadInput) {
    Registration reg;
    reg.uuid = 42;
    reg.record.peer = {"10.1.2.3", 6000};
    reg.record.availability = {true};

    Registration no_uuid = reg;
    no_uuid.uuid = 0;
    EXPECT_TRUE(createRegisterRequest(no_uuid).empty());

    Registration bad_ip = reg;
    bad_ip.record.peer.ip_addr = "nope";
    EXPECT_TRUE(createRegisterRequest(bad_ip).empty());

    auto msg = createRegisterRequest(reg);
    ASSERT_FALSE(msg.empty());

    auto truncated = msg;
    truncated.pop_back();
    EXPECT_EQ(parseRegisterRequest(truncated).uuid, 0u);

    auto trailing = msg;
    trailing.push_back(0);
    EXPECT_EQ(parseRegisterRequest(trailing).uuid, 0u);

    Registration zero_port = reg;
    zero_port.record.peer.port = 0;
    EXPECT_EQ(parseRegisterRequest(createRegisterRequest(zero_port)).uuid, 0u);

    auto wrong_code = msg;
    wrong_code[0] = DEREGISTER_REQUEST;
    EXPECT_EQ(parseRegisterRequest(wrong_code).uuid, 0u);
}

TEST(MessageFormatting, FilePeerMessagesAreNotInterchangeable) {
    FilePeerPair pair(99, SourceInfo{"127.0.0.1", 7000});

    auto dereg = createDeregisterRequest(pair);
    auto list  = createPeerListRequest(pair);
    ASSERT_FALSE(dereg.empty());
    ASSERT_FALSE(list.empty());

    EXPECT_EQ(parseDeregisterRequest(dereg), pair);
    EXPECT_EQ(parsePeerListRequest(list), pair);
    EXPECT_EQ(parseDeregisterRequest(list).first, 0u);
    EXPECT_EQ(parsePeerListRequest(dereg).first, 0u);

    //a leecher not serving yet asks with port 0
    FilePeerPair anonymous(99, SourceInfo{"127.0.0.1", 0});
    EXPECT_EQ(parsePeerListRequest(createPeerListRequest(anonymous)), anonymous);
}

TEST(MessageFormatting, EmptyPeerListIsValid) {
    auto msg = createPeerList({});
    ASSERT_EQ(msg.size(), 9u);
    auto parsed = parsePeerList(msg);
    ASSERT_TRUE(parsed);
    EXPECT_TRUE(parsed->empty());
}

TEST(MessageFormatting, PeerListKeepsOrderAndBitmaps) {
    std::vector<PeerRecord> peers = {
        {{"10.0.0.1", 5000}, {true, false, true}},
        {{"10.0.0.2", 5001}, {}},
        {{"10.0.0.3", 5002}, std::vector<bool>(20, true)},
    };

    auto parsed = parsePeerList(createPeerList(peers));
    ASSERT_TRUE(parsed);
    ASSERT_EQ(parsed->size(), 3u);
    for (size_t i = 0; i < peers.size(); ++i) {
        EXPECT_EQ((*parsed)[i].peer, peers[i].peer);
        EXPECT_EQ((*parsed)[i].availability, peers[i].availability);
    }
    EXPECT_TRUE((*parsed)[2].isSeeder());
    EXPECT_FALSE((*parsed)[0].isSeeder());
}

TEST(MessageFormatting, PeerListRejectsLyingCounts) {
    auto msg = createPeerList({{{"10.0.0.1", 5000}, {true}}});
    ASSERT_FALSE(msg.empty());

    //claims two records but carries one
    auto lying = msg;
    lying[8] = 2;
    EXPECT_FALSE(parsePeerList(lying));

    auto trailing = msg;
    trailing.push_back(0xFF);
    EXPECT_FALSE(parsePeerList(trailing));

    EXPECT_FALSE(parsePeerList({PEER_LIST}));
}

TEST(MessageFormatting, AvailabilityChecksBitmapLength) {
    std::vector<bool> bits(13, false);
    bits[12] = true;
    auto msg = createAvailability(bits);
    ASSERT_EQ(msg.size(), 1u + 8 + 2);
    EXPECT_EQ(parseAvailability(msg).value(), bits);

    auto short_map = msg;
    short_map.pop_back();
    EXPECT_FALSE(parseAvailability(short_map));

    auto long_map = msg;
    long_map.push_back(0);
    EXPECT_FALSE(parseAvailability(long_map));

    auto empty = parseAvailability(createAvailability({}));
    ASSERT_TRUE(empty);
    EXPECT_TRUE(empty->empty());
}

TEST(MessageFormatting, SingleValueMessages) {
    EXPECT_EQ(parseHello(createHello(77)), 77u);
    EXPECT_TRUE(createHello(0).empty());
    EXPECT_EQ(parseChunkRequest(createChunkRequest(5)), 5u);
    EXPECT_EQ(parseNotFound(createNotFound(9)), 9u);
    EXPECT_EQ(parseDescriptorRequest(createDescriptorRequest(123)), 123u);

    //wrong code or length
    EXPECT_EQ(parseChunkRequest(createNotFound(5)), SIZE_MAX);
    EXPECT_EQ(parseNotFound({NOT_FOUND, 0, 0}), SIZE_MAX);
    EXPECT_EQ(parseHello(createDescriptorRequest(77)), 0u);
}

TEST(MessageFormatting, DataChunkAllowsAnyPayload) {
    std::vector<uint8_t> payload = {0, 1, 2, 0xFF};
    auto parsed = parseDataChunk(createDataChunk({3, payload}));
    EXPECT_EQ(parsed.first, 3u);
    EXPECT_EQ(parsed.second, payload);

    auto empty = parseDataChunk(createDataChunk({4, {}}));
    EXPECT_EQ(empty.first, 4u);
    EXPECT_TRUE(empty.second.empty());

    EXPECT_EQ(parseDataChunk({DATA_CHUNK, 0, 0}).first, SIZE_MAX);
}

TEST(MessageFormatting, DescriptorDecodeValidatesCounts) {
    FileDescriptor fd;
    fd.f_name      = "a.txt";
    fd.f_size      = 2500;
    fd.chunk_size  = 1000;
    fd.chunk_count = 3;
    fd.digests.resize(3);
    fd.digests[1].fill(0xAB);

    auto encoded = encodeDescriptor(fd);
    ASSERT_EQ(encoded.size(), 2u + 5 + 24 + 3 * DIGEST_LEN);
    auto decoded = decodeDescriptor(encoded.data(), encoded.size());
    ASSERT_TRUE(decoded);
    EXPECT_EQ(decoded.value(), fd);

    auto wrapped = parseDescriptorMessage(createDescriptorMessage(fd));
    ASSERT_TRUE(wrapped);
    EXPECT_EQ(wrapped.value(), fd);

    //one digest short
    EXPECT_FALSE(decodeDescriptor(encoded.data(), encoded.size() - DIGEST_LEN));

    //chunk count that doesn't match the size
    FileDescriptor wrong_count = fd;
    wrong_count.chunk_count = 4;
    wrong_count.digests.resize(4);
    auto bad = encodeDescriptor(wrong_count);
    ASSERT_FALSE(bad.empty());
    EXPECT_FALSE(decodeDescriptor(bad.data(), bad.size()));

    FileDescriptor mismatched = fd;
    mismatched.digests.pop_back();
    EXPECT_TRUE(encodeDescriptor(mismatched).empty());
}
