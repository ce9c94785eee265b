#include "networking/fileParsing.hpp"
#include "networking/internal/fileParsing/fileUtil.hpp"
#include "errorCodes.hpp"
#include "testUtil.hpp"

#include <gtest/gtest.h>

using namespace csw;

static ChunkMap toMap(const std::vector<Chunk>& chunks) {
    ChunkMap map;
    for (const Chunk& c : chunks)
        map[c.index] = c.data;
    return map;
}

TEST(FileParsing, SplitGivesFullChunksAndAShortLastOne) {
    auto bytes = test::makeBytes(2500, 1);
    auto split = splitFile("dir/data.bin", bytes, 1000);
    ASSERT_TRUE(split);

    const FileDescriptor& fd = split->first;
    EXPECT_EQ(fd.f_name, "data.bin");
    EXPECT_EQ(fd.f_size, 2500u);
    EXPECT_EQ(fd.chunk_count, 3u);
    ASSERT_EQ(split->second.size(), 3u);
    EXPECT_EQ(split->second[0].data.size(), 1000u);
    EXPECT_EQ(split->second[1].data.size(), 1000u);
    EXPECT_EQ(split->second[2].data.size(), 500u);
    EXPECT_EQ(fd.digests[2], split->second[2].digest);
}

TEST(FileParsing, SplitIsDeterministic) {
    auto bytes = test::makeBytes(4096, 2);
    auto a = splitFile("f", bytes, 512);
    auto b = splitFile("f", bytes, 512);
    ASSERT_TRUE(a && b);
    EXPECT_EQ(a->first, b->first);
    EXPECT_EQ(fileIdentifier(a->first), fileIdentifier(b->first));
}

TEST(FileParsing, EmptyFileHasNoChunks) {
    auto split = splitFile("empty", {}, 1024);
    ASSERT_TRUE(split);
    EXPECT_EQ(split->first.chunk_count, 0u);
    EXPECT_TRUE(split->second.empty());

    std::vector<uint8_t> out = {1, 2, 3};
    EXPECT_EQ(reassemble({}, split->first, out), EXIT_SUCCESS);
    EXPECT_TRUE(out.empty());
}

TEST(FileParsing, ZeroChunkSizeIsRejected) {
    EXPECT_FALSE(splitFile("f", test::makeBytes(10, 3), 0));
}

TEST(FileParsing, ChunkTooBigForOneMessageIsRejected) {
    auto bytes = test::makeBytes(10, 3);
    EXPECT_FALSE(splitFile("f", bytes, MAX_CHUNK_SIZE + 1));
    EXPECT_TRUE(splitFile("f", bytes, MAX_CHUNK_SIZE));
}

TEST(FileParsing, VerifyCatchesASingleFlippedByte) {
    auto split = splitFile("f", test::makeBytes(300, 4), 100);
    ASSERT_TRUE(split);

    std::vector<uint8_t> chunk = split->second[1].data;
    EXPECT_TRUE(verifyChunk(chunk, split->first.digests[1]));
    chunk[57] ^= 0x01;
    EXPECT_FALSE(verifyChunk(chunk, split->first.digests[1]));
}

TEST(FileParsing, ReassembleRestoresTheOriginalBytes) {
    auto bytes = test::makeBytes(10 * 1024 + 17, 5);
    auto split = splitFile("f", bytes, 1024);
    ASSERT_TRUE(split);

    std::vector<uint8_t> out;
    ASSERT_EQ(reassemble(toMap(split->second), split->first, out), EXIT_SUCCESS);
    EXPECT_EQ(out, bytes);
}

TEST(FileParsing, ReassembleReportsMissingChunks) {
    auto split = splitFile("f", test::makeBytes(5000, 6), 1000);
    ASSERT_TRUE(split);

    ChunkMap chunks = toMap(split->second);
    chunks.erase(3);
    std::vector<uint8_t> out;
    EXPECT_EQ(reassemble(chunks, split->first, out), INCOMPLETE);
}

TEST(FileParsing, ReassembleReportsCorruptChunks) {
    auto split = splitFile("f", test::makeBytes(5000, 7), 1000);
    ASSERT_TRUE(split);

    ChunkMap chunks = toMap(split->second);
    chunks[2][0] ^= 0xFF;
    std::vector<uint8_t> out;
    EXPECT_EQ(reassemble(chunks, split->first, out), CORRUPT_CHUNK);
    EXPECT_TRUE(out.empty());

    //right bytes, wrong length
    chunks = toMap(split->second);
    chunks[4].push_back(0);
    EXPECT_EQ(reassemble(chunks, split->first, out), CORRUPT_CHUNK);
}

TEST(FileParsing, ReassembleToFileWritesTheFile) {
    auto bytes = test::makeBytes(3333, 8);
    auto split = splitFile("f", bytes, 1000);
    ASSERT_TRUE(split);

    auto path = test::tempPath("reassembled.bin");
    ASSERT_EQ(reassembleToFile(toMap(split->second), split->first, path), EXIT_SUCCESS);

    auto on_disk = readFile(path);
    ASSERT_TRUE(on_disk);
    EXPECT_EQ(on_disk.value(), bytes);
}

TEST(FileParsing, DescriptorSurvivesSaveAndLoad) {
    auto split = splitFile("movie.mkv", test::makeBytes(7000, 9), 2048);
    ASSERT_TRUE(split);

    auto path = test::tempPath("movie.mkv.cswd");
    ASSERT_EQ(saveDescriptor(split->first, path), EXIT_SUCCESS);

    auto loaded = loadDescriptor(path);
    ASSERT_TRUE(loaded);
    EXPECT_EQ(loaded.value(), split->first);
    EXPECT_EQ(fileIdentifier(loaded.value()), fileIdentifier(split->first));
}

TEST(FileParsing, LoadDescriptorRejectsOtherFiles) {
    auto path = test::tempPath("not_a_descriptor");
    auto junk = test::makeBytes(64, 10);
    ASSERT_EQ(writeFile(path, junk.data(), junk.size()), EXIT_SUCCESS);
    EXPECT_FALSE(loadDescriptor(path));
    EXPECT_FALSE(loadDescriptor(test::tempPath("missing.cswd")));
}

TEST(FileParsing, FileIdentifierDependsOnContent) {
    auto a = splitFile("f", test::makeBytes(2048, 11), 1024);
    auto b = splitFile("f", test::makeBytes(2048, 12), 1024);
    ASSERT_TRUE(a && b);
    EXPECT_NE(fileIdentifier(a->first), 0u);
    EXPECT_NE(fileIdentifier(a->first), fileIdentifier(b->first));
}
