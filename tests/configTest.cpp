#include "config.hpp"
#include "networking/fileParsing.hpp"
#include "testUtil.hpp"

#include <fstream>
#include <gtest/gtest.h>

using namespace csw;

static std::filesystem::path writeConfig(const std::string& name, const std::string& contents) {
    auto path = test::tempPath(name);
    std::ofstream out(path);
    out << contents;
    return path;
}

TEST(Config, DefaultsMatchDocumentedValues) {
    Config config;
    EXPECT_EQ(config.chunk_size, 64u * 1024);
    EXPECT_EQ(config.request_timeout_ms, 2000u);
    EXPECT_EQ(config.connect_timeout_ms, 2000u);
    EXPECT_EQ(config.tracker_ttl_ms, 30000u);
    EXPECT_EQ(config.heartbeat_interval_ms, 10000u);
    EXPECT_EQ(config.min_peers, 1u);
}

TEST(Config, LoadsKeyValueLinesAndSkipsComments) {
    auto path = writeConfig("good.conf",
                            "# tracker\n"
                            "tracker_ip = 10.0.0.7\n"
                            "  tracker_port=7000  \n"
                            "\n"
                            "chunk_size = 4096\n"
                            "request_timeout_ms = 150\n"
                            "min_peers = 2\n");
    Config config;
    ASSERT_EQ(loadConfig(path.string(), config), EXIT_SUCCESS);
    EXPECT_EQ(config.tracker_ip, "10.0.0.7");
    EXPECT_EQ(config.tracker_port, 7000);
    EXPECT_EQ(config.chunk_size, 4096u);
    EXPECT_EQ(config.request_timeout_ms, 150u);
    EXPECT_EQ(config.min_peers, 2u);
    //untouched keys keep their defaults
    EXPECT_EQ(config.tracker_ttl_ms, 30000u);
}

TEST(Config, UnknownKeyFailsAndLeavesConfigAlone) {
    auto path = writeConfig("unknown.conf", "chunk_size = 4096\nshoe_size = 11\n");
    Config config;
    EXPECT_EQ(loadConfig(path.string(), config), EXIT_FAILURE);
    EXPECT_EQ(config.chunk_size, 64u * 1024);
}

TEST(Config, MalformedValuesFail) {
    Config config;
    EXPECT_EQ(loadConfig(writeConfig("port.conf", "tracker_port = 70000\n").string(), config), EXIT_FAILURE);
    EXPECT_EQ(loadConfig(writeConfig("ip.conf", "listen_ip = not.an.ip\n").string(), config), EXIT_FAILURE);
    EXPECT_EQ(loadConfig(writeConfig("neg.conf", "request_timeout_ms = -5\n").string(), config), EXIT_FAILURE);
    EXPECT_EQ(loadConfig(writeConfig("zero.conf", "chunk_size = 0\n").string(), config), EXIT_FAILURE);
    EXPECT_EQ(loadConfig(writeConfig("noeq.conf", "chunk_size 4096\n").string(), config), EXIT_FAILURE);
}

TEST(Config, MissingFileFails) {
    Config config;
    EXPECT_EQ(loadConfig(test::tempPath("does_not_exist.conf").string(), config), EXIT_FAILURE);
}

TEST(Config, ChunkSizeMustFitInOneMessage) {
    Config config;
    EXPECT_EQ(loadConfig(writeConfig("huge.conf", "chunk_size = 70000000\n").string(), config), EXIT_FAILURE);
    EXPECT_EQ(config.chunk_size, 64u * 1024);

    EXPECT_FALSE(applySetting("chunk_size", std::to_string(MAX_CHUNK_SIZE + 1), config));
    EXPECT_EQ(config.chunk_size, 64u * 1024);
    EXPECT_TRUE(applySetting("chunk_size", std::to_string(MAX_CHUNK_SIZE), config));
    EXPECT_EQ(config.chunk_size, MAX_CHUNK_SIZE);
}

TEST(Config, ApplySettingChecksAddresses) {
    Config config;
    EXPECT_FALSE(applySetting("tracker_ip", "999.1.1.1", config));
    EXPECT_FALSE(applySetting("listen_ip", "peer-host", config));
    EXPECT_FALSE(applySetting("listen_ip", "", config));
    EXPECT_EQ(config.tracker_ip, Config().tracker_ip);
    EXPECT_EQ(config.listen_ip, Config().listen_ip);

    EXPECT_TRUE(applySetting("tracker_ip", "192.168.1.20", config));
    EXPECT_EQ(config.tracker_ip, "192.168.1.20");
    EXPECT_FALSE(applySetting("no_such_key", "1", config));
}
