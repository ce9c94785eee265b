#pragma once

#include "config.hpp"
#include "peer/internal/peerSession.hpp"
#include "sourceInfo.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace csw::test {

//deterministic pseudo random bytes
std::vector<uint8_t> makeBytes(size_t n, uint32_t seed);

//a path under the temp dir unique to this process, removed if it exists
std::filesystem::path tempPath(const std::string& name);

//short timeouts so failure paths finish quickly
Config testConfig();

//every bit set
std::vector<bool> allBits(size_t n);

/*
 * Serves a set of files the way a peer does, through peerListener, on an OS
 * assigned port. Stopped and joined on destruction.
 */
class TestSeeder {
private:
    Config                config;
    std::atomic<bool>     shutdown        = false;
    std::atomic<uint16_t> port            = 0;
    std::atomic<bool>     listener_setup  = false;
    std::atomic<bool>     listener_failed = false;
    std::thread           listener;

public:
    SharedFiles files;
    std::mutex  files_mtx;

    explicit TestSeeder(const Config& config);
    ~TestSeeder();

    bool start();
    SourceInfo address() const;
};

/*
 * Accepts one connection on an OS assigned port and runs script on it in a
 * thread, for playing the remote side of a session by hand.
 */
class ScriptedPeer {
private:
    int         listen_sock = -1;
    uint16_t    port        = 0;
    std::thread runner;

public:
    explicit ScriptedPeer(std::function<void(int sock)> script);
    ~ScriptedPeer();

    bool ok() const { return listen_sock >= 0; }
    SourceInfo address() const;
};

//a port nothing is listening on
uint16_t closedPort();

} //csw::test
