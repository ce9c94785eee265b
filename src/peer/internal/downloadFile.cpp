#include "peer/internal/downloadFile.hpp"
#include "peer/internal/peerSession.hpp"
#include "peer/internal/pieceManager.hpp"
#include "peer/internal/trackerRequests.hpp"
#include "errorCodes.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <thread>

namespace csw {

std::vector<SourceInfo> pickSessionPeers(const std::vector<PeerRecord>& peers,
                                         const PieceManager&            pm,
                                         const size_t                   max_sessions) {
    std::vector<SourceInfo> picked;
    for (const PeerRecord& p : peers) {
        if (picked.size() >= max_sessions)
            break;

        if (p.availability.size() != pm.chunkCount()) {
            std::cerr << "[download] " << p.peer.toString() << " registered "
                      << p.availability.size() << " chunks, skipping" << std::endl;
            continue;
        }
        if (pm.wantsFrom(p.availability, p.peer))
            picked.push_back(p.peer);
    }
    return picked;
}

//sleeps for millis, waking early on shutdown
static void pause(const uint64_t millis, const std::atomic<bool>& shutdown) {
    auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(millis);
    while (!shutdown.load() && std::chrono::steady_clock::now() < until)
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
}

int attemptFileDownload(const uint64_t           uuid,
                        PieceManager&            pm,
                        const SourceInfo&        me,
                        const Config&            config,
                        const std::atomic<bool>& shutdown) {
    std::vector<PeerRecord> peers;
    int res = requestPeerList({uuid, me}, peers, config);
    if (res == TRACKER_UNREACHABLE) {
        std::cerr << "[download] Could not reach the tracker at " << config.tracker_ip
                  << ":" << config.tracker_port << std::endl;
        return TRACKER_UNREACHABLE;
    }

    //wait for enough of the swarm to show up
    uint64_t waited = 0;
    while (!pm.isComplete() && peers.size() < config.min_peers && waited < config.swarm_retry_rounds) {
        if (shutdown.load())
            return EXIT_FAILURE;
        std::cout << "[download] Waiting for peers (" << peers.size() << "/"
                  << config.min_peers << ")" << std::endl;
        pause(config.retry_interval_ms, shutdown);
        requestPeerList({uuid, me}, peers, config);
        ++waited;
    }

    uint64_t idle_rounds = 0;
    bool first_round = true;
    while (!pm.isComplete()) {
        if (shutdown.load())
            return EXIT_FAILURE;

        if (!first_round) {
            res = requestPeerList({uuid, me}, peers, config);
            if (res != EXIT_SUCCESS)
                std::cerr << "[download] Tracker query failed: " << errorString(res) << std::endl;
        }
        first_round = false;

        size_t have_before = pm.haveCount();
        std::vector<SourceInfo> picked = pickSessionPeers(peers, pm, config.max_sessions);

        std::vector<std::thread> sessions;
        for (const SourceInfo& remote : picked) {
            sessions.emplace_back([&pm, &config, &shutdown, remote, uuid]() {
                int session_res = downloadFromPeer(remote, uuid, pm, config, shutdown);
                if (session_res != EXIT_SUCCESS)
                    std::cerr << "[download] Session with " << remote.toString() << " ended: "
                              << errorString(session_res) << std::endl;
            });
        }
        for (std::thread& t : sessions)
            t.join();

        if (pm.isComplete())
            break;

        if (pm.haveCount() > have_before) {
            idle_rounds = 0;
            continue;
        }

        if (++idle_rounds >= config.swarm_retry_rounds) {
            std::cerr << "[download] No usable peers left, " << pm.haveCount() << "/"
                      << pm.chunkCount() << " chunks held" << std::endl;
            return SWARM_EXHAUSTED;
        }
        pause(config.retry_interval_ms, shutdown);
    }

    return EXIT_SUCCESS;
}

} //csw
