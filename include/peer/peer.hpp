#pragma once

#include "config.hpp"
#include "peer/internal/peerSession.hpp"
#include "sourceInfo.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace csw {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * SwarmPeer
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> The long running half of a peer. Serves every shared file to whoever
 *    connects, and keeps the tracker's view of this peer fresh by
 *    re-registering each shared file, with its current availability, every
 *    heartbeat interval.
 *
 *    Downloads are driven by the caller through attemptFileDownload(), with
 *    the PieceManager handed to share() first, so chunks become servable as
 *    soon as they verify.
 *
 *    stop() deregisters every shared file and joins all threads. The
 *    destructor calls it.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
class SwarmPeer {
private:
    const Config       config;
    std::atomic<bool>& shutdown;

    SharedFiles files;
    std::mutex  files_mtx;

    std::atomic<uint16_t> listener_port   = 0;
    std::atomic<bool>     listener_setup  = false;
    std::atomic<bool>     listener_failed = false;
    std::thread           listener;

    std::thread             heartbeat;
    std::mutex              heartbeat_mtx;
    std::condition_variable heartbeat_cv;

    bool stopped = false;

    void heartbeatLoop();

public:
    SwarmPeer(const Config& config, std::atomic<bool>& shutdown);
    ~SwarmPeer();

    SwarmPeer(const SwarmPeer&) = delete;
    SwarmPeer& operator=(const SwarmPeer&) = delete;

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * start
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Starts the listener and waits until it is accepting connections,
     *    then starts the heartbeat.
     *
     * Returns:
     * -> On success:
     *    EXIT_SUCCESS
     * -> On failure:
     *    EXIT_FAILURE if the listener couldn't open its socket.
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    int start();

    //where other peers reach this one, valid after start()
    SourceInfo address() const;

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * share
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Starts serving a file and registers it with the tracker.
     *
     * Returns:
     * -> On success:
     *    EXIT_SUCCESS
     * -> On failure:
     *    Whatever registerWithTracker() reported. The file is served anyway,
     *    and the heartbeat keeps trying to register it.
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    int share(const uint64_t uuid, std::shared_ptr<PieceManager> pm);

    //registers a shared file right away with its current availability
    int announce(const uint64_t uuid);

    //sets shutdown, deregisters every file and joins all threads
    void stop();
};

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * seedFile
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Splits a file into chunks, writes its descriptor next to it as
 *    <f_path>.cswd, and seeds it until shutdown is set.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS after shutdown.
 * -> On failure:
 *    EXIT_FAILURE if the file couldn't be read or served.
 *    TRACKER_UNREACHABLE if the first registration failed.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int seedFile(const std::filesystem::path& f_path,
             const Config&                config,
             std::atomic<bool>&           shutdown);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * leechFile
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Downloads a file from its swarm into out_path, then keeps seeding it
 *    until shutdown is set if keep_seeding is.
 *
 *    source is either the path of a descriptor file or a decimal file uuid.
 *    For a uuid, the descriptor is fetched from the first peer the tracker
 *    lists that has it, and checked against the uuid.
 *
 *    If out_path already holds a file of the right size, every chunk of it
 *    that verifies is kept and only the rest is downloaded.
 *
 *    While downloading, verified chunks are served to other peers.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS, out_path holds the file.
 * -> On failure:
 *    TRACKER_UNREACHABLE, SWARM_EXHAUSTED, or whatever reassembly reported.
 *    EXIT_FAILURE if source is neither a descriptor nor a known uuid, or
 *    shutdown was set before the download finished.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int leechFile(const std::string&           source,
              const std::filesystem::path& out_path,
              const Config&                config,
              std::atomic<bool>&           shutdown,
              const bool                   keep_seeding = true);

} //csw
