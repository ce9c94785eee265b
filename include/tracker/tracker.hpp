#pragma once

#include "config.hpp"
#include "tracker/internal/database/registry.hpp"

#include <atomic>
#include <cstdint>
#include <thread>

namespace csw {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Tracker
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Owns the Registry and the thread listening for peers. The registry is
 *    handed to the listener explicitly, there's no global state, so several
 *    trackers can run in one process.
 *
 * Constructor:
 * -> Throws:
 *    -> std::runtime_error:
 *       If the registry couldn't be set up.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
class Tracker {
private:
    const Config config;
    Registry     registry;

    std::atomic<bool>     running         = false;
    std::atomic<uint16_t> bound_port      = 0;
    std::atomic<bool>     listener_setup  = false;
    std::atomic<bool>     listener_failed = false;
    std::thread           listener;

public:
    explicit Tracker(const Config& config);
    ~Tracker();

    Tracker(const Tracker&) = delete;
    Tracker& operator=(const Tracker&) = delete;

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * start
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Starts listening on config.tracker_port, or an OS assigned port if
     *    that is 0, and waits until connections are accepted.
     *
     * Returns:
     * -> On success:
     *    EXIT_SUCCESS
     * -> On failure:
     *    EXIT_FAILURE
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    int start();

    //the port listened on, valid after start()
    uint16_t port() const { return bound_port.load(); }

    Registry& peerRegistry() { return registry; }

    //stops accepting, and returns once every connection is closed
    void stop();
};

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * runTracker
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Runs a tracker until shutdown is set.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS
 * -> On failure:
 *    EXIT_FAILURE if the tracker couldn't start.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int runTracker(const Config& config, const std::atomic<bool>& shutdown);

} //csw
