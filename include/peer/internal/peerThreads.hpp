#pragma once

#include "config.hpp"
#include "peer/internal/peerSession.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>

namespace csw {

//connections waiting to be accepted by the listener
inline constexpr int MAX_PENDING_PEERS = 16;

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * peerListener
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Opens a socket to listen for incoming transfer connections, on
 *    config.listen_port or an OS assigned port when that is 0. Records the
 *    port it opened on in listener_port and then sets listener_setup, so the
 *    caller can wait for both before registering with the tracker.
 *
 *    Every accepted connection is served by seedToPeer() on its own thread.
 *    This function is designed to be run as a thread that can be flagged for
 *    shutdown, and is not detached. It joins every session thread it started
 *    before returning.
 *
 *    If the socket can't be opened, listener_failed is set and the function
 *    returns right away.
 *
 * Takes:
 * -> shutdown:
 *    An atomic bool that, if set True, this function will make its best effort
 *    to exit as fast as possible, only delayed by joining the sessions it's
 *    currently managing first.
 * -> files:
 *    The files being served, shared with the sessions.
 * -> files_mtx:
 *    Guards files.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
void peerListener(std::atomic<bool>&     shutdown,
                  std::atomic<uint16_t>& listener_port,
                  std::atomic<bool>&     listener_setup,
                  std::atomic<bool>&     listener_failed,
                  const SharedFiles&     files,
                  std::mutex&            files_mtx,
                  const Config&          config);

} //csw
