#pragma once

#include "config.hpp"
#include "sourceInfo.hpp"

#include <atomic>
#include <cstdint>

namespace csw {

class Registry;

//connections waiting to be accepted by the tracker
inline constexpr int MAX_PENDING_CONNECTIONS = 32;

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * listenThread
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> The tracker's accept loop. Opens a listening socket on port, records the
 *    port actually bound in bound_port, sets listener_setup, then hands every
 *    accepted connection to a detached peerConnection() thread.
 *
 *    Returns once tracker_running is cleared, after every connection thread
 *    it started has finished, so registry may be destroyed afterwards.
 *
 *    If the socket can't be opened, listener_failed is set and the function
 *    returns right away.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
void listenThread(std::atomic<bool>&     tracker_running,
                  const uint16_t         port,
                  Registry&              registry,
                  std::atomic<uint16_t>& bound_port,
                  std::atomic<bool>&     listener_setup,
                  std::atomic<bool>&     listener_failed,
                  const Config&          config);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * peerConnection
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Serves one connection. Answers requests one at a time until the peer
 *    closes the connection, it stays quiet for longer than idle_ms, or
 *    tracker_running is cleared. peer_sock is closed and active_connections
 *    decremented before returning.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
void peerConnection(int                      peer_sock,
                    const SourceInfo         peer,
                    Registry&                registry,
                    const std::atomic<bool>& tracker_running,
                    std::atomic<int>&        active_connections,
                    const uint64_t           idle_ms);

} //csw
