#include "tracker/internal/trackerThreads.hpp"
#include "tracker/internal/internal/trackerActions.hpp"
#include "tracker/internal/database/registry.hpp"
#include "networking/socket.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <thread>
#include <vector>

namespace csw {

//how often a quiet connection checks whether the tracker is shutting down
static constexpr uint64_t CONNECTION_POLL_MS = 250;

void peerConnection(int                      peer_sock,
                    const SourceInfo         peer,
                    Registry&                registry,
                    const std::atomic<bool>& tracker_running,
                    std::atomic<int>&        active_connections,
                    const uint64_t           idle_ms) {
    auto last_heard = std::chrono::steady_clock::now();
    std::vector<uint8_t> request;

    while (tracker_running.load()) {
        ssize_t bytes_read = tcp::recvMessage(peer_sock, request, toTimeval(CONNECTION_POLL_MS));
        if (bytes_read == RECV_TIMED_OUT) {
            if (std::chrono::steady_clock::now() - last_heard >= std::chrono::milliseconds(idle_ms))
                break;
            continue;
        }
        if (bytes_read < 0)
            break; //peer closed the connection, or broke framing
        last_heard = std::chrono::steady_clock::now();

        std::vector<uint8_t> response = handleTrackerRequest(request, registry);
        if (tcp::sendMessage(peer_sock, response) != EXIT_SUCCESS) {
            std::cerr << "[tracker] Could not reply to " << peer.toString() << std::endl;
            break;
        }
    }

    closeSocket(peer_sock);
    active_connections--;
}

void listenThread(std::atomic<bool>&     tracker_running,
                  const uint16_t         port,
                  Registry&              registry,
                  std::atomic<uint16_t>& bound_port,
                  std::atomic<bool>&     listener_setup,
                  std::atomic<bool>&     listener_failed,
                  const Config&          config) {
    ///////////////////////////////////////////////////////////////////////
    //SETUP PROCESS
    auto socket = openSocket(true, port);
    if (!socket) {
        std::cerr << "[tracker] Could not bind listener on port " << port << std::endl;
        listener_failed = true;
        return;
    }

    auto [my_sock, my_port] = socket.value();
    if (EXIT_FAILURE == tcp::listen(my_sock, MAX_PENDING_CONNECTIONS)) {
        std::cerr << "[tracker] Could not start listening." << std::endl;
        listener_failed = true;
        return;
    }

    bound_port     = my_port;
    listener_setup = true;

    std::atomic<int> active_connections = 0;
    ///////////////////////////////////////////////////////////////////////
    //MAIN LOOP
    while (tracker_running.load()) {
        SourceInfo peer;
        int peer_sock = tcp::accept(my_sock, peer, toTimeval(1000));
        if (peer_sock < 0)
            continue;

        active_connections++;
        std::thread peer_conn(peerConnection,
                              peer_sock,
                              peer,
                              std::ref(registry),
                              std::cref(tracker_running),
                              std::ref(active_connections),
                              config.session_idle_timeout_ms);
        peer_conn.detach();
    }

    ///////////////////////////////////////////////////////////////////////
    //SHUTDOWN PROCESS
    closeSocket(my_sock);
    while (active_connections.load() > 0)
        std::this_thread::sleep_for(std::chrono::milliseconds(CONNECTION_POLL_MS));
}

} //csw
