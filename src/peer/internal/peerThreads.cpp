#include "peer/internal/peerThreads.hpp"
#include "networking/socket.hpp"
#include "errorCodes.hpp"
#include "sourceInfo.hpp"

#include <atomic>
#include <iostream>
#include <list>
#include <memory>
#include <thread>

namespace csw {

//a running session and the flag it sets on the way out
struct SeedSlot {
    std::thread                        thread;
    std::shared_ptr<std::atomic<bool>> done;
};

//joins every session that has already finished
static void reapSessions(std::list<SeedSlot>& sessions) {
    for (auto it = sessions.begin(); it != sessions.end();) {
        if (it->done->load()) {
            it->thread.join();
            it = sessions.erase(it);
        } else {
            ++it;
        }
    }
}

void peerListener(std::atomic<bool>&     shutdown,
                  std::atomic<uint16_t>& listener_port,
                  std::atomic<bool>&     listener_setup,
                  std::atomic<bool>&     listener_failed,
                  const SharedFiles&     files,
                  std::mutex&            files_mtx,
                  const Config&          config) {
    auto sock_port = openSocket(true, config.listen_port);
    if (!sock_port) {
        std::cerr << "[peerListener] Could not create and bind a socket for peers." << std::endl;
        listener_failed = true;
        return;
    }

    int listen_sock = sock_port->first;
    listener_port.store(sock_port->second);

    //tcp::listen closes the socket itself on failure
    if (tcp::listen(listen_sock, MAX_PENDING_PEERS)) {
        std::cerr << "[peerListener] Could not start listening." << std::endl;
        listener_failed = true;
        return;
    }

    std::cout << "[peerListener] Serving peers on port " << sock_port->second << std::endl;
    listener_setup = true;

    std::list<SeedSlot> sessions;
    while (!shutdown.load()) {
        reapSessions(sessions);

        SourceInfo remote;
        int peer_sock = tcp::accept(listen_sock, remote, toTimeval(1000));
        if (peer_sock == RECV_TIMED_OUT)
            continue;
        if (peer_sock < 0) {
            if (shutdown.load())
                break;
            std::cerr << "[peerListener] Error accepting connection." << std::endl;
            continue;
        }

        auto done = std::make_shared<std::atomic<bool>>(false);
        std::thread session([peer_sock, remote, done, &files, &files_mtx, &config, &shutdown]() {
            int res = seedToPeer(peer_sock, remote, files, files_mtx, config, shutdown);
            if (res != EXIT_SUCCESS)
                std::cerr << "[peerListener] Session with " << remote.toString() << " ended: "
                          << errorString(res) << std::endl;
            done->store(true);
        });
        sessions.push_back({std::move(session), done});
    }

    for (auto& slot : sessions)
        slot.thread.join();
    closeSocket(listen_sock);
}

} //csw
