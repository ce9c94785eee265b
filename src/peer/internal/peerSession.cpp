#include "peer/internal/peerSession.hpp"
#include "peer/internal/pieceManager.hpp"
#include "peer/internal/internal/peerNetworking.hpp"
#include "networking/fileParsing.hpp"
#include "networking/messageFormatting.hpp"
#include "networking/socket.hpp"
#include "errorCodes.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <thread>
#include <vector>

namespace csw {

//how long a download session with nothing to claim sleeps before checking again
static constexpr uint64_t SESSION_POLL_MS = 50;

//how often a seed session wakes up to check for shutdown
static constexpr uint64_t SEED_POLL_MS = 250;

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * SessionGuard
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Closes the session socket when the session returns, and if the session
 *    was downloading, hands every request it still holds back to the
 *    PieceManager.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
struct SessionGuard {
    int           sock;
    PieceManager* pm;
    SourceInfo    remote;

    SessionGuard(int s, PieceManager* p, const SourceInfo& r) : sock(s), pm(p), remote(r) {}
    SessionGuard(const SessionGuard&) = delete;
    SessionGuard& operator=(const SessionGuard&) = delete;

    ~SessionGuard() {
        if (pm)
            pm->releaseRequests(remote);
        closeSocket(sock);
    }
};

static int violation(const SourceInfo& remote, const std::string& what) {
    std::cerr << "[peerSession] Protocol violation by " << remote.toString()
              << ": " << what << std::endl;
    return PROTOCOL_VIOLATION;
}

static void logProgress(const PieceManager& pm) {
    size_t have  = pm.haveCount();
    size_t count = pm.chunkCount();
    size_t pct   = (count == 0) ? 100 : have * 100 / count;
    std::cout << "[download] " << pm.fileDescriptor().f_name << ": " << have << "/"
              << count << " chunks (" << pct << "%)" << std::endl;
}

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * openingExchange
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> The initiating side of the handshake. Sends HELLO and expects HELLO for
 *    the same file back, then swaps AVAILABILITY.
 *
 * Takes:
 * -> remote_bits:
 *    Set to the remote's availability on success.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS
 * -> On failure:
 *    EXIT_FAILURE if the remote doesn't serve the file, PEER_UNREACHABLE, or
 *    PROTOCOL_VIOLATION.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
static int openingExchange(int                 sock,
                           const SourceInfo&   remote,
                           const uint64_t      uuid,
                           const PieceManager& pm,
                           timeval             timeout,
                           std::vector<bool>&  remote_bits) {
    std::vector<uint8_t> in;
    if (!sendOkay(sock, createHello(uuid)))
        return PEER_UNREACHABLE;
    if (tcp::recvMessage(sock, in, timeout) <= 0)
        return PEER_UNREACHABLE;

    if (in.front() == FAIL) {
        std::cerr << "[peerSession] " << remote.toString() << " refused file "
                  << uuid << ": " << failReason(in) << std::endl;
        return EXIT_FAILURE;
    }
    if (parseHello(in) != uuid)
        return violation(remote, "bad HELLO reply");

    if (!sendOkay(sock, createAvailability(pm.availability())))
        return PEER_UNREACHABLE;
    if (tcp::recvMessage(sock, in, timeout) <= 0)
        return PEER_UNREACHABLE;

    auto bits = parseAvailability(in);
    if (!bits)
        return violation(remote, "bad AVAILABILITY reply");
    if (bits->size() != pm.chunkCount())
        return violation(remote, "advertised " + std::to_string(bits->size())
                                 + " chunks, file has " + std::to_string(pm.chunkCount()));

    remote_bits = std::move(bits.value());
    return EXIT_SUCCESS;
}

int downloadFromPeer(const SourceInfo&        remote,
                     const uint64_t           uuid,
                     PieceManager&            pm,
                     const Config&            config,
                     const std::atomic<bool>& shutdown) {
    int sock = connectToSource(remote, toTimeval(config.connect_timeout_ms));
    if (sock < 0) {
        std::cerr << "[peerSession] Could not connect to " << remote.toString() << std::endl;
        return PEER_UNREACHABLE;
    }
    SessionGuard guard(sock, &pm, remote);

    const timeval request_timeout = toTimeval(config.request_timeout_ms);
    std::vector<bool> remote_bits;
    int res = openingExchange(sock, remote, uuid, pm, request_timeout, remote_bits);
    if (res != EXIT_SUCCESS)
        return res;

    std::vector<uint8_t> in;
    int timeouts = 0;
    while (true) {
        if (shutdown.load() || pm.isComplete()) {
            sendOkay(sock, {BYE});
            return EXIT_SUCCESS;
        }

        pm.expireRequests();
        auto index = pm.claimNext(remote_bits, remote);
        if (!index) {
            if (pm.wantsFrom(remote_bits, remote)) {
                //another session holds what's left, it may still fail
                std::this_thread::sleep_for(std::chrono::milliseconds(SESSION_POLL_MS));
                continue;
            }
            sendOkay(sock, {BYE});
            return EXIT_SUCCESS;
        }

        if (!sendOkay(sock, createChunkRequest(index.value())))
            return PEER_UNREACHABLE;

        auto deadline = std::chrono::steady_clock::now()
                        + std::chrono::milliseconds(config.request_timeout_ms);
        bool answered = false;
        while (!answered) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline)
                break;

            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            ssize_t bytes_read = tcp::recvMessage(sock, in, toTimeval(remaining.count()));
            if (bytes_read == RECV_TIMED_OUT)
                break;
            if (bytes_read < 0)
                return PEER_UNREACHABLE;

            switch (in.front()) {
                case DATA_CHUNK: {
                    auto [chunk_id, data] = parseDataChunk(in);
                    if (chunk_id == SIZE_MAX)
                        return violation(remote, "bad DATA_CHUNK");

                    res = pm.onChunkReceived(chunk_id, data, remote);
                    if (res == PROTOCOL_VIOLATION)
                        return violation(remote, "sent chunk " + std::to_string(chunk_id));

                    //anything else is a late answer to a request that already timed out
                    if (chunk_id == index.value()) {
                        answered = true;
                        if (res == EXIT_SUCCESS)
                            logProgress(pm);
                    }
                    break;
                }
                case NOT_FOUND: {
                    size_t chunk_id = parseNotFound(in);
                    if (chunk_id == SIZE_MAX)
                        return violation(remote, "bad NOT_FOUND");
                    if (chunk_id == index.value()) {
                        remote_bits[chunk_id] = false;
                        pm.releaseRequests(remote);
                        answered = true;
                    }
                    break;
                }
                case BYE:
                    return EXIT_SUCCESS;
                default:
                    return violation(remote, "unexpected message code " + std::to_string(in.front()));
            }
        }

        if (answered) {
            timeouts = 0;
            continue;
        }

        pm.onRequestTimeout(index.value());
        if (++timeouts >= MAX_CONSECUTIVE_TIMEOUTS) {
            std::cerr << "[peerSession] " << remote.toString() << " stopped answering" << std::endl;
            return PEER_UNREACHABLE;
        }
    }
}

int seedToPeer(int                      peer_sock,
               const SourceInfo         remote,
               const SharedFiles&       files,
               std::mutex&              files_mtx,
               const Config&            config,
               const std::atomic<bool>& shutdown) {
    SessionGuard guard(peer_sock, nullptr, remote);

    auto lookup = [&](uint64_t uuid) -> std::shared_ptr<PieceManager> {
        std::lock_guard<std::mutex> lock(files_mtx);
        auto it = files.find(uuid);
        if (it == files.end())
            return nullptr;
        return it->second;
    };

    auto refuse = [&](uint64_t uuid) {
        sendOkay(peer_sock, createFailMessage("file " + std::to_string(uuid) + " is not served here"));
        return EXIT_FAILURE;
    };

    std::shared_ptr<PieceManager> pm; //set by HELLO
    std::vector<bool> advertised;     //set when AVAILABILITY is answered
    bool availability_sent = false;

    const auto idle_timeout = std::chrono::milliseconds(config.session_idle_timeout_ms);
    auto last_heard = std::chrono::steady_clock::now();

    std::vector<uint8_t> in;
    while (!shutdown.load()) {
        ssize_t bytes_read = tcp::recvMessage(peer_sock, in, toTimeval(SEED_POLL_MS));
        if (bytes_read == RECV_TIMED_OUT) {
            if (std::chrono::steady_clock::now() - last_heard >= idle_timeout)
                return EXIT_SUCCESS;
            continue;
        }
        if (bytes_read < 0)
            return PEER_UNREACHABLE;
        last_heard = std::chrono::steady_clock::now();

        switch (in.front()) {
            case HELLO: {
                if (pm)
                    return violation(remote, "second HELLO");
                uint64_t uuid = parseHello(in);
                if (uuid == 0)
                    return violation(remote, "bad HELLO");

                pm = lookup(uuid);
                if (!pm)
                    return refuse(uuid);
                if (!sendOkay(peer_sock, createHello(uuid)))
                    return PEER_UNREACHABLE;
                break;
            }
            case DESCRIPTOR_REQUEST: {
                uint64_t uuid = parseDescriptorRequest(in);
                if (uuid == 0)
                    return violation(remote, "bad DESCRIPTOR_REQUEST");

                auto desc_pm = lookup(uuid);
                if (!desc_pm)
                    return refuse(uuid);
                if (!sendOkay(peer_sock, createDescriptorMessage(desc_pm->fileDescriptor())))
                    return PEER_UNREACHABLE;
                break;
            }
            case AVAILABILITY: {
                if (!pm || availability_sent)
                    return violation(remote, "AVAILABILITY out of order");
                auto bits = parseAvailability(in);
                if (!bits || bits->size() != pm->chunkCount())
                    return violation(remote, "bad AVAILABILITY");

                advertised = pm->availability();
                if (!sendOkay(peer_sock, createAvailability(advertised)))
                    return PEER_UNREACHABLE;
                availability_sent = true;
                break;
            }
            case REQUEST_CHUNK: {
                if (!availability_sent)
                    return violation(remote, "REQUEST_CHUNK before AVAILABILITY");
                size_t chunk_id = parseChunkRequest(in);
                if (chunk_id >= advertised.size() || !advertised[chunk_id])
                    return violation(remote, "requested chunk " + std::to_string(chunk_id)
                                             + " that was never advertised");

                auto chunk = pm->readChunk(chunk_id);
                std::vector<uint8_t> reply = chunk ? createDataChunk({chunk_id, std::move(chunk.value())})
                                                   : createNotFound(chunk_id);
                if (!sendOkay(peer_sock, reply))
                    return PEER_UNREACHABLE;
                break;
            }
            case BYE:
                return EXIT_SUCCESS;
            case FAIL:
                std::cerr << "[peerSession] " << remote.toString() << " failed: "
                          << failReason(in) << std::endl;
                return EXIT_FAILURE;
            default:
                return violation(remote, "unexpected message code " + std::to_string(in.front()));
        }
    }

    sendOkay(peer_sock, {BYE});
    return EXIT_SUCCESS;
}

std::optional<FileDescriptor> fetchDescriptor(const SourceInfo& peer,
                                              const uint64_t    uuid,
                                              const Config&     config) {
    int sock = connectToSource(peer, toTimeval(config.connect_timeout_ms));
    if (sock < 0)
        return std::nullopt;
    SessionGuard guard(sock, nullptr, peer);

    std::vector<uint8_t> in;
    if (EXIT_SUCCESS != sendAndRecv(sock,
                                    createDescriptorRequest(uuid),
                                    in,
                                    DESCRIPTOR,
                                    toTimeval(config.request_timeout_ms))) {
        std::cerr << "[fetchDescriptor] " << peer.toString() << ": " << failReason(in) << std::endl;
        return std::nullopt;
    }

    auto descriptor = parseDescriptorMessage(in);
    if (!descriptor || fileIdentifier(descriptor.value()) != uuid) {
        std::cerr << "[fetchDescriptor] " << peer.toString()
                  << " sent a descriptor that doesn't match file " << uuid << std::endl;
        return std::nullopt;
    }

    sendOkay(sock, {BYE});
    return descriptor;
}

} //csw
