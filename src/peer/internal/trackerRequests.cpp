#include "peer/internal/trackerRequests.hpp"
#include "peer/internal/internal/peerNetworking.hpp"
#include "networking/socket.hpp"
#include "errorCodes.hpp"

#include <cstdlib>
#include <iostream>

namespace csw {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * attemptTrackerCommunication
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Connects to the tracker, sends one request and waits for a reply with
 *    msg_code. A fresh connection is made for every request, and closed once
 *    the reply is in.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS
 * -> On failure:
 *    TRACKER_UNREACHABLE if no connection could be made, EXIT_FAILURE for
 *    any other reply, or no reply.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
static int attemptTrackerCommunication(const std::vector<uint8_t>& request,
                                       std::vector<uint8_t>&       response_buff,
                                       const uint8_t               msg_code,
                                       const Config&               config) {
    if (request.empty())
        return EXIT_FAILURE;

    SourceInfo tracker{config.tracker_ip, config.tracker_port};
    int sock = connectToSource(tracker, toTimeval(config.connect_timeout_ms));
    if (sock < 0)
        return TRACKER_UNREACHABLE;

    int res = sendAndRecv(sock,
                          request,
                          response_buff,
                          msg_code,
                          toTimeval(config.request_timeout_ms));
    closeSocket(sock);

    if (res != EXIT_SUCCESS)
        std::cerr << "[tracker] " << tracker.toString() << ": "
                  << failReason(response_buff) << std::endl;
    return res;
}

int registerWithTracker(const Registration& reg, const Config& config) {
    std::vector<uint8_t> response;
    return attemptTrackerCommunication(createRegisterRequest(reg),
                                       response,
                                       REGISTER_OK,
                                       config);
}

int deregisterFromTracker(const FilePeerPair& dereg, const Config& config) {
    std::vector<uint8_t> response;
    return attemptTrackerCommunication(createDeregisterRequest(dereg),
                                       response,
                                       DEREGISTER_OK,
                                       config);
}

int requestPeerList(const FilePeerPair&      request,
                    std::vector<PeerRecord>& dest,
                    const Config&            config) {
    dest.clear();

    std::vector<uint8_t> response;
    int res = attemptTrackerCommunication(createPeerListRequest(request),
                                          response,
                                          PEER_LIST,
                                          config);
    if (res != EXIT_SUCCESS)
        return res;

    auto peers = parsePeerList(response);
    if (!peers) {
        std::cerr << "[tracker] Malformed peer list." << std::endl;
        return EXIT_FAILURE;
    }

    dest = std::move(peers.value());
    return EXIT_SUCCESS;
}

} //csw
