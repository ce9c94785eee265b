#include "tracker/internal/internal/trackerActions.hpp"
#include "tracker/internal/database/registry.hpp"
#include "networking/messageFormatting.hpp"

#include <cstdlib>
#include <string>

namespace csw {

void peerRegisterRequest(const std::vector<uint8_t>& peer_request,
                               std::vector<uint8_t>& response_dest,
                               Registry&             registry) {
    Registration reg = parseRegisterRequest(peer_request);
    if (reg.uuid == 0) {
        response_dest = createFailMessage("Malformed registration.");
        return;
    }

    if (EXIT_SUCCESS != registry.registerPeer(reg.uuid, reg.record))
        response_dest = createFailMessage(registry.sqliteError());
    else
        response_dest = {REGISTER_OK};
}

void peerDeregisterRequest(const std::vector<uint8_t>& peer_request,
                                 std::vector<uint8_t>& response_dest,
                                 Registry&             registry) {
    FilePeerPair dereg = parseDeregisterRequest(peer_request);
    if (dereg.first == 0) {
        response_dest = createFailMessage("Malformed deregistration.");
        return;
    }

    if (EXIT_SUCCESS != registry.deregisterPeer(dereg.first, dereg.second))
        response_dest = createFailMessage(registry.sqliteError());
    else
        response_dest = {DEREGISTER_OK};
}

void peerListRequest(const std::vector<uint8_t>& peer_request,
                           std::vector<uint8_t>& response_dest,
                           Registry&             registry) {
    FilePeerPair request = parsePeerListRequest(peer_request);
    if (request.first == 0) {
        response_dest = createFailMessage("Invalid file uuid provided.");
        return;
    }

    std::vector<PeerRecord> peers;
    if (EXIT_SUCCESS != registry.listPeers(request.first, request.second, peers))
        response_dest = createFailMessage(registry.sqliteError());
    else
        response_dest = createPeerList(peers);
}

std::vector<uint8_t> handleTrackerRequest(const std::vector<uint8_t>& peer_request,
                                          Registry&                   registry) {
    std::vector<uint8_t> response;
    if (peer_request.empty())
        return createFailMessage("Empty request.");

    switch (peer_request.front()) {
        case REGISTER_REQUEST:
            peerRegisterRequest(peer_request, response, registry);
            break;
        case DEREGISTER_REQUEST:
            peerDeregisterRequest(peer_request, response, registry);
            break;
        case PEER_LIST_REQUEST:
            peerListRequest(peer_request, response, registry);
            break;
        default:
            response = createFailMessage("Unknown request code "
                                         + std::to_string(peer_request.front()) + ".");
    }

    //an empty reply means the reply itself couldn't be encoded
    if (response.empty())
        response = createFailMessage("Could not encode reply.");
    return response;
}

} //csw
