#pragma once

#include <cstdint>
#include <vector>

namespace csw {

class Registry;

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * peerRegisterRequest
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Handles REGISTER_REQUEST. Replies REGISTER_OK, or FAIL for a malformed
 *    request or a registry error.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
void peerRegisterRequest(const std::vector<uint8_t>& peer_request,
                               std::vector<uint8_t>& response_dest,
                               Registry&             registry);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * peerDeregisterRequest
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Handles DEREGISTER_REQUEST. Replies DEREGISTER_OK, including for a peer
 *    that wasn't registered.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
void peerDeregisterRequest(const std::vector<uint8_t>& peer_request,
                                 std::vector<uint8_t>& response_dest,
                                 Registry&             registry);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * peerListRequest
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Handles PEER_LIST_REQUEST. Replies PEER_LIST with every live peer of the
 *    file but the asking one, which may be none.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
void peerListRequest(const std::vector<uint8_t>& peer_request,
                           std::vector<uint8_t>& response_dest,
                           Registry&             registry);

//dispatches on the message code, FAIL for anything the tracker doesn't serve
std::vector<uint8_t> handleTrackerRequest(const std::vector<uint8_t>& peer_request,
                                          Registry&                   registry);

} //csw
