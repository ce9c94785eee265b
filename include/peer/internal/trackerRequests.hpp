#pragma once

#include "config.hpp"
#include "networking/messageFormatting.hpp"
#include "sourceInfo.hpp"

#include <cstdint>
#include <vector>

namespace csw {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * registerWithTracker
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Registers, or refreshes, this peer and its availability for one file.
 *    Called once at startup, then again on every heartbeat, since the tracker
 *    forgets peers it hasn't heard from within its ttl.
 *
 * Takes:
 * -> reg:
 *    The file uuid, our transfer address, and what we hold.
 * -> config:
 *    Tracker address and timeouts.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS
 * -> On failure:
 *    TRACKER_UNREACHABLE if the tracker couldn't be reached, EXIT_FAILURE if
 *    it refused.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int registerWithTracker(const Registration& reg, const Config& config);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * deregisterFromTracker
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Tells the tracker this peer no longer serves a file.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS
 * -> On failure:
 *    TRACKER_UNREACHABLE or EXIT_FAILURE, as for registerWithTracker().
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int deregisterFromTracker(const FilePeerPair& dereg, const Config& config);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * requestPeerList
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Asks the tracker for every live peer of a file other than the one
 *    given in request.second. dest is cleared first, and holds the list on
 *    success. An empty list is a success.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS
 * -> On failure:
 *    TRACKER_UNREACHABLE if the tracker couldn't be reached, EXIT_FAILURE if
 *    it refused or its reply couldn't be parsed.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int requestPeerList(const FilePeerPair&      request,
                    std::vector<PeerRecord>& dest,
                    const Config&            config);

} //csw
