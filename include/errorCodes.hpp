#pragma once

#include <cstdlib>
#include <string>

namespace csw {

/*
 * Status codes returned alongside EXIT_SUCCESS / EXIT_FAILURE by the chunk
 * exchange functions. EXIT_FAILURE stays the generic "something went wrong"
 * code, these name the failures callers are expected to react to.
 *
 * CORRUPT_CHUNK:
 *    Chunk bytes did not hash to the digest in the descriptor. Recoverable,
 *    the chunk is discarded and requested again.
 * INCOMPLETE:
 *    Reassembly attempted with chunk indices missing. A caller bug, fatal to
 *    that one call.
 * PROTOCOL_VIOLATION:
 *    The remote peer broke the transfer protocol. The session is closed.
 * PEER_UNREACHABLE:
 *    Connection refused, reset, or the peer stopped answering.
 * SWARM_EXHAUSTED:
 *    No usable peer is left and the file is still incomplete.
 * TRACKER_UNREACHABLE:
 *    Could not talk to the tracker. At startup this aborts a download.
 */
inline constexpr int CORRUPT_CHUNK       = 2;
inline constexpr int INCOMPLETE          = 3;
inline constexpr int PROTOCOL_VIOLATION  = 4;
inline constexpr int PEER_UNREACHABLE    = 5;
inline constexpr int SWARM_EXHAUSTED     = 6;
inline constexpr int TRACKER_UNREACHABLE = 7;

inline std::string errorString(const int code) {
    switch (code) {
        case EXIT_SUCCESS:        return "success";
        case EXIT_FAILURE:        return "failure";
        case CORRUPT_CHUNK:       return "corrupt chunk";
        case INCOMPLETE:          return "incomplete";
        case PROTOCOL_VIOLATION:  return "protocol violation";
        case PEER_UNREACHABLE:    return "peer unreachable";
        case SWARM_EXHAUSTED:     return "swarm exhausted";
        case TRACKER_UNREACHABLE: return "tracker unreachable";
        default:                  return "unknown error " + std::to_string(code);
    }
}

} //csw
