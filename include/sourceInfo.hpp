#pragma once

#include <cstdint>
#include <string>
#include <tuple>
#include <vector>

namespace csw {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * SourceInfo
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> A struct to store the network address of a peer or tracker you're talking
 *    to. Two SourceInfo's with the same ip and port are the same peer.
 *
 * Fields:
 * -> ip_addr:
 *    IPv4 address in dotted decimal.
 * -> port:
 *    Port number the peer listens on.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
struct SourceInfo {
    std::string ip_addr;
    uint16_t    port = 0;

    bool operator==(const SourceInfo& other) const {
        return ip_addr == other.ip_addr && port == other.port;
    }

    bool operator!=(const SourceInfo& other) const {
        return !(*this == other);
    }

    bool operator<(const SourceInfo& other) const {
        return std::tie(ip_addr, port) < std::tie(other.ip_addr, other.port);
    }

    std::string toString() const {
        return ip_addr + ":" + std::to_string(port);
    }
};

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * PeerRecord
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> What is known about one member of a swarm: where to reach it, and which
 *    chunks it holds. Kept by the tracker for every registration, and rebuilt
 *    by every peer session from the remote peer's advertisement.
 *
 * Fields:
 * -> peer:
 *    The address the peer accepts transfer connections on.
 * -> availability:
 *    One entry per chunk index, true if the peer holds that chunk.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
struct PeerRecord {
    SourceInfo        peer;
    std::vector<bool> availability;

    //a seeder is any peer holding every chunk, never a stored flag
    bool isSeeder() const {
        for (bool b : availability)
            if (!b) return false;
        return true;
    }
};

} //csw
