#pragma once

#include "tracker/internal/database/internal/types.hpp"
#include <utility>

namespace csw {

// TABLE NAMES
inline constexpr char PEER_NAME[] = "PEERS";

// PRIMARY KEY, one row per peer per file
inline const std::vector<TableKey> PEER_KEYS = {
    std::make_pair("file_id", "INT"),
    std::make_pair("ip_addr", "TEXT"),
    std::make_pair("port",    "INT")
};

// ATTRIBUTES DEFINITIONS
inline const std::vector<TableKey> PEER_ATTRIBUTES = {
    std::make_pair("availability", "BLOB"), //packed bitmap
    std::make_pair("bit_count",    "INT"),
    std::make_pair("last_seen",    "INT")   //steady clock millis
};

} //csw
