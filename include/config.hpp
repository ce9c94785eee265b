#pragma once

#include <cstdint>
#include <string>

namespace csw {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Config
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> A struct to store the operational parameters of a peer or tracker. Every
 *    field has a usable default, values are overridden by a config file and
 *    then by the command line.
 *
 * Fields:
 * -> tracker_ip, tracker_port:
 *    Where the tracker listens. A tracker opens its listener on tracker_port.
 * -> listen_ip, listen_port:
 *    The address a peer advertises to the swarm and accepts transfer
 *    connections on. Port 0 lets the OS pick.
 * -> chunk_size:
 *    Bytes per chunk when splitting a file to seed.
 * -> request_timeout_ms:
 *    How long a chunk request may stay unanswered before the chunk is
 *    released for another attempt.
 * -> connect_timeout_ms:
 *    How long to wait on a TCP connect to a peer or the tracker.
 * -> tracker_ttl_ms:
 *    How long a registration stays in the tracker without being refreshed.
 * -> heartbeat_interval_ms:
 *    How often a running peer re-registers. Should be well under the TTL.
 * -> session_idle_timeout_ms:
 *    How long a serving session waits for the next message before closing.
 * -> retry_interval_ms:
 *    Pause between download rounds that made no progress.
 * -> max_sessions:
 *    Max concurrent download sessions per round.
 * -> swarm_retry_rounds:
 *    Rounds without progress tolerated before the swarm is declared
 *    exhausted.
 * -> min_peers:
 *    Peers the tracker must report before a download starts.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
struct Config {
    std::string tracker_ip              = "127.0.0.1";
    uint16_t    tracker_port            = 9090;
    std::string listen_ip               = "127.0.0.1";
    uint16_t    listen_port             = 0;
    uint64_t    chunk_size              = 64 * 1024;
    uint64_t    request_timeout_ms      = 2000;
    uint64_t    connect_timeout_ms      = 2000;
    uint64_t    tracker_ttl_ms          = 30000;
    uint64_t    heartbeat_interval_ms   = 10000;
    uint64_t    session_idle_timeout_ms = 15000;
    uint64_t    retry_interval_ms       = 1000;
    uint64_t    max_sessions            = 5;
    uint64_t    swarm_retry_rounds      = 5;
    uint64_t    min_peers               = 1;
};

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * applySetting
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Parses val and stores it in the Config field named key. Addresses must be
 *    dotted IPv4, chunk_size must fit in one DATA_CHUNK message.
 *
 * Returns:
 * -> true on success.
 * -> false on an unknown key or a malformed value, config is left untouched.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
bool applySetting(const std::string& key, const std::string& val, Config& config);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * loadConfig
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Reads a config file of "key = value" lines into config. Blank lines and
 *    lines starting with '#' are skipped. Keys are the Config field names.
 *    Fields not named in the file keep their current value.
 *
 * Takes:
 * -> config_path:
 *    Path to the config file.
 * -> config:
 *    The config to update. Left untouched if the load fails.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS
 * -> On failure:
 *    EXIT_FAILURE on a missing file, an unknown key, or a malformed value.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int loadConfig(const std::string& config_path, Config& config);

} //csw
