#pragma once

#include "sourceInfo.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include <sqlite3.h>

namespace csw {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Registry
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> The tracker's record of which peers are in the swarm of which file, and
 *    what each of them holds. Kept in an in-memory SQLite database with one
 *    row per (file, peer), so nothing survives a restart. Peers recover from
 *    that on their own by re-registering every heartbeat.
 *
 *    A row is live for ttl after its last registration. Stale rows are never
 *    returned, and are deleted the next time their file's swarm is listed.
 *
 *    Every call is serialized under one mutex, so a Registry can be shared by
 *    all of the tracker's connection threads.
 *
 * Member Variables:
 * -> db:
 *    The SQLite database instance.
 * -> ttl:
 *    How long a registration stays live.
 *
 * Constructor:
 * -> Takes:
 *    -> ttl:
 *       How long a registration stays live.
 * -> Throws:
 *    -> std::runtime_error:
 *       If the database couldn't be opened or set up.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
class Registry {
private:
    sqlite3*                        db = nullptr;
    const std::chrono::milliseconds ttl;
    std::string                     err_msg = ""; //set on any error
    mutable std::mutex              mtx;

    //all of the below expect mtx to be held
    int reportError(const std::string& err_msg);
    int purgeStale(const uint64_t uuid);

    //milliseconds on the steady clock, what last_seen is stored as
    static int64_t nowMillis();

public:
    explicit Registry(std::chrono::milliseconds ttl);
    ~Registry();

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * sqliteError
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Reports the most recent SQLite database error. Should be called after
     *    one of the below functions reports EXIT_FAILURE.
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    std::string sqliteError() const;

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * registerPeer
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Adds a peer to the swarm of a file, or if it's already there,
     *    replaces its availability. Either way the registration is refreshed.
     *    Registering the same record twice is the same as registering it once.
     *
     * Takes:
     * -> uuid:
     *    The file.
     * -> record:
     *    The peer's transfer address and what it holds.
     *
     * Returns:
     * -> On success:
     *    EXIT_SUCCESS
     * -> On failure:
     *    EXIT_FAILURE
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    int registerPeer(const uint64_t uuid, const PeerRecord& record);

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * deregisterPeer
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Removes a peer from the swarm of a file. A peer that isn't
     *    registered is not an error.
     *
     * Returns:
     * -> On success:
     *    EXIT_SUCCESS
     * -> On failure:
     *    EXIT_FAILURE
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    int deregisterPeer(const uint64_t uuid, const SourceInfo& peer);

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * listPeers
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Every live peer in the swarm of a file except excluding, ordered by
     *    ip then port. Stale rows of the file are deleted first.
     *
     * Takes:
     * -> uuid:
     *    The file.
     * -> excluding:
     *    Usually the asking peer. Matches nothing if it isn't registered.
     * -> dest:
     *    Cleared, then filled with the peers.
     *
     * Returns:
     * -> On success:
     *    EXIT_SUCCESS, even if the swarm is empty.
     * -> On failure:
     *    EXIT_FAILURE
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    int listPeers(const uint64_t           uuid,
                  const SourceInfo&        excluding,
                  std::vector<PeerRecord>& dest);

    //rows currently stored, stale or not
    size_t rowCount() const;
};

} //csw
