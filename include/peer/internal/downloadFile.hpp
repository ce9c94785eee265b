#pragma once

#include "config.hpp"
#include "sourceInfo.hpp"

#include <atomic>
#include <cstdint>
#include <vector>

namespace csw {

class PieceManager;

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * attemptFileDownload
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Downloads every chunk pm is missing from the swarm of a file.
 *
 *    The tracker is asked for the swarm, and while it has fewer than
 *    config.min_peers members it is asked again every retry interval, up to
 *    config.swarm_retry_rounds times, after which the download starts with
 *    whoever is there.
 *
 *    Each round then opens a download session, on its own thread, with up to
 *    config.max_sessions peers holding chunks we lack, and waits for them all
 *    to end. Sessions share pm, which keeps them from requesting the same
 *    chunk twice. Between rounds the tracker is asked again, since leechers
 *    gain chunks over time.
 *
 * Takes:
 * -> uuid:
 *    The file to download.
 * -> pm:
 *    The PieceManager of the file, possibly already holding some chunks.
 * -> me:
 *    This peer's transfer address, left out of the tracker's replies.
 * -> config:
 *    Tracker address, session limits and timeouts.
 * -> shutdown:
 *    When set, running sessions end and no new round is started.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS, pm is complete.
 * -> On failure:
 *    TRACKER_UNREACHABLE if the first tracker query failed, SWARM_EXHAUSTED
 *    after swarm_retry_rounds rounds in a row gained no chunk, EXIT_FAILURE
 *    if shutdown was set first.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int attemptFileDownload(const uint64_t           uuid,
                        PieceManager&            pm,
                        const SourceInfo&        me,
                        const Config&            config,
                        const std::atomic<bool>& shutdown);

//the peers worth opening a session with, in tracker order, at most max_sessions
std::vector<SourceInfo> pickSessionPeers(const std::vector<PeerRecord>& peers,
                                         const PieceManager&            pm,
                                         const size_t                   max_sessions);

} //csw
