#pragma once

#include "config.hpp"
#include "fileDescriptor.hpp"
#include "sourceInfo.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

namespace csw {

class PieceManager;

//every file this peer serves, keyed by file uuid
using SharedFiles = std::map<uint64_t, std::shared_ptr<PieceManager>>;

//unanswered requests in a row before a peer is given up on
inline constexpr int MAX_CONSECUTIVE_TIMEOUTS = 3;

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * downloadFromPeer
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Connects to a peer and downloads chunks of one file from it until it has
 *    nothing left we want, or the file is complete.
 *
 *    After the HELLO and AVAILABILITY exchange, one chunk at a time is claimed
 *    from the PieceManager, requested, and waited on for at most the request
 *    timeout. Chunks arriving late for an earlier request are still handed to
 *    the PieceManager. When nothing is claimable but the peer holds chunks in
 *    flight with other sessions, the session waits, since those requests may
 *    still fail.
 *
 *    Every request this session holds is released when it ends, however it
 *    ends.
 *
 * Takes:
 * -> remote:
 *    The address the peer accepts transfer connections on.
 * -> uuid:
 *    The file to download.
 * -> pm:
 *    The PieceManager of that file.
 * -> config:
 *    Timeouts.
 * -> shutdown:
 *    When set, the session says BYE and returns at the next chance.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS, the session ended cleanly. The file may still be
 *    incomplete if the peer didn't hold everything.
 * -> On failure:
 *    PEER_UNREACHABLE if the connection failed or the peer went silent.
 *    PROTOCOL_VIOLATION if the peer broke the protocol.
 *    EXIT_FAILURE if the peer doesn't serve the file.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int downloadFromPeer(const SourceInfo&        remote,
                     const uint64_t           uuid,
                     PieceManager&            pm,
                     const Config&            config,
                     const std::atomic<bool>& shutdown);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * seedToPeer
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Serves one accepted connection. Answers HELLO for any file in files, with
 *    FAIL for anything else, then AVAILABILITY with the chunks held at that
 *    moment, then chunk requests until the peer says BYE, disconnects, goes
 *    idle for longer than the session idle timeout, or shutdown is set.
 *    Also answers DESCRIPTOR_REQUEST.
 *
 *    A request for a chunk that was never advertised is a protocol violation
 *    and closes the session.
 *
 *    peer_sock is closed before returning.
 *
 * Takes:
 * -> peer_sock:
 *    The accepted socket.
 * -> remote:
 *    Address the connection came from, for logging.
 * -> files:
 *    Files being served.
 * -> files_mtx:
 *    Guards files.
 * -> config:
 *    Timeouts.
 * -> shutdown:
 *    Checked between messages.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS
 * -> On failure:
 *    PROTOCOL_VIOLATION, PEER_UNREACHABLE on a broken connection, or
 *    EXIT_FAILURE for a request about a file that isn't served here.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int seedToPeer(int                      peer_sock,
               const SourceInfo         remote,
               const SharedFiles&       files,
               std::mutex&              files_mtx,
               const Config&            config,
               const std::atomic<bool>& shutdown);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * fetchDescriptor
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Asks a peer for the descriptor of a file, and checks that the descriptor
 *    received hashes to uuid before returning it.
 *
 * Returns:
 * -> On success:
 *    The descriptor.
 * -> On failure:
 *    std::nullopt
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::optional<FileDescriptor> fetchDescriptor(const SourceInfo& peer,
                                              const uint64_t    uuid,
                                              const Config&     config);

} //csw
