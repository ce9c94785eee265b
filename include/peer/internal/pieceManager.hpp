#pragma once

#include "fileDescriptor.hpp"
#include "sourceInfo.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace csw {

//per chunk index, exactly one of these at any time
enum class ChunkState {
    MISSING,
    REQUESTED,
    HAVE
};

//verification failures one peer may cause on one index before it's skipped
inline constexpr size_t MAX_CHUNK_FAILURES = 3;

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * PieceManager
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Keeps track of which chunks of one file are held, missing, or in flight,
 *    decides which chunk to ask a peer for next, and owns the file sized
 *    buffer verified chunks are copied into. One instance per file, shared by
 *    every session that downloads or serves that file.
 *
 *    Each index moves MISSING -> REQUESTED -> HAVE. HAVE is never left.
 *    REQUESTED drops back to MISSING on a timeout, a failed verification, or
 *    when the session that sent the request ends.
 *
 *    Every member function is thread safe.
 *
 * Member Variables:
 * -> descriptor:
 *    The file being assembled. Never modified.
 * -> request_timeout:
 *    How long a REQUESTED index waits before it can be expired.
 * -> entries:
 *    State of every chunk index, with who it was requested from and when.
 * -> failures:
 *    Verification failures per index, from any peer.
 * -> peer_failures:
 *    Verification failures per (index, peer). At MAX_CHUNK_FAILURES the peer
 *    is excluded from selection for that index.
 * -> buffer:
 *    The reassembly buffer. Chunk i lives at i * chunk_size.
 * -> have_count:
 *    Number of HAVE indices.
 *
 * Constructor:
 * -> Takes:
 *    -> descriptor:
 *       The file to track. Every index starts MISSING.
 *    -> request_timeout:
 *       Request expiry.
 * -> Throws:
 *    -> std::runtime_error:
 *       If the descriptor doesn't carry one digest per chunk.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
class PieceManager {
private:
    struct ChunkEntry {
        ChunkState                            state = ChunkState::MISSING;
        SourceInfo                            requested_from;
        std::chrono::steady_clock::time_point requested_at;
    };

    const FileDescriptor            descriptor;
    const std::chrono::milliseconds request_timeout;

    std::vector<ChunkEntry>                         entries;
    std::vector<size_t>                             failures;
    std::map<std::pair<size_t, SourceInfo>, size_t> peer_failures;
    std::vector<uint8_t>                            buffer;
    size_t                                          have_count = 0;

    mutable std::mutex mtx;

    //all of the below expect mtx to be held
    bool isExcluded(const size_t index, const SourceInfo& remote) const;
    std::optional<size_t> selectLocked(const std::vector<bool>& remote_bits,
                                       const SourceInfo&        remote) const;
    int markRequested(const size_t index, const SourceInfo& remote);
    void markHave(const size_t index, const uint8_t* data);
    bool chunkMatches(const size_t index, const uint8_t* data, const size_t len) const;

public:
    PieceManager(const FileDescriptor& descriptor, std::chrono::milliseconds request_timeout);

    PieceManager(const PieceManager&) = delete;
    PieceManager& operator=(const PieceManager&) = delete;

    const FileDescriptor& fileDescriptor() const { return descriptor; }
    size_t chunkCount() const { return entries.size(); }

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * selectNext
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Picks the lowest index that is MISSING here, held by the remote, and
     *    that the remote isn't excluded for. Doesn't change any state, so two
     *    callers can get the same answer. Sessions should use claimNext().
     *
     * Takes:
     * -> remote_bits:
     *    The remote peer's advertised availability.
     * -> remote:
     *    The remote peer.
     *
     * Returns:
     * -> On success:
     *    The index.
     * -> On failure:
     *    std::nullopt when nothing is eligible.
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    std::optional<size_t> selectNext(const std::vector<bool>& remote_bits,
                                     const SourceInfo&        remote) const;

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * onRequestSent
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Records that index was requested from remote just now.
     *
     * Returns:
     * -> On success:
     *    EXIT_SUCCESS
     * -> On failure:
     *    PROTOCOL_VIOLATION if index isn't MISSING, or is out of range. The
     *    state is left alone.
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    int onRequestSent(const size_t index, const SourceInfo& remote);

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * claimNext
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> selectNext() and onRequestSent() under one lock, so no two sessions
     *    ever claim the same index.
     *
     * Returns:
     * -> On success:
     *    The index, now REQUESTED from remote.
     * -> On failure:
     *    std::nullopt when nothing is eligible.
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    std::optional<size_t> claimNext(const std::vector<bool>& remote_bits,
                                    const SourceInfo&        remote);

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * onChunkReceived
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Verifies received chunk bytes against the descriptor.
     *
     *    If they check out, the index becomes HAVE and the bytes are copied to
     *    the buffer. A chunk that is already HAVE is a harmless duplicate and
     *    nothing changes.
     *
     *    If they don't, the failure counters for the index and for (index,
     *    from) go up, and the index drops back to MISSING unless another peer
     *    holds the request on it.
     *
     * Returns:
     * -> On success:
     *    EXIT_SUCCESS
     * -> On failure:
     *    CORRUPT_CHUNK on a failed verification, PROTOCOL_VIOLATION if index
     *    is out of range.
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    int onChunkReceived(const size_t                index,
                        const std::vector<uint8_t>& data,
                        const SourceInfo&           from);

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * onRequestTimeout
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Drops a REQUESTED index back to MISSING once its request is older
     *    than the timeout.
     *
     * Returns:
     * -> On success:
     *    EXIT_SUCCESS, the index is MISSING again.
     * -> On failure:
     *    EXIT_FAILURE if the index isn't REQUESTED or hasn't expired yet.
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    int onRequestTimeout(const size_t index);

    //expires every timed out request, returns how many were expired
    size_t expireRequests();

    //drops every request held by remote back to MISSING, returns how many
    size_t releaseRequests(const SourceInfo& remote);

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * loadLocalFile
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Marks every chunk of bytes that verifies as HAVE. Used by seeders,
     *    which hold the whole file, and by leechers resuming from a partial
     *    copy.
     *
     * Returns:
     * -> On success:
     *    EXIT_SUCCESS, every chunk verified.
     * -> On failure:
     *    CORRUPT_CHUNK if some chunks didn't verify. The ones that did are
     *    kept. EXIT_FAILURE if bytes is the wrong size.
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    int loadLocalFile(const std::vector<uint8_t>& bytes);

    bool isComplete() const;

    //one entry per index, true for HAVE. computed on every call
    std::vector<bool> availability() const;

    //the bytes of a HAVE chunk, std::nullopt for any other state
    std::optional<std::vector<uint8_t>> readChunk(const size_t index) const;

    size_t haveCount() const;
    size_t failureCount(const size_t index) const;
    ChunkState state(const size_t index) const;

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * wantsFrom
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Whether the remote holds any index that isn't HAVE here and that it
     *    isn't excluded for, in flight elsewhere or not. A session with nothing
     *    to claim keeps polling while this holds, since another session's
     *    request may still fail and free the index.
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    bool wantsFrom(const std::vector<bool>& remote_bits, const SourceInfo& remote) const;

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * reassemble
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Gathers every chunk from the buffer and writes the file to f_path
     *    through reassembleToFile().
     *
     * Returns:
     * -> On success:
     *    EXIT_SUCCESS
     * -> On failure:
     *    INCOMPLETE if any index isn't HAVE, otherwise whatever
     *    reassembleToFile() reports.
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    int reassemble(const std::filesystem::path& f_path) const;
};

} //csw
