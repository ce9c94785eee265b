#include "peer/internal/pieceManager.hpp"
#include "networking/fileParsing.hpp"
#include "errorCodes.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>

namespace csw {

PieceManager::PieceManager(const FileDescriptor& descriptor, std::chrono::milliseconds request_timeout)
    :
    descriptor      (descriptor),
    request_timeout (request_timeout),
    entries         (descriptor.chunk_count),
    failures        (descriptor.chunk_count, 0),
    buffer          (descriptor.f_size, 0) {
    if (descriptor.digests.size() != descriptor.chunk_count)
        throw std::runtime_error("descriptor for " + descriptor.f_name + " has "
                                 + std::to_string(descriptor.digests.size()) + " digests for "
                                 + std::to_string(descriptor.chunk_count) + " chunks");
}

bool PieceManager::isExcluded(const size_t index, const SourceInfo& remote) const {
    auto it = peer_failures.find(std::make_pair(index, remote));
    return it != peer_failures.end() && it->second >= MAX_CHUNK_FAILURES;
}

std::optional<size_t> PieceManager::selectLocked(const std::vector<bool>& remote_bits,
                                                 const SourceInfo&        remote) const {
    size_t limit = std::min(remote_bits.size(), entries.size());
    for (size_t i = 0; i < limit; ++i) {
        if (entries[i].state != ChunkState::MISSING || !remote_bits[i])
            continue;
        if (isExcluded(i, remote))
            continue;
        return i;
    }
    return std::nullopt;
}

int PieceManager::markRequested(const size_t index, const SourceInfo& remote) {
    if (index >= entries.size() || entries[index].state != ChunkState::MISSING) {
        std::cerr << "[pieceManager] Request for chunk " << index << " to "
                  << remote.toString() << " but chunk isn't missing" << std::endl;
        return PROTOCOL_VIOLATION;
    }

    entries[index].state          = ChunkState::REQUESTED;
    entries[index].requested_from = remote;
    entries[index].requested_at   = std::chrono::steady_clock::now();
    return EXIT_SUCCESS;
}

void PieceManager::markHave(const size_t index, const uint8_t* data) {
    uint64_t len = descriptor.chunkLength(index);
    if (len > 0)
        std::memcpy(buffer.data()+descriptor.chunkOffset(index), data, len);

    entries[index].state          = ChunkState::HAVE;
    entries[index].requested_from = SourceInfo();
    ++have_count;
}

//doesn't touch any state, so safe with or without the lock
bool PieceManager::chunkMatches(const size_t index, const uint8_t* data, const size_t len) const {
    if (len != descriptor.chunkLength(index))
        return false;
    return verifyChunk(data, len, descriptor.digests[index]);
}

std::optional<size_t> PieceManager::selectNext(const std::vector<bool>& remote_bits,
                                               const SourceInfo&        remote) const {
    std::lock_guard<std::mutex> lock(mtx);
    return selectLocked(remote_bits, remote);
}

int PieceManager::onRequestSent(const size_t index, const SourceInfo& remote) {
    std::lock_guard<std::mutex> lock(mtx);
    return markRequested(index, remote);
}

std::optional<size_t> PieceManager::claimNext(const std::vector<bool>& remote_bits,
                                              const SourceInfo&        remote) {
    std::lock_guard<std::mutex> lock(mtx);
    auto index = selectLocked(remote_bits, remote);
    if (!index)
        return std::nullopt;

    if (markRequested(index.value(), remote) != EXIT_SUCCESS)
        return std::nullopt;
    return index;
}

int PieceManager::onChunkReceived(const size_t                index,
                                  const std::vector<uint8_t>& data,
                                  const SourceInfo&           from) {
    if (index >= entries.size()) {
        std::cerr << "[pieceManager] " << from.toString() << " sent chunk "
                  << index << " of a " << entries.size() << " chunk file" << std::endl;
        return PROTOCOL_VIOLATION;
    }

    //hash outside the lock, the descriptor never changes
    bool valid = chunkMatches(index, data.data(), data.size());

    std::lock_guard<std::mutex> lock(mtx);
    ChunkEntry& entry = entries[index];
    if (entry.state == ChunkState::HAVE)
        return EXIT_SUCCESS; //duplicate

    if (!valid) {
        ++failures[index];
        size_t& from_count = peer_failures[std::make_pair(index, from)];
        ++from_count;

        if (entry.state == ChunkState::REQUESTED && entry.requested_from == from) {
            entry.state          = ChunkState::MISSING;
            entry.requested_from = SourceInfo();
        }

        std::cerr << "[pieceManager] Chunk " << index << " from " << from.toString()
                  << " failed verification (" << from_count << " from this peer)" << std::endl;
        if (from_count == MAX_CHUNK_FAILURES)
            std::cerr << "[pieceManager] No longer requesting chunk " << index
                      << " from " << from.toString() << std::endl;
        return CORRUPT_CHUNK;
    }

    markHave(index, data.data());
    return EXIT_SUCCESS;
}

int PieceManager::onRequestTimeout(const size_t index) {
    std::lock_guard<std::mutex> lock(mtx);
    if (index >= entries.size() || entries[index].state != ChunkState::REQUESTED)
        return EXIT_FAILURE;

    auto elapsed = std::chrono::steady_clock::now() - entries[index].requested_at;
    if (elapsed < request_timeout)
        return EXIT_FAILURE;

    entries[index].state          = ChunkState::MISSING;
    entries[index].requested_from = SourceInfo();
    return EXIT_SUCCESS;
}

size_t PieceManager::expireRequests() {
    std::lock_guard<std::mutex> lock(mtx);
    auto now = std::chrono::steady_clock::now();

    size_t expired = 0;
    for (auto& entry : entries) {
        if (entry.state != ChunkState::REQUESTED || now - entry.requested_at < request_timeout)
            continue;
        entry.state          = ChunkState::MISSING;
        entry.requested_from = SourceInfo();
        ++expired;
    }
    return expired;
}

size_t PieceManager::releaseRequests(const SourceInfo& remote) {
    std::lock_guard<std::mutex> lock(mtx);

    size_t released = 0;
    for (auto& entry : entries) {
        if (entry.state != ChunkState::REQUESTED || entry.requested_from != remote)
            continue;
        entry.state          = ChunkState::MISSING;
        entry.requested_from = SourceInfo();
        ++released;
    }
    return released;
}

int PieceManager::loadLocalFile(const std::vector<uint8_t>& bytes) {
    if (bytes.size() != descriptor.f_size) {
        std::cerr << "[pieceManager] Local copy of " << descriptor.f_name << " is "
                  << bytes.size() << " bytes, expected " << descriptor.f_size << std::endl;
        return EXIT_FAILURE;
    }

    int res = EXIT_SUCCESS;
    for (size_t i = 0; i < entries.size(); ++i) {
        const uint8_t* chunk = bytes.data() + descriptor.chunkOffset(i);
        bool valid = chunkMatches(i, chunk, descriptor.chunkLength(i));

        std::lock_guard<std::mutex> lock(mtx);
        if (entries[i].state == ChunkState::HAVE)
            continue;
        if (!valid) {
            res = CORRUPT_CHUNK;
            continue;
        }
        markHave(i, chunk);
    }

    return res;
}

bool PieceManager::isComplete() const {
    std::lock_guard<std::mutex> lock(mtx);
    return have_count == entries.size();
}

std::vector<bool> PieceManager::availability() const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<bool> bits(entries.size(), false);
    for (size_t i = 0; i < entries.size(); ++i)
        bits[i] = entries[i].state == ChunkState::HAVE;
    return bits;
}

std::optional<std::vector<uint8_t>> PieceManager::readChunk(const size_t index) const {
    std::lock_guard<std::mutex> lock(mtx);
    if (index >= entries.size() || entries[index].state != ChunkState::HAVE)
        return std::nullopt;

    auto begin = buffer.begin() + descriptor.chunkOffset(index);
    return std::vector<uint8_t>(begin, begin + descriptor.chunkLength(index));
}

size_t PieceManager::haveCount() const {
    std::lock_guard<std::mutex> lock(mtx);
    return have_count;
}

size_t PieceManager::failureCount(const size_t index) const {
    std::lock_guard<std::mutex> lock(mtx);
    if (index >= failures.size())
        return 0;
    return failures[index];
}

ChunkState PieceManager::state(const size_t index) const {
    std::lock_guard<std::mutex> lock(mtx);
    if (index >= entries.size())
        return ChunkState::MISSING;
    return entries[index].state;
}

bool PieceManager::wantsFrom(const std::vector<bool>& remote_bits, const SourceInfo& remote) const {
    std::lock_guard<std::mutex> lock(mtx);
    size_t limit = std::min(remote_bits.size(), entries.size());
    for (size_t i = 0; i < limit; ++i)
        if (remote_bits[i] && entries[i].state != ChunkState::HAVE && !isExcluded(i, remote))
            return true;
    return false;
}

int PieceManager::reassemble(const std::filesystem::path& f_path) const {
    ChunkMap chunks;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (have_count != entries.size()) {
            std::cerr << "[pieceManager] Can't reassemble " << descriptor.f_name << ", "
                      << entries.size() - have_count << " chunks still missing" << std::endl;
            return INCOMPLETE;
        }

        for (size_t i = 0; i < entries.size(); ++i) {
            auto begin = buffer.begin() + descriptor.chunkOffset(i);
            chunks.emplace(i, std::vector<uint8_t>(begin, begin + descriptor.chunkLength(i)));
        }
    }

    return reassembleToFile(chunks, descriptor, f_path);
}

} //csw
