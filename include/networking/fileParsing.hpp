#pragma once

#include "fileDescriptor.hpp"
#include "networking/socket.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * RECOMMENDED USAGE:
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Seeder:
 * -> readFile() the source, then splitFile() it to get the descriptor and the
 *    chunks. saveDescriptor() so leechers can be handed the descriptor file,
 *    and announce fileIdentifier() to the tracker.
 *
 * Leecher:
 * -> loadDescriptor() the descriptor file, or fetch the descriptor from a peer
 *    and check fileIdentifier() against the id you were given.
 * -> verifyChunk() every chunk received against the descriptor digest.
 * -> once every index is held, reassembleToFile() to write the result.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */

namespace csw {

//DEFAULT: 64KiB, or 64*1024 bytes.
inline constexpr uint64_t DEFAULT_CHUNK_SIZE = 64 * 1024;

//largest chunk a DATA_CHUNK message can carry: code byte, 8 byte index, data
inline constexpr uint64_t MAX_CHUNK_SIZE = MAX_MESSAGE_LEN - 1 - sizeof(uint64_t);

//one chunk of a split file
struct Chunk {
    size_t               index = 0;
    Digest               digest{};
    std::vector<uint8_t> data;
};

//chunk bytes keyed by chunk index, in any order and possibly sparse
using ChunkMap = std::map<size_t, std::vector<uint8_t>>;

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * sha256Digest
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Computes the SHA-256 digest of len bytes at data.
 *
 * Returns:
 * -> On success:
 *    The digest.
 * -> On failure:
 *    std::nullopt, if OpenSSL fails.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::optional<Digest> sha256Digest(const uint8_t* data, const size_t len);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * splitFile
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Splits file bytes into chunks of chunk_size bytes, the last one possibly
 *    shorter, and builds the descriptor describing them. Deterministic, the
 *    same input always gives the same descriptor. A zero length file gives a
 *    descriptor with zero chunks.
 *
 * Takes:
 * -> f_name:
 *    The name to put in the descriptor. Any directories are stripped.
 * -> bytes:
 *    The whole file.
 * -> chunk_size:
 *    Bytes per chunk. Must be non-zero and at most MAX_CHUNK_SIZE.
 *
 * Returns:
 * -> On success:
 *    The descriptor, and the chunks ordered by index.
 * -> On failure:
 *    std::nullopt
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::optional<std::pair<FileDescriptor, std::vector<Chunk>>> splitFile(const std::string&          f_name,
                                                                      const std::vector<uint8_t>& bytes,
                                                                      const uint64_t              chunk_size);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * verifyChunk
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Checks that chunk bytes hash to the expected digest.
 *
 * Returns:
 * -> true if they match, false otherwise or if hashing fails.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
bool verifyChunk(const uint8_t* data, const size_t len, const Digest& expected);
bool verifyChunk(const std::vector<uint8_t>& data, const Digest& expected);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * reassemble
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Concatenates chunks by index into the original file, verifying each one.
 *
 * Takes:
 * -> chunks:
 *    Every chunk index in [0, descriptor.chunk_count) mapped to its bytes.
 * -> descriptor:
 *    The descriptor the chunks belong to.
 * -> out:
 *    Where the file bytes are written. Cleared first, and left empty on
 *    failure.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS
 * -> On failure:
 *    INCOMPLETE if any index is absent, CORRUPT_CHUNK if any chunk fails
 *    verification or has the wrong length.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int reassemble(const ChunkMap&       chunks,
               const FileDescriptor& descriptor,
               std::vector<uint8_t>& out);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * reassembleToFile
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> reassemble(), then writes the file to f_path. Returns success only after
 *    the write has been flushed to disk.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS
 * -> On failure:
 *    INCOMPLETE or CORRUPT_CHUNK as reassemble() does, EXIT_FAILURE if the
 *    write fails.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int reassembleToFile(const ChunkMap&              chunks,
                     const FileDescriptor&        descriptor,
                     const std::filesystem::path& f_path);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * fileIdentifier
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Computes the 8 byte id of a file from the SHA-256 of its descriptor's
 *    canonical encoding. The first 8 bytes of the digest are read big-endian,
 *    so every host computes the same id.
 *
 * Returns:
 * -> On success:
 *    The id.
 * -> On failure:
 *    0
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
uint64_t fileIdentifier(const FileDescriptor& descriptor);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * saveDescriptor
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Writes a descriptor file, a short magic tag followed by the canonical
 *    descriptor encoding.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS
 * -> On failure:
 *    EXIT_FAILURE
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int saveDescriptor(const FileDescriptor& descriptor, const std::filesystem::path& f_path);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * loadDescriptor
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Reads back a descriptor file written by saveDescriptor().
 *
 * Returns:
 * -> On success:
 *    The descriptor.
 * -> On failure:
 *    std::nullopt, if the file can't be read, lacks the magic tag, or doesn't
 *    decode.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::optional<FileDescriptor> loadDescriptor(const std::filesystem::path& f_path);

} //csw
